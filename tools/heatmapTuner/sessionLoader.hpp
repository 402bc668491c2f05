#pragma once

#include "model/calendar.hpp"
#include "model/outing.hpp"
#include "model/pitchEvent.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace bullpen {

//! Charted pitches and the outings they belong to.
struct Session {
	std::vector<Outing> outings;
	std::vector<PitchEvent> events;
};

/*! Load charted pitches from a CSV file with the header "outing_id,pitch_number,pitch_type,x,y".
 *  Every outing id becomes one outing dated `day` with pitch and strike counts taken from its pitches.
 *  \return Nothing if the file cannot be read or a row is malformed.
 */
std::optional<Session> loadSessionCsv(const std::filesystem::path& path, Date day);

//! Reproducible bullpen of a few outings, clustered low and away with some misses.
Session syntheticSession(Date day);

} // namespace bullpen
