#pragma once

#include "model/calendar.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace bullpen {

//! Kind of session an outing was logged for.
enum class EventType { Bullpen, Game, External, Practice };

std::string_view toString(EventType type);
std::optional<EventType> parseEventType(std::string_view name);

//! One practice or game session of a pitcher.
struct Outing {
	std::string id;                  //!< Storage id.
	std::string pitcherName;         //!< Pitcher the outing belongs to. Also the key for roster comparisons.
	Date date{};                     //!< Day of the session.
	EventType eventType{EventType::Bullpen};
	int pitchCount{0};               //!< Total pitches thrown (>= 0).
	std::optional<int> strikes{};    //!< Null: strikes were not tracked in this session.
	std::optional<double> maxVelo{}; //!< Null: velocity was not measured.
	std::string notes{};
	std::string focus{};
	std::string coachNotes{};
};

//! True if the strike count of this outing was recorded.
inline bool hasTrackedStrikes(const Outing& outing) {
	return outing.strikes.has_value();
}

//! Strike percentage of a single outing in [0, 100].
//! \returns Nothing if strikes were not tracked or no pitch was thrown.
std::optional<double> strikePercentage(const Outing& outing);

//! Max velocity if it was measured and is positive.
std::optional<double> recordedVelocity(const Outing& outing);

} // namespace bullpen
