#pragma once

#include "model/calendar.hpp"
#include "model/outing.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Arm care workload: pitches of the trailing seven days against a weekly limit.
namespace bullpen::analytics::trends {

inline constexpr int DEFAULT_MAX_WEEKLY_PITCHES = 120;
inline constexpr int PULSE_WINDOW_DAYS          = 7;

enum class PulseLevel {
	Normal,  //!< Below 75% of the limit.
	Warning, //!< 75% to 89%.
	Caution, //!< 90% to 99%.
	Danger   //!< At or over the limit.
};

std::string_view toString(PulseLevel level);

//! Classify a seven day pitch total. A non-positive limit is Danger as soon as a single pitch was thrown.
PulseLevel pulseLevel(int sevenDayPitches, int maxWeeklyPitches = DEFAULT_MAX_WEEKLY_PITCHES);

//! Display text, e.g. "Approaching limit (80%)" or "40 / 120".
std::string pulseLabel(PulseLevel level, int sevenDayPitches, int maxWeeklyPitches = DEFAULT_MAX_WEEKLY_PITCHES);

//! Dashboard card of one pitcher.
struct PitcherSnapshot {
	std::string pitcherName;
	int sevenDayPulse{0};
	PulseLevel pulse{PulseLevel::Normal};
	std::optional<double> strikePercentage{}; //!< Seven day window, tracked outings only.
	std::optional<double> maxVelocity{};      //!< Seven day window, all-time if the window has none.
	std::optional<Date> lastOuting{};
	int lastPitchCount{0};
	std::string notes{};      //!< Notes of the most recent outing.
	std::string focus{};      //!< Most recent non-empty focus.
	std::string coachNotes{}; //!< Most recent non-empty coach notes.
	int outingCount{0};
};

//! Snapshot of the outings of `pitcherName` as of `today`. Outings of other pitchers are ignored.
PitcherSnapshot pitcherSnapshot(const std::string& pitcherName, const std::vector<Outing>& outings, Date today,
                                int maxWeeklyPitches = DEFAULT_MAX_WEEKLY_PITCHES);

} // namespace bullpen::analytics::trends
