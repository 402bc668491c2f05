#pragma once

#include "model/calendar.hpp"
#include "model/outing.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bullpen::analytics::trends {

struct MonthStats {
	unsigned month;    //!< 1 to 12.
	std::string label; //!< "Jan" to "Dec".
	int pitches{0};
	int outings{0};
	int strikes{0};
	int trackedPitches{0};
	std::optional<double> strikePercentage{};
	std::optional<double> maxVelocity{};
};

enum class MilestoneKind { Positive, Negative };

struct Milestone {
	Date date;
	std::string label; //!< e.g. "New max velo: 55 mph", "High pitch count: 80".
	MilestoneKind kind;
};

//! Value of a metric over the first and the second half of the season's outings.
struct HalfComparison {
	std::optional<double> first{};
	std::optional<double> second{};
};

struct SeasonImprovement {
	HalfComparison averageVelocity;
	HalfComparison strikePercentage;
	HalfComparison averagePitchCount;
};

struct SeasonSummary {
	int year{0};
	int outingCount{0};
	int totalPitches{0};
	int totalStrikes{0};
	std::optional<double> strikePercentage{};
	std::optional<double> maxVelocity{};
	std::optional<double> avgVelocity{};
	std::map<EventType, int> eventCounts{};
	std::vector<MonthStats> months{};          //!< Only months with outings, in calendar order.
	std::vector<Milestone> milestones{};       //!< Chronological, the last MAX_MILESTONES only.
	std::optional<SeasonImprovement> improvement{}; //!< Needs MIN_OUTINGS_FOR_IMPROVEMENT outings.
};

inline constexpr std::size_t MAX_MILESTONES            = 8u;
inline constexpr int MIN_OUTINGS_FOR_IMPROVEMENT       = 4;
inline constexpr int MIN_PITCHES_FOR_STRIKE_MILESTONE  = 15;
inline constexpr int HIGH_PITCH_COUNT                  = 76;

/*! Season view of one pitcher's outings.
 *  Only outings of `year` are used, sorted by date.
 *  Milestones: a new max velocity or a new best strike percentage (sessions of at least 15 pitches) after the first one,
 *  and every outing with a high pitch count.
 */
SeasonSummary seasonSummary(const std::vector<Outing>& outings, int year);

} // namespace bullpen::analytics::trends
