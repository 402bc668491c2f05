#pragma once

#include "model/calendar.hpp"
#include "model/outing.hpp"
#include "model/pitchEvent.hpp"
#include "model/pitchTypes.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Windowed aggregation of outings. All windows are explicit day ranges, the clock is never read.
namespace bullpen::analytics::trends {

//! Inclusive range of days [start, end].
struct DateWindow {
	Date start;
	Date end;

	bool contains(Date day) const { return day >= start && day <= end; }
	int lengthInDays() const { return daysBetween(start, end) + 1; }
};

//! [today - days, today]. The dashboard's "last 7 days" is trailingWindow(today, 7).
DateWindow trailingWindow(Date today, int days);

//! Window of the same length that ends the day before window.start.
DateWindow priorWindow(const DateWindow& window);

//! Outings dated inside the window, in input order.
std::vector<Outing> outingsIn(const std::vector<Outing>& outings, const DateWindow& window);

struct EventTypeStats {
	int outings{0};
	int pitches{0};
};

//! Aggregate of a set of outings.
struct WindowStats {
	int totalPitches{0};
	int outingCount{0};
	int trackedPitches{0};                      //!< Pitches of outings with tracked strikes.
	int totalStrikes{0};                        //!< Strikes of those outings.
	std::optional<double> strikePercentage{};   //!< Nothing if no tracked pitch.
	std::optional<double> minVelocity{};        //!< Over positive velocities only.
	std::optional<double> maxVelocity{};
	std::optional<double> avgVelocity{};
	std::map<EventType, EventTypeStats> byEventType{};
	int uniquePitchers{0};
};

//! Aggregate of the outings inside the window.
WindowStats rollup(const std::vector<Outing>& outings, const DateWindow& window);

//! Aggregate of all outings.
WindowStats rollup(const std::vector<Outing>& outings);

enum class Trend { Up, Down, Neutral };

std::string_view toString(Trend trend);

//! Direction of change. Neutral if a value is missing, the values are equal or the previous value is zero.
Trend trendDirection(std::optional<double> previous, std::optional<double> current);

struct WindowComparison {
	DateWindow currentWindow;
	DateWindow previousWindow;
	WindowStats current;
	WindowStats previous;
	Trend pitches;
	Trend strikePercentage;
	Trend maxVelocity;
};

//! Compare the trailing window of `days` days ending today with the window right before it.
WindowComparison compareWindows(const std::vector<Outing>& outings, Date today, int days);

struct PitchTypeStats {
	int pitchType;
	std::string label;
	int count{0};
	int strikes{0};
	double strikePercentage{0.0};
};

//! Per pitch type counts of charted pitches, ordered by pitch type.
std::vector<PitchTypeStats> pitchTypeBreakdown(const std::vector<PitchEvent>& events, const PitchTypeLabels& labels = PitchTypeLabels{});

} // namespace bullpen::analytics::trends
