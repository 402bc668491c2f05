#include "analytics/trends/rollup.hpp"

#include "analytics/trends/statistics.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace bullpen::analytics::trends {

DateWindow trailingWindow(Date today, int days) {
	return {today - std::chrono::days{std::max(days, 0)}, today};
}

DateWindow priorWindow(const DateWindow& window) {
	const std::chrono::days length{window.lengthInDays()};
	const Date end = window.start - std::chrono::days{1};
	return {end - length + std::chrono::days{1}, end};
}

std::vector<Outing> outingsIn(const std::vector<Outing>& outings, const DateWindow& window) {
	std::vector<Outing> inside;
	std::copy_if(outings.begin(), outings.end(), std::back_inserter(inside), [&window](const Outing& o) { return window.contains(o.date); });
	return inside;
}

WindowStats rollup(const std::vector<Outing>& outings) {
	WindowStats stats{};
	std::vector<double> velocities;
	std::set<std::string> pitchers;

	for (const Outing& outing: outings) {
		stats.totalPitches += outing.pitchCount;
		++stats.outingCount;

		if (hasTrackedStrikes(outing)) {
			stats.trackedPitches += outing.pitchCount;
			stats.totalStrikes += *outing.strikes;
		}
		if (const auto velo = recordedVelocity(outing)) {
			velocities.push_back(*velo);
		}

		EventTypeStats& type = stats.byEventType[outing.eventType];
		++type.outings;
		type.pitches += outing.pitchCount;

		pitchers.insert(outing.pitcherName);
	}

	stats.strikePercentage = percentage(stats.totalStrikes, stats.trackedPitches);
	if (!velocities.empty()) {
		const auto [minIt, maxIt] = std::minmax_element(velocities.begin(), velocities.end());
		stats.minVelocity         = *minIt;
		stats.maxVelocity         = *maxIt;
		stats.avgVelocity         = mean(velocities);
	}
	stats.uniquePitchers = static_cast<int>(pitchers.size());
	return stats;
}

WindowStats rollup(const std::vector<Outing>& outings, const DateWindow& window) {
	return rollup(outingsIn(outings, window));
}

std::string_view toString(Trend trend) {
	switch (trend) {
	case Trend::Up: return "up";
	case Trend::Down: return "down";
	case Trend::Neutral: return "neutral";
	}
	return "neutral";
}

Trend trendDirection(std::optional<double> previous, std::optional<double> current) {
	if (!previous || !current || *previous == 0.0) {
		return Trend::Neutral;
	}
	if (*current > *previous) {
		return Trend::Up;
	}
	if (*current < *previous) {
		return Trend::Down;
	}
	return Trend::Neutral;
}

WindowComparison compareWindows(const std::vector<Outing>& outings, Date today, int days) {
	const DateWindow current  = trailingWindow(today, days);
	const DateWindow previous = priorWindow(current);

	WindowComparison comparison{current, previous, rollup(outings, current), rollup(outings, previous), Trend::Neutral, Trend::Neutral, Trend::Neutral};
	comparison.pitches          = trendDirection(comparison.previous.totalPitches, comparison.current.totalPitches);
	comparison.strikePercentage = trendDirection(comparison.previous.strikePercentage, comparison.current.strikePercentage);
	comparison.maxVelocity      = trendDirection(comparison.previous.maxVelocity, comparison.current.maxVelocity);
	return comparison;
}

std::vector<PitchTypeStats> pitchTypeBreakdown(const std::vector<PitchEvent>& events, const PitchTypeLabels& labels) {
	std::map<int, PitchTypeStats> byType;
	for (const PitchEvent& event: events) {
		auto it = byType.find(event.pitchType());
		if (it == byType.end()) {
			it = byType.emplace(event.pitchType(), PitchTypeStats{event.pitchType(), labels.label(event.pitchType())}).first;
		}
		++it->second.count;
		if (event.isStrike()) {
			++it->second.strikes;
		}
	}

	std::vector<PitchTypeStats> breakdown;
	breakdown.reserve(byType.size());
	for (auto& [type, stats]: byType) {
		stats.strikePercentage = percentage(stats.strikes, stats.count).value_or(0.0);
		breakdown.push_back(std::move(stats));
	}
	return breakdown;
}

} // namespace bullpen::analytics::trends
