#include "analytics/trends/season.hpp"

#include "analytics/trends/rollup.hpp"
#include "analytics/trends/statistics.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <sstream>

namespace bullpen::analytics::trends {

namespace {

static std::string monthLabel(unsigned month) {
	static const std::array<const char*, 12> NAMES{"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
	if (month < 1u || month > 12u) {
		return "?";
	}
	return NAMES[month - 1u];
}

static std::vector<MonthStats> monthlyBreakdown(const std::vector<Outing>& season) {
	std::map<unsigned, MonthStats> months;
	for (const Outing& outing: season) {
		const unsigned month = static_cast<unsigned>(std::chrono::year_month_day{outing.date}.month());

		auto it = months.find(month);
		if (it == months.end()) {
			it = months.emplace(month, MonthStats{month, monthLabel(month)}).first;
		}
		MonthStats& stats = it->second;
		stats.pitches += outing.pitchCount;
		++stats.outings;
		if (hasTrackedStrikes(outing)) {
			stats.strikes += *outing.strikes;
			stats.trackedPitches += outing.pitchCount;
		}
		if (const auto velo = recordedVelocity(outing)) {
			stats.maxVelocity = std::max(stats.maxVelocity.value_or(0.0), *velo);
		}
	}

	std::vector<MonthStats> breakdown;
	for (auto& [month, stats]: months) {
		stats.strikePercentage = percentage(stats.strikes, stats.trackedPitches);
		breakdown.push_back(std::move(stats));
	}
	return breakdown;
}

static std::vector<Milestone> detectMilestones(const std::vector<Outing>& season) {
	std::vector<Milestone> milestones;
	double bestVelo   = 0.0;
	double bestStrike = 0.0;

	for (const Outing& outing: season) {
		if (const auto velo = recordedVelocity(outing); velo && *velo > bestVelo) {
			if (bestVelo > 0.0) {
				std::ostringstream label;
				label << "New max velo: " << *velo << " mph";
				milestones.push_back({outing.date, label.str(), MilestoneKind::Positive});
			}
			bestVelo = *velo;
		}

		if (hasTrackedStrikes(outing) && outing.pitchCount >= MIN_PITCHES_FOR_STRIKE_MILESTONE) {
			const double pct = strikePercentage(outing).value_or(0.0);
			if (pct > bestStrike) {
				if (bestStrike > 0.0) {
					milestones.push_back({outing.date, "Best strike %: " + std::to_string(std::lround(pct)) + "%", MilestoneKind::Positive});
				}
				bestStrike = pct;
			}
		}

		if (outing.pitchCount >= HIGH_PITCH_COUNT) {
			milestones.push_back({outing.date, "High pitch count: " + std::to_string(outing.pitchCount), MilestoneKind::Negative});
		}
	}

	if (milestones.size() > MAX_MILESTONES) {
		milestones.erase(milestones.begin(), milestones.end() - static_cast<std::ptrdiff_t>(MAX_MILESTONES));
	}
	return milestones;
}

static std::optional<double> averagePitchCount(const std::vector<Outing>& outings) {
	if (outings.empty()) {
		return std::nullopt;
	}
	std::vector<double> counts;
	counts.reserve(outings.size());
	for (const Outing& o: outings) {
		counts.push_back(o.pitchCount);
	}
	return mean(counts);
}

static std::optional<SeasonImprovement> compareHalves(const std::vector<Outing>& season) {
	if (static_cast<int>(season.size()) < MIN_OUTINGS_FOR_IMPROVEMENT) {
		return std::nullopt;
	}

	const auto mid = static_cast<std::ptrdiff_t>(season.size() / 2u);
	const std::vector<Outing> firstHalf(season.begin(), season.begin() + mid);
	const std::vector<Outing> secondHalf(season.begin() + mid, season.end());

	const WindowStats first  = rollup(firstHalf);
	const WindowStats second = rollup(secondHalf);

	SeasonImprovement improvement{};
	improvement.averageVelocity   = {first.avgVelocity, second.avgVelocity};
	improvement.strikePercentage  = {first.strikePercentage, second.strikePercentage};
	improvement.averagePitchCount = {averagePitchCount(firstHalf), averagePitchCount(secondHalf)};
	return improvement;
}

} // namespace

SeasonSummary seasonSummary(const std::vector<Outing>& outings, int year) {
	std::vector<Outing> season;
	std::copy_if(outings.begin(), outings.end(), std::back_inserter(season),
	             [year](const Outing& o) { return static_cast<int>(std::chrono::year_month_day{o.date}.year()) == year; });
	std::stable_sort(season.begin(), season.end(), [](const Outing& a, const Outing& b) { return a.date < b.date; });

	SeasonSummary summary{};
	summary.year = year;
	if (season.empty()) {
		return summary;
	}

	const WindowStats totals = rollup(season);
	summary.outingCount      = totals.outingCount;
	summary.totalPitches     = totals.totalPitches;
	summary.totalStrikes     = totals.totalStrikes;
	summary.strikePercentage = totals.strikePercentage;
	summary.maxVelocity      = totals.maxVelocity;
	summary.avgVelocity      = totals.avgVelocity;
	for (const auto& [type, stats]: totals.byEventType) {
		summary.eventCounts[type] = stats.outings;
	}

	summary.months      = monthlyBreakdown(season);
	summary.milestones  = detectMilestones(season);
	summary.improvement = compareHalves(season);
	return summary;
}

} // namespace bullpen::analytics::trends
