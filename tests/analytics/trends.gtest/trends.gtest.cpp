#include "analytics/trends/rollup.hpp"
#include "analytics/trends/season.hpp"
#include "analytics/trends/statistics.hpp"
#include "analytics/trends/workload.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace bullpen::analytics::trends {
namespace gtest {

static Outing makeOuting(const std::string& pitcher, Date date, int pitches, std::optional<int> strikes, std::optional<double> velo = std::nullopt,
                         EventType type = EventType::Bullpen) {
	Outing o{};
	o.id          = pitcher + "-" + toIsoString(date);
	o.pitcherName = pitcher;
	o.date        = date;
	o.eventType   = type;
	o.pitchCount  = pitches;
	o.strikes     = strikes;
	o.maxVelo     = velo;
	return o;
}

static const Date TODAY = makeDate(2026, 5, 20);

TEST(Statistics, GuardedHelpers) {
	EXPECT_EQ(mean({}), 0.0);
	EXPECT_DOUBLE_EQ(mean({50.0, 52.0, 57.0}), 53.0);
	EXPECT_FALSE(percentage(3.0, 0.0).has_value());
	EXPECT_DOUBLE_EQ(*percentage(1.0, 4.0), 25.0);
	EXPECT_FALSE(maximum({}).has_value());
	EXPECT_DOUBLE_EQ(*maximum({3.0, 9.0, 1.0}), 9.0);
}

TEST(Windows, TrailingAndPrior) {
	const DateWindow week = trailingWindow(TODAY, 7);
	EXPECT_EQ(week.start, makeDate(2026, 5, 13));
	EXPECT_EQ(week.end, TODAY);
	EXPECT_EQ(week.lengthInDays(), 8);
	EXPECT_TRUE(week.contains(makeDate(2026, 5, 13)));
	EXPECT_FALSE(week.contains(makeDate(2026, 5, 12)));
	EXPECT_FALSE(week.contains(makeDate(2026, 5, 21)));

	const DateWindow before = priorWindow(week);
	EXPECT_EQ(before.end, makeDate(2026, 5, 12));
	EXPECT_EQ(before.start, makeDate(2026, 5, 5));
	EXPECT_EQ(before.lengthInDays(), week.lengthInDays());
}

TEST(Rollup, UntrackedStrikesAreExcluded) {
	const std::vector<Outing> outings{
	        makeOuting("Sam", TODAY, 50, std::nullopt),
	        makeOuting("Sam", TODAY, 50, 40),
	};
	const WindowStats stats = rollup(outings);
	EXPECT_EQ(stats.totalPitches, 100);
	EXPECT_EQ(stats.trackedPitches, 50);
	EXPECT_EQ(stats.totalStrikes, 40);
	ASSERT_TRUE(stats.strikePercentage.has_value());
	EXPECT_DOUBLE_EQ(*stats.strikePercentage, 80.0);
}

TEST(Rollup, EmptyInputHasNoPercentages) {
	const WindowStats stats = rollup({}, trailingWindow(TODAY, 7));
	EXPECT_EQ(stats.totalPitches, 0);
	EXPECT_EQ(stats.outingCount, 0);
	EXPECT_FALSE(stats.strikePercentage.has_value());
	EXPECT_FALSE(stats.maxVelocity.has_value());
	EXPECT_FALSE(stats.avgVelocity.has_value());
	EXPECT_EQ(stats.uniquePitchers, 0);
}

TEST(Rollup, WindowVelocityAndBreakdown) {
	const std::vector<Outing> outings{
	        makeOuting("Sam", makeDate(2026, 5, 18), 30, 20, 52.0, EventType::Bullpen),
	        makeOuting("Sam", makeDate(2026, 5, 19), 45, 30, 0.0, EventType::Game),
	        makeOuting("Ari", makeDate(2026, 5, 20), 25, std::nullopt, 48.0, EventType::Game),
	        makeOuting("Ari", makeDate(2026, 4, 1), 60, 40, 60.0, EventType::Game), // outside the window
	};
	const WindowStats stats = rollup(outings, trailingWindow(TODAY, 7));

	EXPECT_EQ(stats.outingCount, 3);
	EXPECT_EQ(stats.totalPitches, 100);
	EXPECT_EQ(stats.trackedPitches, 75);
	EXPECT_EQ(stats.totalStrikes, 50);
	EXPECT_EQ(stats.uniquePitchers, 2);

	ASSERT_TRUE(stats.maxVelocity.has_value());
	EXPECT_DOUBLE_EQ(*stats.maxVelocity, 52.0);
	EXPECT_DOUBLE_EQ(*stats.minVelocity, 48.0);
	EXPECT_DOUBLE_EQ(*stats.avgVelocity, 50.0);

	ASSERT_EQ(stats.byEventType.count(EventType::Game), 1u);
	EXPECT_EQ(stats.byEventType.at(EventType::Game).outings, 2);
	EXPECT_EQ(stats.byEventType.at(EventType::Game).pitches, 70);
	EXPECT_EQ(stats.byEventType.at(EventType::Bullpen).pitches, 30);
	EXPECT_EQ(stats.byEventType.count(EventType::Practice), 0u);
}

TEST(Trend, Direction) {
	EXPECT_EQ(trendDirection(50.0, 60.0), Trend::Up);
	EXPECT_EQ(trendDirection(60.0, 50.0), Trend::Down);
	EXPECT_EQ(trendDirection(60.0, 60.0), Trend::Neutral);
	EXPECT_EQ(trendDirection(0.0, 60.0), Trend::Neutral);
	EXPECT_EQ(trendDirection(std::nullopt, 60.0), Trend::Neutral);
	EXPECT_EQ(trendDirection(60.0, std::nullopt), Trend::Neutral);
	EXPECT_EQ(toString(Trend::Up), "up");
}

TEST(Trend, CompareWindows) {
	const std::vector<Outing> outings{
	        makeOuting("Sam", makeDate(2026, 5, 8), 40, 20, 50.0),
	        makeOuting("Sam", makeDate(2026, 5, 15), 60, 42, 53.0),
	};
	const WindowComparison comparison = compareWindows(outings, TODAY, 7);

	EXPECT_EQ(comparison.current.totalPitches, 60);
	EXPECT_EQ(comparison.previous.totalPitches, 40);
	EXPECT_EQ(comparison.pitches, Trend::Up);
	EXPECT_EQ(comparison.strikePercentage, Trend::Up);
	EXPECT_EQ(comparison.maxVelocity, Trend::Up);

	// Nothing in the previous window: no trend.
	const WindowComparison fresh = compareWindows({outings[1]}, TODAY, 7);
	EXPECT_EQ(fresh.pitches, Trend::Neutral);
	EXPECT_EQ(fresh.strikePercentage, Trend::Neutral);
}

TEST(PitchTypes, Breakdown) {
	const Timestamp t{};
	const std::vector<PitchEvent> events{
	        PitchEvent::record("o", "p", 1, 1, 0.0, 0.0, t),  PitchEvent::record("o", "p", 2, 1, 0.9, 0.9, t),
	        PitchEvent::record("o", "p", 3, 3, 0.1, -0.1, t), PitchEvent::record("o", "p", 4, 1, 0.1, 0.2, t),
	        PitchEvent::record("o", "p", 5, 7, 0.0, 0.0, t),
	};
	PitchTypeLabels labels;
	labels.set(3, "SPL");

	const std::vector<PitchTypeStats> breakdown = pitchTypeBreakdown(events, labels);
	ASSERT_EQ(breakdown.size(), 3u);

	EXPECT_EQ(breakdown[0].pitchType, 1);
	EXPECT_EQ(breakdown[0].label, "FB");
	EXPECT_EQ(breakdown[0].count, 3);
	EXPECT_EQ(breakdown[0].strikes, 2);
	EXPECT_NEAR(breakdown[0].strikePercentage, 66.667, 1e-3);

	EXPECT_EQ(breakdown[1].label, "SPL");
	EXPECT_EQ(breakdown[2].label, "P7");
	EXPECT_DOUBLE_EQ(breakdown[2].strikePercentage, 100.0);
}

TEST(Workload, PulseLevels) {
	EXPECT_EQ(pulseLevel(0), PulseLevel::Normal);
	EXPECT_EQ(pulseLevel(89), PulseLevel::Normal);
	EXPECT_EQ(pulseLevel(90), PulseLevel::Warning);
	EXPECT_EQ(pulseLevel(107), PulseLevel::Warning);
	EXPECT_EQ(pulseLevel(108), PulseLevel::Caution);
	EXPECT_EQ(pulseLevel(119), PulseLevel::Caution);
	EXPECT_EQ(pulseLevel(120), PulseLevel::Danger);
	EXPECT_EQ(pulseLevel(200), PulseLevel::Danger);

	EXPECT_EQ(pulseLevel(30, 40), PulseLevel::Warning);
	EXPECT_EQ(pulseLevel(0, 0), PulseLevel::Normal);
	EXPECT_EQ(pulseLevel(1, 0), PulseLevel::Danger);
}

TEST(Workload, PulseLabels) {
	EXPECT_EQ(pulseLabel(PulseLevel::Normal, 40, 120), "40 / 120");
	EXPECT_EQ(pulseLabel(PulseLevel::Warning, 96, 120), "Approaching limit (80%)");
	EXPECT_EQ(pulseLabel(PulseLevel::Caution, 110, 120), "Near limit (92%)");
	EXPECT_EQ(pulseLabel(PulseLevel::Danger, 130, 120), "Over limit (108%)");
}

TEST(Workload, PitcherSnapshot) {
	std::vector<Outing> outings{
	        makeOuting("Sam", makeDate(2026, 3, 1), 50, 30, 58.0),
	        makeOuting("Sam", makeDate(2026, 5, 16), 40, 30),
	        makeOuting("Sam", makeDate(2026, 5, 19), 55, std::nullopt),
	        makeOuting("Ari", makeDate(2026, 5, 19), 90, 80, 62.0),
	};
	outings[0].focus      = "Tempo";
	outings[1].coachNotes = "Stay tall";
	outings[2].notes      = "Felt good";

	const PitcherSnapshot snapshot = pitcherSnapshot("Sam", outings, TODAY);
	EXPECT_EQ(snapshot.outingCount, 3);
	EXPECT_EQ(snapshot.sevenDayPulse, 95);
	EXPECT_EQ(snapshot.pulse, PulseLevel::Warning);
	ASSERT_TRUE(snapshot.strikePercentage.has_value());
	EXPECT_DOUBLE_EQ(*snapshot.strikePercentage, 75.0);
	ASSERT_TRUE(snapshot.maxVelocity.has_value());
	EXPECT_DOUBLE_EQ(*snapshot.maxVelocity, 58.0); // no velocity this week, all-time fallback
	ASSERT_TRUE(snapshot.lastOuting.has_value());
	EXPECT_EQ(*snapshot.lastOuting, makeDate(2026, 5, 19));
	EXPECT_EQ(snapshot.lastPitchCount, 55);
	EXPECT_EQ(snapshot.notes, "Felt good");
	EXPECT_EQ(snapshot.focus, "Tempo");
	EXPECT_EQ(snapshot.coachNotes, "Stay tall");

	const PitcherSnapshot nobody = pitcherSnapshot("Kai", outings, TODAY);
	EXPECT_EQ(nobody.outingCount, 0);
	EXPECT_FALSE(nobody.lastOuting.has_value());
	EXPECT_EQ(nobody.pulse, PulseLevel::Normal);
}

TEST(Season, Summary) {
	const std::vector<Outing> outings{
	        makeOuting("Sam", makeDate(2026, 3, 2), 40, 20, 50.0),
	        makeOuting("Sam", makeDate(2026, 3, 20), 30, 21, 52.0),
	        makeOuting("Sam", makeDate(2026, 4, 5), 80, 50, 51.0, EventType::Game),
	        makeOuting("Sam", makeDate(2026, 4, 25), 20, std::nullopt, 54.0),
	        makeOuting("Sam", makeDate(2025, 8, 1), 99, 99, 70.0), // other season
	};
	const SeasonSummary summary = seasonSummary(outings, 2026);

	EXPECT_EQ(summary.outingCount, 4);
	EXPECT_EQ(summary.totalPitches, 170);
	EXPECT_EQ(summary.totalStrikes, 91);
	ASSERT_TRUE(summary.strikePercentage.has_value());
	EXPECT_NEAR(*summary.strikePercentage, 91.0 / 150.0 * 100.0, 1e-9);
	EXPECT_DOUBLE_EQ(*summary.maxVelocity, 54.0);
	EXPECT_DOUBLE_EQ(*summary.avgVelocity, 51.75);
	EXPECT_EQ(summary.eventCounts.at(EventType::Bullpen), 3);
	EXPECT_EQ(summary.eventCounts.at(EventType::Game), 1);

	ASSERT_EQ(summary.months.size(), 2u);
	EXPECT_EQ(summary.months[0].label, "Mar");
	EXPECT_EQ(summary.months[0].pitches, 70);
	EXPECT_EQ(summary.months[0].outings, 2);
	EXPECT_EQ(summary.months[1].label, "Apr");
	EXPECT_EQ(summary.months[1].trackedPitches, 80);
	EXPECT_DOUBLE_EQ(*summary.months[1].maxVelocity, 54.0);

	// 52 mph and 70% on Mar 20, high pitch count on Apr 5, 54 mph on Apr 25.
	ASSERT_EQ(summary.milestones.size(), 4u);
	EXPECT_EQ(summary.milestones[0].label, "New max velo: 52 mph");
	EXPECT_EQ(summary.milestones[1].label, "Best strike %: 70%");
	EXPECT_EQ(summary.milestones[2].label, "High pitch count: 80");
	EXPECT_EQ(summary.milestones[2].kind, MilestoneKind::Negative);
	EXPECT_EQ(summary.milestones[3].label, "New max velo: 54 mph");

	ASSERT_TRUE(summary.improvement.has_value());
	EXPECT_DOUBLE_EQ(*summary.improvement->averageVelocity.first, 51.0);
	EXPECT_DOUBLE_EQ(*summary.improvement->averageVelocity.second, 52.5);
	EXPECT_DOUBLE_EQ(*summary.improvement->averagePitchCount.first, 35.0);
	EXPECT_DOUBLE_EQ(*summary.improvement->averagePitchCount.second, 50.0);
}

TEST(Season, SmallSeasons) {
	const SeasonSummary empty = seasonSummary({}, 2026);
	EXPECT_EQ(empty.outingCount, 0);
	EXPECT_FALSE(empty.strikePercentage.has_value());
	EXPECT_TRUE(empty.months.empty());
	EXPECT_FALSE(empty.improvement.has_value());

	const std::vector<Outing> three{
	        makeOuting("Sam", makeDate(2026, 3, 2), 40, 20),
	        makeOuting("Sam", makeDate(2026, 3, 3), 40, 20),
	        makeOuting("Sam", makeDate(2026, 3, 4), 40, 20),
	};
	EXPECT_FALSE(seasonSummary(three, 2026).improvement.has_value());
}

TEST(Season, KeepsTheLastEightMilestones) {
	std::vector<Outing> outings;
	for (unsigned day = 1; day <= 10; ++day) {
		outings.push_back(makeOuting("Sam", makeDate(2026, 6, day), 80 + static_cast<int>(day), std::nullopt));
	}
	const SeasonSummary summary = seasonSummary(outings, 2026);
	ASSERT_EQ(summary.milestones.size(), 8u);
	EXPECT_EQ(summary.milestones.front().label, "High pitch count: 83");
	EXPECT_EQ(summary.milestones.back().label, "High pitch count: 90");
}

} // namespace gtest
} // namespace bullpen::analytics::trends
