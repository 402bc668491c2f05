#include "analytics/badges/badgeEvaluator.hpp"

#include "analytics/core/strikeZone.hpp"
#include "analytics/trends/rollup.hpp"
#include "analytics/trends/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <string_view>

namespace bullpen::analytics {

namespace {

// Every rule is a pure function of the inputs. Rules that look at single sessions group the pitch events by outing id.

using EventGroups = std::map<std::string, std::vector<const PitchEvent*>>;

static EventGroups groupByOuting(const std::vector<PitchEvent>& events) {
	EventGroups groups;
	for (const PitchEvent& event: events) {
		groups[event.outingId()].push_back(&event);
	}
	return groups;
}

//! Highest number of events of a single outing that satisfy the predicate.
static int bestSessionCount(const EventGroups& groups, const std::function<bool(const PitchEvent&)>& predicate) {
	int best = 0;
	for (const auto& [outingId, events]: groups) {
		const auto count = std::count_if(events.begin(), events.end(), [&predicate](const PitchEvent* e) { return predicate(*e); });
		best             = std::max(best, static_cast<int>(count));
	}
	return best;
}

static double clampProgress(double progress) {
	if (!std::isfinite(progress)) {
		return 0.0;
	}
	return std::clamp(progress, 0.0, 100.0);
}

static double ratioProgress(double value, double target) {
	if (!(target > 0.0)) {
		return value > 0.0 ? 100.0 : 0.0;
	}
	return clampProgress(value / target * 100.0);
}

static std::string fixed(double value, int decimals) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(decimals) << value;
	return out.str();
}

static std::string plain(double value) {
	std::ostringstream out;
	out << value;
	return out.str();
}

//! Strike percentage over the outings with tracked strikes. Nothing if no tracked pitch.
static std::optional<double> trackedStrikePercentage(const std::vector<Outing>& outings) {
	return trends::rollup(outings).strikePercentage;
}

namespace Rules {

static BadgeResult zoneMaster(const BadgeDefinition& badge, const std::vector<Outing>& outings, const BadgeThresholds& t) {
	const auto pct = trackedStrikePercentage(outings);
	if (!pct) {
		return {&badge, false, 0.0, "No tracked strikes"};
	}
	return {&badge, *pct >= t.zoneMasterStrikePct, ratioProgress(*pct, t.zoneMasterStrikePct), fixed(*pct, 1) + "% strikes"};
}

static BadgeResult sniperStatus(const BadgeDefinition& badge, const EventGroups& groups, const BadgeThresholds& t) {
	const int best = bestSessionCount(groups, [](const PitchEvent& e) { return core::isInShadowZone(e.xLocation(), e.yLocation()); });
	return {&badge, best >= t.sniperShadowPitches, ratioProgress(best, t.sniperShadowPitches), "Best: " + std::to_string(best) + " shadow pitches"};
}

static BadgeResult bridgeBuilder(const BadgeDefinition& badge, const std::vector<PitchEvent>& events, const BadgeThresholds& t) {
	int offSpeed = 0;
	int strikes  = 0;
	for (const PitchEvent& event: events) {
		if (event.isFastball()) {
			continue;
		}
		++offSpeed;
		if (event.isStrike()) {
			++strikes;
		}
	}
	if (offSpeed == 0) {
		return {&badge, false, 0.0, "No off-speed data"};
	}

	const double pct = static_cast<double>(strikes) / offSpeed * 100.0;
	return {&badge, pct >= t.bridgeBuilderStrikePct, ratioProgress(pct, t.bridgeBuilderStrikePct), fixed(pct, 0) + "% off-speed strikes"};
}

static BadgeResult downAndAway(const BadgeDefinition& badge, const EventGroups& groups, const BadgeThresholds& t) {
	const int best = bestSessionCount(groups, [](const PitchEvent& e) { return core::isInBottomThird(e.yLocation()); });
	return {&badge, best >= t.downAwayLowPitches, ratioProgress(best, t.downAwayLowPitches), "Best: " + std::to_string(best) + " low zone pitches"};
}

static BadgeResult velocityJump(const BadgeDefinition& badge, const std::vector<Outing>& outings, const BadgeContext& context, const BadgeThresholds& t) {
	std::vector<const Outing*> measured;
	for (const Outing& outing: outings) {
		if (recordedVelocity(outing)) {
			measured.push_back(&outing);
		}
	}
	if (measured.size() < 2u) {
		return {&badge, false, 0.0, "Need more data"};
	}

	// Newest first.
	std::stable_sort(measured.begin(), measured.end(), [](const Outing* a, const Outing* b) { return a->date > b->date; });
	const double latest = *measured.front()->maxVelo;

	const Date cutoff = context.today - std::chrono::days{t.velocityLookbackDays};
	std::vector<double> older;
	for (const Outing* outing: measured) {
		if (outing->date < cutoff) {
			older.push_back(*outing->maxVelo);
		}
	}
	if (older.empty()) {
		return {&badge, false, 0.0, "Need 30+ days of data"};
	}

	const double jump = latest - trends::mean(older);
	return {&badge, jump >= t.velocityJumpMph, ratioProgress(jump, t.velocityJumpMph), (jump >= 0.0 ? "+" : "") + fixed(jump, 1) + " MPH"};
}

static BadgeResult terminator(const BadgeDefinition& badge, const std::vector<Outing>& outings, const BadgeThresholds& t) {
	std::optional<double> best;
	for (const Outing& outing: outings) {
		if (outing.pitchCount < t.terminatorMinPitches) {
			continue;
		}
		if (const auto pct = strikePercentage(outing)) {
			best = std::max(best.value_or(0.0), *pct);
		}
	}
	if (!best) {
		return {&badge, false, 0.0, "No 30+ pitch sessions"};
	}
	return {&badge, *best >= t.terminatorStrikePct, ratioProgress(*best, t.terminatorStrikePct), "Best: " + fixed(*best, 0) + "% in a session"};
}

//! Velocity a pitcher needs to be in the top fraction of the roster. Pitchers are ranked by their own max velocity.
static double topVelocityCutoff(const std::vector<Outing>& teamOutings, double topFraction) {
	std::map<std::string, double> perPitcher;
	for (const Outing& outing: teamOutings) {
		double& best = perPitcher[outing.pitcherName];
		best         = std::max(best, recordedVelocity(outing).value_or(0.0));
	}

	std::vector<double> velocities;
	for (const auto& [name, velo]: perPitcher) {
		if (velo > 0.0) {
			velocities.push_back(velo);
		}
	}
	if (velocities.empty()) {
		return 0.0;
	}
	std::sort(velocities.begin(), velocities.end(), std::greater<>());

	const auto index = static_cast<std::size_t>(std::floor(static_cast<double>(velocities.size()) * topFraction));
	return index < velocities.size() ? velocities[index] : velocities.front();
}

static BadgeResult powerAndPrecision(const BadgeDefinition& badge, const std::vector<Outing>& outings, const BadgeContext& context,
                                     const BadgeThresholds& t) {
	const double pct    = trackedStrikePercentage(outings).value_or(0.0);
	const double target = t.powerPrecisionStrikePct;

	double myMax = 0.0;
	for (const Outing& outing: outings) {
		myMax = std::max(myMax, recordedVelocity(outing).value_or(0.0));
	}

	if (context.teamOutings == nullptr || context.teamOutings->empty() || myMax <= 0.0) {
		return {&badge, false, clampProgress(pct / target * 50.0), "Need team data for velo ranking"};
	}

	const double cutoff  = topVelocityCutoff(*context.teamOutings, t.powerPrecisionTopFraction);
	const bool inTop     = myMax >= cutoff;
	const double veloPart = inTop ? 50.0 : myMax / cutoff * 50.0;
	const double pctPart  = std::min(pct, target) / target * 50.0;

	return {&badge, inTop && pct >= target, clampProgress(veloPart + pctPart), plain(myMax) + " MPH, " + fixed(pct, 0) + "% strikes"};
}

static BadgeResult stratosphere(const BadgeDefinition& badge, const EventGroups& groups, const BadgeThresholds& t) {
	const int best = bestSessionCount(groups, [](const PitchEvent& e) { return e.isFastball() && core::isInTopThird(e.yLocation()); });
	return {&badge, best >= t.stratosphereHighFastballs, ratioProgress(best, t.stratosphereHighFastballs), "Best: " + std::to_string(best) + " high fastballs"};
}

static BadgeResult repeatableMotion(const BadgeDefinition& badge, const std::vector<Outing>& outings, const BadgeThresholds& t) {
	std::vector<const Outing*> tracked;
	for (const Outing& outing: outings) {
		if (strikePercentage(outing)) {
			tracked.push_back(&outing);
		}
	}
	// Oldest first.
	std::stable_sort(tracked.begin(), tracked.end(), [](const Outing* a, const Outing* b) { return a->date < b->date; });

	const int n = static_cast<int>(tracked.size());
	if (n < t.repeatableStreak) {
		return {&badge, false, clampProgress(static_cast<double>(n) / t.repeatableStreak * 50.0),
		        std::to_string(n) + "/" + std::to_string(t.repeatableStreak) + " outings"};
	}

	int longest = 1;
	int current = 1;
	for (std::size_t i = 1; i < tracked.size(); ++i) {
		const double diff = *strikePercentage(*tracked[i]) - *strikePercentage(*tracked[i - 1]);
		if (std::abs(diff) <= t.repeatableMaxDifference) {
			++current;
			longest = std::max(longest, current);
		} else {
			current = 1;
		}
	}
	return {&badge, longest >= t.repeatableStreak, ratioProgress(longest, t.repeatableStreak), std::to_string(longest) + " consecutive consistent"};
}

static BadgeResult earlyCountKiller(const BadgeDefinition& badge, const EventGroups& groups, const BadgeThresholds& t) {
	double best = 0.0;
	for (const auto& [outingId, events]: groups) {
		if (static_cast<int>(events.size()) < t.earlyCountMinPitches) {
			continue;
		}
		const auto strikes = std::count_if(events.begin(), events.end(), [](const PitchEvent* e) { return e->isStrike(); });
		best               = std::max(best, static_cast<double>(strikes) / static_cast<double>(events.size()) * 100.0);
	}
	return {&badge, best >= t.earlyCountZoneRate, ratioProgress(best, t.earlyCountZoneRate), "Best: " + fixed(best, 0) + "% zone rate"};
}

} // namespace Rules

namespace Debugging {

static bool runtimeDebugEnabled() {
	const char* debugEnv = std::getenv("BULLPEN_BADGE_DEBUG");
	return debugEnv != nullptr && std::string_view(debugEnv) == "1";
}

static void emitRuntimeDebug(const std::vector<Outing>& outings, const std::vector<PitchEvent>& events, const BadgeContext& context,
                             const std::vector<BadgeResult>& results) {
	if (!runtimeDebugEnabled()) {
		return;
	}

	std::cerr << "[badge-debug] today=" << toIsoString(context.today) << " outings=" << outings.size() << " events=" << events.size()
	          << " team=" << (context.teamOutings ? static_cast<long>(context.teamOutings->size()) : -1L) << '\n';
	for (const BadgeResult& result: results) {
		std::cerr << "  " << result.badge->id << " earned=" << result.earned << " progress=" << result.progress << " detail='" << result.detail << "'\n";
	}
}

} // namespace Debugging

} // namespace

std::vector<BadgeResult> evaluateBadges(const std::vector<Outing>& outings, const std::vector<PitchEvent>& pitchEvents, const BadgeContext& context,
                                        const BadgeThresholds& thresholds) {
	const auto& definitions = badgeDefinitions();
	const EventGroups groups = groupByOuting(pitchEvents);

	std::vector<BadgeResult> results;
	results.reserve(definitions.size());
	results.push_back(Rules::zoneMaster(definitions[0], outings, thresholds));
	results.push_back(Rules::sniperStatus(definitions[1], groups, thresholds));
	results.push_back(Rules::bridgeBuilder(definitions[2], pitchEvents, thresholds));
	results.push_back(Rules::downAndAway(definitions[3], groups, thresholds));
	results.push_back(Rules::velocityJump(definitions[4], outings, context, thresholds));
	results.push_back(Rules::terminator(definitions[5], outings, thresholds));
	results.push_back(Rules::powerAndPrecision(definitions[6], outings, context, thresholds));
	results.push_back(Rules::stratosphere(definitions[7], groups, thresholds));
	results.push_back(Rules::repeatableMotion(definitions[8], outings, thresholds));
	results.push_back(Rules::earlyCountKiller(definitions[9], groups, thresholds));

	Debugging::emitRuntimeDebug(outings, pitchEvents, context, results);
	return results;
}

int earnedCount(const std::vector<BadgeResult>& results) {
	return static_cast<int>(std::count_if(results.begin(), results.end(), [](const BadgeResult& r) { return r.earned; }));
}

std::vector<Outing> filterSince(const std::vector<Outing>& outings, std::optional<Date> start) {
	if (!start) {
		return outings;
	}
	std::vector<Outing> kept;
	std::copy_if(outings.begin(), outings.end(), std::back_inserter(kept), [&start](const Outing& o) { return o.date >= *start; });
	return kept;
}

std::vector<PitchEvent> filterSince(const std::vector<PitchEvent>& events, std::optional<Date> start) {
	if (!start) {
		return events;
	}
	std::vector<PitchEvent> kept;
	std::copy_if(events.begin(), events.end(), std::back_inserter(kept),
	             [&start](const PitchEvent& e) { return std::chrono::floor<std::chrono::days>(e.createdAt()) >= *start; });
	return kept;
}

} // namespace bullpen::analytics
