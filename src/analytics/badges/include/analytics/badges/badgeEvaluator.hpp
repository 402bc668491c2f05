#pragma once

#include "analytics/badges/badgeDefinitions.hpp"
#include "model/calendar.hpp"
#include "model/outing.hpp"
#include "model/pitchEvent.hpp"

#include <optional>
#include <string>
#include <vector>

namespace bullpen::analytics {

//! Outcome of one badge rule. Recomputed on every evaluation.
struct BadgeResult {
	const BadgeDefinition* badge; //!< Points into badgeDefinitions().
	bool earned;
	double progress;    //!< [0, 100].
	std::string detail; //!< Empty if the rule has nothing to say.
};

//! Inputs of an evaluation that do not belong to the pitcher's own records.
struct BadgeContext {
	Date today;                                    //!< Day the evaluation is made for. Velocity Jump looks back from here.
	const std::vector<Outing>* teamOutings{nullptr}; //!< Outings of the whole roster, for Power & Precision. Optional.
};

//! Targets of the rules.
struct BadgeThresholds {
	double zoneMasterStrikePct{65.0};
	int sniperShadowPitches{5};
	double bridgeBuilderStrikePct{50.0};
	int downAwayLowPitches{5};
	double velocityJumpMph{2.0};
	int velocityLookbackDays{30};
	int terminatorMinPitches{30};
	double terminatorStrikePct{70.0};
	double powerPrecisionStrikePct{60.0};
	double powerPrecisionTopFraction{0.25}; //!< Share of the roster that counts as top velocity.
	int stratosphereHighFastballs{4};
	double repeatableMaxDifference{5.0}; //!< Strike percentage points between consecutive outings.
	int repeatableStreak{3};
	int earlyCountMinPitches{5};
	double earlyCountZoneRate{60.0};
};

/*! Score a pitcher's history against every badge.
 * \param [in] outings     Outings of the pitcher.
 * \param [in] pitchEvents Charted pitches of the pitcher, any outing.
 * \param [in] context     Evaluation day and optional roster outings.
 * \param [in] thresholds  Rule targets.
 * \return     One result per definition, in the order of badgeDefinitions(). Sparse data yields unearned results, never an error.
 */
std::vector<BadgeResult> evaluateBadges(const std::vector<Outing>& outings, const std::vector<PitchEvent>& pitchEvents, const BadgeContext& context,
                                        const BadgeThresholds& thresholds = BadgeThresholds{});

//! Number of earned badges.
int earnedCount(const std::vector<BadgeResult>& results);

//! Outings on or after `start`. Everything if there is no start.
std::vector<Outing> filterSince(const std::vector<Outing>& outings, std::optional<Date> start);

//! Pitch events created on or after the day `start`. Everything if there is no start.
std::vector<PitchEvent> filterSince(const std::vector<PitchEvent>& events, std::optional<Date> start);

} // namespace bullpen::analytics
