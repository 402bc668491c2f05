#include "analytics/core/strikeZone.hpp"

#include <algorithm>
#include <cmath>

namespace bullpen::analytics::core {

static constexpr double SHADOW_SPLIT_LO = 0.25; //!< Shadow band: outer 25% of each axis.
static constexpr double SHADOW_SPLIT_HI = 0.75;
static constexpr double THIRD_SPLIT_LO  = 1.0 / 3.0;
static constexpr double THIRD_SPLIT_HI  = 2.0 / 3.0;

bool isStrike(double x, double y) {
	if (!std::isfinite(x) || !std::isfinite(y)) {
		return false;
	}

	// Closest point of the rectangle to the ball center. Inside the zone this is the center itself.
	const double closestX = std::clamp(x, ZONE_LEFT, ZONE_RIGHT);
	const double closestY = std::clamp(y, ZONE_BOTTOM, ZONE_TOP);

	const double dx = x - closestX;
	const double dy = y - closestY;
	return dx * dx + dy * dy <= BALL_RADIUS_NORMALIZED * BALL_RADIUS_NORMALIZED;
}

std::optional<int> bandIndex(double value, double lower, double upper, double splitLo, double splitHi, CutOwner owner) {
	if (!(value >= lower && value <= upper)) {
		return std::nullopt;
	}

	const double span  = upper - lower;
	const double cutLo = lower + span * splitLo;
	const double cutHi = lower + span * splitHi;

	if (owner == CutOwner::Outer) {
		if (value <= cutLo) {
			return 0;
		}
		if (value >= cutHi) {
			return 2;
		}
		return 1;
	}

	if (value < cutLo) {
		return 0;
	}
	if (value > cutHi) {
		return 2;
	}
	return 1;
}

bool isInShadowZone(double x, double y) {
	const auto column = bandIndex(x, ZONE_LEFT, ZONE_RIGHT, SHADOW_SPLIT_LO, SHADOW_SPLIT_HI, CutOwner::Middle);
	const auto row    = bandIndex(y, ZONE_BOTTOM, ZONE_TOP, SHADOW_SPLIT_LO, SHADOW_SPLIT_HI, CutOwner::Middle);
	if (!column || !row) {
		return false;
	}
	return *column != 1 || *row != 1;
}

bool isInBottomThird(double y) {
	return bandIndex(y, ZONE_BOTTOM, ZONE_TOP, THIRD_SPLIT_LO, THIRD_SPLIT_HI, CutOwner::Outer) == 0;
}

bool isInTopThird(double y) {
	return bandIndex(y, ZONE_BOTTOM, ZONE_TOP, THIRD_SPLIT_LO, THIRD_SPLIT_HI, CutOwner::Outer) == 2;
}

std::optional<ZoneCell> zoneCell(double x, double y) {
	const auto column = bandIndex(x, ZONE_LEFT, ZONE_RIGHT, THIRD_SPLIT_LO, THIRD_SPLIT_HI, CutOwner::Outer);
	const auto band   = bandIndex(y, ZONE_BOTTOM, ZONE_TOP, THIRD_SPLIT_LO, THIRD_SPLIT_HI, CutOwner::Outer);
	if (!column || !band) {
		return std::nullopt;
	}
	return ZoneCell{*column, 2 - *band}; // Rows count from the top.
}

} // namespace bullpen::analytics::core
