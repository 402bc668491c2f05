#pragma once

#include <optional>

// Strike zone in normalised plate crossing coordinates.
// Both axes run from -1 to 1: x left to right (catcher view), y bottom to top. The zone is a fixed axis aligned rectangle.
// A pitch is a strike if any part of the ball touches the rectangle, not only its center.
namespace bullpen::analytics::core {

inline constexpr double ZONE_LEFT              = -0.4;
inline constexpr double ZONE_RIGHT             = 0.4;
inline constexpr double ZONE_BOTTOM            = -0.45;
inline constexpr double ZONE_TOP               = 0.45;
inline constexpr double BALL_RADIUS_NORMALIZED = 0.07; //!< Ball radius (1.47") relative to the effective zone width (19.94").

//! Circle vs. rectangle test of the ball centered at (x, y) against the strike zone.
//! Any finite input is classified as given, also outside [-1, 1]. Non-finite input is a ball.
bool isStrike(double x, double y);

//! Outer band of the zone: inside the zone but outside the centered core that spans the middle 50% of each axis.
bool isInShadowZone(double x, double y);

//! Lowest of three equal horizontal bands of the zone (boundaries inclusive). Only the height is checked.
bool isInBottomThird(double y);

//! Highest of three equal horizontal bands of the zone (boundaries inclusive). Only the height is checked.
bool isInTopThird(double y);

//! Cell of the 3x3 zone subdivision.
struct ZoneCell {
	int column; //!< 0 = left, 2 = right.
	int row;    //!< 0 = top, 2 = bottom.
};

//! 3x3 cell of a location inside the zone rectangle. Nothing for locations outside the rectangle.
std::optional<ZoneCell> zoneCell(double x, double y);

//! Which bands own a value that lies exactly on a cut.
enum class CutOwner { Outer, Middle };

/*! Index of the band a value falls into when [lower, upper] is split at two fractions.
 *  Shared by the shadow zone (cuts at 25% / 75%) and the thirds (cuts at 1/3 / 2/3).
 *  \param [in] value   Coordinate to locate.
 *  \param [in] lower   Lower interval boundary.
 *  \param [in] upper   Upper interval boundary.
 *  \param [in] splitLo Fraction of the lower cut in (0, 1).
 *  \param [in] splitHi Fraction of the upper cut in [splitLo, 1).
 *  \param [in] owner   Band that owns values exactly on a cut.
 *  \return     0 (low band), 1 (middle band) or 2 (high band). Nothing outside [lower, upper].
 */
std::optional<int> bandIndex(double value, double lower, double upper, double splitLo, double splitHi, CutOwner owner);

} // namespace bullpen::analytics::core
