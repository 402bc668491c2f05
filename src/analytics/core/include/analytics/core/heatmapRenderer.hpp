#pragma once

#include "analytics/core/debugVisualizer.hpp"
#include "analytics/core/densityEstimator.hpp"

#include <opencv2/core/mat.hpp>
#include <opencv2/core/matx.hpp>

#include <vector>

namespace bullpen::analytics::core {

//! Colour of the gradient at a density threshold.
struct ColorStop {
	double threshold; //!< Position in [0, 1]. Stops are sorted by threshold.
	cv::Vec4b rgba;   //!< Colour in RGBA order.
};

//! Magenta (no density) over blue, cyan, green and yellow to red (highest density).
std::vector<ColorStop> defaultColorStops();

//! Style of the strike zone overlay.
struct OverlayStyle {
	cv::Vec3b color{255, 255, 255}; //!< RGB.
	double alpha{1.0};
	int thickness{1};
};

//! Output raster parameters.
struct HeatmapConfig {
	int width{300};
	int height{388};
	double gamma{0.8}; //!< density^gamma before the colour lookup. 1.0 disables the correction.
	std::vector<ColorStop> stops{defaultColorStops()};
	bool drawZoneOverlay{true};
	OverlayStyle outline{{255, 255, 255}, 0.8, 2};   //!< Zone rectangle.
	OverlayStyle gridLines{{255, 255, 255}, 0.3, 1}; //!< 3x3 subdivision inside the zone.
};

/*! Piecewise linear colour lookup.
 *  \param [in] stops Sorted stops. The first is expected at 0 and the last at 1.
 *  \param [in] value Density in [0, 1]. Values outside are clamped.
 *  \return     Every channel interpolated linearly between the bracketing stops. Exactly the first/last stop at 0/1.
 */
cv::Vec4b lookupColor(const std::vector<ColorStop>& stops, double value);

//! Bilinear interpolation of the grid at fractional (column, row) coordinates. Coordinates are clamped to the grid.
double sampleBilinear(const DensityGrid& grid, double gx, double gy);

bool isValidConfig(const HeatmapConfig& config);

/*! Render a density grid to an RGBA raster (CV_8UC4).
 *  Every pixel is mapped to fractional grid coordinates, sampled bilinearly, gamma corrected and colour mapped.
 *  An empty grid renders the first stop colour with the overlay only. The output only depends on the inputs.
 * \param [in]     grid     Normalised density grid.
 * \param [in]     config   Output size, gradient and overlay style.
 * \param [in,out] debugger Optional visualizer. Records the raster.
 * \return         RGBA raster of config.width x config.height. Empty matrix for an invalid configuration.
 */
cv::Mat renderHeatmap(const DensityGrid& grid, const HeatmapConfig& config = HeatmapConfig{}, DebugVisualizer* debugger = nullptr);

//! Density estimation and rendering in one call.
cv::Mat renderPitchHeatmap(const std::vector<cv::Point2d>& points, const DensityConfig& densityConfig = DensityConfig{},
                           const HeatmapConfig& heatmapConfig = HeatmapConfig{}, DebugVisualizer* debugger = nullptr);

} // namespace bullpen::analytics::core
