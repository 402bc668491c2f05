#pragma once

#include "analytics/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

#include <vector>

// Spatial density of pitch locations.
// Bounded radius kernel accumulation on a square grid, followed by a few passes of a 3x3 smoothing kernel and a normalisation
// to the grid's own maximum. Density is relative within one grid, not an absolute count.
namespace bullpen::analytics::core {

//! Tunable constants of the density estimation.
struct DensityConfig {
	int gridSize{100};        //!< N of the NxN grid.
	int influenceRadius{8};   //!< Cells beyond this euclidean distance from the pitch get nothing.
	double sigmaDivisor{2.5}; //!< Gaussian sigma = influenceRadius / sigmaDivisor.
	int blurPasses{3};        //!< Passes of the 3x3 kernel (0.0625 / 0.125 / 0.25), zero padded at the border.
};

//! Normalised NxN density matrix (CV_64FC1). Row 0 is the top of the plate view (y = +1).
class DensityGrid {
public:
	DensityGrid() = default;
	//! Single channel input of any depth is converted to CV_64F. Multi channel input leaves the grid empty.
	explicit DensityGrid(const cv::Mat& values);

	int size() const { return m_values.rows; }
	bool isEmpty() const { return m_max <= 0.0; } //!< No data: no cells or all cells zero.
	double maxValue() const { return m_max; }     //!< 1.0 if any pitch was accumulated, else 0.0.
	double valueAt(int row, int col) const;       //!< 0.0 outside the grid.
	const cv::Mat& values() const { return m_values; }

private:
	cv::Mat m_values{};
	double m_max{0.0};
};

struct DensityResult {
	bool success;     //!< False for an invalid configuration.
	DensityGrid grid; //!< All zero grid if no point was given.
};

/*! Build the density grid of a set of pitch locations.
 * \param [in]     points   Plate crossing locations in [-1, 1]^2. Out of range values are clamped to the domain, non-finite points are skipped.
 * \param [in]     config   Grid size, kernel radius, sigma and smoothing passes.
 * \param [in,out] debugger Optional visualizer. Records the accumulated, smoothed and normalised grids.
 * \return         DensityResult with the normalised grid.
 */
DensityResult buildDensityGrid(const std::vector<cv::Point2d>& points, const DensityConfig& config = DensityConfig{}, DebugVisualizer* debugger = nullptr);

//! Grid position (column, row) of a plate location, with the y axis inverted. Clamped to [0, N-1].
cv::Point2d toGridSpace(const cv::Point2d& location, int gridSize);

bool isValidConfig(const DensityConfig& config);

} // namespace bullpen::analytics::core
