#include "analytics/core/densityEstimator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace bullpen::analytics::core {

namespace {

// Density pipeline:
// 1) Accumulation -> splat a truncated gaussian around every pitch onto the grid.
// 2) Smoothing    -> repeated 3x3 blur with zero padding.
// 3) Normalise    -> divide by the maximum so the hottest cell is exactly 1.
// 4) Debugging    -> optional statistics on stderr (BULLPEN_HEATMAP_DEBUG=1|2).

struct AccumulationStats {
	int accepted{0};
	int skipped{0};
	int clamped{0};
};

namespace Accumulation {

//! Truncated gaussian weights for offsets in [-radius, radius]^2. Zero beyond the radius.
static cv::Mat makeSplatKernel(int radius, double sigma) {
	const int side = 2 * radius + 1;
	cv::Mat kernel = cv::Mat::zeros(side, side, CV_64FC1);

	const double twoSigmaSq = 2.0 * sigma * sigma;
	const int radiusSq      = radius * radius;
	for (int dy = -radius; dy <= radius; ++dy) {
		double* row = kernel.ptr<double>(dy + radius);
		for (int dx = -radius; dx <= radius; ++dx) {
			const int distanceSq = dx * dx + dy * dy;
			if (distanceSq > radiusSq) {
				continue;
			}
			row[dx + radius] = std::exp(-static_cast<double>(distanceSq) / twoSigmaSq);
		}
	}
	return kernel;
}

static void splat(cv::Mat& grid, const cv::Point& center, const cv::Mat& kernel, int radius) {
	const int n = grid.rows;
	for (int dy = -radius; dy <= radius; ++dy) {
		const int y = center.y + dy;
		if (y < 0 || y >= n) {
			continue;
		}
		double* gridRow         = grid.ptr<double>(y);
		const double* kernelRow = kernel.ptr<double>(dy + radius);
		for (int dx = -radius; dx <= radius; ++dx) {
			const int x = center.x + dx;
			if (x < 0 || x >= n) {
				continue;
			}
			gridRow[x] += kernelRow[dx + radius];
		}
	}
}

static cv::Mat accumulate(const std::vector<cv::Point2d>& points, const DensityConfig& config, AccumulationStats& stats) {
	cv::Mat grid = cv::Mat::zeros(config.gridSize, config.gridSize, CV_64FC1);

	const double sigma   = static_cast<double>(config.influenceRadius) / config.sigmaDivisor;
	const cv::Mat kernel = makeSplatKernel(config.influenceRadius, std::max(sigma, 1e-6));

	for (const cv::Point2d& point: points) {
		if (!std::isfinite(point.x) || !std::isfinite(point.y)) {
			++stats.skipped;
			continue;
		}
		if (std::abs(point.x) > 1.0 || std::abs(point.y) > 1.0) {
			++stats.clamped;
		}

		const cv::Point2d gridPos = toGridSpace(point, config.gridSize);
		const cv::Point center(static_cast<int>(std::lround(gridPos.x)), static_cast<int>(std::lround(gridPos.y)));
		splat(grid, center, kernel, config.influenceRadius);
		++stats.accepted;
	}
	return grid;
}

} // namespace Accumulation

namespace Smoothing {

static cv::Mat smoothingKernel() {
	static const cv::Mat KERNEL = (cv::Mat_<double>(3, 3) << 0.0625, 0.125, 0.0625, 0.125, 0.25, 0.125, 0.0625, 0.125, 0.0625);
	return KERNEL;
}

static cv::Mat smooth(const cv::Mat& grid, int passes) {
	cv::Mat current = grid.clone();
	cv::Mat next;
	for (int pass = 0; pass < passes; ++pass) {
		// Zero padding: cells outside the grid contribute nothing.
		cv::filter2D(current, next, CV_64F, smoothingKernel(), cv::Point(-1, -1), 0.0, cv::BORDER_CONSTANT);
		std::swap(current, next);
	}
	return current;
}

} // namespace Smoothing

namespace Normalise {

//! Divide every cell by the maximum. Cell by cell division keeps the maximum at exactly 1.0.
static double normalise(cv::Mat& grid) {
	double maxValue = 0.0;
	cv::minMaxLoc(grid, nullptr, &maxValue);
	if (!(maxValue > 0.0)) {
		return 0.0;
	}

	for (int y = 0; y < grid.rows; ++y) {
		double* row = grid.ptr<double>(y);
		for (int x = 0; x < grid.cols; ++x) {
			row[x] /= maxValue;
		}
	}
	return maxValue;
}

} // namespace Normalise

namespace Debugging {

static int runtimeDebugLevel() {
	const char* debugEnv = std::getenv("BULLPEN_HEATMAP_DEBUG");
	if (debugEnv == nullptr) {
		return 0;
	}
	const std::string_view debugFlag(debugEnv);
	if (debugFlag == "1") {
		return 1;
	}
	if (debugFlag == "2") {
		return 2;
	}
	return 0;
}

static void emitRuntimeDebug(const DensityConfig& config, const AccumulationStats& stats, const cv::Mat& normalised, double rawMax) {
	const int level = runtimeDebugLevel();
	if (level == 0) {
		return;
	}

	std::cerr << "[density-debug] N=" << config.gridSize << " r=" << config.influenceRadius << " sigma=" << config.influenceRadius / config.sigmaDivisor
	          << " passes=" << config.blurPasses << " points=" << stats.accepted << " skipped=" << stats.skipped << " clamped=" << stats.clamped
	          << " rawMax=" << rawMax << " nonZero=" << cv::countNonZero(normalised) << '\n';

	if (level < 2 || rawMax <= 0.0) {
		return;
	}

	// Hottest cells of the grid.
	cv::Mat remaining = normalised.clone();
	for (int i = 0; i < 5; ++i) {
		double value = 0.0;
		cv::Point location;
		cv::minMaxLoc(remaining, nullptr, &value, nullptr, &location);
		if (value <= 0.0) {
			break;
		}
		std::cerr << "  hot row=" << location.y << " col=" << location.x << " v=" << value << '\n';
		remaining.at<double>(location) = 0.0;
	}
}

} // namespace Debugging

} // namespace

DensityGrid::DensityGrid(const cv::Mat& values) {
	if (values.empty()) {
		return;
	}
	if (values.channels() != 1) {
		std::cerr << "[Error] Density grid rejected: expected one channel, got " << values.channels() << "\n";
		return;
	}

	values.convertTo(m_values, CV_64F);
	cv::minMaxLoc(m_values, nullptr, &m_max);
}

double DensityGrid::valueAt(int row, int col) const {
	if (row < 0 || col < 0 || row >= m_values.rows || col >= m_values.cols) {
		return 0.0;
	}
	return m_values.at<double>(row, col);
}

bool isValidConfig(const DensityConfig& config) {
	return config.gridSize >= 2 && config.influenceRadius >= 0 && config.sigmaDivisor > 0.0 && std::isfinite(config.sigmaDivisor) && config.blurPasses >= 0;
}

cv::Point2d toGridSpace(const cv::Point2d& location, int gridSize) {
	const double x     = std::clamp(location.x, -1.0, 1.0);
	const double y     = std::clamp(location.y, -1.0, 1.0);
	const double scale = static_cast<double>(gridSize - 1) * 0.5;
	return {(x + 1.0) * scale, (1.0 - y) * scale};
}

DensityResult buildDensityGrid(const std::vector<cv::Point2d>& points, const DensityConfig& config, DebugVisualizer* debugger) {
	if (!isValidConfig(config)) {
		std::cerr << "[Error] Density estimation failed: invalid configuration (N=" << config.gridSize << ", r=" << config.influenceRadius
		          << ", sigmaDivisor=" << config.sigmaDivisor << ", passes=" << config.blurPasses << ")\n";
		return {false, {}};
	}

	if (debugger) {
		debugger->beginStage("Density");
	}

	AccumulationStats stats{};
	const cv::Mat accumulated = Accumulation::accumulate(points, config, stats);
	cv::Mat grid              = Smoothing::smooth(accumulated, config.blurPasses);

	if (debugger) {
		debugger->add("Accumulated", accumulated);
		debugger->add("Smoothed", grid);
	}

	const double rawMax = Normalise::normalise(grid);
	Debugging::emitRuntimeDebug(config, stats, grid, rawMax);

	if (debugger) {
		debugger->add("Normalized", grid);
		debugger->endStage();
	}

	return {true, DensityGrid(std::move(grid))};
}

} // namespace bullpen::analytics::core
