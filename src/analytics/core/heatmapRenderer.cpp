#include "analytics/core/heatmapRenderer.hpp"

#include "analytics/core/strikeZone.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace bullpen::analytics::core {

namespace {

//! Strike zone rectangle in raster pixel coordinates.
struct ZonePixels {
	double left;
	double right;
	double top;
	double bottom;
};

static ZonePixels zoneInPixels(int width, int height) {
	const auto toX = [width](double x) { return (x + 1.0) * 0.5 * static_cast<double>(width); };
	const auto toY = [height](double y) { return (1.0 - y) * 0.5 * static_cast<double>(height); };
	return {toX(ZONE_LEFT), toX(ZONE_RIGHT), toY(ZONE_TOP), toY(ZONE_BOTTOM)};
}

static bool isValidStyle(const OverlayStyle& style) {
	return style.alpha >= 0.0 && style.alpha <= 1.0 && style.thickness >= 1;
}

//! Blend the style colour into every raster pixel covered by the mask. Alpha channel stays untouched.
static void blendMask(cv::Mat& raster, const cv::Mat& mask, const OverlayStyle& style) {
	const double keep = 1.0 - style.alpha;
	for (int y = 0; y < raster.rows; ++y) {
		cv::Vec4b* pixels       = raster.ptr<cv::Vec4b>(y);
		const std::uint8_t* hit = mask.ptr<std::uint8_t>(y);
		for (int x = 0; x < raster.cols; ++x) {
			if (hit[x] == 0u) {
				continue;
			}
			for (int c = 0; c < 3; ++c) {
				const double mixed = static_cast<double>(style.color[c]) * style.alpha + static_cast<double>(pixels[x][c]) * keep;
				pixels[x][c]       = cv::saturate_cast<std::uint8_t>(std::lround(mixed));
			}
		}
	}
}

//! Zone rectangle and its 3x3 subdivision. Independent of the density data.
static void drawZoneOverlay(cv::Mat& raster, const HeatmapConfig& config) {
	const ZonePixels zone = zoneInPixels(raster.cols, raster.rows);
	const auto px         = [](double v) { return static_cast<int>(std::lround(v)); };

	const double zoneW = zone.right - zone.left;
	const double zoneH = zone.bottom - zone.top;

	cv::Mat gridMask = cv::Mat::zeros(raster.size(), CV_8UC1);
	for (int i = 1; i < 3; ++i) {
		const double x = zone.left + zoneW * i / 3.0;
		const double y = zone.top + zoneH * i / 3.0;
		cv::line(gridMask, cv::Point(px(x), px(zone.top)), cv::Point(px(x), px(zone.bottom)), cv::Scalar(255), config.gridLines.thickness, cv::LINE_8);
		cv::line(gridMask, cv::Point(px(zone.left), px(y)), cv::Point(px(zone.right), px(y)), cv::Scalar(255), config.gridLines.thickness, cv::LINE_8);
	}
	blendMask(raster, gridMask, config.gridLines);

	cv::Mat outlineMask = cv::Mat::zeros(raster.size(), CV_8UC1);
	cv::rectangle(outlineMask, cv::Point(px(zone.left), px(zone.top)), cv::Point(px(zone.right), px(zone.bottom)), cv::Scalar(255),
	              config.outline.thickness, cv::LINE_8);
	blendMask(raster, outlineMask, config.outline);
}

} // namespace

std::vector<ColorStop> defaultColorStops() {
	return {
	        {0.00, {255, 0, 255, 255}}, // magenta
	        {0.15, {128, 0, 255, 255}}, // purple
	        {0.25, {0, 0, 255, 255}},   // blue
	        {0.35, {0, 128, 255, 255}}, // light blue
	        {0.45, {0, 255, 255, 255}}, // cyan
	        {0.55, {0, 255, 128, 255}}, // teal
	        {0.65, {0, 255, 0, 255}},   // green
	        {0.75, {255, 255, 0, 255}}, // yellow
	        {0.85, {255, 128, 0, 255}}, // orange
	        {1.00, {255, 0, 0, 255}},   // red
	};
}

cv::Vec4b lookupColor(const std::vector<ColorStop>& stops, double value) {
	if (stops.empty()) {
		return {0, 0, 0, 0};
	}
	if (!std::isfinite(value)) {
		value = 0.0;
	}
	value = std::clamp(value, 0.0, 1.0);

	if (value <= stops.front().threshold) {
		return stops.front().rgba;
	}
	if (value >= stops.back().threshold) {
		return stops.back().rgba;
	}

	std::size_t upper = 1;
	while (upper < stops.size() - 1 && value > stops[upper].threshold) {
		++upper;
	}
	const ColorStop& lo = stops[upper - 1];
	const ColorStop& hi = stops[upper];

	const double range = hi.threshold - lo.threshold;
	const double t     = range > 0.0 ? (value - lo.threshold) / range : 0.0;

	cv::Vec4b out;
	for (int c = 0; c < 4; ++c) {
		const double channel = static_cast<double>(lo.rgba[c]) + t * (static_cast<double>(hi.rgba[c]) - static_cast<double>(lo.rgba[c]));
		out[c]               = cv::saturate_cast<std::uint8_t>(std::lround(channel));
	}
	return out;
}

double sampleBilinear(const DensityGrid& grid, double gx, double gy) {
	const int n = grid.size();
	if (n == 0) {
		return 0.0;
	}

	gx = std::clamp(gx, 0.0, static_cast<double>(n - 1));
	gy = std::clamp(gy, 0.0, static_cast<double>(n - 1));

	const int x0 = static_cast<int>(std::floor(gx));
	const int y0 = static_cast<int>(std::floor(gy));
	const int x1 = std::min(x0 + 1, n - 1);
	const int y1 = std::min(y0 + 1, n - 1);

	const double fx = gx - x0;
	const double fy = gy - y0;

	return grid.valueAt(y0, x0) * (1.0 - fx) * (1.0 - fy) + grid.valueAt(y0, x1) * fx * (1.0 - fy) + grid.valueAt(y1, x0) * (1.0 - fx) * fy +
	       grid.valueAt(y1, x1) * fx * fy;
}

bool isValidConfig(const HeatmapConfig& config) {
	if (config.width <= 0 || config.height <= 0) {
		return false;
	}
	if (!(config.gamma > 0.0) || !std::isfinite(config.gamma)) {
		return false;
	}
	if (config.stops.size() < 2u || config.stops.front().threshold != 0.0 || config.stops.back().threshold != 1.0) {
		return false;
	}
	const bool sorted = std::is_sorted(config.stops.begin(), config.stops.end(), [](const ColorStop& a, const ColorStop& b) { return a.threshold < b.threshold; });
	return sorted && isValidStyle(config.outline) && isValidStyle(config.gridLines);
}

cv::Mat renderHeatmap(const DensityGrid& grid, const HeatmapConfig& config, DebugVisualizer* debugger) {
	if (!isValidConfig(config)) {
		std::cerr << "[Error] Heatmap rendering failed: invalid configuration (" << config.width << "x" << config.height << ", " << config.stops.size()
		          << " colour stops)\n";
		return {};
	}

	cv::Mat raster(config.height, config.width, CV_8UC4, cv::Scalar::all(0));

	if (grid.isEmpty()) {
		// No data: plain background, the overlay still shows where the zone is.
		raster.setTo(cv::Scalar(config.stops.front().rgba[0], config.stops.front().rgba[1], config.stops.front().rgba[2], config.stops.front().rgba[3]));
	} else {
		const double span     = static_cast<double>(grid.size() - 1);
		const bool applyGamma = config.gamma != 1.0;
		for (int py = 0; py < raster.rows; ++py) {
			cv::Vec4b* row  = raster.ptr<cv::Vec4b>(py);
			const double gy = static_cast<double>(py) / config.height * span;
			for (int px = 0; px < raster.cols; ++px) {
				const double gx = static_cast<double>(px) / config.width * span;
				double density  = std::clamp(sampleBilinear(grid, gx, gy), 0.0, 1.0);
				if (applyGamma) {
					density = std::pow(density, config.gamma);
				}
				row[px] = lookupColor(config.stops, density);
			}
		}
	}

	if (config.drawZoneOverlay) {
		drawZoneOverlay(raster, config);
	}

	if (debugger) {
		debugger->beginStage("Heatmap");
		debugger->add("Raster", raster, ChannelOrder::Rgb);
		debugger->endStage();
	}

	return raster;
}

cv::Mat renderPitchHeatmap(const std::vector<cv::Point2d>& points, const DensityConfig& densityConfig, const HeatmapConfig& heatmapConfig,
                           DebugVisualizer* debugger) {
	const DensityResult density = buildDensityGrid(points, densityConfig, debugger);
	if (!density.success) {
		return {};
	}
	return renderHeatmap(density.grid, heatmapConfig, debugger);
}

} // namespace bullpen::analytics::core
