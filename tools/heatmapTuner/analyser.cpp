#include "analyser.hpp"

#include "analytics/badges/badgeEvaluator.hpp"
#include "analytics/core/debugVisualizer.hpp"

#include <opencv2/imgproc.hpp>

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace bullpen {

static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.85, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
	return tile;
}

Analyser::Analyser(Session session, Date today) : m_session(std::move(session)), m_today(today) {
}

cv::Mat Analyser::analyse(const ViewStep step) const {
	if (m_session.events.empty()) {
		return buildInfoTile("Input Error", "No pitches loaded.");
	}

	const std::vector<cv::Point2d> points = pitchLocations(m_session.events);

	switch (step) {
	case ViewStep::Heatmap: {
		const cv::Mat raster = analytics::core::renderPitchHeatmap(points, m_densityConfig, m_heatmapConfig);
		if (raster.empty()) {
			return buildInfoTile("Heatmap", "Rendering failed, check the configuration.");
		}
		cv::Mat bgr;
		cv::cvtColor(raster, bgr, cv::COLOR_RGBA2BGR);
		return bgr;
	}

	case ViewStep::DensityStages: {
		analytics::core::DebugVisualizer debugger;
		analytics::core::renderPitchHeatmap(points, m_densityConfig, m_heatmapConfig, &debugger);

		const cv::Mat mosaic = debugger.buildMosaic();
		if (mosaic.empty()) {
			return buildInfoTile("No Debug Output", "Selected stage produced no visuals.");
		}
		return mosaic;
	}

	case ViewStep::Badges: return renderBadges();
	}

	return buildInfoTile("Unknown View", "Select a view.");
}

cv::Mat Analyser::renderBadges() const {
	static constexpr int ROW_HEIGHT = 46;
	static constexpr int BAR_WIDTH  = 240;

	const std::vector<analytics::BadgeResult> results = analytics::evaluateBadges(m_session.outings, m_session.events, analytics::BadgeContext{m_today});

	cv::Mat tile(80 + static_cast<int>(results.size()) * ROW_HEIGHT, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	const std::string title = "Badges: " + std::to_string(analytics::earnedCount(results)) + " / " + std::to_string(results.size()) + " earned";
	cv::putText(tile, title, cv::Point(20, 50), cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);

	int y = 80;
	for (const analytics::BadgeResult& result: results) {
		const cv::Scalar color = result.earned ? cv::Scalar(80, 200, 80) : cv::Scalar(160, 160, 160);

		cv::putText(tile, result.badge->name, cv::Point(20, y + 30), cv::FONT_HERSHEY_SIMPLEX, 0.7, color, 2, cv::LINE_AA);

		const cv::Rect bar(300, y + 14, BAR_WIDTH, 20);
		cv::rectangle(tile, bar, cv::Scalar(70, 70, 70), cv::FILLED);
		const int filled = static_cast<int>(BAR_WIDTH * result.progress / 100.0);
		if (filled > 0) {
			cv::rectangle(tile, cv::Rect(bar.x, bar.y, filled, bar.height), color, cv::FILLED);
		}

		std::ostringstream progress;
		progress << std::fixed << std::setprecision(0) << result.progress << "%  " << result.detail;
		cv::putText(tile, progress.str(), cv::Point(560, y + 30), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(220, 220, 220), 1, cv::LINE_AA);

		y += ROW_HEIGHT;
	}
	return tile;
}

} // namespace bullpen
