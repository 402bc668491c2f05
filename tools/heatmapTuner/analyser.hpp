#pragma once

#include "sessionLoader.hpp"
#include "viewStep.hpp"

#include "analytics/core/densityEstimator.hpp"
#include "analytics/core/heatmapRenderer.hpp"

#include <opencv2/core/mat.hpp>

namespace bullpen {

//! Runs the analytics pipeline on a session with the DebugVisualizer attached to the desired ViewStep.
class Analyser {
public:
	Analyser(Session session, Date today);

	cv::Mat analyse(ViewStep step) const;

	analytics::core::DensityConfig& densityConfig() { return m_densityConfig; }
	analytics::core::HeatmapConfig& heatmapConfig() { return m_heatmapConfig; }

private:
	cv::Mat renderBadges() const;

private:
	Session m_session;
	Date m_today;
	analytics::core::DensityConfig m_densityConfig{};
	analytics::core::HeatmapConfig m_heatmapConfig{};
};

} // namespace bullpen
