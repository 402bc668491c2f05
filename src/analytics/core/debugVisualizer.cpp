#include "analytics/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace bullpen::analytics::core {

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_current        = DebugStage{std::move(name), {}};
	m_hasActiveStage = true;
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}
	m_stages.push_back(std::move(m_current));
	m_current        = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& image, ChannelOrder order) {
	if (!m_hasActiveStage) {
		std::cerr << "[Error] DebugVisualizer: step '" << name << "' added without an active stage.\n";
		return;
	}
	m_current.steps.push_back(DebugStep{std::move(name), image.clone(), order});
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_current        = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic() {
	static constexpr int TILE_SIZE     = 320;
	static constexpr int HEADER_HEIGHT = 32;
	static constexpr int LABEL_HEIGHT  = 24;
	static constexpr int PADDING       = 4;

	static const cv::Scalar BACKGROUND(24, 24, 24);
	static const cv::Scalar BAR(0, 0, 0);
	static const cv::Scalar TEXT(255, 255, 255);

	endStage();

	std::size_t rows = 0;
	for (const DebugStage& stage: m_stages) {
		rows = std::max(rows, stage.steps.size());
	}
	if (m_stages.empty() || rows == 0) {
		return {};
	}

	const int columns = static_cast<int>(m_stages.size());
	cv::Mat mosaic(HEADER_HEIGHT + static_cast<int>(rows) * TILE_SIZE, columns * TILE_SIZE, CV_8UC3, BACKGROUND);

	for (int c = 0; c < columns; ++c) {
		const DebugStage& stage = m_stages[static_cast<std::size_t>(c)];

		cv::rectangle(mosaic, cv::Rect(c * TILE_SIZE, 0, TILE_SIZE, HEADER_HEIGHT), BAR, cv::FILLED);
		cv::putText(mosaic, stage.name, cv::Point(c * TILE_SIZE + 8, HEADER_HEIGHT - 10), cv::FONT_HERSHEY_SIMPLEX, 0.7, TEXT, 1, cv::LINE_AA);

		for (std::size_t r = 0; r < stage.steps.size(); ++r) {
			const DebugStep& step = stage.steps[r];
			cv::Mat tile          = mosaic(cv::Rect(c * TILE_SIZE, HEADER_HEIGHT + static_cast<int>(r) * TILE_SIZE, TILE_SIZE, TILE_SIZE));

			cv::rectangle(tile, cv::Rect(0, 0, tile.cols, LABEL_HEIGHT), BAR, cv::FILLED);
			cv::putText(tile, step.name, cv::Point(PADDING, LABEL_HEIGHT - 7), cv::FONT_HERSHEY_SIMPLEX, 0.5, TEXT, 1, cv::LINE_AA);

			const cv::Mat display = toDisplay(step);
			if (display.empty()) {
				continue;
			}

			// Fit into the area below the label, keep the aspect ratio.
			const int availW   = TILE_SIZE - 2 * PADDING;
			const int availH   = TILE_SIZE - LABEL_HEIGHT - 2 * PADDING;
			const double scale = std::min(static_cast<double>(availW) / display.cols, static_cast<double>(availH) / display.rows);
			const int w        = std::clamp(static_cast<int>(std::lround(display.cols * scale)), 1, availW);
			const int h        = std::clamp(static_cast<int>(std::lround(display.rows * scale)), 1, availH);

			cv::Mat resized;
			cv::resize(display, resized, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);
			resized.copyTo(tile(cv::Rect(PADDING + (availW - w) / 2, LABEL_HEIGHT + PADDING + (availH - h) / 2, w, h)));
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toDisplay(const DebugStep& step) {
	const cv::Mat& in = step.image;
	if (in.empty()) {
		return {};
	}

	if (in.channels() == 1) {
		// Density grids: scale to their own range and colour map them.
		double minV = 0.0;
		double maxV = 0.0;
		cv::minMaxLoc(in, &minV, &maxV);

		cv::Mat gray;
		if (maxV - minV < 1e-12) {
			gray = cv::Mat::zeros(in.size(), CV_8UC1);
		} else {
			in.convertTo(gray, CV_8U, 255.0 / (maxV - minV), -minV * 255.0 / (maxV - minV));
		}

		cv::Mat colored;
		cv::applyColorMap(gray, colored, cv::COLORMAP_INFERNO);
		return colored;
	}

	cv::Mat bgr;
	if (in.channels() == 4) {
		cv::cvtColor(in, bgr, step.order == ChannelOrder::Rgb ? cv::COLOR_RGBA2BGR : cv::COLOR_BGRA2BGR);
	} else if (in.channels() == 3 && step.order == ChannelOrder::Rgb) {
		cv::cvtColor(in, bgr, cv::COLOR_RGB2BGR);
	} else {
		bgr = in;
	}

	if (bgr.depth() != CV_8U) {
		bgr.convertTo(bgr, CV_8U);
	}
	return bgr;
}

} // namespace bullpen::analytics::core
