#pragma once

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace bullpen::analytics::core {

//! Channel order of a debug image with 3 or 4 channels.
enum class ChannelOrder { Bgr, Rgb };

//! One intermediate result of a pipeline step.
struct DebugStep {
	std::string name;                     //!< Step label shown above the tile.
	cv::Mat image;                        //!< Density grid (CV_64F) or raster (CV_8U).
	ChannelOrder order{ChannelOrder::Bgr}; //!< Channel order of colour images.
};

//! All steps recorded while one stage (density, heatmap) was active.
struct DebugStage {
	std::string name;
	std::vector<DebugStep> steps{};
};

//! Collects intermediate grids and rasters of the heatmap pipeline. Pass it to the pipeline functions to record their stages.
class DebugVisualizer {
public:
	void beginStage(std::string name); //!< Start a new stage. Ends the active stage first.
	void endStage();

	//! Record a step of the active stage. Ignored if no stage is active.
	void add(std::string name, const cv::Mat& image, ChannelOrder order = ChannelOrder::Bgr);

	//! Mosaic with one column per stage and one row per step (BGR, 8 bit). Ends the active stage.
	//! Single channel grids are shown with a colour map scaled to their own range.
	cv::Mat buildMosaic();

	const std::vector<DebugStage>& stages() const { return m_stages; }
	void clear();

private:
	static cv::Mat toDisplay(const DebugStep& step);

private:
	DebugStage m_current{};             //!< Stage currently collecting steps.
	bool m_hasActiveStage{false};
	std::vector<DebugStage> m_stages{}; //!< Completed stages in recording order.
};

} // namespace bullpen::analytics::core
