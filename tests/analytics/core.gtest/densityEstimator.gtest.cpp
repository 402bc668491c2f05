#include "analytics/core/densityEstimator.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <cmath>
#include <limits>
#include <vector>

namespace bullpen::analytics::core {
namespace gtest {

//! Largest absolute difference of two grids of equal size.
static double maxDifference(const DensityGrid& a, const DensityGrid& b) {
	return cv::norm(a.values(), b.values(), cv::NORM_INF);
}

static cv::Point hottestCell(const DensityGrid& grid) {
	cv::Point location;
	cv::minMaxLoc(grid.values(), nullptr, nullptr, nullptr, &location);
	return location;
}

TEST(DensityEstimator, EmptyInputGivesZeroGrid) {
	const DensityResult result = buildDensityGrid({});
	ASSERT_TRUE(result.success);
	EXPECT_TRUE(result.grid.isEmpty());
	EXPECT_EQ(result.grid.size(), 100);
	EXPECT_EQ(result.grid.maxValue(), 0.0);
	EXPECT_EQ(cv::countNonZero(result.grid.values()), 0);
}

TEST(DensityEstimator, NormalisedToExactlyOne) {
	const std::vector<cv::Point2d> points{{0.0, 0.0}, {0.2, -0.3}, {-0.35, 0.4}, {0.1, 0.1}};
	const DensityResult result = buildDensityGrid(points);
	ASSERT_TRUE(result.success);
	ASSERT_FALSE(result.grid.isEmpty());

	double minV = 0.0;
	double maxV = 0.0;
	cv::minMaxLoc(result.grid.values(), &minV, &maxV);
	EXPECT_GE(minV, 0.0);
	EXPECT_EQ(maxV, 1.0);
	EXPECT_EQ(result.grid.maxValue(), 1.0);
}

TEST(DensityEstimator, SinglePitchPeaksAtItsCell) {
	const DensityResult result = buildDensityGrid({{0.0, 0.0}});
	ASSERT_TRUE(result.success);

	// (0, 0) maps to 49.5 on both axes, rounded to cell 50.
	EXPECT_EQ(result.grid.valueAt(50, 50), 1.0);
	EXPECT_LT(result.grid.valueAt(50, 40), result.grid.valueAt(50, 45));
	EXPECT_NEAR(result.grid.valueAt(50, 45), result.grid.valueAt(50, 55), 1e-12);
	EXPECT_EQ(result.grid.valueAt(0, 0), 0.0);
	EXPECT_EQ(result.grid.valueAt(-1, 50), 0.0);
	EXPECT_EQ(result.grid.valueAt(50, 100), 0.0);
}

TEST(DensityEstimator, HighPitchesAreNearTheTopRow) {
	const DensityResult high = buildDensityGrid({{0.0, 0.9}});
	const DensityResult low  = buildDensityGrid({{0.0, -0.9}});
	ASSERT_TRUE(high.success);
	ASSERT_TRUE(low.success);

	EXPECT_EQ(hottestCell(high.grid).y, 5);
	EXPECT_EQ(hottestCell(low.grid).y, 94);
}

TEST(DensityEstimator, IdenticalPitchesGiveTheSameShape) {
	const DensityResult one  = buildDensityGrid({{0.1, -0.2}});
	const DensityResult many = buildDensityGrid(std::vector<cv::Point2d>(25, cv::Point2d{0.1, -0.2}));
	ASSERT_TRUE(one.success);
	ASSERT_TRUE(many.success);

	EXPECT_EQ(hottestCell(one.grid), hottestCell(many.grid));
	EXPECT_LT(maxDifference(one.grid, many.grid), 1e-12);
}

TEST(DensityEstimator, OutOfDomainPointsAreClamped) {
	const DensityResult clamped = buildDensityGrid({{5.0, -3.0}});
	const DensityResult corner  = buildDensityGrid({{1.0, -1.0}});
	ASSERT_TRUE(clamped.success);
	ASSERT_TRUE(corner.success);
	EXPECT_EQ(maxDifference(clamped.grid, corner.grid), 0.0);

	// Zero padding pulls the peak a little away from the border.
	const cv::Point hottest = hottestCell(corner.grid);
	EXPECT_GE(hottest.x, 94);
	EXPECT_GE(hottest.y, 94);
	EXPECT_GT(corner.grid.valueAt(99, 99), 0.0);
}

TEST(DensityEstimator, NonFinitePointsAreSkipped) {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	const DensityResult mixed = buildDensityGrid({{nan, 0.0}, {0.0, 0.0}, {0.3, std::numeric_limits<double>::infinity()}});
	const DensityResult clean = buildDensityGrid({{0.0, 0.0}});
	ASSERT_TRUE(mixed.success);
	EXPECT_EQ(maxDifference(mixed.grid, clean.grid), 0.0);

	const DensityResult onlyBroken = buildDensityGrid({{nan, nan}});
	ASSERT_TRUE(onlyBroken.success);
	EXPECT_TRUE(onlyBroken.grid.isEmpty());
}

TEST(DensityEstimator, CustomConfig) {
	DensityConfig config{};
	config.gridSize        = 20;
	config.influenceRadius = 0;
	config.blurPasses      = 0;

	const DensityResult result = buildDensityGrid({{-1.0, 1.0}}, config);
	ASSERT_TRUE(result.success);
	EXPECT_EQ(result.grid.size(), 20);
	EXPECT_EQ(result.grid.valueAt(0, 0), 1.0);
	EXPECT_EQ(cv::countNonZero(result.grid.values()), 1);
}

TEST(DensityEstimator, InvalidConfigIsReported) {
	DensityConfig tiny{};
	tiny.gridSize = 1;
	EXPECT_FALSE(buildDensityGrid({{0.0, 0.0}}, tiny).success);

	DensityConfig noSigma{};
	noSigma.sigmaDivisor = 0.0;
	EXPECT_FALSE(buildDensityGrid({{0.0, 0.0}}, noSigma).success);

	DensityConfig negative{};
	negative.blurPasses = -1;
	EXPECT_FALSE(isValidConfig(negative));
	EXPECT_TRUE(isValidConfig(DensityConfig{}));
}

TEST(DensityEstimator, GridSpaceInvertsY) {
	const cv::Point2d topLeft = toGridSpace({-1.0, 1.0}, 100);
	EXPECT_DOUBLE_EQ(topLeft.x, 0.0);
	EXPECT_DOUBLE_EQ(topLeft.y, 0.0);

	const cv::Point2d bottomRight = toGridSpace({1.0, -1.0}, 100);
	EXPECT_DOUBLE_EQ(bottomRight.x, 99.0);
	EXPECT_DOUBLE_EQ(bottomRight.y, 99.0);

	const cv::Point2d clamped = toGridSpace({-4.0, 0.0}, 100);
	EXPECT_DOUBLE_EQ(clamped.x, 0.0);
	EXPECT_DOUBLE_EQ(clamped.y, 49.5);
}

TEST(DensityEstimator, DebuggerRecordsEveryStep) {
	DebugVisualizer debugger;
	const DensityResult result = buildDensityGrid({{0.0, 0.0}}, DensityConfig{}, &debugger);
	ASSERT_TRUE(result.success);

	ASSERT_EQ(debugger.stages().size(), 1u);
	const DebugStage& stage = debugger.stages().front();
	EXPECT_EQ(stage.name, "Density");
	ASSERT_EQ(stage.steps.size(), 3u);
	EXPECT_EQ(stage.steps[0].name, "Accumulated");
	EXPECT_EQ(stage.steps[1].name, "Smoothed");
	EXPECT_EQ(stage.steps[2].name, "Normalized");
}

TEST(DensityGrid, ConvertsSingleChannelInputToDouble) {
	cv::Mat floats = cv::Mat::zeros(4, 4, CV_32F);
	floats.at<float>(3, 3) = 0.5f;
	floats.at<float>(1, 2) = 1.0f;

	const DensityGrid fromFloat(floats);
	EXPECT_EQ(fromFloat.values().type(), CV_64FC1);
	EXPECT_EQ(fromFloat.size(), 4);
	EXPECT_DOUBLE_EQ(fromFloat.valueAt(3, 3), 0.5);
	EXPECT_DOUBLE_EQ(fromFloat.valueAt(1, 2), 1.0);
	EXPECT_DOUBLE_EQ(fromFloat.maxValue(), 1.0);

	cv::Mat bytes = cv::Mat::zeros(3, 3, CV_8U);
	bytes.at<unsigned char>(2, 0) = 7;
	const DensityGrid fromBytes(bytes);
	EXPECT_EQ(fromBytes.values().type(), CV_64FC1);
	EXPECT_DOUBLE_EQ(fromBytes.valueAt(2, 0), 7.0);
	EXPECT_DOUBLE_EQ(fromBytes.valueAt(0, 0), 0.0);
}

TEST(DensityGrid, RejectsMultiChannelInput) {
	const DensityGrid grid(cv::Mat(4, 4, CV_8UC3, cv::Scalar(10, 20, 30)));
	EXPECT_TRUE(grid.isEmpty());
	EXPECT_EQ(grid.size(), 0);
	EXPECT_DOUBLE_EQ(grid.valueAt(0, 0), 0.0);
}

} // namespace gtest
} // namespace bullpen::analytics::core
