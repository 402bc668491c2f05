#pragma once

#include <optional>
#include <vector>

// Small numeric helpers shared by the aggregation and badge rules.
namespace bullpen::analytics::trends {

//! Arithmetic mean. 0.0 for an empty input.
double mean(const std::vector<double>& v);

//! part / whole * 100. Nothing if whole is not positive.
std::optional<double> percentage(double part, double whole);

//! Largest value. Nothing for an empty input.
std::optional<double> maximum(const std::vector<double>& v);

} // namespace bullpen::analytics::trends
