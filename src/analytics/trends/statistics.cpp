#include "analytics/trends/statistics.hpp"

#include <algorithm>
#include <numeric>

namespace bullpen::analytics::trends {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	}
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

std::optional<double> percentage(double part, double whole) {
	if (!(whole > 0.0)) {
		return std::nullopt;
	}
	return part / whole * 100.0;
}

std::optional<double> maximum(const std::vector<double>& v) {
	if (v.empty()) {
		return std::nullopt;
	}
	return *std::max_element(v.begin(), v.end());
}

} // namespace bullpen::analytics::trends
