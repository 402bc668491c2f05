#include "model/calendar.hpp"

#include <charconv>
#include <cstdio>

namespace bullpen {

static bool parseNumber(std::string_view text, int& out) {
	if (text.empty()) {
		return false;
	}
	for (char c: text) {
		if (c < '0' || c > '9') {
			return false;
		}
	}
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
	return ec == std::errc{} && ptr == text.data() + text.size();
}

Date makeDate(int year, unsigned month, unsigned day) {
	return std::chrono::sys_days{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
}

std::optional<Date> parseDate(std::string_view iso) {
	// Strict layout: 4 digit year, 2 digit month, 2 digit day.
	if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
		return std::nullopt;
	}

	int year  = 0;
	int month = 0;
	int day   = 0;
	if (!parseNumber(iso.substr(0, 4), year) || !parseNumber(iso.substr(5, 2), month) || !parseNumber(iso.substr(8, 2), day)) {
		return std::nullopt;
	}

	const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
	                                      std::chrono::day{static_cast<unsigned>(day)}};
	if (!ymd.ok()) {
		return std::nullopt;
	}
	return std::chrono::sys_days{ymd};
}

std::string toIsoString(Date date) {
	const std::chrono::year_month_day ymd{date};

	char buffer[16]{};
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
	              static_cast<unsigned>(ymd.day()));
	return buffer;
}

} // namespace bullpen
