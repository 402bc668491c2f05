#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace bullpen {

using Date      = std::chrono::sys_days;                  //!< Calendar day without time of day.
using Timestamp = std::chrono::system_clock::time_point; //!< Point in time a record was created.

//! Build a day from year, month (1-12) and day of month (1-31). Invalid days are normalised by chrono.
Date makeDate(int year, unsigned month, unsigned day);

//! Parse "YYYY-MM-DD". Returns nothing for malformed strings or days that do not exist.
std::optional<Date> parseDate(std::string_view iso);

//! Format a day as "YYYY-MM-DD".
std::string toIsoString(Date date);

//! Signed number of days from `from` to `to`.
inline int daysBetween(Date from, Date to) {
	return static_cast<int>((to - from).count());
}

} // namespace bullpen
