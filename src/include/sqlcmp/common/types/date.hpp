//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/types/date.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"

namespace sqlcmp {

//! Type used to represent dates (days since 1970-01-01)
struct date_t { // NOLINT
	int32_t days;

	date_t() = default;
	explicit inline date_t(int32_t days_p) : days(days_p) {
	}

	inline bool operator==(const date_t &rhs) const {
		return days == rhs.days;
	}
	inline bool operator!=(const date_t &rhs) const {
		return days != rhs.days;
	}
	inline bool operator<(const date_t &rhs) const {
		return days < rhs.days;
	}
};

//! The Date class is a static class that holds helper functions for the date type.
class Date {
public:
	static const int32_t NORMAL_DAYS[13];
	static const int32_t LEAP_DAYS[13];

	constexpr static const int32_t DATE_MIN_YEAR = 0;
	constexpr static const int32_t DATE_MAX_YEAR = 9999;

public:
	//! Try to convert text in a buffer to a date; pos is set to the first unconsumed character
	static bool TryConvertDate(const char *buf, idx_t len, idx_t &pos, date_t &result);
	//! Convert a date object to a string in the format "YYYY-MM-DD"
	static string ToString(date_t date);

	//! Create a date from the year, month and day; throws ConversionException if the date is invalid
	static date_t FromDate(int32_t year, int32_t month, int32_t day);
	static bool TryFromDate(int32_t year, int32_t month, int32_t day, date_t &result);
	//! Extract the year, month and day from a given date object
	static void Convert(date_t date, int32_t &out_year, int32_t &out_month, int32_t &out_day);

	static bool IsLeapYear(int32_t year);
	static bool IsValid(int32_t year, int32_t month, int32_t day);

	//! Parse one or two digits at pos
	static bool ParseDoubleDigit(const char *buf, idx_t len, idx_t &pos, int32_t &result);
};

} // namespace sqlcmp
