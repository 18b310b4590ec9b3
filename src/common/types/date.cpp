#include "sqlcmp/common/types/date.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/string_util.hpp"

namespace sqlcmp {

const int32_t Date::NORMAL_DAYS[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
const int32_t Date::LEAP_DAYS[] = {0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

constexpr const int32_t Date::DATE_MIN_YEAR;
constexpr const int32_t Date::DATE_MAX_YEAR;

bool Date::IsLeapYear(int32_t year) {
	return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

bool Date::IsValid(int32_t year, int32_t month, int32_t day) {
	if (month < 1 || month > 12) {
		return false;
	}
	if (day < 1) {
		return false;
	}
	if (year < DATE_MIN_YEAR || year > DATE_MAX_YEAR) {
		return false;
	}
	return Date::IsLeapYear(year) ? day <= Date::LEAP_DAYS[month] : day <= Date::NORMAL_DAYS[month];
}

// days/civil conversions follow the proleptic Gregorian calendar, counted in 400-year eras
bool Date::TryFromDate(int32_t year, int32_t month, int32_t day, date_t &result) {
	if (!Date::IsValid(year, month, day)) {
		return false;
	}
	int64_t y = month <= 2 ? year - 1 : year;
	int64_t era = (y >= 0 ? y : y - 399) / 400;
	int64_t year_of_era = y - era * 400;
	int64_t month_index = month > 2 ? month - 3 : month + 9;
	int64_t day_of_year = (153 * month_index + 2) / 5 + day - 1;
	int64_t day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
	result = date_t(int32_t(era * 146097 + day_of_era - 719468));
	return true;
}

date_t Date::FromDate(int32_t year, int32_t month, int32_t day) {
	date_t result;
	if (!Date::TryFromDate(year, month, day, result)) {
		throw ConversionException("Date out of range: %d-%d-%d", year, month, day);
	}
	return result;
}

void Date::Convert(date_t date, int32_t &out_year, int32_t &out_month, int32_t &out_day) {
	int64_t z = int64_t(date.days) + 719468;
	int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	int64_t day_of_era = z - era * 146097;
	int64_t year_of_era = (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) / 365;
	int64_t day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
	int64_t month_index = (5 * day_of_year + 2) / 153;
	out_day = int32_t(day_of_year - (153 * month_index + 2) / 5 + 1);
	out_month = int32_t(month_index < 10 ? month_index + 3 : month_index - 9);
	out_year = int32_t(year_of_era + era * 400 + (out_month <= 2));
}

bool Date::ParseDoubleDigit(const char *buf, idx_t len, idx_t &pos, int32_t &result) {
	if (pos < len && StringUtil::CharacterIsDigit(buf[pos])) {
		result = buf[pos++] - '0';
		if (pos < len && StringUtil::CharacterIsDigit(buf[pos])) {
			result = (buf[pos++] - '0') + result * 10;
		}
		return true;
	}
	return false;
}

bool Date::TryConvertDate(const char *buf, idx_t len, idx_t &pos, date_t &result) {
	pos = 0;
	if (len == 0) {
		return false;
	}

	int32_t day = 0;
	int32_t month = -1;
	int32_t year = 0;

	// skip leading spaces
	while (pos < len && StringUtil::CharacterIsSpace(buf[pos])) {
		pos++;
	}
	if (pos >= len || !StringUtil::CharacterIsDigit(buf[pos])) {
		return false;
	}
	// first parse the year: exactly four digits
	idx_t year_start = pos;
	for (; pos < len && StringUtil::CharacterIsDigit(buf[pos]); pos++) {
		year = (buf[pos] - '0') + year * 10;
	}
	if (pos - year_start != 4) {
		return false;
	}

	if (pos >= len || buf[pos++] != '-') {
		return false;
	}
	// parse the month
	if (!Date::ParseDoubleDigit(buf, len, pos, month)) {
		return false;
	}
	if (pos >= len || buf[pos++] != '-') {
		return false;
	}
	// now parse the day
	if (!Date::ParseDoubleDigit(buf, len, pos, day)) {
		return false;
	}
	// there can be no direct trailing digits
	if (pos < len && StringUtil::CharacterIsDigit(buf[pos])) {
		return false;
	}
	return Date::TryFromDate(year, month, day, result);
}

string Date::ToString(date_t date) {
	int32_t year, month, day;
	Date::Convert(date, year, month, day);
	return StringUtil::Format("%04d-%02d-%02d", year, month, day);
}

} // namespace sqlcmp
