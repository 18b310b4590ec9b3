#include "sqlcmp/common/types/timestamp.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/string_util.hpp"

#include <chrono>
#include <limits>

namespace sqlcmp {

static_assert(sizeof(timestamp_t) == sizeof(int64_t), "timestamp_t was padded");

constexpr const int32_t Timestamp::HOURS_PER_DAY;
constexpr const int32_t Timestamp::MINS_PER_HOUR;
constexpr const int64_t Timestamp::MICROS_PER_MSEC;
constexpr const int64_t Timestamp::MICROS_PER_SEC;
constexpr const int64_t Timestamp::MICROS_PER_MINUTE;
constexpr const int64_t Timestamp::MICROS_PER_HOUR;
constexpr const int64_t Timestamp::MICROS_PER_DAY;

// string format is YYYY-MM-DDThh:mm:ss.ffffffZ
// T may be a space, everything after the date is optional
// ISO 8601

bool Timestamp::TryParseTime(const char *buf, idx_t len, idx_t &pos, int64_t &result) {
	int32_t hour = 0, min = 0, sec = 0;
	int64_t micros = 0;
	if (!Date::ParseDoubleDigit(buf, len, pos, hour) || hour >= 24) {
		return false;
	}
	if (pos < len && buf[pos] == ':') {
		pos++;
		if (!Date::ParseDoubleDigit(buf, len, pos, min) || min >= 60) {
			return false;
		}
		if (pos < len && buf[pos] == ':') {
			pos++;
			if (!Date::ParseDoubleDigit(buf, len, pos, sec) || sec >= 60) {
				return false;
			}
			if (pos < len && buf[pos] == '.') {
				pos++;
				// digits beyond microsecond precision are truncated
				idx_t digits = 0;
				int64_t mult = 100000;
				for (; pos < len && StringUtil::CharacterIsDigit(buf[pos]); pos++, digits++) {
					if (digits < 6) {
						micros += (buf[pos] - '0') * mult;
						mult /= 10;
					}
				}
				if (digits == 0) {
					return false;
				}
			}
		}
	}
	result = hour * MICROS_PER_HOUR + min * MICROS_PER_MINUTE + sec * MICROS_PER_SEC + micros;
	return true;
}

bool Timestamp::TryParseUTCOffset(const char *str, idx_t &pos, idx_t len, int &hour_offset, int &minute_offset) {
	minute_offset = 0;
	idx_t curpos = pos;
	// parse the next 3 characters
	if (curpos + 3 > len) {
		// no characters left to parse
		return false;
	}
	char sign_char = str[curpos];
	if (sign_char != '+' && sign_char != '-') {
		// expected either + or -
		return false;
	}
	curpos++;
	if (!StringUtil::CharacterIsDigit(str[curpos]) || !StringUtil::CharacterIsDigit(str[curpos + 1])) {
		// expected +HH or -HH
		return false;
	}
	hour_offset = (str[curpos] - '0') * 10 + (str[curpos + 1] - '0');
	if (hour_offset >= HOURS_PER_DAY) {
		return false;
	}
	if (sign_char == '-') {
		hour_offset = -hour_offset;
	}
	curpos += 2;

	// optional minute specifier: expected either "MM" or ":MM"
	if (curpos >= len) {
		pos = curpos;
		return true;
	}
	if (str[curpos] == ':') {
		curpos++;
	}
	if (curpos + 2 > len || !StringUtil::CharacterIsDigit(str[curpos]) ||
	    !StringUtil::CharacterIsDigit(str[curpos + 1])) {
		// no MM specifier
		pos = curpos;
		return true;
	}
	// we have an MM specifier: parse it
	minute_offset = (str[curpos] - '0') * 10 + (str[curpos + 1] - '0');
	if (minute_offset >= MINS_PER_HOUR) {
		return false;
	}
	if (sign_char == '-') {
		minute_offset = -minute_offset;
	}
	pos = curpos + 2;
	return true;
}

TimestampCastResult Timestamp::TryConvertTimestamp(const char *str, idx_t len, timestamp_t &result) {
	idx_t pos;
	date_t date;
	int64_t time = 0;
	if (!Date::TryConvertDate(str, len, pos, date)) {
		return TimestampCastResult::ERROR_INCORRECT_FORMAT;
	}
	// try to parse a time field
	if (pos < len && (str[pos] == ' ' || str[pos] == 'T')) {
		idx_t time_pos = pos + 1;
		if (time_pos < len && StringUtil::CharacterIsDigit(str[time_pos])) {
			pos = time_pos;
			if (!TryParseTime(str, len, pos, time)) {
				return TimestampCastResult::ERROR_INCORRECT_FORMAT;
			}
		}
	}
	if (!Timestamp::TryFromDatetime(date, time, result)) {
		return TimestampCastResult::ERROR_RANGE;
	}
	if (pos < len) {
		// skip a "Z" at the end (as per the ISO8601 specs)
		int hour_offset, minute_offset;
		if (str[pos] == 'Z') {
			pos++;
		} else if (Timestamp::TryParseUTCOffset(str, pos, len, hour_offset, minute_offset)) {
			result.value -= hour_offset * MICROS_PER_HOUR + minute_offset * MICROS_PER_MINUTE;
		}
		// skip any spaces at the end
		while (pos < len && StringUtil::CharacterIsSpace(str[pos])) {
			pos++;
		}
		if (pos < len) {
			return TimestampCastResult::ERROR_INCORRECT_FORMAT;
		}
	}
	return TimestampCastResult::SUCCESS;
}

string Timestamp::ConversionError(const string &str) {
	return StringUtil::Format("invalid timestamp: \"%s\", "
	                          "expected format is (YYYY-MM-DD[THH[:MM[:SS[.fff]]]][Z|±HH[:MM]])",
	                          str);
}

timestamp_t Timestamp::FromString(const string &str) {
	timestamp_t result;
	if (TryConvertTimestamp(str.c_str(), str.size(), result) != TimestampCastResult::SUCCESS) {
		throw ConversionException(Timestamp::ConversionError(str));
	}
	return result;
}

string Timestamp::ToString(timestamp_t timestamp) {
	auto date = Timestamp::GetDate(timestamp);
	auto time = Timestamp::GetTime(timestamp);
	auto hour = time / MICROS_PER_HOUR;
	auto min = (time % MICROS_PER_HOUR) / MICROS_PER_MINUTE;
	auto sec = (time % MICROS_PER_MINUTE) / MICROS_PER_SEC;
	auto micros = time % MICROS_PER_SEC;
	auto result = Date::ToString(date) + StringUtil::Format(" %02d:%02d:%02d", hour, min, sec);
	if (micros != 0) {
		result += StringUtil::Format(".%06d", micros);
	}
	return result;
}

date_t Timestamp::GetDate(timestamp_t timestamp) {
	int64_t days = timestamp.value / MICROS_PER_DAY;
	if (timestamp.value % MICROS_PER_DAY < 0) {
		days--;
	}
	return date_t(int32_t(days));
}

int64_t Timestamp::GetTime(timestamp_t timestamp) {
	int64_t time = timestamp.value % MICROS_PER_DAY;
	if (time < 0) {
		time += MICROS_PER_DAY;
	}
	return time;
}

bool Timestamp::TryFromDatetime(date_t date, int64_t time_micros, timestamp_t &result) {
	if (time_micros < 0 || time_micros >= MICROS_PER_DAY) {
		return false;
	}
	result.value = int64_t(date.days) * MICROS_PER_DAY + time_micros;
	return true;
}

timestamp_t Timestamp::FromDatetime(date_t date, int64_t time_micros) {
	timestamp_t result;
	if (!TryFromDatetime(date, time_micros, result)) {
		throw ConversionException("Overflow exception in date/time -> timestamp conversion");
	}
	return result;
}

timestamp_t Timestamp::FromEpochMs(int64_t ms) {
	if (ms > std::numeric_limits<int64_t>::max() / MICROS_PER_MSEC ||
	    ms < std::numeric_limits<int64_t>::min() / MICROS_PER_MSEC) {
		throw ConversionException("Could not convert Timestamp(MS) to Timestamp(US)");
	}
	return timestamp_t(ms * MICROS_PER_MSEC);
}

timestamp_t Timestamp::GetCurrentTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
	return Timestamp::FromEpochMs(epoch_ms);
}

} // namespace sqlcmp
