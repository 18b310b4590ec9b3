//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/types/timestamp.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"
#include "sqlcmp/common/types/date.hpp"

namespace sqlcmp {

//! Type used to represent timestamps (microseconds since 1970-01-01 00:00:00 UTC)
struct timestamp_t { // NOLINT
	int64_t value;

	timestamp_t() = default;
	explicit inline constexpr timestamp_t(int64_t micros) : value(micros) {
	}

	// comparison operators
	inline bool operator==(const timestamp_t &rhs) const {
		return value == rhs.value;
	};
	inline bool operator!=(const timestamp_t &rhs) const {
		return value != rhs.value;
	};
	inline bool operator<=(const timestamp_t &rhs) const {
		return value <= rhs.value;
	};
	inline bool operator<(const timestamp_t &rhs) const {
		return value < rhs.value;
	};
	inline bool operator>(const timestamp_t &rhs) const {
		return value > rhs.value;
	};
	inline bool operator>=(const timestamp_t &rhs) const {
		return value >= rhs.value;
	};
};

enum class TimestampCastResult : uint8_t { SUCCESS, ERROR_INCORRECT_FORMAT, ERROR_RANGE };

//! The Timestamp class is a static class that holds helper functions for the Timestamp type.
class Timestamp {
public:
	constexpr static const int32_t HOURS_PER_DAY = 24;
	constexpr static const int32_t MINS_PER_HOUR = 60;
	constexpr static const int64_t MICROS_PER_MSEC = 1000;
	constexpr static const int64_t MICROS_PER_SEC = 1000000;
	constexpr static const int64_t MICROS_PER_MINUTE = MICROS_PER_SEC * 60;
	constexpr static const int64_t MICROS_PER_HOUR = MICROS_PER_MINUTE * 60;
	constexpr static const int64_t MICROS_PER_DAY = MICROS_PER_HOUR * 24;

public:
	//! Convert a string in the format "YYYY-MM-DD[(T| )hh[:mm[:ss[.f]]]][Z|(+|-)hh[:mm]]" to a timestamp object
	static timestamp_t FromString(const string &str);
	//! Try to convert a string to a timestamp, reporting the failure kind instead of throwing
	static TimestampCastResult TryConvertTimestamp(const char *str, idx_t len, timestamp_t &result);
	//! Convert a timestamp object to a string in the format "YYYY-MM-DD hh:mm:ss[.ffffff]"
	static string ToString(timestamp_t timestamp);

	static date_t GetDate(timestamp_t timestamp);
	//! Microseconds since midnight
	static int64_t GetTime(timestamp_t timestamp);
	//! Create a Timestamp object from a specified (date, time) combination
	static bool TryFromDatetime(date_t date, int64_t time_micros, timestamp_t &result);
	static timestamp_t FromDatetime(date_t date, int64_t time_micros);

	//! Create a timestamp from milliseconds since the epoch
	static timestamp_t FromEpochMs(int64_t ms);
	//! The current wall clock time, at millisecond precision
	static timestamp_t GetCurrentTimestamp();

	//! The error for text that is not a valid timestamp
	static string ConversionError(const string &str);

private:
	static bool TryParseTime(const char *buf, idx_t len, idx_t &pos, int64_t &result);
	static bool TryParseUTCOffset(const char *str, idx_t &pos, idx_t len, int &hour_offset, int &minute_offset);
};

} // namespace sqlcmp
