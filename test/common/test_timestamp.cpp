#include "catch.hpp"
#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/types/timestamp.hpp"

using namespace sqlcmp;

static TimestampCastResult TryParseTimestamp(const string &str, timestamp_t &result) {
	return Timestamp::TryConvertTimestamp(str.c_str(), str.size(), result);
}

static bool IsValidTimestamp(const string &str) {
	timestamp_t result;
	return TryParseTimestamp(str, result) == TimestampCastResult::SUCCESS;
}

TEST_CASE("Test timestamp parsing", "[timestamp]") {
	REQUIRE(Timestamp::ToString(Timestamp::FromString("2019-08-26 08:52:06")) == "2019-08-26 08:52:06");
	REQUIRE(Timestamp::ToString(Timestamp::FromString("2019-08-26T08:52:06.123456Z")) ==
	        "2019-08-26 08:52:06.123456");
	REQUIRE(Timestamp::ToString(Timestamp::FromString("2019-08-26")) == "2019-08-26 00:00:00");
	REQUIRE(Timestamp::ToString(Timestamp::FromString("2019-01-01 12")) == "2019-01-01 12:00:00");
	REQUIRE(Timestamp::ToString(Timestamp::FromString("2019-01-01 12:30")) == "2019-01-01 12:30:00");
	REQUIRE(Timestamp::ToString(Timestamp::FromString("  2019-08-26 08:52:06  ")) == "2019-08-26 08:52:06");

	// fractions beyond microseconds are truncated
	REQUIRE(Timestamp::ToString(Timestamp::FromString("2019-01-01 00:00:00.1234567")) ==
	        "2019-01-01 00:00:00.123456");
	REQUIRE(Timestamp::ToString(Timestamp::FromString("2019-01-01 00:00:00.5")) == "2019-01-01 00:00:00.500000");
}

TEST_CASE("Test timestamp offsets", "[timestamp]") {
	REQUIRE(Timestamp::FromString("2019-08-26 10:00:00+02:00") == Timestamp::FromString("2019-08-26 08:00:00"));
	REQUIRE(Timestamp::FromString("2019-08-26 10:00:00+02") == Timestamp::FromString("2019-08-26 08:00:00"));
	REQUIRE(Timestamp::ToString(Timestamp::FromString("2019-08-26 00:00:00-01:30")) == "2019-08-26 01:30:00");
	REQUIRE(Timestamp::ToString(Timestamp::FromString("2019-08-26 00:30:00+01:00")) == "2019-08-25 23:30:00");
	REQUIRE(Timestamp::FromString("2019-08-26 23:00:00+23:59") == Timestamp::FromString("2019-08-25 23:01:00"));

	// offsets are bounded by a day and an hour
	REQUIRE(!IsValidTimestamp("2019-08-26 10:00:00+99"));
	REQUIRE(!IsValidTimestamp("2019-08-26 10:00:00-24:00"));
	REQUIRE(!IsValidTimestamp("2019-08-26 10:00:00+02:60"));
	REQUIRE(!IsValidTimestamp("2019-08-26 10:00:00+0275"));
}

TEST_CASE("Test timestamps around the epoch", "[timestamp]") {
	REQUIRE(Timestamp::FromString("1970-01-01 00:00:00").value == 0);
	REQUIRE(Timestamp::FromString("1970-01-01 00:00:01").value == Timestamp::MICROS_PER_SEC);
	auto before_epoch = Timestamp::FromString("1969-12-31 23:59:59");
	REQUIRE(before_epoch.value == -Timestamp::MICROS_PER_SEC);
	REQUIRE(Timestamp::ToString(before_epoch) == "1969-12-31 23:59:59");
	REQUIRE(Timestamp::ToString(Timestamp::FromEpochMs(1566809526000)) == "2019-08-26 08:52:06");
}

TEST_CASE("Test invalid timestamps", "[timestamp]") {
	REQUIRE(IsValidTimestamp("2020-02-29"));
	REQUIRE(!IsValidTimestamp("2019-02-29"));
	REQUIRE(!IsValidTimestamp("2019-13-01"));
	REQUIRE(!IsValidTimestamp("2019-02-30"));
	REQUIRE(!IsValidTimestamp("19-01-01"));
	REQUIRE(!IsValidTimestamp("2019-01-01 25:00:00"));
	REQUIRE(!IsValidTimestamp("2019-01-01 12:60:00"));
	REQUIRE(!IsValidTimestamp("2019-01-01 12:00:00."));
	REQUIRE(!IsValidTimestamp("2019-01-01X"));
	REQUIRE(!IsValidTimestamp("not a timestamp"));
	REQUIRE(!IsValidTimestamp(""));

	REQUIRE_THROWS_AS(Timestamp::FromString("2019-13-01"), ConversionException);
	REQUIRE_THROWS_WITH(Timestamp::FromString("yesterday"), Catch::Contains("invalid timestamp: \"yesterday\""));
	REQUIRE_THROWS_WITH(Timestamp::FromString("yesterday"), !Catch::Contains("out of range"));
}

TEST_CASE("Test timestamp construction", "[timestamp]") {
	auto date = Date::FromDate(2019, 8, 26);
	auto time = 8 * Timestamp::MICROS_PER_HOUR + 52 * Timestamp::MICROS_PER_MINUTE + 6 * Timestamp::MICROS_PER_SEC;
	REQUIRE(Timestamp::FromDatetime(date, time) == Timestamp::FromString("2019-08-26 08:52:06"));
	REQUIRE(Timestamp::GetDate(Timestamp::FromDatetime(date, time)) == date);
	REQUIRE(Timestamp::GetTime(Timestamp::FromDatetime(date, time)) == time);

	REQUIRE_THROWS_AS(Timestamp::FromDatetime(date, Timestamp::MICROS_PER_DAY), ConversionException);
	REQUIRE_THROWS_AS(Date::FromDate(2019, 2, 29), ConversionException);
	REQUIRE(Date::IsLeapYear(2000));
	REQUIRE(!Date::IsLeapYear(1900));
}
