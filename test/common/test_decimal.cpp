#include "catch.hpp"
#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/types/decimal.hpp"
#include "sqlcmp/common/types/value.hpp"

#include <cmath>
#include <limits>

using namespace sqlcmp;

static bool TryParseDecimal(const string &str, decimal_t &result) {
	return Decimal::TryFromString(str.c_str(), str.size(), result);
}

TEST_CASE("Test parsing decimals", "[decimal]") {
	decimal_t result;
	REQUIRE(TryParseDecimal("1.50", result));
	REQUIRE(result.value == hugeint_t(150));
	REQUIRE(result.scale == 2);

	REQUIRE(TryParseDecimal(" -0.001 ", result));
	REQUIRE(result.value == hugeint_t(-1));
	REQUIRE(result.scale == 3);

	REQUIRE(TryParseDecimal("+.5", result));
	REQUIRE(Decimal::ToString(result) == "0.5");

	REQUIRE(TryParseDecimal("42.", result));
	REQUIRE(Decimal::ToString(result) == "42");

	// exponents shift the scale
	REQUIRE(TryParseDecimal("1e3", result));
	REQUIRE(result.value == hugeint_t(1000));
	REQUIRE(result.scale == 0);
	REQUIRE(TryParseDecimal("1.5E-2", result));
	REQUIRE(Decimal::ToString(result) == "0.015");

	// leading zeros do not count towards the 38 digit limit
	REQUIRE(TryParseDecimal("0000" + string(38, '9'), result));
	REQUIRE(result.scale == 0);
	// neither do trailing zeros: they move into the scale
	REQUIRE(TryParseDecimal("1" + string(40, '0'), result));
	REQUIRE(result.value == Hugeint::POWERS_OF_TEN[37]);
	REQUIRE(result.scale == -3);
	REQUIRE(TryParseDecimal("1.5" + string(40, '0'), result));
	REQUIRE(Decimal::Compare(result, Decimal::FromString("1.5")) == 0);
	REQUIRE(result.scale == 37);
	REQUIRE(!TryParseDecimal(string(39, '9'), result));
	REQUIRE(!TryParseDecimal("1." + string(40, '0') + "1", result));

	// exponents beyond the DECIMAL range are kept in the scale
	REQUIRE(TryParseDecimal("1e40", result));
	REQUIRE(result.value == hugeint_t(1));
	REQUIRE(result.scale == -40);
	REQUIRE(TryParseDecimal("-2.5e-40", result));
	REQUIRE(result.value == hugeint_t(-25));
	REQUIRE(result.scale == 41);
	REQUIRE(TryParseDecimal("0e99", result));
	REQUIRE(result.value == hugeint_t(0));
	REQUIRE(result.scale == 0);
	REQUIRE(!TryParseDecimal("1e999999999999", result));

	REQUIRE(!TryParseDecimal("", result));
	REQUIRE(!TryParseDecimal("   ", result));
	REQUIRE(!TryParseDecimal("abc", result));
	REQUIRE(!TryParseDecimal("1.2.3", result));
	REQUIRE(!TryParseDecimal("--1", result));
	REQUIRE(!TryParseDecimal("1e", result));
	REQUIRE(!TryParseDecimal("1 2", result));
	REQUIRE(!TryParseDecimal(".", result));

	REQUIRE_THROWS_AS(Decimal::FromString("twelve"), ConversionException);
}

TEST_CASE("Test decimal comparison ignores the scale", "[decimal]") {
	REQUIRE(Decimal::Compare(Decimal::FromString("1.50"), Decimal::FromInt64(1)) > 0);
	REQUIRE(Decimal::Compare(Decimal::FromString("1.00"), Decimal::FromInt64(1)) == 0);
	REQUIRE(Decimal::Compare(Decimal::FromString("1.5"), Decimal::FromString("1.50")) == 0);
	REQUIRE(Decimal::Compare(Decimal::FromString("-1.5"), Decimal::FromInt64(-1)) < 0);
	REQUIRE(Decimal::Compare(Decimal::FromString("0.001"), Decimal::FromString("0.01")) < 0);
	REQUIRE(Decimal::Compare(Decimal::FromString("-0.001"), Decimal::FromString("0")) < 0);

	// aligning the scales would overflow: the position of the leading digit decides
	decimal_t huge(Hugeint::POWERS_OF_TEN[37], 0);
	decimal_t tiny(hugeint_t(1), 38);
	decimal_t negative_huge(hugeint_t(0) - Hugeint::POWERS_OF_TEN[37], 0);
	REQUIRE(Decimal::Compare(huge, tiny) > 0);
	REQUIRE(Decimal::Compare(tiny, huge) < 0);
	REQUIRE(Decimal::Compare(negative_huge, tiny) < 0);
	REQUIRE(Decimal::Compare(tiny, negative_huge) > 0);
}

TEST_CASE("Test decimal comparison outside the DECIMAL range", "[decimal]") {
	auto one_and_a_half = Decimal::FromString("1.5");
	REQUIRE(Decimal::Compare(one_and_a_half, Decimal::FromString("1e40")) < 0);
	REQUIRE(Decimal::Compare(one_and_a_half, Decimal::FromString("-1e40")) > 0);
	REQUIRE(Decimal::Compare(one_and_a_half, Decimal::FromString("1e-40")) > 0);
	REQUIRE(Decimal::Compare(Decimal::FromString("-1e-40"), Decimal::FromString("-1e-41")) < 0);
	REQUIRE(Decimal::Compare(Decimal::FromString("1e40"), Decimal::FromString("10e39")) == 0);
	REQUIRE(Decimal::Compare(Decimal::FromString("1e40"), Decimal::FromString("1" + string(40, '0'))) == 0);
	REQUIRE(Decimal::Compare(Decimal::FromString("1.0000000001e40"), Decimal::FromString("1e40")) > 0);
	REQUIRE(Decimal::Compare(Decimal::FromString("2e-40"), Decimal::FromString("0." + string(39, '0') + "2")) == 0);

	// a DECIMAL value cannot hold them
	REQUIRE_THROWS_AS(Value::DECIMAL(Decimal::FromString("1e40")), OutOfRangeException);
	REQUIRE_THROWS_AS(Value::DECIMAL(Decimal::FromString("1e-40")), OutOfRangeException);
	REQUIRE(Value::DECIMAL(Decimal::FromString("1e37")).type() == LogicalType::DECIMAL(38, 0));
}

TEST_CASE("Test decimals from doubles", "[decimal]") {
	// the shortest representation of the double is used, not its binary expansion
	REQUIRE(Decimal::ToString(Decimal::FromDouble(0.1)) == "0.1");
	REQUIRE(Decimal::ToString(Decimal::FromDouble(-2.5)) == "-2.5");
	REQUIRE(Decimal::Compare(Decimal::FromDouble(100.0), Decimal::FromInt64(100)) == 0);
	REQUIRE(Decimal::Compare(Decimal::FromDouble(1e20), Decimal::FromString("100000000000000000000")) == 0);

	REQUIRE_THROWS_AS(Decimal::FromDouble(std::numeric_limits<double>::quiet_NaN()), ConversionException);
	REQUIRE_THROWS_AS(Decimal::FromDouble(std::numeric_limits<double>::infinity()), ConversionException);
	REQUIRE_THROWS_AS(Decimal::FromDouble(-std::numeric_limits<double>::infinity()), ConversionException);

	// every finite double converts, however large or small
	REQUIRE(Decimal::Compare(Decimal::FromDouble(1e300), Decimal::FromString("1e300")) == 0);
	REQUIRE(Decimal::Compare(Decimal::FromDouble(1e39), Decimal::FromString("1.5")) > 0);
	REQUIRE(Decimal::Compare(Decimal::FromDouble(1e-40), Decimal::FromString("1.5")) < 0);
	REQUIRE(Decimal::Compare(Decimal::FromDouble(1e-40), Decimal::FromInt64(0)) > 0);
	REQUIRE(Decimal::Compare(Decimal::FromDouble(std::numeric_limits<double>::max()),
	                         Decimal::FromString("1.7976931348623157e308")) == 0);
	REQUIRE(Decimal::Compare(Decimal::FromDouble(std::numeric_limits<double>::denorm_min()),
	                         Decimal::FromString("5e-324")) == 0);
}

TEST_CASE("Test decimal to string and width", "[decimal]") {
	REQUIRE(Decimal::ToString(decimal_t(hugeint_t(12345), 2)) == "123.45");
	REQUIRE(Decimal::ToString(decimal_t(hugeint_t(-5), 3)) == "-0.005");
	REQUIRE(Decimal::ToString(decimal_t(hugeint_t(0), 2)) == "0.00");
	REQUIRE(Decimal::ToString(decimal_t(hugeint_t(7), 0)) == "7");

	REQUIRE(Decimal::Width(Decimal::FromString("123.45")) == 5);
	REQUIRE(Decimal::Width(Decimal::FromString("0.001")) == 4);
	REQUIRE(Decimal::Width(Decimal::FromString("-12")) == 2);
	REQUIRE(Decimal::Width(Decimal::FromString("1e40")) == 41);

	REQUIRE(Decimal::ToString(Decimal::FromString("1e40")) == "1" + string(40, '0'));
	REQUIRE(Decimal::ToString(Decimal::FromString("1e-40")) == "0." + string(39, '0') + "1");
}

TEST_CASE("Test decimal casts", "[decimal]") {
	double double_result;
	REQUIRE(Decimal::TryCastToDouble(Decimal::FromString("1.25"), double_result));
	REQUIRE(double_result == 1.25);
	REQUIRE(Decimal::TryCastToDouble(Decimal::FromString("-3"), double_result));
	REQUIRE(double_result == -3.0);

	// rounding is half away from zero
	int64_t result;
	REQUIRE(Decimal::TryCastToInt64(Decimal::FromString("2.5"), result));
	REQUIRE(result == 3);
	REQUIRE(Decimal::TryCastToInt64(Decimal::FromString("-2.5"), result));
	REQUIRE(result == -3);
	REQUIRE(Decimal::TryCastToInt64(Decimal::FromString("2.49"), result));
	REQUIRE(result == 2);
	REQUIRE(Decimal::TryCastToInt64(Decimal::FromString("12"), result));
	REQUIRE(result == 12);
	REQUIRE(!Decimal::TryCastToInt64(Decimal::FromString("1e20"), result));
	REQUIRE(!Decimal::TryCastToInt64(Decimal::FromString("1e40"), result));
	REQUIRE(Decimal::TryCastToInt64(Decimal::FromString("4e-40"), result));
	REQUIRE(result == 0);
	REQUIRE(Decimal::TryCastToDouble(Decimal::FromString("1e40"), double_result));
	REQUIRE(double_result == 1e40);
}
