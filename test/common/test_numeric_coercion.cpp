#include "catch.hpp"
#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/operator/numeric_coercion.hpp"

#include <limits>

using namespace sqlcmp;

TEST_CASE("Test coercion to DOUBLE", "[coercion]") {
	REQUIRE(NumericCoercion::ToDouble(Value(3), LogicalType::INTEGER) == 3.0);
	REQUIRE(NumericCoercion::ToDouble(Value(int64_t(-4)), LogicalType::BIGINT) == -4.0);
	REQUIRE(NumericCoercion::ToDouble(Value(2.5), LogicalType::DOUBLE) == 2.5);
	REQUIRE(NumericCoercion::ToDouble(Value::DECIMAL(Decimal::FromString("1.25")), LogicalType::DECIMAL(3, 2)) ==
	        1.25);
	REQUIRE(NumericCoercion::ToDouble(Value(" 2.5 "), LogicalType::STRING) == 2.5);
	REQUIRE(NumericCoercion::ToDouble(Value("1e3"), LogicalType::STRING) == 1000.0);
	REQUIRE(NumericCoercion::ToDouble(Value("+.5"), LogicalType::STRING) == 0.5);
	REQUIRE(NumericCoercion::ToDouble(Value("-1.5E-1"), LogicalType::STRING) == -0.15);

	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value("abc"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value(""), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value("2.5x"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value("1e999"), LogicalType::STRING), ConversionException);
	// hexadecimal and non-finite spellings are not decimal text
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value("0x10"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value("0x1p0"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value("inf"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value("-Infinity"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value("nan"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value("+-1"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value::BOOLEAN(true), LogicalType::BOOLEAN), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToDouble(Value(LogicalType::DOUBLE), LogicalType::DOUBLE), InternalException);
}

TEST_CASE("Test coercion to BIGINT", "[coercion]") {
	REQUIRE(NumericCoercion::ToBigint(Value(7), LogicalType::INTEGER) == 7);
	REQUIRE(NumericCoercion::ToBigint(Value("9223372036854775807"), LogicalType::STRING) ==
	        std::numeric_limits<int64_t>::max());
	REQUIRE(NumericCoercion::ToBigint(Value("-9223372036854775808"), LogicalType::STRING) ==
	        std::numeric_limits<int64_t>::min());
	REQUIRE(NumericCoercion::ToBigint(Value(" +12 "), LogicalType::STRING) == 12);

	// doubles and decimals round half away from zero
	REQUIRE(NumericCoercion::ToBigint(Value(2.5), LogicalType::DOUBLE) == 3);
	REQUIRE(NumericCoercion::ToBigint(Value(-2.5), LogicalType::DOUBLE) == -3);
	REQUIRE(NumericCoercion::ToBigint(Value(2.4), LogicalType::DOUBLE) == 2);
	REQUIRE(NumericCoercion::ToBigint(Value::DECIMAL(Decimal::FromString("12.5")), LogicalType::DECIMAL(3, 1)) == 13);

	REQUIRE_THROWS_AS(NumericCoercion::ToBigint(Value("9223372036854775808"), LogicalType::STRING),
	                  ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToBigint(Value("1.5"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToBigint(Value("-"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToBigint(Value(1e19), LogicalType::DOUBLE), ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToBigint(Value(std::numeric_limits<double>::quiet_NaN()), LogicalType::DOUBLE),
	                  ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToBigint(Value::TIMESTAMP(timestamp_t(0)), LogicalType::TIMESTAMP),
	                  ConversionException);
}

TEST_CASE("Test coercion to INTEGER", "[coercion]") {
	REQUIRE(NumericCoercion::ToInteger(Value("2147483647"), LogicalType::STRING) == 2147483647);
	REQUIRE(NumericCoercion::ToInteger(Value("-2147483648"), LogicalType::STRING) == -2147483647 - 1);
	REQUIRE(NumericCoercion::ToInteger(Value(int64_t(-12)), LogicalType::BIGINT) == -12);

	REQUIRE_THROWS_AS(NumericCoercion::ToInteger(Value(int64_t(2147483648LL)), LogicalType::BIGINT),
	                  ConversionException);
	REQUIRE_THROWS_AS(NumericCoercion::ToInteger(Value(3e9), LogicalType::DOUBLE), ConversionException);
}

TEST_CASE("Test coercion errors name the source type", "[coercion]") {
	REQUIRE_THROWS_WITH(NumericCoercion::ToBigint(Value("abc"), LogicalType::STRING),
	                    Catch::Contains("Unsupported conversion from STRING to BIGINT"));
	// the declared type describes the source, not the runtime representation
	REQUIRE_THROWS_WITH(NumericCoercion::ToInteger(Value("abc"), LogicalType::ARRAY(LogicalType::STRING)),
	                    Catch::Contains("ARRAY<STRING>"));
}
