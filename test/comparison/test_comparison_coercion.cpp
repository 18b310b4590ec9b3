#include "catch.hpp"
#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/execution/comparison/comparison_coercion.hpp"

#include <limits>

using namespace sqlcmp;

TEST_CASE("Test coercion of operands to DECIMAL", "[comparison][coercion]") {
	auto decimal = Value::DECIMAL(Decimal::FromString("1.50"));
	REQUIRE(Decimal::ToString(ComparisonCoercion::ToDecimal(decimal, decimal.type())) == "1.50");
	REQUIRE(Decimal::ToString(ComparisonCoercion::ToDecimal(Value(0.1), LogicalType::DOUBLE)) == "0.1");
	REQUIRE(Decimal::ToString(ComparisonCoercion::ToDecimal(Value(-3), LogicalType::INTEGER)) == "-3");
	REQUIRE(Decimal::ToString(ComparisonCoercion::ToDecimal(Value(int64_t(9000000000LL)), LogicalType::BIGINT)) ==
	        "9000000000");
	REQUIRE(Decimal::ToString(ComparisonCoercion::ToDecimal(Value(" 12.340 "), LogicalType::STRING)) == "12.340");

	REQUIRE_THROWS_AS(ComparisonCoercion::ToDecimal(Value("twelve"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(ComparisonCoercion::ToDecimal(Value::BOOLEAN(true), LogicalType::BOOLEAN), ConversionException);
	REQUIRE_THROWS_AS(ComparisonCoercion::ToDecimal(Value::TIMESTAMP(timestamp_t(0)), LogicalType::TIMESTAMP),
	                  ConversionException);
	REQUIRE_THROWS_AS(ComparisonCoercion::ToDecimal(Value(std::numeric_limits<double>::quiet_NaN()),
	                                                LogicalType::DOUBLE),
	                  ConversionException);
	REQUIRE_THROWS_AS(ComparisonCoercion::ToDecimal(Value(LogicalType::INTEGER), LogicalType::INTEGER),
	                  InternalException);
	REQUIRE_THROWS_WITH(ComparisonCoercion::ToDecimal(Value::BOOLEAN(true), LogicalType::BOOLEAN),
	                    Catch::Contains("Unsupported conversion from BOOLEAN to DECIMAL"));
}

TEST_CASE("Test coercion of operands to TIMESTAMP", "[comparison][coercion]") {
	auto timestamp = Value::TIMESTAMP(2019, 8, 26, 8, 52, 6, 0);
	REQUIRE(ComparisonCoercion::ToTimestamp(timestamp, LogicalType::TIMESTAMP) == TimestampValue::Get(timestamp));
	REQUIRE(ComparisonCoercion::ToTimestamp(Value("2019-08-26T08:52:06Z"), LogicalType::STRING) ==
	        TimestampValue::Get(timestamp));

	// numbers are not interpreted as epoch offsets
	REQUIRE_THROWS_AS(ComparisonCoercion::ToTimestamp(Value(int64_t(1566809526000LL)), LogicalType::BIGINT),
	                  ConversionException);
	REQUIRE_THROWS_AS(ComparisonCoercion::ToTimestamp(Value("yesterday"), LogicalType::STRING), ConversionException);
	REQUIRE_THROWS_AS(ComparisonCoercion::ToTimestamp(Value(LogicalType::STRING), LogicalType::STRING),
	                  InternalException);
	REQUIRE_THROWS_WITH(ComparisonCoercion::ToTimestamp(Value("yesterday"), LogicalType::STRING),
	                    Catch::Contains("Unsupported conversion from STRING to TIMESTAMP"));
}
