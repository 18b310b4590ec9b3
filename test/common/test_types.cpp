#include "catch.hpp"
#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/types.hpp"

using namespace sqlcmp;

TEST_CASE("Test logical type names", "[types]") {
	REQUIRE(LogicalType(LogicalType::INTEGER).ToString() == "INTEGER");
	REQUIRE(LogicalType(LogicalType::STRING).ToString() == "STRING");
	REQUIRE(LogicalType(LogicalTypeId::DECIMAL).ToString() == "DECIMAL");
	REQUIRE(LogicalType::DECIMAL(4, 2).ToString() == "DECIMAL(4,2)");
	REQUIRE(LogicalType::ARRAY(LogicalType::INTEGER).ToString() == "ARRAY<INTEGER>");
	REQUIRE(LogicalType::MAP(LogicalType::STRING, LogicalType::BIGINT).ToString() == "MAP<STRING, BIGINT>");

	child_list_t<LogicalType> children;
	children.push_back(std::make_pair("a", LogicalType(LogicalType::INTEGER)));
	children.push_back(std::make_pair("b", LogicalType::ARRAY(LogicalType::STRING)));
	REQUIRE(LogicalType::STRUCT(children).ToString() == "STRUCT<a INTEGER, b ARRAY<STRING>>");
}

TEST_CASE("Test logical type equality", "[types]") {
	REQUIRE(LogicalType::DECIMAL(4, 2) == LogicalType::DECIMAL(4, 2));
	REQUIRE(LogicalType::DECIMAL(4, 2) != LogicalType::DECIMAL(5, 2));
	REQUIRE(LogicalType::ARRAY(LogicalType::INTEGER) == LogicalType::ARRAY(LogicalType::INTEGER));
	REQUIRE(LogicalType::ARRAY(LogicalType::INTEGER) != LogicalType::ARRAY(LogicalType::BIGINT));
	REQUIRE(LogicalType(LogicalType::INTEGER) != LogicalType(LogicalType::BIGINT));

	child_list_t<LogicalType> left;
	left.push_back(std::make_pair("a", LogicalType(LogicalType::INTEGER)));
	child_list_t<LogicalType> right;
	right.push_back(std::make_pair("b", LogicalType(LogicalType::INTEGER)));
	// field names are part of a struct type
	REQUIRE(LogicalType::STRUCT(left) != LogicalType::STRUCT(right));
	REQUIRE(LogicalType::STRUCT(left) == LogicalType::STRUCT(left));
}

TEST_CASE("Test logical type properties", "[types]") {
	REQUIRE(LogicalType::ARRAY(LogicalType::INTEGER).IsNested());
	REQUIRE(LogicalType::MAP(LogicalType::STRING, LogicalType::INTEGER).IsNested());
	REQUIRE(!LogicalType(LogicalType::BOOLEAN).IsNested());
	REQUIRE(LogicalType::DECIMAL(10, 0).IsNumeric());
	REQUIRE(LogicalType(LogicalType::DOUBLE).IsNumeric());
	REQUIRE(!LogicalType(LogicalType::TIMESTAMP).IsNumeric());

	auto decimal = LogicalType::DECIMAL(38, 10);
	REQUIRE(DecimalType::GetWidth(decimal) == 38);
	REQUIRE(DecimalType::GetScale(decimal) == 10);
	REQUIRE(DecimalType::GetWidth(LogicalType(LogicalTypeId::DECIMAL)) == DecimalType::DEFAULT_WIDTH);

	auto map = LogicalType::MAP(LogicalType::STRING, LogicalType::DOUBLE);
	REQUIRE(MapType::KeyType(map) == LogicalType(LogicalType::STRING));
	REQUIRE(MapType::ValueType(map) == LogicalType(LogicalType::DOUBLE));
	REQUIRE(ArrayType::GetChildType(LogicalType::ARRAY(LogicalType::BOOLEAN)) == LogicalType(LogicalType::BOOLEAN));

	REQUIRE_THROWS_AS(LogicalType::DECIMAL(39, 0), InvalidInputException);
	REQUIRE_THROWS_AS(LogicalType::DECIMAL(0, 0), InvalidInputException);
	REQUIRE_THROWS_AS(LogicalType::DECIMAL(4, 5), InvalidInputException);
}
