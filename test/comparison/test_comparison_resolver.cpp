#include "catch.hpp"
#include "test_helpers.hpp"

#include <limits>

using namespace sqlcmp;

static int32_t Compare(Value left, Value right) {
	auto left_term = Constant(std::move(left));
	auto right_term = Constant(std::move(right));
	auto comparator = ComparisonResolver::ResolveComparator(left_term->ReturnType(), right_term->ReturnType());
	REQUIRE(bool(comparator));
	TermEvaluationContext context;
	return comparator(context, *left_term, *right_term);
}

static bool HasComparator(const LogicalType &left, const LogicalType &right) {
	return bool(ComparisonResolver::ResolveComparator(left, right));
}

static bool HasEquals(const LogicalType &left, const LogicalType &right) {
	return bool(ComparisonResolver::ResolveEquals(left, right));
}

static Value Dec(const string &str) {
	return Value::DECIMAL(Decimal::FromString(str));
}

TEST_CASE("Test decimal comparisons", "[comparison][resolver]") {
	REQUIRE(Compare(Dec("1.50"), Value(1)) > 0);
	REQUIRE(Compare(Dec("1.00"), Value(1)) == 0);
	REQUIRE(Compare(Value(int64_t(2)), Dec("2.001")) < 0);
	REQUIRE(Compare(Dec("1.5"), Value("1.50")) == 0);
	REQUIRE(Compare(Value("1.49"), Dec("1.5")) < 0);
	// the double goes through its shortest representation
	REQUIRE(Compare(Dec("0.1"), Value(0.1)) == 0);
	REQUIRE(Compare(Value(0.30000000000000004), Dec("0.3")) > 0);
	// DECIMAL wins over every other rule, including TIMESTAMP
	REQUIRE(HasComparator(LogicalType::DECIMAL(4, 2), LogicalType::TIMESTAMP));

	REQUIRE_THROWS_AS(Compare(Dec("1.5"), Value("one and a half")), ConversionException);
	REQUIRE_THROWS_AS(Compare(Dec("1.5"), Value::BOOLEAN(true)), ConversionException);
	REQUIRE_THROWS_AS(Compare(Dec("1.5"), Value(std::numeric_limits<double>::quiet_NaN())), ConversionException);
}

TEST_CASE("Test decimal comparisons against operands beyond 38 digits", "[comparison][resolver]") {
	REQUIRE(Compare(Dec("1.5"), Value(1e39)) < 0);
	REQUIRE(Compare(Dec("1.5"), Value(-1e39)) > 0);
	REQUIRE(Compare(Dec("1.5"), Value(1e-40)) > 0);
	REQUIRE(Compare(Dec("0"), Value(1e-40)) < 0);
	REQUIRE(Compare(Value(1e300), Dec("99999999999999999999999999999999999999")) > 0);
	REQUIRE(Compare(Dec("1.5"), Value("1e40")) < 0);
	REQUIRE(Compare(Dec("1.5"), Value("1.5" + string(40, '0'))) == 0);
	REQUIRE(Compare(Value("-1e-50"), Dec("0")) < 0);
}

TEST_CASE("Test timestamp comparisons", "[comparison][resolver]") {
	auto timestamp = Value::TIMESTAMP(2019, 8, 26, 8, 52, 6, 0);
	REQUIRE(Compare(timestamp, Value("2019-08-26 08:52:06")) == 0);
	REQUIRE(Compare(timestamp, Value("2019-08-26T10:52:06+02:00")) == 0);
	REQUIRE(Compare(timestamp, Value("2019-08-27")) < 0);
	REQUIRE(Compare(Value::TIMESTAMP(timestamp_t(0)), Value::TIMESTAMP(timestamp_t(-1))) > 0);
	// TIMESTAMP takes precedence over a STRING on the left
	REQUIRE(Compare(Value("2019-08-26 08:52:07"), timestamp) > 0);

	REQUIRE_THROWS_AS(Compare(timestamp, Value("not a timestamp")), ConversionException);
	REQUIRE_THROWS_AS(Compare(Value(1), timestamp), ConversionException);
}

TEST_CASE("Test string comparisons only apply to a string on the left", "[comparison][resolver]") {
	REQUIRE(Compare(Value("apple"), Value("banana")) < 0);
	REQUIRE(Compare(Value("apple"), Value("apple")) == 0);
	// byte-wise: upper case sorts before lower case
	REQUIRE(Compare(Value("B"), Value("a")) < 0);

	// a STRING on the left compares the text of the right side
	REQUIRE(Compare(Value("10"), Value(9)) < 0);
	REQUIRE(Compare(Value("2.5"), Value(2.5)) == 0);
	REQUIRE(Compare(Value("true"), Value::BOOLEAN(true)) == 0);
	REQUIRE(Compare(Value("[1, 2]"), Value::ARRAY(LogicalType::INTEGER, {Value(1), Value(2)})) == 0);

	// a STRING on the right is converted to the numeric type of the left
	REQUIRE(Compare(Value(10), Value("9")) > 0);
	REQUIRE(Compare(Value(2.5), Value(" 2.5 ")) == 0);
	REQUIRE_THROWS_AS(Compare(Value(10), Value("ten")), ConversionException);
	REQUIRE_THROWS_WITH(Compare(Value(10), Value("ten")),
	                    Catch::Contains("Unsupported conversion from STRING to INTEGER"));
	// only decimal notation is numeric text
	REQUIRE_THROWS_AS(Compare(Value(16.0), Value("0x10")), ConversionException);
	REQUIRE_THROWS_AS(Compare(Value(1.0), Value("0x1p0")), ConversionException);
	REQUIRE_THROWS_AS(Compare(Value(1e300), Value("inf")), ConversionException);
	REQUIRE_THROWS_AS(Compare(Value(0.0), Value("NaN")), ConversionException);
}

TEST_CASE("Test numeric comparisons", "[comparison][resolver]") {
	REQUIRE(Compare(Value(2.5), Value(2)) > 0);
	REQUIRE(Compare(Value(2), Value(2.0)) == 0);
	REQUIRE(Compare(Value(int64_t(1) << 40), Value(1)) > 0);
	REQUIRE(Compare(Value(int64_t(-5)), Value(int64_t(-5))) == 0);
	REQUIRE(Compare(Value(3), Value(4)) < 0);

	// NaN equals NaN and sorts above everything else; -0.0 equals 0.0
	auto nan = std::numeric_limits<double>::quiet_NaN();
	REQUIRE(Compare(Value(nan), Value(nan)) == 0);
	REQUIRE(Compare(Value(nan), Value(std::numeric_limits<double>::infinity())) > 0);
	REQUIRE(Compare(Value(1.0), Value(nan)) < 0);
	REQUIRE(Compare(Value(-0.0), Value(0.0)) == 0);

	// BIGINT values outside the INTEGER range are compared exactly
	REQUIRE(Compare(Value(int64_t(4294967296LL)), Value(0)) > 0);
	// a DOUBLE operand makes the comparison happen in DOUBLE
	REQUIRE(Compare(Value(int64_t(3)), Value(2.9)) > 0);
}

TEST_CASE("Test comparator resolution precedence", "[comparison][resolver]") {
	REQUIRE(HasComparator(LogicalType::INTEGER, LogicalType::INTEGER));
	REQUIRE(HasComparator(LogicalType::STRING, LogicalType::STRING));
	REQUIRE(HasComparator(LogicalType::STRING, LogicalType::BOOLEAN));
	REQUIRE(HasComparator(LogicalType::INTEGER, LogicalType::STRING));
	REQUIRE(HasComparator(LogicalType::BOOLEAN, LogicalType::INTEGER));

	REQUIRE(!HasComparator(LogicalType::BOOLEAN, LogicalType::BOOLEAN));
	REQUIRE(!HasComparator(LogicalType::BOOLEAN, LogicalType::STRING));
	REQUIRE(!HasComparator(LogicalType::ARRAY(LogicalType::INTEGER), LogicalType::ARRAY(LogicalType::INTEGER)));
	REQUIRE(!HasComparator(LogicalType::MAP(LogicalType::STRING, LogicalType::INTEGER), LogicalType::BOOLEAN));

	// a comparator for BOOLEAN against a number exists, but the boolean cannot be converted
	REQUIRE_THROWS_AS(Compare(Value::BOOLEAN(true), Value(1)), ConversionException);
}

TEST_CASE("Test structural equality resolution", "[comparison][resolver]") {
	REQUIRE(HasEquals(LogicalType::ARRAY(LogicalType::INTEGER), LogicalType::ARRAY(LogicalType::INTEGER)));
	REQUIRE(HasEquals(LogicalType::MAP(LogicalType::STRING, LogicalType::INTEGER), LogicalType::INTEGER));
	REQUIRE(HasEquals(LogicalType::BOOLEAN, LogicalType::BOOLEAN));
	child_list_t<LogicalType> children;
	children.push_back(std::make_pair("a", LogicalType(LogicalType::INTEGER)));
	REQUIRE(HasEquals(LogicalType::STRUCT(children), LogicalType::STRUCT(children)));

	// only the left type selects structural equality
	REQUIRE(!HasEquals(LogicalType::INTEGER, LogicalType::ARRAY(LogicalType::INTEGER)));
	REQUIRE(!HasEquals(LogicalType::STRING, LogicalType::BOOLEAN));
	REQUIRE(!HasEquals(LogicalType::DECIMAL(4, 2), LogicalType::DECIMAL(4, 2)));
	REQUIRE(!HasEquals(LogicalType::TIMESTAMP, LogicalType::TIMESTAMP));

	auto equals = ComparisonResolver::ResolveEquals(LogicalType::ARRAY(LogicalType::INTEGER),
	                                                LogicalType::ARRAY(LogicalType::INTEGER));
	auto left = Constant(Value::ARRAY(LogicalType::INTEGER, {Value(1), Value(2)}));
	auto same = Constant(Value::ARRAY(LogicalType::INTEGER, {Value(1), Value(2)}));
	auto reversed = Constant(Value::ARRAY(LogicalType::INTEGER, {Value(2), Value(1)}));
	TermEvaluationContext context;
	REQUIRE(equals(context, *left, *same));
	REQUIRE(!equals(context, *left, *reversed));
}
