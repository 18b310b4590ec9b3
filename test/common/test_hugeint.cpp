#include "catch.hpp"
#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/types/hugeint.hpp"

#include <limits>

using namespace sqlcmp;

TEST_CASE("Test hugeint to string", "[hugeint]") {
	REQUIRE(Hugeint::ToString(hugeint_t(0)) == "0");
	REQUIRE(Hugeint::ToString(hugeint_t(42)) == "42");
	REQUIRE(Hugeint::ToString(hugeint_t(-42)) == "-42");
	REQUIRE(Hugeint::ToString(Hugeint::POWERS_OF_TEN[20]) == "100000000000000000000");
	REQUIRE(Hugeint::ToString(Hugeint::Maximum()) == "170141183460469231731687303715884105727");
	REQUIRE(Hugeint::ToString(Hugeint::Minimum()) == Hugeint::HUGEINT_MINIMUM_STRING);
}

TEST_CASE("Test hugeint arithmetic with overflow checks", "[hugeint]") {
	hugeint_t result;
	REQUIRE(Hugeint::TryMultiply(hugeint_t(123), hugeint_t(-1000), result));
	REQUIRE(result == hugeint_t(-123000));
	REQUIRE(Hugeint::TryMultiply(Hugeint::POWERS_OF_TEN[19], Hugeint::POWERS_OF_TEN[19], result));
	REQUIRE(result == Hugeint::POWERS_OF_TEN[38]);
	// 10^38 * 10 exceeds the 128-bit range
	REQUIRE(!Hugeint::TryMultiply(Hugeint::POWERS_OF_TEN[38], hugeint_t(10), result));
	REQUIRE(!Hugeint::TryMultiply(Hugeint::Minimum(), hugeint_t(-1), result));

	hugeint_t sum = Hugeint::Maximum() - hugeint_t(1);
	REQUIRE(Hugeint::TryAddInPlace(sum, hugeint_t(1)));
	REQUIRE(sum == Hugeint::Maximum());
	REQUIRE(!Hugeint::TryAddInPlace(sum, hugeint_t(1)));

	REQUIRE(Hugeint::TryNegate(hugeint_t(5), result));
	REQUIRE(result == hugeint_t(-5));
	REQUIRE(!Hugeint::TryNegate(Hugeint::Minimum(), result));
	REQUIRE_THROWS_AS(-Hugeint::Minimum(), OutOfRangeException);
}

TEST_CASE("Test hugeint division by small values", "[hugeint]") {
	uint64_t remainder;
	auto quotient = Hugeint::DivModPositive(hugeint_t(1234), 10, remainder);
	REQUIRE(quotient == hugeint_t(123));
	REQUIRE(remainder == 4);

	quotient = Hugeint::DivModPositive(Hugeint::POWERS_OF_TEN[30] + hugeint_t(7), 1000, remainder);
	REQUIRE(quotient == Hugeint::POWERS_OF_TEN[27]);
	REQUIRE(remainder == 7);
}

TEST_CASE("Test hugeint casts", "[hugeint]") {
	int32_t int_result;
	int64_t bigint_result;
	double double_result;

	REQUIRE(Hugeint::TryCast(hugeint_t(-2147483648LL), int_result));
	REQUIRE(int_result == -2147483647 - 1);
	REQUIRE(!Hugeint::TryCast(hugeint_t(2147483648LL), int_result));

	REQUIRE(Hugeint::TryCast(hugeint_t(std::numeric_limits<int64_t>::max()), bigint_result));
	REQUIRE(bigint_result == std::numeric_limits<int64_t>::max());
	REQUIRE(!Hugeint::TryCast(Hugeint::POWERS_OF_TEN[19], bigint_result));

	REQUIRE(Hugeint::TryCast(hugeint_t(-1500), double_result));
	REQUIRE(double_result == -1500.0);
	REQUIRE(Hugeint::TryCast(Hugeint::POWERS_OF_TEN[20], double_result));
	REQUIRE(double_result == 1e20);
}
