//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/types/hugeint.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"

#include <limits>

namespace sqlcmp {

//! A signed 128-bit integer, stored as two's complement over an unsigned lower and a signed upper half
struct hugeint_t { // NOLINT
public:
	uint64_t lower;
	int64_t upper;

public:
	hugeint_t() = default;
	hugeint_t(int64_t value); // NOLINT: Allow implicit conversion from `int64_t`
	constexpr hugeint_t(int64_t upper, uint64_t lower) : lower(lower), upper(upper) {
	}
	constexpr hugeint_t(const hugeint_t &rhs) = default;
	constexpr hugeint_t(hugeint_t &&rhs) = default;
	hugeint_t &operator=(const hugeint_t &rhs) = default;
	hugeint_t &operator=(hugeint_t &&rhs) = default;

	// comparison operators
	bool operator==(const hugeint_t &rhs) const;
	bool operator!=(const hugeint_t &rhs) const;
	bool operator<=(const hugeint_t &rhs) const;
	bool operator<(const hugeint_t &rhs) const;
	bool operator>(const hugeint_t &rhs) const;
	bool operator>=(const hugeint_t &rhs) const;

	// + and - wrap around on overflow, * and unary - throw
	hugeint_t operator+(const hugeint_t &rhs) const;
	hugeint_t operator-(const hugeint_t &rhs) const;
	hugeint_t operator*(const hugeint_t &rhs) const;
	hugeint_t operator-() const;
};

//! The Hugeint class contains static operations for the INT128 type
class Hugeint {
public:
	constexpr static const char *HUGEINT_MINIMUM_STRING = "-170141183460469231731687303715884105728";

	//! Convert a hugeint object to a string
	static string ToString(hugeint_t input);

	static bool TryCast(hugeint_t input, int32_t &result);
	static bool TryCast(hugeint_t input, int64_t &result);
	static bool TryCast(hugeint_t input, double &result);

	static hugeint_t Minimum() {
		return hugeint_t(std::numeric_limits<int64_t>::lowest(), 0);
	}
	static hugeint_t Maximum() {
		return hugeint_t(std::numeric_limits<int64_t>::max(), std::numeric_limits<uint64_t>::max());
	}

	static void NegateInPlace(hugeint_t &input) {
		input.lower = std::numeric_limits<uint64_t>::max() - input.lower + 1ull;
		input.upper = -1 - input.upper + (input.lower == 0);
	}
	static bool TryNegate(hugeint_t input, hugeint_t &result);

	static bool TryMultiply(hugeint_t lhs, hugeint_t rhs, hugeint_t &result);
	static bool TryAddInPlace(hugeint_t &lhs, hugeint_t rhs);

	//! Divides a positive hugeint by a small unsigned value, returning the quotient
	static hugeint_t DivModPositive(hugeint_t lhs, uint64_t rhs, uint64_t &remainder);

	//! Powers of ten up to 10^38, the range of a DECIMAL(38)
	static const hugeint_t POWERS_OF_TEN[39];
};

} // namespace sqlcmp
