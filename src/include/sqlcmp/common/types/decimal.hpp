//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/types/decimal.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"
#include "sqlcmp/common/types/hugeint.hpp"

namespace sqlcmp {

//! An exact decimal number: an unscaled 128-bit integer and the number of digits after the decimal point.
//! 1.50 is stored as (150, 2); it compares equal to (15, 1) and (3, 0) compares equal to 3.00.
//! A DECIMAL value keeps its scale within [0, 38]. Operands coerced for a comparison may carry any scale:
//! 1e40 is (1, -40) and 1e-40 is (1, 40).
struct decimal_t { // NOLINT
	hugeint_t value;
	int32_t scale;

	decimal_t() : value(0), scale(0) {
	}
	decimal_t(hugeint_t value_p, int32_t scale_p) : value(value_p), scale(scale_p) {
	}
};

//! The Decimal class is a static class that holds helper functions for the Decimal type
class Decimal {
public:
	static constexpr uint8_t MAX_WIDTH = 38;
	//! Exponents written in decimal text are limited to this magnitude
	static constexpr int64_t MAX_EXPONENT = 100000000;

public:
	//! Parse canonical decimal text: [sign] digits [. digits] [(e|E) [sign] digits], surrounding spaces allowed.
	//! At most 38 significant digits are kept; zeros beyond them are absorbed into the scale.
	static bool TryFromString(const char *str, idx_t len, decimal_t &result);
	//! Parse decimal text, throwing a ConversionException on failure
	static decimal_t FromString(const string &str);
	static decimal_t FromInt64(int64_t value);
	//! Convert a double through its shortest round-trip representation (0.1 becomes 0.1, not its binary expansion)
	static decimal_t FromDouble(double value);

	//! Three-way comparison that ignores the scale of either side, exact for any scale
	static int32_t Compare(const decimal_t &left, const decimal_t &right);

	static string ToString(const decimal_t &input);
	//! The number of digits needed to write the value without an exponent (at least the scale plus one)
	static idx_t Width(const decimal_t &input);

	static bool TryCastToDouble(const decimal_t &input, double &result);
	//! Cast to an integer, rounding half away from zero
	static bool TryCastToInt64(const decimal_t &input, int64_t &result);
};

} // namespace sqlcmp
