#include "sqlcmp/common/types/decimal.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/string_util.hpp"

#include "fmt/format.h"

#include <cmath>
#include <limits>

namespace sqlcmp {

constexpr uint8_t Decimal::MAX_WIDTH;
constexpr int64_t Decimal::MAX_EXPONENT;

static bool TryGetMagnitude(const hugeint_t &value, hugeint_t &magnitude) {
	if (value < 0) {
		return Hugeint::TryNegate(value, magnitude);
	}
	magnitude = value;
	return true;
}

//! The number of decimal digits of a non-negative value, 39 for anything above 10^38
static idx_t DigitCount(const hugeint_t &magnitude) {
	for (idx_t digits = 1; digits <= Decimal::MAX_WIDTH; digits++) {
		if (magnitude < Hugeint::POWERS_OF_TEN[digits]) {
			return digits;
		}
	}
	return Decimal::MAX_WIDTH + 1;
}

bool Decimal::TryFromString(const char *str, idx_t len, decimal_t &result) {
	idx_t pos = 0;
	// skip leading spaces
	while (pos < len && StringUtil::CharacterIsSpace(str[pos])) {
		pos++;
	}
	bool negative = false;
	if (pos < len && (str[pos] == '-' || str[pos] == '+')) {
		negative = str[pos] == '-';
		pos++;
	}
	hugeint_t value = 0;
	idx_t significant_digits = 0;
	idx_t digit_count = 0;
	// zeros past the 38th significant digit are not stored, they lower the scale instead
	idx_t dropped_zeros = 0;
	int64_t scale = 0;
	bool seen_dot = false;
	for (; pos < len; pos++) {
		char c = str[pos];
		if (c == '.') {
			if (seen_dot) {
				return false;
			}
			seen_dot = true;
			continue;
		}
		if (!StringUtil::CharacterIsDigit(c)) {
			break;
		}
		digit_count++;
		if (seen_dot) {
			scale++;
		}
		if (significant_digits == 0 && c == '0') {
			// leading zeroes do not count towards the width
			continue;
		}
		if (significant_digits == MAX_WIDTH) {
			if (c != '0') {
				return false;
			}
			dropped_zeros++;
			continue;
		}
		significant_digits++;
		value = value * hugeint_t(10) + hugeint_t(c - '0');
	}
	if (digit_count == 0) {
		return false;
	}
	scale -= int64_t(dropped_zeros);
	if (pos < len && (str[pos] == 'e' || str[pos] == 'E')) {
		pos++;
		bool exponent_negative = false;
		if (pos < len && (str[pos] == '-' || str[pos] == '+')) {
			exponent_negative = str[pos] == '-';
			pos++;
		}
		int64_t exponent = 0;
		idx_t exponent_digits = 0;
		for (; pos < len && StringUtil::CharacterIsDigit(str[pos]); pos++) {
			exponent_digits++;
			if (exponent > MAX_EXPONENT) {
				return false;
			}
			exponent = exponent * 10 + (str[pos] - '0');
		}
		if (exponent_digits == 0) {
			return false;
		}
		scale -= exponent_negative ? -exponent : exponent;
	}
	// skip trailing spaces
	while (pos < len && StringUtil::CharacterIsSpace(str[pos])) {
		pos++;
	}
	if (pos < len) {
		return false;
	}
	if (value == 0) {
		scale = MaxValue<int64_t>(scale, 0);
	} else if (scale < 0 && int64_t(significant_digits) - scale <= int64_t(MAX_WIDTH)) {
		// a positive exponent that still fits in 38 digits is folded into the unscaled value
		value = value * Hugeint::POWERS_OF_TEN[-scale];
		scale = 0;
	}
	if (scale > std::numeric_limits<int32_t>::max() || scale < std::numeric_limits<int32_t>::min()) {
		return false;
	}
	if (negative) {
		Hugeint::NegateInPlace(value);
	}
	result = decimal_t(value, int32_t(scale));
	return true;
}

decimal_t Decimal::FromString(const string &str) {
	decimal_t result;
	if (!TryFromString(str.c_str(), str.size(), result)) {
		throw ConversionException("Could not convert string \"%s\" to DECIMAL", str);
	}
	return result;
}

decimal_t Decimal::FromInt64(int64_t value) {
	return decimal_t(hugeint_t(value), 0);
}

decimal_t Decimal::FromDouble(double value) {
	if (!std::isfinite(value)) {
		throw ConversionException("Could not convert DOUBLE %s to DECIMAL", std::to_string(value));
	}
	// the shortest round-trip text has at most 17 significant digits, so this parse cannot fail
	auto text = fmt::format("{}", value);
	decimal_t result;
	if (!TryFromString(text.c_str(), text.size(), result)) {
		throw InternalException("Could not parse the text \"%s\" of a DOUBLE as a decimal", text);
	}
	return result;
}

static int32_t CompareUnscaled(const hugeint_t &left, const hugeint_t &right) {
	if (left == right) {
		return 0;
	}
	return left < right ? -1 : 1;
}

static int32_t Sign(const hugeint_t &value) {
	return CompareUnscaled(value, hugeint_t(0));
}

int32_t Decimal::Compare(const decimal_t &left, const decimal_t &right) {
	auto left_sign = Sign(left.value);
	auto right_sign = Sign(right.value);
	if (left_sign != right_sign) {
		return left_sign < right_sign ? -1 : 1;
	}
	if (left_sign == 0) {
		return 0;
	}
	hugeint_t left_magnitude, right_magnitude;
	if (!TryGetMagnitude(left.value, left_magnitude) || !TryGetMagnitude(right.value, right_magnitude)) {
		throw InternalException("Decimal comparison of an unscaled value outside the DECIMAL range");
	}
	// the position of the most significant digit relative to the decimal point
	auto left_digits = DigitCount(left_magnitude);
	auto right_digits = DigitCount(right_magnitude);
	auto left_exponent = int64_t(left_digits) - left.scale;
	auto right_exponent = int64_t(right_digits) - right.scale;
	int32_t result;
	if (left_exponent != right_exponent) {
		result = left_exponent < right_exponent ? -1 : 1;
	} else {
		// equal exponents: the scales differ by exactly the difference in digit counts
		if (left_digits < right_digits) {
			hugeint_t upscaled;
			if (!Hugeint::TryMultiply(left_magnitude, Hugeint::POWERS_OF_TEN[right_digits - left_digits], upscaled)) {
				result = 1;
			} else {
				result = CompareUnscaled(upscaled, right_magnitude);
			}
		} else {
			hugeint_t upscaled;
			if (!Hugeint::TryMultiply(right_magnitude, Hugeint::POWERS_OF_TEN[left_digits - right_digits], upscaled)) {
				result = -1;
			} else {
				result = CompareUnscaled(left_magnitude, upscaled);
			}
		}
	}
	return left_sign < 0 ? -result : result;
}

string Decimal::ToString(const decimal_t &input) {
	auto digits = Hugeint::ToString(input.value);
	bool negative = !digits.empty() && digits[0] == '-';
	if (negative) {
		digits = digits.substr(1);
	}
	if (input.scale < 0) {
		digits += string(idx_t(-int64_t(input.scale)), '0');
	} else if (input.scale > 0) {
		auto scale = idx_t(input.scale);
		if (digits.size() <= scale) {
			digits = string(scale - digits.size() + 1, '0') + digits;
		}
		digits.insert(digits.size() - scale, ".");
	}
	return negative ? "-" + digits : digits;
}

idx_t Decimal::Width(const decimal_t &input) {
	hugeint_t magnitude;
	if (!TryGetMagnitude(input.value, magnitude)) {
		return MAX_WIDTH + 1;
	}
	int64_t width = int64_t(DigitCount(magnitude));
	if (input.scale < 0) {
		width -= input.scale;
	} else if (width <= input.scale) {
		width = int64_t(input.scale) + 1;
	}
	return idx_t(width);
}

bool Decimal::TryCastToDouble(const decimal_t &input, double &result) {
	double unscaled;
	if (!Hugeint::TryCast(input.value, unscaled)) {
		return false;
	}
	if (input.scale >= 0) {
		result = unscaled / std::pow(10.0, double(input.scale));
	} else {
		result = unscaled * std::pow(10.0, -double(input.scale));
	}
	return std::isfinite(result);
}

bool Decimal::TryCastToInt64(const decimal_t &input, int64_t &result) {
	if (input.scale < 0) {
		if (-int64_t(input.scale) > int64_t(MAX_WIDTH)) {
			return input.value == 0 && Hugeint::TryCast(input.value, result);
		}
		hugeint_t upscaled;
		return Hugeint::TryMultiply(input.value, Hugeint::POWERS_OF_TEN[-input.scale], upscaled) &&
		       Hugeint::TryCast(upscaled, result);
	}
	if (input.scale > int32_t(MAX_WIDTH) + 1) {
		// every digit lies below the first decimal place
		result = 0;
		return true;
	}
	hugeint_t value = input.value;
	bool negative = value < 0;
	if (negative && !Hugeint::TryNegate(value, value)) {
		return false;
	}
	uint64_t remainder = 0;
	for (int32_t i = 0; i < input.scale; i++) {
		value = Hugeint::DivModPositive(value, 10, remainder);
	}
	// the remainder of the last division is the first dropped digit
	if (remainder >= 5 && !Hugeint::TryAddInPlace(value, hugeint_t(1))) {
		return false;
	}
	if (negative) {
		Hugeint::NegateInPlace(value);
	}
	return Hugeint::TryCast(value, result);
}

} // namespace sqlcmp
