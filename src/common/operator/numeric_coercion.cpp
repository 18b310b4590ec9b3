#include "sqlcmp/common/operator/numeric_coercion.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/string_util.hpp"

#include "fast_float/fast_float.h"

#include <cmath>
#include <limits>
#include <system_error>

namespace sqlcmp {

static ConversionException UnsupportedNumericConversion(const Value &value, const LogicalType &source_type,
                                                        LogicalTypeId target) {
	return ConversionException("Unsupported conversion from %s to %s: \"%s\"", source_type, target,
	                           value.ToString());
}

static void CheckNotNull(const Value &value, LogicalTypeId target) {
	if (value.IsNull()) {
		throw InternalException("Attempting to coerce a NULL value to %s", target);
	}
}

static bool TryParseDouble(const string &input, double &result) {
	const char *buf = input.c_str();
	idx_t len = input.size();
	// skip any spaces at the start
	while (len > 0 && StringUtil::CharacterIsSpace(*buf)) {
		buf++;
		len--;
	}
	idx_t sign_length = 0;
	if (len > 0 && *buf == '+') {
		// fast_float does not accept a leading plus
		buf++;
		len--;
	} else if (len > 0 && *buf == '-') {
		sign_length = 1;
	}
	// only plain decimal notation: no hex floats, no inf or nan spellings
	if (len <= sign_length || !(StringUtil::CharacterIsDigit(buf[sign_length]) || buf[sign_length] == '.')) {
		return false;
	}
	auto endptr = buf + len;
	auto parse_result = fast_float::from_chars(buf, endptr, result, fast_float::chars_format::general);
	if (parse_result.ec != std::errc()) {
		return false;
	}
	auto current_end = parse_result.ptr;
	while (current_end < endptr && StringUtil::CharacterIsSpace(*current_end)) {
		current_end++;
	}
	return current_end == endptr && std::isfinite(result);
}

static bool TryParseBigint(const string &input, int64_t &result) {
	string str = input;
	StringUtil::Trim(str);
	idx_t pos = 0;
	bool negative = false;
	if (pos < str.size() && (str[pos] == '-' || str[pos] == '+')) {
		negative = str[pos] == '-';
		pos++;
	}
	if (pos == str.size()) {
		return false;
	}
	// accumulate as a negative number so that the minimum value can be represented
	int64_t value = 0;
	for (; pos < str.size(); pos++) {
		if (!StringUtil::CharacterIsDigit(str[pos])) {
			return false;
		}
		int64_t digit = str[pos] - '0';
		if (value < (std::numeric_limits<int64_t>::min() + digit) / 10) {
			return false;
		}
		value = value * 10 - digit;
	}
	if (!negative) {
		if (value == std::numeric_limits<int64_t>::min()) {
			return false;
		}
		value = -value;
	}
	result = value;
	return true;
}

static bool TryRoundDouble(double input, int64_t &result) {
	if (!std::isfinite(input)) {
		return false;
	}
	double rounded = std::round(input);
	// 2^63 is exactly representable, anything at or above it does not fit
	if (rounded < -9223372036854775808.0 || rounded >= 9223372036854775808.0) {
		return false;
	}
	result = int64_t(rounded);
	return true;
}

double NumericCoercion::ToDouble(const Value &value, const LogicalType &source_type) {
	CheckNotNull(value, LogicalTypeId::DOUBLE);
	switch (value.type().id()) {
	case LogicalTypeId::INTEGER:
		return double(IntegerValue::Get(value));
	case LogicalTypeId::BIGINT:
		return double(BigIntValue::Get(value));
	case LogicalTypeId::DOUBLE:
		return DoubleValue::Get(value);
	case LogicalTypeId::DECIMAL: {
		double result;
		if (Decimal::TryCastToDouble(DecimalValue::Get(value), result)) {
			return result;
		}
		break;
	}
	case LogicalTypeId::STRING: {
		double result;
		if (TryParseDouble(StringValue::Get(value), result)) {
			return result;
		}
		break;
	}
	default:
		break;
	}
	throw UnsupportedNumericConversion(value, source_type, LogicalTypeId::DOUBLE);
}

static bool TryCoerceBigint(const Value &value, int64_t &result) {
	switch (value.type().id()) {
	case LogicalTypeId::INTEGER:
		result = IntegerValue::Get(value);
		return true;
	case LogicalTypeId::BIGINT:
		result = BigIntValue::Get(value);
		return true;
	case LogicalTypeId::DOUBLE:
		return TryRoundDouble(DoubleValue::Get(value), result);
	case LogicalTypeId::DECIMAL:
		return Decimal::TryCastToInt64(DecimalValue::Get(value), result);
	case LogicalTypeId::STRING:
		return TryParseBigint(StringValue::Get(value), result);
	default:
		return false;
	}
}

int64_t NumericCoercion::ToBigint(const Value &value, const LogicalType &source_type) {
	CheckNotNull(value, LogicalTypeId::BIGINT);
	int64_t result;
	if (!TryCoerceBigint(value, result)) {
		throw UnsupportedNumericConversion(value, source_type, LogicalTypeId::BIGINT);
	}
	return result;
}

int32_t NumericCoercion::ToInteger(const Value &value, const LogicalType &source_type) {
	CheckNotNull(value, LogicalTypeId::INTEGER);
	int64_t result;
	if (!TryCoerceBigint(value, result) || result < std::numeric_limits<int32_t>::min() ||
	    result > std::numeric_limits<int32_t>::max()) {
		throw UnsupportedNumericConversion(value, source_type, LogicalTypeId::INTEGER);
	}
	return int32_t(result);
}

} // namespace sqlcmp
