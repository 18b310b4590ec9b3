#include "sqlcmp/execution/comparison/comparison_coercion.hpp"

#include "sqlcmp/common/exception.hpp"

namespace sqlcmp {

decimal_t ComparisonCoercion::ToDecimal(const Value &value, const LogicalType &source_type) {
	if (value.IsNull()) {
		throw InternalException("Attempting to coerce a NULL value to DECIMAL");
	}
	switch (value.type().id()) {
	case LogicalTypeId::DECIMAL:
		return DecimalValue::Get(value);
	case LogicalTypeId::DOUBLE:
		return Decimal::FromDouble(DoubleValue::Get(value));
	case LogicalTypeId::INTEGER:
		return Decimal::FromInt64(IntegerValue::Get(value));
	case LogicalTypeId::BIGINT:
		return Decimal::FromInt64(BigIntValue::Get(value));
	case LogicalTypeId::STRING: {
		auto &str = StringValue::Get(value);
		decimal_t result;
		if (!Decimal::TryFromString(str.c_str(), str.size(), result)) {
			throw ConversionException("Unsupported conversion from %s to DECIMAL: could not parse \"%s\"",
			                          source_type, str);
		}
		return result;
	}
	default:
		throw ConversionException("Unsupported conversion from %s to DECIMAL", source_type);
	}
}

timestamp_t ComparisonCoercion::ToTimestamp(const Value &value, const LogicalType &source_type) {
	if (value.IsNull()) {
		throw InternalException("Attempting to coerce a NULL value to TIMESTAMP");
	}
	switch (value.type().id()) {
	case LogicalTypeId::TIMESTAMP:
		return TimestampValue::Get(value);
	case LogicalTypeId::STRING: {
		auto &str = StringValue::Get(value);
		timestamp_t result;
		if (Timestamp::TryConvertTimestamp(str.c_str(), str.size(), result) != TimestampCastResult::SUCCESS) {
			throw ConversionException("Unsupported conversion from %s to TIMESTAMP: %s", source_type,
			                          Timestamp::ConversionError(str));
		}
		return result;
	}
	default:
		throw ConversionException("Unsupported conversion from %s to TIMESTAMP", source_type);
	}
}

} // namespace sqlcmp
