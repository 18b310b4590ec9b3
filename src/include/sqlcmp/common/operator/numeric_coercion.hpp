//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/operator/numeric_coercion.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/types/value.hpp"

namespace sqlcmp {

//! Conversions of a non-null value to the primitive numeric representations used for ordering.
//! Each accepts INTEGER, BIGINT, DOUBLE, DECIMAL and STRING representations; the declared type of the operand
//! is only used to describe the source in error messages. Anything that cannot be represented exactly enough
//! in the target throws a ConversionException.
struct NumericCoercion {
	static double ToDouble(const Value &value, const LogicalType &source_type);
	//! Doubles and decimals are rounded half away from zero; strings must be integral
	static int64_t ToBigint(const Value &value, const LogicalType &source_type);
	static int32_t ToInteger(const Value &value, const LogicalType &source_type);
};

} // namespace sqlcmp
