//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/execution/comparison/comparison_coercion.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/types/decimal.hpp"
#include "sqlcmp/common/types/timestamp.hpp"
#include "sqlcmp/common/types/value.hpp"

namespace sqlcmp {

//! Conversions of a non-null operand value into the representation a comparison is carried out in.
//! The conversion dispatches on the runtime representation of the value; the declared source type is only used
//! to describe the failure. Unsupported representations and unparsable text throw a ConversionException.
struct ComparisonCoercion {
	//! Accepts DECIMAL, DOUBLE, INTEGER, BIGINT and STRING values
	static decimal_t ToDecimal(const Value &value, const LogicalType &source_type);
	//! Accepts TIMESTAMP values and STRING values in the timestamp text format
	static timestamp_t ToTimestamp(const Value &value, const LogicalType &source_type);
};

} // namespace sqlcmp
