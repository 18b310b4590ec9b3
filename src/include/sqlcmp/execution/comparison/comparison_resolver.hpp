//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/execution/comparison/comparison_resolver.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/types.hpp"
#include "sqlcmp/execution/comparison/comparison_function.hpp"

namespace sqlcmp {

//! Decides, from the declared types of two operands, how their values are compared.
//! Both functions return an empty function object when the pair of types has no such comparison.
struct ComparisonResolver {
	//! The first matching rule wins:
	//! 1. either side DECIMAL: both sides converted to DECIMAL
	//! 2. either side TIMESTAMP: both sides converted to TIMESTAMP
	//! 3. the left side STRING: the text of both sides, compared byte-wise. Only the left type selects this rule,
	//!    a STRING on the right falls through to the numeric rules below.
	//! 4. either side DOUBLE, 5. either side BIGINT, 6. either side INTEGER: numeric comparison in that type
	//! Every operand is converted using its own declared type as the source.
	static comparator_function_t ResolveComparator(const LogicalType &left_type, const LogicalType &right_type);
	//! Structural equality when the left side is an ARRAY, MAP, STRUCT or BOOLEAN
	static equals_function_t ResolveEquals(const LogicalType &left_type, const LogicalType &right_type);
};

} // namespace sqlcmp
