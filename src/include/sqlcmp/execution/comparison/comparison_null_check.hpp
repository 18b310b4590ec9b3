//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/execution/comparison/comparison_null_check.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/enums/expression_type.hpp"
#include "sqlcmp/execution/comparison/comparison_function.hpp"

namespace sqlcmp {

struct ComparisonNullCheck {
	//! Select the NULL handling of a comparison operator.
	//! IS DISTINCT FROM treats NULL as a comparable value: with at least one NULL operand the result is whether
	//! exactly one side is NULL. Every other operator yields false as soon as either operand is NULL.
	static null_check_function_t Select(ExpressionType type);
};

} // namespace sqlcmp
