//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/execution/comparison/comparison_function.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/enums/ternary_bool.hpp"
#include "sqlcmp/execution/term.hpp"

#include <functional>

namespace sqlcmp {

//! Signed ordering of the values of two operands: negative, zero or positive.
//! Only defined when neither operand evaluates to NULL.
typedef std::function<int32_t(TermEvaluationContext &context, const Term &left, const Term &right)>
    comparator_function_t;

//! Equality of the values of two operands. Only defined when neither operand evaluates to NULL.
typedef std::function<bool(TermEvaluationContext &context, const Term &left, const Term &right)> equals_function_t;

//! Decides the result of a comparison up front when an operand is NULL.
//! Returns TERNARY_UNSET when both operands are non-null and the comparison has to run.
typedef std::function<TernaryBool(TermEvaluationContext &context, const Term &left, const Term &right)>
    null_check_function_t;

} // namespace sqlcmp
