#include "sqlcmp/execution/comparison/comparison_null_check.hpp"

namespace sqlcmp {

static TernaryBool DistinctFromNullCheck(TermEvaluationContext &context, const Term &left, const Term &right) {
	bool left_is_null = left.Evaluate(context).IsNull();
	bool right_is_null = right.Evaluate(context).IsNull();
	if (!left_is_null && !right_is_null) {
		return TernaryBool::TERNARY_UNSET;
	}
	return ToTernaryBool(left_is_null != right_is_null);
}

static TernaryBool StrictNullCheck(TermEvaluationContext &context, const Term &left, const Term &right) {
	if (left.Evaluate(context).IsNull() || right.Evaluate(context).IsNull()) {
		return TernaryBool::TERNARY_FALSE;
	}
	return TernaryBool::TERNARY_UNSET;
}

null_check_function_t ComparisonNullCheck::Select(ExpressionType type) {
	if (type == ExpressionType::COMPARE_DISTINCT_FROM) {
		return DistinctFromNullCheck;
	}
	return StrictNullCheck;
}

} // namespace sqlcmp
