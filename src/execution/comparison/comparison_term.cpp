#include "sqlcmp/execution/comparison/comparison_term.hpp"

#include "sqlcmp/common/exception.hpp"

namespace sqlcmp {

constexpr const TermClass ComparisonTerm::TYPE;

ComparisonTerm::ComparisonTerm(ExpressionType type, unique_ptr<Term> left, unique_ptr<Term> right,
                               null_check_function_t null_check, predicate_function_t predicate)
    : Term(TermClass::COMPARISON), type(type), left(std::move(left)), right(std::move(right)),
      null_check(std::move(null_check)), predicate(std::move(predicate)) {
	D_ASSERT(this->left && this->right);
}

Value ComparisonTerm::Evaluate(TermEvaluationContext &context) const {
	auto determined = null_check(context, *left, *right);
	if (determined != TernaryBool::TERNARY_UNSET) {
		return Value::BOOLEAN(determined == TernaryBool::TERNARY_TRUE);
	}
	return Value::BOOLEAN(predicate(context, *left, *right));
}

LogicalType ComparisonTerm::ReturnType() const {
	return LogicalType::BOOLEAN;
}

string ComparisonTerm::ToString() const {
	return "(" + left->ToString() + " " + ExpressionTypeToOperator(type) + " " + right->ToString() + ")";
}

//===--------------------------------------------------------------------===//
// ComparisonTermBuilder
//===--------------------------------------------------------------------===//
static UnsupportedComparisonException UnsupportedComparison(ExpressionType type, const Term &left, const Term &right) {
	return UnsupportedComparisonException("Unsupported comparison between %s and %s: %s", left.ReturnType(),
	                                      right.ReturnType(), type);
}

unique_ptr<ComparisonTerm> ComparisonTermBuilder::BuildComparisonTerm(ExpressionType type, unique_ptr<Term> left,
                                                                      unique_ptr<Term> right,
                                                                      null_check_function_t null_check,
                                                                      comparator_function_t comparator) {
	std::function<bool(int32_t)> result_function;
	switch (type) {
	case ExpressionType::COMPARE_EQUAL:
		result_function = [](int32_t r) { return r == 0; };
		break;
	case ExpressionType::COMPARE_NOTEQUAL:
	case ExpressionType::COMPARE_DISTINCT_FROM:
		result_function = [](int32_t r) { return r != 0; };
		break;
	case ExpressionType::COMPARE_GREATERTHANOREQUALTO:
		result_function = [](int32_t r) { return r >= 0; };
		break;
	case ExpressionType::COMPARE_GREATERTHAN:
		result_function = [](int32_t r) { return r > 0; };
		break;
	case ExpressionType::COMPARE_LESSTHANOREQUALTO:
		result_function = [](int32_t r) { return r <= 0; };
		break;
	case ExpressionType::COMPARE_LESSTHAN:
		result_function = [](int32_t r) { return r < 0; };
		break;
	default:
		throw UnsupportedComparison(type, *left, *right);
	}
	auto predicate = [comparator, result_function](TermEvaluationContext &context, const Term &l, const Term &r) {
		return result_function(comparator(context, l, r));
	};
	return make_uniq<ComparisonTerm>(type, std::move(left), std::move(right), std::move(null_check), predicate);
}

unique_ptr<ComparisonTerm> ComparisonTermBuilder::BuildEqualsTerm(ExpressionType type, unique_ptr<Term> left,
                                                                  unique_ptr<Term> right,
                                                                  null_check_function_t null_check,
                                                                  equals_function_t equals) {
	ComparisonTerm::predicate_function_t predicate;
	switch (type) {
	case ExpressionType::COMPARE_EQUAL:
		predicate = equals;
		break;
	case ExpressionType::COMPARE_NOTEQUAL:
	case ExpressionType::COMPARE_DISTINCT_FROM:
		predicate = [equals](TermEvaluationContext &context, const Term &l, const Term &r) {
			return !equals(context, l, r);
		};
		break;
	default:
		throw UnsupportedComparison(type, *left, *right);
	}
	return make_uniq<ComparisonTerm>(type, std::move(left), std::move(right), std::move(null_check),
	                                 std::move(predicate));
}

} // namespace sqlcmp
