//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/execution/comparison/comparison_term.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/enums/expression_type.hpp"
#include "sqlcmp/execution/comparison/comparison_function.hpp"

namespace sqlcmp {

//! A compiled comparison between two operand terms, producing a BOOLEAN.
//! The NULL check runs first; when it determines the result the predicate is never invoked.
class ComparisonTerm : public Term {
public:
	static constexpr const TermClass TYPE = TermClass::COMPARISON;

	//! The comparator or equality function of the operands, already shaped into the result of the operator
	typedef std::function<bool(TermEvaluationContext &context, const Term &left, const Term &right)>
	    predicate_function_t;

public:
	ComparisonTerm(ExpressionType type, unique_ptr<Term> left, unique_ptr<Term> right,
	               null_check_function_t null_check, predicate_function_t predicate);

public:
	Value Evaluate(TermEvaluationContext &context) const override;
	LogicalType ReturnType() const override;
	string ToString() const override;

	ExpressionType GetExpressionType() const {
		return type;
	}
	const Term &GetLeft() const {
		return *left;
	}
	const Term &GetRight() const {
		return *right;
	}

private:
	ExpressionType type;
	unique_ptr<Term> left;
	unique_ptr<Term> right;
	null_check_function_t null_check;
	predicate_function_t predicate;
};

struct ComparisonTermBuilder {
	//! Build a term from a comparator, mapping its ordering to the operator:
	//! = is r == 0, != and IS DISTINCT FROM are r != 0, < <= > >= compare r against 0.
	//! Throws an UnsupportedComparisonException for any other operator.
	static unique_ptr<ComparisonTerm> BuildComparisonTerm(ExpressionType type, unique_ptr<Term> left,
	                                                      unique_ptr<Term> right, null_check_function_t null_check,
	                                                      comparator_function_t comparator);
	//! Build a term from an equality function. Only =, != and IS DISTINCT FROM are supported, any other
	//! operator throws an UnsupportedComparisonException.
	static unique_ptr<ComparisonTerm> BuildEqualsTerm(ExpressionType type, unique_ptr<Term> left,
	                                                  unique_ptr<Term> right, null_check_function_t null_check,
	                                                  equals_function_t equals);
};

} // namespace sqlcmp
