//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/execution/term.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"
#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/types/value.hpp"

namespace sqlcmp {

//! The input a term is evaluated against: the values of the current row
class TermEvaluationContext {
public:
	TermEvaluationContext();
	explicit TermEvaluationContext(vector<Value> row);

	void SetRow(vector<Value> row);
	//! Throws an InvalidInputException if the row has no column at the index
	const Value &GetColumn(idx_t index) const;
	idx_t ColumnCount() const;

private:
	vector<Value> row;
};

enum class TermClass : uint8_t { INVALID = 0, CONSTANT = 1, COLUMN_REF = 2, COMPARISON = 3 };

//! A Term is a compiled expression node: given a context it produces a (possibly NULL) value of its return type.
//! Terms are immutable once built and can be evaluated concurrently against distinct contexts.
class Term {
public:
	explicit Term(TermClass term_class);
	virtual ~Term();

	TermClass term_class;

public:
	virtual Value Evaluate(TermEvaluationContext &context) const = 0;
	//! The declared type of the values produced by Evaluate
	virtual LogicalType ReturnType() const = 0;
	virtual string ToString() const = 0;

	template <class TARGET>
	TARGET &Cast() {
		if (term_class != TARGET::TYPE) {
			throw InternalException("Failed to cast term to type - term type mismatch");
		}
		return reinterpret_cast<TARGET &>(*this);
	}

	template <class TARGET>
	const TARGET &Cast() const {
		if (term_class != TARGET::TYPE) {
			throw InternalException("Failed to cast term to type - term type mismatch");
		}
		return reinterpret_cast<const TARGET &>(*this);
	}
};

//! A term that always yields the same value
class ConstantTerm : public Term {
public:
	static constexpr const TermClass TYPE = TermClass::CONSTANT;

public:
	explicit ConstantTerm(Value value);

	Value value;

public:
	Value Evaluate(TermEvaluationContext &context) const override;
	LogicalType ReturnType() const override;
	string ToString() const override;
};

//! A term that reads one column of the row held by the evaluation context
class ColumnRefTerm : public Term {
public:
	static constexpr const TermClass TYPE = TermClass::COLUMN_REF;

public:
	ColumnRefTerm(idx_t index, LogicalType type, string alias = string());

	idx_t index;
	LogicalType type;
	string alias;

public:
	Value Evaluate(TermEvaluationContext &context) const override;
	LogicalType ReturnType() const override;
	string ToString() const override;
};

} // namespace sqlcmp
