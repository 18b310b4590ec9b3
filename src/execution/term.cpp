#include "sqlcmp/execution/term.hpp"

namespace sqlcmp {

//===--------------------------------------------------------------------===//
// TermEvaluationContext
//===--------------------------------------------------------------------===//
TermEvaluationContext::TermEvaluationContext() {
}

TermEvaluationContext::TermEvaluationContext(vector<Value> row_p) : row(std::move(row_p)) {
}

void TermEvaluationContext::SetRow(vector<Value> row_p) {
	row = std::move(row_p);
}

const Value &TermEvaluationContext::GetColumn(idx_t index) const {
	if (index >= row.size()) {
		throw InvalidInputException("Column index %llu is out of range for a row with %llu columns", index,
		                            row.size());
	}
	return row[index];
}

idx_t TermEvaluationContext::ColumnCount() const {
	return row.size();
}

//===--------------------------------------------------------------------===//
// Term
//===--------------------------------------------------------------------===//
Term::Term(TermClass term_class) : term_class(term_class) {
}

Term::~Term() {
}

constexpr const TermClass ConstantTerm::TYPE;
constexpr const TermClass ColumnRefTerm::TYPE;

ConstantTerm::ConstantTerm(Value value_p) : Term(TermClass::CONSTANT), value(std::move(value_p)) {
}

Value ConstantTerm::Evaluate(TermEvaluationContext &context) const {
	return value;
}

LogicalType ConstantTerm::ReturnType() const {
	return value.type();
}

string ConstantTerm::ToString() const {
	return value.ToString();
}

ColumnRefTerm::ColumnRefTerm(idx_t index_p, LogicalType type_p, string alias_p)
    : Term(TermClass::COLUMN_REF), index(index_p), type(std::move(type_p)), alias(std::move(alias_p)) {
}

Value ColumnRefTerm::Evaluate(TermEvaluationContext &context) const {
	return context.GetColumn(index);
}

LogicalType ColumnRefTerm::ReturnType() const {
	return type;
}

string ColumnRefTerm::ToString() const {
	if (!alias.empty()) {
		return alias;
	}
	return "#" + std::to_string(index);
}

} // namespace sqlcmp
