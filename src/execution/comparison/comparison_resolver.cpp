#include "sqlcmp/execution/comparison/comparison_resolver.hpp"

#include "sqlcmp/common/operator/numeric_coercion.hpp"
#include "sqlcmp/common/value_operations/value_operations.hpp"
#include "sqlcmp/execution/comparison/comparison_coercion.hpp"

#include <cmath>

namespace sqlcmp {

//===--------------------------------------------------------------------===//
// Three-way comparison
//===--------------------------------------------------------------------===//
template <class T>
static int32_t ThreeWayCompare(const T &left, const T &right) {
	if (left == right) {
		return 0;
	}
	return left < right ? -1 : 1;
}

// NaN equals NaN and is bigger than every other value; -0.0 equals 0.0
template <>
int32_t ThreeWayCompare(const double &left, const double &right) {
	bool left_is_nan = std::isnan(left);
	bool right_is_nan = std::isnan(right);
	if (left_is_nan || right_is_nan) {
		if (left_is_nan && right_is_nan) {
			return 0;
		}
		return left_is_nan ? 1 : -1;
	}
	if (left == right) {
		return 0;
	}
	return left < right ? -1 : 1;
}

template <>
int32_t ThreeWayCompare(const decimal_t &left, const decimal_t &right) {
	return Decimal::Compare(left, right);
}

static string ToText(const Value &value, const LogicalType &source_type) {
	return value.ToString();
}

template <class T>
static comparator_function_t CreateComparator(const LogicalType &left_type, const LogicalType &right_type,
                                              T (*coerce)(const Value &value, const LogicalType &source_type)) {
	return [left_type, right_type, coerce](TermEvaluationContext &context, const Term &left,
	                                       const Term &right) -> int32_t {
		auto left_value = coerce(left.Evaluate(context), left_type);
		auto right_value = coerce(right.Evaluate(context), right_type);
		return ThreeWayCompare<T>(left_value, right_value);
	};
}

static bool EitherIs(const LogicalType &left_type, const LogicalType &right_type, LogicalTypeId id) {
	return left_type.id() == id || right_type.id() == id;
}

comparator_function_t ComparisonResolver::ResolveComparator(const LogicalType &left_type,
                                                            const LogicalType &right_type) {
	if (EitherIs(left_type, right_type, LogicalTypeId::DECIMAL)) {
		return CreateComparator<decimal_t>(left_type, right_type, ComparisonCoercion::ToDecimal);
	}
	if (EitherIs(left_type, right_type, LogicalTypeId::TIMESTAMP)) {
		return CreateComparator<timestamp_t>(left_type, right_type, ComparisonCoercion::ToTimestamp);
	}
	if (left_type.id() == LogicalTypeId::STRING) {
		return CreateComparator<string>(left_type, right_type, ToText);
	}
	if (EitherIs(left_type, right_type, LogicalTypeId::DOUBLE)) {
		return CreateComparator<double>(left_type, right_type, NumericCoercion::ToDouble);
	}
	if (EitherIs(left_type, right_type, LogicalTypeId::BIGINT)) {
		return CreateComparator<int64_t>(left_type, right_type, NumericCoercion::ToBigint);
	}
	if (EitherIs(left_type, right_type, LogicalTypeId::INTEGER)) {
		return CreateComparator<int32_t>(left_type, right_type, NumericCoercion::ToInteger);
	}
	return comparator_function_t();
}

static bool StructuralEquals(TermEvaluationContext &context, const Term &left, const Term &right) {
	return ValueOperations::NotDistinctFrom(left.Evaluate(context), right.Evaluate(context));
}

equals_function_t ComparisonResolver::ResolveEquals(const LogicalType &left_type, const LogicalType &right_type) {
	switch (left_type.id()) {
	case LogicalTypeId::ARRAY:
	case LogicalTypeId::MAP:
	case LogicalTypeId::STRUCT:
	case LogicalTypeId::BOOLEAN:
		return StructuralEquals;
	case LogicalTypeId::INVALID:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
	case LogicalTypeId::DOUBLE:
	case LogicalTypeId::DECIMAL:
	case LogicalTypeId::TIMESTAMP:
	case LogicalTypeId::STRING:
		break;
	}
	return equals_function_t();
}

} // namespace sqlcmp
