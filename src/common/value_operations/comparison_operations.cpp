#include "sqlcmp/common/value_operations/value_operations.hpp"

#include "sqlcmp/common/exception.hpp"

#include <cmath>

namespace sqlcmp {

static bool DoubleNotDistinctFrom(double left, double right) {
	if (std::isnan(left) || std::isnan(right)) {
		return std::isnan(left) && std::isnan(right);
	}
	// -0.0 == 0.0
	return left == right;
}

static bool ArrayNotDistinctFrom(const vector<Value> &left, const vector<Value> &right) {
	if (left.size() != right.size()) {
		return false;
	}
	for (idx_t i = 0; i < left.size(); i++) {
		if (!ValueOperations::NotDistinctFrom(left[i], right[i])) {
			return false;
		}
	}
	return true;
}

static bool MapNotDistinctFrom(const vector<Value> &left, const vector<Value> &right) {
	if (left.size() != right.size()) {
		return false;
	}
	// every entry on the left must pair up with a distinct entry on the right
	vector<bool> matched(right.size(), false);
	for (auto &left_entry : left) {
		bool found = false;
		for (idx_t i = 0; i < right.size(); i++) {
			if (matched[i] || !ValueOperations::NotDistinctFrom(left_entry, right[i])) {
				continue;
			}
			matched[i] = true;
			found = true;
			break;
		}
		if (!found) {
			return false;
		}
	}
	return true;
}

static bool StructNotDistinctFrom(const Value &left, const Value &right) {
	auto &left_types = StructType::GetChildTypes(left.type());
	auto &right_types = StructType::GetChildTypes(right.type());
	if (left_types.size() != right_types.size()) {
		return false;
	}
	for (idx_t i = 0; i < left_types.size(); i++) {
		if (left_types[i].first != right_types[i].first) {
			return false;
		}
	}
	return ArrayNotDistinctFrom(StructValue::GetChildren(left), StructValue::GetChildren(right));
}

bool ValueOperations::NotDistinctFrom(const Value &left, const Value &right) {
	if (left.IsNull() || right.IsNull()) {
		return left.IsNull() && right.IsNull();
	}
	if (left.type().id() != right.type().id()) {
		return false;
	}
	switch (left.type().id()) {
	case LogicalTypeId::BOOLEAN:
		return BooleanValue::Get(left) == BooleanValue::Get(right);
	case LogicalTypeId::INTEGER:
		return IntegerValue::Get(left) == IntegerValue::Get(right);
	case LogicalTypeId::BIGINT:
		return BigIntValue::Get(left) == BigIntValue::Get(right);
	case LogicalTypeId::DOUBLE:
		return DoubleNotDistinctFrom(DoubleValue::Get(left), DoubleValue::Get(right));
	case LogicalTypeId::DECIMAL:
		return Decimal::Compare(DecimalValue::Get(left), DecimalValue::Get(right)) == 0;
	case LogicalTypeId::TIMESTAMP:
		return TimestampValue::Get(left) == TimestampValue::Get(right);
	case LogicalTypeId::STRING:
		return StringValue::Get(left) == StringValue::Get(right);
	case LogicalTypeId::ARRAY:
		return ArrayNotDistinctFrom(ArrayValue::GetChildren(left), ArrayValue::GetChildren(right));
	case LogicalTypeId::MAP:
		return MapNotDistinctFrom(MapValue::GetChildren(left), MapValue::GetChildren(right));
	case LogicalTypeId::STRUCT:
		return StructNotDistinctFrom(left, right);
	case LogicalTypeId::INVALID:
		break;
	}
	throw InternalException("Unimplemented type for ValueOperations::NotDistinctFrom: %s", left.type());
}

bool ValueOperations::DistinctFrom(const Value &left, const Value &right) {
	return !NotDistinctFrom(left, right);
}

} // namespace sqlcmp
