#include "sqlcmp/common/types/value.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/string_util.hpp"
#include "sqlcmp/common/types/date.hpp"
#include "sqlcmp/common/value_operations/value_operations.hpp"

#include "fmt/format.h"

#include <cmath>
#include <utility>

namespace sqlcmp {

//===--------------------------------------------------------------------===//
// Extra Value Info
//===--------------------------------------------------------------------===//
enum class ExtraValueInfoType : uint8_t { INVALID_TYPE_INFO = 0, STRING_VALUE_INFO = 1, NESTED_VALUE_INFO = 2 };

struct ExtraValueInfo {
	explicit ExtraValueInfo(ExtraValueInfoType type) : type(type) {
	}
	virtual ~ExtraValueInfo() {
	}

	ExtraValueInfoType type;

public:
	template <class T>
	const T &Get() const {
		if (type != T::TYPE) {
			throw InternalException("ExtraValueInfo type mismatch");
		}
		return static_cast<const T &>(*this);
	}
};

struct StringValueInfo : public ExtraValueInfo {
	static constexpr const ExtraValueInfoType TYPE = ExtraValueInfoType::STRING_VALUE_INFO;

public:
	explicit StringValueInfo(string str_p)
	    : ExtraValueInfo(ExtraValueInfoType::STRING_VALUE_INFO), str(std::move(str_p)) {
	}

	const string &GetString() const {
		return str;
	}

private:
	string str;
};

struct NestedValueInfo : public ExtraValueInfo {
	static constexpr const ExtraValueInfoType TYPE = ExtraValueInfoType::NESTED_VALUE_INFO;

public:
	explicit NestedValueInfo(vector<Value> values_p)
	    : ExtraValueInfo(ExtraValueInfoType::NESTED_VALUE_INFO), values(std::move(values_p)) {
	}

	const vector<Value> &GetValues() const {
		return values;
	}

private:
	vector<Value> values;
};

constexpr const ExtraValueInfoType StringValueInfo::TYPE;
constexpr const ExtraValueInfoType NestedValueInfo::TYPE;

//===--------------------------------------------------------------------===//
// Value
//===--------------------------------------------------------------------===//
Value::Value(LogicalType type) : type_(std::move(type)), is_null(true) {
}

Value::Value(int32_t val) : type_(LogicalType::INTEGER), is_null(false) {
	value_.integer = val;
}

Value::Value(int64_t val) : type_(LogicalType::BIGINT), is_null(false) {
	value_.bigint = val;
}

Value::Value(double val) : type_(LogicalType::DOUBLE), is_null(false) {
	value_.double_ = val;
}

Value::Value(const char *val) : Value(val ? string(val) : string()) {
}

Value::Value(string val) : type_(LogicalType::STRING), is_null(false) {
	value_info_ = make_shared_ptr<StringValueInfo>(std::move(val));
}

Value::~Value() {
}

Value::Value(const Value &other)
    : type_(other.type_), is_null(other.is_null), value_(other.value_), value_info_(other.value_info_) {
}

Value::Value(Value &&other) noexcept
    : type_(std::move(other.type_)), is_null(other.is_null), value_(other.value_),
      value_info_(std::move(other.value_info_)) {
}

Value &Value::operator=(const Value &other) {
	if (this == &other) {
		return *this;
	}
	type_ = other.type_;
	is_null = other.is_null;
	value_ = other.value_;
	value_info_ = other.value_info_;
	return *this;
}

Value &Value::operator=(Value &&other) noexcept {
	type_ = std::move(other.type_);
	is_null = other.is_null;
	value_ = other.value_;
	value_info_ = std::move(other.value_info_);
	return *this;
}

Value Value::BOOLEAN(bool value) {
	Value result(LogicalType::BOOLEAN);
	result.value_.boolean = value;
	result.is_null = false;
	return result;
}

Value Value::INTEGER(int32_t value) {
	return Value(value);
}

Value Value::BIGINT(int64_t value) {
	return Value(value);
}

Value Value::DOUBLE(double value) {
	return Value(value);
}

Value Value::DECIMAL(const decimal_t &value) {
	auto stored = value;
	if (stored.scale < 0) {
		// a DECIMAL value has no exponent: fold it into the unscaled value
		if (-int64_t(stored.scale) > int64_t(Decimal::MAX_WIDTH) ||
		    !Hugeint::TryMultiply(stored.value, Hugeint::POWERS_OF_TEN[-stored.scale], stored.value)) {
			throw OutOfRangeException("Decimal %s does not fit in DECIMAL(%d)", Decimal::ToString(value),
			                          Decimal::MAX_WIDTH);
		}
		stored.scale = 0;
	}
	auto width = Decimal::Width(stored);
	if (stored.scale > int32_t(Decimal::MAX_WIDTH) || width > Decimal::MAX_WIDTH) {
		throw OutOfRangeException("Decimal %s does not fit in DECIMAL(%d)", Decimal::ToString(value),
		                          Decimal::MAX_WIDTH);
	}
	return Value::DECIMAL(stored.value, uint8_t(width), uint8_t(stored.scale));
}

Value Value::DECIMAL(hugeint_t value, uint8_t width, uint8_t scale) {
	Value result(LogicalType::DECIMAL(width, scale));
	result.value_.hugeint = value;
	result.is_null = false;
	return result;
}

Value Value::TIMESTAMP(timestamp_t value) {
	Value result(LogicalType::TIMESTAMP);
	result.value_.timestamp = value;
	result.is_null = false;
	return result;
}

Value Value::TIMESTAMP(int32_t year, int32_t month, int32_t day, int32_t hour, int32_t min, int32_t sec,
                       int32_t micros) {
	int64_t time_micros = hour * Timestamp::MICROS_PER_HOUR + min * Timestamp::MICROS_PER_MINUTE +
	                      sec * Timestamp::MICROS_PER_SEC + micros;
	return Value::TIMESTAMP(Timestamp::FromDatetime(Date::FromDate(year, month, day), time_micros));
}

Value Value::ARRAY(const LogicalType &child_type, vector<Value> values) {
	Value result(LogicalType::ARRAY(child_type));
	result.value_info_ = make_shared_ptr<NestedValueInfo>(std::move(values));
	result.is_null = false;
	return result;
}

Value Value::MAP(const LogicalType &key_type, const LogicalType &value_type, vector<Value> keys,
                 vector<Value> values) {
	if (keys.size() != values.size()) {
		throw InvalidInputException("Value::MAP requires as many keys as values, got %llu keys and %llu values",
		                            keys.size(), values.size());
	}
	vector<Value> entries;
	entries.reserve(keys.size());
	for (idx_t i = 0; i < keys.size(); i++) {
		child_list_t<Value> entry;
		entry.push_back(std::make_pair("key", std::move(keys[i])));
		entry.push_back(std::make_pair("value", std::move(values[i])));
		entries.push_back(Value::STRUCT(std::move(entry)));
	}
	Value result(LogicalType::MAP(key_type, value_type));
	result.value_info_ = make_shared_ptr<NestedValueInfo>(std::move(entries));
	result.is_null = false;
	return result;
}

Value Value::STRUCT(child_list_t<Value> values) {
	child_list_t<LogicalType> child_types;
	vector<Value> struct_values;
	for (auto &child : values) {
		child_types.push_back(std::make_pair(std::move(child.first), child.second.type()));
		struct_values.push_back(std::move(child.second));
	}
	Value result(LogicalType::STRUCT(std::move(child_types)));
	result.value_info_ = make_shared_ptr<NestedValueInfo>(std::move(struct_values));
	result.is_null = false;
	return result;
}

//===--------------------------------------------------------------------===//
// GetValue
//===--------------------------------------------------------------------===//
static void CheckRepresentation(const Value &value, LogicalTypeId expected) {
	if (value.IsNull()) {
		throw InternalException("Attempting to read the %s contents of a NULL value", expected);
	}
	if (value.type().id() != expected) {
		throw InternalException("Attempting to read a %s value as %s", value.type(), expected);
	}
}

bool BooleanValue::Get(const Value &value) {
	CheckRepresentation(value, LogicalTypeId::BOOLEAN);
	return value.value_.boolean;
}

int32_t IntegerValue::Get(const Value &value) {
	CheckRepresentation(value, LogicalTypeId::INTEGER);
	return value.value_.integer;
}

int64_t BigIntValue::Get(const Value &value) {
	CheckRepresentation(value, LogicalTypeId::BIGINT);
	return value.value_.bigint;
}

double DoubleValue::Get(const Value &value) {
	CheckRepresentation(value, LogicalTypeId::DOUBLE);
	return value.value_.double_;
}

decimal_t DecimalValue::Get(const Value &value) {
	CheckRepresentation(value, LogicalTypeId::DECIMAL);
	return decimal_t(value.value_.hugeint, DecimalType::GetScale(value.type()));
}

timestamp_t TimestampValue::Get(const Value &value) {
	CheckRepresentation(value, LogicalTypeId::TIMESTAMP);
	return value.value_.timestamp;
}

const string &StringValue::Get(const Value &value) {
	CheckRepresentation(value, LogicalTypeId::STRING);
	return value.value_info_->Get<StringValueInfo>().GetString();
}

const vector<Value> &ArrayValue::GetChildren(const Value &value) {
	CheckRepresentation(value, LogicalTypeId::ARRAY);
	return value.value_info_->Get<NestedValueInfo>().GetValues();
}

const vector<Value> &MapValue::GetChildren(const Value &value) {
	CheckRepresentation(value, LogicalTypeId::MAP);
	return value.value_info_->Get<NestedValueInfo>().GetValues();
}

const vector<Value> &StructValue::GetChildren(const Value &value) {
	CheckRepresentation(value, LogicalTypeId::STRUCT);
	return value.value_info_->Get<NestedValueInfo>().GetValues();
}

//===--------------------------------------------------------------------===//
// ToString
//===--------------------------------------------------------------------===//
static string DoubleToString(double value) {
	if (std::isnan(value)) {
		return "nan";
	}
	if (std::isinf(value)) {
		return value < 0 ? "-inf" : "inf";
	}
	auto result = fmt::format("{}", value);
	if (result.find_first_of(".e") == string::npos) {
		// keep integral doubles recognizable as doubles
		result += ".0";
	}
	return result;
}

string Value::ToString() const {
	if (IsNull()) {
		return "NULL";
	}
	switch (type_.id()) {
	case LogicalTypeId::BOOLEAN:
		return value_.boolean ? "true" : "false";
	case LogicalTypeId::INTEGER:
		return std::to_string(value_.integer);
	case LogicalTypeId::BIGINT:
		return std::to_string(value_.bigint);
	case LogicalTypeId::DOUBLE:
		return DoubleToString(value_.double_);
	case LogicalTypeId::DECIMAL:
		return Decimal::ToString(DecimalValue::Get(*this));
	case LogicalTypeId::TIMESTAMP:
		return Timestamp::ToString(value_.timestamp);
	case LogicalTypeId::STRING:
		return StringValue::Get(*this);
	case LogicalTypeId::ARRAY: {
		vector<string> children;
		for (auto &child : ArrayValue::GetChildren(*this)) {
			children.push_back(child.ToString());
		}
		return "[" + StringUtil::Join(children, ", ") + "]";
	}
	case LogicalTypeId::MAP: {
		vector<string> entries;
		for (auto &entry : MapValue::GetChildren(*this)) {
			auto &key_value = StructValue::GetChildren(entry);
			entries.push_back(key_value[0].ToString() + "=" + key_value[1].ToString());
		}
		return "{" + StringUtil::Join(entries, ", ") + "}";
	}
	case LogicalTypeId::STRUCT: {
		auto &children = StructValue::GetChildren(*this);
		vector<string> fields;
		for (idx_t i = 0; i < children.size(); i++) {
			fields.push_back("'" + StructType::GetChildName(type_, i) + "': " + children[i].ToString());
		}
		return "{" + StringUtil::Join(fields, ", ") + "}";
	}
	case LogicalTypeId::INVALID:
		break;
	}
	throw InternalException("Unimplemented type for Value::ToString: %s", type_);
}

//===--------------------------------------------------------------------===//
// Comparison Operators
//===--------------------------------------------------------------------===//
bool Value::operator==(const Value &rhs) const {
	return ValueOperations::NotDistinctFrom(*this, rhs);
}

bool Value::operator!=(const Value &rhs) const {
	return ValueOperations::DistinctFrom(*this, rhs);
}

} // namespace sqlcmp
