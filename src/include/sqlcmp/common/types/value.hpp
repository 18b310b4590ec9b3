//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/types/value.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"
#include "sqlcmp/common/types.hpp"
#include "sqlcmp/common/types/decimal.hpp"
#include "sqlcmp/common/types/hugeint.hpp"
#include "sqlcmp/common/types/timestamp.hpp"

namespace sqlcmp {

struct ExtraValueInfo;

//! The Value object holds a single value of arbitrary type.
//! Its runtime representation is determined by type().id(); a value without a type is an untyped NULL.
class Value {
	friend struct StringValue;
	friend struct ArrayValue;
	friend struct MapValue;
	friend struct StructValue;

public:
	//! Create an empty NULL value of the specified type
	explicit Value(LogicalType type = LogicalType());
	//! Create an INTEGER value
	Value(int32_t val); // NOLINT: Allow implicit conversion from `int32_t`
	//! Create a BIGINT value
	Value(int64_t val); // NOLINT: Allow implicit conversion from `int64_t`
	//! Create a DOUBLE value
	Value(double val); // NOLINT: Allow implicit conversion from `double`
	//! Create a STRING value
	Value(const char *val); // NOLINT: Allow implicit conversion from `const char *`
	//! Create a STRING value
	Value(string val); // NOLINT: Allow implicit conversion from `string`
	Value(const Value &other);
	Value(Value &&other) noexcept;
	~Value();

	Value &operator=(const Value &other);
	Value &operator=(Value &&other) noexcept;

	inline const LogicalType &type() const {
		return type_;
	}
	inline bool IsNull() const {
		return is_null;
	}

	//! Create a BOOLEAN value
	static Value BOOLEAN(bool value);
	//! Create an INTEGER value
	static Value INTEGER(int32_t value);
	//! Create a BIGINT value
	static Value BIGINT(int64_t value);
	//! Create a DOUBLE value
	static Value DOUBLE(double value);
	//! Create a DECIMAL value; the width is derived from the number of digits
	static Value DECIMAL(const decimal_t &value);
	//! Create a DECIMAL value of an explicit width and scale
	static Value DECIMAL(hugeint_t value, uint8_t width, uint8_t scale);
	//! Create a TIMESTAMP value
	static Value TIMESTAMP(timestamp_t value);
	//! Create a TIMESTAMP value from its components (in UTC)
	static Value TIMESTAMP(int32_t year, int32_t month, int32_t day, int32_t hour, int32_t min, int32_t sec,
	                       int32_t micros);
	//! Create an ARRAY value with the given child type
	static Value ARRAY(const LogicalType &child_type, vector<Value> values);
	//! Create a MAP value from parallel key and value lists
	static Value MAP(const LogicalType &key_type, const LogicalType &value_type, vector<Value> keys,
	                 vector<Value> values);
	//! Create a STRUCT value; the field order is significant
	static Value STRUCT(child_list_t<Value> values);

	//! Textual representation of the value. This is also the representation used when a value is compared
	//! against a STRING operand.
	string ToString() const;

	//! Deep structural equality: both the representation and the contents must match. NULL equals NULL.
	bool operator==(const Value &rhs) const;
	bool operator!=(const Value &rhs) const;

private:
	//! The logical type of the value
	LogicalType type_;
	//! Whether or not the value is NULL
	bool is_null;

	//! The value of the object, if it is of a constant size Type
	union Val {
		bool boolean;
		int32_t integer;
		int64_t bigint;
		double double_;
		hugeint_t hugeint;
		timestamp_t timestamp;
	} value_; // NOLINT

	shared_ptr<ExtraValueInfo> value_info_; // NOLINT

private:
	friend struct BooleanValue;
	friend struct IntegerValue;
	friend struct BigIntValue;
	friend struct DoubleValue;
	friend struct DecimalValue;
	friend struct TimestampValue;
};

//===--------------------------------------------------------------------===//
// Type-specific getters
//===--------------------------------------------------------------------===//
// Reading a value through the getter of another representation throws an InternalException.
struct BooleanValue {
	static bool Get(const Value &value);
};

struct IntegerValue {
	static int32_t Get(const Value &value);
};

struct BigIntValue {
	static int64_t Get(const Value &value);
};

struct DoubleValue {
	static double Get(const Value &value);
};

struct DecimalValue {
	static decimal_t Get(const Value &value);
};

struct TimestampValue {
	static timestamp_t Get(const Value &value);
};

struct StringValue {
	static const string &Get(const Value &value);
};

struct ArrayValue {
	static const vector<Value> &GetChildren(const Value &value);
};

struct MapValue {
	//! The entries of the map, each a STRUCT with a "key" and a "value" field
	static const vector<Value> &GetChildren(const Value &value);
};

struct StructValue {
	static const vector<Value> &GetChildren(const Value &value);
};

} // namespace sqlcmp
