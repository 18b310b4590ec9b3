//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/common/types.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"

namespace sqlcmp {

class Value;
struct ExtraTypeInfo;

template <class T>
using child_list_t = vector<std::pair<std::string, T>>;

//===--------------------------------------------------------------------===//
// SQL Base Types
//===--------------------------------------------------------------------===//
//! The closed set of base types an operand can be declared with. Adding an entry here requires revisiting
//! every switch over LogicalTypeId (the compiler flags the missing cases).
enum class LogicalTypeId : uint8_t {
	INVALID = 0,
	BOOLEAN = 10,
	INTEGER = 13,
	BIGINT = 14,
	TIMESTAMP = 19,
	DECIMAL = 21,
	DOUBLE = 23,
	STRING = 25,
	STRUCT = 100,
	ARRAY = 101,
	MAP = 102
};

string LogicalTypeIdToString(LogicalTypeId type);

struct LogicalType {
	LogicalType();
	LogicalType(LogicalTypeId id); // NOLINT: Allow implicit conversion from `LogicalTypeId`
	LogicalType(LogicalTypeId id, shared_ptr<ExtraTypeInfo> type_info);
	LogicalType(const LogicalType &other);
	LogicalType(LogicalType &&other) noexcept;

	~LogicalType();

	inline LogicalTypeId id() const {
		return id_;
	}
	inline const ExtraTypeInfo *AuxInfo() const {
		return type_info_.get();
	}

	LogicalType &operator=(const LogicalType &other);
	LogicalType &operator=(LogicalType &&other) noexcept;

	bool operator==(const LogicalType &rhs) const;
	bool operator!=(const LogicalType &rhs) const {
		return !(*this == rhs);
	}

	string ToString() const;
	//! True for the composite types that are compared by structure instead of by ordering
	bool IsNested() const;
	bool IsNumeric() const;

private:
	LogicalTypeId id_;
	shared_ptr<ExtraTypeInfo> type_info_;

public:
	static constexpr const LogicalTypeId INVALID = LogicalTypeId::INVALID;
	static constexpr const LogicalTypeId BOOLEAN = LogicalTypeId::BOOLEAN;
	static constexpr const LogicalTypeId INTEGER = LogicalTypeId::INTEGER;
	static constexpr const LogicalTypeId BIGINT = LogicalTypeId::BIGINT;
	static constexpr const LogicalTypeId DOUBLE = LogicalTypeId::DOUBLE;
	static constexpr const LogicalTypeId TIMESTAMP = LogicalTypeId::TIMESTAMP;
	static constexpr const LogicalTypeId STRING = LogicalTypeId::STRING;

	// deep types
	static LogicalType DECIMAL(uint8_t width, uint8_t scale); // NOLINT
	static LogicalType ARRAY(const LogicalType &child);        // NOLINT
	static LogicalType MAP(const LogicalType &key, const LogicalType &value); // NOLINT
	static LogicalType STRUCT(child_list_t<LogicalType> children);            // NOLINT
};

struct DecimalType {
	static uint8_t GetWidth(const LogicalType &type);
	static uint8_t GetScale(const LogicalType &type);
	//! The widest decimal the engine can represent (a 128-bit unscaled value)
	static constexpr uint8_t MAX_WIDTH = 38;
	static constexpr uint8_t DEFAULT_WIDTH = 18;
	static constexpr uint8_t DEFAULT_SCALE = 3;
};

struct ArrayType {
	static const LogicalType &GetChildType(const LogicalType &type);
};

struct MapType {
	static const LogicalType &KeyType(const LogicalType &type);
	static const LogicalType &ValueType(const LogicalType &type);
};

struct StructType {
	static const child_list_t<LogicalType> &GetChildTypes(const LogicalType &type);
	static const string &GetChildName(const LogicalType &type, idx_t index);
	static idx_t GetChildCount(const LogicalType &type);
};

//===--------------------------------------------------------------------===//
// Extra Type Info
//===--------------------------------------------------------------------===//
enum class ExtraTypeInfoType : uint8_t {
	INVALID_TYPE_INFO = 0,
	DECIMAL_TYPE_INFO = 1,
	LIST_TYPE_INFO = 2,
	MAP_TYPE_INFO = 3,
	STRUCT_TYPE_INFO = 4
};

struct ExtraTypeInfo {
	explicit ExtraTypeInfo(ExtraTypeInfoType type);
	virtual ~ExtraTypeInfo();

	ExtraTypeInfoType type;

public:
	bool Equals(const ExtraTypeInfo *other_p) const;

	template <class TARGET>
	const TARGET &Cast() const {
		return reinterpret_cast<const TARGET &>(*this);
	}

protected:
	virtual bool EqualsInternal(const ExtraTypeInfo *other_p) const;
};

struct DecimalTypeInfo : public ExtraTypeInfo {
	DecimalTypeInfo(uint8_t width_p, uint8_t scale_p);

	uint8_t width;
	uint8_t scale;

protected:
	bool EqualsInternal(const ExtraTypeInfo *other_p) const override;
};

struct ListTypeInfo : public ExtraTypeInfo {
	explicit ListTypeInfo(LogicalType child_type_p);

	LogicalType child_type;

protected:
	bool EqualsInternal(const ExtraTypeInfo *other_p) const override;
};

struct MapTypeInfo : public ExtraTypeInfo {
	MapTypeInfo(LogicalType key_type_p, LogicalType value_type_p);

	LogicalType key_type;
	LogicalType value_type;

protected:
	bool EqualsInternal(const ExtraTypeInfo *other_p) const override;
};

struct StructTypeInfo : public ExtraTypeInfo {
	explicit StructTypeInfo(child_list_t<LogicalType> child_types_p);

	child_list_t<LogicalType> child_types;

protected:
	bool EqualsInternal(const ExtraTypeInfo *other_p) const override;
};

} // namespace sqlcmp
