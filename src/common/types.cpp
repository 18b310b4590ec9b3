#include "sqlcmp/common/types.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/string_util.hpp"

namespace sqlcmp {

constexpr const LogicalTypeId LogicalType::INVALID;
constexpr const LogicalTypeId LogicalType::BOOLEAN;
constexpr const LogicalTypeId LogicalType::INTEGER;
constexpr const LogicalTypeId LogicalType::BIGINT;
constexpr const LogicalTypeId LogicalType::DOUBLE;
constexpr const LogicalTypeId LogicalType::TIMESTAMP;
constexpr const LogicalTypeId LogicalType::STRING;

constexpr uint8_t DecimalType::MAX_WIDTH;
constexpr uint8_t DecimalType::DEFAULT_WIDTH;
constexpr uint8_t DecimalType::DEFAULT_SCALE;

LogicalType::LogicalType() : LogicalType(LogicalTypeId::INVALID) {
}

LogicalType::LogicalType(LogicalTypeId id) : id_(id) {
	if (id == LogicalTypeId::DECIMAL) {
		// a bare DECIMAL gets the default width and scale
		type_info_ = make_shared_ptr<DecimalTypeInfo>(DecimalType::DEFAULT_WIDTH, DecimalType::DEFAULT_SCALE);
	}
}

LogicalType::LogicalType(LogicalTypeId id, shared_ptr<ExtraTypeInfo> type_info)
    : id_(id), type_info_(std::move(type_info)) {
}

LogicalType::LogicalType(const LogicalType &other) : id_(other.id_), type_info_(other.type_info_) {
}

LogicalType::LogicalType(LogicalType &&other) noexcept : id_(other.id_), type_info_(std::move(other.type_info_)) {
}

LogicalType::~LogicalType() {
}

LogicalType &LogicalType::operator=(const LogicalType &other) {
	id_ = other.id_;
	type_info_ = other.type_info_;
	return *this;
}

LogicalType &LogicalType::operator=(LogicalType &&other) noexcept {
	id_ = other.id_;
	type_info_ = std::move(other.type_info_);
	return *this;
}

bool LogicalType::operator==(const LogicalType &rhs) const {
	if (id_ != rhs.id_) {
		return false;
	}
	if (type_info_.get() == rhs.type_info_.get()) {
		return true;
	}
	if (type_info_) {
		return type_info_->Equals(rhs.type_info_.get());
	}
	return rhs.type_info_->Equals(type_info_.get());
}

string LogicalTypeIdToString(LogicalTypeId type) {
	switch (type) {
	case LogicalTypeId::BOOLEAN:
		return "BOOLEAN";
	case LogicalTypeId::INTEGER:
		return "INTEGER";
	case LogicalTypeId::BIGINT:
		return "BIGINT";
	case LogicalTypeId::DOUBLE:
		return "DOUBLE";
	case LogicalTypeId::DECIMAL:
		return "DECIMAL";
	case LogicalTypeId::TIMESTAMP:
		return "TIMESTAMP";
	case LogicalTypeId::STRING:
		return "STRING";
	case LogicalTypeId::ARRAY:
		return "ARRAY";
	case LogicalTypeId::MAP:
		return "MAP";
	case LogicalTypeId::STRUCT:
		return "STRUCT";
	case LogicalTypeId::INVALID:
		break;
	}
	return "INVALID";
}

string LogicalType::ToString() const {
	switch (id_) {
	case LogicalTypeId::DECIMAL: {
		if (!type_info_) {
			return "DECIMAL";
		}
		return StringUtil::Format("DECIMAL(%d,%d)", DecimalType::GetWidth(*this), DecimalType::GetScale(*this));
	}
	case LogicalTypeId::ARRAY: {
		if (!type_info_) {
			return "ARRAY";
		}
		return "ARRAY<" + ArrayType::GetChildType(*this).ToString() + ">";
	}
	case LogicalTypeId::MAP: {
		if (!type_info_) {
			return "MAP";
		}
		return "MAP<" + MapType::KeyType(*this).ToString() + ", " + MapType::ValueType(*this).ToString() + ">";
	}
	case LogicalTypeId::STRUCT: {
		if (!type_info_) {
			return "STRUCT";
		}
		auto &child_types = StructType::GetChildTypes(*this);
		string ret = "STRUCT<";
		for (idx_t i = 0; i < child_types.size(); i++) {
			ret += StringUtil::Format("%s %s", child_types[i].first, child_types[i].second);
			if (i + 1 < child_types.size()) {
				ret += ", ";
			}
		}
		ret += ">";
		return ret;
	}
	default:
		return LogicalTypeIdToString(id_);
	}
}

bool LogicalType::IsNested() const {
	switch (id_) {
	case LogicalTypeId::ARRAY:
	case LogicalTypeId::MAP:
	case LogicalTypeId::STRUCT:
		return true;
	default:
		return false;
	}
}

bool LogicalType::IsNumeric() const {
	switch (id_) {
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
	case LogicalTypeId::DOUBLE:
	case LogicalTypeId::DECIMAL:
		return true;
	default:
		return false;
	}
}

//===--------------------------------------------------------------------===//
// Decimal Type
//===--------------------------------------------------------------------===//
LogicalType LogicalType::DECIMAL(uint8_t width, uint8_t scale) {
	if (width == 0 || width > DecimalType::MAX_WIDTH) {
		throw InvalidInputException("Width must be between 1 and %d", DecimalType::MAX_WIDTH);
	}
	if (scale > width) {
		throw InvalidInputException("Scale %d cannot be bigger than width %d", scale, width);
	}
	auto type_info = make_shared_ptr<DecimalTypeInfo>(width, scale);
	return LogicalType(LogicalTypeId::DECIMAL, std::move(type_info));
}

uint8_t DecimalType::GetWidth(const LogicalType &type) {
	D_ASSERT(type.id() == LogicalTypeId::DECIMAL);
	auto info = type.AuxInfo();
	if (!info) {
		return DEFAULT_WIDTH;
	}
	return info->Cast<DecimalTypeInfo>().width;
}

uint8_t DecimalType::GetScale(const LogicalType &type) {
	D_ASSERT(type.id() == LogicalTypeId::DECIMAL);
	auto info = type.AuxInfo();
	if (!info) {
		return DEFAULT_SCALE;
	}
	return info->Cast<DecimalTypeInfo>().scale;
}

//===--------------------------------------------------------------------===//
// Array Type
//===--------------------------------------------------------------------===//
LogicalType LogicalType::ARRAY(const LogicalType &child) {
	auto info = make_shared_ptr<ListTypeInfo>(child);
	return LogicalType(LogicalTypeId::ARRAY, std::move(info));
}

const LogicalType &ArrayType::GetChildType(const LogicalType &type) {
	D_ASSERT(type.id() == LogicalTypeId::ARRAY);
	auto info = type.AuxInfo();
	D_ASSERT(info);
	return info->Cast<ListTypeInfo>().child_type;
}

//===--------------------------------------------------------------------===//
// Map Type
//===--------------------------------------------------------------------===//
LogicalType LogicalType::MAP(const LogicalType &key, const LogicalType &value) {
	auto info = make_shared_ptr<MapTypeInfo>(key, value);
	return LogicalType(LogicalTypeId::MAP, std::move(info));
}

const LogicalType &MapType::KeyType(const LogicalType &type) {
	D_ASSERT(type.id() == LogicalTypeId::MAP);
	auto info = type.AuxInfo();
	D_ASSERT(info);
	return info->Cast<MapTypeInfo>().key_type;
}

const LogicalType &MapType::ValueType(const LogicalType &type) {
	D_ASSERT(type.id() == LogicalTypeId::MAP);
	auto info = type.AuxInfo();
	D_ASSERT(info);
	return info->Cast<MapTypeInfo>().value_type;
}

//===--------------------------------------------------------------------===//
// Struct Type
//===--------------------------------------------------------------------===//
LogicalType LogicalType::STRUCT(child_list_t<LogicalType> children) {
	auto info = make_shared_ptr<StructTypeInfo>(std::move(children));
	return LogicalType(LogicalTypeId::STRUCT, std::move(info));
}

const child_list_t<LogicalType> &StructType::GetChildTypes(const LogicalType &type) {
	D_ASSERT(type.id() == LogicalTypeId::STRUCT);
	auto info = type.AuxInfo();
	D_ASSERT(info);
	return info->Cast<StructTypeInfo>().child_types;
}

const string &StructType::GetChildName(const LogicalType &type, idx_t index) {
	auto &child_types = StructType::GetChildTypes(type);
	D_ASSERT(index < child_types.size());
	return child_types[index].first;
}

idx_t StructType::GetChildCount(const LogicalType &type) {
	return StructType::GetChildTypes(type).size();
}

//===--------------------------------------------------------------------===//
// Extra Type Info
//===--------------------------------------------------------------------===//
ExtraTypeInfo::ExtraTypeInfo(ExtraTypeInfoType type) : type(type) {
}

ExtraTypeInfo::~ExtraTypeInfo() {
}

bool ExtraTypeInfo::Equals(const ExtraTypeInfo *other_p) const {
	if (!other_p) {
		return false;
	}
	if (type != other_p->type) {
		return false;
	}
	return EqualsInternal(other_p);
}

bool ExtraTypeInfo::EqualsInternal(const ExtraTypeInfo *other_p) const {
	// Do nothing
	return true;
}

DecimalTypeInfo::DecimalTypeInfo(uint8_t width_p, uint8_t scale_p)
    : ExtraTypeInfo(ExtraTypeInfoType::DECIMAL_TYPE_INFO), width(width_p), scale(scale_p) {
}

bool DecimalTypeInfo::EqualsInternal(const ExtraTypeInfo *other_p) const {
	auto &other = other_p->Cast<DecimalTypeInfo>();
	return width == other.width && scale == other.scale;
}

ListTypeInfo::ListTypeInfo(LogicalType child_type_p)
    : ExtraTypeInfo(ExtraTypeInfoType::LIST_TYPE_INFO), child_type(std::move(child_type_p)) {
}

bool ListTypeInfo::EqualsInternal(const ExtraTypeInfo *other_p) const {
	auto &other = other_p->Cast<ListTypeInfo>();
	return child_type == other.child_type;
}

MapTypeInfo::MapTypeInfo(LogicalType key_type_p, LogicalType value_type_p)
    : ExtraTypeInfo(ExtraTypeInfoType::MAP_TYPE_INFO), key_type(std::move(key_type_p)),
      value_type(std::move(value_type_p)) {
}

bool MapTypeInfo::EqualsInternal(const ExtraTypeInfo *other_p) const {
	auto &other = other_p->Cast<MapTypeInfo>();
	return key_type == other.key_type && value_type == other.value_type;
}

StructTypeInfo::StructTypeInfo(child_list_t<LogicalType> child_types_p)
    : ExtraTypeInfo(ExtraTypeInfoType::STRUCT_TYPE_INFO), child_types(std::move(child_types_p)) {
}

bool StructTypeInfo::EqualsInternal(const ExtraTypeInfo *other_p) const {
	auto &other = other_p->Cast<StructTypeInfo>();
	return child_types == other.child_types;
}

} // namespace sqlcmp
