#include "sqlcmp/main/config.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/string_util.hpp"
#include "sqlcmp/main/settings.hpp"

namespace sqlcmp {

#define SQLCMP_GLOBAL(_PARAM)                                                                                          \
	{ _PARAM::Name, _PARAM::Description, _PARAM::InputType, _PARAM::SetGlobal, _PARAM::ResetGlobal, _PARAM::GetSetting }
#define FINAL_SETTING                                                                                                  \
	{ nullptr, nullptr, LogicalTypeId::INVALID, nullptr, nullptr, nullptr }

static const ConfigurationOption internal_options[] = {SQLCMP_GLOBAL(ComparisonRequireSameEqualityTypesSetting),
                                                       SQLCMP_GLOBAL(DisabledLogTypesSetting),
                                                       SQLCMP_GLOBAL(EnableLoggingSetting),
                                                       SQLCMP_GLOBAL(EnabledLogTypesSetting),
                                                       SQLCMP_GLOBAL(LoggingLevelSetting),
                                                       SQLCMP_GLOBAL(LoggingStorageSetting),
                                                       FINAL_SETTING};

CompilerConfig::CompilerConfig() {
}

CompilerConfig::~CompilerConfig() {
}

idx_t CompilerConfig::GetOptionCount() {
	idx_t count = 0;
	for (idx_t index = 0; internal_options[index].name; index++) {
		count++;
	}
	return count;
}

vector<string> CompilerConfig::GetOptionNames() {
	vector<string> names;
	for (idx_t i = 0, option_count = CompilerConfig::GetOptionCount(); i < option_count; i++) {
		names.emplace_back(CompilerConfig::GetOptionByIndex(i)->name);
	}
	return names;
}

const ConfigurationOption *CompilerConfig::GetOptionByIndex(idx_t target_index) {
	for (idx_t index = 0; internal_options[index].name; index++) {
		if (index == target_index) {
			return internal_options + index;
		}
	}
	return nullptr;
}

const ConfigurationOption *CompilerConfig::GetOptionByName(const string &name) {
	auto lname = StringUtil::Lower(name);
	for (idx_t index = 0; internal_options[index].name; index++) {
		D_ASSERT(StringUtil::Lower(internal_options[index].name) == string(internal_options[index].name));
		if (internal_options[index].name == lname) {
			return internal_options + index;
		}
	}
	return nullptr;
}

static bool TryCastToBoolean(const Value &input, bool &result) {
	switch (input.type().id()) {
	case LogicalTypeId::BOOLEAN:
		result = BooleanValue::Get(input);
		return true;
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT: {
		auto value = input.type().id() == LogicalTypeId::INTEGER ? IntegerValue::Get(input) : BigIntValue::Get(input);
		if (value != 0 && value != 1) {
			return false;
		}
		result = value == 1;
		return true;
	}
	case LogicalTypeId::STRING: {
		auto str = StringUtil::Lower(StringValue::Get(input));
		StringUtil::Trim(str);
		if (str == "true" || str == "t" || str == "1" || str == "on") {
			result = true;
			return true;
		}
		if (str == "false" || str == "f" || str == "0" || str == "off") {
			result = false;
			return true;
		}
		return false;
	}
	default:
		return false;
	}
}

//! Convert the input of an option to the parameter type of the option
static Value CastOptionInput(const ConfigurationOption &option, const Value &input) {
	if (input.IsNull()) {
		throw InvalidInputException("Option \"%s\" cannot be set to NULL", option.name);
	}
	switch (option.parameter_type) {
	case LogicalTypeId::BOOLEAN: {
		bool result;
		if (!TryCastToBoolean(input, result)) {
			throw InvalidInputException("Could not convert %s value \"%s\" to BOOLEAN for option \"%s\"",
			                            input.type(), input.ToString(), option.name);
		}
		return Value::BOOLEAN(result);
	}
	case LogicalTypeId::STRING:
		return Value(input.ToString());
	default:
		throw InternalException("Unsupported parameter type %s for option \"%s\"", option.parameter_type,
		                        option.name);
	}
}

void CompilerConfig::SetOption(const ConfigurationOption &option, const Value &value) {
	D_ASSERT(option.set_option);
	auto input = CastOptionInput(option, value);
	option.set_option(*this, input);
}

void CompilerConfig::SetOptionByName(const string &name, const Value &value) {
	auto option = CompilerConfig::GetOptionByName(name);
	if (!option) {
		throw InvalidInputException("Unrecognized configuration option \"%s\", expected one of: %s", name,
		                            StringUtil::Join(GetOptionNames(), ", "));
	}
	SetOption(*option, value);
}

void CompilerConfig::ResetOption(const string &name) {
	auto option = CompilerConfig::GetOptionByName(name);
	if (!option) {
		throw InvalidInputException("Unrecognized configuration option \"%s\"", name);
	}
	option->reset_option(*this);
}

Value CompilerConfig::GetOptionValue(const string &name) const {
	auto option = CompilerConfig::GetOptionByName(name);
	if (!option) {
		throw InvalidInputException("Unrecognized configuration option \"%s\"", name);
	}
	return option->get_setting(*this);
}

} // namespace sqlcmp
