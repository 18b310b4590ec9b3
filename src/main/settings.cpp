#include "sqlcmp/main/settings.hpp"

#include "sqlcmp/common/string_util.hpp"
#include "sqlcmp/main/config.hpp"

#include <algorithm>

namespace sqlcmp {

static std::unordered_set<string> ParseLogTypes(const string &input) {
	std::unordered_set<string> result;
	for (auto &log_type : StringUtil::Split(input, ',')) {
		auto trimmed = log_type;
		StringUtil::Trim(trimmed);
		if (!trimmed.empty()) {
			result.insert(trimmed);
		}
	}
	return result;
}

static Value LogTypesToValue(const std::unordered_set<string> &log_types) {
	vector<string> sorted(log_types.begin(), log_types.end());
	std::sort(sorted.begin(), sorted.end());
	return Value(StringUtil::Join(sorted, ","));
}

//===----------------------------------------------------------------------===//
// Comparison Require Same Equality Types
//===----------------------------------------------------------------------===//
void ComparisonRequireSameEqualityTypesSetting::SetGlobal(CompilerConfig &config, const Value &input) {
	config.options.comparison_require_same_equality_types = BooleanValue::Get(input);
}

void ComparisonRequireSameEqualityTypesSetting::ResetGlobal(CompilerConfig &config) {
	config.options.comparison_require_same_equality_types = CompilerConfigOptions().comparison_require_same_equality_types;
}

Value ComparisonRequireSameEqualityTypesSetting::GetSetting(const CompilerConfig &config) {
	return Value::BOOLEAN(config.options.comparison_require_same_equality_types);
}

//===----------------------------------------------------------------------===//
// Enable Logging
//===----------------------------------------------------------------------===//
void EnableLoggingSetting::SetGlobal(CompilerConfig &config, const Value &input) {
	config.options.log_config.enabled = BooleanValue::Get(input);
}

void EnableLoggingSetting::ResetGlobal(CompilerConfig &config) {
	config.options.log_config.enabled = LogConfig().enabled;
}

Value EnableLoggingSetting::GetSetting(const CompilerConfig &config) {
	return Value::BOOLEAN(config.options.log_config.enabled);
}

//===----------------------------------------------------------------------===//
// Logging Level
//===----------------------------------------------------------------------===//
void LoggingLevelSetting::SetGlobal(CompilerConfig &config, const Value &input) {
	config.options.log_config.level = LogLevelFromString(StringValue::Get(input));
}

void LoggingLevelSetting::ResetGlobal(CompilerConfig &config) {
	config.options.log_config.level = LogConfig::DEFAULT_LOG_LEVEL;
}

Value LoggingLevelSetting::GetSetting(const CompilerConfig &config) {
	return Value(StringUtil::Lower(LogLevelToString(config.options.log_config.level)));
}

//===----------------------------------------------------------------------===//
// Enabled Log Types
//===----------------------------------------------------------------------===//
void EnabledLogTypesSetting::SetGlobal(CompilerConfig &config, const Value &input) {
	auto &log_config = config.options.log_config;
	log_config.enabled_log_types = ParseLogTypes(StringValue::Get(input));
	log_config.disabled_log_types.clear();
	log_config.mode = log_config.enabled_log_types.empty() ? LogMode::LEVEL_ONLY : LogMode::ENABLE_SELECTED;
}

void EnabledLogTypesSetting::ResetGlobal(CompilerConfig &config) {
	auto &log_config = config.options.log_config;
	log_config.enabled_log_types.clear();
	if (log_config.mode == LogMode::ENABLE_SELECTED) {
		log_config.mode = LogMode::LEVEL_ONLY;
	}
}

Value EnabledLogTypesSetting::GetSetting(const CompilerConfig &config) {
	return LogTypesToValue(config.options.log_config.enabled_log_types);
}

//===----------------------------------------------------------------------===//
// Disabled Log Types
//===----------------------------------------------------------------------===//
void DisabledLogTypesSetting::SetGlobal(CompilerConfig &config, const Value &input) {
	auto &log_config = config.options.log_config;
	log_config.disabled_log_types = ParseLogTypes(StringValue::Get(input));
	log_config.enabled_log_types.clear();
	log_config.mode = log_config.disabled_log_types.empty() ? LogMode::LEVEL_ONLY : LogMode::DISABLE_SELECTED;
}

void DisabledLogTypesSetting::ResetGlobal(CompilerConfig &config) {
	auto &log_config = config.options.log_config;
	log_config.disabled_log_types.clear();
	if (log_config.mode == LogMode::DISABLE_SELECTED) {
		log_config.mode = LogMode::LEVEL_ONLY;
	}
}

Value DisabledLogTypesSetting::GetSetting(const CompilerConfig &config) {
	return LogTypesToValue(config.options.log_config.disabled_log_types);
}

//===----------------------------------------------------------------------===//
// Logging Storage
//===----------------------------------------------------------------------===//
void LoggingStorageSetting::SetGlobal(CompilerConfig &config, const Value &input) {
	config.options.log_config.storage = StringUtil::Lower(StringValue::Get(input));
}

void LoggingStorageSetting::ResetGlobal(CompilerConfig &config) {
	config.options.log_config.storage = LogConfig::DEFAULT_LOG_STORAGE;
}

Value LoggingStorageSetting::GetSetting(const CompilerConfig &config) {
	return Value(config.options.log_config.storage);
}

} // namespace sqlcmp
