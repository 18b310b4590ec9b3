//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/main/settings.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"
#include "sqlcmp/common/types/value.hpp"

namespace sqlcmp {

struct CompilerConfig;

struct ComparisonRequireSameEqualityTypesSetting {
	static constexpr const char *Name = "comparison_require_same_equality_types";
	static constexpr const char *Description =
	    "Reject equality comparisons between a nested or BOOLEAN operand and an operand of another type";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::BOOLEAN;
	static void SetGlobal(CompilerConfig &config, const Value &parameter);
	static void ResetGlobal(CompilerConfig &config);
	static Value GetSetting(const CompilerConfig &config);
};

struct EnableLoggingSetting {
	static constexpr const char *Name = "log_enabled";
	static constexpr const char *Description = "Enables the logger";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::BOOLEAN;
	static void SetGlobal(CompilerConfig &config, const Value &parameter);
	static void ResetGlobal(CompilerConfig &config);
	static Value GetSetting(const CompilerConfig &config);
};

struct LoggingLevelSetting {
	static constexpr const char *Name = "log_level";
	static constexpr const char *Description = "The log level which will be recorded in the log";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::STRING;
	static void SetGlobal(CompilerConfig &config, const Value &parameter);
	static void ResetGlobal(CompilerConfig &config);
	static Value GetSetting(const CompilerConfig &config);
};

struct EnabledLogTypesSetting {
	static constexpr const char *Name = "enabled_log_types";
	static constexpr const char *Description =
	    "Sets the list of enabled loggers, all other log types are dropped (comma separated)";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::STRING;
	static void SetGlobal(CompilerConfig &config, const Value &parameter);
	static void ResetGlobal(CompilerConfig &config);
	static Value GetSetting(const CompilerConfig &config);
};

struct DisabledLogTypesSetting {
	static constexpr const char *Name = "disabled_log_types";
	static constexpr const char *Description = "Sets the list of disabled loggers (comma separated)";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::STRING;
	static void SetGlobal(CompilerConfig &config, const Value &parameter);
	static void ResetGlobal(CompilerConfig &config);
	static Value GetSetting(const CompilerConfig &config);
};

struct LoggingStorageSetting {
	static constexpr const char *Name = "log_storage";
	static constexpr const char *Description = "Where log entries are written: 'memory' or 'stdout'";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::STRING;
	static void SetGlobal(CompilerConfig &config, const Value &parameter);
	static void ResetGlobal(CompilerConfig &config);
	static Value GetSetting(const CompilerConfig &config);
};

} // namespace sqlcmp
