//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/main/config.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"
#include "sqlcmp/common/types/value.hpp"
#include "sqlcmp/logging/logging.hpp"

namespace sqlcmp {

struct CompilerConfig;

typedef void (*set_option_function_t)(CompilerConfig &config, const Value &parameter);
typedef void (*reset_option_function_t)(CompilerConfig &config);
typedef Value (*get_option_function_t)(const CompilerConfig &config);

struct ConfigurationOption {
	const char *name;
	const char *description;
	LogicalTypeId parameter_type;
	set_option_function_t set_option;
	reset_option_function_t reset_option;
	get_option_function_t get_setting;
};

struct CompilerConfigOptions {
	//! Whether an equality between a nested or BOOLEAN left operand and a right operand of another base type is
	//! rejected when the comparison is compiled
	bool comparison_require_same_equality_types = true;
	//! The logging configuration of the compiler
	LogConfig log_config;
};

struct CompilerConfig {
public:
	CompilerConfig();
	~CompilerConfig();

	//! The options of the compiler
	CompilerConfigOptions options;

public:
	static idx_t GetOptionCount();
	static vector<string> GetOptionNames();
	//! Fetch an option by index. Returns a pointer to the option, or nullptr if out of range
	static const ConfigurationOption *GetOptionByIndex(idx_t index);
	//! Fetch an option by its (case insensitive) name. Returns a pointer to the option, or nullptr if none exists.
	static const ConfigurationOption *GetOptionByName(const string &name);

	//! Set an option, converting the value to the parameter type of the option
	void SetOption(const ConfigurationOption &option, const Value &value);
	//! Set an option by name. Throws an InvalidInputException for unknown options or unconvertible values.
	void SetOptionByName(const string &name, const Value &value);
	//! Restore the default of an option
	void ResetOption(const string &name);
	//! The current value of an option
	Value GetOptionValue(const string &name) const;
};

} // namespace sqlcmp
