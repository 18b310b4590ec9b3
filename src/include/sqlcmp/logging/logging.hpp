//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/logging/logging.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"

#include <unordered_set>

namespace sqlcmp {

//! Logging levels, ordered by severity
enum class LogLevel : uint8_t {
	LOG_TRACE = 10,
	LOG_DEBUG = 20,
	LOG_INFO = 30,
	LOG_WARN = 40,
	LOG_ERROR = 50,
	LOG_FATAL = 60
};

//! Which log types pass the level filter
enum class LogMode : uint8_t {
	//! Every log type is written
	LEVEL_ONLY = 0,
	//! Only the enabled log types are written
	ENABLE_SELECTED = 1,
	//! Every log type except the disabled ones is written
	DISABLE_SELECTED = 2,
};

string LogLevelToString(LogLevel level);
//! Parse a (case insensitive) level name, throws an InvalidInputException on unknown names
LogLevel LogLevelFromString(const string &level);

struct LogConfig {
	constexpr static LogLevel DEFAULT_LOG_LEVEL = LogLevel::LOG_INFO;
	constexpr static const char *IN_MEMORY_STORAGE_NAME = "memory";
	constexpr static const char *STDOUT_STORAGE_NAME = "stdout";
	constexpr static const char *DEFAULT_LOG_STORAGE = IN_MEMORY_STORAGE_NAME;

	LogConfig();

	static LogConfig Create(bool enabled, LogLevel level);
	static LogConfig CreateFromEnabled(bool enabled, LogLevel level, std::unordered_set<string> enabled_log_types);
	static LogConfig CreateFromDisabled(bool enabled, LogLevel level, std::unordered_set<string> disabled_log_types);

	//! Whether the enabled/disabled log type sets agree with the mode
	bool IsConsistent() const;

	bool enabled;
	LogMode mode;
	LogLevel level;
	string storage;

	std::unordered_set<string> enabled_log_types;
	std::unordered_set<string> disabled_log_types;

protected:
	LogConfig(bool enabled, LogLevel level, LogMode mode, std::unordered_set<string> enabled_log_types,
	          std::unordered_set<string> disabled_log_types);
};

} // namespace sqlcmp
