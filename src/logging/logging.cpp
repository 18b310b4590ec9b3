#include "sqlcmp/logging/logging.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/string_util.hpp"

namespace sqlcmp {

constexpr LogLevel LogConfig::DEFAULT_LOG_LEVEL;
constexpr const char *LogConfig::IN_MEMORY_STORAGE_NAME;
constexpr const char *LogConfig::STDOUT_STORAGE_NAME;
constexpr const char *LogConfig::DEFAULT_LOG_STORAGE;

string LogLevelToString(LogLevel level) {
	switch (level) {
	case LogLevel::LOG_TRACE:
		return "TRACE";
	case LogLevel::LOG_DEBUG:
		return "DEBUG";
	case LogLevel::LOG_INFO:
		return "INFO";
	case LogLevel::LOG_WARN:
		return "WARN";
	case LogLevel::LOG_ERROR:
		return "ERROR";
	case LogLevel::LOG_FATAL:
		return "FATAL";
	}
	throw InternalException("Unrecognized LogLevel %d", static_cast<int>(level));
}

LogLevel LogLevelFromString(const string &level) {
	auto upper = StringUtil::Upper(level);
	if (upper == "TRACE") {
		return LogLevel::LOG_TRACE;
	} else if (upper == "DEBUG") {
		return LogLevel::LOG_DEBUG;
	} else if (upper == "INFO") {
		return LogLevel::LOG_INFO;
	} else if (upper == "WARN" || upper == "WARNING") {
		return LogLevel::LOG_WARN;
	} else if (upper == "ERROR") {
		return LogLevel::LOG_ERROR;
	} else if (upper == "FATAL") {
		return LogLevel::LOG_FATAL;
	}
	throw InvalidInputException("Unrecognized log level \"%s\", expected one of: trace, debug, info, warn, error, fatal",
	                            level);
}

LogConfig::LogConfig()
    : enabled(false), mode(LogMode::LEVEL_ONLY), level(DEFAULT_LOG_LEVEL), storage(DEFAULT_LOG_STORAGE) {
}

bool LogConfig::IsConsistent() const {
	if (mode == LogMode::LEVEL_ONLY) {
		return enabled_log_types.empty() && disabled_log_types.empty();
	}
	if (mode == LogMode::DISABLE_SELECTED) {
		return enabled_log_types.empty() && !disabled_log_types.empty();
	}
	if (mode == LogMode::ENABLE_SELECTED) {
		return !enabled_log_types.empty() && disabled_log_types.empty();
	}
	return false;
}

LogConfig LogConfig::Create(bool enabled, LogLevel level) {
	return LogConfig(enabled, level, LogMode::LEVEL_ONLY, {}, {});
}

LogConfig LogConfig::CreateFromEnabled(bool enabled, LogLevel level, std::unordered_set<string> enabled_log_types) {
	return LogConfig(enabled, level, LogMode::ENABLE_SELECTED, std::move(enabled_log_types), {});
}

LogConfig LogConfig::CreateFromDisabled(bool enabled, LogLevel level, std::unordered_set<string> disabled_log_types) {
	return LogConfig(enabled, level, LogMode::DISABLE_SELECTED, {}, std::move(disabled_log_types));
}

LogConfig::LogConfig(bool enabled, LogLevel level_p, LogMode mode_p, std::unordered_set<string> enabled_log_types_p,
                     std::unordered_set<string> disabled_log_types_p)
    : enabled(enabled), mode(mode_p), level(level_p), storage(DEFAULT_LOG_STORAGE),
      enabled_log_types(std::move(enabled_log_types_p)), disabled_log_types(std::move(disabled_log_types_p)) {
}

} // namespace sqlcmp
