//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/logging/logger.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"
#include "sqlcmp/common/string_util.hpp"
#include "sqlcmp/logging/logging.hpp"

namespace sqlcmp {

class ComparisonCompiler;
class LogManager;

//! Main logging interface
class Logger {
public:
	explicit Logger(LogManager &manager) : manager(manager) {
	}
	virtual ~Logger() {
	}

	//! Main Logger API
	virtual bool ShouldLog(const char *log_type, LogLevel log_level) = 0;
	virtual void WriteLog(const char *log_type, LogLevel log_level, const char *message) = 0;
	void WriteLog(const char *log_type, LogLevel log_level, const string &message);

	//! Format the message before writing it; only call after ShouldLog returned true
	template <typename... ARGS>
	void WriteLog(const char *log_type, LogLevel log_level, const char *format_string, ARGS... params) {
		auto formatted_string = StringUtil::Format(format_string, params...);
		WriteLog(log_type, log_level, formatted_string.c_str());
	}

	virtual void Flush() = 0;

	//! Get the Logger to write log messages to
	static Logger &Get(Logger &logger) {
		return logger;
	}
	static Logger &Get(const ComparisonCompiler &compiler);

protected:
	LogManager &manager;
};

//! Logger that writes every entry that passes the configured filters to the log manager.
//! The configuration is copied on construction; create a new logger to pick up configuration changes.
class ThreadSafeLogger : public Logger {
public:
	ThreadSafeLogger(LogConfig config_p, LogManager &manager);

	bool ShouldLog(const char *log_type, LogLevel log_level) override;
	void WriteLog(const char *log_type, LogLevel log_level, const char *log_message) override;
	void Flush() override;

protected:
	const LogConfig config;
};

//! Logger that discards everything, used when logging is disabled
class NopLogger : public Logger {
public:
	explicit NopLogger(LogManager &manager) : Logger(manager) {
	}
	bool ShouldLog(const char *log_type, LogLevel log_level) override {
		return false;
	}
	void WriteLog(const char *log_type, LogLevel log_level, const char *log_message) override {
	}
	void Flush() override {
	}
};

} // namespace sqlcmp

//===--------------------------------------------------------------------===//
// Logging macros
//===--------------------------------------------------------------------===//
// The message is only formatted when the logger accepts the entry

#define SQLCMP_LOG_INTERNAL(SOURCE, LOG_TYPE_STRING, LOG_LEVEL, ...)                                                   \
	{                                                                                                                  \
		auto &logger_internal = sqlcmp::Logger::Get(SOURCE);                                                           \
		if (logger_internal.ShouldLog(LOG_TYPE_STRING, LOG_LEVEL)) {                                                   \
			logger_internal.WriteLog(LOG_TYPE_STRING, LOG_LEVEL, __VA_ARGS__);                                         \
		}                                                                                                              \
	}

#define SQLCMP_LOG_TRACE(SOURCE, LOG_TYPE, ...)                                                                        \
	SQLCMP_LOG_INTERNAL(SOURCE, LOG_TYPE, sqlcmp::LogLevel::LOG_TRACE, __VA_ARGS__)
#define SQLCMP_LOG_DEBUG(SOURCE, LOG_TYPE, ...)                                                                        \
	SQLCMP_LOG_INTERNAL(SOURCE, LOG_TYPE, sqlcmp::LogLevel::LOG_DEBUG, __VA_ARGS__)
#define SQLCMP_LOG_INFO(SOURCE, LOG_TYPE, ...)                                                                         \
	SQLCMP_LOG_INTERNAL(SOURCE, LOG_TYPE, sqlcmp::LogLevel::LOG_INFO, __VA_ARGS__)
#define SQLCMP_LOG_WARN(SOURCE, LOG_TYPE, ...)                                                                         \
	SQLCMP_LOG_INTERNAL(SOURCE, LOG_TYPE, sqlcmp::LogLevel::LOG_WARN, __VA_ARGS__)
