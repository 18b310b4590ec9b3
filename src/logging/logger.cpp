#include "sqlcmp/logging/logger.hpp"

#include "sqlcmp/common/types/timestamp.hpp"
#include "sqlcmp/execution/comparison_compiler.hpp"
#include "sqlcmp/logging/log_manager.hpp"

namespace sqlcmp {

void Logger::WriteLog(const char *log_type, LogLevel log_level, const string &message) {
	WriteLog(log_type, log_level, message.c_str());
}

Logger &Logger::Get(const ComparisonCompiler &compiler) {
	return compiler.GetLogger();
}

ThreadSafeLogger::ThreadSafeLogger(LogConfig config_p, LogManager &manager)
    : Logger(manager), config(std::move(config_p)) {
	// NopLogger should be used instead
	D_ASSERT(config.enabled);
}

bool ThreadSafeLogger::ShouldLog(const char *log_type, LogLevel log_level) {
	if (config.level > log_level) {
		return false;
	}
	if (config.mode == LogMode::ENABLE_SELECTED) {
		return config.enabled_log_types.find(log_type) != config.enabled_log_types.end();
	}
	if (config.mode == LogMode::DISABLE_SELECTED) {
		return config.disabled_log_types.find(log_type) == config.disabled_log_types.end();
	}
	return true;
}

void ThreadSafeLogger::WriteLog(const char *log_type, LogLevel log_level, const char *log_message) {
	manager.WriteLogEntry(Timestamp::GetCurrentTimestamp(), log_type, log_level, log_message);
}

void ThreadSafeLogger::Flush() {
	manager.Flush();
}

} // namespace sqlcmp
