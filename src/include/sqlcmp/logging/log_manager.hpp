//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/logging/log_manager.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"
#include "sqlcmp/logging/log_storage.hpp"
#include "sqlcmp/logging/logger.hpp"

#include <mutex>
#include <unordered_map>

namespace sqlcmp {

//! The LogManager holds the log configuration and the storage that log entries are written to.
//! Loggers created by the manager funnel their entries through WriteLogEntry.
class LogManager {
	friend class ThreadSafeLogger;

public:
	explicit LogManager(LogConfig config = LogConfig());
	~LogManager();

	//! Create a logger for the current configuration
	unique_ptr<Logger> CreateLogger();

	void Flush();
	shared_ptr<LogStorage> GetLogStorage();
	//! Select "memory" or "stdout" storage, or a storage registered under that name
	void SetLogStorage(const string &storage_name);
	bool RegisterLogStorage(const string &name, shared_ptr<LogStorage> storage);
	void TruncateLogStorage();

	void SetConfig(LogConfig config);
	LogConfig GetConfig();

protected:
	void WriteLogEntry(timestamp_t timestamp, const char *log_type, LogLevel log_level, const char *log_message);

private:
	std::mutex lock;
	LogConfig config;
	shared_ptr<LogStorage> log_storage;
	std::unordered_map<string, shared_ptr<LogStorage>> registered_log_storages;
};

} // namespace sqlcmp
