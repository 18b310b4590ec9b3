//===----------------------------------------------------------------------===//
//                         sqlcmp
//
// sqlcmp/logging/log_storage.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sqlcmp/common/common.hpp"
#include "sqlcmp/common/types/timestamp.hpp"
#include "sqlcmp/logging/logging.hpp"

#include <mutex>

namespace sqlcmp {

struct LogEntry {
	LogEntry(timestamp_t timestamp, string log_type, LogLevel level, string message);

	timestamp_t timestamp;
	string log_type;
	LogLevel level;
	string message;
};

//! Interface for writing log entries
class LogStorage {
public:
	LogStorage() {
	}
	virtual ~LogStorage() {
	}

	//! LogStorage API: WRITING
	virtual void WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
	                           const string &log_message) = 0;
	virtual void Flush() = 0;

	//! LogStorage API: READING
	virtual bool CanScan() {
		return false;
	}
	//! Remove all stored entries
	virtual void Truncate();
};

class StdOutLogStorage : public LogStorage {
public:
	StdOutLogStorage();
	~StdOutLogStorage() override;

	void WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
	                   const string &log_message) override;
	void Flush() override;
};

//! Keeps every entry in memory so that it can be inspected
class InMemoryLogStorage : public LogStorage {
public:
	InMemoryLogStorage();
	~InMemoryLogStorage() override;

	void WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
	                   const string &log_message) override;
	void Flush() override;
	void Truncate() override;

	bool CanScan() override {
		return true;
	}
	//! A snapshot of the stored entries, in the order they were written
	vector<LogEntry> GetEntries() const;
	idx_t GetEntryCount() const;

private:
	mutable std::mutex lock;
	vector<LogEntry> entries;
};

} // namespace sqlcmp
