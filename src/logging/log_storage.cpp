#include "sqlcmp/logging/log_storage.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/printer.hpp"

#include "fmt/format.h"

namespace sqlcmp {

LogEntry::LogEntry(timestamp_t timestamp_p, string log_type_p, LogLevel level_p, string message_p)
    : timestamp(timestamp_p), log_type(std::move(log_type_p)), level(level_p), message(std::move(message_p)) {
}

void LogStorage::Truncate() {
	throw NotImplementedException("Not implemented for this LogStorage: TruncateLogStorage");
}

StdOutLogStorage::StdOutLogStorage() {
}

StdOutLogStorage::~StdOutLogStorage() {
}

void StdOutLogStorage::WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
                                     const string &log_message) {
	Printer::RawPrint(OutputStream::STREAM_STDOUT, fmt::format("{}\t{}\t{}\t{}\n", Timestamp::ToString(timestamp),
	                                                           log_type, LogLevelToString(level), log_message));
}

void StdOutLogStorage::Flush() {
	Printer::Flush(OutputStream::STREAM_STDOUT);
}

InMemoryLogStorage::InMemoryLogStorage() {
}

InMemoryLogStorage::~InMemoryLogStorage() {
}

void InMemoryLogStorage::WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
                                       const string &log_message) {
	std::lock_guard<std::mutex> lck(lock);
	entries.emplace_back(timestamp, log_type, level, log_message);
}

void InMemoryLogStorage::Flush() {
	// NOP
}

void InMemoryLogStorage::Truncate() {
	std::lock_guard<std::mutex> lck(lock);
	entries.clear();
}

vector<LogEntry> InMemoryLogStorage::GetEntries() const {
	std::lock_guard<std::mutex> lck(lock);
	return entries;
}

idx_t InMemoryLogStorage::GetEntryCount() const {
	std::lock_guard<std::mutex> lck(lock);
	return entries.size();
}

} // namespace sqlcmp
