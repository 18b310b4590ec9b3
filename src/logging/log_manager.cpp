#include "sqlcmp/logging/log_manager.hpp"

#include "sqlcmp/common/exception.hpp"
#include "sqlcmp/common/string_util.hpp"

namespace sqlcmp {

LogManager::LogManager(LogConfig config_p) : config(std::move(config_p)) {
	auto storage_name = config.storage;
	config.storage = LogConfig::IN_MEMORY_STORAGE_NAME;
	log_storage = make_shared_ptr<InMemoryLogStorage>();
	SetLogStorage(storage_name);
}

LogManager::~LogManager() {
}

unique_ptr<Logger> LogManager::CreateLogger() {
	std::unique_lock<std::mutex> lck(lock);
	if (!config.enabled) {
		return make_uniq<NopLogger>(*this);
	}
	return make_uniq<ThreadSafeLogger>(config, *this);
}

bool LogManager::RegisterLogStorage(const string &name, shared_ptr<LogStorage> storage) {
	std::unique_lock<std::mutex> lck(lock);
	auto lname = StringUtil::Lower(name);
	if (registered_log_storages.find(lname) != registered_log_storages.end()) {
		return false;
	}
	registered_log_storages.insert(std::make_pair(lname, std::move(storage)));
	return true;
}

void LogManager::Flush() {
	std::unique_lock<std::mutex> lck(lock);
	log_storage->Flush();
}

shared_ptr<LogStorage> LogManager::GetLogStorage() {
	std::unique_lock<std::mutex> lck(lock);
	return log_storage;
}

void LogManager::WriteLogEntry(timestamp_t timestamp, const char *log_type, LogLevel log_level,
                               const char *log_message) {
	std::unique_lock<std::mutex> lck(lock);
	log_storage->WriteLogEntry(timestamp, log_level, log_type, log_message);
}

void LogManager::SetLogStorage(const string &storage_name) {
	std::unique_lock<std::mutex> lck(lock);
	auto storage_name_to_lower = StringUtil::Lower(storage_name);

	if (config.storage == storage_name_to_lower && log_storage) {
		return;
	}

	// Flush the old storage, we are going to replace it.
	log_storage->Flush();

	if (storage_name_to_lower == LogConfig::IN_MEMORY_STORAGE_NAME) {
		log_storage = make_shared_ptr<InMemoryLogStorage>();
	} else if (storage_name_to_lower == LogConfig::STDOUT_STORAGE_NAME) {
		log_storage = make_shared_ptr<StdOutLogStorage>();
	} else if (registered_log_storages.find(storage_name_to_lower) != registered_log_storages.end()) {
		log_storage = registered_log_storages[storage_name_to_lower];
	} else {
		throw InvalidInputException("Log storage '%s' is not yet registered", storage_name);
	}
	config.storage = storage_name_to_lower;
}

void LogManager::TruncateLogStorage() {
	std::unique_lock<std::mutex> lck(lock);
	log_storage->Truncate();
}

void LogManager::SetConfig(LogConfig new_config) {
	// switch the storage first: an unknown storage leaves the configuration untouched
	SetLogStorage(new_config.storage);
	std::unique_lock<std::mutex> lck(lock);
	new_config.storage = config.storage;
	config = std::move(new_config);
}

LogConfig LogManager::GetConfig() {
	std::unique_lock<std::mutex> lck(lock);
	return config;
}

} // namespace sqlcmp
