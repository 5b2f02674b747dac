#include "datastore.h"
#include "logger.h"

#define LOG_STORE_DEBUG(message) LOG_DEBUG("store", message)

namespace kaddht {

const char* datastore_status_to_string(DatastoreStatus status) {
    switch (status) {
        case DatastoreStatus::Ok:       return "ok";
        case DatastoreStatus::NotFound: return "not found";
        case DatastoreStatus::Error:    return "error";
    }
    return "unknown";
}

DatastoreStatus MemoryDatastore::get(const std::string& key, std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return DatastoreStatus::NotFound;
    }
    value = it->second;
    return DatastoreStatus::Ok;
}

DatastoreStatus MemoryDatastore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
    LOG_STORE_DEBUG("Stored " << value.size() << " bytes under " << key);
    return DatastoreStatus::Ok;
}

DatastoreStatus MemoryDatastore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(key) == 0) {
        return DatastoreStatus::NotFound;
    }
    LOG_STORE_DEBUG("Removed " << key);
    return DatastoreStatus::Ok;
}

DatastoreStatus MemoryDatastore::has(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) ? DatastoreStatus::Ok : DatastoreStatus::NotFound;
}

size_t MemoryDatastore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> MemoryDatastore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace kaddht
