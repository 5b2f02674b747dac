#pragma once

#include "kaddht_export.h"
#include <string>
#include <vector>
#include <map>
#include <mutex>

namespace kaddht {

/**
 * Outcome of a datastore call
 */
enum class DatastoreStatus {
    Ok,
    NotFound,
    Error
};

KADDHT_API const char* datastore_status_to_string(DatastoreStatus status);

/**
 * Key-value persistence used by the responder. Implementations must be safe
 * for concurrent use and make a completed put visible to subsequent gets.
 */
class KADDHT_API Datastore {
public:
    virtual ~Datastore() = default;

    virtual DatastoreStatus get(const std::string& key, std::string& value) = 0;
    virtual DatastoreStatus put(const std::string& key, const std::string& value) = 0;
    virtual DatastoreStatus remove(const std::string& key) = 0;

    /**
     * @return Ok if present, NotFound if absent, Error on failure
     */
    virtual DatastoreStatus has(const std::string& key) = 0;
};

/**
 * Thread-safe in-memory datastore
 */
class KADDHT_API MemoryDatastore : public Datastore {
public:
    MemoryDatastore() = default;

    DatastoreStatus get(const std::string& key, std::string& value) override;
    DatastoreStatus put(const std::string& key, const std::string& value) override;
    DatastoreStatus remove(const std::string& key) override;
    DatastoreStatus has(const std::string& key) override;

    size_t size() const;
    std::vector<std::string> keys() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> entries_;
};

} // namespace kaddht
