#pragma once

#include "network_block.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace asn2ip {

// Snapshot of one AS as last fetched. The fetched_* flags record which
// versions were asked for, whether or not any blocks came back.
struct CacheRecord {
    std::string asn;
    std::vector<NetworkBlock> ipv4;
    std::vector<NetworkBlock> ipv6;
    bool fetched_ipv4 = false;
    bool fetched_ipv6 = false;
    std::chrono::steady_clock::time_point inserted_at{};  // set by Storage::set
};

struct StorageOptions {
    std::string name;
    std::chrono::seconds ttl{86400};
};

class Storage {
public:
    virtual ~Storage() = default;

    // Empty optional when the AS is absent or its record expired.
    // Throws StorageError when the backend itself fails.
    virtual std::optional<CacheRecord> get(const std::string& asn) = 0;

    // Insert or replace, stamping the record with the current time
    virtual void set(CacheRecord record) = 0;
};

// Maps backend names to constructors
class StorageRegistry {
public:
    using Constructor = std::function<std::unique_ptr<Storage>(const StorageOptions&)>;

    // Comes with "", "default" and "memory" (all MemoryStorage)
    static StorageRegistry& instance();

    void register_backend(const std::string& name, Constructor ctor);
    bool has_backend(const std::string& name) const;
    std::vector<std::string> backend_names() const;

    // Throws StorageNotFoundError for an unregistered name
    std::unique_ptr<Storage> create(const StorageOptions& options) const;

private:
    StorageRegistry();

    mutable std::mutex mutex_;
    std::map<std::string, Constructor> backends_;
};

inline std::unique_ptr<Storage> create_storage(const StorageOptions& options) {
    return StorageRegistry::instance().create(options);
}

} // namespace asn2ip
