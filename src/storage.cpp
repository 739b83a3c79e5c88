#include "storage.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "memory_storage.hpp"

namespace asn2ip {

static std::unique_ptr<Storage> new_memory(const StorageOptions& options) {
    return std::make_unique<MemoryStorage>(options.ttl);
}

StorageRegistry::StorageRegistry() {
    backends_[""] = new_memory;
    backends_["default"] = new_memory;
    backends_["memory"] = new_memory;
}

StorageRegistry& StorageRegistry::instance() {
    static StorageRegistry registry;
    return registry;
}

void StorageRegistry::register_backend(const std::string& name, Constructor ctor) {
    std::lock_guard<std::mutex> lock(mutex_);
    backends_[name] = std::move(ctor);
}

bool StorageRegistry::has_backend(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backends_.count(name) > 0;
}

std::vector<std::string> StorageRegistry::backend_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : backends_) {
        names.push_back(entry.first);
    }
    return names;
}

std::unique_ptr<Storage> StorageRegistry::create(const StorageOptions& options) const {
    Constructor ctor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = backends_.find(options.name);
        if (it == backends_.end()) {
            throw StorageNotFoundError(options.name);
        }
        ctor = it->second;
    }

    log_debug("creating storage backend", {{"name", options.name},
                                           {"ttl", std::to_string(options.ttl.count()) + "s"}});
    auto storage = ctor(options);
    if (!storage) {
        throw StorageError("storage backend '" + options.name + "' failed to initialize");
    }
    return storage;
}

} // namespace asn2ip
