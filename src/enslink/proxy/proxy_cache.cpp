#include <enslink/proxy/proxy_cache.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace enslink::proxy {

    ProxyCache::ProxyCache(size_t ceiling) : ceiling_(ceiling) {}

    ProxyPtr ProxyCache::find(int64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(id);
        return it == handles_.end() ? nullptr : it->second;
    }

    ProxyPtr ProxyCache::insert(ProxyPtr handle) {
        if (!handle) {
            throw std::invalid_argument("Cannot cache a null proxy handle");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return handles_.emplace(handle->id, handle).first->second;
    }

    bool ProxyCache::prune() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handles_.size() <= ceiling_) {
            return false;
        }
        spdlog::debug("Proxy cache flushed at {} entries", handles_.size());
        handles_.clear();
        return true;
    }

    size_t ProxyCache::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handles_.size();
    }

    void ProxyCache::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        handles_.clear();
    }

} // namespace enslink::proxy
