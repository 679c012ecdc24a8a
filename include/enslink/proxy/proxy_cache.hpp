#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

#include <enslink/proxy/proxy_handle.hpp>

namespace enslink::proxy {

    // Session-scoped identity map: at most one handle per remote id.
    // Flushed wholesale once it grows past the ceiling.
    class ProxyCache {
      public:
        static constexpr size_t DEFAULT_CEILING = 1000000;

        explicit ProxyCache(size_t ceiling = DEFAULT_CEILING);

        ProxyCache(const ProxyCache &) = delete;
        ProxyCache &operator=(const ProxyCache &) = delete;

        ProxyPtr find(int64_t id) const;

        // Returns the handle already cached for handle->id when there is one
        ProxyPtr insert(ProxyPtr handle);

        // Drop every entry when size() exceeds the ceiling; true if flushed
        bool prune();

        size_t size() const;
        size_t ceiling() const { return ceiling_; }
        void clear();

      private:
        size_t ceiling_;
        std::unordered_map<int64_t, ProxyPtr> handles_;
        mutable std::mutex mutex_;
    };

} // namespace enslink::proxy
