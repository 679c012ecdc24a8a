#include <enslink/events/callback_registry.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace enslink::events {

    namespace {
        constexpr const char *STREAM_SUFFIX = "?enum=";
        constexpr const char *STREAM_SUFFIX_JOINED = "&enum=";
    } // namespace

    std::string CallbackRegistry::short_tag(const std::string &tag) {
        auto idx = tag.find('?');
        return idx == std::string::npos ? tag : tag.substr(0, idx);
    }

    std::string CallbackRegistry::normalize_notification(const std::string &url) {
        const auto first_query = url.find('?');
        const auto suffix = url.find(STREAM_SUFFIX);
        if (suffix == std::string::npos || first_query >= suffix) {
            return url;
        }

        std::string result = url;
        const std::string from = STREAM_SUFFIX;
        const std::string to = STREAM_SUFFIX_JOINED;
        size_t pos = 0;
        while ((pos = result.find(from, pos)) != std::string::npos) {
            result.replace(pos, from.size(), to);
            pos += to.size();
        }
        return result;
    }

    std::string CallbackRegistry::notification_tag(const std::string &url) {
        size_t path_begin = 0;
        const auto scheme = url.find("://");
        if (scheme != std::string::npos) {
            path_begin = url.find('/', scheme + 3);
            if (path_begin == std::string::npos) {
                return {};
            }
        }

        auto path_end = url.find_first_of("?#", path_begin);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        std::string path = url.substr(path_begin, path_end - path_begin);
        if (!path.empty() && path.front() == '/') {
            path.erase(0, 1);
        }
        return path;
    }

    Result<void> CallbackRegistry::add(CallbackRegistration registration) {
        registration.short_tag = short_tag(registration.tag);

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &existing : registrations_) {
            if (existing.short_tag == registration.short_tag) {
                return Result<void>::precondition("A callback for tag '" + registration.short_tag +
                                                  "' already exists");
            }
        }
        registrations_.push_back(std::move(registration));
        return Result<void>::ok();
    }

    Result<CallbackRegistration> CallbackRegistry::remove(const std::string &tag) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(registrations_.begin(), registrations_.end(),
                               [&](const CallbackRegistration &r) { return r.short_tag == tag; });
        if (it == registrations_.end()) {
            return Result<CallbackRegistration>::precondition("A callback for tag '" + tag + "' does not exist");
        }
        CallbackRegistration removed = std::move(*it);
        registrations_.erase(it);
        return Result<CallbackRegistration>::ok(std::move(removed));
    }

    bool CallbackRegistry::contains(const std::string &tag) const { return find(tag).has_value(); }

    std::optional<CallbackRegistration> CallbackRegistry::find(const std::string &tag) const {
        const auto key = short_tag(tag);
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &registration : registrations_) {
            if (registration.short_tag == key) {
                return registration;
            }
        }
        return std::nullopt;
    }

    size_t CallbackRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return registrations_.size();
    }

    bool CallbackRegistry::dispatch(const std::string &url) const {
        const std::string normalized = normalize_notification(url);
        const std::string fired = notification_tag(normalized);

        // Copy the callable so it runs without holding the lock
        Callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &registration : registrations_) {
                if (fired.compare(0, registration.short_tag.size(), registration.short_tag) == 0) {
                    callback = registration.callback;
                    break;
                }
            }
        }

        if (!callback) {
            spdlog::warn("Unhandled event: {}", normalized);
            return false;
        }
        callback(normalized);
        return true;
    }

} // namespace enslink::events
