#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <enslink/utils/result.hpp>

namespace enslink::events {

    using Callback = std::function<void(const std::string &url)>;

    struct CallbackRegistration {
        std::string short_tag; // dedup key: tag up to its first '?'
        std::string tag;       // as registered, may carry {{Attribute}} macros
        std::string remote_id; // opaque id returned by the engine
        std::vector<std::string> attributes;
        Callback callback;
        bool compress{true};
    };

    // Callback registry
    // Maps short tags to local callbacks. Notifications are matched by prefix in registration order.
    class CallbackRegistry {
      public:
        CallbackRegistry() = default;

        CallbackRegistry(const CallbackRegistry &) = delete;
        CallbackRegistry &operator=(const CallbackRegistry &) = delete;

        static std::string short_tag(const std::string &tag);

        // Rewrite a second '?' that precedes the stream's own "?enum=" suffix into '&'
        static std::string normalize_notification(const std::string &url);

        // Path of the notification URL without its leading '/'
        static std::string notification_tag(const std::string &url);

        // Precondition failure when the short tag is already registered
        Result<void> add(CallbackRegistration registration);

        // Removes and returns the registration for this exact short tag; Precondition failure otherwise
        Result<CallbackRegistration> remove(const std::string &tag);

        bool contains(const std::string &tag) const;
        std::optional<CallbackRegistration> find(const std::string &tag) const;

        size_t size() const;
        bool empty() const { return size() == 0; }

        // Invoke the first matching callback with the normalized URL; false when unhandled
        bool dispatch(const std::string &url) const;

      private:
        std::vector<CallbackRegistration> registrations_;
        mutable std::mutex mutex_;
    };

} // namespace enslink::events
