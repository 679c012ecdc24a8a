#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <enslink/rpc/executor.hpp>
#include <enslink/utils/result.hpp>

namespace enslink::events {

    enum class StreamState { Idle, Starting, Active, Closed, Broken };

    const char *to_string(StreamState state);

    // Event stream
    // One background reader per enable(). Each notification is offered to the listener on the
    // reader thread; whatever the listener does not handle is queued FIFO for get_event().
    // The listener may call enable() and close() on its own stream.
    class EventStream {
      public:
        using Listener = std::function<bool(const std::string &url)>; // true: handled

        EventStream(rpc::Executor &executor, std::string prefix);
        ~EventStream();

        EventStream(const EventStream &) = delete;
        EventStream &operator=(const EventStream &) = delete;

        // No-op while Starting or Active, and when called from the reader thread.
        // Otherwise opens the stream and starts the reader.
        Result<void> enable(Listener listener = nullptr);

        // Starting or Active
        bool is_enabled() const;
        StreamState state() const;

        // Oldest queued notification, removed from the queue
        std::optional<std::string> get_event();
        size_t pending() const;

        // Cancel the stream and join the reader. From the reader thread the stream is only
        // cancelled; the reader exits once the listener returns and is joined later.
        void close();

        const std::string &prefix() const { return prefix_; }

      private:
        // State shared with the reader thread, which never touches the EventStream itself
        struct Feed {
            StreamState state{StreamState::Idle};
            std::deque<std::string> queue;
            std::shared_ptr<rpc::NotificationStream> stream;
            std::thread::id reader; // set while a reader loop runs
            std::mutex mutex;
        };

        static void run(std::shared_ptr<Feed> feed, std::string prefix,
                        std::shared_ptr<rpc::NotificationStream> stream, Listener listener);

        bool on_reader_thread() const;

        rpc::Executor &executor_;
        std::string prefix_;
        std::shared_ptr<Feed> feed_;

        std::thread reader_;
        std::mutex lifecycle_mutex_; // serializes enable(); guards reader_
    };

} // namespace enslink::events
