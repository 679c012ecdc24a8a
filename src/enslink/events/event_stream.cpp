#include <enslink/events/event_stream.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace enslink::events {

    const char *to_string(StreamState state) {
        switch (state) {
        case StreamState::Idle:
            return "idle";
        case StreamState::Starting:
            return "starting";
        case StreamState::Active:
            return "active";
        case StreamState::Closed:
            return "closed";
        case StreamState::Broken:
            return "broken";
        }
        return "unknown";
    }

    EventStream::EventStream(rpc::Executor &executor, std::string prefix)
        : executor_(executor), prefix_(std::move(prefix)), feed_(std::make_shared<Feed>()) {}

    EventStream::~EventStream() {
        close();
        if (reader_.joinable()) {
            // Destroyed from its own listener; the reader holds only the feed and exits by itself
            reader_.detach();
        }
    }

    bool EventStream::on_reader_thread() const {
        std::lock_guard<std::mutex> lock(feed_->mutex);
        return feed_->reader == std::this_thread::get_id();
    }

    Result<void> EventStream::enable(Listener listener) {
        {
            std::lock_guard<std::mutex> lock(feed_->mutex);
            if (feed_->state == StreamState::Starting || feed_->state == StreamState::Active) {
                return Result<void>::ok();
            }
            if (feed_->reader == std::this_thread::get_id()) {
                // The reader running this listener is on its way out
                spdlog::debug("Event stream {} is {}; enable ignored on its reader", prefix_,
                              to_string(feed_->state));
                return Result<void>::ok();
            }
        }

        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        {
            std::lock_guard<std::mutex> lock(feed_->mutex);
            if (feed_->state == StreamState::Starting || feed_->state == StreamState::Active) {
                return Result<void>::ok();
            }
        }

        // A previous reader has left, or is leaving, its loop
        if (reader_.joinable()) {
            reader_.join();
        }

        {
            std::lock_guard<std::mutex> lock(feed_->mutex);
            feed_->state = StreamState::Starting;
        }

        auto opened = executor_.open_event_stream(prefix_);
        if (!opened) {
            std::lock_guard<std::mutex> lock(feed_->mutex);
            if (feed_->state == StreamState::Starting) {
                feed_->state = StreamState::Broken;
            }
            spdlog::warn("Unable to open event stream {}: {}", prefix_, opened.error);
            return opened.error_as<void>();
        }

        std::shared_ptr<rpc::NotificationStream> stream(std::move(opened.value));
        {
            std::lock_guard<std::mutex> lock(feed_->mutex);
            if (feed_->state != StreamState::Starting) {
                spdlog::debug("Event stream {} closed while starting", prefix_);
                stream->cancel();
                return Result<void>::ok();
            }
            feed_->stream = stream;
            feed_->state = StreamState::Active;
        }
        reader_ = std::thread(&EventStream::run, feed_, prefix_, std::move(stream), std::move(listener));
        spdlog::debug("Event stream {} active", prefix_);
        return Result<void>::ok();
    }

    bool EventStream::is_enabled() const {
        std::lock_guard<std::mutex> lock(feed_->mutex);
        return feed_->state == StreamState::Starting || feed_->state == StreamState::Active;
    }

    StreamState EventStream::state() const {
        std::lock_guard<std::mutex> lock(feed_->mutex);
        return feed_->state;
    }

    std::optional<std::string> EventStream::get_event() {
        std::lock_guard<std::mutex> lock(feed_->mutex);
        if (feed_->queue.empty()) {
            return std::nullopt;
        }
        std::string event = std::move(feed_->queue.front());
        feed_->queue.pop_front();
        return event;
    }

    size_t EventStream::pending() const {
        std::lock_guard<std::mutex> lock(feed_->mutex);
        return feed_->queue.size();
    }

    void EventStream::close() {
        std::shared_ptr<rpc::NotificationStream> stream;
        {
            std::lock_guard<std::mutex> lock(feed_->mutex);
            if (feed_->state == StreamState::Starting || feed_->state == StreamState::Active) {
                feed_->state = StreamState::Closed;
            }
            stream.swap(feed_->stream);
        }
        if (stream) {
            stream->cancel();
        }
        if (on_reader_thread()) {
            return;
        }

        // Never join while holding the lifecycle lock
        std::thread reader;
        {
            std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
            reader = std::move(reader_);
        }
        if (reader.joinable()) {
            reader.join();
        }
    }

    void EventStream::run(std::shared_ptr<Feed> feed, std::string prefix,
                          std::shared_ptr<rpc::NotificationStream> stream, Listener listener) {
        {
            std::lock_guard<std::mutex> lock(feed->mutex);
            feed->reader = std::this_thread::get_id();
        }

        while (true) {
            auto next = stream->next();
            if (!next) {
                std::lock_guard<std::mutex> lock(feed->mutex);
                // Only the current stream can break the feed; a closed one was already swapped out
                if (feed->stream == stream) {
                    feed->stream.reset();
                    if (feed->state == StreamState::Active) {
                        feed->state = StreamState::Broken;
                        spdlog::warn("Event stream {} terminated: {}", prefix, next.error);
                    }
                }
                if (feed->reader == std::this_thread::get_id()) {
                    feed->reader = std::thread::id();
                }
                return;
            }

            bool handled = false;
            if (listener) {
                try {
                    handled = listener(next.value);
                } catch (const std::exception &e) {
                    spdlog::error("Event listener failed on {}: {}", next.value, e.what());
                    handled = true;
                }
            }

            if (!handled) {
                std::lock_guard<std::mutex> lock(feed->mutex);
                feed->queue.push_back(std::move(next.value));
            }
        }
    }

} // namespace enslink::events
