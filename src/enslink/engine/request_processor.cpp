#include <enslink/engine/request_processor.hpp>
#include <enslink/rpc/channel.hpp>
#include <enslink/rpc/codec.hpp>

#include "ensight.pb.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace enslink::engine {

    namespace {

        // Messages queued for one open event stream
        struct Subscription {
            std::string prefix;
            std::deque<std::vector<uint8_t>> messages;
            bool closed{false};
            std::mutex mutex;
            std::condition_variable cv;

            void push(std::vector<uint8_t> message) {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (closed) {
                        return;
                    }
                    messages.push_back(std::move(message));
                }
                cv.notify_one();
            }

            void close() {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    closed = true;
                }
                cv.notify_all();
            }
        };

        class QueueEventReader : public rpc::EventReader {
          public:
            explicit QueueEventReader(std::shared_ptr<Subscription> subscription)
                : subscription_(std::move(subscription)) {}

            ~QueueEventReader() override { subscription_->close(); }

            Result<std::vector<uint8_t>> read() override {
                std::unique_lock<std::mutex> lock(subscription_->mutex);
                subscription_->cv.wait(lock,
                                       [this] { return subscription_->closed || !subscription_->messages.empty(); });
                // Queued messages are delivered before the end of stream
                if (!subscription_->messages.empty()) {
                    auto message = std::move(subscription_->messages.front());
                    subscription_->messages.pop_front();
                    return Result<std::vector<uint8_t>>::ok(std::move(message));
                }
                return Result<std::vector<uint8_t>>::io_error("Event stream closed");
            }

            void cancel() override { subscription_->close(); }

          private:
            std::shared_ptr<Subscription> subscription_;
        };

        rpc::ExecMode to_exec_mode(ensightservice::PythonRequest::ExecType type) {
            switch (type) {
            case ensightservice::PythonRequest::EXEC_RETURN_PYTHON:
                return rpc::ExecMode::Evaluated;
            case ensightservice::PythonRequest::EXEC_RETURN_JSON:
                return rpc::ExecMode::Structured;
            default:
                return rpc::ExecMode::NoResult;
            }
        }

        constexpr const char *UNAVAILABLE = "Engine unavailable";

    } // namespace

    class RequestProcessor::Impl {
      public:
        std::shared_ptr<Handler> handler;
        std::string security_token;
        bool available{true};

        std::vector<std::weak_ptr<Subscription>> subscriptions;
        rpc::Metadata last_metadata;

        RequestProcessor::Stats stats;
        mutable std::mutex mutex;

        Impl(std::shared_ptr<Handler> h, std::string token) : handler(std::move(h)), security_token(std::move(token)) {
            stats.start_time = std::chrono::system_clock::now();
        }

        // Records the metadata and checks the shared secret
        bool admit(const rpc::Metadata &metadata) {
            std::lock_guard<std::mutex> lock(mutex);
            last_metadata = metadata;
            if (security_token.empty()) {
                return true;
            }
            bool authorized = std::any_of(metadata.begin(), metadata.end(), [this](const auto &entry) {
                return entry.first == rpc::SHARED_SECRET_KEY && entry.second == security_token;
            });
            if (!authorized) {
                stats.rejected_requests++;
            }
            return authorized;
        }

        void prune_subscriptions() {
            subscriptions.erase(std::remove_if(subscriptions.begin(), subscriptions.end(),
                                               [](const std::weak_ptr<Subscription> &s) { return s.expired(); }),
                                subscriptions.end());
        }

        Result<std::vector<uint8_t>> handle_python(const std::vector<uint8_t> &request_data);
        Result<std::vector<uint8_t>> handle_render(const std::vector<uint8_t> &request_data);
        Result<std::vector<uint8_t>> handle_geometry(const std::vector<uint8_t> &request_data);
        Result<std::vector<uint8_t>> handle_exit();
    };

    Result<std::vector<uint8_t>> RequestProcessor::Impl::handle_python(const std::vector<uint8_t> &request_data) {
        ensightservice::PythonRequest request;
        if (!rpc::codec::decode(request_data, request)) {
            return Result<std::vector<uint8_t>>::io_error("Failed to deserialize PythonRequest");
        }

        auto outcome = handler->run_python(to_exec_mode(request.type()), request.command());
        {
            std::lock_guard<std::mutex> lock(mutex);
            stats.python_requests++;
        }

        ensightservice::PythonReply reply;
        reply.set_error(outcome.error);
        reply.set_value(outcome.value);
        return Result<std::vector<uint8_t>>::ok(rpc::codec::encode(reply));
    }

    Result<std::vector<uint8_t>> RequestProcessor::Impl::handle_render(const std::vector<uint8_t> &request_data) {
        ensightservice::RenderRequest request;
        if (!rpc::codec::decode(request_data, request)) {
            return Result<std::vector<uint8_t>>::io_error("Failed to deserialize RenderRequest");
        }

        rpc::RenderOptions options;
        options.width = request.image_width();
        options.height = request.image_height();
        options.aa_passes = request.image_aa_passes();
        options.png = request.type() == ensightservice::RenderRequest::IMAGE_PNG;
        options.highlighting = request.include_highlighting();

        auto image = handler->render(options);
        {
            std::lock_guard<std::mutex> lock(mutex);
            stats.render_requests++;
        }

        ensightservice::RenderReply reply;
        reply.set_value(std::string(image.begin(), image.end()));
        return Result<std::vector<uint8_t>>::ok(rpc::codec::encode(reply));
    }

    Result<std::vector<uint8_t>> RequestProcessor::Impl::handle_geometry(const std::vector<uint8_t> &request_data) {
        ensightservice::GeometryRequest request;
        if (!rpc::codec::decode(request_data, request)) {
            return Result<std::vector<uint8_t>>::io_error("Failed to deserialize GeometryRequest");
        }

        auto scene = handler->geometry();
        {
            std::lock_guard<std::mutex> lock(mutex);
            stats.geometry_requests++;
        }

        ensightservice::GeometryReply reply;
        reply.set_value(std::string(scene.begin(), scene.end()));
        return Result<std::vector<uint8_t>>::ok(rpc::codec::encode(reply));
    }

    Result<std::vector<uint8_t>> RequestProcessor::Impl::handle_exit() {
        handler->exit();
        {
            std::lock_guard<std::mutex> lock(mutex);
            stats.exit_requests++;
        }
        ensightservice::ExitReply reply;
        return Result<std::vector<uint8_t>>::ok(rpc::codec::encode(reply));
    }

    RequestProcessor::RequestProcessor(std::shared_ptr<Handler> handler, std::string security_token) {
        if (!handler) {
            throw std::invalid_argument("RequestProcessor requires a handler");
        }
        impl_ = std::make_unique<Impl>(std::move(handler), std::move(security_token));
    }

    RequestProcessor::~RequestProcessor() { disconnect_streams(); }

    Result<std::vector<uint8_t>> RequestProcessor::process(const std::string &method,
                                                           const std::vector<uint8_t> &request,
                                                           const rpc::Metadata &metadata) {
        if (!is_available()) {
            return Result<std::vector<uint8_t>>::io_error(UNAVAILABLE);
        }
        if (!impl_->admit(metadata)) {
            return Result<std::vector<uint8_t>>::io_error("Unauthenticated");
        }

        if (method == rpc::methods::RUN_PYTHON) {
            return impl_->handle_python(request);
        }
        if (method == rpc::methods::RENDER_IMAGE) {
            return impl_->handle_render(request);
        }
        if (method == rpc::methods::GET_GEOMETRY) {
            return impl_->handle_geometry(request);
        }
        if (method == rpc::methods::EXIT) {
            auto reply = impl_->handle_exit();
            disconnect_streams();
            return reply;
        }
        return Result<std::vector<uint8_t>>::io_error("Unimplemented method: " + method);
    }

    Result<std::unique_ptr<rpc::EventReader>> RequestProcessor::open_stream(const std::string &method,
                                                                            const std::vector<uint8_t> &request,
                                                                            const rpc::Metadata &metadata) {
        using StreamResult = Result<std::unique_ptr<rpc::EventReader>>;

        if (!is_available()) {
            return StreamResult::io_error(UNAVAILABLE);
        }
        if (!impl_->admit(metadata)) {
            return StreamResult::io_error("Unauthenticated");
        }
        if (method != rpc::methods::GET_EVENT_STREAM) {
            return StreamResult::io_error("Unimplemented method: " + method);
        }

        ensightservice::EventStreamRequest stream_request;
        if (!rpc::codec::decode(request, stream_request)) {
            return StreamResult::io_error("Failed to deserialize EventStreamRequest");
        }

        auto subscription = std::make_shared<Subscription>();
        subscription->prefix = stream_request.prefix();
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            impl_->prune_subscriptions();
            impl_->subscriptions.push_back(subscription);
            impl_->stats.stream_opens++;
        }
        spdlog::debug("Event stream opened for {}", subscription->prefix);
        return StreamResult::ok(std::make_unique<QueueEventReader>(std::move(subscription)));
    }

    size_t RequestProcessor::publish(const std::string &url) {
        std::vector<std::shared_ptr<Subscription>> targets;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            for (const auto &weak : impl_->subscriptions) {
                auto subscription = weak.lock();
                if (subscription && url.compare(0, subscription->prefix.size(), subscription->prefix) == 0) {
                    targets.push_back(std::move(subscription));
                }
            }
            impl_->stats.published_events++;
        }

        ensightservice::EventReply reply;
        reply.set_tag(url);
        const auto message = rpc::codec::encode(reply);
        for (auto &subscription : targets) {
            subscription->push(message);
        }
        return targets.size();
    }

    void RequestProcessor::disconnect_streams() {
        std::vector<std::weak_ptr<Subscription>> subscriptions;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            subscriptions.swap(impl_->subscriptions);
        }
        for (auto &weak : subscriptions) {
            if (auto subscription = weak.lock()) {
                subscription->close();
            }
        }
    }

    size_t RequestProcessor::stream_count() const {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        size_t count = 0;
        for (const auto &weak : impl_->subscriptions) {
            auto subscription = weak.lock();
            if (!subscription) {
                continue;
            }
            std::lock_guard<std::mutex> sub_lock(subscription->mutex);
            if (!subscription->closed) {
                ++count;
            }
        }
        return count;
    }

    void RequestProcessor::set_available(bool available) {
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            impl_->available = available;
        }
        if (!available) {
            disconnect_streams();
        }
    }

    bool RequestProcessor::is_available() const {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        return impl_->available;
    }

    const std::shared_ptr<Handler> &RequestProcessor::handler() const { return impl_->handler; }

    RequestProcessor::Stats RequestProcessor::get_stats() const {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        return impl_->stats;
    }

    rpc::Metadata RequestProcessor::last_metadata() const {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        return impl_->last_metadata;
    }

} // namespace enslink::engine
