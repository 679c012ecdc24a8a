#include <enslink/engine/direct_transport.hpp>

#include <exception>
#include <thread>

namespace enslink::engine {

    namespace {
        constexpr std::chrono::milliseconds READY_POLL{5};
    } // namespace

    // Keeps a processor stream reachable for close() while the reader is alive
    struct DirectTransport::ReaderSlot {
        std::unique_ptr<rpc::EventReader> inner;
    };

    class DirectTransport::TrackedReader : public rpc::EventReader {
      public:
        explicit TrackedReader(std::shared_ptr<ReaderSlot> slot) : slot_(std::move(slot)) {}

        Result<std::vector<uint8_t>> read() override { return slot_->inner->read(); }
        void cancel() override { slot_->inner->cancel(); }

      private:
        std::shared_ptr<ReaderSlot> slot_;
    };

    DirectTransport::DirectTransport(std::shared_ptr<RequestProcessor> processor) : processor_(std::move(processor)) {}

    DirectTransport::~DirectTransport() { close(); }

    bool DirectTransport::wait_ready(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (is_closed() || !processor_) {
                return false;
            }
            if (processor_->is_available()) {
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(READY_POLL);
        }
    }

    Result<std::vector<uint8_t>> DirectTransport::call(const std::string &method, const std::vector<uint8_t> &request,
                                                       const rpc::Metadata &metadata) {
        if (!processor_) {
            return Result<std::vector<uint8_t>>::io_error("No processor configured");
        }
        if (is_closed()) {
            return Result<std::vector<uint8_t>>::io_error("Transport closed");
        }

        try {
            return processor_->process(method, request, metadata);
        } catch (const std::exception &e) {
            return Result<std::vector<uint8_t>>::io_error(e.what());
        }
    }

    Result<std::unique_ptr<rpc::EventReader>> DirectTransport::open_stream(const std::string &method,
                                                                           const std::vector<uint8_t> &request,
                                                                           const rpc::Metadata &metadata) {
        using StreamResult = Result<std::unique_ptr<rpc::EventReader>>;

        if (!processor_) {
            return StreamResult::io_error("No processor configured");
        }

        auto opened = processor_->open_stream(method, request, metadata);
        if (!opened) {
            return opened;
        }

        auto slot = std::make_shared<ReaderSlot>();
        slot->inner = std::move(opened.value);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return StreamResult::io_error("Transport closed");
            }
            readers_.push_back(slot);
        }
        return StreamResult::ok(std::make_unique<TrackedReader>(std::move(slot)));
    }

    void DirectTransport::close() {
        std::vector<std::weak_ptr<ReaderSlot>> readers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            readers.swap(readers_);
        }
        for (auto &weak : readers) {
            if (auto slot = weak.lock()) {
                slot->inner->cancel();
            }
        }
    }

    bool DirectTransport::is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    rpc::TransportFactory direct_transport_factory(std::shared_ptr<RequestProcessor> processor) {
        return [processor](const rpc::ChannelConfig &) -> std::unique_ptr<rpc::Transport> {
            return std::make_unique<DirectTransport>(processor);
        };
    }

} // namespace enslink::engine
