#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <enslink/engine/request_processor.hpp>
#include <enslink/rpc/transport.hpp>

namespace enslink::engine {

    // Direct transport - connects a channel to a request processor in-process (no networking)
    class DirectTransport : public rpc::Transport {
      public:
        explicit DirectTransport(std::shared_ptr<RequestProcessor> processor);
        ~DirectTransport() override;

        DirectTransport(const DirectTransport &) = delete;
        DirectTransport &operator=(const DirectTransport &) = delete;

        // Transport interface
        bool wait_ready(std::chrono::milliseconds timeout) override;

        Result<std::vector<uint8_t>> call(const std::string &method, const std::vector<uint8_t> &request,
                                          const rpc::Metadata &metadata) override;

        Result<std::unique_ptr<rpc::EventReader>> open_stream(const std::string &method,
                                                              const std::vector<uint8_t> &request,
                                                              const rpc::Metadata &metadata) override;

        void close() override;

        bool is_closed() const;

      private:
        class TrackedReader;
        struct ReaderSlot;

        std::shared_ptr<RequestProcessor> processor_;
        std::vector<std::weak_ptr<ReaderSlot>> readers_;
        bool closed_{false};
        mutable std::mutex mutex_;
    };

    // Factory for rpc::Channel: every connect() gets a fresh DirectTransport on the same processor
    rpc::TransportFactory direct_transport_factory(std::shared_ptr<RequestProcessor> processor);

} // namespace enslink::engine
