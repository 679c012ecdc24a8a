#pragma once

#include <memory>
#include <string>

#include <enslink/rpc/transport.hpp>

namespace enslink::rpc {

    // gRPC transport to a remote engine (insecure channel, unlimited receive size)
    class GrpcTransport : public Transport {
      public:
        explicit GrpcTransport(const std::string &address);
        ~GrpcTransport() override;

        GrpcTransport(const GrpcTransport &) = delete;
        GrpcTransport &operator=(const GrpcTransport &) = delete;

        bool wait_ready(std::chrono::milliseconds timeout) override;

        Result<std::vector<uint8_t>> call(const std::string &method, const std::vector<uint8_t> &request,
                                          const Metadata &metadata) override;

        Result<std::unique_ptr<EventReader>> open_stream(const std::string &method,
                                                         const std::vector<uint8_t> &request,
                                                         const Metadata &metadata) override;

        void close() override;

        const std::string &address() const;

      private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

    // Default factory used by Channel: one GrpcTransport per connect()
    TransportFactory grpc_transport_factory();

} // namespace enslink::rpc
