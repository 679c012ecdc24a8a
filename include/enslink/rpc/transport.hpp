#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <enslink/utils/result.hpp>

namespace enslink::rpc {

    struct ChannelConfig;

    // Per-call key/value metadata (authentication)
    using Metadata = std::vector<std::pair<std::string, std::string>>;

    // Fully qualified method paths of the engine service
    namespace methods {
        inline constexpr const char *RUN_PYTHON = "/ensightservice.EnSightService/RunPython";
        inline constexpr const char *RENDER_IMAGE = "/ensightservice.EnSightService/RenderImage";
        inline constexpr const char *GET_GEOMETRY = "/ensightservice.EnSightService/GetGeometry";
        inline constexpr const char *EXIT = "/ensightservice.EnSightService/Exit";
        inline constexpr const char *GET_EVENT_STREAM = "/ensightservice.EnSightService/GetEventStream";
    } // namespace methods

    // Server-push stream opened by Transport::open_stream
    class EventReader {
      public:
        virtual ~EventReader() = default;

        // Block until the next serialized message arrives.
        // Fails with ErrorKind::Io once the stream ends, is cancelled, or the transport closes.
        virtual Result<std::vector<uint8_t>> read() = 0;

        // Unblock a pending read(); safe to call from any thread
        virtual void cancel() = 0;
    };

    // Abstract transport interface for the engine connection
    // Implementations: GrpcTransport (network), engine::DirectTransport (in-process)
    class Transport {
      public:
        virtual ~Transport() = default;

        // Wait until the transport can carry calls; false on timeout
        virtual bool wait_ready(std::chrono::milliseconds timeout) = 0;

        // Unary call: serialized request in, serialized response out
        virtual Result<std::vector<uint8_t>> call(const std::string &method, const std::vector<uint8_t> &request,
                                                  const Metadata &metadata) = 0;

        // Server-streaming call
        virtual Result<std::unique_ptr<EventReader>> open_stream(const std::string &method,
                                                                 const std::vector<uint8_t> &request,
                                                                 const Metadata &metadata) = 0;

        // Release the connection; pending stream reads fail
        virtual void close() = 0;
    };

    using TransportFactory = std::function<std::unique_ptr<Transport>(const ChannelConfig &config)>;

} // namespace enslink::rpc
