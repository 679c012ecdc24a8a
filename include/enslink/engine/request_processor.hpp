#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <enslink/rpc/executor.hpp>
#include <enslink/rpc/transport.hpp>
#include <enslink/utils/result.hpp>

namespace enslink::engine {

    struct PythonOutcome {
        int32_t error{0}; // negative: execution failed
        std::string value;
    };

    // Engine-side behavior behind the service methods - implement this to script an engine
    class Handler {
      public:
        virtual ~Handler() = default;

        virtual PythonOutcome run_python(rpc::ExecMode mode, const std::string &command) = 0;

        // Optional: image and scene payloads
        virtual std::vector<uint8_t> render(const rpc::RenderOptions & /*options*/) { return {}; }
        virtual std::vector<uint8_t> geometry() { return {}; }

        // Optional: called on an Exit request
        virtual void exit() {}
    };

    // Request processor - decodes service requests, checks the shared secret and dispatches to a handler.
    // Also the publisher side of the event stream.
    class RequestProcessor {
      public:
        explicit RequestProcessor(std::shared_ptr<Handler> handler, std::string security_token = "");
        ~RequestProcessor();

        RequestProcessor(const RequestProcessor &) = delete;
        RequestProcessor &operator=(const RequestProcessor &) = delete;

        // Unary request: serialized request in, serialized reply out
        Result<std::vector<uint8_t>> process(const std::string &method, const std::vector<uint8_t> &request,
                                             const rpc::Metadata &metadata);

        // Server-streaming request (GetEventStream)
        Result<std::unique_ptr<rpc::EventReader>> open_stream(const std::string &method,
                                                              const std::vector<uint8_t> &request,
                                                              const rpc::Metadata &metadata);

        // Push a notification URL to every open stream whose prefix starts it; returns deliveries
        size_t publish(const std::string &url);

        // End every open stream; pending reads fail
        void disconnect_streams();

        size_t stream_count() const;

        // false makes transports report "not ready" and fail calls
        void set_available(bool available);
        bool is_available() const;

        const std::shared_ptr<Handler> &handler() const;

        // Statistics
        struct Stats {
            uint64_t python_requests{0};
            uint64_t render_requests{0};
            uint64_t geometry_requests{0};
            uint64_t exit_requests{0};
            uint64_t stream_opens{0};
            uint64_t rejected_requests{0};
            uint64_t published_events{0};
            std::chrono::system_clock::time_point start_time;
        };

        Stats get_stats() const;

        // Metadata of the most recent request
        rpc::Metadata last_metadata() const;

      private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace enslink::engine
