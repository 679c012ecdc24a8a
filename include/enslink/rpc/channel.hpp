#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <enslink/rpc/grpc_transport.hpp>
#include <enslink/rpc/transport.hpp>

namespace enslink::rpc {

    // Metadata key carrying the shared secret
    inline constexpr const char *SHARED_SECRET_KEY = "shared_secret";

    // Environment variable consulted by ChannelConfig::from_env()
    inline constexpr const char *SECURITY_TOKEN_ENV = "ENSIGHT_SECURITY_TOKEN";

    struct ChannelConfig {
        std::string host{"127.0.0.1"};
        uint16_t port{12345};
        std::string security_token; // empty: no authentication metadata
        std::chrono::milliseconds connect_timeout{15000};

        // Defaults, with the security token taken from the environment when set
        static ChannelConfig from_env();

        std::string address() const;
    };

    // Channel manager
    // Owns at most one live transport. connected() is true iff that transport is held.
    class Channel {
      public:
        explicit Channel(ChannelConfig config = {}, TransportFactory factory = grpc_transport_factory());
        ~Channel();

        Channel(const Channel &) = delete;
        Channel &operator=(const Channel &) = delete;

        // No-op when connected. Otherwise open a transport and wait for readiness.
        // A timeout leaves the channel disconnected; callers check is_connected().
        void connect();
        void connect(std::chrono::milliseconds timeout);

        bool is_connected() const;

        // Optionally ask the remote engine to exit, then release the transport. Idempotent.
        void shutdown(bool stop_remote = false);

        // Authentication metadata attached to every call
        Metadata metadata() const;

        // Unary call on the current transport; Io failure when disconnected
        Result<std::vector<uint8_t>> call(const std::string &method, const std::vector<uint8_t> &request);

        Result<std::unique_ptr<EventReader>> open_stream(const std::string &method,
                                                         const std::vector<uint8_t> &request);

        const ChannelConfig &config() const { return config_; }
        void set_security_token(const std::string &token);

      private:
        std::shared_ptr<Transport> transport() const;

        ChannelConfig config_;
        TransportFactory factory_;
        std::shared_ptr<Transport> transport_;
        mutable std::mutex mutex_;
    };

} // namespace enslink::rpc
