#include <enslink/rpc/channel.hpp>
#include <enslink/rpc/codec.hpp>

#include "ensight.pb.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <stdexcept>

namespace enslink::rpc {

    ChannelConfig ChannelConfig::from_env() {
        ChannelConfig config;
        if (const char *token = std::getenv(SECURITY_TOKEN_ENV)) {
            config.security_token = token;
        }
        return config;
    }

    std::string ChannelConfig::address() const { return host + ":" + std::to_string(port); }

    Channel::Channel(ChannelConfig config, TransportFactory factory)
        : config_(std::move(config)), factory_(std::move(factory)) {
        if (!factory_) {
            throw std::invalid_argument("Channel requires a transport factory");
        }
    }

    Channel::~Channel() { shutdown(false); }

    void Channel::connect() { connect(config_.connect_timeout); }

    void Channel::connect(std::chrono::milliseconds timeout) {
        if (is_connected()) {
            return;
        }

        std::shared_ptr<Transport> fresh = factory_(config_);
        if (!fresh) {
            spdlog::debug("No transport created for {}", config_.address());
            return;
        }

        if (!fresh->wait_ready(timeout)) {
            spdlog::debug("Transport to {} not ready after {} ms", config_.address(), timeout.count());
            fresh->close();
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (transport_) {
            // Lost a race with another connect(); keep the first transport
            fresh->close();
            return;
        }
        transport_ = std::move(fresh);
        spdlog::debug("Connected to {}", config_.address());
    }

    bool Channel::is_connected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transport_ != nullptr;
    }

    void Channel::shutdown(bool stop_remote) {
        std::shared_ptr<Transport> current;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current.swap(transport_);
        }
        if (!current) {
            return;
        }

        if (stop_remote) {
            ensightservice::ExitRequest request;
            auto result = current->call(methods::EXIT, codec::encode(request), metadata());
            if (!result) {
                spdlog::debug("Exit request to {} failed: {}", config_.address(), result.error);
            }
        }

        current->close();
        spdlog::debug("Channel to {} shut down", config_.address());
    }

    Metadata Channel::metadata() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.security_token.empty()) {
            return {};
        }
        return {{SHARED_SECRET_KEY, config_.security_token}};
    }

    Result<std::vector<uint8_t>> Channel::call(const std::string &method, const std::vector<uint8_t> &request) {
        auto current = transport();
        if (!current) {
            return Result<std::vector<uint8_t>>::io_error("gRPC connection dropped: channel is not connected");
        }
        return current->call(method, request, metadata());
    }

    Result<std::unique_ptr<EventReader>> Channel::open_stream(const std::string &method,
                                                              const std::vector<uint8_t> &request) {
        auto current = transport();
        if (!current) {
            return Result<std::unique_ptr<EventReader>>::io_error(
                "gRPC connection dropped: channel is not connected");
        }
        return current->open_stream(method, request, metadata());
    }

    void Channel::set_security_token(const std::string &token) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.security_token = token;
    }

    std::shared_ptr<Transport> Channel::transport() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transport_;
    }

} // namespace enslink::rpc
