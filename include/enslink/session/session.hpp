#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <enslink/events/callback_registry.hpp>
#include <enslink/events/event_stream.hpp>
#include <enslink/proxy/marshaller.hpp>
#include <enslink/proxy/proxy_cache.hpp>
#include <enslink/rpc/channel.hpp>
#include <enslink/rpc/executor.hpp>
#include <enslink/utils/result.hpp>

namespace enslink {

    struct SessionConfig {
        rpc::ChannelConfig channel;

        // Budget of the connection retry loop
        std::chrono::milliseconds timeout{120000};
        // Pause between two connection attempts
        std::chrono::milliseconds retry_interval{100};

        size_t proxy_cache_ceiling{proxy::ProxyCache::DEFAULT_CEILING};

        // Probe the engine with version queries while connecting
        bool validate_connection{true};
        // Load the remote enum table on start()
        bool load_enums{true};
    };

    // Session - one connection to a remote engine and all state scoped to it.
    // Sessions share nothing with each other.
    class Session {
      public:
        explicit Session(SessionConfig config = {}, rpc::TransportFactory factory = rpc::grpc_transport_factory());
        ~Session();

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        // Connect (validated when configured) and load the enum table
        Result<void> start();

        // Retry connect() until connected, or until the timeout budget is spent.
        // With validate, version probes must succeed as well.
        Result<void> establish_connection(bool validate = false);

        bool is_connected() const { return channel_.is_connected(); }

        // Evaluate an expression remotely and marshal its result into local values
        Result<proxy::Value> cmd(const std::string &command);
        Result<proxy::MarshalledResult> evaluate(const std::string &command);

        // Execute a statement remotely, discarding any result
        Result<void> run(const std::string &command);

        // Evaluate remotely, returning the JSON encoding untouched
        Result<std::string> cmd_json(const std::string &command);

        // PNG image of the current scene
        Result<std::vector<uint8_t>> render(int width, int height, int aa_passes = 1);

        // GLB scene geometry
        Result<std::vector<uint8_t>> geometry();

        // Expression naming remote object id
        static std::string remote_obj(int64_t id);

        // Cached proxy for id, or nullptr
        proxy::ProxyPtr obj_instance(int64_t id) const;

        // Attributes are read from and written to the live remote object
        Result<proxy::Value> get_attribute(const proxy::ProxyHandle &handle, const std::string &attribute);
        Result<void> set_attribute(const proxy::ProxyHandle &handle, const std::string &attribute,
                                   const std::string &value_expression);

        // Event stream
        Result<void> enable_events();
        bool events_enabled() const { return events_.is_enabled(); }
        std::optional<std::string> get_event() { return events_.get_event(); }

        // Watch attributes of the target objects; the first registration enables the event stream
        Result<void> add_callback(const std::string &target, const std::string &tag,
                                  const std::vector<std::string> &attributes, events::Callback callback,
                                  bool compress = true);
        Result<void> remove_callback(const std::string &tag);

        // Close the event stream and the channel. The engine keeps running unless stop_remote is set.
        void close(bool stop_remote = false);

        std::optional<int64_t> enum_value(const std::string &name) const;
        size_t enum_count() const;

        const std::string &cei_home() const { return cei_home_; }
        const std::string &cei_suffix() const { return cei_suffix_; }
        const std::string &prefix() const { return prefix_; }
        const SessionConfig &config() const { return config_; }

        rpc::Channel &channel() { return channel_; }
        rpc::Executor &executor() { return executor_; }
        proxy::ProxyCache &proxy_cache() { return cache_; }
        events::EventStream &event_stream() { return events_; }
        events::CallbackRegistry &callbacks() { return callbacks_; }

      private:
        Result<std::string> evaluate_text(const std::string &command);
        Result<void> load_enums();
        bool handle_event(const std::string &url);

        SessionConfig config_;
        std::string prefix_;
        rpc::Channel channel_;
        rpc::Executor executor_;
        proxy::ProxyCache cache_;
        proxy::Marshaller marshaller_;
        events::CallbackRegistry callbacks_;
        events::EventStream events_;

        std::map<std::string, int64_t> enums_;
        mutable std::mutex enums_mutex_;
        std::string cei_home_;
        std::string cei_suffix_;
    };

} // namespace enslink
