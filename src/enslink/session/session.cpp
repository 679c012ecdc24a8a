#include <enslink/session/session.hpp>
#include <enslink/utils/random.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace enslink {

    namespace {

        constexpr const char *CONNECT_FAILURE = "Unable to establish a gRPC connection to EnSight.";
        constexpr const char *ENUMS_COMMAND =
            "{key: getattr(ensight.objs.enums, key) for key in dir(ensight.objs.enums)}";
        constexpr const char *COMPRESS_FLAGS = ",flags=ensight.objs.EVENTMAP_FLAG_COMP_GLOBAL";

        // Text form of a marshalled value: strings unquoted, anything else as written
        std::string as_text(const proxy::MarshalledResult &result) {
            if (result.value.is_string()) {
                return result.value.as_string();
            }
            if (result.value.is_int()) {
                return std::to_string(result.value.as_int());
            }
            return result.expression;
        }

    } // namespace

    Session::Session(SessionConfig config, rpc::TransportFactory factory)
        : config_(std::move(config)), prefix_(utils::make_session_prefix()),
          channel_(config_.channel, std::move(factory)), executor_(channel_), cache_(config_.proxy_cache_ceiling),
          marshaller_(
              cache_, proxy::SubtypeTable::standard(),
              [this](const std::string &expression) { return evaluate_text(expression); },
              [this](const std::string &name) { return enum_value(name); }),
          events_(executor_, prefix_) {}

    Session::~Session() { close(); }

    Result<void> Session::start() {
        auto connected = establish_connection(config_.validate_connection);
        if (!connected) {
            return connected;
        }
        if (config_.load_enums) {
            return load_enums();
        }
        return Result<void>::ok();
    }

    Result<void> Session::establish_connection(bool validate) {
        const auto deadline = std::chrono::steady_clock::now() + config_.timeout;

        while (std::chrono::steady_clock::now() < deadline) {
            if (channel_.is_connected()) {
                if (!validate) {
                    return Result<void>::ok();
                }

                auto home = evaluate("ensight.version('CEI_HOME')");
                if (home) {
                    auto suffix = evaluate("ensight.version('suffix')");
                    if (suffix) {
                        cei_home_ = as_text(home.value);
                        cei_suffix_ = as_text(suffix.value);
                        spdlog::debug("Connected to engine at {} (suffix {})", cei_home_, cei_suffix_);
                        return Result<void>::ok();
                    }
                    if (suffix.kind != ErrorKind::Io) {
                        return suffix.error_as<void>();
                    }
                } else if (home.kind != ErrorKind::Io) {
                    return home.error_as<void>();
                }

                // The transport dropped under the probe; start over with a fresh one
                channel_.shutdown(false);
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                                   std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }
            channel_.connect(std::min(channel_.config().connect_timeout, remaining));
            if (!channel_.is_connected()) {
                std::this_thread::sleep_for(std::min(config_.retry_interval, remaining));
            }
        }

        spdlog::error("{} ({})", CONNECT_FAILURE, channel_.config().address());
        return Result<void>::io_error(CONNECT_FAILURE);
    }

    Result<proxy::Value> Session::cmd(const std::string &command) {
        auto result = evaluate(command);
        if (!result) {
            return result.error_as<proxy::Value>();
        }
        return Result<proxy::Value>::ok(std::move(result.value.value));
    }

    Result<proxy::MarshalledResult> Session::evaluate(const std::string &command) {
        auto connected = establish_connection(false);
        if (!connected) {
            return connected.error_as<proxy::MarshalledResult>();
        }

        auto text = evaluate_text(command);
        if (!text) {
            return text.error_as<proxy::MarshalledResult>();
        }
        return marshaller_.marshal(text.value);
    }

    Result<std::string> Session::evaluate_text(const std::string &command) {
        auto executed = executor_.execute(command, rpc::ExecMode::Evaluated);
        if (!executed) {
            return executed.error_as<std::string>();
        }
        return Result<std::string>::ok(std::move(executed.value.text));
    }

    Result<void> Session::run(const std::string &command) {
        auto connected = establish_connection(false);
        if (!connected) {
            return connected;
        }

        auto executed = executor_.execute(command, rpc::ExecMode::NoResult);
        if (!executed) {
            return executed.error_as<void>();
        }
        return Result<void>::ok();
    }

    Result<std::string> Session::cmd_json(const std::string &command) {
        auto connected = establish_connection(false);
        if (!connected) {
            return connected.error_as<std::string>();
        }

        auto executed = executor_.execute(command, rpc::ExecMode::Structured);
        if (!executed) {
            return executed.error_as<std::string>();
        }
        return Result<std::string>::ok(std::move(executed.value.text));
    }

    Result<std::vector<uint8_t>> Session::render(int width, int height, int aa_passes) {
        auto connected = establish_connection(false);
        if (!connected) {
            return connected.error_as<std::vector<uint8_t>>();
        }

        rpc::RenderOptions options;
        options.width = width;
        options.height = height;
        options.aa_passes = aa_passes;
        options.png = true;
        return executor_.render(options);
    }

    Result<std::vector<uint8_t>> Session::geometry() {
        auto connected = establish_connection(false);
        if (!connected) {
            return connected.error_as<std::vector<uint8_t>>();
        }
        return executor_.geometry();
    }

    std::string Session::remote_obj(int64_t id) { return "ensight.objs.wrap_id(" + std::to_string(id) + ")"; }

    proxy::ProxyPtr Session::obj_instance(int64_t id) const { return cache_.find(id); }

    Result<proxy::Value> Session::get_attribute(const proxy::ProxyHandle &handle, const std::string &attribute) {
        return cmd(remote_obj(handle.id) + ".getattr(ensight.objs.enums." + attribute + ")");
    }

    Result<void> Session::set_attribute(const proxy::ProxyHandle &handle, const std::string &attribute,
                                        const std::string &value_expression) {
        return run(remote_obj(handle.id) + ".setattr(ensight.objs.enums." + attribute + ", " + value_expression +
                   ")");
    }

    Result<void> Session::enable_events() {
        auto connected = establish_connection(false);
        if (!connected) {
            return connected;
        }
        return events_.enable([this](const std::string &url) { return handle_event(url); });
    }

    bool Session::handle_event(const std::string &url) {
        if (callbacks_.empty()) {
            return false;
        }
        callbacks_.dispatch(url);
        return true;
    }

    Result<void> Session::add_callback(const std::string &target, const std::string &tag,
                                       const std::vector<std::string> &attributes, events::Callback callback,
                                       bool compress) {
        auto connected = establish_connection(false);
        if (!connected) {
            return connected;
        }

        const auto short_tag = events::CallbackRegistry::short_tag(tag);
        if (callbacks_.contains(short_tag)) {
            return Result<void>::precondition("A callback for tag '" + short_tag + "' already exists");
        }

        proxy::List attribute_list;
        for (const auto &attribute : attributes) {
            attribute_list.emplace_back(attribute);
        }

        std::string command = "ensight.objs.addcallback(" + target + ",None,'" + prefix_ + tag +
                              "',attrs=" + proxy::Value(std::move(attribute_list)).repr();
        if (compress) {
            command += COMPRESS_FLAGS;
        }
        command += ")";

        auto armed = evaluate(command);
        if (!armed) {
            return armed.error_as<void>();
        }

        events::CallbackRegistration registration;
        registration.tag = tag;
        registration.remote_id = as_text(armed.value);
        registration.attributes = attributes;
        registration.callback = std::move(callback);
        registration.compress = compress;

        const auto remote_id = registration.remote_id;
        auto added = callbacks_.add(std::move(registration));
        if (!added) {
            // Lost a race for the same tag; disarm the watch just created
            auto disarmed = run("ensight.objs.removecallback(" + remote_id + ")");
            if (!disarmed) {
                spdlog::warn("Unable to remove callback {}: {}", remote_id, disarmed.error);
            }
            return added;
        }

        return enable_events();
    }

    Result<void> Session::remove_callback(const std::string &tag) {
        auto removed = callbacks_.remove(tag);
        if (!removed) {
            return removed.error_as<void>();
        }
        return run("ensight.objs.removecallback(" + removed.value.remote_id + ")");
    }

    void Session::close(bool stop_remote) {
        events_.close();
        channel_.shutdown(stop_remote);
    }

    std::optional<int64_t> Session::enum_value(const std::string &name) const {
        std::lock_guard<std::mutex> lock(enums_mutex_);
        auto it = enums_.find(name);
        if (it == enums_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t Session::enum_count() const {
        std::lock_guard<std::mutex> lock(enums_mutex_);
        return enums_.size();
    }

    Result<void> Session::load_enums() {
        auto table = cmd(ENUMS_COMMAND);
        if (!table) {
            return table.error_as<void>();
        }
        if (!table.value.is_dict()) {
            spdlog::warn("Enum table is not a dictionary; discriminator ids stay symbolic");
            return Result<void>::ok();
        }

        std::map<std::string, int64_t> loaded;
        for (const auto &entry : table.value.as_dict()) {
            if (entry.key.is_string() && entry.value.is_int()) {
                loaded.emplace(entry.key.as_string(), entry.value.as_int());
            }
        }

        std::lock_guard<std::mutex> lock(enums_mutex_);
        enums_ = std::move(loaded);
        spdlog::debug("Loaded {} enum values", enums_.size());
        return Result<void>::ok();
    }

} // namespace enslink
