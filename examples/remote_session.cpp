/**
 * Remote Session Example
 *
 * Connects to a running EnSight gRPC server, lists the parts of the current
 * case and watches the part list for changes.
 *
 * The shared secret is read from ENSIGHT_SECURITY_TOKEN when set.
 * Run: ./remote_session [host] [port]
 */

#include <enslink/enslink.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

int main(int argc, char *argv[]) {
    std::cout << "EnSight Remote Session\n";
    std::cout << "======================\n\n";

    enslink::SessionConfig config;
    config.channel = enslink::rpc::ChannelConfig::from_env();
    if (argc >= 2) {
        config.channel.host = argv[1];
    }
    if (argc >= 3) {
        config.channel.port = static_cast<uint16_t>(std::stoi(argv[2]));
    }
    config.timeout = std::chrono::seconds(30);

    spdlog::set_level(spdlog::level::info);

    std::cout << "Connecting to " << config.channel.address() << "...\n";
    enslink::Session session(config);
    auto started = session.start();
    if (!started.success) {
        std::cerr << "Failed to connect: " << started.error << "\n";
        return 1;
    }
    std::cout << "CEI_HOME: " << session.cei_home() << "\n";
    std::cout << "Version suffix: " << session.cei_suffix() << "\n";
    std::cout << "Enum values loaded: " << session.enum_count() << "\n\n";

    auto parts = session.cmd("ensight.objs.core.PARTS");
    if (!parts.success) {
        std::cerr << "Failed to list parts: " << parts.error << "\n";
        return 1;
    }

    if (parts.value.is_list()) {
        std::cout << "Parts (" << parts.value.as_list().size() << "):\n";
        for (const auto &part : parts.value.as_list()) {
            if (!part.is_object()) {
                continue;
            }
            const auto &handle = *part.as_object();
            auto name = session.get_attribute(handle, "DESCRIPTION");
            std::cout << "  [" << handle.id << "] " << handle.class_name;
            if (name.success) {
                std::cout << " " << name.value.repr();
            }
            std::cout << "\n";
        }
    } else {
        std::cout << "PARTS: " << parts.value.repr() << "\n";
    }

    auto watched = session.add_callback("ensight.objs.core", "partlist", {"PARTS"}, [](const std::string &url) {
        std::cout << "Part list changed: " << url << "\n";
    });
    if (!watched.success) {
        std::cerr << "Failed to register callback: " << watched.error << "\n";
        return 1;
    }

    std::cout << "\nWatching the part list for 30 seconds...\n";
    std::this_thread::sleep_for(std::chrono::seconds(30));

    auto removed = session.remove_callback("partlist");
    if (!removed.success) {
        std::cerr << "Failed to remove callback: " << removed.error << "\n";
    }

    session.close();
    std::cout << "Session closed\n";
    return 0;
}
