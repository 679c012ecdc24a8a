/**
 * Loopback Session Example
 *
 * Runs a session against a small in-process engine: no server, no network.
 * Shows object proxies, identity reuse and event callbacks end to end.
 *
 * Run: ./loopback_session
 */

#include <enslink/enslink.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

    // A one-part engine
    class DemoHandler : public enslink::engine::Handler {
      public:
        enslink::engine::PythonOutcome run_python(enslink::ExecMode mode, const std::string &command) override {
            if (command == "ensight.version('CEI_HOME')") {
                return {0, "'/demo/CEI'"};
            }
            if (command == "ensight.version('suffix')") {
                return {0, "'000'"};
            }
            if (command == "ensight.objs.core.PARTS") {
                return {0, "[Class: ENS_PART, desc: 'Sphere', CvfObjID: 1078, cached:no]"};
            }
            if (command == "ensight.objs.wrap_id(1078).getattr(ensight.objs.enums.PARTTYPE)") {
                return {0, "0"};
            }
            if (command.rfind("ensight.objs.addcallback(", 0) == 0) {
                return {0, "1"};
            }
            if (command.rfind("raise", 0) == 0) {
                return {-1, ""};
            }
            return {0, mode == enslink::ExecMode::Structured ? "null" : "None"};
        }
    };

} // namespace

int main() {
    std::cout << "EnSight Loopback Session\n";
    std::cout << "========================\n\n";

    auto processor = std::make_shared<enslink::engine::RequestProcessor>(std::make_shared<DemoHandler>());

    enslink::SessionConfig config;
    config.timeout = std::chrono::seconds(2);
    config.load_enums = false;
    enslink::Session session(config, enslink::engine::direct_transport_factory(processor));

    auto started = session.start();
    if (!started.success) {
        std::cerr << "Failed to start: " << started.error << "\n";
        return 1;
    }
    std::cout << "Engine at " << session.cei_home() << "\n";

    // 1. Object proxies
    auto first = session.evaluate("ensight.objs.core.PARTS");
    if (!first.success) {
        std::cerr << "Query failed: " << first.error << "\n";
        return 1;
    }
    std::cout << "Result:      " << first.value.value.repr() << "\n";
    std::cout << "Expression:  " << first.value.expression << "\n";
    std::cout << "Round-trips: " << first.value.round_trips << "\n";

    auto second = session.evaluate("ensight.objs.core.PARTS");
    if (second.success) {
        std::cout << "Second pass: " << second.value.expression << " (" << second.value.round_trips
                  << " round-trips)\n";
        const bool same = first.value.value.as_list()[0].as_object() == second.value.value.as_list()[0].as_object();
        std::cout << "Same handle: " << (same ? "yes" : "no") << "\n\n";
    }

    // 2. Remote errors
    auto failed = session.run("raise ValueError()");
    std::cout << "Remote error: " << failed.error << " (" << enslink::to_string(failed.kind) << ")\n\n";

    // 3. Events
    auto added = session.add_callback("ensight.objs.core", "partlist", {"PARTS"}, [](const std::string &url) {
        std::cout << "Callback fired: " << url << "\n";
    });
    if (!added.success) {
        std::cerr << "Failed to add callback: " << added.error << "\n";
        return 1;
    }

    processor->publish(session.prefix() + "partlist?enum=PARTS&uid=221");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    session.close(true);
    std::cout << "\nStatistics:\n";
    auto stats = processor->get_stats();
    std::cout << "  Python requests: " << stats.python_requests << "\n";
    std::cout << "  Stream opens:    " << stats.stream_opens << "\n";
    std::cout << "  Exit requests:   " << stats.exit_requests << "\n";
    return 0;
}
