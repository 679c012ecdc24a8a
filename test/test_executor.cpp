#include <doctest/doctest.h>

#include "engine_fixture.hpp"

#include <thread>

using namespace enslink;
using namespace enslink_test;

TEST_CASE("Executor - Execution modes") {
    LoopbackEngine engine;
    engine.handler->set_reply("ensight.objs.core.PARTS", "[1, 2]");
    engine.handler->set_reply("json.dumps(ensight.objs.core.PARTS)", "[1, 2]");

    rpc::Channel channel({}, engine.factory());
    rpc::Executor executor(channel);

    SUBCASE("Connects on demand") {
        CHECK_FALSE(channel.is_connected());
        auto result = executor.execute("ensight.objs.core.PARTS", rpc::ExecMode::Evaluated);
        REQUIRE(result.success);
        CHECK(channel.is_connected());
    }

    SUBCASE("NoResult returns no text") {
        auto result = executor.execute("ensight.objs.core.PARTS", rpc::ExecMode::NoResult);
        REQUIRE(result.success);
        CHECK(result.value.mode == rpc::ExecMode::NoResult);
        CHECK(result.value.text.empty());
        CHECK(engine.handler->commands().back().first == rpc::ExecMode::NoResult);
    }

    SUBCASE("Evaluated returns the textual form") {
        auto result = executor.execute("ensight.objs.core.PARTS", rpc::ExecMode::Evaluated);
        REQUIRE(result.success);
        CHECK(result.value.mode == rpc::ExecMode::Evaluated);
        CHECK(result.value.text == "[1, 2]");
    }

    SUBCASE("Structured returns JSON") {
        auto result = executor.execute("1 + 1", rpc::ExecMode::Structured);
        REQUIRE(result.success);
        CHECK(result.value.text == "null");
        CHECK(engine.handler->last_command() == "1 + 1");
        CHECK(engine.handler->commands().back().first == rpc::ExecMode::Structured);
    }

    CHECK(engine.processor->get_stats().python_requests == 1);
}

TEST_CASE("Executor - Remote failures") {
    LoopbackEngine engine;
    engine.handler->set_reply("raise ValueError()", "Traceback", -1);

    rpc::Channel channel({}, engine.factory());
    rpc::Executor executor(channel);

    auto result = executor.execute("raise ValueError()", rpc::ExecMode::NoResult);
    CHECK_FALSE(result.success);
    CHECK(result.kind == ErrorKind::Remote);
    CHECK(result.error == "Remote execution error");

    // The executor does not retry
    CHECK(engine.handler->count("raise ValueError()") == 1);

    // Zero and positive codes are success
    engine.handler->set_reply("warn()", "None", 3);
    CHECK(executor.execute("warn()", rpc::ExecMode::Evaluated).success);
}

TEST_CASE("Executor - Unreachable engine") {
    LoopbackEngine engine;
    engine.processor->set_available(false);

    rpc::ChannelConfig config;
    config.connect_timeout = std::chrono::milliseconds(20);
    rpc::Channel channel(config, engine.factory());
    rpc::Executor executor(channel);

    auto result = executor.execute("1", rpc::ExecMode::Evaluated);
    CHECK_FALSE(result.success);
    CHECK(result.kind == ErrorKind::Io);

    CHECK(executor.render().kind == ErrorKind::Io);
    CHECK(executor.geometry().kind == ErrorKind::Io);
    CHECK(executor.open_event_stream("grpc://x/").kind == ErrorKind::Io);
    CHECK(engine.handler->commands().empty());
}

TEST_CASE("Executor - Render and geometry") {
    LoopbackEngine engine;
    rpc::Channel channel({}, engine.factory());
    rpc::Executor executor(channel);

    rpc::RenderOptions options;
    options.width = 800;
    options.height = 600;
    options.aa_passes = 4;
    auto image = executor.render(options);
    REQUIRE(image.success);
    CHECK(std::string(image.value.begin(), image.value.end()) == "PNG 800x600/4");

    auto defaults = executor.render();
    REQUIRE(defaults.success);
    CHECK(std::string(defaults.value.begin(), defaults.value.end()) == "PNG 640x480/1");

    auto scene = executor.geometry();
    REQUIRE(scene.success);
    CHECK(scene.value == std::vector<uint8_t>{'g', 'l', 'T', 'F'});

    auto stats = engine.processor->get_stats();
    CHECK(stats.render_requests == 2);
    CHECK(stats.geometry_requests == 1);
}

TEST_CASE("Executor - Notification stream") {
    LoopbackEngine engine;
    rpc::Channel channel({}, engine.factory());
    rpc::Executor executor(channel);

    auto opened = executor.open_event_stream("grpc://abc/");
    REQUIRE(opened.success);
    auto stream = std::move(opened.value);
    CHECK(engine.processor->stream_count() == 1);

    // Only URLs under the stream prefix are delivered
    CHECK(engine.processor->publish("grpc://abc/partlist?enum=PARTS") == 1);
    CHECK(engine.processor->publish("grpc://other/partlist") == 0);
    CHECK(engine.processor->publish("grpc://abc/variables") == 1);

    auto first = stream->next();
    REQUIRE(first.success);
    CHECK(first.value == "grpc://abc/partlist?enum=PARTS");
    auto second = stream->next();
    REQUIRE(second.success);
    CHECK(second.value == "grpc://abc/variables");

    SUBCASE("Cancel unblocks a pending read") {
        std::thread canceller([&stream] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            stream->cancel();
        });
        auto next = stream->next();
        canceller.join();
        CHECK_FALSE(next.success);
        CHECK(next.kind == ErrorKind::Io);
    }

    SUBCASE("Channel shutdown ends the stream") {
        channel.shutdown();
        auto next = stream->next();
        CHECK_FALSE(next.success);
        CHECK(next.kind == ErrorKind::Io);
    }
}
