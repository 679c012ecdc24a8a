#include <doctest/doctest.h>

#include <enslink/events/callback_registry.hpp>

#include <string>
#include <vector>

using namespace enslink;
using namespace enslink::events;

namespace {
    CallbackRegistration make_registration(const std::string &tag, Callback callback = nullptr) {
        CallbackRegistration registration;
        registration.tag = tag;
        registration.remote_id = "7";
        registration.callback = std::move(callback);
        return registration;
    }
} // namespace

TEST_SUITE("Callback registry") {

    TEST_CASE("Short tags stop at the first query separator") {
        CHECK(CallbackRegistry::short_tag("partlist") == "partlist");
        CHECK(CallbackRegistry::short_tag("partlist?enum=PARTS") == "partlist");
        CHECK(CallbackRegistry::short_tag("p?x=1?y=2") == "p");
        CHECK(CallbackRegistry::short_tag("") == "");
    }

    TEST_CASE("Duplicate short tags are rejected") {
        CallbackRegistry registry;
        REQUIRE(registry.add(make_registration("foo")).success);

        auto duplicate = registry.add(make_registration("foo?x=1"));
        CHECK_FALSE(duplicate.success);
        CHECK(duplicate.kind == ErrorKind::Precondition);
        CHECK(duplicate.error == "A callback for tag 'foo' already exists");
        CHECK(registry.size() == 1);

        CHECK(registry.add(make_registration("bar")).success);
        CHECK(registry.size() == 2);
    }

    TEST_CASE("Find and remove") {
        CallbackRegistry registry;
        CHECK(registry.empty());
        REQUIRE(registry.add(make_registration("partlist?enum=PARTS")).success);

        CHECK(registry.contains("partlist"));
        CHECK(registry.contains("partlist?anything"));
        auto found = registry.find("partlist");
        REQUIRE(found.has_value());
        CHECK(found->tag == "partlist?enum=PARTS");
        CHECK(found->short_tag == "partlist");
        CHECK(found->remote_id == "7");

        // Only the short tag removes a registration
        auto by_full_tag = registry.remove("partlist?enum=PARTS");
        CHECK_FALSE(by_full_tag.success);
        CHECK(by_full_tag.kind == ErrorKind::Precondition);
        CHECK(by_full_tag.error == "A callback for tag 'partlist?enum=PARTS' does not exist");
        CHECK(registry.size() == 1);

        auto removed = registry.remove("partlist");
        REQUIRE(removed.success);
        CHECK(removed.value.remote_id == "7");
        CHECK(registry.empty());

        auto again = registry.remove("partlist");
        CHECK_FALSE(again.success);
        CHECK(again.kind == ErrorKind::Precondition);
        CHECK(again.error == "A callback for tag 'partlist' does not exist");
    }

    TEST_CASE("Notification normalization") {
        // Tag carried its own query; the stream suffix must join it
        CHECK(CallbackRegistry::normalize_notification("grpc://u/partlist?uid=3?enum=PARTS") ==
              "grpc://u/partlist?uid=3&enum=PARTS");

        // A single query is already well formed
        CHECK(CallbackRegistry::normalize_notification("grpc://u/partlist?enum=PARTS&uid=221") ==
              "grpc://u/partlist?enum=PARTS&uid=221");
        CHECK(CallbackRegistry::normalize_notification("grpc://u/variables") == "grpc://u/variables");
    }

    TEST_CASE("Notification tags") {
        CHECK(CallbackRegistry::notification_tag("grpc://1f2e/partlist?enum=PARTS&uid=221") == "partlist");
        CHECK(CallbackRegistry::notification_tag("grpc://1f2e/a/b#frag") == "a/b");
        CHECK(CallbackRegistry::notification_tag("/bare?x=1") == "bare");
        CHECK(CallbackRegistry::notification_tag("grpc://host-only") == "");
    }

    TEST_CASE("Dispatch in registration order") {
        CallbackRegistry registry;
        std::vector<std::string> calls;

        REQUIRE(registry.add(make_registration("part", [&](const std::string &url) { calls.push_back("part " + url); }))
                    .success);
        REQUIRE(registry
                    .add(make_registration("partlist", [&](const std::string &url) { calls.push_back("list " + url); }))
                    .success);

        // "part" was registered first and prefixes "partlist"
        CHECK(registry.dispatch("grpc://u/partlist?enum=PARTS"));
        REQUIRE(calls.size() == 1);
        CHECK(calls[0] == "part grpc://u/partlist?enum=PARTS");

        CHECK(registry.dispatch("grpc://u/part?uid=1?enum=PARTS"));
        REQUIRE(calls.size() == 2);
        CHECK(calls[1] == "part grpc://u/part?uid=1&enum=PARTS");

        CHECK_FALSE(registry.dispatch("grpc://u/variables"));
        CHECK(calls.size() == 2);
    }

    TEST_CASE("Callbacks may modify the registry") {
        CallbackRegistry registry;
        bool fired = false;

        REQUIRE(registry
                    .add(make_registration("once",
                                           [&](const std::string &) {
                                               fired = true;
                                               CHECK(registry.remove("once").success);
                                           }))
                    .success);

        CHECK(registry.dispatch("grpc://u/once"));
        CHECK(fired);
        CHECK(registry.empty());
        CHECK_FALSE(registry.dispatch("grpc://u/once"));
    }
}
