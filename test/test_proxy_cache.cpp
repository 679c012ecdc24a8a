#include <doctest/doctest.h>

#include <enslink/proxy/proxy_cache.hpp>

#include <stdexcept>

using namespace enslink::proxy;

namespace {
    ProxyPtr make_handle(int64_t id, const std::string &class_name = "ENS_GLOBALS") {
        auto handle = std::make_shared<ProxyHandle>();
        handle->id = id;
        handle->class_name = class_name;
        return handle;
    }
} // namespace

TEST_SUITE("Proxy cache") {

    TEST_CASE("Insert and find") {
        ProxyCache cache;
        CHECK(cache.size() == 0);
        CHECK(cache.ceiling() == ProxyCache::DEFAULT_CEILING);
        CHECK(cache.find(7) == nullptr);

        auto handle = make_handle(7);
        CHECK(cache.insert(handle) == handle);
        CHECK(cache.find(7) == handle);
        CHECK(cache.size() == 1);
    }

    TEST_CASE("At most one handle per identity") {
        ProxyCache cache;
        auto first = make_handle(42, "ENS_PART_MODEL");
        auto second = make_handle(42, "ENS_PART");

        CHECK(cache.insert(first) == first);
        auto stored = cache.insert(second);
        CHECK(stored == first);
        CHECK(stored->class_name == "ENS_PART_MODEL");
        CHECK(cache.size() == 1);
    }

    TEST_CASE("Null handles are rejected") { CHECK_THROWS_AS(ProxyCache().insert(nullptr), std::invalid_argument); }

    TEST_CASE("Prune flushes only past the ceiling") {
        ProxyCache cache(3);
        for (int64_t id = 1; id <= 3; ++id) {
            cache.insert(make_handle(id));
        }
        CHECK_FALSE(cache.prune());
        CHECK(cache.size() == 3);

        cache.insert(make_handle(4));
        CHECK(cache.prune());
        CHECK(cache.size() == 0);
        CHECK(cache.find(1) == nullptr);
    }

    TEST_CASE("Clear") {
        ProxyCache cache;
        cache.insert(make_handle(1));
        cache.insert(make_handle(2));
        cache.clear();
        CHECK(cache.size() == 0);
    }

    TEST_CASE("Handles outlive a flush") {
        ProxyCache cache(0);
        auto handle = cache.insert(make_handle(9));
        CHECK(cache.prune());
        CHECK(handle->id == 9);
        CHECK(handle->remote_expression() == "ensight.objs.wrap_id(9)");
    }
}
