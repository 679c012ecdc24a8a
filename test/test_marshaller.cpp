#include <doctest/doctest.h>

#include <enslink/proxy/marshaller.hpp>

#include <map>
#include <string>
#include <vector>

using namespace enslink;
using namespace enslink::proxy;

namespace {

    // Answers discriminator queries from a table and records every query
    struct CountingEvaluator {
        std::map<std::string, std::string> replies;
        std::vector<std::string> queries;
        std::optional<ErrorKind> failure;

        Evaluator evaluator() {
            return [this](const std::string &expression) -> Result<std::string> {
                queries.push_back(expression);
                if (failure) {
                    return Result<std::string>::failure(*failure, "scripted failure");
                }
                auto it = replies.find(expression);
                return Result<std::string>::ok(it == replies.end() ? "None" : it->second);
            };
        }
    };

    const std::string SPHERE = "[Class: ENS_PART, desc: 'Sphere', CvfObjID: 1078, cached:no]";

} // namespace

TEST_SUITE("Result marshaller") {

    TEST_CASE("Part resolved through its discriminator") {
        ProxyCache cache;
        CountingEvaluator remote;
        remote.replies[Marshaller::discriminator_query(1078, "PARTTYPE")] = "0";
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator());

        auto first = marshaller.marshal(SPHERE);
        REQUIRE(first.success);

        // One secondary round-trip
        CHECK(remote.queries.size() == 1);
        CHECK(remote.queries[0] == "ensight.objs.wrap_id(1078).getattr(ensight.objs.enums.PARTTYPE)");
        CHECK(first.value.round_trips == 1);
        CHECK(first.value.resolved == 1);

        // Single-element ordered container holding the handle
        REQUIRE(first.value.value.is_list());
        const auto &items = first.value.value.as_list();
        REQUIRE(items.size() == 1);
        REQUIRE(items[0].is_object());
        const auto handle = items[0].as_object();
        CHECK(handle->id == 1078);
        CHECK(handle->class_name == "ENS_PART_MODEL");
        CHECK(handle->discriminator.value() == "PARTTYPE");
        CHECK(handle->discriminator_value.value() == 0);

        CHECK(first.value.expression ==
              "ensobjlist([session.ensight.objs.ENS_PART_MODEL(session, 1078,attr_id=ensight.objs.enums.PARTTYPE, "
              "attr_value=0)])");

        // Cached: the second pass issues no round-trip and returns the same handle
        REQUIRE(cache.find(1078) == handle);
        auto second = marshaller.marshal(SPHERE);
        REQUIRE(second.success);
        CHECK(remote.queries.size() == 1);
        CHECK(second.value.round_trips == 0);
        CHECK(second.value.resolved == 0);
        CHECK(second.value.expression == "ensobjlist([session.obj_instance(1078)])");
        CHECK(second.value.value.as_list()[0].as_object() == handle);
    }

    TEST_CASE("Known enum values replace the symbolic attribute id") {
        ProxyCache cache;
        CountingEvaluator remote;
        remote.replies[Marshaller::discriminator_query(5, "TOOLTYPE")] = "2";
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator(),
                              [](const std::string &name) -> std::optional<int64_t> {
                                  if (name == "TOOLTYPE") {
                                      return 1610612801;
                                  }
                                  return std::nullopt;
                              });

        auto result = marshaller.marshal("Class: ENS_TOOL, CvfObjID: 5, cached:no");
        REQUIRE(result.success);
        CHECK(result.value.expression ==
              "session.ensight.objs.ENS_TOOL_PLANE(session, 5,attr_id=1610612801, attr_value=2)");
        REQUIRE(result.value.value.is_object());
        CHECK(result.value.value.as_object()->discriminator_id.value() == 1610612801);
    }

    TEST_CASE("Identity stability across repeated occurrences") {
        ProxyCache cache;
        CountingEvaluator remote;
        remote.replies[Marshaller::discriminator_query(7, "PARTTYPE")] = "1";
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator());

        std::string text = "[Class: ENS_PART, desc: 'clip', CvfObjID: 7, cached:no, "
                           "Class: ENS_PART, desc: 'clip', CvfObjID: 7, cached:yes, "
                           "Class: ENS_PART, desc: 'clip', CvfObjID: 7, cached:yes]";
        auto result = marshaller.marshal(text);
        REQUIRE(result.success);
        CHECK(remote.queries.size() == 1);
        CHECK(result.value.references == 3);

        const auto &items = result.value.value.as_list();
        REQUIRE(items.size() == 3);
        CHECK(items[0].as_object() == items[1].as_object());
        CHECK(items[1].as_object() == items[2].as_object());
        CHECK(items[0].as_object()->class_name == "ENS_PART_CLIP");
        CHECK(result.value.expression ==
              "ensobjlist([session.ensight.objs.ENS_PART_CLIP(session, 7,attr_id=ensight.objs.enums.PARTTYPE, "
              "attr_value=1), session.obj_instance(7), session.obj_instance(7)])");
    }

    TEST_CASE("Non-polymorphic classes need no round-trip") {
        ProxyCache cache;
        CountingEvaluator remote;
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator());

        auto result = marshaller.marshal("Class: ENS_GLOBALS, CvfObjID: 221, cached:yes");
        REQUIRE(result.success);
        CHECK(remote.queries.empty());
        CHECK(result.value.expression == "session.ensight.objs.ENS_GLOBALS(session, 221)");
        REQUIRE(result.value.value.is_object());
        CHECK(result.value.value.as_object()->class_name == "ENS_GLOBALS");
        CHECK_FALSE(result.value.value.as_object()->discriminator.has_value());
    }

    TEST_CASE("Unrecognized discriminator falls back to the base class") {
        ProxyCache cache;
        CountingEvaluator remote;
        remote.replies[Marshaller::discriminator_query(12, "ANNOTTYPE")] = "42";
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator());

        auto result = marshaller.marshal("Class: ENS_ANNOT, CvfObjID: 12, cached:no");
        REQUIRE(result.success);
        CHECK(remote.queries.size() == 1);
        CHECK(result.value.expression == "session.ensight.objs.ENS_ANNOT(session, 12)");
        CHECK(result.value.value.as_object()->class_name == "ENS_ANNOT");
    }

    TEST_CASE("Non-integer discriminator falls back to the base class") {
        ProxyCache cache;
        CountingEvaluator remote;
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator());

        auto result = marshaller.marshal("Class: ENS_PART, CvfObjID: 3, cached:no");
        REQUIRE(result.success);
        CHECK(result.value.value.as_object()->class_name == "ENS_PART");
    }

    TEST_CASE("Failed round-trips propagate") {
        ProxyCache cache;
        CountingEvaluator remote;
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator());

        SUBCASE("Transport failure") {
            remote.failure = ErrorKind::Io;
            auto result = marshaller.marshal(SPHERE);
            CHECK_FALSE(result.success);
            CHECK(result.kind == ErrorKind::Io);
        }

        SUBCASE("Remote failure") {
            remote.failure = ErrorKind::Remote;
            auto result = marshaller.marshal(SPHERE);
            CHECK_FALSE(result.success);
            CHECK(result.kind == ErrorKind::Remote);
        }

        CHECK(cache.size() == 0);
    }

    TEST_CASE("Plain results pass through") {
        ProxyCache cache;
        CountingEvaluator remote;
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator());

        auto number = marshaller.marshal("14");
        REQUIRE(number.success);
        CHECK(number.value.value.as_int() == 14);
        CHECK(number.value.expression == "14");

        auto list = marshaller.marshal("  [1, 2]\n");
        REQUIRE(list.success);
        CHECK(list.value.expression == "ensobjlist([1, 2])");
        CHECK(list.value.value.as_list().size() == 2);

        auto text = marshaller.marshal("<ensight.objs.ENS_CASE object>");
        REQUIRE(text.success);
        REQUIRE(text.value.value.is_raw());
        CHECK(text.value.value.as_raw().text == "<ensight.objs.ENS_CASE object>");
        CHECK(remote.queries.empty());
    }

    TEST_CASE("Malformed descriptions are left as text") {
        ProxyCache cache;
        CountingEvaluator remote;
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator());

        auto result = marshaller.marshal("[CvfObjID: 3, cached:no]");
        REQUIRE(result.success);
        CHECK_FALSE(result.value.complete);
        CHECK(result.value.value.is_raw());
        CHECK(result.value.expression == "ensobjlist([CvfObjID: 3, cached:no])");
        CHECK(cache.size() == 0);
    }

    TEST_CASE("Cache is flushed past its ceiling before a pass") {
        ProxyCache cache(1);
        CountingEvaluator remote;
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator());

        auto first = marshaller.marshal("[Class: ENS_VAR, CvfObjID: 1, cached:no, Class: ENS_VAR, CvfObjID: 2, cached:no]");
        REQUIRE(first.success);
        CHECK(cache.size() == 2);
        auto old_handle = cache.find(1);

        auto second = marshaller.marshal("Class: ENS_VAR, CvfObjID: 1, cached:yes");
        REQUIRE(second.success);
        CHECK(second.value.resolved == 1);
        CHECK(cache.size() == 1);
        CHECK(second.value.value.as_object() != old_handle);
    }

    TEST_CASE("Dict results with handles") {
        ProxyCache cache;
        CountingEvaluator remote;
        Marshaller marshaller(cache, SubtypeTable::standard(), remote.evaluator());

        auto result = marshaller.marshal("{'case': Class: ENS_CASE, desc: 'Case 1', CvfObjID: 33, cached:no, 'n': 2}");
        REQUIRE(result.success);
        REQUIRE(result.value.value.is_dict());
        const auto *entry = result.value.value.get("case");
        REQUIRE(entry != nullptr);
        CHECK(entry->as_object()->id == 33);
        CHECK(result.value.value.get("n")->as_int() == 2);
    }

    TEST_CASE("Evaluator is required") {
        ProxyCache cache;
        CHECK_THROWS_AS(Marshaller(cache, SubtypeTable::standard(), nullptr), std::invalid_argument);
    }
}
