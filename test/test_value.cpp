#include <doctest/doctest.h>

#include <enslink/proxy/value.hpp>

#include <cmath>

using namespace enslink::proxy;

TEST_SUITE("Literal values") {

    TEST_CASE("Scalars") {
        SUBCASE("None and booleans") {
            auto none = parse_value("None");
            REQUIRE(none.success);
            CHECK(none.value.is_none());

            auto yes = parse_value("True");
            REQUIRE(yes.success);
            CHECK(yes.value.as_bool());

            auto no = parse_value(" False ");
            REQUIRE(no.success);
            CHECK_FALSE(no.value.as_bool());
        }

        SUBCASE("Integers") {
            auto value = parse_value("1610612792");
            REQUIRE(value.success);
            CHECK(value.value.as_int() == 1610612792);

            auto negative = parse_value("-42");
            REQUIRE(negative.success);
            CHECK(negative.value.as_int() == -42);
        }

        SUBCASE("Floats") {
            auto value = parse_value("0.25");
            REQUIRE(value.success);
            CHECK(value.value.is_float());
            CHECK(value.value.as_float() == doctest::Approx(0.25));

            auto exponent = parse_value("1e-05");
            REQUIRE(exponent.success);
            CHECK(exponent.value.as_float() == doctest::Approx(1e-05));

            auto inf = parse_value("-inf");
            REQUIRE(inf.success);
            CHECK(std::isinf(inf.value.as_float()));

            auto huge = parse_value("99999999999999999999");
            REQUIRE(huge.success);
            CHECK(huge.value.is_float());
        }

        SUBCASE("Strings") {
            auto single = parse_value("'/ansys_inc/v232/CEI'");
            REQUIRE(single.success);
            CHECK(single.value.as_string() == "/ansys_inc/v232/CEI");

            auto escaped = parse_value(R"("it's \"quoted\"\n\x41é")");
            REQUIRE(escaped.success);
            CHECK(escaped.value.as_string() == "it's \"quoted\"\nA\xc3\xa9");

            auto bytes = parse_value("b'abc'");
            REQUIRE(bytes.success);
            CHECK(bytes.value.as_string() == "abc");
        }
    }

    TEST_CASE("Containers") {
        SUBCASE("Lists and tuples") {
            auto list = parse_value("[1, 'two', 3.0, None,]");
            REQUIRE(list.success);
            REQUIRE(list.value.is_list());
            const auto &items = list.value.as_list();
            REQUIRE(items.size() == 4);
            CHECK(items[0].as_int() == 1);
            CHECK(items[1].as_string() == "two");
            CHECK(items[2].is_float());
            CHECK(items[3].is_none());

            auto tuple = parse_value("(1, (2, 3))");
            REQUIRE(tuple.success);
            REQUIRE(tuple.value.as_list().size() == 2);
            CHECK(tuple.value.as_list()[1].as_list().size() == 2);

            auto empty = parse_value("[]");
            REQUIRE(empty.success);
            CHECK(empty.value.as_list().empty());
        }

        SUBCASE("Dicts keep insertion order") {
            auto dict = parse_value("{'PARTTYPE': 1610612792, 'ANNOTTYPE': 1610612800, 'NAME': 'x'}");
            REQUIRE(dict.success);
            REQUIRE(dict.value.is_dict());
            const auto &entries = dict.value.as_dict();
            REQUIRE(entries.size() == 3);
            CHECK(entries[0].key.as_string() == "PARTTYPE");
            CHECK(entries[2].value.as_string() == "x");

            REQUIRE(dict.value.get("ANNOTTYPE") != nullptr);
            CHECK(dict.value.get("ANNOTTYPE")->as_int() == 1610612800);
            CHECK(dict.value.get("MISSING") == nullptr);
        }

        SUBCASE("Sets become lists") {
            auto set = parse_value("{1, 2}");
            REQUIRE(set.success);
            CHECK(set.value.as_list().size() == 2);

            auto empty = parse_value("{}");
            REQUIRE(empty.success);
            CHECK(empty.value.is_dict());
        }
    }

    TEST_CASE("Object pieces are atoms") {
        auto handle = std::make_shared<ProxyHandle>();
        handle->id = 1078;
        handle->class_name = "ENS_PART_MODEL";

        std::vector<ValuePiece> pieces = {{"[", nullptr}, {"", handle}, {", 5]", nullptr}};
        auto value = parse_value(pieces);
        REQUIRE(value.success);
        const auto &items = value.value.as_list();
        REQUIRE(items.size() == 2);
        CHECK(items[0].as_object() == handle);
        CHECK(items[1].as_int() == 5);
    }

    TEST_CASE("Non-literals are rejected") {
        CHECK_FALSE(parse_value("").success);
        CHECK_FALSE(parse_value("<function x at 0x7f>").success);
        CHECK_FALSE(parse_value("[1, 2").success);
        CHECK_FALSE(parse_value("'unterminated").success);
        CHECK_FALSE(parse_value("1 2").success);
        CHECK_FALSE(parse_value("ensobjlist([1])").success);
        CHECK(parse_value("[1, 2").kind == enslink::ErrorKind::Precondition);
    }

    TEST_CASE("repr") {
        CHECK(Value().repr() == "None");
        CHECK(Value(true).repr() == "True");
        CHECK(Value(int64_t{12}).repr() == "12");
        CHECK(Value(2.0).repr() == "2.0");
        CHECK(Value("it's").repr() == "'it\\'s'");
        CHECK(Value(List{Value("PARTS"), Value("VISIBLE")}).repr() == "['PARTS', 'VISIBLE']");
        CHECK(Value(Dict{DictEntry{Value("a"), Value(int64_t{1})}}).repr() == "{'a': 1}");
        CHECK(Value(RawText{"x + 1"}).repr() == "x + 1");
    }
}
