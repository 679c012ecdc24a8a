#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <enslink/proxy/proxy_handle.hpp>
#include <enslink/utils/result.hpp>

namespace enslink::proxy {

    struct Value;
    struct DictEntry;

    using List = std::vector<Value>;
    using Dict = std::vector<DictEntry>; // insertion order kept

    // Result text that is not a literal (an expression, a repr with angle brackets, ...)
    struct RawText {
        std::string text;
    };

    // Local value of an evaluated command result
    struct Value {
        using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, ProxyPtr, List, Dict, RawText>;

        Storage data;

        Value() = default;
        Value(bool b);
        Value(int64_t i);
        Value(double d);
        Value(const char *s);
        Value(std::string s);
        Value(ProxyPtr p);
        Value(List l);
        Value(Dict d);
        Value(RawText r);

        bool is_none() const { return std::holds_alternative<std::monostate>(data); }
        bool is_bool() const { return std::holds_alternative<bool>(data); }
        bool is_int() const { return std::holds_alternative<int64_t>(data); }
        bool is_float() const { return std::holds_alternative<double>(data); }
        bool is_string() const { return std::holds_alternative<std::string>(data); }
        bool is_object() const { return std::holds_alternative<ProxyPtr>(data); }
        bool is_list() const { return std::holds_alternative<List>(data); }
        bool is_dict() const { return std::holds_alternative<Dict>(data); }
        bool is_raw() const { return std::holds_alternative<RawText>(data); }

        // std::bad_variant_access on a type mismatch
        bool as_bool() const { return std::get<bool>(data); }
        int64_t as_int() const { return std::get<int64_t>(data); }
        double as_float() const { return std::get<double>(data); }
        const std::string &as_string() const { return std::get<std::string>(data); }
        const ProxyPtr &as_object() const { return std::get<ProxyPtr>(data); }
        const List &as_list() const { return std::get<List>(data); }
        const Dict &as_dict() const { return std::get<Dict>(data); }
        const RawText &as_raw() const { return std::get<RawText>(data); }

        // Dict lookup by string key; nullptr when absent or not a dict
        const Value *get(std::string_view key) const;

        // Python-style rendering; objects render as their remote expression
        std::string repr() const;
    };

    struct DictEntry {
        Value key;
        Value value;
    };

    // Piece of a scanned result: literal text, or an already resolved object
    struct ValuePiece {
        std::string text;
        ProxyPtr object; // non-null: the piece stands for one object atom
    };

    // Parse a Python literal (None, True/False, int, float, str, list, tuple, set, dict).
    // Object pieces are atoms. Precondition failure when the input is not a literal.
    Result<Value> parse_value(const std::vector<ValuePiece> &pieces);
    Result<Value> parse_value(std::string_view text);

} // namespace enslink::proxy
