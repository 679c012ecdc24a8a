#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <enslink/proxy/object_reference.hpp>
#include <enslink/proxy/proxy_cache.hpp>
#include <enslink/proxy/subtype_table.hpp>
#include <enslink/proxy/value.hpp>
#include <enslink/utils/result.hpp>

namespace enslink::proxy {

    // Evaluates an expression remotely and returns its textual result (secondary round-trip)
    using Evaluator = std::function<Result<std::string>(const std::string &expression)>;

    // Integer value of a remote enum (e.g. "PARTTYPE"), when known locally
    using EnumLookup = std::function<std::optional<int64_t>(const std::string &name)>;

    struct MarshalledResult {
        // Rewritten expression: object descriptions replaced by constructor or lookup
        // expressions, bracketed lists wrapped in ensobjlist(...)
        std::string expression;
        Value value;
        size_t references{0};  // object descriptions found
        size_t resolved{0};    // fresh handles created by this pass
        size_t round_trips{0}; // discriminator queries issued
        bool complete{true};   // false when a malformed description stopped the scan
    };

    // Result marshaller
    // Turns evaluated result text into identity-stable proxy handles
    class Marshaller {
      public:
        Marshaller(ProxyCache &cache, const SubtypeTable &subtypes, Evaluator evaluator, EnumLookup enums = nullptr);

        Marshaller(const Marshaller &) = delete;
        Marshaller &operator=(const Marshaller &) = delete;

        // Io or Remote failure only when a discriminator round-trip fails
        Result<MarshalledResult> marshal(const std::string &text);

        // Query sent to learn the discriminator of a polymorphic object
        static std::string discriminator_query(int64_t id, const std::string &attribute);

      private:
        Result<ProxyPtr> resolve(const ObjectReference &reference, MarshalledResult &result);
        std::string constructor_expression(const ProxyHandle &handle) const;

        ProxyCache &cache_;
        const SubtypeTable &subtypes_;
        Evaluator evaluator_;
        EnumLookup enums_;
    };

} // namespace enslink::proxy
