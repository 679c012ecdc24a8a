#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace enslink::proxy {

    // Live stand-in for an object in the remote engine. Carries identity only, never remote state.
    struct ProxyHandle {
        int64_t id{0};
        std::string class_name; // resolved (concrete) class

        // Set when the class was resolved through a discriminator attribute
        std::optional<std::string> discriminator;     // enum name, e.g. "PARTTYPE"
        std::optional<int64_t> discriminator_id;      // enum value of that attribute, when known
        std::optional<int64_t> discriminator_value;

        // Expression naming the remote object inside the engine interpreter
        std::string remote_expression() const { return "ensight.objs.wrap_id(" + std::to_string(id) + ")"; }
    };

    using ProxyPtr = std::shared_ptr<ProxyHandle>;

} // namespace enslink::proxy
