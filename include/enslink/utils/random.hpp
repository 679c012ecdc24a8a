#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace enslink::utils {

    // Initialize libsodium once per process; throws std::runtime_error on failure
    void ensure_sodium_init();

    std::vector<uint8_t> generate_random_bytes(size_t size);

    std::string bytes_to_hex(const std::vector<uint8_t> &data);

    // Random identifier in the canonical 8-4-4-4-12 layout (version 4, RFC 4122 variant)
    std::string generate_uuid();

    // Namespace prefix used to tag event registrations of one session: grpc://{uuid}/
    std::string make_session_prefix();

} // namespace enslink::utils
