#include <enslink/utils/random.hpp>

#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace enslink::utils {

    namespace {
        char nibble_to_hex(uint8_t nibble) {
            return static_cast<char>(nibble < 10 ? '0' + nibble : 'a' + (nibble - 10));
        }
    } // namespace

    void ensure_sodium_init() {
        static std::once_flag sodium_flag;
        static int status = -1;
        std::call_once(sodium_flag, []() { status = sodium_init(); });

        if (status < 0) {
            throw std::runtime_error("libsodium initialization failed");
        }
    }

    std::vector<uint8_t> generate_random_bytes(size_t size) {
        ensure_sodium_init();
        std::vector<uint8_t> bytes(size);
        randombytes_buf(bytes.data(), bytes.size());
        return bytes;
    }

    std::string bytes_to_hex(const std::vector<uint8_t> &data) {
        std::string hex;
        hex.reserve(data.size() * 2);
        for (uint8_t byte : data) {
            hex.push_back(nibble_to_hex((byte >> 4) & 0x0F));
            hex.push_back(nibble_to_hex(byte & 0x0F));
        }
        return hex;
    }

    std::string generate_uuid() {
        auto bytes = generate_random_bytes(16);
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

        auto hex = bytes_to_hex(bytes);
        std::string uuid;
        uuid.reserve(36);
        uuid.append(hex, 0, 8).push_back('-');
        uuid.append(hex, 8, 4).push_back('-');
        uuid.append(hex, 12, 4).push_back('-');
        uuid.append(hex, 16, 4).push_back('-');
        uuid.append(hex, 20, 12);
        return uuid;
    }

    std::string make_session_prefix() { return "grpc://" + generate_uuid() + "/"; }

} // namespace enslink::utils
