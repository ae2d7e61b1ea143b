#include "telemux/crypto/crypto.hpp"

#include <sodium.h>

namespace telemux::crypto {

bool init() {
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

void random_bytes(std::span<uint8_t> output) {
    randombytes_buf(output.data(), output.size());
}

Digest payload_digest(std::span<const uint8_t> payload) {
    Digest digest{};
    crypto_generichash(digest.data(), digest.size(),
                       payload.data(), payload.size(),
                       nullptr, 0);
    return digest;
}

std::string to_hex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

std::string random_owner_token() {
    std::array<uint8_t, OWNER_TOKEN_SIZE> token{};
    random_bytes(token);
    return to_hex(token);
}

}  // namespace telemux::crypto
