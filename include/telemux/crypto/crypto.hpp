#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace telemux::crypto {

constexpr size_t DIGEST_SIZE = 32;     // BLAKE2b-256
constexpr size_t OWNER_TOKEN_SIZE = 16;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

// Initialize the crypto subsystem
bool init();

// Generate random bytes
void random_bytes(std::span<uint8_t> output);

// BLAKE2b-256 digest of a payload
Digest payload_digest(std::span<const uint8_t> payload);

// Lowercase hex encoding
std::string to_hex(std::span<const uint8_t> data);

// Random token identifying one engine instance as a claim owner
std::string random_owner_token();

}  // namespace telemux::crypto
