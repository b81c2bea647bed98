#pragma once

#include <stowage/schema/primitives.hpp>
#include <array>
#include <optional>

namespace stowage::crypto {

using ed25519_seed_t = std::array<uint8_t, 32>;
using ed25519_public_key_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;

/// True when the linked OpenSSL provides Ed25519.
bool available();

std::optional<ed25519_public_key_t> public_key(const ed25519_seed_t& seed);

std::optional<ed25519_signature_t> sign(
    const ed25519_seed_t& seed,
    const stowage::schema::bytes_view_t& message);

bool verify(const ed25519_public_key_t& public_key,
            const stowage::schema::bytes_view_t& message,
            const stowage::schema::bytes_view_t& signature);

/// Parse a hex-encoded 32-byte seed, surrounding whitespace ignored.
std::optional<ed25519_seed_t> parse_seed(std::string_view hex);

}  // namespace stowage::crypto
