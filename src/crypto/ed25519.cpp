#include <stowage/crypto/ed25519.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <memory>

namespace stowage::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

evp_pkey_ptr private_key(const ed25519_seed_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(
                          EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
                      EVP_PKEY_free};
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

std::optional<ed25519_public_key_t> public_key(const ed25519_seed_t& seed) {
  auto pkey = private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto out = ed25519_public_key_t{};
  auto length = out.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), out.data(), &length) != 1 ||
      length != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::optional<ed25519_signature_t> sign(
    const ed25519_seed_t& seed,
    const stowage::schema::bytes_view_t& message) {
  auto pkey = private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }

  auto out = ed25519_signature_t{};
  auto length = out.size();
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  if (EVP_DigestSign(ctx.get(), out.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != out.size()) {
    return std::nullopt;
  }
  return out;
}

bool verify(const ed25519_public_key_t& public_key,
            const stowage::schema::bytes_view_t& message,
            const stowage::schema::bytes_view_t& signature) {
  if (signature.size() != std::tuple_size_v<ed25519_signature_t>) {
    return false;
  }
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

std::optional<ed25519_seed_t> parse_seed(std::string_view hex) {
  auto is_space = [](const char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
  };
  while (!hex.empty() && is_space(hex.front())) {
    hex.remove_prefix(1);
  }
  while (!hex.empty() && is_space(hex.back())) {
    hex.remove_suffix(1);
  }
  auto decoded = stowage::schema::try_from_hex(hex);
  if (!decoded || decoded->size() != std::tuple_size_v<ed25519_seed_t>) {
    return std::nullopt;
  }
  auto seed = ed25519_seed_t{};
  std::ranges::copy(*decoded, std::begin(seed));
  return seed;
}

}  // namespace stowage::crypto
