#include <spdlog/spdlog.h>
#include <stowage/attestation/attestor.hpp>
#include <stowage/common/critical.hpp>

namespace stowage::attestation {

signer_t make_ed25519_signer(const stowage::crypto::ed25519_seed_t& seed) {
  if (!stowage::crypto::available()) {
    stowage::common::critical("OpenSSL does not provide Ed25519");
  }
  auto public_key = stowage::crypto::public_key(seed);
  if (!public_key) {
    stowage::common::critical("Signing key rejected by OpenSSL");
  }
  spdlog::info("Attesting with Ed25519 key {}",
               stowage::schema::to_hex(stowage::schema::bytes_view_t{
                   public_key->data(), public_key->size()}));
  return [seed](const stowage::schema::bytes_view_t& message) {
    auto signature = stowage::crypto::sign(seed, message);
    if (!signature) {
      return stowage::schema::bytes_t{};
    }
    return stowage::schema::bytes_t{std::begin(*signature),
                                    std::end(*signature)};
  };
}

attestor::attestor(signer_t signer) : signer_{std::move(signer)} {}

stowage::schema::status_t attestor::attest(
    const stowage::store::commit_receipt& receipt,
    stowage::schema::bytes_t& signature) const {
  const auto& hash = receipt.batch_header_hash();
  signature = signer_(stowage::schema::bytes_view_t{hash.data(), hash.size()});
  if (signature.empty()) {
    spdlog::error("Signer produced no signature for batch {}",
                  stowage::schema::to_hex(hash));
    return stowage::schema::make_error(
        stowage::schema::error_code::signing,
        "signer produced no signature for batch " +
            stowage::schema::to_hex(hash));
  }
  return stowage::schema::make_ok();
}

}  // namespace stowage::attestation
