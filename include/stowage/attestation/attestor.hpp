#pragma once
#include <stowage/crypto/ed25519.hpp>
#include <stowage/schema/primitives.hpp>
#include <stowage/schema/status.hpp>
#include <stowage/store/chunk_store.hpp>
#include <functional>

namespace stowage::attestation {

/// Signs a batch header hash with the node's key. Must be deterministic so
/// that a repeated store of the same batch yields the same attestation.
using signer_t = std::function<stowage::schema::bytes_t(
    const stowage::schema::bytes_view_t& message)>;

/// Ed25519 signer over `seed`. Fatal when OpenSSL rejects the key.
signer_t make_ed25519_signer(const stowage::crypto::ed25519_seed_t& seed);

/// Issues custody attestations. Only a `commit_receipt` can be signed, so a
/// signature always follows the durable write of its batch.
class attestor final {
 public:
  explicit attestor(signer_t signer);

  /// Sign the receipt's batch_header_hash. An empty signature from the signer
  /// is a signing error and leaves `signature` empty.
  stowage::schema::status_t attest(const stowage::store::commit_receipt& receipt,
                                   stowage::schema::bytes_t& signature) const;

 private:
  signer_t signer_;
};

}  // namespace stowage::attestation
