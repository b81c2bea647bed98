#pragma once
#include <stowage/schema/blob.hpp>
#include <stowage/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <span>

namespace stowage::commitment {

/// Pairing checks the node delegates to an external KZG implementation.
///
/// Inputs are serialized group elements: the commitment is a compressed G1
/// point, the length proof a compressed G2 point, and each frame is a G1
/// opening proof followed by `chunk_length` field elements.
class pairing_backend {
 public:
  virtual ~pairing_backend() = default;

  /// True when `frames` are the evaluations at positions
  /// `[start_index, start_index + frames.size())` of the polynomial bound by
  /// `commitment`, encoded into `total_chunks` chunks of `chunk_length`.
  virtual bool verify_frames(
      const stowage::schema::bytes_view_t& commitment,
      std::span<const stowage::schema::bytes_t> frames,
      uint32_t start_index,
      uint32_t chunk_length,
      uint32_t total_chunks) const = 0;

  /// True when `length_proof` bounds the degree of the committed polynomial
  /// to `length` symbols.
  virtual bool verify_length(const stowage::schema::bytes_view_t& commitment,
                             const stowage::schema::bytes_view_t& length_proof,
                             uint32_t length) const = 0;
};

/// Fails every check. Installed when no pairing library is linked so that the
/// node never attests to data it could not verify.
class rejecting_backend final : public pairing_backend {
 public:
  bool verify_frames(const stowage::schema::bytes_view_t& commitment,
                     std::span<const stowage::schema::bytes_t> frames,
                     uint32_t start_index,
                     uint32_t chunk_length,
                     uint32_t total_chunks) const override;
  bool verify_length(const stowage::schema::bytes_view_t& commitment,
                     const stowage::schema::bytes_view_t& length_proof,
                     uint32_t length) const override;
};

/// Passes every pairing check. Shape checks still run in the verifier, so
/// this only skips the cryptographic binding.
class structural_backend final : public pairing_backend {
 public:
  bool verify_frames(const stowage::schema::bytes_view_t& commitment,
                     std::span<const stowage::schema::bytes_t> frames,
                     uint32_t start_index,
                     uint32_t chunk_length,
                     uint32_t total_chunks) const override;
  bool verify_length(const stowage::schema::bytes_view_t& commitment,
                     const stowage::schema::bytes_view_t& length_proof,
                     uint32_t length) const override;
};

std::shared_ptr<const pairing_backend> make_pairing_backend(
    bool allow_unverified_commitments);

}  // namespace stowage::commitment
