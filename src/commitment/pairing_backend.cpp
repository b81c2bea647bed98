#include <spdlog/spdlog.h>
#include <stowage/commitment/pairing_backend.hpp>

namespace stowage::commitment {

bool rejecting_backend::verify_frames(const stowage::schema::bytes_view_t&,
                                      std::span<const stowage::schema::bytes_t>,
                                      uint32_t,
                                      uint32_t,
                                      uint32_t) const {
  return false;
}

bool rejecting_backend::verify_length(const stowage::schema::bytes_view_t&,
                                      const stowage::schema::bytes_view_t&,
                                      uint32_t) const {
  return false;
}

bool structural_backend::verify_frames(
    const stowage::schema::bytes_view_t&,
    std::span<const stowage::schema::bytes_t>,
    uint32_t,
    uint32_t,
    uint32_t) const {
  return true;
}

bool structural_backend::verify_length(const stowage::schema::bytes_view_t&,
                                       const stowage::schema::bytes_view_t&,
                                       uint32_t) const {
  return true;
}

std::shared_ptr<const pairing_backend> make_pairing_backend(
    const bool allow_unverified_commitments) {
  if (allow_unverified_commitments) {
    spdlog::warn(
        "Commitment pairing checks are disabled; chunks are verified for "
        "shape only");
    return std::make_shared<structural_backend>();
  }
  spdlog::info(
      "No pairing library linked; every store request will fail commitment "
      "verification");
  return std::make_shared<rejecting_backend>();
}

}  // namespace stowage::commitment
