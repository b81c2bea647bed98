#pragma once
#include <stowage/commitment/commitment_verifier.hpp>
#include <stowage/merkle/merkle_tree.hpp>
#include <stowage/schema/batch_header.hpp>
#include <stowage/schema/blob.hpp>
#include <stowage/schema/enum_string.hpp>
#include <stowage/schema/operator_state.hpp>
#include <stowage/schema/primitives.hpp>
#include <stowage/schema/status.hpp>
#include <array>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace stowage::validation {

/// What to do with a blob none of whose quorums assign chunks to this node.
enum class blob_rejection_policy : uint8_t {
  whole_batch = 0,
  per_blob = 1,
};

inline constexpr auto kBlobRejectionPolicyNames =
    std::array<std::pair<std::string_view, blob_rejection_policy>, 2>{{
        {"whole_batch", blob_rejection_policy::whole_batch},
        {"per_blob", blob_rejection_policy::per_blob},
    }};

struct validator_config final {
  stowage::schema::block_number_t max_reference_lag{150};
  stowage::schema::block_number_t max_reference_lead{5};
  /// Blocks past the reference block for which a batch is held.
  stowage::schema::block_number_t custody_blocks{100800};
  blob_rejection_policy rejection_policy{blob_rejection_policy::whole_batch};
};

/// Accepted shape of a batch: the quorums this node verifies and stores per
/// blob, and the inclusion tree recomputed from the headers. A blob with no
/// assigned quorum is stored header-only.
struct batch_plan final {
  stowage::schema::hash32_t batch_header_hash{};
  std::vector<std::vector<stowage::commitment::assigned_bundle>> assigned;
  std::optional<stowage::merkle::merkle_tree> tree;
};

class batch_validator final {
 public:
  explicit batch_validator(validator_config config);

  /// Structural checks, chain drift and custody window, batch root and
  /// assignment enforcement, in that order. Fills `plan` on success.
  stowage::schema::status_t validate(
      const stowage::schema::batch_header_t& header,
      const std::vector<stowage::schema::blob_t>& blobs,
      const stowage::schema::operator_state_t& state,
      stowage::schema::block_number_t current_block_number,
      batch_plan& plan) const;

  const validator_config& config() const;

 private:
  validator_config config_;
};

}  // namespace stowage::validation
