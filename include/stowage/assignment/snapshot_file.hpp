#pragma once
#include <stowage/assignment/snapshot_registry.hpp>
#include <stowage/schema/operator_state.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace stowage::assignment {

/// Parse an `OperatorStateSnapshots` text-format document. On failure
/// returns false and describes the problem in `error`.
bool parse_snapshots(std::string_view text,
                     std::vector<stowage::schema::operator_state_t>& states,
                     stowage::schema::block_number_t& current_block_number,
                     std::string& error);

/// Feeds a registry from a snapshot file maintained by the operator indexer.
class snapshot_file_source final {
 public:
  snapshot_file_source(std::string path, snapshot_registry& registry);

  /// Reload the file. A file that cannot be read or parsed leaves the
  /// registry untouched.
  bool refresh();

 private:
  std::string path_;
  snapshot_registry& registry_;
};

}  // namespace stowage::assignment
