#pragma once
#include <spdlog/common.h>
#include <stowage/schema/primitives.hpp>
#include <stowage/validation/batch_validator.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace stowage::config {

struct node_options final {
  std::string dispersal_address{"0.0.0.0:32005"};
  std::string retrieval_address{"0.0.0.0:32004"};
  std::string db_path{"./data/stowage"};
  std::string signing_key_path;
  std::string operator_state_path;
  std::chrono::seconds snapshot_refresh{12};
  stowage::schema::block_number_t custody_blocks{100800};
  stowage::schema::block_number_t max_reference_lag{150};
  stowage::schema::block_number_t max_reference_lead{5};
  std::chrono::milliseconds timeout{30000};
  std::chrono::seconds expiry_interval{180};
  std::size_t verification_threads{1};
  uint32_t storage_retries{3};
  stowage::validation::blob_rejection_policy rejection_policy{
      stowage::validation::blob_rejection_policy::whole_batch};
  bool allow_unverified_commitments{false};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{"stowage.log"};
};

enum class parse_outcome : uint8_t {
  run = 0,
  help = 1,
  error = 2,
};

/// Parse the command line into `options`. For `help` the usage text is in
/// `message`; for `error` the reason followed by the usage text.
parse_outcome parse_options(int argc,
                            const char* const argv[],
                            node_options& options,
                            std::string& message);

}  // namespace stowage::config
