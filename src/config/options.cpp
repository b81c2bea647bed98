#include <boost/program_options.hpp>
#include <stowage/config/options.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <thread>

namespace stowage::config {

namespace po = boost::program_options;

namespace {

std::string usage(const po::options_description& description) {
  auto out = std::ostringstream{};
  out << description;
  return out.str();
}

}  // namespace

parse_outcome parse_options(const int argc,
                            const char* const argv[],
                            node_options& options,
                            std::string& message) {
  auto refresh_seconds = uint64_t{12};
  auto expiry_seconds = uint64_t{180};
  auto timeout_ms = uint64_t{30000};
  auto threads = std::size_t{std::max(1u, std::thread::hardware_concurrency())};
  auto policy = std::string{"whole_batch"};
  auto log_level = std::string{"info"};

  auto description = po::options_description{"Stowage"};
  description.add_options()("help,h", "Show the help message")(
      "dispersal-address",
      po::value<std::string>(&options.dispersal_address)
          ->default_value(options.dispersal_address),
      "IP:Port for the Dispersal service")(
      "retrieval-address",
      po::value<std::string>(&options.retrieval_address)
          ->default_value(options.retrieval_address),
      "IP:Port for the Retrieval service")(
      "db-path",
      po::value<std::string>(&options.db_path)->default_value(options.db_path),
      "RocksDB directory")(
      "signing-key",
      po::value<std::string>(&options.signing_key_path)->required(),
      "File holding the hex Ed25519 seed used for attestations")(
      "operator-state",
      po::value<std::string>(&options.operator_state_path)->required(),
      "Operator state snapshot file (protobuf text format)")(
      "snapshot-refresh-seconds",
      po::value<uint64_t>(&refresh_seconds)->default_value(refresh_seconds),
      "Operator state reload interval")(
      "custody-blocks",
      po::value<uint64_t>(&options.custody_blocks)
          ->default_value(options.custody_blocks),
      "Custody window in blocks")(
      "max-reference-lag",
      po::value<uint64_t>(&options.max_reference_lag)
          ->default_value(options.max_reference_lag),
      "Blocks a reference block may trail the chain view")(
      "max-reference-lead",
      po::value<uint64_t>(&options.max_reference_lead)
          ->default_value(options.max_reference_lead),
      "Blocks a reference block may lead the chain view")(
      "timeout-ms", po::value<uint64_t>(&timeout_ms)->default_value(timeout_ms),
      "Per-call deadline")(
      "expiry-interval-seconds",
      po::value<uint64_t>(&expiry_seconds)->default_value(expiry_seconds),
      "Background expiry period")(
      "verification-threads",
      po::value<std::size_t>(&threads)->default_value(threads),
      "Blobs verified in parallel")(
      "storage-retries",
      po::value<uint32_t>(&options.storage_retries)
          ->default_value(options.storage_retries),
      "Attempts per storage operation")(
      "blob-rejection-policy",
      po::value<std::string>(&policy)->default_value(policy),
      "whole_batch or per_blob")(
      "allow-unverified-commitments",
      po::bool_switch(&options.allow_unverified_commitments),
      "Skip pairing checks (shape checks still run)")(
      "log-level", po::value<std::string>(&log_level)->default_value(log_level),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      po::value<std::string>(&options.log_file)->default_value(options.log_file),
      "Log file path");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("help")) {
      message = usage(description);
      return parse_outcome::help;
    }
    po::notify(vm);
  } catch (const po::error& e) {
    message = std::string{e.what()} + "\n" + usage(description);
    return parse_outcome::error;
  }

  auto parsed_policy = stowage::schema::from_string(
      std::string_view{policy}, stowage::validation::kBlobRejectionPolicyNames);
  if (!parsed_policy) {
    message = "unknown blob rejection policy '" + policy + "'";
    return parse_outcome::error;
  }
  auto parsed_level = spdlog::level::from_str(log_level);
  if (parsed_level == spdlog::level::off && log_level != "off") {
    message = "unknown log level '" + log_level + "'";
    return parse_outcome::error;
  }
  if (threads == 0) {
    message = "verification-threads must be at least 1";
    return parse_outcome::error;
  }
  if (timeout_ms == 0) {
    message = "timeout-ms must be positive";
    return parse_outcome::error;
  }
  if (options.custody_blocks <= options.max_reference_lag) {
    message = "custody-blocks (" + std::to_string(options.custody_blocks) +
              ") must exceed max-reference-lag (" +
              std::to_string(options.max_reference_lag) + ")";
    return parse_outcome::error;
  }

  options.rejection_policy = *parsed_policy;
  options.log_level = parsed_level;
  options.verification_threads = threads;
  options.snapshot_refresh = std::chrono::seconds{refresh_seconds};
  options.expiry_interval = std::chrono::seconds{expiry_seconds};
  options.timeout = std::chrono::milliseconds{timeout_ms};
  return parse_outcome::run;
}

}  // namespace stowage::config
