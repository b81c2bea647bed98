#include <google/protobuf/text_format.h>
#include <spdlog/spdlog.h>
#include <stowage/assignment/snapshot_file.hpp>
#include <stowage/node/operator_state.pb.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace stowage::assignment {

namespace {

bool parse_stake(const std::string& text, stowage::schema::stake_t& stake) {
  if (text.empty() ||
      text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  try {
    stake = stowage::schema::stake_t{text};
  } catch (const std::runtime_error&) {
    return false;
  }
  return true;
}

}  // namespace

bool parse_snapshots(std::string_view text,
                     std::vector<stowage::schema::operator_state_t>& states,
                     stowage::schema::block_number_t& current_block_number,
                     std::string& error) {
  states.clear();
  auto message = stowage::node::OperatorStateSnapshots{};
  if (!google::protobuf::TextFormat::ParseFromString(std::string{text},
                                                     &message)) {
    error = "not a valid OperatorStateSnapshots document";
    return false;
  }

  auto self = stowage::schema::try_make_hash32(
      std::string_view{message.self_operator_id()});
  if (!self) {
    error = "self_operator_id must be 32 hex-encoded bytes";
    return false;
  }

  for (const auto& snapshot : message.snapshots()) {
    auto state = stowage::schema::operator_state_t{
        .block_number = snapshot.block_number(), .self = *self};
    for (const auto& quorum : snapshot.quorums()) {
      if (quorum.quorum_id() > stowage::schema::kMaxQuorumId) {
        error = "quorum id " + std::to_string(quorum.quorum_id()) +
                " out of range";
        return false;
      }
      auto& operators =
          state.quorums[static_cast<stowage::schema::quorum_id_t>(
              quorum.quorum_id())];
      for (const auto& entry : quorum.operators()) {
        auto id = stowage::schema::try_make_hash32(
            std::string_view{entry.operator_id()});
        if (!id) {
          error = "operator id '" + entry.operator_id() + "' is not 32 bytes";
          return false;
        }
        auto stake = stowage::schema::stake_t{};
        if (!parse_stake(entry.stake(), stake)) {
          error = "stake '" + entry.stake() + "' is not a decimal amount";
          return false;
        }
        operators.push_back(stowage::schema::operator_stake_t{
            .operator_id = *id, .index = entry.index(), .stake = stake});
      }
    }
    states.push_back(std::move(state));
  }
  current_block_number = message.current_block_number();
  return true;
}

snapshot_file_source::snapshot_file_source(std::string path,
                                           snapshot_registry& registry)
    : path_{std::move(path)}, registry_{registry} {}

bool snapshot_file_source::refresh() {
  auto file = std::ifstream{path_};
  if (!file) {
    spdlog::error("Cannot open operator state file {}", path_);
    return false;
  }
  auto buffer = std::stringstream{};
  buffer << file.rdbuf();

  auto states = std::vector<stowage::schema::operator_state_t>{};
  auto current = stowage::schema::block_number_t{};
  auto error = std::string{};
  if (!parse_snapshots(buffer.str(), states, current, error)) {
    spdlog::error("Ignoring operator state file {}: {}", path_, error);
    return false;
  }
  spdlog::debug("Loaded {} operator state snapshot(s) at block {}",
                states.size(), current);
  registry_.replace(std::move(states), current);
  return true;
}

}  // namespace stowage::assignment
