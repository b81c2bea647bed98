#include <stowage/assignment/resolver.hpp>

#include <algorithm>
#include <limits>
#include <vector>

namespace stowage::assignment {

namespace {

stowage::schema::stake_t ceil_divide(const stowage::schema::stake_t& num,
                                     const stowage::schema::stake_t& denom) {
  return (num + denom - 1) / denom;
}

}  // namespace

std::optional<stowage::schema::assignment_t> resolve(
    const stowage::schema::operator_state_t& state,
    const stowage::schema::quorum_id_t quorum_id,
    const uint32_t quantization_factor) {
  auto quorum = state.quorums.find(quorum_id);
  if (quorum == std::end(state.quorums) || quorum->second.empty() ||
      quantization_factor == 0) {
    return std::nullopt;
  }

  auto operators = quorum->second;
  std::ranges::sort(operators, {}, &stowage::schema::operator_stake_t::index);

  auto total_stake = stowage::schema::stake_t{};
  for (const auto& entry : operators) {
    total_stake += entry.stake;
  }
  if (total_stake == 0) {
    return std::nullopt;
  }

  auto multiplier = stowage::schema::stake_t{operators.size()} *
                    stowage::schema::stake_t{quantization_factor};
  auto result = std::optional<stowage::schema::assignment_t>{};
  auto offset = stowage::schema::stake_t{};
  for (const auto& entry : operators) {
    auto chunks = ceil_divide(entry.stake * multiplier, total_stake);
    if (entry.operator_id == state.self && chunks > 0) {
      result = stowage::schema::assignment_t{
          .start_index = static_cast<uint32_t>(offset),
          .num_chunks = static_cast<uint32_t>(chunks)};
    }
    offset += chunks;
  }
  if (!result || offset > std::numeric_limits<uint32_t>::max()) {
    return std::nullopt;
  }
  result->total_chunks = static_cast<uint32_t>(offset);
  return result;
}

}  // namespace stowage::assignment
