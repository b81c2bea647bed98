#pragma once
#include <stowage/schema/primitives.hpp>
#include <map>
#include <vector>

// Schema type: operator state.
// Stake distribution of every quorum at a chain height, as published by the
// operator registry, plus the identity of this node.
namespace stowage::schema {

template <uint16_t Version>
struct operator_stake;

template <>
struct operator_stake<1> final {
  uint16_t version{1};
  operator_id_t operator_id{};
  uint32_t index{};
  stake_t stake{};
};

using operator_stake_t = operator_stake<1>;

template <uint16_t Version>
struct operator_state;

template <>
struct operator_state<1> final {
  uint16_t version{1};
  block_number_t block_number{};
  operator_id_t self{};
  std::map<quorum_id_t, std::vector<operator_stake_t>> quorums;
};

using operator_state_t = operator_state<1>;

}  // namespace stowage::schema
