#pragma once
#include <stowage/schema/assignment.hpp>
#include <stowage/schema/operator_state.hpp>
#include <stowage/schema/primitives.hpp>
#include <optional>

namespace stowage::assignment {

/// Chunk range this node holds for `quorum_id` under `quantization_factor`.
///
/// Each operator of the quorum receives
/// `ceil(stake * operator_count * quantization_factor / total_stake)` chunks,
/// laid out in operator-index order. Returns std::nullopt when this node is
/// not an operator of the quorum or is due zero chunks.
std::optional<stowage::schema::assignment_t> resolve(
    const stowage::schema::operator_state_t& state,
    stowage::schema::quorum_id_t quorum_id,
    uint32_t quantization_factor);

}  // namespace stowage::assignment
