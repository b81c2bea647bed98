#include <stowage/merkle/merkle_tree.hpp>
#include <stowage/schema/hash.hpp>
#include <stowage/testing/node_fixture.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <optional>
#include <vector>

namespace {

using stowage::schema::error_code;
using clock_type = stowage::dispersal::engine::clock_type;

struct request final {
  stowage::schema::batch_header_t header;
  std::vector<stowage::schema::blob_t> blobs;
};

request make_request(const stowage::schema::operator_state_t& state,
                     const std::vector<std::vector<stowage::schema::quorum_id_t>>&
                         blob_quorums,
                     const uint8_t seed = 10) {
  auto out = request{};
  for (std::size_t i = 0; i < blob_quorums.size(); ++i) {
    out.blobs.push_back(stowage::testing::make_blob(
        blob_quorums[i], state, static_cast<uint8_t>(seed + (i * 16))));
  }
  out.header = stowage::testing::make_batch_header(out.blobs);
  return out;
}

bool batch_exists(stowage::testing::node_fixture& node,
                  const stowage::schema::hash32_t& hash) {
  auto record = std::optional<stowage::schema::batch_record_t>{};
  EXPECT_TRUE(stowage::schema::is_ok(node.store().get_batch(hash, record)));
  return record.has_value();
}

}  // namespace

TEST(engine, stores_attests_and_serves_batch) {
  auto node = stowage::testing::node_fixture{"stowage_engine_store"};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0, 1}, {1}});

  auto result = node.engine().store_chunks(req.header, req.blobs);
  ASSERT_TRUE(stowage::schema::is_ok(result.status)) << result.status.log;
  EXPECT_FALSE(result.already_stored);
  EXPECT_FALSE(result.signature.empty());
  EXPECT_EQ(result.batch_header_hash,
            stowage::schema::hash_batch_header(req.header));
  EXPECT_EQ(node.sign_calls(), 1u);
  EXPECT_EQ(node.backend().frame_checks.load(), 3u);

  auto chunks = node.retrieval().retrieve_chunks(result.batch_header_hash, 0, 1);
  ASSERT_TRUE(stowage::schema::is_ok(chunks.status));
  EXPECT_EQ(chunks.chunks, req.blobs[0].bundles[1]);

  chunks = node.retrieval().retrieve_chunks(result.batch_header_hash, 1, 1);
  ASSERT_TRUE(stowage::schema::is_ok(chunks.status));
  EXPECT_EQ(chunks.chunks, req.blobs[1].bundles[0]);
}

TEST(engine, repeated_batch_returns_same_attestation_without_rewriting) {
  auto node = stowage::testing::node_fixture{"stowage_engine_repeat"};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0}, {0, 1}});

  auto first = node.engine().store_chunks(req.header, req.blobs);
  ASSERT_TRUE(stowage::schema::is_ok(first.status));
  auto second = node.engine().store_chunks(req.header, req.blobs);
  ASSERT_TRUE(stowage::schema::is_ok(second.status));

  EXPECT_FALSE(first.already_stored);
  EXPECT_TRUE(second.already_stored);
  EXPECT_EQ(first.signature, second.signature);
  EXPECT_EQ(first.batch_header_hash, second.batch_header_hash);
}

TEST(engine, same_header_with_different_chunks_is_rejected) {
  auto node = stowage::testing::node_fixture{"stowage_engine_conflict"};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0}});
  ASSERT_TRUE(stowage::schema::is_ok(
      node.engine().store_chunks(req.header, req.blobs).status));

  auto altered = req.blobs;
  altered[0].bundles[0][0][5] ^= 0x01;
  auto result = node.engine().store_chunks(req.header, altered);
  EXPECT_EQ(result.status.code, error_code::validation);
  EXPECT_TRUE(result.signature.empty());
  EXPECT_EQ(node.sign_calls(), 1u);
}

TEST(engine, failing_blob_stores_nothing) {
  auto node = stowage::testing::node_fixture{"stowage_engine_atomic"};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0}, {0, 1}, {1}});
  node.backend().reject_frames(req.blobs[1].header.commitment);

  auto result = node.engine().store_chunks(req.header, req.blobs);
  EXPECT_EQ(result.status.code, error_code::commitment);
  EXPECT_TRUE(result.signature.empty());
  EXPECT_EQ(node.sign_calls(), 0u);
  EXPECT_FALSE(batch_exists(node, result.batch_header_hash));

  auto chunks = node.retrieval().retrieve_chunks(result.batch_header_hash, 0, 0);
  EXPECT_EQ(chunks.status.code, error_code::not_found);
}

TEST(engine, length_proof_failure_rejects_batch) {
  auto node = stowage::testing::node_fixture{"stowage_engine_length"};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0}, {1}});
  node.backend().reject_length(req.blobs[0].header.commitment);

  auto result = node.engine().store_chunks(req.header, req.blobs);
  EXPECT_EQ(result.status.code, error_code::commitment);
  EXPECT_FALSE(batch_exists(node, result.batch_header_hash));
}

TEST(engine, missing_operator_state_is_an_assignment_error) {
  auto node = stowage::testing::node_fixture{"stowage_engine_nostate"};
  auto state = stowage::testing::make_operator_state({0, 1});
  auto req = make_request(state, {{0}});

  auto result = node.engine().store_chunks(req.header, req.blobs);
  EXPECT_EQ(result.status.code, error_code::assignment);
  EXPECT_EQ(node.backend().frame_checks.load(), 0u);

  // A snapshot taken after the reference block does not apply either.
  node.publish(stowage::testing::make_operator_state(
      {0, 1}, {0, 1}, stowage::testing::kReferenceBlock + 1));
  result = node.engine().store_chunks(req.header, req.blobs);
  EXPECT_EQ(result.status.code, error_code::assignment);
}

TEST(engine, elapsed_deadline_times_out_without_writing) {
  auto node = stowage::testing::node_fixture{"stowage_engine_deadline"};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0}, {1}});

  auto result = node.engine().store_chunks(
      req.header, req.blobs, clock_type::now() - std::chrono::milliseconds{1});
  EXPECT_EQ(result.status.code, error_code::timeout);
  EXPECT_EQ(node.sign_calls(), 0u);
  EXPECT_FALSE(batch_exists(node, result.batch_header_hash));
}

TEST(engine, concurrent_duplicates_write_once_and_agree) {
  auto node = stowage::testing::node_fixture{"stowage_engine_concurrent"};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0, 1}, {0}, {1}});

  auto calls = std::vector<std::future<stowage::schema::store_result_t>>{};
  for (int i = 0; i < 8; ++i) {
    calls.push_back(std::async(std::launch::async, [&]() {
      return node.engine().store_chunks(req.header, req.blobs);
    }));
  }

  auto fresh = 0;
  auto signature = std::optional<stowage::schema::bytes_t>{};
  for (auto& call : calls) {
    auto result = call.get();
    ASSERT_TRUE(stowage::schema::is_ok(result.status)) << result.status.log;
    if (!result.already_stored) {
      ++fresh;
    }
    if (!signature) {
      signature = result.signature;
    }
    EXPECT_EQ(result.signature, *signature);
  }
  EXPECT_EQ(fresh, 1);
}

TEST(engine, batch_disappears_once_custody_ends) {
  auto node = stowage::testing::node_fixture{"stowage_engine_custody"};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0}});
  auto result = node.engine().store_chunks(req.header, req.blobs);
  ASSERT_TRUE(stowage::schema::is_ok(result.status));

  // Custody is 50 blocks past the reference block.
  node.registry().set_current_block_number(150);
  EXPECT_TRUE(stowage::schema::is_ok(
      node.retrieval().retrieve_chunks(result.batch_header_hash, 0, 0).status));

  node.registry().set_current_block_number(151);
  EXPECT_EQ(
      node.retrieval().retrieve_chunks(result.batch_header_hash, 0, 0).status.code,
      error_code::not_found);
  EXPECT_TRUE(batch_exists(node, result.batch_header_hash));

  auto expired = std::size_t{0};
  ASSERT_TRUE(stowage::schema::is_ok(node.store().expire(151, expired)));
  EXPECT_EQ(expired, 1u);
  EXPECT_FALSE(batch_exists(node, result.batch_header_hash));
}

TEST(engine, batch_past_custody_is_neither_stored_nor_attested) {
  auto node = stowage::testing::node_fixture{"stowage_engine_past_custody"};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0}});

  // Within the reference lag, but custody of block 100 ended at block 150.
  node.registry().set_current_block_number(151);
  auto result = node.engine().store_chunks(req.header, req.blobs);
  EXPECT_EQ(result.status.code, error_code::validation);
  EXPECT_TRUE(result.signature.empty());
  EXPECT_EQ(node.sign_calls(), 0u);
  EXPECT_FALSE(batch_exists(node, result.batch_header_hash));
}

TEST(engine, repeated_store_after_custody_ended_is_not_reattested) {
  auto node = stowage::testing::node_fixture{"stowage_engine_repeat_custody"};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0}});
  ASSERT_TRUE(stowage::schema::is_ok(
      node.engine().store_chunks(req.header, req.blobs).status));
  EXPECT_EQ(node.sign_calls(), 1u);

  node.registry().set_current_block_number(151);
  auto repeat = node.engine().store_chunks(req.header, req.blobs);
  EXPECT_EQ(repeat.status.code, error_code::validation);
  EXPECT_FALSE(repeat.already_stored);
  EXPECT_TRUE(repeat.signature.empty());
  EXPECT_EQ(node.sign_calls(), 1u);
}

TEST(engine, signer_failure_is_reported_without_attestation) {
  auto options = stowage::testing::node_fixture_options{};
  options.signer = [](const stowage::schema::bytes_view_t&) {
    return stowage::schema::bytes_t{};
  };
  auto node = stowage::testing::node_fixture{"stowage_engine_signer", options};
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  auto req = make_request(state, {{0}});

  auto result = node.engine().store_chunks(req.header, req.blobs);
  EXPECT_EQ(result.status.code, error_code::signing);
  EXPECT_TRUE(result.signature.empty());
  // The durable write already happened; a later store re-attests it.
  EXPECT_TRUE(batch_exists(node, result.batch_header_hash));
}

TEST(engine, unassigned_blob_under_whole_batch_policy_rejects_batch) {
  auto node = stowage::testing::node_fixture{"stowage_engine_whole"};
  auto state = stowage::testing::make_operator_state({1});
  node.publish(state);
  auto req = make_request(state, {{0}, {1}});

  auto result = node.engine().store_chunks(req.header, req.blobs);
  EXPECT_EQ(result.status.code, error_code::assignment);
  EXPECT_FALSE(batch_exists(node, result.batch_header_hash));
}

TEST(engine, unassigned_blob_under_per_blob_policy_keeps_header_only) {
  auto options = stowage::testing::node_fixture_options{};
  options.rejection_policy = stowage::validation::blob_rejection_policy::per_blob;
  auto node = stowage::testing::node_fixture{"stowage_engine_perblob", options};
  auto state = stowage::testing::make_operator_state({1});
  node.publish(state);
  auto req = make_request(state, {{0}, {1}});

  auto result = node.engine().store_chunks(req.header, req.blobs);
  ASSERT_TRUE(stowage::schema::is_ok(result.status)) << result.status.log;
  EXPECT_EQ(node.backend().frame_checks.load(), 1u);

  auto chunks = node.retrieval().retrieve_chunks(result.batch_header_hash, 0, 0);
  EXPECT_EQ(chunks.status.code, error_code::not_found);
  chunks = node.retrieval().retrieve_chunks(result.batch_header_hash, 1, 1);
  ASSERT_TRUE(stowage::schema::is_ok(chunks.status));
  EXPECT_EQ(chunks.chunks, req.blobs[1].bundles[0]);

  for (uint32_t index = 0; index < 2; ++index) {
    auto quorum = static_cast<uint32_t>(index);
    auto header =
        node.retrieval().get_blob_header(result.batch_header_hash, index, quorum);
    ASSERT_TRUE(stowage::schema::is_ok(header.status)) << header.status.log;
    EXPECT_EQ(header.proof.index, index);
    EXPECT_TRUE(stowage::merkle::verify(
        stowage::schema::hash_blob_header(header.header), header.proof,
        req.header.batch_root));
  }
}
