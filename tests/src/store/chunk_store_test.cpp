#include <stowage/merkle/merkle_index.hpp>
#include <stowage/schema/hash.hpp>
#include <stowage/store/expiry_worker.hpp>
#include <stowage/testing/node_fixture.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <vector>

namespace {

using stowage::schema::error_code;

constexpr auto kCurrent = stowage::testing::kReferenceBlock;

struct staged_batch final {
  stowage::schema::batch_header_t header;
  std::vector<stowage::schema::blob_t> blobs;
};

staged_batch make_batch(const uint8_t seed) {
  auto state = stowage::testing::make_operator_state({0, 1});
  auto batch = staged_batch{};
  batch.blobs.push_back(stowage::testing::make_blob({0, 1}, state, seed));
  batch.blobs.push_back(stowage::testing::make_blob({0}, state, seed + 10));
  batch.header = stowage::testing::make_batch_header(batch.blobs);
  return batch;
}

stowage::store::transaction stage(const stowage::store::chunk_store& store,
                                  const staged_batch& batch) {
  auto tx = store.begin(batch.header,
                        static_cast<uint32_t>(batch.blobs.size()));
  auto headers = std::vector<stowage::schema::blob_header_t>{};
  for (uint32_t i = 0; i < batch.blobs.size(); ++i) {
    const auto& blob = batch.blobs[i];
    headers.push_back(blob.header);
    store.put_blob_header(tx, i, blob.header);
    for (std::size_t q = 0; q < blob.bundles.size(); ++q) {
      store.put(tx, i, blob.header.quorum_headers[q].quorum_id,
                blob.bundles[q]);
    }
  }
  store.put_merkle(tx, stowage::merkle::merkle_index::build(headers));
  return tx;
}

}  // namespace

TEST(chunk_store, staged_writes_are_invisible_until_commit) {
  auto node = stowage::testing::node_fixture{"stowage_store_stage"};
  auto batch = make_batch(3);
  auto tx = stage(node.store(), batch);
  EXPECT_EQ(tx.batch_header_hash(),
            stowage::schema::hash_batch_header(batch.header));

  auto chunks = stowage::schema::bundle_t{};
  EXPECT_EQ(node.store().get(tx.batch_header_hash(), 0, 0, chunks).code,
            error_code::not_found);

  auto receipt = std::optional<stowage::store::commit_receipt>{};
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().commit(std::move(tx), kCurrent, receipt)));
  ASSERT_TRUE(receipt.has_value());
  EXPECT_FALSE(receipt->already_stored());
  EXPECT_EQ(receipt->batch_header().batch_root, batch.header.batch_root);

  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().get(receipt->batch_header_hash(), 0, 1, chunks)));
  EXPECT_EQ(chunks, batch.blobs[0].bundles[1]);

  auto header = std::optional<stowage::schema::blob_header_t>{};
  ASSERT_TRUE(stowage::schema::is_ok(node.store().get_blob_header(
      receipt->batch_header_hash(), 1, header)));
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(stowage::schema::hash_blob_header(*header),
            stowage::schema::hash_blob_header(batch.blobs[1].header));

  auto record = std::optional<stowage::schema::batch_record_t>{};
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().get_batch(receipt->batch_header_hash(), record)));
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->blob_count, 2u);
  EXPECT_EQ(record->reference_block_number, stowage::testing::kReferenceBlock);
  EXPECT_EQ(record->expiry_block, stowage::testing::kReferenceBlock + 50);
}

TEST(chunk_store, missing_bundle_is_not_found) {
  auto node = stowage::testing::node_fixture{"stowage_store_missing"};
  auto batch = make_batch(4);
  auto receipt = std::optional<stowage::store::commit_receipt>{};
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().commit(stage(node.store(), batch), kCurrent, receipt)));

  auto chunks = stowage::schema::bundle_t{};
  EXPECT_EQ(node.store().get(receipt->batch_header_hash(), 1, 1, chunks).code,
            error_code::not_found);
  EXPECT_EQ(node.store().get(receipt->batch_header_hash(), 7, 0, chunks).code,
            error_code::not_found);
  EXPECT_TRUE(chunks.empty());
}

TEST(chunk_store, recommitting_identical_batch_writes_nothing) {
  auto node = stowage::testing::node_fixture{"stowage_store_idempotent"};
  auto batch = make_batch(5);
  auto first = std::optional<stowage::store::commit_receipt>{};
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().commit(stage(node.store(), batch), kCurrent, first)));

  auto second = std::optional<stowage::store::commit_receipt>{};
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().commit(stage(node.store(), batch), kCurrent, second)));
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(second->already_stored());
  EXPECT_EQ(second->batch_header_hash(), first->batch_header_hash());
}

TEST(chunk_store, recommitting_different_content_is_a_conflict) {
  auto node = stowage::testing::node_fixture{"stowage_store_conflict"};
  auto batch = make_batch(6);
  auto receipt = std::optional<stowage::store::commit_receipt>{};
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().commit(stage(node.store(), batch), kCurrent, receipt)));

  auto altered = batch;
  altered.blobs[0].bundles[0][0][0] ^= 0xFF;
  receipt.reset();
  auto status =
      node.store().commit(stage(node.store(), altered), kCurrent, receipt);
  EXPECT_EQ(status.code, error_code::validation);
  EXPECT_FALSE(receipt.has_value());

  // Fewer bundles than stored is also different content.
  auto reduced = node.store().begin(batch.header, 2);
  for (uint32_t i = 0; i < batch.blobs.size(); ++i) {
    node.store().put_blob_header(reduced, i, batch.blobs[i].header);
  }
  status = node.store().commit(std::move(reduced), kCurrent, receipt);
  EXPECT_EQ(status.code, error_code::validation);

  auto chunks = stowage::schema::bundle_t{};
  ASSERT_TRUE(stowage::schema::is_ok(node.store().get(
      stowage::schema::hash_batch_header(batch.header), 0, 0, chunks)));
  EXPECT_EQ(chunks, batch.blobs[0].bundles[0]);
}

TEST(chunk_store, recommitting_after_custody_ended_is_rejected) {
  auto node = stowage::testing::node_fixture{"stowage_store_past_custody"};
  auto batch = make_batch(11);
  auto receipt = std::optional<stowage::store::commit_receipt>{};
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().commit(stage(node.store(), batch), kCurrent, receipt)));
  EXPECT_EQ(receipt->batch_header().reference_block_number, kCurrent);

  // Custody of a batch referencing block 100 ends at block 150.
  receipt.reset();
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().commit(stage(node.store(), batch), 150, receipt)));
  EXPECT_TRUE(receipt->already_stored());

  receipt.reset();
  auto status = node.store().commit(stage(node.store(), batch), 151, receipt);
  EXPECT_EQ(status.code, error_code::validation);
  EXPECT_FALSE(receipt.has_value());
}

TEST(chunk_store, expire_removes_batches_whose_custody_ended) {
  auto node = stowage::testing::node_fixture{"stowage_store_expire"};
  auto early = make_batch(7);
  auto late = make_batch(8);
  late.header = stowage::testing::make_batch_header(late.blobs, 120);

  auto receipt = std::optional<stowage::store::commit_receipt>{};
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().commit(stage(node.store(), early), kCurrent, receipt)));
  auto early_hash = receipt->batch_header_hash();
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().commit(stage(node.store(), late), kCurrent, receipt)));
  auto late_hash = receipt->batch_header_hash();

  auto expired = std::size_t{0};
  ASSERT_TRUE(stowage::schema::is_ok(node.store().expire(150, expired)));
  EXPECT_EQ(expired, 0u);

  ASSERT_TRUE(stowage::schema::is_ok(node.store().expire(151, expired)));
  EXPECT_EQ(expired, 1u);

  auto record = std::optional<stowage::schema::batch_record_t>{};
  ASSERT_TRUE(stowage::schema::is_ok(node.store().get_batch(early_hash, record)));
  EXPECT_FALSE(record.has_value());
  auto chunks = stowage::schema::bundle_t{};
  EXPECT_EQ(node.store().get(early_hash, 0, 0, chunks).code,
            error_code::not_found);
  auto header = std::optional<stowage::schema::blob_header_t>{};
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().get_blob_header(early_hash, 0, header)));
  EXPECT_FALSE(header.has_value());
  auto tree = std::optional<stowage::merkle::merkle_tree>{};
  ASSERT_TRUE(stowage::schema::is_ok(node.index().load(early_hash, tree)));
  EXPECT_FALSE(tree.has_value());

  ASSERT_TRUE(stowage::schema::is_ok(node.store().get(late_hash, 0, 0, chunks)));

  ASSERT_TRUE(stowage::schema::is_ok(node.store().expire(1000, expired)));
  EXPECT_EQ(expired, 1u);
  EXPECT_EQ(node.store().get(late_hash, 0, 0, chunks).code,
            error_code::not_found);
}

TEST(chunk_store, expiry_is_strictly_after_custody_end) {
  auto record = stowage::schema::batch_record_t{
      .reference_block_number = 10, .blob_count = 1, .expiry_block = 60};
  EXPECT_FALSE(stowage::store::chunk_store::is_expired(record, 59));
  EXPECT_FALSE(stowage::store::chunk_store::is_expired(record, 60));
  EXPECT_TRUE(stowage::store::chunk_store::is_expired(record, 61));
}

TEST(expiry_worker, pass_uses_registry_chain_height) {
  auto node = stowage::testing::node_fixture{"stowage_store_worker"};
  auto batch = make_batch(9);
  auto receipt = std::optional<stowage::store::commit_receipt>{};
  ASSERT_TRUE(stowage::schema::is_ok(
      node.store().commit(stage(node.store(), batch), kCurrent, receipt)));

  auto worker = stowage::store::expiry_worker{node.store(), node.registry(),
                                              std::chrono::seconds{3600}};
  EXPECT_EQ(worker.run_once(), 0u);

  node.registry().set_current_block_number(151);
  EXPECT_EQ(worker.run_once(), 1u);
  EXPECT_EQ(worker.run_once(), 0u);

  worker.start();
  worker.stop();
}
