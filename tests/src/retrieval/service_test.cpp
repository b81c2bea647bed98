#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <stowage/merkle/merkle_tree.hpp>
#include <stowage/schema/hash.hpp>
#include <stowage/schema/key/keys.hpp>
#include <stowage/testing/node_fixture.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using stowage::schema::error_code;

stowage::schema::hash32_t store_batch(stowage::testing::node_fixture& node,
                                      std::vector<stowage::schema::blob_t>& blobs) {
  auto state = stowage::testing::make_operator_state({0, 1});
  node.publish(state);
  blobs.push_back(stowage::testing::make_blob({0}, state, 20));
  blobs.push_back(stowage::testing::make_blob({0, 1}, state, 40));
  blobs.push_back(stowage::testing::make_blob({1}, state, 60));
  auto header = stowage::testing::make_batch_header(blobs);
  auto result = node.engine().store_chunks(header, blobs);
  EXPECT_TRUE(stowage::schema::is_ok(result.status)) << result.status.log;
  return result.batch_header_hash;
}

}  // namespace

TEST(retrieval, serves_chunks_per_blob_and_quorum) {
  auto node = stowage::testing::node_fixture{"stowage_retrieval_chunks"};
  auto blobs = std::vector<stowage::schema::blob_t>{};
  auto hash = store_batch(node, blobs);

  auto result = node.retrieval().retrieve_chunks(hash, 1, 0);
  ASSERT_TRUE(stowage::schema::is_ok(result.status));
  EXPECT_EQ(result.chunks, blobs[1].bundles[0]);
  result = node.retrieval().retrieve_chunks(hash, 2, 1);
  ASSERT_TRUE(stowage::schema::is_ok(result.status));
  EXPECT_EQ(result.chunks, blobs[2].bundles[0]);
}

TEST(retrieval, every_miss_is_not_found) {
  auto node = stowage::testing::node_fixture{"stowage_retrieval_miss"};
  auto blobs = std::vector<stowage::schema::blob_t>{};
  auto hash = store_batch(node, blobs);

  // Unknown batch.
  EXPECT_EQ(node.retrieval()
                .retrieve_chunks(stowage::testing::make_hash(99), 0, 0)
                .status.code,
            error_code::not_found);
  // Blob index past the batch.
  EXPECT_EQ(node.retrieval().retrieve_chunks(hash, 3, 0).status.code,
            error_code::not_found);
  // Quorum the blob did not opt into.
  EXPECT_EQ(node.retrieval().retrieve_chunks(hash, 0, 1).status.code,
            error_code::not_found);
  // Quorum id that cannot exist.
  EXPECT_EQ(node.retrieval().retrieve_chunks(hash, 0, 256).status.code,
            error_code::not_found);
  EXPECT_EQ(node.retrieval().get_blob_header(hash, 0, 256).status.code,
            error_code::not_found);
  EXPECT_EQ(node.retrieval().get_blob_header(hash, 5, 0).status.code,
            error_code::not_found);
}

TEST(retrieval, blob_header_proofs_verify_against_batch_root) {
  auto node = stowage::testing::node_fixture{"stowage_retrieval_proof"};
  auto blobs = std::vector<stowage::schema::blob_t>{};
  auto hash = store_batch(node, blobs);
  auto root = stowage::testing::make_batch_header(blobs).batch_root;

  for (uint32_t index = 0; index < blobs.size(); ++index) {
    auto quorum = blobs[index].header.quorum_headers.front().quorum_id;
    auto result = node.retrieval().get_blob_header(hash, index, quorum);
    ASSERT_TRUE(stowage::schema::is_ok(result.status)) << result.status.log;
    EXPECT_EQ(stowage::schema::hash_blob_header(result.header),
              stowage::schema::hash_blob_header(blobs[index].header));
    EXPECT_EQ(result.proof.index, index);
    EXPECT_EQ(result.proof.hashes.size(), 2u);
    EXPECT_TRUE(stowage::merkle::verify(
        stowage::schema::hash_blob_header(result.header), result.proof, root));
  }
}

TEST(retrieval, custody_end_hides_batch_before_it_is_reclaimed) {
  auto node = stowage::testing::node_fixture{"stowage_retrieval_custody"};
  auto blobs = std::vector<stowage::schema::blob_t>{};
  auto hash = store_batch(node, blobs);

  node.registry().set_current_block_number(stowage::testing::kReferenceBlock +
                                           51);
  EXPECT_EQ(node.retrieval().retrieve_chunks(hash, 0, 0).status.code,
            error_code::not_found);
  EXPECT_EQ(node.retrieval().get_blob_header(hash, 0, 0).status.code,
            error_code::not_found);
}

TEST(retrieval, storage_read_failures_are_retried_before_surfacing) {
  auto node = stowage::testing::node_fixture{"stowage_retrieval_retry"};
  auto blobs = std::vector<stowage::schema::blob_t>{};
  auto hash = store_batch(node, blobs);

  auto corrupt = stowage::storage::write_batch{};
  corrupt.puts.emplace_back(stowage::schema::key::make_batch_key(hash),
                            stowage::schema::bytes_t{1, 2});
  ASSERT_TRUE(stowage::schema::is_ok(node.storage().write(corrupt)));

  auto captured = std::ostringstream{};
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(std::make_shared<spdlog::logger>(
      "retrieval_retry",
      std::make_shared<spdlog::sinks::ostream_sink_mt>(captured)));

  auto chunks = node.retrieval().retrieve_chunks(hash, 0, 0);
  auto header = node.retrieval().get_blob_header(hash, 0, 0);
  spdlog::set_default_logger(previous);

  EXPECT_EQ(chunks.status.code, error_code::storage);
  EXPECT_TRUE(chunks.chunks.empty());
  EXPECT_EQ(header.status.code, error_code::storage);
  auto log = captured.str();
  EXPECT_NE(log.find("'read batch record' failed (attempt 1/2)"),
            std::string::npos);
  EXPECT_NE(log.find("failed after 2 attempt(s)"), std::string::npos);
}
