#include <stowage/merkle/merkle_index.hpp>
#include <stowage/schema/hash.hpp>
#include <stowage/schema/key/keys.hpp>
#include <stowage/testing/batch_builder.hpp>
#include <stowage/testing/common.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace {

using storage_t =
    stowage::storage::storage<stowage::storage::rocksdb_storage_tag>;

std::vector<stowage::schema::blob_header_t> make_headers(const std::size_t n) {
  auto state = stowage::testing::make_operator_state({0});
  auto headers = std::vector<stowage::schema::blob_header_t>{};
  for (std::size_t i = 0; i < n; ++i) {
    headers.push_back(
        stowage::testing::make_blob({0}, state, static_cast<uint8_t>(10 + i))
            .header);
  }
  return headers;
}

}  // namespace

TEST(merkle_index, persisted_tree_serves_verifiable_proofs) {
  auto db = stowage::testing::make_db_path("stowage_merkle_index");
  {
    auto storage = stowage::storage::make_storage<
        stowage::storage::rocksdb_storage_tag>(db);
    auto index = stowage::merkle::merkle_index{storage};
    auto headers = make_headers(5);
    auto tree = stowage::merkle::merkle_index::build(headers);
    auto batch_hash = stowage::testing::make_hash(42);

    auto batch = stowage::storage::write_batch{};
    batch.puts.push_back(
        stowage::merkle::merkle_index::make_entry(batch_hash, tree));
    ASSERT_TRUE(stowage::schema::is_ok(storage.write(batch)));

    for (uint32_t i = 0; i < headers.size(); ++i) {
      auto proof = stowage::schema::merkle_proof_t{};
      ASSERT_TRUE(
          stowage::schema::is_ok(index.get_proof(batch_hash, i, proof)));
      EXPECT_TRUE(stowage::merkle::verify(
          stowage::schema::hash_blob_header(headers[i]), proof, tree.root()));
    }

    auto proof = stowage::schema::merkle_proof_t{};
    EXPECT_EQ(index.get_proof(batch_hash, 5, proof).code,
              stowage::schema::error_code::blob_index_out_of_range);
  }
  stowage::testing::remove_path(db);
}

TEST(merkle_index, unknown_batch_is_not_found) {
  auto db = stowage::testing::make_db_path("stowage_merkle_unknown");
  {
    auto storage = stowage::storage::make_storage<
        stowage::storage::rocksdb_storage_tag>(db);
    auto index = stowage::merkle::merkle_index{storage};
    auto proof = stowage::schema::merkle_proof_t{};
    EXPECT_EQ(index.get_proof(stowage::testing::make_hash(1), 0, proof).code,
              stowage::schema::error_code::not_found);

    auto tree = std::optional<stowage::merkle::merkle_tree>{};
    EXPECT_TRUE(stowage::schema::is_ok(
        index.load(stowage::testing::make_hash(1), tree)));
    EXPECT_FALSE(tree.has_value());
  }
  stowage::testing::remove_path(db);
}

TEST(merkle_index, corrupt_arena_is_a_storage_error) {
  auto db = stowage::testing::make_db_path("stowage_merkle_corrupt");
  {
    auto storage = stowage::storage::make_storage<
        stowage::storage::rocksdb_storage_tag>(db);
    auto index = stowage::merkle::merkle_index{storage};
    auto batch_hash = stowage::testing::make_hash(3);
    auto batch = stowage::storage::write_batch{};
    batch.puts.emplace_back(stowage::schema::key::make_merkle_key(batch_hash),
                            stowage::schema::bytes_t{0x01});
    ASSERT_TRUE(stowage::schema::is_ok(storage.write(batch)));

    auto proof = stowage::schema::merkle_proof_t{};
    EXPECT_EQ(index.get_proof(batch_hash, 0, proof).code,
              stowage::schema::error_code::storage);
  }
  stowage::testing::remove_path(db);
}
