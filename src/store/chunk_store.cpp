#include <spdlog/spdlog.h>
#include <stowage/merkle/merkle_index.hpp>
#include <stowage/schema/encoding/scale/batch_record.hpp>
#include <stowage/schema/encoding/scale/blob_header.hpp>
#include <stowage/schema/encoding/scale/encoder.hpp>
#include <stowage/schema/hash.hpp>
#include <stowage/schema/key/keys.hpp>
#include <stowage/store/chunk_store.hpp>

#include <algorithm>
#include <iterator>
#include <string>

namespace stowage::store {

namespace {

using encoder_t = stowage::schema::encoding::scale_encoder_t;

stowage::schema::bytes_view_t view_of(const stowage::schema::bytes_t& bytes) {
  return stowage::schema::bytes_view_t{bytes.data(), bytes.size()};
}

stowage::schema::status_t conflict(const stowage::schema::hash32_t& hash,
                                   const std::string& detail) {
  return stowage::schema::make_error(
      stowage::schema::error_code::validation,
      "batch " + stowage::schema::to_hex(hash) +
          " is already stored with different content (" + detail + ")");
}

}  // namespace

commit_receipt::commit_receipt(stowage::schema::batch_header_t batch_header,
                               stowage::schema::hash32_t batch_header_hash,
                               const bool already_stored)
    : batch_header_{std::move(batch_header)},
      batch_header_hash_{batch_header_hash},
      already_stored_{already_stored} {}

const stowage::schema::batch_header_t& commit_receipt::batch_header() const {
  return batch_header_;
}

const stowage::schema::hash32_t& commit_receipt::batch_header_hash() const {
  return batch_header_hash_;
}

bool commit_receipt::already_stored() const {
  return already_stored_;
}

transaction::transaction(stowage::schema::batch_header_t batch_header,
                         stowage::schema::hash32_t batch_header_hash,
                         const uint32_t blob_count)
    : batch_header_{std::move(batch_header)},
      batch_header_hash_{batch_header_hash},
      blob_count_{blob_count} {}

const stowage::schema::batch_header_t& transaction::batch_header() const {
  return batch_header_;
}

const stowage::schema::hash32_t& transaction::batch_header_hash() const {
  return batch_header_hash_;
}

chunk_store::chunk_store(const storage_t& storage, chunk_store_config config)
    : storage_{storage}, config_{std::move(config)} {}

const chunk_store_config& chunk_store::config() const {
  return config_;
}

chunk_store::view_t chunk_store::view() const {
  return storage_.view();
}

transaction chunk_store::begin(
    const stowage::schema::batch_header_t& batch_header,
    const uint32_t blob_count) const {
  return transaction{batch_header,
                     stowage::schema::hash_batch_header(batch_header),
                     blob_count};
}

void chunk_store::put(transaction& tx,
                      const uint32_t blob_index,
                      const stowage::schema::quorum_id_t quorum_id,
                      const stowage::schema::bundle_t& chunks) const {
  auto encoder = encoder_t{};
  tx.entries_.emplace_back(
      stowage::schema::key::make_bundle_key(tx.batch_header_hash_, blob_index,
                                            quorum_id),
      encoder.encode(chunks));
  ++tx.bundle_count_;
}

void chunk_store::put_blob_header(
    transaction& tx,
    const uint32_t blob_index,
    const stowage::schema::blob_header_t& header) const {
  auto encoder = encoder_t{};
  tx.entries_.emplace_back(
      stowage::schema::key::make_blob_header_key(tx.batch_header_hash_,
                                                 blob_index),
      encoder.encode(stowage::schema::encoding::scale::to_tuple(header)));
}

void chunk_store::put_merkle(transaction& tx,
                             const stowage::merkle::merkle_tree& tree) const {
  tx.entries_.push_back(
      stowage::merkle::merkle_index::make_entry(tx.batch_header_hash_, tree));
}

stowage::schema::status_t chunk_store::commit(
    transaction tx,
    const stowage::schema::block_number_t current_block_number,
    std::optional<commit_receipt>& receipt) const {
  receipt.reset();
  const auto& hash = tx.batch_header_hash_;

  auto stored = std::optional<stowage::schema::batch_record_t>{};
  {
    auto snapshot = storage_.view();
    auto status = stowage::storage::with_retry(
        config_.retry, "read batch record",
        [&]() { return get_batch(hash, stored, &snapshot); });
    if (!stowage::schema::is_ok(status)) {
      return status;
    }
    if (stored) {
      if (is_expired(*stored, current_block_number)) {
        return stowage::schema::make_error(
            stowage::schema::error_code::validation,
            "batch " + stowage::schema::to_hex(hash) +
                " is past custody (ended at block " +
                std::to_string(stored->expiry_block) + ", chain height " +
                std::to_string(current_block_number) + ")");
      }
      status = matches_stored(tx, *stored, snapshot);
      if (!stowage::schema::is_ok(status)) {
        return status;
      }
      spdlog::debug("Batch {} already stored; skipping write",
                    stowage::schema::to_hex(hash));
      receipt = commit_receipt{tx.batch_header_, hash, true};
      return stowage::schema::make_ok();
    }
  }

  auto record = stowage::schema::batch_record_t{
      .reference_block_number = tx.batch_header_.reference_block_number,
      .blob_count = tx.blob_count_,
      .expiry_block =
          tx.batch_header_.reference_block_number + config_.custody_blocks};

  auto encoder = encoder_t{};
  auto batch = stowage::storage::write_batch{};
  batch.puts = std::move(tx.entries_);
  batch.puts.emplace_back(
      stowage::schema::key::make_batch_key(hash),
      encoder.encode(stowage::schema::encoding::scale::to_tuple(record)));
  batch.puts.emplace_back(
      stowage::schema::key::make_expiry_key(record.expiry_block, hash),
      stowage::schema::bytes_t{});

  auto status = stowage::storage::with_retry(
      config_.retry, "commit batch", [&]() { return storage_.write(batch); });
  if (!stowage::schema::is_ok(status)) {
    return status;
  }
  spdlog::debug("Committed batch {} ({} entries, custody until block {})",
                stowage::schema::to_hex(hash), batch.puts.size(),
                record.expiry_block);
  receipt = commit_receipt{tx.batch_header_, hash, false};
  return stowage::schema::make_ok();
}

stowage::schema::status_t chunk_store::matches_stored(
    const transaction& tx,
    const stowage::schema::batch_record_t& stored,
    const view_t& view) const {
  const auto& hash = tx.batch_header_hash_;
  if (stored.blob_count != tx.blob_count_) {
    return conflict(hash, "blob count");
  }
  for (const auto& [key, value] : tx.entries_) {
    auto existing = std::optional<stowage::schema::bytes_t>{};
    auto status = stowage::storage::with_retry(
        config_.retry, "read staged key",
        [&]() { return storage_.read(view_of(key), existing, &view); });
    if (!stowage::schema::is_ok(status)) {
      return status;
    }
    if (!existing || *existing != value) {
      return conflict(hash, "entry mismatch");
    }
  }

  auto prefix = stowage::schema::key::make_bundle_prefix(hash);
  auto stored_bundles = uint32_t{0};
  auto status = stowage::storage::with_retry(
      config_.retry, "count stored bundles", [&]() {
        stored_bundles = 0;
        return storage_.scan_prefix(
            view_of(prefix),
            [&](const stowage::schema::bytes_view_t&,
                const stowage::schema::bytes_view_t&) {
              ++stored_bundles;
              return true;
            },
            &view);
      });
  if (!stowage::schema::is_ok(status)) {
    return status;
  }
  if (stored_bundles != tx.bundle_count_) {
    return conflict(hash, "bundle count");
  }
  return stowage::schema::make_ok();
}

stowage::schema::status_t chunk_store::get(
    const stowage::schema::hash32_t& batch_header_hash,
    const uint32_t blob_index,
    const stowage::schema::quorum_id_t quorum_id,
    stowage::schema::bundle_t& chunks,
    const view_t* view) const {
  chunks.clear();
  auto encoder = encoder_t{};
  auto key = stowage::schema::key::make_bundle_key(batch_header_hash,
                                                   blob_index, quorum_id);
  auto bundle = std::optional<stowage::schema::bundle_t>{};
  auto status = storage_.read(encoder, view_of(key), bundle, view);
  if (!stowage::schema::is_ok(status)) {
    return status;
  }
  if (!bundle) {
    return stowage::schema::make_error(stowage::schema::error_code::not_found,
                                       "no chunks stored for key");
  }
  chunks = std::move(*bundle);
  return stowage::schema::make_ok();
}

stowage::schema::status_t chunk_store::get_blob_header(
    const stowage::schema::hash32_t& batch_header_hash,
    const uint32_t blob_index,
    std::optional<stowage::schema::blob_header_t>& header,
    const view_t* view) const {
  header.reset();
  auto encoder = encoder_t{};
  auto key =
      stowage::schema::key::make_blob_header_key(batch_header_hash, blob_index);
  auto stored = std::optional<
      stowage::schema::encoding::scale::blob_header_tuple_t>{};
  auto status = storage_.read(encoder, view_of(key), stored, view);
  if (!stowage::schema::is_ok(status) || !stored) {
    return status;
  }
  header = stowage::schema::encoding::scale::from_tuple(*stored);
  return stowage::schema::make_ok();
}

stowage::schema::status_t chunk_store::get_batch(
    const stowage::schema::hash32_t& batch_header_hash,
    std::optional<stowage::schema::batch_record_t>& record,
    const view_t* view) const {
  record.reset();
  auto encoder = encoder_t{};
  auto key = stowage::schema::key::make_batch_key(batch_header_hash);
  auto stored = std::optional<
      stowage::schema::encoding::scale::batch_record_tuple_t>{};
  auto status = storage_.read(encoder, view_of(key), stored, view);
  if (!stowage::schema::is_ok(status) || !stored) {
    return status;
  }
  record = stowage::schema::encoding::scale::from_tuple(*stored);
  return stowage::schema::make_ok();
}

bool chunk_store::is_expired(
    const stowage::schema::batch_record_t& record,
    const stowage::schema::block_number_t current_block_number) {
  return record.expiry_block < current_block_number;
}

stowage::schema::status_t chunk_store::expire(
    const stowage::schema::block_number_t current_block_number,
    std::size_t& expired) const {
  expired = 0;
  auto due = std::vector<std::pair<stowage::schema::block_number_t,
                                   stowage::schema::hash32_t>>{};
  auto prefix = stowage::schema::key::make_expiry_prefix();
  auto status = stowage::storage::with_retry(
      config_.retry, "scan expiry index", [&]() {
        due.clear();
        return storage_.scan_prefix(
            view_of(prefix),
            [&](const stowage::schema::bytes_view_t& key,
                const stowage::schema::bytes_view_t&) {
              auto parsed = stowage::schema::key::parse_expiry_key(key);
              if (!parsed) {
                spdlog::warn("Skipping malformed expiry key '{}'",
                             stowage::schema::to_hex(key));
                return true;
              }
              // Keys are ordered by expiry block; everything after is still
              // live.
              if (parsed->first >= current_block_number) {
                return false;
              }
              due.push_back(*parsed);
              return true;
            });
      });
  if (!stowage::schema::is_ok(status)) {
    return status;
  }

  for (const auto& [expiry_block, hash] : due) {
    status = delete_batch(hash, expiry_block);
    if (!stowage::schema::is_ok(status)) {
      return status;
    }
    ++expired;
    spdlog::debug("Expired batch {} (custody ended at block {})",
                  stowage::schema::to_hex(hash), expiry_block);
  }
  return stowage::schema::make_ok();
}

stowage::schema::status_t chunk_store::delete_batch(
    const stowage::schema::hash32_t& batch_header_hash,
    const stowage::schema::block_number_t expiry_block) const {
  auto batch = stowage::storage::write_batch{};
  batch.deletes.push_back(
      stowage::schema::key::make_batch_key(batch_header_hash));
  batch.deletes.push_back(
      stowage::schema::key::make_merkle_key(batch_header_hash));
  batch.deletes.push_back(
      stowage::schema::key::make_expiry_key(expiry_block, batch_header_hash));

  auto snapshot = storage_.view();
  for (const auto& prefix :
       {stowage::schema::key::make_blob_header_prefix(batch_header_hash),
        stowage::schema::key::make_bundle_prefix(batch_header_hash)}) {
    auto keys = std::vector<stowage::schema::bytes_t>{};
    auto status = stowage::storage::with_retry(
        config_.retry, "collect batch keys", [&]() {
          keys.clear();
          return storage_.scan_prefix(
              view_of(prefix),
              [&](const stowage::schema::bytes_view_t& key,
                  const stowage::schema::bytes_view_t&) {
                keys.push_back(stowage::schema::make_bytes(key));
                return true;
              },
              &snapshot);
        });
    if (!stowage::schema::is_ok(status)) {
      return status;
    }
    std::move(std::begin(keys), std::end(keys),
              std::back_inserter(batch.deletes));
  }

  return stowage::storage::with_retry(
      config_.retry, "expire batch", [&]() { return storage_.write(batch); });
}

}  // namespace stowage::store
