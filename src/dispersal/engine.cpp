#include <spdlog/spdlog.h>
#include <stowage/dispersal/engine.hpp>
#include <stowage/schema/hash.hpp>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <string>

namespace stowage::dispersal {

namespace {

stowage::schema::status_t timed_out(const std::string& stage) {
  return stowage::schema::make_error(stowage::schema::error_code::timeout,
                                     "deadline exceeded " + stage);
}

stowage::schema::store_result_t reject(
    stowage::schema::store_result_t result,
    stowage::schema::status_t status) {
  spdlog::warn("Rejected batch {}: {} ({})",
               stowage::schema::to_hex(result.batch_header_hash),
               stowage::schema::error_code_name(status.code), status.log);
  result.status = std::move(status);
  return result;
}

}  // namespace

engine::engine(const stowage::assignment::snapshot_registry& registry,
               const stowage::validation::batch_validator& validator,
               const stowage::commitment::commitment_verifier& verifier,
               const stowage::store::chunk_store& store,
               const stowage::attestation::attestor& attestor,
               engine_config config)
    : registry_{registry},
      validator_{validator},
      verifier_{verifier},
      store_{store},
      attestor_{attestor},
      config_{std::move(config)} {}

const engine_config& engine::config() const {
  return config_;
}

stowage::schema::store_result_t engine::store_chunks(
    const stowage::schema::batch_header_t& header,
    const std::vector<stowage::schema::blob_t>& blobs) {
  return store_chunks(header, blobs, clock_type::now() + config_.timeout);
}

stowage::schema::store_result_t engine::store_chunks(
    const stowage::schema::batch_header_t& header,
    const std::vector<stowage::schema::blob_t>& blobs,
    const clock_type::time_point deadline) {
  auto result = stowage::schema::store_result_t{};
  result.batch_header_hash = stowage::schema::hash_batch_header(header);

  auto guard = locks_.lock_until(result.batch_header_hash, deadline);
  if (!guard) {
    return reject(std::move(result), timed_out("waiting for batch lock"));
  }

  auto snapshot = registry_.at(header.reference_block_number);
  if (!snapshot) {
    return reject(std::move(result),
                  stowage::schema::make_error(
                      stowage::schema::error_code::assignment,
                      "no operator state for reference block " +
                          std::to_string(header.reference_block_number)));
  }

  // One chain height for the whole request so validation and commit agree.
  auto current_block_number = registry_.current_block_number();
  auto plan = stowage::validation::batch_plan{};
  auto status = validator_.validate(header, blobs, *snapshot,
                                    current_block_number, plan);
  if (!stowage::schema::is_ok(status)) {
    return reject(std::move(result), std::move(status));
  }
  if (clock_type::now() >= deadline) {
    return reject(std::move(result), timed_out("after validation"));
  }

  status = verify_blobs(blobs, plan, deadline);
  if (!stowage::schema::is_ok(status)) {
    return reject(std::move(result), std::move(status));
  }
  if (clock_type::now() >= deadline) {
    return reject(std::move(result), timed_out("before commit"));
  }

  auto receipt = std::optional<stowage::store::commit_receipt>{};
  status = persist(header, blobs, plan, current_block_number, receipt);
  if (!stowage::schema::is_ok(status)) {
    return reject(std::move(result), std::move(status));
  }

  status = attestor_.attest(*receipt, result.signature);
  if (!stowage::schema::is_ok(status)) {
    return reject(std::move(result), std::move(status));
  }
  result.already_stored = receipt->already_stored();
  spdlog::info("Attested batch {} ({} blob(s), reference block {}{})",
               stowage::schema::to_hex(result.batch_header_hash), blobs.size(),
               header.reference_block_number,
               result.already_stored ? ", already stored" : "");
  return result;
}

stowage::schema::status_t engine::verify_blobs(
    const std::vector<stowage::schema::blob_t>& blobs,
    const stowage::validation::batch_plan& plan,
    const clock_type::time_point deadline) const {
  auto workers = std::clamp<std::size_t>(config_.verification_threads, 1,
                                         blobs.size());
  auto next = std::atomic<std::size_t>{0};
  auto cancelled = std::atomic<bool>{false};
  auto failure_mutex = std::mutex{};
  auto failure = stowage::schema::make_ok();

  auto fail = [&](stowage::schema::status_t status) {
    auto lock = std::lock_guard{failure_mutex};
    if (stowage::schema::is_ok(failure)) {
      failure = std::move(status);
    }
    cancelled = true;
  };

  auto work = [&]() {
    while (!cancelled) {
      auto index = next.fetch_add(1);
      if (index >= blobs.size()) {
        return;
      }
      if (clock_type::now() >= deadline) {
        fail(timed_out("during verification"));
        return;
      }
      auto status = verifier_.verify_blob(blobs[index], plan.assigned[index]);
      if (!stowage::schema::is_ok(status)) {
        status.log = "blob " + std::to_string(index) + ": " + status.log;
        fail(std::move(status));
        return;
      }
    }
  };

  auto tasks = std::vector<std::future<void>>{};
  tasks.reserve(workers - 1);
  for (std::size_t i = 1; i < workers; ++i) {
    tasks.push_back(std::async(std::launch::async, work));
  }
  work();
  for (auto& task : tasks) {
    task.get();
  }
  return failure;
}

stowage::schema::status_t engine::persist(
    const stowage::schema::batch_header_t& header,
    const std::vector<stowage::schema::blob_t>& blobs,
    const stowage::validation::batch_plan& plan,
    const stowage::schema::block_number_t current_block_number,
    std::optional<stowage::store::commit_receipt>& receipt) const {
  auto tx = store_.begin(header, static_cast<uint32_t>(blobs.size()));
  for (uint32_t i = 0; i < blobs.size(); ++i) {
    const auto& blob = blobs[i];
    store_.put_blob_header(tx, i, blob.header);
    for (const auto& entry : plan.assigned[i]) {
      store_.put(tx, i,
                 blob.header.quorum_headers[entry.quorum_position].quorum_id,
                 blob.bundles[entry.quorum_position]);
    }
  }
  store_.put_merkle(tx, *plan.tree);
  return store_.commit(std::move(tx), current_block_number, receipt);
}

}  // namespace stowage::dispersal
