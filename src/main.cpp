#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stowage/assignment/snapshot_file.hpp>
#include <stowage/attestation/attestor.hpp>
#include <stowage/commitment/commitment_verifier.hpp>
#include <stowage/common/critical.hpp>
#include <stowage/config/options.hpp>
#include <stowage/crypto/ed25519.hpp>
#include <stowage/dispersal/engine.hpp>
#include <stowage/merkle/merkle_index.hpp>
#include <stowage/retrieval/service.hpp>
#include <stowage/rpc/server.hpp>
#include <stowage/storage/rocksdb/storage.hpp>
#include <stowage/store/chunk_store.hpp>
#include <stowage/store/expiry_worker.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

stowage::crypto::ed25519_seed_t load_signing_key(const std::string& path) {
  auto file = std::ifstream{path};
  if (!file) {
    spdlog::error("Cannot open signing key file {}", path);
    stowage::common::critical("Signing key unreadable");
  }
  auto buffer = std::stringstream{};
  buffer << file.rdbuf();
  auto seed = stowage::crypto::parse_seed(buffer.str());
  if (!seed) {
    spdlog::error("Signing key file {} does not hold a 32-byte hex seed", path);
    stowage::common::critical("Signing key unreadable");
  }
  return *seed;
}

std::unique_ptr<grpc::Server> start_server(const std::string& address,
                                           grpc::Service* service) {
  auto builder = grpc::ServerBuilder();
  builder.AddListeningPort(address, grpc::InsecureServerCredentials());
  builder.RegisterService(service);
  auto server = std::unique_ptr<grpc::Server>(builder.BuildAndStart());
  if (!server) {
    spdlog::error("Failed to listen on {}", address);
    stowage::common::critical("gRPC server did not start");
  }
  server->GetHealthCheckService()->SetServingStatus(false);
  spdlog::info("gRPC service listening on {}", address);
  return server;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto options = stowage::config::node_options{};
  auto message = std::string{};
  switch (stowage::config::parse_options(argc, argv, options, message)) {
    case stowage::config::parse_outcome::help:
      std::cout << message << std::endl;
      return 0;
    case stowage::config::parse_outcome::error:
      std::cerr << message << std::endl;
      return 1;
    case stowage::config::parse_outcome::run:
      break;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "stowage", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(options.log_level);

  auto registry = stowage::assignment::snapshot_registry{};
  auto snapshots = stowage::assignment::snapshot_file_source{
      options.operator_state_path, registry};
  if (!snapshots.refresh()) {
    stowage::common::critical("Operator state unavailable at startup");
  }
  spdlog::info("Operator state: {} snapshot(s), chain height {}",
               registry.size(), registry.current_block_number());

  auto storage = stowage::storage::make_storage<
      stowage::storage::rocksdb_storage_tag>(options.db_path);
  auto store = stowage::store::chunk_store{
      storage, stowage::store::chunk_store_config{
                   .custody_blocks = options.custody_blocks,
                   .retry = stowage::storage::retry_policy{
                       .attempts = options.storage_retries}}};
  auto index = stowage::merkle::merkle_index{storage};

  auto validator =
      stowage::validation::batch_validator{stowage::validation::validator_config{
          .max_reference_lag = options.max_reference_lag,
          .max_reference_lead = options.max_reference_lead,
          .custody_blocks = options.custody_blocks,
          .rejection_policy = options.rejection_policy}};
  auto verifier = stowage::commitment::commitment_verifier{
      stowage::commitment::make_pairing_backend(
          options.allow_unverified_commitments)};
  auto attestor = stowage::attestation::attestor{
      stowage::attestation::make_ed25519_signer(
          load_signing_key(options.signing_key_path))};
  auto engine = stowage::dispersal::engine{
      registry, validator, verifier, store, attestor,
      stowage::dispersal::engine_config{
          .verification_threads = options.verification_threads,
          .timeout = options.timeout}};
  auto retrieval = stowage::retrieval::service{store, index, registry};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto dispersal_listener =
      stowage::rpc::dispersal_listener{engine, options.timeout};
  auto retrieval_listener = stowage::rpc::retrieval_listener{retrieval, options.timeout};
  auto dispersal_server =
      start_server(options.dispersal_address, &dispersal_listener);
  auto retrieval_server =
      start_server(options.retrieval_address, &retrieval_listener);

  auto expiry = stowage::store::expiry_worker{store, registry,
                                              options.expiry_interval};
  expiry.start();

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { dispersal_server->Wait(); });
  threads.emplace_back([&] { retrieval_server->Wait(); });
  threads.emplace_back([&] {
    auto next_refresh =
        std::chrono::steady_clock::now() + options.snapshot_refresh;
    while (!shutdown_requested()) {
      dispersal_server->GetHealthCheckService()->SetServingStatus(true);
      retrieval_server->GetHealthCheckService()->SetServingStatus(true);
      if (std::chrono::steady_clock::now() >= next_refresh) {
        if (!snapshots.refresh()) {
          spdlog::warn("Keeping operator state from the last good load");
        }
        next_refresh =
            std::chrono::steady_clock::now() + options.snapshot_refresh;
      }
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down");
    dispersal_server->GetHealthCheckService()->SetServingStatus(false);
    retrieval_server->GetHealthCheckService()->SetServingStatus(false);
    dispersal_server->Shutdown();
    retrieval_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }
  expiry.stop();

  spdlog::shutdown();
  return 0;
}
