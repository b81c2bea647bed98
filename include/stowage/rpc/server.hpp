#pragma once

#include <grpcpp/grpcpp.h>
#include <stowage/dispersal/engine.hpp>
#include <stowage/node/node.grpc.pb.h>
#include <stowage/retrieval/service.hpp>
#include <chrono>

namespace stowage::rpc {

/// Deadline of a call: the earlier of the client deadline and `timeout`.
stowage::dispersal::engine::clock_type::time_point effective_deadline(
    std::chrono::system_clock::time_point client_deadline,
    std::chrono::milliseconds timeout);

/// Callback listener for the Dispersal service.
struct dispersal_listener final
    : public stowage::node::Dispersal::CallbackService {
  dispersal_listener(stowage::dispersal::engine& engine,
                     std::chrono::milliseconds timeout);

  /// Validate, verify, store and attest one batch. The reply carries the
  /// signature over the batch header hash.
  virtual grpc::ServerUnaryReactor* StoreChunks(
      grpc::CallbackServerContext* context,
      const stowage::node::StoreChunksRequest* request,
      stowage::node::StoreChunksReply* response) override final;

  stowage::dispersal::engine& engine_;
  std::chrono::milliseconds timeout_;
};

/// Callback listener for the Retrieval service. A lookup still running when
/// its deadline passes answers DEADLINE_EXCEEDED instead of its result.
struct retrieval_listener final
    : public stowage::node::Retrieval::CallbackService {
  retrieval_listener(const stowage::retrieval::service& service,
                     std::chrono::milliseconds timeout);

  virtual grpc::ServerUnaryReactor* RetrieveChunks(
      grpc::CallbackServerContext* context,
      const stowage::node::RetrieveChunksRequest* request,
      stowage::node::RetrieveChunksReply* response) override final;

  virtual grpc::ServerUnaryReactor* GetBlobHeader(
      grpc::CallbackServerContext* context,
      const stowage::node::GetBlobHeaderRequest* request,
      stowage::node::GetBlobHeaderReply* response) override final;

  const stowage::retrieval::service& service_;
  std::chrono::milliseconds timeout_;
};

}  // namespace stowage::rpc
