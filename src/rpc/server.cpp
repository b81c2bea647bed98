#include <spdlog/spdlog.h>
#include <stowage/rpc/convert.hpp>
#include <stowage/rpc/server.hpp>

#include <string>

using namespace stowage::rpc;

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

bool expired(const stowage::dispersal::engine::clock_type::time_point deadline) {
  return stowage::dispersal::engine::clock_type::now() >= deadline;
}

grpc::Status deadline_exceeded(const std::string& stage) {
  return to_grpc_status(stowage::schema::make_error(
      stowage::schema::error_code::timeout, "deadline exceeded " + stage));
}

grpc::Status unknown_batch() {
  return grpc::Status{grpc::StatusCode::NOT_FOUND,
                      "not_found: batch header hash must be 32 bytes"};
}

}  // namespace

stowage::dispersal::engine::clock_type::time_point
stowage::rpc::effective_deadline(
    const std::chrono::system_clock::time_point client_deadline,
    const std::chrono::milliseconds timeout) {
  auto now = stowage::dispersal::engine::clock_type::now();
  auto wall_now = std::chrono::system_clock::now();
  if (client_deadline >= wall_now + timeout) {
    return now + timeout;
  }
  if (client_deadline <= wall_now) {
    return now;
  }
  return now + std::chrono::duration_cast<std::chrono::milliseconds>(
                   client_deadline - wall_now);
}

dispersal_listener::dispersal_listener(stowage::dispersal::engine& engine,
                                       const std::chrono::milliseconds timeout)
    : engine_{engine}, timeout_{timeout} {}

grpc::ServerUnaryReactor* dispersal_listener::StoreChunks(
    grpc::CallbackServerContext* context,
    const stowage::node::StoreChunksRequest* request,
    stowage::node::StoreChunksReply* response) {
  auto deadline = effective_deadline(context->deadline(), timeout_);
  auto header = stowage::schema::batch_header_t{};
  auto blobs = std::vector<stowage::schema::blob_t>{};
  auto status = from_proto(*request, header, blobs);
  if (!stowage::schema::is_ok(status)) {
    spdlog::warn("Rejected malformed StoreChunks request from {}: {}",
                 context->peer(), status.log);
    return finish(context, to_grpc_status(status));
  }

  auto result = engine_.store_chunks(header, blobs, deadline);
  if (!stowage::schema::is_ok(result.status)) {
    return finish(context, to_grpc_status(result.status));
  }
  response->set_signature(stowage::schema::make_string(result.signature));
  return finish(context, grpc::Status::OK);
}

retrieval_listener::retrieval_listener(
    const stowage::retrieval::service& service,
    const std::chrono::milliseconds timeout)
    : service_{service}, timeout_{timeout} {}

grpc::ServerUnaryReactor* retrieval_listener::RetrieveChunks(
    grpc::CallbackServerContext* context,
    const stowage::node::RetrieveChunksRequest* request,
    stowage::node::RetrieveChunksReply* response) {
  auto deadline = effective_deadline(context->deadline(), timeout_);
  auto hash = parse_batch_header_hash(request->batch_header_hash());
  if (!hash) {
    return finish(context, unknown_batch());
  }
  if (expired(deadline)) {
    return finish(context, deadline_exceeded("before lookup"));
  }
  auto result = service_.retrieve_chunks(*hash, request->blob_index(),
                                         request->quorum_id());
  if (expired(deadline)) {
    return finish(context, deadline_exceeded("during lookup"));
  }
  if (!stowage::schema::is_ok(result.status)) {
    return finish(context, to_grpc_status(result.status));
  }
  for (const auto& chunk : result.chunks) {
    response->add_chunks(stowage::schema::make_string(chunk));
  }
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* retrieval_listener::GetBlobHeader(
    grpc::CallbackServerContext* context,
    const stowage::node::GetBlobHeaderRequest* request,
    stowage::node::GetBlobHeaderReply* response) {
  auto deadline = effective_deadline(context->deadline(), timeout_);
  auto hash = parse_batch_header_hash(request->batch_header_hash());
  if (!hash) {
    return finish(context, unknown_batch());
  }
  if (expired(deadline)) {
    return finish(context, deadline_exceeded("before lookup"));
  }
  auto result = service_.get_blob_header(*hash, request->blob_index(),
                                         request->quorum_id());
  if (expired(deadline)) {
    return finish(context, deadline_exceeded("during lookup"));
  }
  if (!stowage::schema::is_ok(result.status)) {
    return finish(context, to_grpc_status(result.status));
  }
  to_proto(result.header, response->mutable_blob_header());
  to_proto(result.proof, response->mutable_proof());
  return finish(context, grpc::Status::OK);
}
