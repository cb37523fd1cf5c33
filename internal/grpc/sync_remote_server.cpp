#include "internal/grpc/sync_remote_server.hpp"

#include <chrono>

#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace syncore::grpc {

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

SyncRemoteServer::SyncRemoteServer(std::shared_ptr<syncore::remote::RemoteStore> store) : store_(std::move(store)) {
}

::grpc::Status SyncRemoteServer::Pull(::grpc::ServerContext*, const syncore::v1::PullRequest* req, syncore::v1::PullResponse* resp) {
  observability::SpanScope span("SyncRemote.Pull");
  const auto               start = std::chrono::steady_clock::now();
  try {
    *resp = store_->Pull(*req);
    observability::Metrics::Instance().RecordRequest("pull", true);
    observability::Metrics::Instance().ObserveRequestLatencyMs("pull", ElapsedMs(start));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordRequest("pull", false);
    SYNCORE_LOG_WARN("pull rejected", {observability::StringField("error", e.what())});
    return ToStatus(e);
  }
}

::grpc::Status SyncRemoteServer::Push(::grpc::ServerContext*, const syncore::v1::PushRequest* req, syncore::v1::PushResponse* resp) {
  observability::SpanScope span("SyncRemote.Push");
  span.SetAttribute("operation.id", req->operation().id());
  const auto start = std::chrono::steady_clock::now();
  try {
    *resp = store_->Push(*req);
    observability::Metrics::Instance().RecordRequest("push", true);
    observability::Metrics::Instance().ObserveRequestLatencyMs("push", ElapsedMs(start));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordRequest("push", false);
    SYNCORE_LOG_WARN("push rejected", {observability::StringField("operation_id", req->operation().id()),
                                       observability::StringField("error", e.what())});
    return ToStatus(e);
  }
}

} // namespace syncore::grpc
