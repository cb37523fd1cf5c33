#include "internal/runtime/server.hpp"

#include <grpcpp/health_check_service_interface.h>

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace syncore::runtime {

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::EnableDefaultHealthCheckService(true);

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &selected_port_);
  builder.SetMaxReceiveMessageSize(options_.max_message_bytes);
  builder.SetMaxSendMessageSize(options_.max_message_bytes);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to start gRPC server on " + options_.bind_address);
  }

  SYNCORE_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", options_.bind_address),
                                             observability::IntField("port", selected_port_),
                                             observability::IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }
  // in-flight pushes get a short grace period to finish
  grpc_server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  grpc_server_.reset();
  SYNCORE_LOG_INFO("gRPC server stopped", {observability::StringField("bind_address", options_.bind_address)});
}

} // namespace syncore::runtime
