#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace syncore::runtime {

struct ServerOptions {
  std::string bind_address = "0.0.0.0:50051";
  // a pushed operation carries its whole payload
  int max_message_bytes = 16 * 1024 * 1024;
};

/*
  Hosts the SyncRemote service (and the standard gRPC health service) for
  devices to push to and pull from.
*/
class Server {
 public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound (useful with ":0").
  int Port() const {
    return selected_port_;
  }

 private:
  ServerOptions                                 options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           selected_port_ = 0;
};

} // namespace syncore::runtime
