#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace treasury::grpc {

AdminServer::AdminServer(std::shared_ptr<treasury::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const treasury::ledger::admin::v1::StatsRequest* req,
                                  treasury::ledger::admin::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace treasury::grpc
