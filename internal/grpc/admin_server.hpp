#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "treasury/ledger/services/v1/treasury_admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace treasury::grpc {

class AdminServer final : public treasury::ledger::services::v1::TreasuryAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<treasury::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const treasury::ledger::admin::v1::StatsRequest*,
                       treasury::ledger::admin::v1::StatsResponse*) override;

private:
  std::shared_ptr<treasury::service::AdminService> service_;
};

}
