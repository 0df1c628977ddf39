#pragma once

#include "service_context.hpp"
#include "treasury/ledger/v1.hpp"

namespace treasury::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  treasury::ledger::v1::StatsResponse
  Stats(const treasury::ledger::v1::StatsRequest& req);

private:
  ServiceContext ctx_;
};

}
