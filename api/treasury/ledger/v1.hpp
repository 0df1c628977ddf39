#pragma once

#include "treasury/ledger/core/v1/types.pb.h"

#include "treasury/ledger/admin/v1/stats.pb.h"

#include "treasury/ledger/services/v1/treasury_admin_service.pb.h"
#include "treasury/ledger/services/v1/treasury_ledger_service.pb.h"

#include "treasury/ledger/services/v1/treasury_admin_service.grpc.pb.h"
#include "treasury/ledger/services/v1/treasury_ledger_service.grpc.pb.h"

namespace treasury::ledger::v1 {
using namespace ::treasury::ledger::core::v1;
using namespace ::treasury::ledger::admin::v1;
using namespace ::treasury::ledger::services::v1;
}
