#include <cassert>
#include <iostream>
#include <stdexcept>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/core/ledger_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "treasury/ledger/v1.hpp"

namespace {

namespace v1 = treasury::ledger::v1;

treasury::service::ServiceContext BuildServiceContext() {
  treasury::service::ServiceContext ctx;
  ctx.manager = std::make_shared<treasury::core::LedgerManager>(std::make_shared<treasury::db::memory::MemoryRepository>());
  return ctx;
}

struct Fixture {
  Fixture() : ctx(BuildServiceContext()), server(std::make_shared<treasury::service::LedgerService>(ctx)) {
    v1::InitializeRequest req;
    req.add_asset_ids("A");
    req.add_descriptions("desc");
    req.add_collateral_values(15000);
    req.set_initial_supply(10000);
    req.set_oracle_initial_value(15000);
    req.mutable_governance()->set_value("gov");
    req.mutable_owner()->set_value("owner");

    v1::InitializeResponse resp;
    ::grpc::ServerContext  grpc_ctx;
    const auto             status = server.Initialize(&grpc_ctx, &req, &resp);
    assert(status.ok());
    ledger_id = resp.ledger().id().value();
  }

  v1::IssueRequest Issue(uint64_t collateral, uint64_t amount) const {
    v1::IssueRequest req;
    req.mutable_ledger_id()->set_value(ledger_id);
    req.set_additional_collateral_value(collateral);
    req.set_amount(amount);
    req.mutable_recipient()->set_value("alice");
    return req;
  }

  v1::RedeemRequest Redeem(const std::string& holder, uint64_t burn, uint64_t reduction) const {
    v1::RedeemRequest req;
    req.mutable_ledger_id()->set_value(ledger_id);
    req.mutable_holder()->set_value(holder);
    req.set_burn_amount(burn);
    req.set_collateral_value_reduction(reduction);
    return req;
  }

  v1::GovernanceRequest Governance(const std::string& caller) const {
    v1::GovernanceRequest req;
    req.mutable_ledger_id()->set_value(ledger_id);
    req.mutable_caller()->set_value(caller);
    return req;
  }

  treasury::service::ServiceContext ctx;
  treasury::grpc::LedgerServer      server;
  std::string                       ledger_id;
};

void ExpectStatus(const ::grpc::Status& status, ::grpc::StatusCode code, const std::string& kind) {
  assert(status.error_code() == code);
  assert(status.error_details() == kind);
}

void TestInsufficientCollateralReturnsFailedPrecondition() {
  Fixture               f;
  auto                  req = f.Issue(0, 1);
  v1::IssueResponse     resp;
  ::grpc::ServerContext grpc_ctx;
  ExpectStatus(f.server.Issue(&grpc_ctx, &req, &resp), ::grpc::StatusCode::FAILED_PRECONDITION, "InsufficientCollateral");
}

void TestIssueSuccessReturnsSnapshot() {
  Fixture               f;
  auto                  req = f.Issue(150, 1);
  v1::IssueResponse     resp;
  ::grpc::ServerContext grpc_ctx;
  assert(f.server.Issue(&grpc_ctx, &req, &resp).ok());
  assert(resp.ledger().pool().circulating_supply() == 10001);
  assert(resp.ledger().total_collateral() == "15150");
}

void TestRedeemFailuresMapToDistinctCodes() {
  Fixture f;
  {
    auto                  req = f.Redeem("owner", 10001, 0);
    v1::RedeemResponse    resp;
    ::grpc::ServerContext grpc_ctx;
    ExpectStatus(f.server.Redeem(&grpc_ctx, &req, &resp), ::grpc::StatusCode::FAILED_PRECONDITION, "InsufficientSupply");
  }
  {
    auto                  req = f.Redeem("owner", 1, 15001);
    v1::RedeemResponse    resp;
    ::grpc::ServerContext grpc_ctx;
    ExpectStatus(f.server.Redeem(&grpc_ctx, &req, &resp), ::grpc::StatusCode::INVALID_ARGUMENT, "ExcessiveReduction");
  }
  {
    auto                  req = f.Redeem("alice", 1, 0);
    v1::RedeemResponse    resp;
    ::grpc::ServerContext grpc_ctx;
    ExpectStatus(f.server.Redeem(&grpc_ctx, &req, &resp), ::grpc::StatusCode::FAILED_PRECONDITION, "InsufficientBalance");
  }
}

void TestPausedReturnsUnavailable() {
  Fixture f;
  {
    auto                   req = f.Governance("gov");
    v1::GovernanceResponse resp;
    ::grpc::ServerContext  grpc_ctx;
    assert(f.server.Pause(&grpc_ctx, &req, &resp).ok());
    assert(resp.paused());
  }

  auto                  req = f.Issue(1500, 1000);
  v1::IssueResponse     resp;
  ::grpc::ServerContext grpc_ctx;
  ExpectStatus(f.server.Issue(&grpc_ctx, &req, &resp), ::grpc::StatusCode::UNAVAILABLE, "Paused");
}

void TestUnauthorizedReturnsPermissionDenied() {
  Fixture                f;
  auto                   req = f.Governance("owner");
  v1::GovernanceResponse resp;
  ::grpc::ServerContext  grpc_ctx;
  ExpectStatus(f.server.Pause(&grpc_ctx, &req, &resp), ::grpc::StatusCode::PERMISSION_DENIED, "Unauthorized");
}

void TestMissingLedgerReturnsNotFound() {
  Fixture                f;
  v1::CheckHealthRequest req;
  req.mutable_ledger_id()->set_value("missing-ledger");
  v1::CheckHealthResponse resp;
  ::grpc::ServerContext   grpc_ctx;
  ExpectStatus(f.server.CheckHealth(&grpc_ctx, &req, &resp), ::grpc::StatusCode::NOT_FOUND, "NotFound");
}

void TestMismatchedInitializeListsReturnInvalidArgument() {
  Fixture               f;
  v1::InitializeRequest req;
  req.add_asset_ids("A");
  req.add_collateral_values(1);
  req.mutable_governance()->set_value("gov");
  req.mutable_owner()->set_value("owner");

  v1::InitializeResponse resp;
  ::grpc::ServerContext  grpc_ctx;
  ExpectStatus(f.server.Initialize(&grpc_ctx, &req, &resp), ::grpc::StatusCode::INVALID_ARGUMENT, "InvalidArgument");
}

void TestTransferRoundTripsBalances() {
  Fixture             f;
  v1::TransferRequest req;
  req.mutable_ledger_id()->set_value(f.ledger_id);
  req.mutable_from()->set_value("owner");
  req.mutable_to()->set_value("bob");
  req.set_amount(40);

  v1::TransferResponse  resp;
  ::grpc::ServerContext grpc_ctx;
  assert(f.server.Transfer(&grpc_ctx, &req, &resp).ok());
  assert(resp.from_balance() == 9960);
  assert(resp.to_balance() == 40);

  v1::GetBalanceRequest balance_req;
  balance_req.mutable_ledger_id()->set_value(f.ledger_id);
  balance_req.mutable_holder()->set_value("bob");
  v1::GetBalanceResponse balance_resp;
  ::grpc::ServerContext  balance_ctx;
  assert(f.server.GetBalance(&balance_ctx, &balance_req, &balance_resp).ok());
  assert(balance_resp.balance() == 40);
}

void TestListEventsPagesJournal() {
  Fixture f;
  for (int i = 0; i < 3; ++i) {
    auto                  req = f.Issue(15, 10);
    v1::IssueResponse     resp;
    ::grpc::ServerContext grpc_ctx;
    assert(f.server.Issue(&grpc_ctx, &req, &resp).ok());
  }

  v1::ListEventsRequest req;
  req.mutable_ledger_id()->set_value(f.ledger_id);
  req.set_start_sequence(2);
  req.set_max_events(2);
  v1::ListEventsResponse resp;
  ::grpc::ServerContext  grpc_ctx;
  assert(f.server.ListEvents(&grpc_ctx, &req, &resp).ok());
  assert(resp.events_size() == 2);
  assert(resp.events(0).sequence() == 2);
  assert(resp.events(0).kind() == v1::LEDGER_EVENT_KIND_ISSUE);

  req.set_max_events(0);
  v1::ListEventsResponse all;
  ::grpc::ServerContext  all_ctx;
  assert(f.server.ListEvents(&all_ctx, &req, &all).ok());
  assert(all.events_size() == 3);
}

void TestAdminStatsCountsLedgers() {
  Fixture                    f;
  treasury::grpc::AdminServer admin(std::make_shared<treasury::service::AdminService>(f.ctx));

  v1::StatsRequest      req;
  v1::StatsResponse     resp;
  ::grpc::ServerContext grpc_ctx;
  assert(admin.Stats(&grpc_ctx, &req, &resp).ok());
  assert(resp.ledgers() == 1);
  assert(resp.total_circulating_supply() == "10000");
}

void TestEveryKindHasAStatusCode() {
  using namespace treasury::util;
  ExpectStatus(treasury::grpc::ToStatus(EmptyCollateralPool("x")), ::grpc::StatusCode::FAILED_PRECONDITION, "EmptyCollateralPool");
  ExpectStatus(treasury::grpc::ToStatus(ArithmeticOverflow("x")), ::grpc::StatusCode::OUT_OF_RANGE, "ArithmeticOverflow");
  ExpectStatus(treasury::grpc::ToStatus(AlreadyExists("x")), ::grpc::StatusCode::ALREADY_EXISTS, "AlreadyExists");
  ExpectStatus(treasury::grpc::ToStatus(Conflict("x")), ::grpc::StatusCode::ABORTED, "Conflict");

  const auto internal = treasury::grpc::ToStatus(std::runtime_error("boom"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(internal.error_message() == "boom");
}

} // namespace

int main() {
  TestInsufficientCollateralReturnsFailedPrecondition();
  TestIssueSuccessReturnsSnapshot();
  TestRedeemFailuresMapToDistinctCodes();
  TestPausedReturnsUnavailable();
  TestUnauthorizedReturnsPermissionDenied();
  TestMissingLedgerReturnsNotFound();
  TestMismatchedInitializeListsReturnInvalidArgument();
  TestTransferRoundTripsBalances();
  TestListEventsPagesJournal();
  TestAdminStatsCountsLedgers();
  TestEveryKindHasAStatusCode();

  std::cout << "treasury_ledger_unit_grpc_status: pass\n";
  return 0;
}
