#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "treasury/ledger/services/v1/treasury_ledger_service.grpc.pb.h"
#include "internal/service/ledger_service.hpp"

namespace treasury::grpc {

/*
  Thin adapter: every handler forwards to LedgerService and maps any
  exception through ToStatus.
*/
class LedgerServer final : public treasury::ledger::services::v1::TreasuryLedgerService::Service {
public:
  explicit LedgerServer(std::shared_ptr<treasury::service::LedgerService> svc);

  ::grpc::Status Initialize(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::InitializeRequest*,
                       treasury::ledger::services::v1::InitializeResponse*) override;

  ::grpc::Status Issue(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::IssueRequest*,
                       treasury::ledger::services::v1::IssueResponse*) override;

  ::grpc::Status Redeem(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::RedeemRequest*,
                       treasury::ledger::services::v1::RedeemResponse*) override;

  ::grpc::Status Pause(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::GovernanceRequest*,
                       treasury::ledger::services::v1::GovernanceResponse*) override;

  ::grpc::Status Resume(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::GovernanceRequest*,
                       treasury::ledger::services::v1::GovernanceResponse*) override;

  ::grpc::Status UpdateValuation(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::UpdateValuationRequest*,
                       treasury::ledger::services::v1::UpdateValuationResponse*) override;

  ::grpc::Status CheckHealth(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::CheckHealthRequest*,
                       treasury::ledger::services::v1::CheckHealthResponse*) override;

  ::grpc::Status Transfer(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::TransferRequest*,
                       treasury::ledger::services::v1::TransferResponse*) override;

  ::grpc::Status GetLedger(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::GetLedgerRequest*,
                       treasury::ledger::services::v1::GetLedgerResponse*) override;

  ::grpc::Status GetBalance(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::GetBalanceRequest*,
                       treasury::ledger::services::v1::GetBalanceResponse*) override;

  ::grpc::Status ListLedgers(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::ListLedgersRequest*,
                       treasury::ledger::services::v1::ListLedgersResponse*) override;

  ::grpc::Status ListEvents(::grpc::ServerContext*,
                       const treasury::ledger::services::v1::ListEventsRequest*,
                       treasury::ledger::services::v1::ListEventsResponse*) override;

private:
  std::shared_ptr<treasury::service::LedgerService> service_;
};

}
