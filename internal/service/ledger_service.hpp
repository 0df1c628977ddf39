#pragma once

#include "service_context.hpp"
#include "treasury/ledger/v1.hpp"

namespace treasury::service {

class LedgerService {
public:
  explicit LedgerService(ServiceContext ctx);

  treasury::ledger::v1::InitializeResponse
  Initialize(const treasury::ledger::v1::InitializeRequest& req);

  treasury::ledger::v1::IssueResponse
  Issue(const treasury::ledger::v1::IssueRequest& req);

  treasury::ledger::v1::RedeemResponse
  Redeem(const treasury::ledger::v1::RedeemRequest& req);

  treasury::ledger::v1::GovernanceResponse
  Pause(const treasury::ledger::v1::GovernanceRequest& req);

  treasury::ledger::v1::GovernanceResponse
  Resume(const treasury::ledger::v1::GovernanceRequest& req);

  treasury::ledger::v1::UpdateValuationResponse
  UpdateValuation(const treasury::ledger::v1::UpdateValuationRequest& req);

  treasury::ledger::v1::CheckHealthResponse
  CheckHealth(const treasury::ledger::v1::CheckHealthRequest& req);

  treasury::ledger::v1::TransferResponse
  Transfer(const treasury::ledger::v1::TransferRequest& req);

  treasury::ledger::v1::GetLedgerResponse
  GetLedger(const treasury::ledger::v1::GetLedgerRequest& req);

  treasury::ledger::v1::GetBalanceResponse
  GetBalance(const treasury::ledger::v1::GetBalanceRequest& req);

  treasury::ledger::v1::ListLedgersResponse
  ListLedgers(const treasury::ledger::v1::ListLedgersRequest& req);

  treasury::ledger::v1::ListEventsResponse
  ListEvents(const treasury::ledger::v1::ListEventsRequest& req);

private:
  ServiceContext ctx_;
};

}
