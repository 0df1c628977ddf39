#include "ledger_server.hpp"

#include "grpc_error.hpp"

namespace treasury::grpc {

using namespace treasury::ledger::services::v1;

LedgerServer::LedgerServer(std::shared_ptr<treasury::service::LedgerService> svc) : service_(std::move(svc)) {
}

::grpc::Status LedgerServer::Initialize(::grpc::ServerContext*, const InitializeRequest* req, InitializeResponse* resp) {
  try {
    *resp = service_->Initialize(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Issue(::grpc::ServerContext*, const IssueRequest* req, IssueResponse* resp) {
  try {
    *resp = service_->Issue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Redeem(::grpc::ServerContext*, const RedeemRequest* req, RedeemResponse* resp) {
  try {
    *resp = service_->Redeem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Pause(::grpc::ServerContext*, const GovernanceRequest* req, GovernanceResponse* resp) {
  try {
    *resp = service_->Pause(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Resume(::grpc::ServerContext*, const GovernanceRequest* req, GovernanceResponse* resp) {
  try {
    *resp = service_->Resume(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::UpdateValuation(::grpc::ServerContext*, const UpdateValuationRequest* req, UpdateValuationResponse* resp) {
  try {
    *resp = service_->UpdateValuation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::CheckHealth(::grpc::ServerContext*, const CheckHealthRequest* req, CheckHealthResponse* resp) {
  try {
    *resp = service_->CheckHealth(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Transfer(::grpc::ServerContext*, const TransferRequest* req, TransferResponse* resp) {
  try {
    *resp = service_->Transfer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetLedger(::grpc::ServerContext*, const GetLedgerRequest* req, GetLedgerResponse* resp) {
  try {
    *resp = service_->GetLedger(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetBalance(::grpc::ServerContext*, const GetBalanceRequest* req, GetBalanceResponse* resp) {
  try {
    *resp = service_->GetBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::ListLedgers(::grpc::ServerContext*, const ListLedgersRequest* req, ListLedgersResponse* resp) {
  try {
    *resp = service_->ListLedgers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::ListEvents(::grpc::ServerContext*, const ListEventsRequest* req, ListEventsResponse* resp) {
  try {
    *resp = service_->ListEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace treasury::grpc
