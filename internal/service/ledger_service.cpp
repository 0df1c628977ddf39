#include "ledger_service.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <type_traits>

#include "internal/core/ledger_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace treasury::service {

using namespace treasury::ledger::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const LedgerID* ledger_id, Fn&& fn) {
  treasury::observability::SpanScope span(route);
  if (ledger_id) {
    span.SetAttribute("ledger.id", ledger_id->value());
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    treasury::observability::Metrics::Instance().RecordRequest(route, success);
    treasury::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const treasury::util::LedgerError& ex) {
    span.RecordRejection(treasury::util::ErrorKindName(ex.Kind()), ex.what());
    TREASURY_LOG_WARN("RPC rejected", {treasury::observability::StringField("route", route),
                                       treasury::observability::StringField("kind", treasury::util::ErrorKindName(ex.Kind())),
                                       treasury::observability::StringField("ledger_id", ledger_id ? ledger_id->value() : ""),
                                       treasury::observability::StringField("error", ex.what())});
    record(false);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    TREASURY_LOG_ERROR("RPC failed", {treasury::observability::StringField("route", route),
                                      treasury::observability::StringField("ledger_id", ledger_id ? ledger_id->value() : ""),
                                      treasury::observability::StringField("error", ex.what())});
    record(false);
    throw;
  }
}

} // namespace

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

InitializeResponse LedgerService::Initialize(const InitializeRequest& req) {
  return ObserveRpc("LedgerService.Initialize", nullptr, [&] {
    if (req.asset_ids_size() != req.collateral_values_size() || req.asset_ids_size() != req.descriptions_size()) {
      throw treasury::util::InvalidArgument("initialize: asset_ids, descriptions and collateral_values must have equal length");
    }

    treasury::core::TreasuryLedger::InitializeParams params;
    for (int i = 0; i < req.asset_ids_size(); ++i) {
      params.collateral.push_back({req.asset_ids(i), req.descriptions(i), req.collateral_values(i)});
    }
    params.initial_supply       = req.initial_supply();
    params.oracle_initial_value = req.oracle_initial_value();
    params.governance           = req.governance().value();
    params.owner                = req.owner().value();

    InitializeResponse resp;
    *resp.mutable_ledger() = ctx_.manager->Initialize(std::move(params));
    return resp;
  });
}

IssueResponse LedgerService::Issue(const IssueRequest& req) {
  return ObserveRpc("LedgerService.Issue", &req.ledger_id(), [&] {
    treasury::core::TreasuryLedger::IssueParams params;
    params.additional_collateral_value = req.additional_collateral_value();
    params.amount                      = req.amount();
    params.recipient                   = req.recipient().value();
    params.asset_id                    = req.asset_id();
    params.description                 = req.description();

    IssueResponse resp;
    *resp.mutable_ledger() = ctx_.manager->Issue(req.ledger_id().value(), params);
    return resp;
  });
}

RedeemResponse LedgerService::Redeem(const RedeemRequest& req) {
  return ObserveRpc("LedgerService.Redeem", &req.ledger_id(), [&] {
    RedeemResponse resp;
    *resp.mutable_ledger() =
        ctx_.manager->Redeem(req.ledger_id().value(), req.holder().value(), req.burn_amount(), req.collateral_value_reduction());
    return resp;
  });
}

GovernanceResponse LedgerService::Pause(const GovernanceRequest& req) {
  return ObserveRpc("LedgerService.Pause", &req.ledger_id(), [&] {
    GovernanceResponse resp;
    resp.set_paused(ctx_.manager->Pause(req.ledger_id().value(), req.caller().value()));
    return resp;
  });
}

GovernanceResponse LedgerService::Resume(const GovernanceRequest& req) {
  return ObserveRpc("LedgerService.Resume", &req.ledger_id(), [&] {
    GovernanceResponse resp;
    resp.set_paused(ctx_.manager->Resume(req.ledger_id().value(), req.caller().value()));
    return resp;
  });
}

UpdateValuationResponse LedgerService::UpdateValuation(const UpdateValuationRequest& req) {
  return ObserveRpc("LedgerService.UpdateValuation", &req.ledger_id(), [&] {
    UpdateValuationResponse resp;
    *resp.mutable_oracle() = ctx_.manager->UpdateValuation(req.ledger_id().value(), req.caller().value(), req.value());
    return resp;
  });
}

CheckHealthResponse LedgerService::CheckHealth(const CheckHealthRequest& req) {
  return ObserveRpc("LedgerService.CheckHealth", &req.ledger_id(), [&] {
    CheckHealthResponse resp;
    resp.set_healthy(ctx_.manager->CheckHealth(req.ledger_id().value()));
    return resp;
  });
}

TransferResponse LedgerService::Transfer(const TransferRequest& req) {
  return ObserveRpc("LedgerService.Transfer", &req.ledger_id(), [&] {
    const auto result = ctx_.manager->Transfer(req.ledger_id().value(), req.from().value(), req.to().value(), req.amount());

    TransferResponse resp;
    resp.set_from_balance(result.from_balance);
    resp.set_to_balance(result.to_balance);
    return resp;
  });
}

GetLedgerResponse LedgerService::GetLedger(const GetLedgerRequest& req) {
  return ObserveRpc("LedgerService.GetLedger", &req.ledger_id(), [&] {
    GetLedgerResponse resp;
    *resp.mutable_ledger() = ctx_.manager->GetLedger(req.ledger_id().value());
    return resp;
  });
}

GetBalanceResponse LedgerService::GetBalance(const GetBalanceRequest& req) {
  return ObserveRpc("LedgerService.GetBalance", &req.ledger_id(), [&] {
    GetBalanceResponse resp;
    resp.set_balance(ctx_.manager->GetBalance(req.ledger_id().value(), req.holder().value()));
    return resp;
  });
}

ListLedgersResponse LedgerService::ListLedgers(const ListLedgersRequest&) {
  return ObserveRpc("LedgerService.ListLedgers", nullptr, [&] {
    ListLedgersResponse resp;
    for (auto& snapshot : ctx_.manager->ListLedgers()) {
      *resp.add_ledgers() = std::move(snapshot);
    }
    return resp;
  });
}

ListEventsResponse LedgerService::ListEvents(const ListEventsRequest& req) {
  return ObserveRpc("LedgerService.ListEvents", &req.ledger_id(), [&] {
    const auto max_events = req.max_events() > 0 ? std::optional<uint64_t>(req.max_events()) : std::nullopt;

    ListEventsResponse resp;
    for (auto& event : ctx_.manager->ListEvents(req.ledger_id().value(), req.start_sequence(), max_events)) {
      *resp.add_events() = std::move(event);
    }
    return resp;
  });
}

} // namespace treasury::service
