#include "admin_service.hpp"

#include <chrono>

#include "internal/core/ledger_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace treasury::service {

using namespace treasury::ledger::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  treasury::observability::SpanScope span("AdminService.Stats");
  const auto                         started_at = std::chrono::steady_clock::now();
  const auto                         elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto resp = ctx_.manager->Stats();
    span.SetAttribute("ledgers", static_cast<std::int64_t>(resp.ledgers()));

    treasury::observability::Metrics::Instance().RecordRequest("AdminService.Stats", true);
    treasury::observability::Metrics::Instance().ObserveRequestLatencyMs("AdminService.Stats", elapsed_ms());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    TREASURY_LOG_ERROR("RPC failed",
                       {treasury::observability::StringField("route", "AdminService.Stats"), treasury::observability::StringField("error", ex.what())});
    treasury::observability::Metrics::Instance().RecordRequest("AdminService.Stats", false);
    treasury::observability::Metrics::Instance().ObserveRequestLatencyMs("AdminService.Stats", elapsed_ms());
    throw;
  }
}

} // namespace treasury::service
