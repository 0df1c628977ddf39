#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "treasury/ledger/v1.hpp"

using namespace treasury::ledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ledgerctl <addr> init <governance> <owner> <initial_supply> <oracle_value> [asset_id=value[:description] ...]\n"
            << "  ledgerctl <addr> issue <ledger> <recipient> <amount> <collateral_value> [asset_id] [description]\n"
            << "  ledgerctl <addr> redeem <ledger> <holder> <burn_amount> <collateral_reduction>\n"
            << "  ledgerctl <addr> pause <ledger> <caller>\n"
            << "  ledgerctl <addr> resume <ledger> <caller>\n"
            << "  ledgerctl <addr> valuation <ledger> <caller> <value>\n"
            << "  ledgerctl <addr> health <ledger>\n"
            << "  ledgerctl <addr> transfer <ledger> <from> <to> <amount>\n"
            << "  ledgerctl <addr> show <ledger>\n"
            << "  ledgerctl <addr> balance <ledger> <holder>\n"
            << "  ledgerctl <addr> list\n"
            << "  ledgerctl <addr> events <ledger> [start_sequence] [max_events]\n"
            << "  ledgerctl <addr> stats\n";
}

static std::optional<uint64_t> ParseU64(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

static LedgerID MakeLedgerID(const std::string& s) {
  LedgerID id;
  id.set_value(s);
  return id;
}

static Address MakeAddress(const std::string& s) {
  Address address;
  address.set_value(s);
  return address;
}

// RPC failures print the ledger error kind when the server sent one.
static int Fail(const grpc::Status& status) {
  if (!status.error_details().empty()) {
    std::cerr << status.error_details() << ": ";
  }
  std::cerr << status.error_message() << "\n";
  return 2;
}

static int BadNumber(const std::string& value) {
  std::cerr << "invalid unsigned integer: '" << value << "'\n";
  return 1;
}

static const char* EventKindName(LedgerEventKind kind) {
  switch (kind) {
    case LEDGER_EVENT_KIND_INITIALIZE:
      return "initialize";
    case LEDGER_EVENT_KIND_ISSUE:
      return "issue";
    case LEDGER_EVENT_KIND_REDEEM:
      return "redeem";
    case LEDGER_EVENT_KIND_PAUSE:
      return "pause";
    case LEDGER_EVENT_KIND_RESUME:
      return "resume";
    case LEDGER_EVENT_KIND_VALUATION_UPDATE:
      return "valuation";
    case LEDGER_EVENT_KIND_TRANSFER:
      return "transfer";
    default:
      return "unknown";
  }
}

static void PrintSnapshot(const LedgerSnapshot& ledger) {
  std::cout << "ledger=" << ledger.id().value() << "\n";
  std::cout << "version=" << ledger.version() << "\n";
  std::cout << "supply=" << ledger.pool().circulating_supply() << "\n";
  std::cout << "total_collateral=" << ledger.total_collateral() << "\n";
  std::cout << "ratio_bps=" << ledger.collateral_ratio_bps() << "\n";
  std::cout << "healthy=" << (ledger.healthy() ? "true" : "false") << "\n";
  std::cout << "paused=" << (ledger.guard().paused() ? "true" : "false") << "\n";
  std::cout << "oracle=" << ledger.oracle().latest_value() << (ledger.oracle_stale() ? " (stale)" : "") << "\n";
  for (int i = 0; i < ledger.pool().entries_size(); ++i) {
    const auto& entry = ledger.pool().entries(i);
    std::cout << "entry[" << i << "]=" << entry.asset_id() << " value=" << entry.value();
    if (!entry.description().empty()) std::cout << " description=" << entry.description();
    std::cout << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string              addr = argv[1];
  std::string              cmd  = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto ledger_stub = TreasuryLedgerService::NewStub(channel);
  auto admin_stub  = TreasuryAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "init") {
    if (args.size() < 4) {
      Usage();
      return 1;
    }

    InitializeRequest req;
    *req.mutable_governance() = MakeAddress(args[0]);
    *req.mutable_owner()      = MakeAddress(args[1]);

    const auto supply = ParseU64(args[2]);
    if (!supply) return BadNumber(args[2]);
    const auto oracle = ParseU64(args[3]);
    if (!oracle) return BadNumber(args[3]);
    req.set_initial_supply(*supply);
    req.set_oracle_initial_value(*oracle);

    for (size_t i = 4; i < args.size(); ++i) {
      const auto eq = args[i].find('=');
      if (eq == std::string::npos) {
        std::cerr << "collateral must be asset_id=value[:description], got '" << args[i] << "'\n";
        return 1;
      }
      auto       rest  = args[i].substr(eq + 1);
      const auto colon = rest.find(':');
      const auto value = ParseU64(rest.substr(0, colon));
      if (!value) return BadNumber(rest.substr(0, colon));

      req.add_asset_ids(args[i].substr(0, eq));
      req.add_collateral_values(*value);
      req.add_descriptions(colon == std::string::npos ? "" : rest.substr(colon + 1));
    }

    InitializeResponse resp;
    auto               status = ledger_stub->Initialize(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSnapshot(resp.ledger());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "issue") {
    if (args.size() < 4) {
      Usage();
      return 1;
    }

    const auto amount = ParseU64(args[2]);
    if (!amount) return BadNumber(args[2]);
    const auto collateral = ParseU64(args[3]);
    if (!collateral) return BadNumber(args[3]);

    IssueRequest req;
    *req.mutable_ledger_id() = MakeLedgerID(args[0]);
    *req.mutable_recipient() = MakeAddress(args[1]);
    req.set_amount(*amount);
    req.set_additional_collateral_value(*collateral);
    if (args.size() >= 5) req.set_asset_id(args[4]);
    if (args.size() >= 6) req.set_description(args[5]);

    IssueResponse resp;
    auto          status = ledger_stub->Issue(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSnapshot(resp.ledger());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "redeem") {
    if (args.size() < 4) {
      Usage();
      return 1;
    }

    const auto burn = ParseU64(args[2]);
    if (!burn) return BadNumber(args[2]);
    const auto reduction = ParseU64(args[3]);
    if (!reduction) return BadNumber(args[3]);

    RedeemRequest req;
    *req.mutable_ledger_id() = MakeLedgerID(args[0]);
    *req.mutable_holder()    = MakeAddress(args[1]);
    req.set_burn_amount(*burn);
    req.set_collateral_value_reduction(*reduction);

    RedeemResponse resp;
    auto           status = ledger_stub->Redeem(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSnapshot(resp.ledger());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pause" || cmd == "resume") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    GovernanceRequest req;
    *req.mutable_ledger_id() = MakeLedgerID(args[0]);
    *req.mutable_caller()    = MakeAddress(args[1]);

    GovernanceResponse resp;
    auto status = cmd == "pause" ? ledger_stub->Pause(&ctx, req, &resp) : ledger_stub->Resume(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "paused=" << (resp.paused() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "valuation") {
    if (args.size() < 3) {
      Usage();
      return 1;
    }

    const auto value = ParseU64(args[2]);
    if (!value) return BadNumber(args[2]);

    UpdateValuationRequest req;
    *req.mutable_ledger_id() = MakeLedgerID(args[0]);
    *req.mutable_caller()    = MakeAddress(args[1]);
    req.set_value(*value);

    UpdateValuationResponse resp;
    auto                    status = ledger_stub->UpdateValuation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "oracle=" << resp.oracle().latest_value() << "\n";
    std::cout << "updated_at=" << resp.oracle().last_updated().seconds() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    if (args.size() < 1) {
      Usage();
      return 1;
    }

    CheckHealthRequest req;
    *req.mutable_ledger_id() = MakeLedgerID(args[0]);

    CheckHealthResponse resp;
    auto                status = ledger_stub->CheckHealth(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "healthy=" << (resp.healthy() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "transfer") {
    if (args.size() < 4) {
      Usage();
      return 1;
    }

    const auto amount = ParseU64(args[3]);
    if (!amount) return BadNumber(args[3]);

    TransferRequest req;
    *req.mutable_ledger_id() = MakeLedgerID(args[0]);
    *req.mutable_from()      = MakeAddress(args[1]);
    *req.mutable_to()        = MakeAddress(args[2]);
    req.set_amount(*amount);

    TransferResponse resp;
    auto             status = ledger_stub->Transfer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << args[1] << "=" << resp.from_balance() << "\n";
    std::cout << args[2] << "=" << resp.to_balance() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (args.size() < 1) {
      Usage();
      return 1;
    }

    GetLedgerRequest req;
    *req.mutable_ledger_id() = MakeLedgerID(args[0]);

    GetLedgerResponse resp;
    auto              status = ledger_stub->GetLedger(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSnapshot(resp.ledger());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "balance") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    GetBalanceRequest req;
    *req.mutable_ledger_id() = MakeLedgerID(args[0]);
    *req.mutable_holder()    = MakeAddress(args[1]);

    GetBalanceResponse resp;
    auto               status = ledger_stub->GetBalance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "balance=" << resp.balance() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListLedgersRequest  req;
    ListLedgersResponse resp;
    auto                status = ledger_stub->ListLedgers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& ledger : resp.ledgers()) {
      std::cout << ledger.id().value() << " supply=" << ledger.pool().circulating_supply() << " ratio_bps=" << ledger.collateral_ratio_bps()
                << (ledger.guard().paused() ? " paused" : "") << (ledger.healthy() ? "" : " UNHEALTHY") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    if (args.size() < 1) {
      Usage();
      return 1;
    }

    ListEventsRequest req;
    *req.mutable_ledger_id() = MakeLedgerID(args[0]);
    if (args.size() >= 2) {
      const auto start = ParseU64(args[1]);
      if (!start) return BadNumber(args[1]);
      req.set_start_sequence(*start);
    }
    if (args.size() >= 3) {
      const auto max = ParseU64(args[2]);
      if (!max) return BadNumber(args[2]);
      req.set_max_events(*max);
    }

    ListEventsResponse resp;
    auto               status = ledger_stub->ListEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      std::cout << event.sequence() << " " << EventKindName(event.kind()) << " actor=" << event.actor().value();
      if (!event.counterparty().value().empty()) std::cout << " counterparty=" << event.counterparty().value();
      std::cout << " amount=" << event.amount() << " collateral=" << event.collateral_value() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "ledgers=" << resp.ledgers() << "\n";
    std::cout << "paused=" << resp.ledgers_paused() << "\n";
    std::cout << "unhealthy=" << resp.ledgers_unhealthy() << "\n";
    std::cout << "total_supply=" << resp.total_circulating_supply() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
