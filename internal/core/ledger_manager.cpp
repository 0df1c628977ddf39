#include "ledger_manager.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/util/wide.hpp"

namespace treasury::core {

namespace pb = treasury::ledger::core::v1;

using observability::BoolField;
using observability::StringField;
using observability::UIntField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message + " (" + std::string(db::ErrorCodeName(result.code)) + ")");
  }
}

LedgerState ToLedgerState(const db::model::LedgerRecord& record) {
  std::vector<CollateralEntry> entries;
  entries.reserve(record.entries.size());
  for (const auto& entry : record.entries) {
    entries.push_back({entry.asset_id, entry.description, entry.value});
  }

  LedgerState state;
  state.id     = record.id;
  state.pool   = CollateralPool(std::move(entries), record.circulating_supply);
  state.oracle = ValuationOracle(record.oracle_value, util::FromUnixMillis(record.oracle_updated_ms));
  state.guard  = GovernanceGuard(record.governance, record.paused);
  return state;
}

// Carries version and created_at over from `base`.
db::model::LedgerRecord ToLedgerRecord(const TreasuryLedger& ledger, const db::model::LedgerRecord& base) {
  db::model::LedgerRecord record;
  record.id = ledger.Id();
  for (const auto& entry : ledger.Pool().Entries()) {
    record.entries.push_back({entry.asset_id, entry.description, entry.value});
  }
  record.circulating_supply = ledger.Pool().CirculatingSupply();
  record.oracle_value       = ledger.Oracle().LatestValue();
  record.oracle_updated_ms  = util::ToUnixMillis(ledger.Oracle().LastUpdated());
  record.governance         = ledger.Guard().Governance();
  record.paused             = ledger.Guard().IsPaused();
  record.version            = base.version;
  record.created_at_ms      = base.created_at_ms;
  return record;
}

uint64_t Saturate(util::Wide value) {
  return util::FitsU64(value) ? static_cast<uint64_t>(value) : static_cast<uint64_t>(util::kU64Max);
}

db::model::LedgerEventRecord MakeEvent(const std::string& ledger_id, pb::LedgerEventKind kind, const Address& actor) {
  db::model::LedgerEventRecord event;
  event.ledger_id     = ledger_id;
  event.kind          = kind;
  event.actor         = actor;
  event.created_at_ms = util::ToUnixMillis(util::Now());
  return event;
}

pb::LedgerEvent ToProto(const db::model::LedgerEventRecord& record) {
  pb::LedgerEvent event;
  event.mutable_ledger_id()->set_value(record.ledger_id);
  event.set_sequence(record.sequence);
  event.set_kind(record.kind);
  event.mutable_actor()->set_value(record.actor);
  event.mutable_counterparty()->set_value(record.counterparty);
  event.set_amount(record.amount);
  event.set_collateral_value(record.collateral_value);
  *event.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return event;
}

HoldingTable LoadHoldings(db::Repository& repository, db::Transaction& tx, const std::string& ledger_id) {
  HoldingTable::Balances balances;
  for (const auto& holding : repository.ListHoldings(tx, ledger_id)) {
    balances[holding.holder] = holding.balance;
  }
  return HoldingTable(ledger_id, std::move(balances));
}

} // namespace

LedgerManager::LedgerManager(std::shared_ptr<db::Repository> repository) : LedgerManager(std::move(repository), Options{}) {
}

LedgerManager::LedgerManager(std::shared_ptr<db::Repository> repository, Options options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("ledger manager requires a repository");
  }
}

std::shared_ptr<std::mutex> LedgerManager::LedgerMutex(const std::string& ledger_id) {
  std::lock_guard<std::mutex> lock(ledger_mutexes_guard_);
  auto&                       ledger_mutex = ledger_mutexes_[ledger_id];
  if (!ledger_mutex) {
    ledger_mutex = std::make_shared<std::mutex>();
  }
  return ledger_mutex;
}

LedgerManager::LedgerLock::LedgerLock(LedgerManager& manager, const std::string& ledger_id)
    : manager_(manager), ledger_id_(ledger_id), mutex_(manager.LedgerMutex(ledger_id)) {
  mutex_->lock();
}

LedgerManager::LedgerLock::~LedgerLock() {
  mutex_->unlock();

  // Copies are only taken under the guard, so the table plus this lock
  // being the sole owners means no caller is waiting on the entry.
  std::lock_guard<std::mutex> lock(manager_.ledger_mutexes_guard_);
  auto                        it = manager_.ledger_mutexes_.find(ledger_id_);
  if (it != manager_.ledger_mutexes_.end() && it->second == mutex_ && mutex_.use_count() == 2) {
    manager_.ledger_mutexes_.erase(it);
  }
}

std::size_t LedgerManager::TrackedLedgerLocks() const {
  std::lock_guard<std::mutex> lock(ledger_mutexes_guard_);
  return ledger_mutexes_.size();
}

LedgerManager::Loaded LedgerManager::Load(db::Transaction& tx, const std::string& ledger_id, const char* context) {
  auto record = repository_->GetLedger(tx, ledger_id);
  if (!record.has_value()) {
    throw util::NotFound(std::string(context) + ": ledger not found: " + ledger_id);
  }
  auto ledger   = TreasuryLedger::Restore(ToLedgerState(*record));
  auto holdings = LoadHoldings(*repository_, tx, ledger_id);
  return Loaded{std::move(*record), std::move(ledger), std::move(holdings)};
}

db::model::LedgerRecord LedgerManager::Persist(db::Transaction& tx, const Loaded& before, const TreasuryLedger& ledger,
                                               const HoldingTable& holdings, db::model::LedgerEventRecord event, const char* context) {
  auto record = ToLedgerRecord(ledger, before.record);
  record.version++;
  ThrowIfDbError(repository_->UpdateLedger(tx, record), context);

  for (const auto& [holder, balance] : holdings.All()) {
    if (before.holdings.All().contains(holder) && before.holdings.BalanceOf(holder) == balance) {
      continue;
    }
    ThrowIfDbError(repository_->UpsertHolding(tx, {ledger.Id(), holder, balance}), context);
  }

  ThrowIfDbError(repository_->AppendEvent(tx, event), context);
  return record;
}

pb::LedgerSnapshot LedgerManager::BuildSnapshot(const db::model::LedgerRecord& record) const {
  const auto state = ToLedgerState(record);
  const auto total = state.pool.TotalValue();

  pb::LedgerSnapshot snapshot;
  snapshot.mutable_id()->set_value(record.id);

  auto* pool = snapshot.mutable_pool();
  for (const auto& entry : record.entries) {
    auto* out = pool->add_entries();
    out->set_asset_id(entry.asset_id);
    out->set_description(entry.description);
    out->set_value(entry.value);
  }
  pool->set_circulating_supply(record.circulating_supply);

  snapshot.mutable_oracle()->set_latest_value(record.oracle_value);
  *snapshot.mutable_oracle()->mutable_last_updated() = util::ToProto(state.oracle.LastUpdated());

  snapshot.mutable_guard()->mutable_governance()->set_value(record.governance);
  snapshot.mutable_guard()->set_paused(record.paused);

  snapshot.set_version(record.version);
  snapshot.set_healthy(IsCollateralized(total, record.circulating_supply));
  snapshot.set_oracle_stale(state.oracle.IsStale(util::Now(), options_.oracle_max_age));
  snapshot.set_collateral_ratio_bps(CollateralRatioBps(total, record.circulating_supply));
  snapshot.set_total_collateral(util::ToDecimal(total));
  *snapshot.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return snapshot;
}

void LedgerManager::PublishGauges(const db::model::LedgerRecord& record) const {
  util::Wide total = 0;
  for (const auto& entry : record.entries) {
    total += entry.value;
  }
  auto& metrics = observability::Metrics::Instance();
  metrics.SetCirculatingSupply(record.id, record.circulating_supply);
  metrics.SetCollateralRatioBps(record.id, CollateralRatioBps(total, record.circulating_supply));
}

pb::LedgerSnapshot LedgerManager::Initialize(TreasuryLedger::InitializeParams params) {
  if (params.ledger_id.empty()) {
    params.ledger_id = util::NewLedgerId();
  }
  params.now = util::Now();

  LedgerLock lock(*this, params.ledger_id);

  auto tx = repository_->Begin();
  if (repository_->GetLedger(*tx, params.ledger_id).has_value()) {
    throw util::AlreadyExists("initialize ledger: ledger already exists: " + params.ledger_id);
  }

  HoldingTable holdings(params.ledger_id);
  auto         ledger = TreasuryLedger::Initialize(params, holdings);

  db::model::LedgerRecord base;
  base.version       = 1;
  base.created_at_ms = util::ToUnixMillis(params.now);
  const auto record  = ToLedgerRecord(ledger, base);

  ThrowIfDbError(repository_->InsertLedger(*tx, record), "initialize ledger");
  for (const auto& [holder, balance] : holdings.All()) {
    ThrowIfDbError(repository_->UpsertHolding(*tx, {record.id, holder, balance}), "initialize ledger");
  }

  auto event             = MakeEvent(record.id, pb::LEDGER_EVENT_KIND_INITIALIZE, params.owner);
  event.counterparty     = params.governance;
  event.amount           = params.initial_supply;
  event.collateral_value = Saturate(ledger.Pool().TotalValue()); // saturated; the snapshot carries the exact sum
  ThrowIfDbError(repository_->AppendEvent(*tx, event), "initialize ledger");
  tx->Commit();

  PublishGauges(record);
  TREASURY_LOG_INFO("ledger initialized", {StringField("ledger", record.id), StringField("owner", params.owner),
                                           UIntField("supply", record.circulating_supply), UIntField("entries", record.entries.size())});
  return BuildSnapshot(record);
}

pb::LedgerSnapshot LedgerManager::Issue(const std::string& ledger_id, const TreasuryLedger::IssueParams& params) {
  LedgerLock lock(*this, ledger_id);

  auto tx     = repository_->Begin();
  auto loaded = Load(*tx, ledger_id, "issue");

  auto ledger   = TreasuryLedger::Restore(loaded.ledger.State());
  auto holdings = loaded.holdings;
  ledger.Issue(params, holdings);

  auto event             = MakeEvent(ledger_id, pb::LEDGER_EVENT_KIND_ISSUE, params.recipient);
  event.amount           = params.amount;
  event.collateral_value = params.additional_collateral_value;
  const auto record      = Persist(*tx, loaded, ledger, holdings, std::move(event), "issue");
  tx->Commit();

  PublishGauges(record);
  TREASURY_LOG_INFO("ledger issued", {StringField("ledger", ledger_id), StringField("recipient", params.recipient),
                                      UIntField("amount", params.amount), UIntField("collateral", params.additional_collateral_value),
                                      UIntField("version", record.version)});
  return BuildSnapshot(record);
}

pb::LedgerSnapshot LedgerManager::Redeem(const std::string& ledger_id, const Address& holder, uint64_t burn_amount,
                                         uint64_t collateral_value_reduction) {
  LedgerLock lock(*this, ledger_id);

  auto tx     = repository_->Begin();
  auto loaded = Load(*tx, ledger_id, "redeem");

  auto ledger   = TreasuryLedger::Restore(loaded.ledger.State());
  auto holdings = loaded.holdings;
  ledger.Redeem(holder, burn_amount, collateral_value_reduction, holdings);

  auto event             = MakeEvent(ledger_id, pb::LEDGER_EVENT_KIND_REDEEM, holder);
  event.amount           = burn_amount;
  event.collateral_value = collateral_value_reduction;
  const auto record      = Persist(*tx, loaded, ledger, holdings, std::move(event), "redeem");
  tx->Commit();

  PublishGauges(record);
  TREASURY_LOG_INFO("ledger redeemed", {StringField("ledger", ledger_id), StringField("holder", holder), UIntField("amount", burn_amount),
                                        UIntField("reduction", collateral_value_reduction), UIntField("version", record.version)});
  if (!ledger.CheckHealth()) {
    TREASURY_LOG_WARN("redeem left ledger under-collateralized",
                      {StringField("ledger", ledger_id), StringField("total_collateral", util::ToDecimal(ledger.Pool().TotalValue())),
                       UIntField("supply", ledger.Pool().CirculatingSupply())});
  }
  return BuildSnapshot(record);
}

bool LedgerManager::Pause(const std::string& ledger_id, const Address& caller) {
  LedgerLock lock(*this, ledger_id);

  auto tx     = repository_->Begin();
  auto loaded = Load(*tx, ledger_id, "pause");

  auto ledger = TreasuryLedger::Restore(loaded.ledger.State());
  ledger.Pause(caller);

  const auto record = Persist(*tx, loaded, ledger, loaded.holdings, MakeEvent(ledger_id, pb::LEDGER_EVENT_KIND_PAUSE, caller), "pause");
  tx->Commit();

  TREASURY_LOG_WARN("ledger paused", {StringField("ledger", ledger_id), StringField("caller", caller), BoolField("was_paused", loaded.record.paused)});
  return record.paused;
}

bool LedgerManager::Resume(const std::string& ledger_id, const Address& caller) {
  LedgerLock lock(*this, ledger_id);

  auto tx     = repository_->Begin();
  auto loaded = Load(*tx, ledger_id, "resume");

  auto ledger = TreasuryLedger::Restore(loaded.ledger.State());
  ledger.Resume(caller);

  const auto record = Persist(*tx, loaded, ledger, loaded.holdings, MakeEvent(ledger_id, pb::LEDGER_EVENT_KIND_RESUME, caller), "resume");
  tx->Commit();

  TREASURY_LOG_INFO("ledger resumed", {StringField("ledger", ledger_id), StringField("caller", caller), BoolField("was_paused", loaded.record.paused)});
  return record.paused;
}

pb::ValuationOracle LedgerManager::UpdateValuation(const std::string& ledger_id, const Address& caller, uint64_t value) {
  LedgerLock lock(*this, ledger_id);

  auto tx     = repository_->Begin();
  auto loaded = Load(*tx, ledger_id, "update valuation");

  auto ledger = TreasuryLedger::Restore(loaded.ledger.State());
  ledger.UpdateValuation(caller, value, util::Now());

  auto event             = MakeEvent(ledger_id, pb::LEDGER_EVENT_KIND_VALUATION_UPDATE, caller);
  event.collateral_value = value;
  const auto record      = Persist(*tx, loaded, ledger, loaded.holdings, std::move(event), "update valuation");
  tx->Commit();

  TREASURY_LOG_INFO("valuation updated", {StringField("ledger", ledger_id), UIntField("value", value), UIntField("version", record.version)});

  pb::ValuationOracle oracle;
  oracle.set_latest_value(ledger.Oracle().LatestValue());
  *oracle.mutable_last_updated() = util::ToProto(ledger.Oracle().LastUpdated());
  return oracle;
}

LedgerManager::TransferResult LedgerManager::Transfer(const std::string& ledger_id, const Address& from, const Address& to, uint64_t amount) {
  LedgerLock lock(*this, ledger_id);

  auto tx     = repository_->Begin();
  auto loaded = Load(*tx, ledger_id, "transfer");

  // Not gated by pause.
  auto holdings = loaded.holdings;
  holdings.Transfer(from, to, amount);

  auto event         = MakeEvent(ledger_id, pb::LEDGER_EVENT_KIND_TRANSFER, from);
  event.counterparty = to;
  event.amount       = amount;
  const auto record  = Persist(*tx, loaded, loaded.ledger, holdings, std::move(event), "transfer");
  tx->Commit();

  TREASURY_LOG_DEBUG("units transferred", {StringField("ledger", ledger_id), StringField("from", from), StringField("to", to),
                                           UIntField("amount", amount), UIntField("version", record.version)});
  return {holdings.BalanceOf(from), holdings.BalanceOf(to)};
}

bool LedgerManager::CheckHealth(const std::string& ledger_id) {
  auto tx     = repository_->Begin();
  auto loaded = Load(*tx, ledger_id, "check health");
  tx->Commit();
  return loaded.ledger.CheckHealth();
}

pb::LedgerSnapshot LedgerManager::GetLedger(const std::string& ledger_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetLedger(*tx, ledger_id);
  tx->Commit();
  if (!record.has_value()) {
    throw util::NotFound("get ledger: ledger not found: " + ledger_id);
  }
  return BuildSnapshot(*record);
}

uint64_t LedgerManager::GetBalance(const std::string& ledger_id, const Address& holder) {
  auto tx = repository_->Begin();
  if (!repository_->GetLedger(*tx, ledger_id).has_value()) {
    throw util::NotFound("get balance: ledger not found: " + ledger_id);
  }
  auto holding = repository_->GetHolding(*tx, ledger_id, holder);
  tx->Commit();
  return holding.has_value() ? holding->balance : 0;
}

std::vector<pb::LedgerSnapshot> LedgerManager::ListLedgers() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListLedgers(*tx);
  tx->Commit();

  std::vector<pb::LedgerSnapshot> snapshots;
  snapshots.reserve(records.size());
  for (const auto& record : records) {
    snapshots.push_back(BuildSnapshot(record));
  }
  return snapshots;
}

std::vector<pb::LedgerEvent> LedgerManager::ListEvents(const std::string& ledger_id, uint64_t start_sequence, std::optional<uint64_t> max_events) {
  auto tx = repository_->Begin();
  if (!repository_->GetLedger(*tx, ledger_id).has_value()) {
    throw util::NotFound("list events: ledger not found: " + ledger_id);
  }
  auto records = repository_->ListEvents(*tx, ledger_id, start_sequence, max_events);
  tx->Commit();

  std::vector<pb::LedgerEvent> events;
  events.reserve(records.size());
  for (const auto& record : records) {
    events.push_back(ToProto(record));
  }
  return events;
}

treasury::ledger::admin::v1::StatsResponse LedgerManager::Stats() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListLedgers(*tx);
  tx->Commit();

  treasury::ledger::admin::v1::StatsResponse stats;
  util::Wide                                 total_supply = 0;
  uint64_t                                   paused       = 0;
  uint64_t                                   unhealthy    = 0;
  for (const auto& record : records) {
    const auto state = ToLedgerState(record);
    total_supply += record.circulating_supply;
    if (record.paused) paused++;
    if (!IsCollateralized(state.pool.TotalValue(), record.circulating_supply)) unhealthy++;
  }
  stats.set_ledgers(records.size());
  stats.set_ledgers_paused(paused);
  stats.set_ledgers_unhealthy(unhealthy);
  stats.set_total_circulating_supply(util::ToDecimal(total_supply));
  return stats;
}

} // namespace treasury::core
