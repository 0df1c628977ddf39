#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/ledger_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/service_context.hpp"
#if TREASURY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace treasury::factory {

using namespace treasury;

namespace {

#if TREASURY_DB_SQLITE
// Append new steps; never edit a shipped one.
const std::vector<std::string>& SqliteSchemaMigrations() {
  static const std::vector<std::string> kMigrations = {
      "CREATE TABLE IF NOT EXISTS ledgers (id TEXT PRIMARY KEY, circulating_supply INTEGER NOT NULL, oracle_value INTEGER NOT NULL, oracle_updated_ms INTEGER NOT NULL, governance TEXT NOT NULL, paused INTEGER NOT NULL, version INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS collateral_entries (ledger_id TEXT NOT NULL REFERENCES ledgers(id) ON DELETE CASCADE, position INTEGER NOT NULL, asset_id BLOB NOT NULL, description TEXT NOT NULL, value INTEGER NOT NULL, PRIMARY KEY (ledger_id, position), UNIQUE (ledger_id, asset_id));",
      "CREATE TABLE IF NOT EXISTS holdings (ledger_id TEXT NOT NULL REFERENCES ledgers(id) ON DELETE CASCADE, holder TEXT NOT NULL, balance INTEGER NOT NULL, PRIMARY KEY (ledger_id, holder));",
      "CREATE TABLE IF NOT EXISTS ledger_events (ledger_id TEXT NOT NULL REFERENCES ledgers(id) ON DELETE CASCADE, sequence INTEGER NOT NULL, kind INTEGER NOT NULL, actor TEXT NOT NULL, counterparty TEXT NOT NULL, amount INTEGER NOT NULL, collateral_value INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (ledger_id, sequence));"};
  return kMigrations;
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const treasury::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TREASURY_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode = database.sqlite().wal_mode();
    if (database.sqlite().busy_timeout_ms() > 0) {
      options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());
    }

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    sqlite_db->ApplyMigrations(SqliteSchemaMigrations());
    TREASURY_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  TREASURY_LOG_INFO("using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const treasury::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  core::LedgerManager::Options options;
  options.oracle_max_age = std::chrono::milliseconds(config.ledger().oracle_max_age_ms());
  app.manager            = std::make_shared<core::LedgerManager>(app.repository, options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;

  auto ledger_service = std::make_shared<service::LedgerService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::LedgerServer>(ledger_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace treasury::factory
