#include "factory.hpp"

#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#if TABLES_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace tables::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const tables::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TABLES_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    const int   busy_ms   = sqlite.busy_timeout_ms() == 0 ? db::sqlite::kDefaultBusyTimeoutMs : static_cast<int>(sqlite.busy_timeout_ms());
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode(), busy_ms);
    db::sqlite::BootstrapSchema(*sqlite_db);
    TABLES_LOG_INFO("Using sqlite repository", {observability::StringField("path", sqlite.path()),
                                                observability::BoolField("wal_mode", sqlite.wal_mode()),
                                                observability::IntField("busy_timeout_ms", busy_ms)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidArgument("sqlite backend requested but not enabled at build time");
#endif
  }

  TABLES_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const tables::runtime::config::RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);

  service::ServiceContext ctx;
  ctx.repository = app.repository;

  app.generation_service = std::make_shared<service::GenerationService>(ctx);
  app.adjustment_service = std::make_shared<service::ManualAdjustmentService>(ctx);
  app.tournament_service = std::make_shared<service::TournamentService>(ctx);

  return app;
}

} // namespace tables::factory
