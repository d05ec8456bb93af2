#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/catalog/operation_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/request_server.hpp"
#include "internal/interpreter/keyword_classifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/executor_registry.hpp"
#include "internal/service/service_context.hpp"
#include "internal/status/in_process_transport.hpp"
#include "internal/storage/storage_factory.hpp"
#if WAVEQ_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace waveq::factory {

using namespace waveq;

std::shared_ptr<db::Repository> BuildRepository(const waveq::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if WAVEQ_DB_SQLITE
    const auto& sqlite = database.sqlite();
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), !sqlite.has_wal_mode() || sqlite.wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

void Application::Start() {
  workers->Start();
  if (intake) {
    intake->Start();
  }
}

void Application::Stop() {
  if (intake) {
    intake->Stop();
  }
  if (workers) {
    workers->Stop();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const waveq::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and audio storage
  // ------------------------------------------------------------------
  app.repository  = BuildRepository(config.database());
  app.audio_store = storage::StorageFactory::Build(config.storage());

  // ------------------------------------------------------------------
  // Request state
  // ------------------------------------------------------------------
  app.store     = std::make_shared<store::RequestStore>(app.repository);
  app.scheduler = std::make_shared<scheduler::RequestScheduler>(app.store, config.scheduler().max_active_per_client());

  // ------------------------------------------------------------------
  // Status channel
  // ------------------------------------------------------------------
  status::PublisherOptions publisher_options;
  publisher_options.publish_attempts = config.status().publish_attempts();
  publisher_options.progress_events  = !config.status().has_progress_events() || config.status().progress_events();

  app.transport = std::make_shared<status::InProcessTransport>();
  app.publisher = std::make_shared<status::StatusPublisher>(app.transport, publisher_options);

  auto publisher = app.publisher;
  app.store->SetTransitionListener([publisher](const store::RequestEvent& event) { publisher->OnTransition(event); });

  // ------------------------------------------------------------------
  // Interpretation and execution
  // ------------------------------------------------------------------
  const auto& catalog = catalog::OperationCatalog::Default();
  app.interpreter     = std::make_shared<interpreter::InstructionInterpreter>(
      catalog, std::make_shared<interpreter::KeywordClassifier>(), config.scheduler().default_priority());

  pipeline::PipelineOptions pipeline_options;
  pipeline_options.max_attempts           = config.execution().max_attempts();
  pipeline_options.retry_backoff_ms       = config.execution().retry_backoff_ms();
  pipeline_options.operation_timeout_ms   = config.execution().operation_timeout_ms();
  pipeline_options.max_abandoned_attempts = config.execution().max_abandoned_attempts();

  app.executor = std::make_shared<pipeline::PipelineExecutor>(app.store, pipeline::BuildDefaultRegistry(), app.audio_store, pipeline_options);
  app.workers  = std::make_shared<pipeline::WorkerPool>(app.scheduler, app.executor, config.workers().threads());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.catalog     = &catalog;
  ctx.interpreter = app.interpreter;
  ctx.store       = app.store;
  ctx.scheduler   = app.scheduler;
  ctx.audio_store = app.audio_store;
  ctx.publisher   = app.publisher;
  ctx.transport   = app.transport;

  app.request_service = std::make_shared<service::RequestService>(ctx);

  if (config.intake().enabled()) {
    app.intake = std::make_shared<service::IntakeListener>(app.request_service, app.transport, config.intake().topic());
  }

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RequestServer>(app.request_service));

  WAVEQ_LOG_INFO("Engine assembled", {observability::StringField("database", config.database().has_sqlite() ? "sqlite" : "memory"),
                                      observability::StringField("storage", config.storage().has_disk() ? "disk" : "ram"),
                                      observability::IntField("workers", config.workers().threads())});

  return app;
}

} // namespace waveq::factory
