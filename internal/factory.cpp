#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/core/transfer_process_manager.hpp"
#include "internal/core/wait_strategy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/dispatcher_registry.hpp"
#include "internal/dispatch/grpc_dispatcher.hpp"
#include "internal/flow/data_flow_manager.hpp"
#include "internal/flow/file_copy_flow_controller.hpp"
#include "internal/grpc/transfer_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/monitor.hpp"
#include "internal/provision/directory_provisioner.hpp"
#include "internal/provision/manifest_generator.hpp"
#include "internal/provision/provision_manager.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/transfer_service.hpp"
#include "internal/store/repository_store.hpp"
#include "internal/util/errors.hpp"
#if TRANSFER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TRANSFER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace transfer::factory {

using transfer::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<core::WaitStrategy> BuildWaitStrategy(const transfer::runtime::config::WaitStrategyConfig& wait) {
  if (wait.has_exponential()) {
    return std::make_shared<core::ExponentialWaitStrategy>(std::chrono::milliseconds(wait.exponential().initial_ms()),
                                                           std::chrono::milliseconds(wait.exponential().max_ms()));
  }
  if (wait.has_fixed()) {
    return std::make_shared<core::FixedWaitStrategy>(std::chrono::milliseconds(wait.fixed().wait_ms()));
  }
  return std::make_shared<core::FixedWaitStrategy>();
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TRANSFER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TRANSFER_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::PgRepository::BootstrapSchema(*pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigurationError("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<store::RepositoryTransferProcessStore>(app.repository);

  auto monitor = std::make_shared<observability::LogMonitor>();

  // ------------------------------------------------------------------
  // Provisioning
  // ------------------------------------------------------------------
  auto manifest_generator = std::make_shared<provision::RegistryManifestGenerator>();
  manifest_generator->RegisterClientGenerator(std::make_shared<provision::DirectoryResourceGenerator>());

  auto provision_manager = std::make_shared<provision::ProvisionManagerImpl>(app.store, monitor);
  provision_manager->Register(std::make_shared<provision::DirectoryProvisioner>(config.provisioning().staging_root()));

  // ------------------------------------------------------------------
  // Dispatch and data flow
  // ------------------------------------------------------------------
  auto dispatcher_registry = std::make_shared<dispatch::RemoteMessageDispatcherRegistry>();
  dispatcher_registry->Register(
      std::make_shared<dispatch::GrpcRemoteMessageDispatcher>(std::chrono::milliseconds(config.dispatch().grpc().deadline_ms())));

  auto data_flow_manager = std::make_shared<flow::DataFlowManagerImpl>();
  data_flow_manager->Register(
      std::make_shared<flow::FileCopyFlowController>(config.flow().source_root(), config.flow().destination_root()));

  // ------------------------------------------------------------------
  // Process manager
  // ------------------------------------------------------------------
  core::TransferProcessManagerConfig manager_config;
  manager_config.manifest_generator  = manifest_generator;
  manager_config.provision_manager   = provision_manager;
  manager_config.dispatcher_registry = dispatcher_registry;
  manager_config.data_flow_manager   = data_flow_manager;
  manager_config.monitor             = monitor;
  manager_config.batch_size          = config.manager().batch_size();
  manager_config.wait_strategy       = BuildWaitStrategy(config.manager().wait());
  if (config.manager().provisioning_timeout_ms() > 0) {
    manager_config.provisioning_timeout = std::chrono::milliseconds(config.manager().provisioning_timeout_ms());
  }

  app.manager = std::make_shared<core::TransferProcessManager>(std::move(manager_config));
  app.manager->AttachStore(app.store);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;
  ctx.store   = app.store;

  auto transfer_service = std::make_shared<service::TransferService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::TransferServer>(transfer_service));

  TRANSFER_LOG_INFO("Application built", {observability::StringField("staging_root", config.provisioning().staging_root()),
                                         observability::IntField("batch_size", config.manager().batch_size())});
  return app;
}

} // namespace transfer::factory
