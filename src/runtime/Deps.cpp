#include "runtime/Deps.hpp"
#include "config/Config.hpp"
#include "cron/CrontabScheduler.hpp"
#include "crypto/KeyFileSecretStore.hpp"
#include "db/MemoryStore.hpp"
#include "db/PgStore.hpp"
#include "job/Manager.hpp"
#include "log/Registry.hpp"
#include "provider/Registry.hpp"
#include "rclone/Config.hpp"
#include "rclone/Executor.hpp"
#include "runtime/paths.hpp"
#include "validation/Validator.hpp"

using namespace cs::runtime;

Deps Deps::assemble(const config::Config& config,
                    std::shared_ptr<db::Store> store,
                    std::shared_ptr<const crypto::SecretStore> secrets,
                    std::shared_ptr<cron::Scheduler> scheduler,
                    std::shared_ptr<job::Manager> jobs) {
    Deps deps;
    auto providers = std::make_shared<provider::Registry>(provider::Registry::builtin());
    auto builder = std::make_shared<rclone::ConfigBuilder>(*providers, config.runtime.tmp_dir);

    deps.executor = std::make_shared<rclone::Executor>(*builder, config.rclone);
    deps.validator = std::make_shared<validation::Validator>(*providers);
    deps.configBuilder = std::move(builder);
    deps.providers = std::move(providers);
    deps.store = std::move(store);
    deps.secrets = std::move(secrets);
    deps.scheduler = std::move(scheduler);
    deps.jobs = std::move(jobs);
    return deps;
}

Deps Deps::fromConfig(const config::Config& config) {
    log::Registry::cloudsync()->info("[Deps] Initializing (database backend: {})", config::to_string(config.database.backend));

    std::shared_ptr<db::Store> store;
    if (config.database.backend == config::DatabaseConfig::Backend::Postgres)
        store = std::make_shared<db::PgStore>(config.database);
    else store = std::make_shared<db::MemoryStore>();

    return assemble(config,
                    std::move(store),
                    std::make_shared<crypto::KeyFileSecretStore>(config.secrets.key_file),
                    std::make_shared<cron::CrontabScheduler>(config.cron),
                    std::make_shared<job::Manager>(paths::getJobLogPath(), config.runtime.tmp_dir / "locks"));
}
