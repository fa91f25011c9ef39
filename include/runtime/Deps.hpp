#pragma once

#include <memory>

namespace cs::config { struct Config; }
namespace cs::provider { class Registry; }
namespace cs::db { class Store; }
namespace cs::crypto { struct SecretStore; }
namespace cs::cron { class Scheduler; }
namespace cs::job { class Manager; }
namespace cs::rclone { class ConfigBuilder; class Executor; }
namespace cs::validation { class Validator; }

namespace cs::runtime {

// Collaborators shared by the services. Built once at startup; tests swap in
// their own store, secret store and scheduler.
struct Deps {
    std::shared_ptr<const provider::Registry> providers;
    std::shared_ptr<db::Store> store;
    std::shared_ptr<const crypto::SecretStore> secrets;
    std::shared_ptr<cron::Scheduler> scheduler;
    std::shared_ptr<const rclone::ConfigBuilder> configBuilder;
    std::shared_ptr<const rclone::Executor> executor;
    std::shared_ptr<const validation::Validator> validator;
    // Last, so running jobs are joined before the pieces they use go away
    std::shared_ptr<job::Manager> jobs;

    // Production wiring from the loaded configuration
    static Deps fromConfig(const config::Config& config);

    // Registry-derived pieces (config builder, executor, validator) on top
    // of the given store/secrets/scheduler/jobs
    static Deps assemble(const config::Config& config,
                         std::shared_ptr<db::Store> store,
                         std::shared_ptr<const crypto::SecretStore> secrets,
                         std::shared_ptr<cron::Scheduler> scheduler,
                         std::shared_ptr<job::Manager> jobs);
};

}
