#pragma once

#include "model/Task.hpp"
#include "runtime/Deps.hpp"
#include "services/CredentialService.hpp"

#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::job { class Job; }

namespace cs::services {

// cloudsync: task CRUD, runs and remote listings
class CloudSyncService {
public:
    static constexpr auto CREATE_SCHEMA = "cloud_sync";
    static constexpr auto UPDATE_SCHEMA = "cloud_sync_update";

    explicit CloudSyncService(runtime::Deps deps);

    // Both validation stages run before anything is written
    model::CloudSyncTask create(const nlohmann::json& data);

    // Partial patch over the stored task
    model::CloudSyncTask update(uint32_t id, const nlohmann::json& data);

    void remove(uint32_t id);

    [[nodiscard]] std::vector<model::CloudSyncTask> query() const;
    [[nodiscard]] model::CloudSyncTask get(uint32_t id) const;

    // Background job, single flight per task under "cloud_sync:<id>"
    std::shared_ptr<job::Job> run(uint32_t id);

    // {credentials, encryption..., attributes: {bucket?, folder}}
    [[nodiscard]] std::vector<nlohmann::json> listDirectory(const nlohmann::json& spec) const;

    [[nodiscard]] std::vector<nlohmann::json> listBuckets(uint32_t credentialId) const;

    [[nodiscard]] nlohmann::json providers() const;

    // Regenerates the schedule from the stored tasks
    void refreshScheduler() const;

    // Stored record -> public task (credential loaded, secrets decrypted)
    [[nodiscard]] model::CloudSyncTask extend(const nlohmann::json& record) const;

    // Public task -> stored record (credential id, secrets encrypted, flat cron)
    [[nodiscard]] nlohmann::json compress(const model::CloudSyncTask& task) const;

    [[nodiscard]] const CredentialService& credentials() const { return credentials_; }

private:
    runtime::Deps deps_;
    CredentialService credentials_;

    void validate(model::CloudSyncTask& task, const std::string& schemaName) const;
    [[nodiscard]] std::vector<nlohmann::json> list(const model::CloudSyncTask& spec) const;
};

}
