#include "services/CloudSyncService.hpp"
#include "cron/Scheduler.hpp"
#include "crypto/SecretStore.hpp"
#include "db/Store.hpp"
#include "job/Manager.hpp"
#include "log/Registry.hpp"
#include "provider/Registry.hpp"
#include "rclone/Executor.hpp"
#include "validation/Validator.hpp"

#include <stdexcept>

using namespace cs::services;
using namespace cs::model;
using json = nlohmann::json;

CloudSyncService::CloudSyncService(runtime::Deps deps)
    : deps_(std::move(deps)), credentials_(deps_) {}

CloudSyncTask CloudSyncService::extend(const json& record) const {
    auto task = fromRecord(record);

    task.credential = credentials_.find(task.credential_id);
    if (!task.credential)
        log::Registry::cloudsync()->warn("[CloudSyncService] Task {} references missing credentials {}", task.id, task.credential_id);

    task.encryption_password = deps_.secrets->decrypt(task.encryption_password);
    task.encryption_salt = deps_.secrets->decrypt(task.encryption_salt);
    return task;
}

json CloudSyncService::compress(const CloudSyncTask& task) const {
    auto record = toRecord(task);
    record["encryption_password"] = deps_.secrets->encrypt(task.encryption_password);
    record["encryption_salt"] = deps_.secrets->encrypt(task.encryption_salt);
    return record;
}

void CloudSyncService::validate(CloudSyncTask& task, const std::string& schemaName) const {
    validation::ValidationErrors verrors;

    task.credential = credentials_.find(task.credential_id);
    deps_.validator->validate(verrors, schemaName, task, task.credential ? &*task.credential : nullptr);
    verrors.raiseIfAny();

    deps_.validator->validateFolder(verrors, schemaName, task, [this](const CloudSyncTask& spec) { return list(spec); });
    verrors.raiseIfAny();
}

CloudSyncTask CloudSyncService::create(const json& data) {
    auto task = CloudSyncTask::fromRequest(data, CREATE_SCHEMA);
    validate(task, CREATE_SCHEMA);

    task.id = deps_.store->insert(db::TASKS_TABLE, compress(task));
    refreshScheduler();

    log::Registry::cloudsync()->info("[CloudSyncService] Created task {} ({} {} {})", task.id,
                                     to_string(task.direction), to_string(task.transfer_mode), task.path);
    return extend(deps_.store->get(db::TASKS_TABLE, task.id));
}

CloudSyncTask CloudSyncService::update(const uint32_t id, const json& data) {
    if (!data.is_object()) {
        validation::ValidationErrors verrors;
        verrors.add(UPDATE_SCHEMA, "Not a dictionary");
        verrors.raiseIfAny();
    }

    json merged = get(id);
    merged["credentials"] = merged["credentials"].is_object() ? merged["credentials"]["id"] : merged["credentials"];
    for (const auto& [k, v] : data.items()) merged[k] = v;

    auto task = CloudSyncTask::fromRequest(merged, UPDATE_SCHEMA);
    task.id = id;
    validate(task, UPDATE_SCHEMA);

    deps_.store->update(db::TASKS_TABLE, id, compress(task));
    refreshScheduler();

    log::Registry::cloudsync()->info("[CloudSyncService] Updated task {}", id);
    return extend(deps_.store->get(db::TASKS_TABLE, id));
}

void CloudSyncService::remove(const uint32_t id) {
    deps_.store->remove(db::TASKS_TABLE, id);
    refreshScheduler();
    log::Registry::cloudsync()->info("[CloudSyncService] Deleted task {}", id);
}

std::vector<CloudSyncTask> CloudSyncService::query() const {
    std::vector<CloudSyncTask> out;
    for (const auto& r : deps_.store->query(db::TASKS_TABLE)) out.push_back(extend(r));
    return out;
}

CloudSyncTask CloudSyncService::get(const uint32_t id) const {
    return extend(deps_.store->get(db::TASKS_TABLE, id));
}

std::shared_ptr<cs::job::Job> CloudSyncService::run(const uint32_t id) {
    // Fail fast on an unknown id instead of queueing a doomed job
    (void)deps_.store->get(db::TASKS_TABLE, id);

    return deps_.jobs->submit("cloudsync.sync", "cloud_sync:" + std::to_string(id), [this, id](job::Job& job) {
        const auto task = get(id);
        if (!task.credential) throw std::runtime_error("Credentials " + std::to_string(task.credential_id) + " not found");
        return json(deps_.executor->run(job, task));
    });
}

std::vector<json> CloudSyncService::list(const CloudSyncTask& spec) const {
    const auto& provider = deps_.providers->get(spec.credential->provider);
    const auto path = provider.usesBuckets()
        ? spec.attribute("bucket") + "/" + spec.attribute("folder")
        : spec.attribute("folder");
    return deps_.executor->list(spec, path);
}

std::vector<json> CloudSyncService::listDirectory(const json& spec) const {
    if (!spec.is_object()) {
        validation::ValidationErrors verrors;
        verrors.add(CREATE_SCHEMA, "Not a dictionary");
        verrors.raiseIfAny();
    }

    // Listing specs carry no transfer settings
    auto data = spec;
    if (!data.contains("direction")) data["direction"] = "PULL";
    if (!data.contains("transfer_mode")) data["transfer_mode"] = "SYNC";
    if (!data.contains("path")) data["path"] = "";

    auto task = CloudSyncTask::fromRequest(data, CREATE_SCHEMA);
    task.credential = credentials_.find(task.credential_id);

    validation::ValidationErrors verrors;
    deps_.validator->validate(verrors, CREATE_SCHEMA, task, task.credential ? &*task.credential : nullptr);
    verrors.raiseIfAny();

    return list(task);
}

std::vector<json> CloudSyncService::listBuckets(const uint32_t credentialId) const {
    CloudSyncTask spec;
    spec.credential = credentials_.get(credentialId);
    spec.credential_id = credentialId;
    spec.attributes.reset();

    if (!deps_.providers->get(spec.credential->provider).usesBuckets())
        throw std::runtime_error("This provider does not use buckets");

    return deps_.executor->list(spec, "");
}

json CloudSyncService::providers() const {
    json out = json::array();
    for (const auto* p : deps_.providers->list()) out.push_back(p->describe());
    return out;
}

void CloudSyncService::refreshScheduler() const {
    std::vector<CloudSyncTask> tasks;
    for (const auto& r : deps_.store->query(db::TASKS_TABLE)) tasks.push_back(fromRecord(r));
    deps_.scheduler->refresh(tasks);
}
