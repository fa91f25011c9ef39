#include "provider/Provider.hpp"
#include "model/Credential.hpp"
#include "model/Task.hpp"
#include "validation/Errors.hpp"

using namespace cs::provider;

Provider::Provider(std::string name, std::string title, std::string rcloneType,
                   Schema credentialsSchema, Schema taskSchema,
                   const bool buckets, const bool readonly)
    : name_(std::move(name)),
      title_(std::move(title)),
      rcloneType_(std::move(rcloneType)),
      credentialsSchema_(std::move(credentialsSchema)),
      taskSchema_(std::move(taskSchema)),
      buckets_(buckets),
      readonly_(readonly) {}

nlohmann::json Provider::getCredentialsExtra(const model::Credential&) const {
    return nlohmann::json::object();
}

nlohmann::json Provider::getTaskExtra(const model::CloudSyncTask&) const {
    return nlohmann::json::object();
}

void Provider::preSaveTask(const model::CloudSyncTask&, const model::Credential&, validation::ValidationErrors&) const {}

nlohmann::json Provider::describe() const {
    return {
        {"name", name_},
        {"title", title_},
        {"credentials_schema", schemaToJson(credentialsSchema_)},
        {"buckets", buckets_},
        {"readonly", readonly_},
        {"task_schema", schemaToJson(taskSchema_)}
    };
}
