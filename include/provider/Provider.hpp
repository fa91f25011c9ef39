#pragma once

#include "provider/Schema.hpp"

#include <string>
#include <nlohmann/json.hpp>

namespace cs::model {
struct Credential;
struct CloudSyncTask;
}

namespace cs::validation { class ValidationErrors; }

namespace cs::provider {

// Descriptor of one cloud backend. Instances are immutable once registered
// and shared read-only by every request.
class Provider {
public:
    virtual ~Provider() = default;

    Provider(const Provider&) = delete;
    Provider& operator=(const Provider&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& title() const { return title_; }
    [[nodiscard]] const std::string& rcloneType() const { return rcloneType_; }
    [[nodiscard]] bool usesBuckets() const { return buckets_; }
    [[nodiscard]] bool readonly() const { return readonly_; }
    [[nodiscard]] const Schema& credentialsSchema() const { return credentialsSchema_; }
    [[nodiscard]] const Schema& taskSchema() const { return taskSchema_; }

    // Extra [remote] keys derived from the credential
    [[nodiscard]] virtual nlohmann::json getCredentialsExtra(const model::Credential& credential) const;

    // Extra [remote] keys derived from the task
    [[nodiscard]] virtual nlohmann::json getTaskExtra(const model::CloudSyncTask& task) const;

    // Provider business rules; errors are relative to the task attributes
    virtual void preSaveTask(const model::CloudSyncTask& task,
                             const model::Credential& credential,
                             validation::ValidationErrors& verrors) const;

    [[nodiscard]] nlohmann::json describe() const;

protected:
    Provider(std::string name, std::string title, std::string rcloneType,
             Schema credentialsSchema, Schema taskSchema = {},
             bool buckets = false, bool readonly = false);

private:
    std::string name_, title_, rcloneType_;
    Schema credentialsSchema_, taskSchema_;
    bool buckets_, readonly_;
};

}
