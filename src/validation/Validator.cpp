#include "validation/Validator.hpp"
#include "log/Registry.hpp"
#include "model/Task.hpp"
#include "provider/Registry.hpp"

#include <stdexcept>

using namespace cs::validation;
using namespace cs::provider;

namespace {

std::string trimSlashes(const std::string& s) {
    const auto first = s.find_first_not_of('/');
    if (first == std::string::npos) return {};
    return s.substr(first, s.find_last_not_of('/') - first + 1);
}

}

Validator::Validator(const Registry& registry) : registry_(registry) {}

void Validator::validateCredential(ValidationErrors& verrors, const std::string& name, model::Credential& credential) const {
    const auto* provider = registry_.find(credential.provider);
    if (!provider) {
        verrors.add(name + ".provider", "Invalid provider");
        return;
    }

    verrors.addChild(name + ".attributes", validateAttributes(provider->credentialsSchema(), credential.attributes));
}

void Validator::validate(ValidationErrors& verrors, const std::string& name,
                         model::CloudSyncTask& task, const model::Credential* credential) const {
    if (task.encryption && task.encryption_password.empty())
        verrors.add(name + ".encryption_password", "This field is required when encryption is enabled");

    verrors.addChild(name + ".schedule", task.schedule.validate());

    if (!credential) {
        verrors.add(name + ".credentials", "Credentials " + std::to_string(task.credential_id) + " not found");
        return;
    }

    const auto* provider = registry_.find(credential->provider);
    if (!provider) {
        verrors.add(name + ".credentials", "Invalid provider: " + credential->provider);
        return;
    }

    if (task.direction == model::Direction::Push && provider->readonly())
        verrors.add(name + ".direction", "This remote is read-only");

    Schema schema;
    if (provider->usesBuckets()) schema.push_back(Field::str("bucket", true));
    schema.push_back(Field::str("folder", true));
    schema.insert(schema.end(), provider->taskSchema().begin(), provider->taskSchema().end());

    if (!task.attributes) task.attributes = nlohmann::json::object();
    auto attrErrors = validateAttributes(schema, *task.attributes, true);

    if (attrErrors.empty()) {
        provider->preSaveTask(task, *credential, attrErrors);
        if (!attrErrors.empty())
            log::Registry::provider()->debug("[Validator] {} rejected task attributes ({} errors)", provider->name(), attrErrors.size());
    }

    verrors.addChild(name + ".attributes", attrErrors);
}

void Validator::validateFolder(ValidationErrors& verrors, const std::string& name,
                               const model::CloudSyncTask& task, const Lister& lister) const {
    if (task.direction != model::Direction::Pull) return;

    const auto folder = trimSlashes(task.attribute("folder"));
    if (folder.empty()) return;

    const auto slash = folder.rfind('/');
    const auto parent = slash == std::string::npos ? std::string{} : folder.substr(0, slash);
    const auto basename = slash == std::string::npos ? folder : folder.substr(slash + 1);

    auto spec = task;
    if (!spec.attributes) spec.attributes = nlohmann::json::object();
    (*spec.attributes)["folder"] = parent;

    std::vector<nlohmann::json> entries;
    try {
        entries = lister(spec);
    } catch (const std::runtime_error& e) {
        verrors.add(name + ".attributes.folder", e.what());
        return;
    }

    for (const auto& item : entries) {
        if (!item.is_object() || item.value("Name", "") != basename) continue;
        if (!item.value("IsDir", false)) verrors.add(name + ".attributes.folder", "This is not a directory");
        return;
    }

    verrors.add(name + ".attributes.folder", "Directory does not exist");
}
