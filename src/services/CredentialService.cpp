#include "services/CredentialService.hpp"
#include "db/Store.hpp"
#include "log/Registry.hpp"
#include "validation/Validator.hpp"

#include <algorithm>

using namespace cs::services;
using namespace cs::model;
using json = nlohmann::json;

CredentialService::CredentialService(runtime::Deps deps) : deps_(std::move(deps)) {}

Credential CredentialService::parse(const json& data) const {
    validation::ValidationErrors verrors;
    if (!data.is_object()) {
        verrors.add(SCHEMA, "Not a dictionary");
        verrors.raiseIfAny();
    }

    for (const auto* key : {"name", "provider"}) {
        if (!data.contains(key)) verrors.add(std::string(SCHEMA) + "." + key, "attribute required");
        else if (!data[key].is_string()) verrors.add(std::string(SCHEMA) + "." + key, "Not a string");
    }
    if (data.contains("attributes") && !data["attributes"].is_null() && !data["attributes"].is_object())
        verrors.add(std::string(SCHEMA) + ".attributes", "Not a dictionary");

    verrors.raiseIfAny();
    return Credential(data);
}

void CredentialService::validate(Credential& credential) const {
    validation::ValidationErrors verrors;
    deps_.validator->validateCredential(verrors, SCHEMA, credential);
    verrors.raiseIfAny();
}

Credential CredentialService::create(const json& data) {
    auto credential = parse(data);
    validate(credential);

    json record = credential;
    record.erase("id");
    credential.id = deps_.store->insert(db::CREDENTIALS_TABLE, record);

    log::Registry::cloudsync()->info("[CredentialService] Created credentials {} ({}, {})", credential.id, credential.name, credential.provider);
    return credential;
}

Credential CredentialService::update(const uint32_t id, const json& data) {
    if (!data.is_object()) {
        validation::ValidationErrors verrors;
        verrors.add(SCHEMA, "Not a dictionary");
        verrors.raiseIfAny();
    }

    json merged = get(id);
    for (const auto& [k, v] : data.items()) merged[k] = v;
    merged["id"] = id;

    auto credential = parse(merged);
    validate(credential);

    json record = credential;
    record.erase("id");
    deps_.store->update(db::CREDENTIALS_TABLE, id, record);

    log::Registry::cloudsync()->info("[CredentialService] Updated credentials {}", id);
    return credential;
}

void CredentialService::remove(const uint32_t id) {
    deps_.store->remove(db::CREDENTIALS_TABLE, id);
    log::Registry::cloudsync()->info("[CredentialService] Deleted credentials {}", id);
}

std::vector<Credential> CredentialService::query() const {
    std::vector<Credential> out;
    for (const auto& r : deps_.store->query(db::CREDENTIALS_TABLE)) out.emplace_back(r);
    return out;
}

Credential CredentialService::get(const uint32_t id) const {
    return Credential(deps_.store->get(db::CREDENTIALS_TABLE, id));
}

std::optional<Credential> CredentialService::find(const uint32_t id) const {
    const auto records = deps_.store->query(db::CREDENTIALS_TABLE);
    const auto it = std::ranges::find_if(records, [id](const json& r) { return r.value("id", 0u) == id; });
    if (it == records.end()) return std::nullopt;
    return Credential(*it);
}
