#pragma once

#include "model/Credential.hpp"
#include "runtime/Deps.hpp"

#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::services {

// cloudsync.credentials
class CredentialService {
public:
    static constexpr auto SCHEMA = "cloud_sync_credentials";

    explicit CredentialService(runtime::Deps deps);

    model::Credential create(const nlohmann::json& data);

    // Keys absent from `data` keep their stored value
    model::Credential update(uint32_t id, const nlohmann::json& data);

    void remove(uint32_t id);

    [[nodiscard]] std::vector<model::Credential> query() const;
    [[nodiscard]] model::Credential get(uint32_t id) const;
    [[nodiscard]] std::optional<model::Credential> find(uint32_t id) const;

private:
    runtime::Deps deps_;

    model::Credential parse(const nlohmann::json& data) const;
    void validate(model::Credential& credential) const;
};

}
