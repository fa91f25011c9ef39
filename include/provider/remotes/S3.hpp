#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class S3 final : public Provider {
public:
    S3();

    [[nodiscard]] nlohmann::json getCredentialsExtra(const model::Credential& credential) const override;
    [[nodiscard]] nlohmann::json getTaskExtra(const model::CloudSyncTask& task) const override;

    // AWS bucket naming rules
    void preSaveTask(const model::CloudSyncTask& task,
                     const model::Credential& credential,
                     validation::ValidationErrors& verrors) const override;
};

}
