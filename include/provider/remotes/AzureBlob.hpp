#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class AzureBlob final : public Provider {
public:
    AzureBlob();

    void preSaveTask(const model::CloudSyncTask& task,
                     const model::Credential& credential,
                     validation::ValidationErrors& verrors) const override;
};

}
