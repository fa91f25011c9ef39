#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class SFTP final : public Provider {
public:
    SFTP();

    void preSaveTask(const model::CloudSyncTask& task,
                     const model::Credential& credential,
                     validation::ValidationErrors& verrors) const override;
};

}
