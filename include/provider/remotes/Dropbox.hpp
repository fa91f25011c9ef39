#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class Dropbox final : public Provider {
public:
    Dropbox();

    [[nodiscard]] nlohmann::json getTaskExtra(const model::CloudSyncTask& task) const override;
};

}
