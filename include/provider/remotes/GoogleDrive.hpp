#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class GoogleDrive final : public Provider {
public:
    GoogleDrive();

    [[nodiscard]] nlohmann::json getCredentialsExtra(const model::Credential& credential) const override;
};

}
