#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class OneDrive final : public Provider {
public:
    OneDrive();

    [[nodiscard]] nlohmann::json getCredentialsExtra(const model::Credential& credential) const override;
};

}
