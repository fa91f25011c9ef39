#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class WebDAV final : public Provider {
public:
    WebDAV();

    [[nodiscard]] nlohmann::json getCredentialsExtra(const model::Credential& credential) const override;
};

}
