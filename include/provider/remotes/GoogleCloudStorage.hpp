#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class GoogleCloudStorage final : public Provider {
public:
    GoogleCloudStorage();
};

}
