#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class HTTP final : public Provider {
public:
    HTTP();
};

}
