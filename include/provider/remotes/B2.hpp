#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class B2 final : public Provider {
public:
    B2();
};

}
