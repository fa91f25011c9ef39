#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class Mega final : public Provider {
public:
    Mega();
};

}
