#pragma once

#include "provider/Provider.hpp"

namespace cs::provider::remotes {

class FTP final : public Provider {
public:
    FTP();
};

}
