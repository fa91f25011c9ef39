#pragma once

#include <string>

namespace cs::crypto {

// At-rest protection for task secrets (encryption password and salt).
struct SecretStore {
    virtual ~SecretStore() = default;

    [[nodiscard]] virtual std::string encrypt(const std::string& plaintext) const = 0;
    [[nodiscard]] virtual std::string decrypt(const std::string& ciphertext) const = 0;
};

}
