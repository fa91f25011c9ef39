#pragma once

#include "crypto/SecretStore.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>

namespace cs::crypto {

class KeyFileSecretStore final : public SecretStore {
public:
    explicit KeyFileSecretStore(std::filesystem::path keyFile);

    [[nodiscard]] std::string encrypt(const std::string& plaintext) const override;

    // Undecryptable values (e.g. key rotated underneath) decrypt to an empty string
    [[nodiscard]] std::string decrypt(const std::string& ciphertext) const override;

private:
    std::filesystem::path keyFile_;
    mutable std::mutex mutex_;
    mutable std::vector<uint8_t> key_;

    const std::vector<uint8_t>& masterKey() const;
    void createKeyFile() const;
};

}
