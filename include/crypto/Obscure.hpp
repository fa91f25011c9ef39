#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace cs::crypto {

// rclone's "obscure" transform. The key is public; this keeps secrets out of
// plain sight in generated config files, it is not encryption.
class Obscure {
public:
    static constexpr size_t IV_SIZE = 16;

    // base64url(iv || AES-256-CTR(plaintext)) without padding, fresh IV per call
    [[nodiscard]] static std::string obscure(const std::string& plaintext);

    // Inverse of obscure(); throws std::invalid_argument on malformed input
    [[nodiscard]] static std::string reveal(const std::string& token);

private:
    static const std::array<uint8_t, 32> KEY;

    static std::string crypt(const uint8_t* iv, const uint8_t* in, size_t len);
};

}
