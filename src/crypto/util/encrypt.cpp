#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

#include <sodium.h>

#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace cs::crypto::util {

namespace {

void requireAesGcm() {
    if (sodium_init() < 0) throw std::runtime_error("Failed to initialize libsodium");
    if (crypto_aead_aes256gcm_is_available() == 0)
        throw std::runtime_error("AES256-GCM not supported on this CPU");
}

void requireKey(const std::vector<uint8_t>& key) {
    if (key.size() == AES_KEY_SIZE) return;
    log::Registry::crypto()->error("[encrypt] Invalid AES-256 key size: {} bytes", key.size());
    throw std::invalid_argument("Invalid AES-256 key size");
}

int variantOf(const Base64 alphabet) {
    return alphabet == Base64::Standard ? sodium_base64_VARIANT_ORIGINAL : sodium_base64_VARIANT_URLSAFE_NO_PADDING;
}

}

std::vector<uint8_t> seal(const std::string& plaintext, const std::vector<uint8_t>& key) {
    requireKey(key);
    requireAesGcm();

    std::vector<uint8_t> out(AES_IV_SIZE + plaintext.size() + AES_TAG_SIZE);
    randombytes_buf(out.data(), AES_IV_SIZE);

    unsigned long long len = 0;
    crypto_aead_aes256gcm_encrypt(out.data() + AES_IV_SIZE, &len,
                                  reinterpret_cast<const unsigned char*>(plaintext.data()), plaintext.size(),
                                  nullptr, 0, nullptr, out.data(), key.data());

    out.resize(AES_IV_SIZE + len);
    return out;
}

std::string unseal(const std::vector<uint8_t>& sealed, const std::vector<uint8_t>& key) {
    requireKey(key);
    if (sealed.size() < AES_IV_SIZE + AES_TAG_SIZE) throw std::runtime_error("Sealed value too short");
    requireAesGcm();

    const auto* nonce = sealed.data();
    const auto* ct = sealed.data() + AES_IV_SIZE;
    const auto ctLen = sealed.size() - AES_IV_SIZE;

    std::string out(ctLen - AES_TAG_SIZE, '\0');
    unsigned long long len = 0;
    if (crypto_aead_aes256gcm_decrypt(reinterpret_cast<unsigned char*>(out.data()), &len, nullptr,
                                      ct, ctLen, nullptr, 0, nonce, key.data()) != 0)
        throw std::runtime_error("Decryption failed: authentication error");

    out.resize(len);
    return out;
}

std::vector<uint8_t> readKey(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open key file: " + path.string());

    std::vector<uint8_t> key{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (key.size() != AES_KEY_SIZE)
        throw std::runtime_error("Invalid key file size (" + std::to_string(key.size()) + " bytes): " + path.string());
    return key;
}

std::string toBase64(const std::vector<uint8_t>& data, const Base64 alphabet) {
    if (sodium_init() < 0) throw std::runtime_error("Failed to initialize libsodium");

    const auto variant = variantOf(alphabet);
    std::string out(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
    out.resize(std::strlen(out.c_str()));
    return out;
}

std::vector<uint8_t> fromBase64(const std::string& text, const Base64 alphabet) {
    if (sodium_init() < 0) throw std::runtime_error("Failed to initialize libsodium");

    std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
    size_t len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), text.c_str(), text.size(), nullptr, &len, &end, variantOf(alphabet)) != 0
        || end != text.c_str() + text.size())
        throw std::invalid_argument("Invalid base64 input");

    out.resize(len);
    return out;
}

}
