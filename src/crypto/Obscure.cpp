#include "crypto/Obscure.hpp"
#include "crypto/util/encrypt.hpp"

#include <memory>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>

using namespace cs::crypto;

const std::array<uint8_t, 32> Obscure::KEY = {
    0x9c, 0x93, 0x5b, 0x48, 0x73, 0x0a, 0x55, 0x4d,
    0x6b, 0xfd, 0x7c, 0x63, 0xc8, 0x86, 0xa9, 0x2b,
    0xd3, 0x90, 0x19, 0x8e, 0xb8, 0x12, 0x8a, 0xfb,
    0xf4, 0xde, 0x16, 0x2b, 0x8b, 0x95, 0xf6, 0x38
};

std::string Obscure::obscure(const std::string& plaintext) {
    std::vector<uint8_t> out(IV_SIZE);
    if (RAND_bytes(out.data(), static_cast<int>(IV_SIZE)) != 1)
        throw std::runtime_error("Failed to generate IV for password obscuring");

    const auto ct = crypt(out.data(), reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size());
    out.insert(out.end(), ct.begin(), ct.end());
    return util::toBase64(out, util::Base64::UrlNoPadding);
}

std::string Obscure::reveal(const std::string& token) {
    const auto raw = util::fromBase64(token, util::Base64::UrlNoPadding);
    if (raw.size() < IV_SIZE)
        throw std::invalid_argument("input too short when revealing password - is it obscured?");
    return crypt(raw.data(), raw.data() + IV_SIZE, raw.size() - IV_SIZE);
}

std::string Obscure::crypt(const uint8_t* iv, const uint8_t* in, const size_t len) {
    // CTR mode: the same operation encrypts and decrypts
    const std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) throw std::runtime_error("Failed to allocate cipher context");

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_ctr(), nullptr, KEY.data(), iv) != 1)
        throw std::runtime_error("Failed to initialize AES-256-CTR");

    std::string out(len, '\0');
    int outLen = 0;
    if (len > 0 && EVP_EncryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(out.data()), &outLen,
                                     in, static_cast<int>(len)) != 1)
        throw std::runtime_error("AES-256-CTR update failed");

    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(out.data()) + outLen, &finalLen) != 1)
        throw std::runtime_error("AES-256-CTR finalization failed");

    out.resize(static_cast<size_t>(outLen + finalLen));
    return out;
}
