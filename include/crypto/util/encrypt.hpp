#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cs::crypto::util {

constexpr size_t AES_KEY_SIZE = 32;
constexpr size_t AES_IV_SIZE  = 12;
constexpr size_t AES_TAG_SIZE = 16;

// AES-256-GCM under a fresh random nonce. Output is nonce || ciphertext || tag.
std::vector<uint8_t> seal(const std::string& plaintext, const std::vector<uint8_t>& key);

// Inverse of seal; throws std::runtime_error on a short or forged blob
std::string unseal(const std::vector<uint8_t>& sealed, const std::vector<uint8_t>& key);

// Reads a raw AES_KEY_SIZE key, rejecting files of any other size
std::vector<uint8_t> readKey(const std::filesystem::path& path);

enum class Base64 { Standard, UrlNoPadding };

std::string toBase64(const std::vector<uint8_t>& data, Base64 alphabet = Base64::Standard);

// Throws std::invalid_argument on malformed input
std::vector<uint8_t> fromBase64(const std::string& text, Base64 alphabet = Base64::Standard);

}
