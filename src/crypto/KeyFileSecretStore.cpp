#include "crypto/KeyFileSecretStore.hpp"
#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

#include <fcntl.h>
#include <sodium.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

using namespace cs::crypto;
using namespace cs::crypto::util;

KeyFileSecretStore::KeyFileSecretStore(std::filesystem::path keyFile)
    : keyFile_(std::move(keyFile)) {
    if (sodium_init() < 0) throw std::runtime_error("Failed to initialize libsodium");
}

std::string KeyFileSecretStore::encrypt(const std::string& plaintext) const {
    if (plaintext.empty()) return {};

    std::scoped_lock lock(mutex_);
    return toBase64(seal(plaintext, masterKey()));
}

std::string KeyFileSecretStore::decrypt(const std::string& ciphertext) const {
    if (ciphertext.empty()) return {};

    std::scoped_lock lock(mutex_);
    try {
        return unseal(fromBase64(ciphertext), masterKey());
    } catch (const std::invalid_argument& e) {
        log::Registry::crypto()->error("[KeyFileSecretStore] Malformed secret: {}", e.what());
    } catch (const std::runtime_error& e) {
        log::Registry::crypto()->error("[KeyFileSecretStore] Unable to decrypt secret: {}", e.what());
    }
    return {};
}

const std::vector<uint8_t>& KeyFileSecretStore::masterKey() const {
    if (!key_.empty()) return key_;

    if (!std::filesystem::exists(keyFile_)) createKeyFile();

    key_ = readKey(keyFile_);
    return key_;
}

void KeyFileSecretStore::createKeyFile() const {
    if (keyFile_.has_parent_path()) std::filesystem::create_directories(keyFile_.parent_path());

    std::vector<uint8_t> key(AES_KEY_SIZE);
    randombytes_buf(key.data(), key.size());

    // Written under a private name, then linked into place so a concurrent
    // reader never sees a short file.
    std::string tmpl = keyFile_.string() + ".XXXXXX";
    const int fd = ::mkostemp(tmpl.data(), O_CLOEXEC);
    if (fd < 0) throw std::runtime_error("Failed to create secret key file " + keyFile_.string() + ": " + std::strerror(errno));

    const bool written = ::fchmod(fd, S_IRUSR | S_IWUSR) == 0 &&
                         ::write(fd, key.data(), key.size()) == static_cast<ssize_t>(AES_KEY_SIZE) &&
                         ::fsync(fd) == 0;
    ::close(fd);
    sodium_memzero(key.data(), key.size());

    if (!written) {
        ::unlink(tmpl.c_str());
        throw std::runtime_error("Failed to write secret key file " + keyFile_.string());
    }

    const int rc = ::link(tmpl.c_str(), keyFile_.c_str());
    const int err = errno;
    ::unlink(tmpl.c_str());

    if (rc != 0) {
        // Another process generated the key first; use theirs
        if (err == EEXIST) return;
        throw std::runtime_error("Failed to install secret key file " + keyFile_.string() + ": " + std::strerror(err));
    }

    log::Registry::crypto()->info("[KeyFileSecretStore] Generated new secret key at {}", keyFile_.string());
}
