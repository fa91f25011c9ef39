#include "provider/Registry.hpp"
#include "provider/remotes/AzureBlob.hpp"
#include "provider/remotes/B2.hpp"
#include "provider/remotes/Dropbox.hpp"
#include "provider/remotes/FTP.hpp"
#include "provider/remotes/GoogleCloudStorage.hpp"
#include "provider/remotes/GoogleDrive.hpp"
#include "provider/remotes/HTTP.hpp"
#include "provider/remotes/Mega.hpp"
#include "provider/remotes/OneDrive.hpp"
#include "provider/remotes/S3.hpp"
#include "provider/remotes/SFTP.hpp"
#include "provider/remotes/WebDAV.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace cs::provider;

Registry::Registry(std::vector<std::unique_ptr<Provider>> providers)
    : providers_(std::move(providers)) {
    for (const auto& p : providers_) {
        if (!p) throw std::invalid_argument("Null provider in registration list");
        if (!byName_.emplace(p->name(), p.get()).second)
            throw std::invalid_argument("Duplicate provider name: " + p->name());
    }
}

Registry Registry::builtin() {
    std::vector<std::unique_ptr<Provider>> list;
    list.push_back(std::make_unique<remotes::AzureBlob>());
    list.push_back(std::make_unique<remotes::B2>());
    list.push_back(std::make_unique<remotes::Dropbox>());
    list.push_back(std::make_unique<remotes::FTP>());
    list.push_back(std::make_unique<remotes::GoogleCloudStorage>());
    list.push_back(std::make_unique<remotes::GoogleDrive>());
    list.push_back(std::make_unique<remotes::HTTP>());
    list.push_back(std::make_unique<remotes::Mega>());
    list.push_back(std::make_unique<remotes::OneDrive>());
    list.push_back(std::make_unique<remotes::S3>());
    list.push_back(std::make_unique<remotes::SFTP>());
    list.push_back(std::make_unique<remotes::WebDAV>());

    Registry registry(std::move(list));
    if (log::Registry::isInitialized())
        log::Registry::provider()->debug("[provider::Registry] Registered {} providers", registry.size());
    return registry;
}

const Provider* Registry::find(const std::string& name) const {
    const auto it = byName_.find(name);
    return it == byName_.end() ? nullptr : it->second;
}

const Provider& Registry::get(const std::string& name) const {
    const auto* p = find(name);
    if (!p) throw std::invalid_argument("Invalid provider: " + name);
    return *p;
}

std::vector<const Provider*> Registry::list() const {
    std::vector<const Provider*> out;
    out.reserve(providers_.size());
    for (const auto& p : providers_) out.push_back(p.get());

    const auto lower = [](std::string s) {
        std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
        return s;
    };
    std::ranges::sort(out, [&](const Provider* a, const Provider* b) { return lower(a->title()) < lower(b->title()); });
    return out;
}
