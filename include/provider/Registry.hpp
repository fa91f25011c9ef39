#pragma once

#include "provider/Provider.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cs::provider {

// Immutable after construction; safe to share across threads without locking.
class Registry {
public:
    explicit Registry(std::vector<std::unique_ptr<Provider>> providers);

    Registry(Registry&&) noexcept = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Every remote compiled into this build
    static Registry builtin();

    [[nodiscard]] const Provider* find(const std::string& name) const;
    [[nodiscard]] const Provider& get(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Sorted case-insensitively by title
    [[nodiscard]] std::vector<const Provider*> list() const;

    [[nodiscard]] size_t size() const { return providers_.size(); }

private:
    std::vector<std::unique_ptr<Provider>> providers_;
    std::unordered_map<std::string, const Provider*> byName_;
};

}
