#include "validation/Errors.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace cs::validation {

void ValidationErrors::add(const std::string& attribute, const std::string& message, const int errnum) {
    errors_.push_back({attribute, message, errnum});
    rebuildMessage();
}

void ValidationErrors::addChild(const std::string& prefix, const ValidationErrors& child) {
    for (const auto& e : child.errors_) {
        const auto attr = e.attribute.empty() ? prefix : prefix + "." + e.attribute;
        errors_.push_back({attr, e.message, e.errnum});
    }
    rebuildMessage();
}

void ValidationErrors::extend(const ValidationErrors& other) {
    errors_.insert(errors_.end(), other.errors_.begin(), other.errors_.end());
    rebuildMessage();
}

bool ValidationErrors::has(const std::string& attribute) const {
    return find(attribute) != nullptr;
}

const Error* ValidationErrors::find(const std::string& attribute) const {
    const auto it = std::ranges::find_if(errors_, [&](const Error& e) { return e.attribute == attribute; });
    return it == errors_.end() ? nullptr : &*it;
}

void ValidationErrors::raiseIfAny() const {
    if (!errors_.empty()) throw *this;
}

const char* ValidationErrors::what() const noexcept { return message_.c_str(); }

void ValidationErrors::rebuildMessage() {
    message_.clear();
    for (const auto& e : errors_) {
        if (!message_.empty()) message_ += '\n';
        message_ += "[" + std::string(e.errnum == EINVAL ? "EINVAL" : std::to_string(e.errnum)) + "] "
                    + e.attribute + ": " + e.message;
    }
}

void to_json(nlohmann::json& j, const Error& e) {
    j = {
        {"attribute", e.attribute},
        {"message", e.message},
        {"errno", e.errnum}
    };
}

void to_json(nlohmann::json& j, const ValidationErrors& e) {
    j = nlohmann::json::array();
    for (const auto& err : e.errors()) j.push_back(err);
}

}
