#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace cs::model {

struct Credential {
    uint32_t id{};
    std::string name;
    std::string provider;
    nlohmann::json attributes = nlohmann::json::object();

    Credential() = default;
    explicit Credential(const nlohmann::json& record);
};

void to_json(nlohmann::json& j, const Credential& c);
void from_json(const nlohmann::json& j, Credential& c);

}
