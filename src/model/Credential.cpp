#include "model/Credential.hpp"

namespace cs::model {

Credential::Credential(const nlohmann::json& record) { from_json(record, *this); }

void to_json(nlohmann::json& j, const Credential& c) {
    j = {
        {"id", c.id},
        {"name", c.name},
        {"provider", c.provider},
        {"attributes", c.attributes}
    };
}

void from_json(const nlohmann::json& j, Credential& c) {
    c.id = j.value("id", 0u);
    c.name = j.value("name", "");
    c.provider = j.value("provider", "");
    c.attributes = j.contains("attributes") && !j["attributes"].is_null() ? j["attributes"] : nlohmann::json::object();
}

}
