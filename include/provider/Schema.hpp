#pragma once

#include "validation/Errors.hpp"

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::provider {

struct Field {
    enum class Type { String, Bool, Int, Dict };

    std::string name;
    Type type{Type::String};
    bool required{false};
    nlohmann::json defaultValue{};          // null = no default
    std::vector<std::string> choices{};     // String only; empty = any
    bool secret{false};
    std::string title{};

    static Field str(std::string name, bool required = false);
    static Field boolean(std::string name, bool def);
    static Field integer(std::string name, bool required = false);
    static Field dict(std::string name);

    Field& withChoices(std::vector<std::string> values);
    Field& withDefault(nlohmann::json value);
    Field& withTitle(std::string value);
    Field& asSecret();

    [[nodiscard]] nlohmann::json toJsonSchema() const;
};

using Schema = std::vector<Field>;

// Cleans `attributes` in place (defaults, int coercion) and validates it
// against `schema`. Attribute names in returned errors are relative
// ("bucket", "folder"); the caller re-parents them.
validation::ValidationErrors validateAttributes(const Schema& schema,
                                                nlohmann::json& attributes,
                                                bool additionalAttrs = false);

nlohmann::json schemaToJson(const Schema& schema);

std::string to_string(Field::Type t);

}
