#include "provider/Schema.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace cs::provider {

Field Field::str(std::string name, const bool required) {
    Field f;
    f.name = std::move(name);
    f.type = Type::String;
    f.required = required;
    return f;
}

Field Field::boolean(std::string name, const bool def) {
    Field f;
    f.name = std::move(name);
    f.type = Type::Bool;
    f.defaultValue = def;
    return f;
}

Field Field::integer(std::string name, const bool required) {
    Field f;
    f.name = std::move(name);
    f.type = Type::Int;
    f.required = required;
    return f;
}

Field Field::dict(std::string name) {
    Field f;
    f.name = std::move(name);
    f.type = Type::Dict;
    return f;
}

Field& Field::withChoices(std::vector<std::string> values) {
    choices = std::move(values);
    return *this;
}

Field& Field::withDefault(nlohmann::json value) {
    defaultValue = std::move(value);
    return *this;
}

Field& Field::withTitle(std::string value) {
    title = std::move(value);
    return *this;
}

Field& Field::asSecret() {
    secret = true;
    return *this;
}

std::string to_string(const Field::Type t) {
    switch (t) {
        case Field::Type::String: return "string";
        case Field::Type::Bool: return "boolean";
        case Field::Type::Int: return "integer";
        case Field::Type::Dict: return "object";
    }
    return "unknown";
}

nlohmann::json Field::toJsonSchema() const {
    nlohmann::json j = {
        {"type", to_string(type)},
        {"title", title.empty() ? name : title},
        {"_required_", required}
    };
    if (!choices.empty()) j["enum"] = choices;
    if (!defaultValue.is_null()) j["default"] = defaultValue;
    if (secret) j["private"] = true;
    return j;
}

static bool isAllDigits(const std::string& s) {
    const auto start = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1u : 0u;
    if (s.size() <= start) return false;
    return std::all_of(s.begin() + start, s.end(), [](const unsigned char c) { return std::isdigit(c); });
}

// Returns an error message, or an empty string when the value is acceptable
static std::string cleanValue(const Field& field, nlohmann::json& value) {
    if (value.is_null()) {
        if (field.required) return "null not allowed";
        return {};
    }

    switch (field.type) {
    case Field::Type::String:
        if (!value.is_string()) return "Not a string";
        if (!field.choices.empty() &&
            std::ranges::find(field.choices, value.get<std::string>()) == field.choices.end())
            return "Invalid choice: " + value.get<std::string>();
        return {};
    case Field::Type::Bool:
        if (!value.is_boolean()) return "Not a boolean";
        return {};
    case Field::Type::Int:
        if (value.is_number_integer()) return {};
        if (value.is_string() && isAllDigits(value.get<std::string>())) {
            try {
                value = std::stoll(value.get<std::string>());
                return {};
            } catch (const std::out_of_range&) {
                return "Not an integer";
            }
        }
        return "Not an integer";
    case Field::Type::Dict:
        if (!value.is_object()) return "Not a dictionary";
        return {};
    }
    return {};
}

validation::ValidationErrors validateAttributes(const Schema& schema,
                                                nlohmann::json& attributes,
                                                const bool additionalAttrs) {
    validation::ValidationErrors verrors;

    if (attributes.is_null()) attributes = nlohmann::json::object();
    if (!attributes.is_object()) {
        verrors.add("", "Not a dictionary");
        return verrors;
    }

    for (const auto& field : schema) {
        if (!attributes.contains(field.name)) {
            if (field.required) verrors.add(field.name, "attribute required");
            else if (!field.defaultValue.is_null()) attributes[field.name] = field.defaultValue;
            continue;
        }

        if (const auto err = cleanValue(field, attributes[field.name]); !err.empty())
            verrors.add(field.name, err);
    }

    if (!additionalAttrs) {
        for (const auto& [key, _] : attributes.items()) {
            const auto known = std::ranges::any_of(schema, [&](const Field& f) { return f.name == key; });
            if (!known) verrors.add(key, "Field was not expected");
        }
    }

    return verrors;
}

nlohmann::json schemaToJson(const Schema& schema) {
    auto out = nlohmann::json::array();
    for (const auto& field : schema)
        out.push_back({{"property", field.name}, {"schema", field.toJsonSchema()}});
    return out;
}

}
