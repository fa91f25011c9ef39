#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::db {

inline constexpr auto CREDENTIALS_TABLE = "system.cloudcredentials";
inline constexpr auto TASKS_TABLE = "tasks.cloudsync";

// Record persistence keyed by (table, id). Records are JSON objects; the
// store owns the "id" key.
class Store {
public:
    virtual ~Store() = default;

    virtual uint32_t insert(const std::string& table, const nlohmann::json& record) = 0;

    // Throws std::runtime_error when the record does not exist
    virtual void update(const std::string& table, uint32_t id, const nlohmann::json& record) = 0;

    virtual void remove(const std::string& table, uint32_t id) = 0;

    // Ordered by id
    [[nodiscard]] virtual std::vector<nlohmann::json> query(const std::string& table) const = 0;

    // Throws std::runtime_error("... not found") for an unknown id
    [[nodiscard]] virtual nlohmann::json get(const std::string& table, uint32_t id) const = 0;
};

}
