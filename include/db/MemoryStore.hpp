#pragma once

#include "db/Store.hpp"

#include <map>
#include <mutex>

namespace cs::db {

class MemoryStore final : public Store {
public:
    uint32_t insert(const std::string& table, const nlohmann::json& record) override;
    void update(const std::string& table, uint32_t id, const nlohmann::json& record) override;
    void remove(const std::string& table, uint32_t id) override;
    [[nodiscard]] std::vector<nlohmann::json> query(const std::string& table) const override;
    [[nodiscard]] nlohmann::json get(const std::string& table, uint32_t id) const override;

private:
    struct Table {
        uint32_t nextId = 1;
        std::map<uint32_t, nlohmann::json> rows;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Table> tables_;
};

}
