#pragma once

#include "db/Store.hpp"
#include "config/Config.hpp"

#include <memory>

namespace cs::db {

class Pool;

// All record tables share one "records" relation keyed by (tbl, id) with a
// jsonb payload.
class PgStore final : public Store {
public:
    explicit PgStore(const config::DatabaseConfig& cfg);
    ~PgStore() override;

    uint32_t insert(const std::string& table, const nlohmann::json& record) override;
    void update(const std::string& table, uint32_t id, const nlohmann::json& record) override;
    void remove(const std::string& table, uint32_t id) override;
    [[nodiscard]] std::vector<nlohmann::json> query(const std::string& table) const override;
    [[nodiscard]] nlohmann::json get(const std::string& table, uint32_t id) const override;

private:
    std::unique_ptr<Pool> pool_;
};

}
