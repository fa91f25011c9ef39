#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace cs::db {

class Connection {
public:
    explicit Connection(const config::DatabaseConfig& cfg);
    ~Connection();

    [[nodiscard]] pqxx::connection& get() const;

    static constexpr auto SCHEMA =
        "CREATE TABLE IF NOT EXISTS records ("
        "tbl TEXT NOT NULL, "
        "id INTEGER NOT NULL, "
        "payload JSONB NOT NULL, "
        "PRIMARY KEY (tbl, id))";

private:
    std::unique_ptr<pqxx::connection> conn_;

    void ensureSchema() const;
    void initPrepared() const;
};

// postgresql:// URI; the password is percent-encoded
std::string connectionString(const config::DatabaseConfig& cfg);

}
