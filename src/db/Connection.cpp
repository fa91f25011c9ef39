#include "db/Connection.hpp"
#include "log/Registry.hpp"

#include <cctype>
#include <pqxx/pqxx>
#include <fmt/core.h>

namespace cs::db {

namespace {

std::string escapeUriComponent(const std::string& in) {
    std::string out;
    for (const unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out += static_cast<char>(c);
        else out += fmt::format("%{:02X}", c);
    }
    return out;
}

}

std::string connectionString(const config::DatabaseConfig& cfg) {
    std::string auth = escapeUriComponent(cfg.user);
    if (!cfg.password.empty()) auth += ":" + escapeUriComponent(cfg.password);
    return fmt::format("postgresql://{}@{}:{}/{}", auth, cfg.host, cfg.port, cfg.name);
}

Connection::Connection(const config::DatabaseConfig& cfg)
    : conn_(std::make_unique<pqxx::connection>(connectionString(cfg))) {
    log::Registry::db()->debug("[Connection] Connected to {}:{}/{}", cfg.host, cfg.port, cfg.name);
    ensureSchema();
    initPrepared();
}

Connection::~Connection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& Connection::get() const { return *conn_; }

void Connection::ensureSchema() const {
    pqxx::nontransaction txn(*conn_);
    txn.exec(SCHEMA);
}

void Connection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    conn_->prepare("lock_records_table", "SELECT pg_advisory_xact_lock(hashtext($1))");

    conn_->prepare("insert_record",
                   "INSERT INTO records (tbl, id, payload) "
                   "VALUES ($1, (SELECT COALESCE(MAX(id), 0) + 1 FROM records WHERE tbl = $1), $2::jsonb) "
                   "RETURNING id");

    conn_->prepare("update_record", "UPDATE records SET payload = $3::jsonb WHERE tbl = $1 AND id = $2");

    conn_->prepare("delete_record", "DELETE FROM records WHERE tbl = $1 AND id = $2");

    conn_->prepare("list_records", "SELECT id, payload FROM records WHERE tbl = $1 ORDER BY id");

    conn_->prepare("get_record", "SELECT id, payload FROM records WHERE tbl = $1 AND id = $2");
}

}
