#include "db/PgStore.hpp"
#include "db/Transactions.hpp"

#include <stdexcept>

using namespace cs::db;
using json = nlohmann::json;

namespace {

json rowToRecord(const pqxx::row& row) {
    auto record = json::parse(row["payload"].as<std::string>());
    record["id"] = row["id"].as<uint32_t>();
    return record;
}

std::string payloadOf(const json& record) {
    auto payload = record;
    payload.erase("id");
    return payload.dump();
}

}

PgStore::PgStore(const config::DatabaseConfig& cfg) : pool_(std::make_unique<Pool>(cfg)) {}

PgStore::~PgStore() = default;

uint32_t PgStore::insert(const std::string& table, const json& record) {
    return Transactions::exec(*pool_, "PgStore::insert", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"lock_records_table"}, pqxx::params{table});
        return txn.exec(pqxx::prepped{"insert_record"}, pqxx::params{table, payloadOf(record)}).one_field().as<uint32_t>();
    });
}

void PgStore::update(const std::string& table, const uint32_t id, const json& record) {
    Transactions::exec(*pool_, "PgStore::update", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"update_record"}, pqxx::params{table, id, payloadOf(record)});
        if (res.affected_rows() == 0) throw std::runtime_error(table + " " + std::to_string(id) + " not found");
    });
}

void PgStore::remove(const std::string& table, const uint32_t id) {
    Transactions::exec(*pool_, "PgStore::remove", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_record"}, pqxx::params{table, id});
    });
}

std::vector<json> PgStore::query(const std::string& table) const {
    return Transactions::exec(*pool_, "PgStore::query", [&](pqxx::work& txn) {
        std::vector<json> out;
        for (const auto& row : txn.exec(pqxx::prepped{"list_records"}, pqxx::params{table})) out.push_back(rowToRecord(row));
        return out;
    });
}

json PgStore::get(const std::string& table, const uint32_t id) const {
    return Transactions::exec(*pool_, "PgStore::get", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"get_record"}, pqxx::params{table, id});
        if (res.empty()) throw std::runtime_error(table + " " + std::to_string(id) + " not found");
        return rowToRecord(res[0]);
    });
}
