#include "db/MemoryStore.hpp"

#include <ranges>
#include <stdexcept>

using namespace cs::db;
using json = nlohmann::json;

uint32_t MemoryStore::insert(const std::string& table, const json& record) {
    std::scoped_lock lock(mutex_);
    auto& t = tables_[table];
    const auto id = t.nextId++;
    auto row = record;
    row["id"] = id;
    t.rows.emplace(id, std::move(row));
    return id;
}

void MemoryStore::update(const std::string& table, const uint32_t id, const json& record) {
    std::scoped_lock lock(mutex_);
    const auto t = tables_.find(table);
    if (t == tables_.end() || !t->second.rows.contains(id))
        throw std::runtime_error(table + " " + std::to_string(id) + " not found");

    auto row = record;
    row["id"] = id;
    t->second.rows[id] = std::move(row);
}

void MemoryStore::remove(const std::string& table, const uint32_t id) {
    std::scoped_lock lock(mutex_);
    if (const auto t = tables_.find(table); t != tables_.end()) t->second.rows.erase(id);
}

std::vector<json> MemoryStore::query(const std::string& table) const {
    std::scoped_lock lock(mutex_);
    std::vector<json> out;
    if (const auto t = tables_.find(table); t != tables_.end())
        for (const auto& row : t->second.rows | std::views::values) out.push_back(row);
    return out;
}

json MemoryStore::get(const std::string& table, const uint32_t id) const {
    std::scoped_lock lock(mutex_);
    if (const auto t = tables_.find(table); t != tables_.end())
        if (const auto r = t->second.rows.find(id); r != t->second.rows.end()) return r->second;
    throw std::runtime_error(table + " " + std::to_string(id) + " not found");
}
