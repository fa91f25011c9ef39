#pragma once

#include "db/Pool.hpp"
#include "log/Registry.hpp"

#include <pqxx/pqxx>
#include <string>
#include <type_traits>
#include <utility>

namespace cs::db {

class Transactions {
  public:
    // Runs func inside one committed pqxx::work; rolls back and rethrows on error
    template <typename Func>
    static auto exec(Pool& pool, const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = pool.acquire();

        try {
            pqxx::work txn(conn->get());
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                pool.release(std::move(conn));
            } else {
                auto result = func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                pool.release(std::move(conn));
                return result;
            }
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions::exec] {} in '{}', rolling back", e.what(), ctx);
            pool.release(std::move(conn));
            throw;
        }
    }
};

}
