#pragma once

#include "validation/Errors.hpp"

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace cs::model {

// Public cron representation. Persisted records keep the fields flat as
// minute/hour/daymonth/month/dayweek.
struct Schedule {
    std::string minute = "00";
    std::string hour = "*";
    std::string dom = "*";
    std::string month = "*";
    std::string dow = "*";

    [[nodiscard]] validation::ValidationErrors validate() const;

    // "m h dom mon dow"
    [[nodiscard]] std::string toCronLine() const;

    void toDbFormat(nlohmann::json& record) const;
    static Schedule fromDbFormat(const nlohmann::json& record);

    bool operator==(const Schedule&) const = default;
};

void to_json(nlohmann::json& j, const Schedule& s);
void from_json(const nlohmann::json& j, Schedule& s);

}
