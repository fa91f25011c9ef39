#include "model/Schedule.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <nlohmann/json.hpp>

namespace cs::model {

namespace {

constexpr std::array<const char*, 12> MONTH_NAMES = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"
};
constexpr std::array<const char*, 7> DOW_NAMES = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

struct FieldRange {
    int min;
    int max;
    bool names_month;
    bool names_dow;
};

bool parseNumber(std::string tok, const FieldRange& r, int& out) {
    std::ranges::transform(tok, tok.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (r.names_month || r.names_dow) {
        if (r.names_month) {
            for (size_t i = 0; i < MONTH_NAMES.size(); ++i)
                if (tok == MONTH_NAMES[i]) { out = static_cast<int>(i) + 1; return true; }
        } else {
            for (size_t i = 0; i < DOW_NAMES.size(); ++i)
                if (tok == DOW_NAMES[i]) { out = static_cast<int>(i); return true; }
        }
    }

    if (tok.empty() || tok.size() > 4) return false;
    if (!std::ranges::all_of(tok, [](const unsigned char c) { return std::isdigit(c); })) return false;
    out = std::stoi(tok);
    return out >= r.min && out <= r.max;
}

bool validCronField(const std::string& field, const FieldRange& r) {
    if (field.empty()) return false;

    std::stringstream ss(field);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) return false;

        std::string base = item;
        if (const auto slash = item.find('/'); slash != std::string::npos) {
            base = item.substr(0, slash);
            const auto step = item.substr(slash + 1);
            if (step.empty() || !std::ranges::all_of(step, [](const unsigned char c) { return std::isdigit(c); }))
                return false;
            if (step.size() > 4 || std::stoi(step) == 0) return false;
        }

        if (base == "*") continue;

        int lo = 0, hi = 0;
        if (const auto dash = base.find('-'); dash != std::string::npos) {
            if (!parseNumber(base.substr(0, dash), r, lo) || !parseNumber(base.substr(dash + 1), r, hi)) return false;
            if (lo > hi) return false;
        } else if (!parseNumber(base, r, lo)) return false;
    }
    return true;
}

}

validation::ValidationErrors Schedule::validate() const {
    validation::ValidationErrors verrors;
    if (!validCronField(minute, {0, 59, false, false})) verrors.add("minute", "Invalid cron field: " + minute);
    if (!validCronField(hour, {0, 23, false, false})) verrors.add("hour", "Invalid cron field: " + hour);
    if (!validCronField(dom, {1, 31, false, false})) verrors.add("dom", "Invalid cron field: " + dom);
    if (!validCronField(month, {1, 12, true, false})) verrors.add("month", "Invalid cron field: " + month);
    if (!validCronField(dow, {0, 7, false, true})) verrors.add("dow", "Invalid cron field: " + dow);
    return verrors;
}

std::string Schedule::toCronLine() const {
    return minute + " " + hour + " " + dom + " " + month + " " + dow;
}

void Schedule::toDbFormat(nlohmann::json& record) const {
    record.erase("schedule");
    record["minute"] = minute;
    record["hour"] = hour;
    record["daymonth"] = dom;
    record["month"] = month;
    record["dayweek"] = dow;
}

Schedule Schedule::fromDbFormat(const nlohmann::json& record) {
    Schedule s;
    s.minute = record.value("minute", s.minute);
    s.hour = record.value("hour", s.hour);
    s.dom = record.value("daymonth", s.dom);
    s.month = record.value("month", s.month);
    s.dow = record.value("dayweek", s.dow);
    return s;
}

void to_json(nlohmann::json& j, const Schedule& s) {
    j = {
        {"minute", s.minute},
        {"hour", s.hour},
        {"dom", s.dom},
        {"month", s.month},
        {"dow", s.dow}
    };
}

void from_json(const nlohmann::json& j, Schedule& s) {
    s.minute = j.value("minute", "00");
    s.hour = j.value("hour", "*");
    s.dom = j.value("dom", "*");
    s.month = j.value("month", "*");
    s.dow = j.value("dow", "*");
}

}
