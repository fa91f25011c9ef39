#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::cli {

struct CommandCall {
    std::string name;
    std::vector<std::string> positionals;

    // if set, long-running commands report progress lines here
    std::function<void(const std::string&)> progress;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;
    std::string stderr_text;
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string usage;
    std::string description;
    CommandHandler handler;
};

}
