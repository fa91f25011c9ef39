#pragma once

#include "cli/types.hpp"

#include <map>
#include <string>

namespace cs::cli {

class Router {
public:
    void registerCommand(const std::string& name, const std::string& usage,
                         const std::string& description, CommandHandler handler);

    // Validation and execution errors become a non-zero result; anything
    // else propagates
    CommandResult execute(CommandCall call) const;

    [[nodiscard]] std::string usage() const;

private:
    std::map<std::string, CommandInfo> commands_;
};

CommandResult ok(const nlohmann::json& data);
CommandResult ok(std::string text);
CommandResult invalid(const std::string& message);

}
