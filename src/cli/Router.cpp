#include "cli/Router.hpp"
#include "log/Registry.hpp"
#include "rclone/Executor.hpp"
#include "validation/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <fmt/core.h>

using namespace cs::cli;

namespace {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

}

CommandResult cs::cli::ok(const nlohmann::json& data) {
    CommandResult r;
    r.data = data;
    r.has_data = true;
    r.stdout_text = data.dump(2) + "\n";
    return r;
}

CommandResult cs::cli::ok(std::string text) {
    CommandResult r;
    r.stdout_text = std::move(text);
    return r;
}

CommandResult cs::cli::invalid(const std::string& message) {
    CommandResult r;
    r.exit_code = 2;
    r.stderr_text = message + "\n";
    return r;
}

void Router::registerCommand(const std::string& name, const std::string& usage,
                             const std::string& description, CommandHandler handler) {
    const auto key = normalize(name);
    if (commands_.contains(key))
        log::Registry::cloudsync()->warn("[Router] Command '{}' registered twice, replacing", key);
    commands_[key] = CommandInfo{usage, description, std::move(handler)};
}

std::string Router::usage() const {
    std::string out = "usage: cloudsyncctl <command> [args...]\n\ncommands:\n";
    size_t width = 0;
    for (const auto& info : commands_ | std::views::values) width = std::max(width, info.usage.size());
    for (const auto& info : commands_ | std::views::values)
        out += fmt::format("  {:<{}}  {}\n", info.usage, width, info.description);
    return out;
}

CommandResult Router::execute(CommandCall call) const {
    if (call.name.empty()) return invalid(usage());

    call.name = normalize(call.name);
    const auto it = commands_.find(call.name);
    if (it == commands_.end()) return invalid(fmt::format("Unknown command: {}\n\n{}", call.name, usage()));

    log::Registry::cloudsync()->debug("[Router] Executing command: '{}'", call.name);

    try {
        return it->second.handler(call);
    } catch (const validation::ValidationErrors& e) {
        CommandResult r;
        r.exit_code = 2;
        for (const auto& err : e.errors()) r.stderr_text += fmt::format("{}: {}\n", err.attribute, err.message);
        r.data = e;
        r.has_data = true;
        return r;
    } catch (const rclone::ExecutionError& e) {
        CommandResult r;
        r.exit_code = 1;
        r.stderr_text = fmt::format("rclone: {}\n", e.what());
        return r;
    } catch (const nlohmann::json::exception& e) {
        return invalid(fmt::format("Invalid JSON argument: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        return invalid(e.what());
    } catch (const std::runtime_error& e) {
        CommandResult r;
        r.exit_code = 1;
        r.stderr_text = fmt::format("{}\n", e.what());
        return r;
    }
}
