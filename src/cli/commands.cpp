#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "job/Job.hpp"
#include "services/CloudSyncService.hpp"
#include "services/CredentialService.hpp"

#include <fmt/core.h>

using namespace cs::cli;
using namespace cs::services;
using json = nlohmann::json;

namespace {

uint32_t parseId(const std::string& s) {
    if (s.empty() || s.size() > 9 || s.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument("Invalid id: " + s);
    return static_cast<uint32_t>(std::stoul(s));
}

const std::string& arg(const CommandCall& call, const size_t i, const char* what) {
    if (call.positionals.size() <= i) throw std::invalid_argument(fmt::format("Missing argument: {}", what));
    return call.positionals[i];
}

json toJsonArray(const auto& items) {
    json out = json::array();
    for (const auto& i : items) out.push_back(i);
    return out;
}

CommandResult handleCredentials(const CommandCall& call, CredentialService& credentials) {
    const auto& action = arg(call, 0, "action");

    if (action == "list") return ok(toJsonArray(credentials.query()));
    if (action == "get") return ok(json(credentials.get(parseId(arg(call, 1, "id")))));
    if (action == "create") return ok(json(credentials.create(json::parse(arg(call, 1, "json")))));
    if (action == "update")
        return ok(json(credentials.update(parseId(arg(call, 1, "id")), json::parse(arg(call, 2, "json")))));
    if (action == "delete") {
        credentials.remove(parseId(arg(call, 1, "id")));
        return ok(json(true));
    }

    return invalid("Unknown credentials action: " + action);
}

CommandResult handleTasks(const CommandCall& call, CloudSyncService& tasks) {
    const auto& action = arg(call, 0, "action");

    if (action == "list") return ok(toJsonArray(tasks.query()));
    if (action == "get") return ok(json(tasks.get(parseId(arg(call, 1, "id")))));
    if (action == "create") return ok(json(tasks.create(json::parse(arg(call, 1, "json")))));
    if (action == "update")
        return ok(json(tasks.update(parseId(arg(call, 1, "id")), json::parse(arg(call, 2, "json")))));
    if (action == "delete") {
        tasks.remove(parseId(arg(call, 1, "id")));
        return ok(json(true));
    }

    return invalid("Unknown tasks action: " + action);
}

CommandResult handleRun(const CommandCall& call, CloudSyncService& tasks) {
    const auto id = parseId(arg(call, 0, "task id"));
    const auto job = tasks.run(id);

    if (call.progress) {
        call.progress(fmt::format("Job {} queued for task {}", job->id(), id));
        job->onProgress([&call](const cs::job::Progress& p) { call.progress(p.description); });
    }

    const auto state = job->wait();

    CommandResult r;
    r.data = job->toJson();
    r.has_data = true;
    r.stdout_text = r.data.dump(2) + "\n";
    if (state != cs::job::State::Success) {
        r.exit_code = 1;
        r.stderr_text = fmt::format("Task {} {}: {}\n", id, cs::job::to_string(state), job->error());
    }
    return r;
}

}

void cs::cli::registerCommands(Router& router, CloudSyncService& tasks, CredentialService& credentials) {
    router.registerCommand("providers", "providers", "List supported cloud providers and their schemas",
                           [&tasks](const CommandCall&) { return ok(tasks.providers()); });

    router.registerCommand("credentials", "credentials list|get|create|update|delete [id] [json]",
                           "Manage cloud credentials",
                           [&credentials](const CommandCall& call) { return handleCredentials(call, credentials); });

    router.registerCommand("tasks", "tasks list|get|create|update|delete [id] [json]",
                           "Manage cloud sync tasks",
                           [&tasks](const CommandCall& call) { return handleTasks(call, tasks); });

    router.registerCommand("run", "run <task id>", "Run a cloud sync task in the foreground",
                           [&tasks](const CommandCall& call) { return handleRun(call, tasks); });

    router.registerCommand("ls", "ls <json>", "List a remote directory ({credentials, attributes: {bucket, folder}})",
                           [&tasks](const CommandCall& call) {
                               return ok(toJsonArray(tasks.listDirectory(json::parse(arg(call, 0, "json")))));
                           });

    router.registerCommand("buckets", "buckets <credentials id>", "List buckets of a bucket-based provider",
                           [&tasks](const CommandCall& call) {
                               return ok(toJsonArray(tasks.listBuckets(parseId(arg(call, 0, "credentials id")))));
                           });

    router.registerCommand("crontab", "crontab", "Regenerate the cron schedule from stored tasks",
                           [&tasks](const CommandCall&) {
                               tasks.refreshScheduler();
                               return ok(std::string("crontab updated\n"));
                           });
}
