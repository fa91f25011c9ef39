#pragma once

namespace cs::services {
class CloudSyncService;
class CredentialService;
}

namespace cs::cli {

class Router;

void registerCommands(Router& router, services::CloudSyncService& tasks, services::CredentialService& credentials);

}
