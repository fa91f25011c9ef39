#pragma once

#include <filesystem>

namespace cs::paths {

std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();
std::filesystem::path getJobLogPath();

void setConfigPath(const std::filesystem::path& path);
void setLogPathForTesting();

}
