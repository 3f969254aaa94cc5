#pragma once

#include <string>

namespace distd {

/// Root of the runtime state, from DISTD_VAR_DIR or /var/distd.
void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string chunksDir();
std::string registryPath();
std::string configPath();

} // namespace distd
