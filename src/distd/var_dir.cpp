#include "distd/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace distd {

static std::string varDir = [] {
  const char *env = std::getenv("DISTD_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/distd"))
    return std::string("/var/distd");
  return std::string("var/distd");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string chunksDir() { return getVarDir() + "/chunks"; }

std::string registryPath() { return getVarDir() + "/registry.pb"; }

std::string configPath() {
  const char *env = std::getenv("DISTD_CONFIG");
  if (env && env[0] != '\0')
    return env;
  return getVarDir() + "/distd.yaml";
}

} // namespace distd
