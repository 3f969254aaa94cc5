#include "distd/config.hpp"
#include "distd/errors.hpp"
#include "distd/var_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace distd {

namespace {

void applyNode(const YAML::Node &root, DistdConfig &cfg) {
  if (!root || root.IsNull())
    return;
  if (!root.IsMap()) {
    throwInvalidInput("Configuration root must be a mapping");
  }
  if (root["chunk_size"])
    cfg.chunkSize = root["chunk_size"].as<size_t>();

  if (const YAML::Node storage = root["storage"]) {
    if (storage["backend"])
      cfg.storageBackend = storage["backend"].as<std::string>();
    if (storage["root"])
      cfg.storageRoot = storage["root"].as<std::string>();
    if (storage["compression_level"])
      cfg.compressionLevel = storage["compression_level"].as<int>();
    if (storage["removal_policy"])
      cfg.removalPolicy =
          parseRemovalPolicy(storage["removal_policy"].as<std::string>());
    if (storage["shards"])
      cfg.shards = storage["shards"].as<size_t>();
  }

  if (const YAML::Node registry = root["registry"]) {
    if (registry["max_versions"])
      cfg.maxVersions = registry["max_versions"].as<size_t>();
    if (registry["file"])
      cfg.registryFile = registry["file"].as<std::string>();
  }

  if (const YAML::Node log = root["log"]) {
    if (log["file"])
      cfg.logFile = log["file"].as<std::string>();
    if (log["level"])
      cfg.logLevel = parseLogLevel(log["level"].as<std::string>());
    if (log["max_size"])
      cfg.logMaxSize = log["max_size"].as<long long>();
    if (log["max_backups"])
      cfg.logMaxBackups = log["max_backups"].as<int>();
  }
}

DistdConfig fromNode(const YAML::Node &root) {
  DistdConfig cfg = DistdConfig::defaults();
  try {
    applyNode(root, cfg);
  } catch (const YAML::Exception &e) {
    throwInvalidInput(std::string("Invalid configuration value: ") + e.what());
  }
  applyEnvOverrides(cfg);
  validateConfig(cfg);
  return cfg;
}

size_t parseSize(const char *name, const char *value) {
  try {
    size_t pos = 0;
    unsigned long long v = std::stoull(value, &pos);
    if (pos != std::string(value).size())
      throw std::invalid_argument(value);
    return static_cast<size_t>(v);
  } catch (const std::invalid_argument &) {
    throwInvalidInput(std::string(name) + " is not a number: " + value);
  } catch (const std::out_of_range &) {
    throwInvalidInput(std::string(name) + " is out of range: " + value);
  }
}

} // namespace

DistdConfig DistdConfig::defaults() {
  DistdConfig cfg;
  cfg.storageRoot = chunksDir();
  cfg.registryFile = registryPath();
  cfg.logFile = logsDir() + "/distd.log";
  return cfg;
}

DistdConfig loadConfig(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    Logger::getInstance().log(LogLevel::DEBUG, "No configuration at " + path +
                                                   ", using defaults");
    return fromNode(YAML::Node());
  }
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throwInvalidInput("Cannot parse " + path + ": " + e.what());
  }
  return fromNode(root);
}

DistdConfig parseConfig(const std::string &yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception &e) {
    throwInvalidInput(std::string("Cannot parse configuration: ") + e.what());
  }
  return fromNode(root);
}

void applyEnvOverrides(DistdConfig &config) {
  if (const char *env = std::getenv("DISTD_CHUNK_SIZE"))
    config.chunkSize = parseSize("DISTD_CHUNK_SIZE", env);
  if (const char *env = std::getenv("DISTD_STORAGE_BACKEND"))
    config.storageBackend = env;
  if (const char *env = std::getenv("DISTD_STORAGE_ROOT"))
    config.storageRoot = env;
  if (const char *env = std::getenv("DISTD_LOG_LEVEL"))
    config.logLevel = parseLogLevel(env);
}

void validateConfig(const DistdConfig &config) {
  if (config.chunkSize == 0 || config.chunkSize > 0xffffffffULL) {
    throwInvalidInput("chunk_size must be between 1 and 4294967295");
  }
  if (config.storageBackend != "memory" &&
      config.storageBackend != "filesystem") {
    throwInvalidInput("storage.backend must be 'memory' or 'filesystem', got '" +
                      config.storageBackend + "'");
  }
  if (config.storageBackend == "filesystem" && config.storageRoot.empty()) {
    throwInvalidInput("storage.root is required for the filesystem backend");
  }
  if (config.compressionLevel < 0 || config.compressionLevel > 22) {
    throwInvalidInput("storage.compression_level must be between 0 and 22");
  }
  if (config.shards == 0) {
    throwInvalidInput("storage.shards must be at least 1");
  }
  if (config.logMaxSize <= 0 || config.logMaxBackups < 0) {
    throwInvalidInput("log.max_size must be positive and log.max_backups "
                      "non-negative");
  }
}

} // namespace distd
