#ifndef DISTD_CONFIG_HPP
#define DISTD_CONFIG_HPP

#include <cstddef>
#include <string>

#include "distd/chunk_store.hpp"
#include "distd/chunker.hpp"
#include "distd/logger.h"

namespace distd {

/**
 * @brief Runtime options of the engine.
 *
 * YAML layout:
 * @code
 * chunk_size: 262144
 * storage:
 *   backend: filesystem        # or memory
 *   root: /var/distd/chunks
 *   compression_level: 3       # zstd level, 0 stores chunks raw
 *   removal_policy: deferred   # or immediate
 *   shards: 16
 * registry:
 *   max_versions: 4            # 0 keeps every version
 *   file: /var/distd/registry.pb  # only used with the filesystem backend
 * log:
 *   file: /var/distd/logs/distd.log
 *   level: info
 *   max_size: 10485760
 *   max_backups: 5
 * @endcode
 */
struct DistdConfig {
  size_t chunkSize = DEFAULT_CHUNK_SIZE;

  std::string storageBackend = "memory";
  std::string storageRoot;
  int compressionLevel = 0;
  RemovalPolicy removalPolicy = RemovalPolicy::Immediate;
  size_t shards = 16;

  size_t maxVersions = 0;
  std::string registryFile;

  std::string logFile;
  LogLevel logLevel = LogLevel::INFO;
  long long logMaxSize = 10 * 1024 * 1024;
  int logMaxBackups = 5;

  /// Defaults with paths resolved against the var dir.
  static DistdConfig defaults();
};

/**
 * @brief Load @p path, then apply DISTD_* environment overrides.
 *
 * A missing file yields the defaults.
 * @throws distd::InvalidInputError on malformed YAML or invalid values.
 */
DistdConfig loadConfig(const std::string &path);

/// Same as loadConfig() for an in-memory document.
DistdConfig parseConfig(const std::string &yaml);

/// @throws distd::InvalidInputError on an invalid value.
void applyEnvOverrides(DistdConfig &config);

/// @throws distd::InvalidInputError if a value is out of range.
void validateConfig(const DistdConfig &config);

} // namespace distd

#endif // DISTD_CONFIG_HPP
