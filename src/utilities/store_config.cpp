#include "utilities/store_config.hpp"
#include "utilities/store_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace mailcas {

DedupPolicy dedupPolicyFromString(const std::string &name) {
  if (name == "unique")
    return DedupPolicy::UniquePerContent;
  if (name == "shared")
    return DedupPolicy::SharedReferences;
  throw std::invalid_argument("Unknown dedup_policy: " + name);
}

std::string toString(DedupPolicy policy) {
  return policy == DedupPolicy::UniquePerContent ? "unique" : "shared";
}

IndexBackend indexBackendFromString(const std::string &name) {
  if (name == "sqlite")
    return IndexBackend::Sqlite;
  if (name == "memory")
    return IndexBackend::Memory;
  throw std::invalid_argument("Unknown index_backend: " + name);
}

std::string toString(IndexBackend backend) {
  return backend == IndexBackend::Sqlite ? "sqlite" : "memory";
}

static int64_t parseLimit(const std::string &value) {
  try {
    size_t consumed = 0;
    long long v = std::stoll(value, &consumed);
    if (consumed != value.size())
      throw std::invalid_argument(value);
    return static_cast<int64_t>(v);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Invalid history limit: " + value);
  }
}

StoreConfig loadStoreConfig(const std::string &path) {
  StoreConfig cfg;
  cfg.baseDir = defaultBaseDir();

  if (!path.empty() && std::filesystem::exists(path)) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      if (node["base_dir"])
        cfg.baseDir = node["base_dir"].as<std::string>();
      if (node["history_limit"])
        cfg.historyLimit = node["history_limit"].as<int64_t>();
      if (node["dedup_policy"])
        cfg.dedupPolicy =
            dedupPolicyFromString(node["dedup_policy"].as<std::string>());
      if (node["index_backend"])
        cfg.indexBackend =
            indexBackendFromString(node["index_backend"].as<std::string>());
      if (node["durable_writes"])
        cfg.durableWrites = node["durable_writes"].as<bool>();
      if (node["log_file"])
        cfg.logFile = node["log_file"].as<std::string>();
      if (node["log_level"])
        cfg.logLevel = logLevelFromString(node["log_level"].as<std::string>());
    } catch (const YAML::Exception &e) {
      throw std::invalid_argument("Invalid config " + path + ": " + e.what());
    }
  }

  if (const char *env = std::getenv("MAILCAS_BASE_DIR"); env && env[0])
    cfg.baseDir = env;
  if (const char *env = std::getenv("MAILCAS_HISTORY_LIMIT"); env && env[0])
    cfg.historyLimit = parseLimit(env);
  if (const char *env = std::getenv("MAILCAS_LOG_LEVEL"); env && env[0])
    cfg.logLevel = logLevelFromString(env);
  return cfg;
}

StoreConfig loadStoreConfig() {
  const char *cfg = std::getenv("MAILCAS_CONFIG");
  if (!cfg)
    cfg = "mailcas_config.yaml";
  return loadStoreConfig(cfg);
}

} // namespace mailcas
