#include "utilities/store_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace mailcas {

std::string defaultBaseDir() {
  const char *env = std::getenv("MAILCAS_BASE_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  return std::string("var/mailcas");
}

StorePaths::StorePaths(std::string baseDir) : baseDir_(std::move(baseDir)) {}

std::string StorePaths::casDir() const {
  return (std::filesystem::path(baseDir_) / "cas").string();
}

std::string StorePaths::blobPath(const std::string &hash) const {
  return (std::filesystem::path(baseDir_) / "cas" / hash).string();
}

std::string StorePaths::indexDbPath() const {
  return (std::filesystem::path(baseDir_) / "index.db").string();
}

std::string StorePaths::logsDir() const {
  return (std::filesystem::path(baseDir_) / "logs").string();
}

} // namespace mailcas
