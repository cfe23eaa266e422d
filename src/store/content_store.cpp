#include "store/content_store.hpp"
#include "utilities/content_hasher.hpp"
#include "utilities/errors.h"
#include "utilities/hash_utils.hpp"
#include "utilities/logger.h"
#include "utilities/store_paths.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mailcas {

namespace {

std::atomic<uint64_t> g_tempCounter{0};

std::string errnoMessage(const std::string &what) {
  return what + ": " + std::strerror(errno);
}

bool isTempName(const std::string &name) {
  return name.rfind(StorePaths::TEMP_PREFIX, 0) == 0;
}

} // namespace

ContentStore::ContentStore(std::string casDir, bool durableWrites)
    : casDir_(std::move(casDir)), durableWrites_(durableWrites) {
  std::error_code ec;
  fs::create_directories(casDir_, ec);
  if (ec) {
    throw IOFailure("Cannot create blob directory: " + ec.message(), casDir_);
  }
}

std::string ContentStore::pathFor(const std::string &hash) const {
  if (!utils::is_content_hash(hash)) {
    throw std::invalid_argument("Not a content hash: '" + hash + "'");
  }
  return (fs::path(casDir_) / hash).string();
}

ContentStore::StoreResult
ContentStore::store(std::span<const std::byte> data) {
  StoreResult result;
  result.hash = ContentHasher::sha256_hex(data);
  result.sizeBytes = data.size();
  result.created = put(result.hash, data);
  return result;
}

bool ContentStore::put(const std::string &hash,
                       std::span<const std::byte> data) {
  const std::string path = pathFor(hash);
  std::error_code ec;
  if (fs::exists(path, ec) && fs::file_size(path, ec) == data.size() && !ec) {
    return false;
  }
  writeDurably(hash, data);
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[ContentStore] Stored " + hash + " (" +
                                std::to_string(data.size()) + " bytes)");
  return true;
}

void ContentStore::writeDurably(const std::string &hash,
                                std::span<const std::byte> data) {
  const std::string finalPath = pathFor(hash);
  const std::string tempPath =
      (fs::path(casDir_) /
       (std::string(StorePaths::TEMP_PREFIX) + hash + "-" +
        std::to_string(::getpid()) + "-" + std::to_string(++g_tempCounter)))
          .string();

  int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                  0644);
  if (fd < 0) {
    throw IOFailure(errnoMessage("Cannot create blob file"), tempPath);
  }

  auto fail = [&](const std::string &what) {
    IOFailure err(errnoMessage(what), tempPath);
    ::close(fd);
    ::unlink(tempPath.c_str());
    throw err;
  };

  const char *ptr = reinterpret_cast<const char *>(data.data());
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, ptr, remaining);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      fail("Write to blob file failed");
    }
    ptr += n;
    remaining -= static_cast<size_t>(n);
  }
  if (durableWrites_ && ::fsync(fd) != 0) {
    fail("fsync of blob file failed");
  }
  if (::close(fd) != 0) {
    IOFailure err(errnoMessage("close of blob file failed"), tempPath);
    ::unlink(tempPath.c_str());
    throw err;
  }
  if (::rename(tempPath.c_str(), finalPath.c_str()) != 0) {
    IOFailure err(errnoMessage("rename of blob file failed"), finalPath);
    ::unlink(tempPath.c_str());
    throw err;
  }
  if (durableWrites_) {
    syncDirectory();
  }
}

void ContentStore::syncDirectory() const {
  int dfd = ::open(casDir_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dfd < 0) {
    throw IOFailure(errnoMessage("Cannot open blob directory"), casDir_);
  }
  int rc = ::fsync(dfd);
  int savedErrno = errno;
  ::close(dfd);
  if (rc != 0) {
    errno = savedErrno;
    throw IOFailure(errnoMessage("fsync of blob directory failed"), casDir_);
  }
}

bool ContentStore::exists(const std::string &hash) const {
  std::error_code ec;
  return fs::is_regular_file(pathFor(hash), ec);
}

std::optional<std::ifstream>
ContentStore::open(const std::string &hash) const {
  std::ifstream in(pathFor(hash), std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  return in;
}

std::optional<std::vector<std::byte>>
ContentStore::read(const std::string &hash) const {
  auto in = open(hash);
  if (!in) {
    return std::nullopt;
  }
  std::vector<std::byte> bytes;
  std::error_code ec;
  auto size = fs::file_size(pathFor(hash), ec);
  if (!ec) {
    bytes.resize(static_cast<size_t>(size));
  }
  in->read(reinterpret_cast<char *>(bytes.data()),
           static_cast<std::streamsize>(bytes.size()));
  if (ec || !*in) {
    throw IOFailure("Read of blob file failed", pathFor(hash));
  }
  return bytes;
}

bool ContentStore::remove(const std::string &hash) {
  const std::string path = pathFor(hash);
  std::error_code ec;
  bool removed = fs::remove(path, ec);
  if (ec) {
    throw IOFailure("Cannot delete blob file: " + ec.message(), path);
  }
  if (removed) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "[ContentStore] Deleted " + hash);
  }
  return removed;
}

size_t ContentStore::removeAll() {
  size_t removed = 0;
  std::optional<IOFailure> firstFailure;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(casDir_, ec)) {
    const std::string name = entry.path().filename().string();
    if (!utils::is_content_hash(name) && !isTempName(name))
      continue;
    std::error_code rmEc;
    if (fs::remove(entry.path(), rmEc)) {
      ++removed;
    } else if (rmEc) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "[ContentStore] Cannot delete " +
                                    entry.path().string() + ": " +
                                    rmEc.message());
      if (!firstFailure)
        firstFailure.emplace("Cannot delete blob file: " + rmEc.message(),
                             entry.path().string());
    }
  }
  if (ec) {
    throw IOFailure("Cannot list blob directory: " + ec.message(), casDir_);
  }
  // Everything deletable is gone; report the first entry that was not.
  if (firstFailure)
    throw *firstFailure;
  return removed;
}

std::vector<std::string> ContentStore::listHashes() const {
  std::vector<std::string> hashes;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(casDir_, ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_regular_file() && utils::is_content_hash(name))
      hashes.push_back(name);
  }
  if (ec) {
    throw IOFailure("Cannot list blob directory: " + ec.message(), casDir_);
  }
  return hashes;
}

ContentStore::GCStats
ContentStore::garbageCollect(const std::unordered_set<std::string> &referenced,
                             bool dryRun) {
  GCStats stats{};
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(casDir_, ec)) {
    if (!entry.is_regular_file())
      continue;
    const std::string name = entry.path().filename().string();
    const bool temp = isTempName(name);
    if (!temp && !utils::is_content_hash(name))
      continue;
    stats.totalFiles++;
    if (!temp && referenced.count(name) > 0)
      continue;

    std::error_code sizeEc;
    size_t size = static_cast<size_t>(entry.file_size(sizeEc));
    if (sizeEc)
      size = 0;
    stats.reclaimableFiles++;
    stats.reclaimableBytes += size;
    if (!dryRun) {
      std::error_code rmEc;
      if (fs::remove(entry.path(), rmEc)) {
        stats.freedFiles++;
        stats.freedBytes += size;
      } else if (rmEc) {
        throw IOFailure("Cannot delete unreferenced blob: " + rmEc.message(),
                        entry.path().string());
      }
    }
  }
  if (ec) {
    throw IOFailure("Cannot list blob directory: " + ec.message(), casDir_);
  }
  Logger::getInstance().log(
      LogLevel::INFO, "[ContentStore] GC " + std::string(dryRun ? "(dry run) " : "") +
                          "reclaimable=" + std::to_string(stats.reclaimableFiles) +
                          " freed=" + std::to_string(stats.freedFiles));
  return stats;
}

} // namespace mailcas
