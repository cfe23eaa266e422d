#ifndef MAILCAS_CONTENT_STORE_HPP
#define MAILCAS_CONTENT_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

namespace mailcas {

/**
 * @brief Content-addressable byte store: one file per hash under a cas/ dir.
 *
 * A file named `<hash>` only ever appears fully written: bytes go to a
 * temporary file first, which is flushed to disk and then renamed into
 * place. Methods are virtual so tests can substitute failing storage.
 */
class ContentStore {
public:
  struct StoreResult {
    std::string hash;
    uint64_t sizeBytes{0};
    bool created{false}; ///< false when the file was already present
  };

  struct GCStats {
    size_t totalFiles{0};
    size_t reclaimableFiles{0};
    size_t reclaimableBytes{0};
    size_t freedFiles{0};
    size_t freedBytes{0};
  };

  /**
   * @param casDir Directory holding the blob files; created if missing.
   * @param durableWrites fsync each blob and the directory before returning.
   * @throws IOFailure if the directory cannot be created.
   */
  explicit ContentStore(std::string casDir, bool durableWrites = true);
  virtual ~ContentStore() = default;

  /**
   * @brief Hash @p data and write it under its hash unless already present.
   * @throws IOFailure if the bytes cannot be written.
   */
  virtual StoreResult store(std::span<const std::byte> data);

  /**
   * @brief Write @p data under a precomputed @p hash.
   *
   * The caller guarantees that @p hash is the SHA-256 of @p data.
   * @return true if a new file was written, false if it already existed.
   * @throws std::invalid_argument if @p hash is not a content hash.
   * @throws IOFailure if the bytes cannot be written.
   */
  virtual bool put(const std::string &hash, std::span<const std::byte> data);

  virtual bool exists(const std::string &hash) const;

  /**
   * @brief Open the blob for reading.
   * @return An open binary stream, or std::nullopt if no such blob exists.
   */
  virtual std::optional<std::ifstream> open(const std::string &hash) const;

  /**
   * @brief Read the whole blob.
   * @return The bytes, or std::nullopt if no such blob exists.
   * @throws IOFailure if the file exists but cannot be read.
   */
  virtual std::optional<std::vector<std::byte>>
  read(const std::string &hash) const;

  /**
   * @brief Delete the blob file.
   *
   * A missing file already is the requested end state, so it is not an error.
   * @return true if a file was removed.
   * @throws IOFailure if an existing file cannot be removed.
   */
  virtual bool remove(const std::string &hash);

  /**
   * @brief Delete every blob and temp file.
   * @return Number of files removed.
   * @throws IOFailure naming the first entry that could not be removed, after
   * every other entry was attempted.
   */
  virtual size_t removeAll();

  /// Hashes of all blob files currently on disk.
  virtual std::vector<std::string> listHashes() const;

  /**
   * @brief Remove files that @p referenced does not name.
   *
   * Leftover temp files from interrupted writes are always reclaimable.
   * Files whose names are not content hashes are left alone. With @p dryRun
   * nothing is deleted; statistics are returned in all cases.
   */
  GCStats garbageCollect(const std::unordered_set<std::string> &referenced,
                         bool dryRun);

  /// Path of the file backing @p hash (whether or not it exists).
  std::string pathFor(const std::string &hash) const;

  const std::string &directory() const { return casDir_; }

private:
  void writeDurably(const std::string &hash, std::span<const std::byte> data);
  void syncDirectory() const;

  std::string casDir_;
  bool durableWrites_;
};

} // namespace mailcas

#endif // MAILCAS_CONTENT_STORE_HPP
