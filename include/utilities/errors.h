#pragma once
#ifndef MAILCAS_ERRORS_H
#define MAILCAS_ERRORS_H

#include <stdexcept>
#include <string>

namespace mailcas {

/**
 * @brief Base class for recoverable store failures surfaced to callers.
 */
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string &what) : std::runtime_error(what) {}
};

/// Writing, reading or deleting bytes on disk failed.
class IOFailure : public StoreError {
public:
  IOFailure(const std::string &what, const std::string &path)
      : StoreError(what + " (" + path + ")"), path_(path) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/// An operation named an id or hash that does not exist, and absence is not
/// an accepted outcome for that operation.
class NotFound : public StoreError {
public:
  explicit NotFound(const std::string &what) : StoreError(what) {}
};

/// The hash backend could not produce a digest.
class HashComputationFailure : public StoreError {
public:
  explicit HashComputationFailure(const std::string &what)
      : StoreError(what) {}
};

/// The metadata database rejected a statement.
class IndexError : public StoreError {
public:
  IndexError(const std::string &what, int code)
      : StoreError(what), code_(code) {}

  int code() const { return code_; }

private:
  int code_;
};

/**
 * @brief Refcount or ledger state contradicts the records referencing it.
 *
 * This is a bug, not an environmental failure, so it derives from
 * std::logic_error and is never clamped or retried.
 */
class LedgerInvariantError : public std::logic_error {
public:
  explicit LedgerInvariantError(const std::string &what)
      : std::logic_error(what) {}
};

} // namespace mailcas

#endif // MAILCAS_ERRORS_H
