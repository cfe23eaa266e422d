#pragma once
#ifndef MAILCAS_RECORDS_H
#define MAILCAS_RECORDS_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mailcas {

/// Maximum length of HistoryRecord::bodyPreview, in characters.
inline constexpr size_t BODY_PREVIEW_MAX_CHARS = 500;

/// Display name stored when the caller supplies a blank one.
inline constexpr const char *UNTITLED = "Untitled";

/**
 * @brief One stored payload.
 *
 * refCount equals the number of HistoryRecords whose blobHash is this hash.
 * A record with refCount 0 never exists.
 */
struct BlobRecord {
  std::string hash; ///< Lowercase hex SHA-256 of the payload
  uint64_t sizeBytes{0};
  uint32_t refCount{0};

  bool operator==(const BlobRecord &) const = default;
};

/**
 * @brief Already-parsed projection of an email, supplied by the caller.
 *
 * Default construction is the "nothing could be parsed" value: empty
 * strings, emailDate 0 (unknown), no attachments.
 */
struct EmailMetadata {
  std::string subject;
  std::string senderEmail;
  std::string senderName;
  std::string recipientEmails; ///< comma-joined
  std::string recipientNames;  ///< comma-joined
  int64_t emailDate{0};        ///< epoch millis; 0 means unknown
  bool hasAttachments{false};
  std::string bodyPreview;
};

/**
 * @brief A user-facing history entry referencing one blob.
 */
struct HistoryRecord {
  int64_t id{0};
  std::string blobHash;
  std::string displayName;
  std::optional<std::string> originalSourceRef;
  int64_t lastAccessed{0}; ///< epoch millis

  std::string subject;
  std::string senderEmail;
  std::string senderName;
  std::string recipientEmails;
  std::string recipientNames;
  int64_t emailDate{0};
  bool hasAttachments{false};
  std::string bodyPreview;

  /// emailDate when known, else lastAccessed.
  int64_t effectiveDate() const {
    return emailDate > 0 ? emailDate : lastAccessed;
  }

  /// senderName when present, else senderEmail.
  const std::string &displaySender() const {
    return senderName.empty() ? senderEmail : senderName;
  }

  /// Copy the email fields of @p meta, truncating the body preview.
  void applyMetadata(const EmailMetadata &meta);

  bool operator==(const HistoryRecord &) const = default;
};

/**
 * @brief Size of the cache as seen by the user.
 *
 * totalSizeBytes sums each distinct blob once, however many records share it.
 */
struct CacheStats {
  uint64_t entryCount{0};
  uint64_t totalSizeBytes{0};

  bool operator==(const CacheStats &) const = default;
};

} // namespace mailcas

#endif // MAILCAS_RECORDS_H
