#include "index/sqlite_history_index.h"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/text_utils.hpp"

#include <algorithm>
#include <limits>
#include <variant>
#include <vector>

namespace mailcas {

namespace {

constexpr const char *COLUMNS =
    "id, blob_hash, display_name, original_uri, last_accessed, subject, "
    "sender_email, sender_name, recipient_emails, recipient_names, "
    "email_date, has_attachments, body_preview";

constexpr const char *EFFECTIVE_DATE =
    "(CASE WHEN email_date > 0 THEN email_date ELSE last_accessed END)";

constexpr const char *DISPLAY_SENDER =
    "(CASE WHEN sender_name <> '' THEN sender_name ELSE sender_email END)";

HistoryRecord readRecord(const Statement &st) {
  HistoryRecord r;
  r.id = st.columnInt64(0);
  r.blobHash = st.columnText(1);
  r.displayName = st.columnText(2);
  r.originalSourceRef = st.columnOptionalText(3);
  r.lastAccessed = st.columnInt64(4);
  r.subject = st.columnText(5);
  r.senderEmail = st.columnText(6);
  r.senderName = st.columnText(7);
  r.recipientEmails = st.columnText(8);
  r.recipientNames = st.columnText(9);
  r.emailDate = st.columnInt64(10);
  r.hasAttachments = st.columnInt64(11) != 0;
  r.bodyPreview = st.columnText(12);
  return r;
}

// "%needle%" with LIKE wildcards in the needle escaped by '\'.
std::string likePattern(const std::string &needle) {
  std::string out = "%";
  for (char c : needle) {
    if (c == '%' || c == '_' || c == '\\')
      out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('%');
  return out;
}

using BindValue = std::variant<int64_t, std::string>;

struct WhereClause {
  std::string sql;
  std::vector<BindValue> binds;

  void add(const std::string &clause) {
    sql += sql.empty() ? " WHERE " : " AND ";
    sql += clause;
  }
};

WhereClause buildWhere(const std::string &rawText, const EmailFilter &f) {
  WhereClause w;
  const std::string text = text::trim(rawText);
  if (!text.empty()) {
    const std::string pattern = likePattern(text);
    w.add("(subject LIKE ? ESCAPE '\\' OR sender_email LIKE ? ESCAPE '\\' "
          "OR sender_name LIKE ? ESCAPE '\\' OR recipient_emails LIKE ? "
          "ESCAPE '\\' OR recipient_names LIKE ? ESCAPE '\\' OR "
          "body_preview LIKE ? ESCAPE '\\')");
    for (int i = 0; i < 6; ++i)
      w.binds.emplace_back(pattern);
  }
  if (f.hasAttachments) {
    w.add("has_attachments = ?");
    w.binds.emplace_back(static_cast<int64_t>(*f.hasAttachments ? 1 : 0));
  }
  if (f.dateFrom) {
    w.add(std::string(EFFECTIVE_DATE) + " >= ?");
    w.binds.emplace_back(*f.dateFrom);
  }
  if (f.dateTo) {
    w.add(std::string(EFFECTIVE_DATE) + " <= ?");
    w.binds.emplace_back(*f.dateTo);
  }
  if (f.senderContains) {
    const std::string pattern = likePattern(*f.senderContains);
    w.add("(sender_email LIKE ? ESCAPE '\\' OR sender_name LIKE ? ESCAPE "
          "'\\')");
    w.binds.emplace_back(pattern);
    w.binds.emplace_back(pattern);
  }
  return w;
}

std::string orderClause(const std::optional<SortOrder> &sort) {
  if (!sort)
    return std::string(" ORDER BY ") + EFFECTIVE_DATE + " DESC, id DESC";
  const char *dir =
      sort->direction == SortDirection::DESCENDING ? " DESC" : " ASC";
  switch (sort->field) {
  case SortField::DATE:
    return std::string(" ORDER BY ") + EFFECTIVE_DATE + dir + ", id ASC";
  case SortField::SUBJECT:
    return std::string(" ORDER BY subject COLLATE NOCASE") + dir + ", id ASC";
  case SortField::SENDER:
    return std::string(" ORDER BY ") + DISPLAY_SENDER + " COLLATE NOCASE" +
           dir + ", id ASC";
  }
  return std::string();
}

// SQLite LIMIT takes a signed 64-bit value.
std::string limitClause(size_t limit) {
  const auto max = static_cast<size_t>(std::numeric_limits<int64_t>::max());
  return " LIMIT " + std::to_string(std::min(limit, max));
}

} // namespace

SqliteHistoryIndex::SqliteHistoryIndex(std::shared_ptr<SqliteDatabase> db,
                                       bool uniqueBlobHash)
    : db_(std::move(db)) {
  createSchema(uniqueBlobHash);
}

int SqliteHistoryIndex::schemaVersion() const {
  Statement st(*db_, "PRAGMA user_version;");
  return st.step() ? static_cast<int>(st.columnInt64(0)) : 0;
}

void SqliteHistoryIndex::createSchema(bool uniqueBlobHash) {
  // 0 is a file no release has stamped yet; the tables below are created
  // idempotently, so it is brought up to date like a fresh one.
  const int found = schemaVersion();
  if (found != 0 && found != SCHEMA_VERSION) {
    throw IndexError("Unsupported history schema version " +
                         std::to_string(found) + " in " + db_->path() +
                         " (expected " + std::to_string(SCHEMA_VERSION) + ")",
                     0);
  }

  db_->exec(R"SQL(
    CREATE TABLE IF NOT EXISTS history_items (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      blob_hash TEXT NOT NULL REFERENCES blobs(hash),
      display_name TEXT NOT NULL,
      original_uri TEXT,
      last_accessed INTEGER NOT NULL,
      subject TEXT NOT NULL DEFAULT '',
      sender_email TEXT NOT NULL DEFAULT '',
      sender_name TEXT NOT NULL DEFAULT '',
      recipient_emails TEXT NOT NULL DEFAULT '',
      recipient_names TEXT NOT NULL DEFAULT '',
      email_date INTEGER NOT NULL DEFAULT 0,
      has_attachments INTEGER NOT NULL DEFAULT 0,
      body_preview TEXT NOT NULL DEFAULT ''
    );
    CREATE INDEX IF NOT EXISTS idx_history_email_date ON history_items(email_date);
    CREATE INDEX IF NOT EXISTS idx_history_sender_email ON history_items(sender_email);
    CREATE INDEX IF NOT EXISTS idx_history_has_attachments ON history_items(has_attachments);
    CREATE INDEX IF NOT EXISTS idx_history_last_accessed ON history_items(last_accessed);
  )SQL");

  if (uniqueBlobHash) {
    db_->exec("DROP INDEX IF EXISTS idx_history_blob_hash;"
              "CREATE UNIQUE INDEX IF NOT EXISTS idx_history_blob_unique "
              "ON history_items(blob_hash);");
  } else {
    db_->exec("DROP INDEX IF EXISTS idx_history_blob_unique;"
              "CREATE INDEX IF NOT EXISTS idx_history_blob_hash "
              "ON history_items(blob_hash);");
  }
  db_->exec("PRAGMA user_version=" + std::to_string(SCHEMA_VERSION) + ";");
  Logger::getInstance().log(
      LogLevel::DEBUG, "[SqliteHistoryIndex] schema ready in " + db_->path() +
                           (uniqueBlobHash ? " (unique blob_hash)" : ""));
}

int64_t SqliteHistoryIndex::insert(const HistoryRecord &r) {
  Statement st(*db_, R"SQL(
    INSERT INTO history_items
      (blob_hash, display_name, original_uri, last_accessed, subject,
       sender_email, sender_name, recipient_emails, recipient_names,
       email_date, has_attachments, body_preview)
    VALUES (?,?,?,?,?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bind(i++, r.blobHash);
  st.bind(i++, r.displayName);
  st.bind(i++, r.originalSourceRef);
  st.bind(i++, r.lastAccessed);
  st.bind(i++, r.subject);
  st.bind(i++, r.senderEmail);
  st.bind(i++, r.senderName);
  st.bind(i++, r.recipientEmails);
  st.bind(i++, r.recipientNames);
  st.bind(i++, r.emailDate);
  st.bind(i++, static_cast<int64_t>(r.hasAttachments ? 1 : 0));
  st.bind(i++, r.bodyPreview);
  st.run();
  return db_->lastInsertRowId();
}

std::optional<HistoryRecord> SqliteHistoryIndex::getById(int64_t id) const {
  Statement st(*db_, std::string("SELECT ") + COLUMNS +
                         " FROM history_items WHERE id = ?");
  st.bind(1, id);
  if (!st.step())
    return std::nullopt;
  return readRecord(st);
}

bool SqliteHistoryIndex::updateLastAccessed(int64_t id, int64_t timestamp) {
  Statement st(*db_,
               "UPDATE history_items SET last_accessed = ? WHERE id = ?");
  st.bind(1, timestamp).bind(2, id);
  st.run();
  return db_->changes() > 0;
}

bool SqliteHistoryIndex::deleteById(int64_t id) {
  Statement st(*db_, "DELETE FROM history_items WHERE id = ?");
  st.bind(1, id);
  st.run();
  return db_->changes() > 0;
}

size_t SqliteHistoryIndex::deleteAll() {
  Statement st(*db_, "DELETE FROM history_items");
  st.run();
  return static_cast<size_t>(db_->changes());
}

size_t SqliteHistoryIndex::countByBlobHash(const std::string &hash) const {
  Statement st(*db_, "SELECT COUNT(*) FROM history_items WHERE blob_hash = ?");
  st.bind(1, hash);
  if (!st.step())
    return 0;
  return static_cast<size_t>(st.columnInt64(0));
}

RecordList SqliteHistoryIndex::findByBlobHash(const std::string &hash) const {
  Statement st(*db_, std::string("SELECT ") + COLUMNS +
                         " FROM history_items WHERE blob_hash = ? "
                         "ORDER BY id ASC");
  st.bind(1, hash);
  RecordList out;
  while (st.step())
    out.push_back(readRecord(st));
  return out;
}

size_t SqliteHistoryIndex::count() const {
  Statement st(*db_, "SELECT COUNT(*) FROM history_items");
  if (!st.step())
    return 0;
  return static_cast<size_t>(st.columnInt64(0));
}

RecordList SqliteHistoryIndex::select(const std::string &whereAndOrder) const {
  Statement st(*db_, std::string("SELECT ") + COLUMNS + " FROM history_items" +
                         whereAndOrder);
  RecordList out;
  while (st.step())
    out.push_back(readRecord(st));
  return out;
}

RecordList SqliteHistoryIndex::all() const {
  return select(" ORDER BY last_accessed DESC, id DESC");
}

RecordList SqliteHistoryIndex::recent(size_t limit) const {
  return select(" ORDER BY last_accessed DESC, id DESC" + limitClause(limit));
}

RecordList SqliteHistoryIndex::oldest(size_t n) const {
  return select(" ORDER BY last_accessed ASC, id ASC" + limitClause(n));
}

RecordList SqliteHistoryIndex::search(const std::string &text) const {
  HistoryQuery q;
  q.text = text;
  return query(q);
}

RecordList SqliteHistoryIndex::sortBy(SortField field,
                                      SortDirection direction) const {
  HistoryQuery q;
  q.sort = SortOrder{field, direction};
  return query(q);
}

RecordList SqliteHistoryIndex::filter(const EmailFilter &f) const {
  HistoryQuery q;
  q.filter = f;
  return query(q);
}

RecordList SqliteHistoryIndex::query(const HistoryQuery &q) const {
  WhereClause where = buildWhere(q.text, q.filter);
  Statement st(*db_, std::string("SELECT ") + COLUMNS + " FROM history_items" +
                         where.sql + orderClause(q.sort));
  int index = 1;
  for (const auto &value : where.binds) {
    if (std::holds_alternative<int64_t>(value))
      st.bind(index++, std::get<int64_t>(value));
    else
      st.bind(index++, std::get<std::string>(value));
  }
  RecordList out;
  while (st.step())
    out.push_back(readRecord(st));
  return out;
}

} // namespace mailcas
