#include "gtest/gtest.h"
#include "index/memory_history_index.h"
#include "index/sqlite_history_index.h"
#include "store/blob_table.hpp"
#include "utilities/errors.h"
#include "utilities/sqlite_db.hpp"

#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace mailcas;

namespace {

std::string hashFor(int n) {
    std::string digits = std::to_string(n);
    return std::string(64 - digits.size(), '0') + digits;
}

std::vector<std::string> subjects(const RecordList &records) {
    std::vector<std::string> out;
    for (const auto &r : records) out.push_back(r.subject);
    return out;
}

std::vector<int64_t> ids(const RecordList &records) {
    std::vector<int64_t> out;
    for (const auto &r : records) out.push_back(r.id);
    return out;
}

} // namespace

struct IndexParam {
    bool sqlite;
    bool unique;
};

class HistoryIndexTest : public ::testing::TestWithParam<IndexParam> {
protected:
    void SetUp() override {
        if (GetParam().sqlite) {
            db_ = std::make_shared<SqliteDatabase>(":memory:");
            blobs_ = std::make_unique<SqliteBlobTable>(db_);
            index_ = std::make_unique<SqliteHistoryIndex>(db_, GetParam().unique);
        } else {
            blobs_ = std::make_unique<MemoryBlobTable>();
            index_ = std::make_unique<MemoryHistoryIndex>(GetParam().unique);
        }
    }

    // Inserts a record, registering its blob row first as the store does.
    int64_t add(HistoryRecord r) {
        if (r.blobHash.empty()) r.blobHash = hashFor(++blobCounter_);
        if (auto existing = blobs_->find(r.blobHash)) {
            blobs_->setRefCount(r.blobHash, existing->refCount + 1);
        } else {
            blobs_->insert(BlobRecord{r.blobHash, 10, 1});
        }
        if (r.displayName.empty()) r.displayName = "entry";
        return index_->insert(r);
    }

    int64_t addSubject(const std::string &subject, int64_t emailDate, int64_t lastAccessed) {
        HistoryRecord r;
        r.subject = subject;
        r.emailDate = emailDate;
        r.lastAccessed = lastAccessed;
        return add(r);
    }

    int blobCounter_ = 0;
    std::shared_ptr<SqliteDatabase> db_;
    std::unique_ptr<BlobTable> blobs_;
    std::unique_ptr<HistoryIndex> index_;
};

TEST_P(HistoryIndexTest, InsertAndGetById) {
    HistoryRecord r;
    r.displayName = "invoice.eml";
    r.originalSourceRef = "content://downloads/42";
    r.lastAccessed = 1234;
    r.subject = "Invoice";
    r.senderEmail = "billing@example.com";
    r.senderName = "Billing";
    r.recipientEmails = "a@example.com,b@example.com";
    r.recipientNames = "A,B";
    r.emailDate = 999;
    r.hasAttachments = true;
    r.bodyPreview = "Please find attached";
    int64_t id = add(r);

    auto loaded = index_->getById(id);
    ASSERT_TRUE(loaded.has_value());
    r.id = id;
    r.blobHash = loaded->blobHash;
    EXPECT_EQ(*loaded, r);
    EXPECT_FALSE(index_->getById(id + 100).has_value());
}

TEST_P(HistoryIndexTest, AbsentSourceRefStaysAbsent) {
    HistoryRecord r;
    r.lastAccessed = 1;
    int64_t id = add(r);
    EXPECT_FALSE(index_->getById(id)->originalSourceRef.has_value());
}

TEST_P(HistoryIndexTest, IdsIncreaseAndAreNeverReused) {
    int64_t a = addSubject("a", 0, 1);
    int64_t b = addSubject("b", 0, 2);
    EXPECT_LT(a, b);
    EXPECT_TRUE(index_->deleteById(b));
    EXPECT_EQ(index_->deleteAll(), 1u);
    int64_t c = addSubject("c", 0, 3);
    EXPECT_GT(c, b);
}

TEST_P(HistoryIndexTest, UpdateAndDeleteReportUnknownIds) {
    int64_t id = addSubject("a", 0, 1);
    EXPECT_TRUE(index_->updateLastAccessed(id, 50));
    EXPECT_EQ(index_->getById(id)->lastAccessed, 50);
    EXPECT_FALSE(index_->updateLastAccessed(id + 1, 50));
    EXPECT_TRUE(index_->deleteById(id));
    EXPECT_FALSE(index_->deleteById(id));
    EXPECT_EQ(index_->count(), 0u);
}

TEST_P(HistoryIndexTest, CountByBlobHash) {
    HistoryRecord r;
    r.blobHash = hashFor(7);
    r.lastAccessed = 1;
    add(r);
    EXPECT_EQ(index_->countByBlobHash(hashFor(7)), 1u);
    EXPECT_EQ(index_->countByBlobHash(hashFor(8)), 0u);
    if (GetParam().unique) {
        EXPECT_THROW(add(r), IndexError);
        EXPECT_EQ(index_->countByBlobHash(hashFor(7)), 1u);
    } else {
        add(r);
        EXPECT_EQ(index_->countByBlobHash(hashFor(7)), 2u);
        EXPECT_EQ(index_->findByBlobHash(hashFor(7)).size(), 2u);
    }
}

TEST_P(HistoryIndexTest, AllIsMostRecentlyAccessedFirst) {
    int64_t a = addSubject("a", 0, 10);
    int64_t b = addSubject("b", 0, 30);
    int64_t c = addSubject("c", 0, 20);
    int64_t d = addSubject("d", 0, 30);
    EXPECT_EQ(ids(index_->all()), (std::vector<int64_t>{d, b, c, a}));
    EXPECT_EQ(ids(index_->recent(2)), (std::vector<int64_t>{d, b}));
    EXPECT_EQ(index_->recent(0).size(), 0u);
}

TEST_P(HistoryIndexTest, OldestBreaksTiesByLowerId) {
    int64_t a = addSubject("a", 0, 10);
    int64_t b = addSubject("b", 0, 10);
    int64_t c = addSubject("c", 0, 5);
    EXPECT_EQ(ids(index_->oldest(2)), (std::vector<int64_t>{c, a}));
    EXPECT_EQ(ids(index_->oldest(10)), (std::vector<int64_t>{c, a, b}));
}

TEST_P(HistoryIndexTest, SearchIsCaseInsensitiveAcrossFields) {
    addSubject("Important Meeting Tomorrow", 3000, 1);
    addSubject("Weekly Report", 2000, 1);
    addSubject("Meeting Notes", 1000, 1);

    EXPECT_EQ(subjects(index_->search("meeting")),
              (std::vector<std::string>{"Important Meeting Tomorrow", "Meeting Notes"}));
    EXPECT_EQ(subjects(index_->search("  MEETING ")),
              (std::vector<std::string>{"Important Meeting Tomorrow", "Meeting Notes"}));
    EXPECT_TRUE(index_->search("nothing like this").empty());
}

TEST_P(HistoryIndexTest, SearchMatchesEverySearchableField) {
    HistoryRecord r;
    r.lastAccessed = 1;
    r.senderEmail = "alice@example.com";
    add(r);
    r = HistoryRecord{};
    r.lastAccessed = 2;
    r.senderName = "Bob Builder";
    add(r);
    r = HistoryRecord{};
    r.lastAccessed = 3;
    r.recipientEmails = "carol@example.org,dave@example.org";
    add(r);
    r = HistoryRecord{};
    r.lastAccessed = 4;
    r.recipientNames = "Carol,Erin";
    add(r);
    r = HistoryRecord{};
    r.lastAccessed = 5;
    r.bodyPreview = "the quarterly numbers look fine";
    add(r);
    r = HistoryRecord{};
    r.lastAccessed = 6;
    r.displayName = "quarterly.eml"; // display name is not searchable
    add(r);

    EXPECT_EQ(index_->search("ALICE").size(), 1u);
    EXPECT_EQ(index_->search("builder").size(), 1u);
    EXPECT_EQ(index_->search("dave@").size(), 1u);
    EXPECT_EQ(index_->search("carol").size(), 2u);
    EXPECT_EQ(index_->search("Quarterly").size(), 1u);
}

TEST_P(HistoryIndexTest, BlankSearchMatchesEverythingInDateOrder) {
    int64_t a = addSubject("a", 1000, 1);
    int64_t b = addSubject("b", 0, 5000);  // falls back to lastAccessed
    int64_t c = addSubject("c", 3000, 1);
    int64_t d = addSubject("d", 3000, 2);
    EXPECT_EQ(ids(index_->search("")), (std::vector<int64_t>{b, d, c, a}));
    EXPECT_EQ(ids(index_->search(" \t")), (std::vector<int64_t>{b, d, c, a}));
}

TEST_P(HistoryIndexTest, SearchTreatsWildcardsLiterally) {
    addSubject("100% done", 1, 1);
    addSubject("1000 done", 2, 1);
    addSubject("snake_case", 3, 1);
    addSubject("snakeXcase", 4, 1);
    EXPECT_EQ(subjects(index_->search("0%")), (std::vector<std::string>{"100% done"}));
    EXPECT_EQ(subjects(index_->search("e_c")), (std::vector<std::string>{"snake_case"}));
}

TEST_P(HistoryIndexTest, SortByDate) {
    int64_t a = addSubject("a", 1000, 1);
    int64_t b = addSubject("b", 3000, 1);
    int64_t c = addSubject("c", 2000, 1);
    EXPECT_EQ(ids(index_->sortBy(SortField::DATE, SortDirection::DESCENDING)),
              (std::vector<int64_t>{b, c, a}));
    EXPECT_EQ(ids(index_->sortBy(SortField::DATE, SortDirection::ASCENDING)),
              (std::vector<int64_t>{a, c, b}));

    // Unknown date sorts by when it was last accessed.
    int64_t d = addSubject("d", 0, 2500);
    EXPECT_EQ(ids(index_->sortBy(SortField::DATE, SortDirection::DESCENDING)),
              (std::vector<int64_t>{b, d, c, a}));
}

TEST_P(HistoryIndexTest, SortBySubjectIgnoresCaseAndBreaksTiesById) {
    int64_t cherry = addSubject("cherry", 0, 1);
    int64_t apple = addSubject("apple", 0, 2);
    int64_t banana = addSubject("Banana", 0, 3);
    int64_t apple2 = addSubject("APPLE", 0, 4);
    EXPECT_EQ(ids(index_->sortBy(SortField::SUBJECT, SortDirection::ASCENDING)),
              (std::vector<int64_t>{apple, apple2, banana, cherry}));
    EXPECT_EQ(ids(index_->sortBy(SortField::SUBJECT, SortDirection::DESCENDING)),
              (std::vector<int64_t>{cherry, banana, apple, apple2}));
}

TEST_P(HistoryIndexTest, SortBySenderUsesNameThenEmail) {
    HistoryRecord r;
    r.lastAccessed = 1;
    r.senderName = "zed";
    r.senderEmail = "aaa@example.com";
    int64_t zed = add(r);
    r = HistoryRecord{};
    r.lastAccessed = 1;
    r.senderEmail = "mike@example.com";
    int64_t mike = add(r);
    r = HistoryRecord{};
    r.lastAccessed = 1;
    r.senderName = "Bea";
    int64_t bea = add(r);
    EXPECT_EQ(ids(index_->sortBy(SortField::SENDER, SortDirection::ASCENDING)),
              (std::vector<int64_t>{bea, mike, zed}));
}

TEST_P(HistoryIndexTest, FilterComposesByAnd) {
    HistoryRecord r;
    r.subject = "with attachment, old";
    r.hasAttachments = true;
    r.emailDate = 1000;
    r.senderEmail = "ops@example.com";
    r.lastAccessed = 1;
    int64_t oldAttach = add(r);

    r = HistoryRecord{};
    r.subject = "with attachment, new";
    r.hasAttachments = true;
    r.emailDate = 5000;
    r.senderName = "Ops Team";
    r.lastAccessed = 2;
    int64_t newAttach = add(r);

    r = HistoryRecord{};
    r.subject = "plain";
    r.emailDate = 3000;
    r.senderEmail = "someone@example.com";
    r.lastAccessed = 3;
    int64_t plain = add(r);

    EmailFilter attachments;
    attachments.hasAttachments = true;
    EXPECT_EQ(ids(index_->filter(attachments)), (std::vector<int64_t>{newAttach, oldAttach}));

    EmailFilter range;
    range.dateFrom = 1000;
    range.dateTo = 3000;
    EXPECT_EQ(ids(index_->filter(range)), (std::vector<int64_t>{plain, oldAttach}));

    EmailFilter sender;
    sender.senderContains = "OPS";
    EXPECT_EQ(ids(index_->filter(sender)), (std::vector<int64_t>{newAttach, oldAttach}));

    EmailFilter all;
    all.hasAttachments = true;
    all.dateFrom = 2000;
    all.senderContains = "ops";
    EXPECT_EQ(ids(index_->filter(all)), (std::vector<int64_t>{newAttach}));

    EXPECT_EQ(index_->filter(EmailFilter{}).size(), 3u);
}

TEST_P(HistoryIndexTest, QueryCombinesSearchFilterAndSort) {
    HistoryRecord r;
    r.subject = "Meeting agenda";
    r.hasAttachments = true;
    r.emailDate = 1000;
    r.lastAccessed = 1;
    int64_t agenda = add(r);

    r = HistoryRecord{};
    r.subject = "Meeting minutes";
    r.hasAttachments = true;
    r.emailDate = 2000;
    r.lastAccessed = 1;
    int64_t minutes = add(r);

    r = HistoryRecord{};
    r.subject = "Meeting cancelled";
    r.emailDate = 3000;
    r.lastAccessed = 1;
    add(r);

    HistoryQuery q;
    q.text = "meeting";
    q.filter.hasAttachments = true;
    EXPECT_EQ(ids(index_->query(q)), (std::vector<int64_t>{minutes, agenda}));

    q.sort = SortOrder{SortField::SUBJECT, SortDirection::ASCENDING};
    EXPECT_EQ(ids(index_->query(q)), (std::vector<int64_t>{agenda, minutes}));
}

INSTANTIATE_TEST_SUITE_P(
    Backends, HistoryIndexTest,
    ::testing::Values(IndexParam{false, true}, IndexParam{false, false},
                      IndexParam{true, true}, IndexParam{true, false}),
    [](const ::testing::TestParamInfo<IndexParam> &info) {
        return std::string(info.param.sqlite ? "Sqlite" : "Memory") +
               (info.param.unique ? "Unique" : "Shared");
    });

TEST(SqliteHistoryIndex, RejectsRecordsForUnknownBlobs) {
    auto db = std::make_shared<SqliteDatabase>(":memory:");
    SqliteBlobTable blobs(db);
    SqliteHistoryIndex index(db, true);
    HistoryRecord r;
    r.blobHash = hashFor(1);
    r.displayName = "orphan";
    EXPECT_THROW(index.insert(r), IndexError);
    EXPECT_EQ(index.count(), 0u);
}

TEST(SqliteHistoryIndex, UniqueModeRefusesDatabaseWithSharedBlobs) {
    auto db = std::make_shared<SqliteDatabase>(":memory:");
    SqliteBlobTable blobs(db);
    {
        SqliteHistoryIndex shared(db, false);
        blobs.insert(BlobRecord{hashFor(1), 4, 2});
        HistoryRecord r;
        r.blobHash = hashFor(1);
        r.displayName = "x";
        shared.insert(r);
        shared.insert(r);
    }
    EXPECT_THROW(SqliteHistoryIndex(db, true), IndexError);
}

TEST(SqliteHistoryIndex, StampsAndChecksSchemaVersion) {
    auto db = std::make_shared<SqliteDatabase>(":memory:");
    SqliteBlobTable blobs(db);
    { SqliteHistoryIndex first(db, true); }
    Statement version(*db, "PRAGMA user_version;");
    ASSERT_TRUE(version.step());
    EXPECT_EQ(version.columnInt64(0), SqliteHistoryIndex::SCHEMA_VERSION);

    // Reopening the same schema is fine; a file from another release is not.
    EXPECT_NO_THROW(SqliteHistoryIndex(db, true));
    db->exec("PRAGMA user_version=" + std::to_string(SqliteHistoryIndex::SCHEMA_VERSION + 1) + ";");
    EXPECT_THROW(SqliteHistoryIndex(db, true), IndexError);
}

TEST(SqliteHistoryIndex, HugeLimitsReturnEverything) {
    auto db = std::make_shared<SqliteDatabase>(":memory:");
    SqliteBlobTable blobs(db);
    SqliteHistoryIndex index(db, true);
    for (int i = 1; i <= 3; ++i) {
        blobs.insert(BlobRecord{hashFor(i), 1, 1});
        HistoryRecord r;
        r.blobHash = hashFor(i);
        r.displayName = "r" + std::to_string(i);
        r.lastAccessed = i;
        index.insert(r);
    }
    EXPECT_EQ(index.recent(std::numeric_limits<size_t>::max()).size(), 3u);
    EXPECT_EQ(index.oldest(std::numeric_limits<size_t>::max()).size(), 3u);
}
