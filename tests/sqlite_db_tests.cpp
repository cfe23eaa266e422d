#include "gtest/gtest.h"
#include "utilities/errors.h"
#include "utilities/sqlite_db.hpp"
#include "test_helpers.h"

using namespace mailcas;
using mailcas::test::TempDir;

TEST(SqliteDatabase, ExecAndStatements) {
    SqliteDatabase db(":memory:");
    db.exec("CREATE TABLE kv (k TEXT PRIMARY KEY, v INTEGER, note TEXT)");

    Statement insert(db, "INSERT INTO kv (k, v, note) VALUES (?, ?, ?)");
    insert.bind(1, std::string("a")).bind(2, int64_t{1}).bind(3, std::optional<std::string>{});
    insert.run();
    EXPECT_EQ(db.changes(), 1);
    EXPECT_EQ(db.lastInsertRowId(), 1);

    insert.reset();
    insert.bind(1, std::string("b")).bind(2, int64_t{2}).bind(3, std::optional<std::string>("n"));
    insert.run();

    Statement select(db, "SELECT k, v, note FROM kv ORDER BY k");
    ASSERT_TRUE(select.step());
    EXPECT_EQ(select.columnText(0), "a");
    EXPECT_EQ(select.columnInt64(1), 1);
    EXPECT_FALSE(select.columnOptionalText(2).has_value());
    ASSERT_TRUE(select.step());
    EXPECT_EQ(select.columnOptionalText(2), std::optional<std::string>("n"));
    EXPECT_FALSE(select.step());
}

TEST(SqliteDatabase, ErrorsBecomeIndexError) {
    SqliteDatabase db(":memory:");
    EXPECT_THROW(db.exec("SELEKT 1"), IndexError);
    EXPECT_THROW(Statement(db, "SELECT * FROM missing_table"), IndexError);

    db.exec("CREATE TABLE t (x INTEGER UNIQUE)");
    db.exec("INSERT INTO t VALUES (1)");
    Statement dup(db, "INSERT INTO t VALUES (1)");
    try {
        dup.run();
        FAIL() << "duplicate insert should throw";
    } catch (const IndexError &e) {
        EXPECT_NE(e.code(), 0);
    }
}

TEST(SqliteDatabase, TransactionRollsBackUnlessCommitted) {
    SqliteDatabase db(":memory:");
    db.exec("CREATE TABLE t (x INTEGER)");
    {
        SqliteDatabase::Transaction tx(db);
        db.exec("INSERT INTO t VALUES (1)");
    }
    {
        SqliteDatabase::Transaction tx(db);
        db.exec("INSERT INTO t VALUES (2)");
        tx.commit();
    }
    Statement count(db, "SELECT COUNT(*), MAX(x) FROM t");
    ASSERT_TRUE(count.step());
    EXPECT_EQ(count.columnInt64(0), 1);
    EXPECT_EQ(count.columnInt64(1), 2);
}

TEST(SqliteDatabase, PersistsToFile) {
    TempDir dir{"mailcas_sqlite"};
    const std::string path = dir.sub("index.db");
    {
        SqliteDatabase db(path);
        db.exec("CREATE TABLE t (x INTEGER); INSERT INTO t VALUES (42);");
    }
    SqliteDatabase reopened(path);
    EXPECT_EQ(reopened.path(), path);
    Statement st(reopened, "SELECT x FROM t");
    ASSERT_TRUE(st.step());
    EXPECT_EQ(st.columnInt64(0), 42);
}
