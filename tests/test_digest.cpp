// Copyright 2026 The sqlbranch Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <sqlbranch.h>

#include <sqlite3.h>

#include <string>

using namespace sqlbranch;

namespace {

struct DB {
    sqlite3* db = nullptr;
    DB() { sqlite3_open(":memory:", &db); }
    ~DB() { if (db) sqlite3_close(db); }
    void exec(const char* sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "error";
            sqlite3_free(err);
            throw std::runtime_error(msg);
        }
    }
    std::string text(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(sqlite3_errmsg(db));
        }
        std::string out;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            auto* t = sqlite3_column_text(stmt, 0);
            out = t ? reinterpret_cast<const char*>(t) : "";
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_ROW) throw std::runtime_error(sqlite3_errmsg(db));
        return out;
    }
};

void fill(DB& d) {
    d.exec("CREATE TABLE t (a TEXT, b INTEGER, v, PRIMARY KEY (a, b))");
    d.exec("INSERT INTO t VALUES ('x', 1, 1.5), ('x', 2, NULL), ('y', 1, x'00'),"
           "  ('y', 2, 'text'), ('z', 9, 42)");
}

} // namespace

TEST_CASE("digest: independent of batch size") {
    DB d;
    fill(d);
    RowDigester dg;
    auto whole = dg.digest(d.db, "t", 100);
    CHECK(whole.size() == 16);
    CHECK(dg.digest(d.db, "t", 1) == whole);
    CHECK(dg.digest(d.db, "t", 2) == whole);
    CHECK(dg.digest(d.db, "t", 5) == whole);
}

TEST_CASE("digest: equal content gives equal digests") {
    DB a, b;
    fill(a);
    fill(b);
    RowDigester dg;
    CHECK(dg.digest(a.db, "t", 3) == dg.digest(b.db, "t", 3));

    b.exec("UPDATE t SET v = 1.25 WHERE a = 'x' AND b = 1");
    CHECK(dg.digest(a.db, "t", 3) != dg.digest(b.db, "t", 3));
}

TEST_CASE("digest: storage class is part of the digest") {
    DB a, b;
    a.exec("CREATE TABLE t (id INTEGER PRIMARY KEY, v)");
    b.exec("CREATE TABLE t (id INTEGER PRIMARY KEY, v)");
    a.exec("INSERT INTO t VALUES (1, 1)");
    b.exec("INSERT INTO t VALUES (1, '1')");
    RowDigester dg;
    CHECK(dg.digest(a.db, "t", 10) != dg.digest(b.db, "t", 10));
}

TEST_CASE("digest: refuses unfit input") {
    DB d;
    d.exec("CREATE TABLE nopk (x)");
    d.exec("CREATE TABLE t (id INTEGER PRIMARY KEY)");
    RowDigester dg;
    try {
        dg.digest(d.db, "nopk", 10);
        FAIL("expected PreconditionFailed");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::PreconditionFailed);
    }
    CHECK_THROWS_AS(dg.digest(d.db, "t", 0), Error);
    CHECK_THROWS_AS(dg.digest(d.db, "missing", 10), Error);
}

TEST_CASE("digest: SQL function matches the digester") {
    DB d;
    fill(d);
    RowDigester dg;
    register_digest_function(d.db, dg);
    CHECK(d.text("SELECT sqlbranch_digest('t', 2)") == dg.digest(d.db, "t", 2));
    CHECK_THROWS(d.text("SELECT sqlbranch_digest('missing', 2)"));
}

TEST_CASE("digest: SQL function is refused in index expressions") {
    DB d;
    fill(d);
    RowDigester dg;
    register_digest_function(d.db, dg);
    CHECK_THROWS(d.exec("CREATE INDEX bad ON t (sqlbranch_digest('t', 1))"));
    CHECK(d.text("SELECT count(*) FROM sqlite_schema WHERE name = 'bad'") == "0");
}
