// Copyright 2026 The sqlbranch Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <sqlbranch.h>

#include <sqlite3.h>

#include <algorithm>

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
};

const ConstraintDescriptor* find_constraint(const TableDescriptor& t, const std::string& name) {
    for (const auto& c : t.constraints) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

} // namespace

TEST_CASE("catalog: describe reports columns in order") {
    DB d;
    d.exec("CREATE TABLE accounts ("
           "  id INTEGER PRIMARY KEY,"
           "  name TEXT NOT NULL COLLATE NOCASE,"
           "  balance NUMERIC(10,2) DEFAULT 0)");
    CatalogInspector cat(d.db);
    auto t = cat.describe("accounts");

    CHECK(t.schema == "main");
    CHECK(t.name == "accounts");
    REQUIRE(t.columns.size() == 3);
    CHECK(t.columns[0].name == "id");
    CHECK(t.columns[0].pk_position == 1);
    CHECK(t.columns[0].identity == IdentityMode::ByDefault);
    CHECK(t.columns[1].not_null);
    CHECK(t.columns[1].collation == "NOCASE");
    CHECK(t.columns[2].type == TypeDescriptor{"NUMERIC", "(10,2)"});
    CHECK(t.columns[2].default_expr == "0");
    CHECK_FALSE(t.columns[2].collation.has_value());
    CHECK(t.primary_key == std::vector<std::string>{"id"});
}

TEST_CASE("catalog: missing relation is NotFound") {
    DB d;
    CatalogInspector cat(d.db);
    try {
        cat.describe("nope");
        FAIL("expected NotFound");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::NotFound);
    }
    CHECK_FALSE(cat.exists("nope"));
    CHECK(cat.object_type("nope").empty());
}

TEST_CASE("catalog: composite key keeps declared order") {
    DB d;
    d.exec("CREATE TABLE pairs (a TEXT, b TEXT, v INTEGER, PRIMARY KEY (b, a))");
    auto t = CatalogInspector(d.db).describe("pairs");
    CHECK(t.primary_key == std::vector<std::string>{"b", "a"});
    for (const auto& c : t.columns) CHECK(c.identity == IdentityMode::None);
}

TEST_CASE("catalog: autoincrement is an always identity") {
    DB d;
    d.exec("CREATE TABLE events (id INTEGER PRIMARY KEY AUTOINCREMENT, kind TEXT)");
    auto t = CatalogInspector(d.db).describe("events");
    CHECK(t.columns[0].identity == IdentityMode::Always);
    CHECK(t.columns[1].identity == IdentityMode::None);
}

TEST_CASE("catalog: constraints get declared or derived names") {
    DB d;
    d.exec("CREATE TABLE parent (id INTEGER PRIMARY KEY)");
    d.exec("CREATE TABLE child ("
           "  id INTEGER PRIMARY KEY,"
           "  parent_id INTEGER REFERENCES parent (id) ON DELETE CASCADE,"
           "  code TEXT UNIQUE,"
           "  qty INTEGER CHECK (qty > 0),"
           "  CONSTRAINT child_sane CHECK (code <> ''))");
    auto t = CatalogInspector(d.db).describe("child");

    auto* pk = find_constraint(t, "child_pkey");
    REQUIRE(pk);
    CHECK(pk->kind == ConstraintKind::PrimaryKey);
    CHECK(pk->definition == "PRIMARY KEY (\"id\")");

    auto* fk = find_constraint(t, "child_parent_id_fkey");
    REQUIRE(fk);
    CHECK(fk->definition == "FOREIGN KEY (\"parent_id\") REFERENCES \"parent\" (\"id\") ON DELETE CASCADE");

    auto* uq = find_constraint(t, "child_code_key");
    REQUIRE(uq);
    CHECK(uq->kind == ConstraintKind::Unique);
    CHECK(uq->definition == "UNIQUE (\"code\")");
    CHECK_FALSE(uq->index_name.empty());

    auto* qty = find_constraint(t, "child_qty_check");
    REQUIRE(qty);
    CHECK(qty->definition == "CHECK (qty > 0)");

    auto* sane = find_constraint(t, "child_sane");
    REQUIRE(sane);
    CHECK(sane->definition == "CHECK (code <> '')");
}

TEST_CASE("catalog: generated columns carry their expression") {
    DB d;
    d.exec("CREATE TABLE g (id INTEGER PRIMARY KEY, a INT,"
           "  b INT GENERATED ALWAYS AS (a * 2) STORED,"
           "  c INT AS (a + 1))");
    auto t = CatalogInspector(d.db).describe("g");
    CHECK(t.column("b")->generated == GeneratedKind::Stored);
    CHECK(t.column("b")->generated_expr == "a * 2");
    CHECK(t.column("c")->generated == GeneratedKind::Virtual);
    CHECK(t.column("c")->generated_expr == "a + 1");

    auto stored = t.stored_columns();
    REQUIRE(stored.size() == 2);
    CHECK(stored[0]->name == "id");
    CHECK(stored[1]->name == "a");
}

TEST_CASE("catalog: table options") {
    DB d;
    d.exec("CREATE TABLE kv (k TEXT PRIMARY KEY, v BLOB) WITHOUT ROWID, STRICT");
    auto t = CatalogInspector(d.db).describe("kv");
    CHECK(t.without_rowid);
    CHECK(t.strict);
}

TEST_CASE("catalog: list_tables skips internal and bookkeeping tables") {
    DB d;
    d.exec("CREATE TABLE b (id INTEGER PRIMARY KEY AUTOINCREMENT)");
    d.exec("CREATE TABLE a (id INTEGER PRIMARY KEY)");
    d.exec("CREATE TABLE _sqlbranch_private (x)");
    d.exec("CREATE VIEW v AS SELECT id FROM a");
    auto tables = CatalogInspector(d.db).list_tables();
    CHECK(tables == std::vector<std::string>{"a", "b"});
    CHECK(is_bookkeeping("_SQLBRANCH_private"));
    CHECK_FALSE(is_bookkeeping("sqlbranch"));
}

TEST_CASE("catalog: object type and definition") {
    DB d;
    d.exec("CREATE TABLE a (id INTEGER PRIMARY KEY, n TEXT)");
    d.exec("CREATE VIEW v AS SELECT id FROM a");
    d.exec("CREATE INDEX a_n ON a (n)");
    CatalogInspector cat(d.db);
    CHECK(cat.object_type("a") == "table");
    CHECK(cat.object_type("v") == "view");
    CHECK(cat.object_type("a_n") == "index");
    CHECK(cat.object_definition("v") == "CREATE VIEW v AS SELECT id FROM a");
    CHECK(cat.object_definition("a_n") == "CREATE INDEX a_n ON a (n)");
}

TEST_CASE("catalog: fingerprint follows shape") {
    DB d;
    d.exec("CREATE TABLE a (id INTEGER PRIMARY KEY, n TEXT)");
    CatalogInspector cat(d.db);
    auto before = cat.describe("a").fingerprint;
    CHECK(cat.describe("a").fingerprint == before);

    auto version = cat.schema_version();
    d.exec("ALTER TABLE a ADD COLUMN extra TEXT");
    CHECK(cat.describe("a").fingerprint != before);
    CHECK(cat.schema_version() > version);
}
