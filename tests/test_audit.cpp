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
};

TrackerConfig named(std::string actor = "alice") {
    TrackerConfig cfg;
    cfg.database_name = "app";
    cfg.actor = std::move(actor);
    return cfg;
}

std::size_t count_tag(const std::vector<DdlRecord>& recs, const std::string& tag) {
    std::size_t n = 0;
    for (const auto& r : recs) {
        if (r.command_tag == tag) ++n;
    }
    return n;
}

} // namespace

TEST_CASE("audit: create table logs start then end") {
    DB d;
    Tracker tr(d.db, named());
    const char* sql = "CREATE TABLE accounts (id INTEGER PRIMARY KEY, name TEXT NOT NULL)";
    tr.execute(sql);

    auto recs = tr.ddl_records();
    REQUIRE(recs.size() == 2);
    const auto& start = recs[0];
    const auto& end = recs[1];

    CHECK(start.phase == DdlPhase::Start);
    CHECK(start.command_tag == "CREATE TABLE");
    CHECK(start.object_type == "table");
    CHECK(start.schema_name == "main");
    CHECK(start.object_identity == "main.accounts");
    CHECK(start.username == "alice");
    CHECK(start.database == "app");
    CHECK(start.sql_text == sql);
    CHECK_FALSE(start.pre_definition.has_value());
    CHECK_FALSE(start.post_definition.has_value());

    CHECK(end.phase == DdlPhase::End);
    CHECK(end.id > start.id);
    CHECK(end.tx == start.tx);
    CHECK(end.post_definition == SchemaRenderer(d.db).render("accounts"));
}

TEST_CASE("audit: created tables get capture") {
    DB d;
    Tracker tr(d.db, named());
    tr.execute("CREATE TABLE accounts (id INTEGER PRIMARY KEY, name TEXT)");
    CHECK(tr.capture_installed("accounts"));

    tr.execute("CREATE TABLE loose (a, b)");
    CHECK_FALSE(tr.capture_installed("loose"));
    CHECK(tr.ddl_records().size() == 4);
}

TEST_CASE("audit: auto_install off leaves tables alone") {
    DB d;
    auto cfg = named();
    cfg.auto_install = false;
    Tracker tr(d.db, cfg);
    tr.execute("CREATE TABLE accounts (id INTEGER PRIMARY KEY, name TEXT)");
    CHECK_FALSE(tr.capture_installed("accounts"));
}

TEST_CASE("audit: view and index definitions") {
    DB d;
    Tracker tr(d.db, named());
    tr.execute("CREATE TABLE a (id INTEGER PRIMARY KEY, n TEXT)");
    auto last = tr.ddl_records().back().id;

    tr.execute("CREATE VIEW v AS SELECT id FROM a");
    tr.execute("CREATE INDEX a_n ON a (n)");
    auto recs = tr.ddl_records(last);
    REQUIRE(recs.size() == 4);
    CHECK(recs[0].command_tag == "CREATE VIEW");
    CHECK(recs[0].object_type == "view");
    CHECK_FALSE(recs[0].pre_definition.has_value());
    CHECK(recs[1].post_definition == "CREATE VIEW v AS SELECT id FROM a");
    CHECK(recs[3].command_tag == "CREATE INDEX");
    CHECK(recs[3].object_identity == "main.a_n");
    CHECK(recs[3].post_definition == "CREATE INDEX a_n ON a (n)");
}

TEST_CASE("audit: alter table records the issued text") {
    DB d;
    Tracker tr(d.db, named());
    tr.execute("CREATE TABLE accounts (id INTEGER PRIMARY KEY, name TEXT)");
    auto last = tr.ddl_records().back().id;

    const char* sql = "ALTER TABLE accounts ADD COLUMN note TEXT";
    tr.execute(sql);
    auto recs = tr.ddl_records(last);
    REQUIRE(recs.size() == 2);
    CHECK(recs[0].phase == DdlPhase::Start);
    CHECK(recs[0].command_tag == "ALTER TABLE");
    CHECK(recs[1].phase == DdlPhase::End);
    CHECK(recs[1].post_definition == sql);
    CHECK(tr.gap_count(AuditGap::AlterDefinition) == 1);

    // Capture follows the new shape.
    d.exec("INSERT INTO accounts VALUES (1, 'a', 'n')");
    auto changes = tr.changes();
    REQUIRE(changes.size() == 1);
    REQUIRE(changes[0].column("note"));
    CHECK(changes[0].column("note")->value.text == "n");
}

TEST_CASE("audit: drop column logs a table rewrite") {
    DB d;
    Tracker tr(d.db, named());
    tr.execute("CREATE TABLE w (id INTEGER PRIMARY KEY, a TEXT, b TEXT)");
    auto last = tr.ddl_records().back().id;

    tr.execute("ALTER TABLE w DROP COLUMN b");
    auto recs = tr.ddl_records(last);
    CHECK(count_tag(recs, "TABLE REWRITE") == 1);
    CHECK(count_tag(recs, "ALTER TABLE") == 2);
    CHECK(tr.capture_installed("w"));

    d.exec("INSERT INTO w VALUES (1, 'x')");
    CHECK(tr.changes().size() == 1);
}

TEST_CASE("audit: rename moves capture to the new name") {
    DB d;
    Tracker tr(d.db, named());
    tr.execute("CREATE TABLE old_name (id INTEGER PRIMARY KEY, v TEXT)");
    tr.execute("ALTER TABLE old_name RENAME TO new_name");

    CHECK(tr.capture_installed("new_name"));
    CHECK_FALSE(tr.capture_installed("old_name"));
    d.exec("INSERT INTO new_name VALUES (1, 'x')");
    auto changes = tr.changes();
    REQUIRE(changes.size() == 1);
    CHECK(changes[0].relation == "new_name");
}

TEST_CASE("audit: drop table logs a single end record") {
    DB d;
    Tracker tr(d.db, named());
    tr.execute("CREATE TABLE w (id INTEGER PRIMARY KEY)");
    auto last = tr.ddl_records().back().id;

    tr.execute("DROP TABLE w");
    auto recs = tr.ddl_records(last);
    REQUIRE(recs.size() == 1);
    CHECK(recs[0].phase == DdlPhase::End);
    CHECK(recs[0].command_tag == "DROP TABLE");
    CHECK(recs[0].object_identity == "main.w");
    CHECK(recs[0].sql_text == "DROP TABLE w");
    CHECK_FALSE(recs[0].pre_definition.has_value());
    CHECK_FALSE(recs[0].post_definition.has_value());
}

TEST_CASE("audit: non-table drops are not logged") {
    DB d;
    Tracker tr(d.db, named());
    tr.execute("CREATE TABLE a (id INTEGER PRIMARY KEY, n TEXT)");
    tr.execute("CREATE VIEW v AS SELECT id FROM a");
    tr.execute("CREATE INDEX a_n ON a (n)");
    auto last = tr.ddl_records().back().id;

    tr.execute("DROP VIEW v");
    tr.execute("DROP INDEX a_n");
    CHECK(tr.ddl_records(last).empty());
    CHECK(tr.gap_count(AuditGap::NonTableDrop) == 2);
}

TEST_CASE("audit: DDL outside execute is counted, not logged") {
    DB d;
    Tracker tr(d.db, named());
    d.exec("CREATE TABLE side (id INTEGER PRIMARY KEY)");
    CHECK(tr.ddl_records().empty());
    CHECK(tr.gap_count(AuditGap::UntrackedStatement) == 1);
    CHECK_FALSE(tr.capture_installed("side"));
}

TEST_CASE("audit: failed DDL leaves no records") {
    DB d;
    Tracker tr(d.db, named());
    tr.execute("CREATE TABLE a (id INTEGER PRIMARY KEY, n TEXT)");
    tr.execute("INSERT INTO a VALUES (1, 'dup'); INSERT INTO a VALUES (2, 'dup')");
    auto before = tr.ddl_records().size();
    auto changes = tr.changes().size();

    try {
        tr.execute("CREATE UNIQUE INDEX a_n ON a (n)");
        FAIL("expected failure");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::SqliteError);
    }
    CHECK(tr.ddl_records().size() == before);
    CHECK(tr.changes().size() == changes);
    CHECK(CatalogInspector(d.db).object_type("a_n").empty());
}

TEST_CASE("audit: created table missing from the catalog is a precondition failure") {
    DB d;
    Tracker tr(d.db, named());
    try {
        tr.execute("EXPLAIN CREATE TABLE ghost (id INTEGER PRIMARY KEY)");
        FAIL("expected PreconditionFailed");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::PreconditionFailed);
        CHECK(std::string(e.what()).find("main.ghost") != std::string::npos);
    }
    CHECK(tr.ddl_records().empty());
    CHECK(CatalogInspector(d.db).object_type("ghost").empty());
}

TEST_CASE("audit: IF NOT EXISTS on an existing object logs nothing") {
    DB d;
    Tracker tr(d.db, named());
    tr.execute("CREATE TABLE a (id INTEGER PRIMARY KEY)");
    auto before = tr.ddl_records().size();
    tr.execute("CREATE TABLE IF NOT EXISTS a (id INTEGER PRIMARY KEY)");
    CHECK(tr.ddl_records().size() == before);
}

TEST_CASE("audit: kinds outside the configured set are ignored") {
    DB d;
    auto cfg = named();
    cfg.audited_kinds = {"table"};
    Tracker tr(d.db, cfg);
    tr.execute("CREATE TABLE a (id INTEGER PRIMARY KEY)");
    auto before = tr.ddl_records().size();
    tr.execute("CREATE VIEW v AS SELECT id FROM a");
    CHECK(tr.ddl_records().size() == before);
    CHECK(tr.gap_count(AuditGap::UntrackedStatement) == 0);
}

TEST_CASE("audit: several statements in one call") {
    DB d;
    Tracker tr(d.db, named());
    tr.execute("CREATE TABLE a1 (id INTEGER PRIMARY KEY);"
               "CREATE INDEX a1_i ON a1 (id);"
               "INSERT INTO a1 VALUES (1);");
    auto recs = tr.ddl_records();
    REQUIRE(recs.size() == 4);
    CHECK(recs[3].post_definition == "CREATE INDEX a1_i ON a1 (id)");
    CHECK(recs[0].tx != recs[2].tx);
    CHECK(tr.changes().size() == 1);
}

TEST_CASE("audit: DDL inside an open transaction shares its id") {
    DB d;
    Tracker tr(d.db, named());
    d.exec("BEGIN");
    tr.execute("CREATE TABLE a (id INTEGER PRIMARY KEY)");
    d.exec("INSERT INTO a VALUES (1)");
    d.exec("COMMIT");

    auto ddl = tr.ddl_records();
    auto changes = tr.changes();
    REQUIRE(ddl.size() == 2);
    REQUIRE(changes.size() == 1);
    CHECK(ddl[0].tx == changes[0].tx);
}

TEST_CASE("audit: database name defaults to main for in-memory") {
    DB d;
    Tracker tr(d.db);
    CHECK(tr.database_name() == "main");
}
