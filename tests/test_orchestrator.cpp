// Copyright 2026 The sqlbranch Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <sqlbranch.h>

#include <sqlite3.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace sqlbranch;
namespace fs = std::filesystem;

namespace {

struct DB {
    sqlite3* db = nullptr;
    explicit DB(const std::string& path = ":memory:") {
        if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
            throw std::runtime_error("cannot open " + path);
        }
    }
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
    int count(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        int n = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : -1;
        sqlite3_finalize(stmt);
        return n;
    }
};

struct TempDir {
    fs::path path;
    TempDir() {
        std::string tmpl = (fs::temp_directory_path() / "sqlbranch_test_XXXXXX").string();
        if (!::mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp failed");
        path = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

// Storage root with one source database "app" holding two accounts.
struct Env {
    TempDir dir;
    DB registry;
    OrchestratorConfig config;

    Env() {
        config.storage_root = dir.path;
        config.tracker.actor = "tester";
        DB app((dir.path / "app.db").string());
        app.exec("CREATE TABLE accounts (id INTEGER PRIMARY KEY, name TEXT)");
        app.exec("INSERT INTO accounts VALUES (1, 'a'), (2, 'b')");
        app.exec("CREATE TABLE loose (x)");
    }

    Orchestrator orchestrator(std::shared_ptr<StorageCloner> cloner = nullptr,
                              std::shared_ptr<OwnershipFixer> fixer = nullptr) {
        return Orchestrator(registry.db, config, std::move(cloner), std::move(fixer));
    }
};

bool has_capture(const fs::path& path, const char* table) {
    DB d(path.string());
    std::string sql = "SELECT count(*) FROM sqlite_schema WHERE type = 'trigger' AND tbl_name = '";
    sql += table;
    sql += "' AND name LIKE '\\_sqlbranch\\_capture\\_%' ESCAPE '\\'";
    return d.count(sql.c_str()) == 3;
}

class FailingCloner : public StorageCloner {
public:
    void clone(const fs::path&, const fs::path& target, const CancelToken&) override {
        std::ofstream(target) << "partial";
        throw Error(ErrorCode::CloneFailed, "disk full");
    }
};

// Copies, then has the cancellation arrive before the step completes.
class CancellingCloner : public StorageCloner {
public:
    explicit CancellingCloner(CancelToken& token) : token_(token) {}
    void clone(const fs::path& source, const fs::path& target, const CancelToken& cancel) override {
        FileCloner().clone(source, target, cancel);
        token_.cancel();
    }

private:
    CancelToken& token_;
};

class FailingFixer : public OwnershipFixer {
public:
    void fix(const fs::path&) override {
        throw Error(ErrorCode::CloneFailed, "chown refused");
    }
};

template <typename F>
ErrorCode error_of(F&& f) {
    try {
        f();
    } catch (const Error& e) {
        return e.code();
    }
    return ErrorCode::Ok;
}

} // namespace

TEST_CASE("orchestrator: branch clones and records lineage") {
    Env env;
    auto orch = env.orchestrator();

    auto op = orch.branch("app", "dev");
    CHECK(op.status == OperationStatus::Succeeded);
    CHECK(op.step == BranchStep::Succeeded);
    CHECK(op.kind == OperationKind::Branch);
    CHECK_FALSE(op.error.has_value());
    CHECK(op.started_at.has_value());
    CHECK(op.finished_at.has_value());
    REQUIRE(op.new_id.has_value());
    REQUIRE(op.source_id.has_value());

    auto dbs = orch.list_databases();
    REQUIRE(dbs.size() == 2);
    CHECK(dbs[0].name == "app");
    CHECK(dbs[0].origin == "source");
    CHECK_FALSE(dbs[0].parent.has_value());
    CHECK(dbs[1].name == "dev");
    CHECK(dbs[1].origin == "branch");
    CHECK(dbs[1].id == *op.new_id);
    CHECK(dbs[1].parent == op.source_id);
    CHECK(dbs[1].storage_present);

    auto dev = orch.path_for("dev");
    CHECK(fs::exists(dev));
    CHECK(has_capture(env.dir.path / "app.db", "accounts"));
    CHECK(has_capture(dev, "accounts"));
    CHECK_FALSE(has_capture(dev, "loose"));
    CHECK(DB(dev.string()).count("SELECT count(*) FROM accounts") == 2);
}

TEST_CASE("orchestrator: clone is independently writable") {
    Env env;
    auto orch = env.orchestrator();
    REQUIRE(orch.branch("app", "dev").status == OperationStatus::Succeeded);

    {
        DB dev(orch.path_for("dev").string());
        Tracker tr(dev.db);
        dev.exec("INSERT INTO accounts VALUES (3, 'c')");
        CHECK(tr.changes().size() == 1);
        CHECK(tr.database_name() == "dev");
    }
    DB app((env.dir.path / "app.db").string());
    CHECK(app.count("SELECT count(*) FROM accounts") == 2);
}

TEST_CASE("orchestrator: unknown source is NotFound and records nothing") {
    Env env;
    auto orch = env.orchestrator();
    CHECK(error_of([&] { orch.branch("ghost", "dev"); }) == ErrorCode::NotFound);
    CHECK(orch.operations().empty());
}

TEST_CASE("orchestrator: taken or invalid target names are refused") {
    Env env;
    auto orch = env.orchestrator();
    REQUIRE(orch.branch("app", "dev").status == OperationStatus::Succeeded);
    auto ops = orch.operations().size();

    CHECK(error_of([&] { orch.branch("app", "dev"); }) == ErrorCode::InvalidState);
    CHECK(error_of([&] { orch.branch("app", "../evil"); }) == ErrorCode::InvalidState);
    CHECK(error_of([&] { orch.branch("app", "_sqlbranch_x"); }) == ErrorCode::InvalidState);
    CHECK(orch.operations().size() == ops);
}

TEST_CASE("orchestrator: clone failure leaves no dangling row") {
    Env env;
    auto orch = env.orchestrator(std::make_shared<FailingCloner>());

    auto op = orch.branch("app", "dev");
    CHECK(op.status == OperationStatus::Failed);
    CHECK(op.step == BranchStep::Failed);
    REQUIRE(op.error.has_value());
    CHECK(op.error->rfind("cloning: ", 0) == 0);
    CHECK(op.error->find("disk full") != std::string::npos);
    CHECK_FALSE(op.new_id.has_value());
    CHECK(op.finished_at.has_value());

    CHECK_FALSE(fs::exists(orch.path_for("dev")));
    for (const auto& db : orch.list_databases()) {
        CHECK(db.name != "dev");
        CHECK(db.storage_present);
    }
}

TEST_CASE("orchestrator: cancellation before cloning") {
    Env env;
    auto orch = env.orchestrator();
    CancelToken token;
    token.cancel();

    auto op = orch.branch("app", "dev", token);
    CHECK(op.status == OperationStatus::Failed);
    REQUIRE(op.error.has_value());
    CHECK(op.error->find("cancelled") != std::string::npos);
    CHECK_FALSE(fs::exists(orch.path_for("dev")));
}

TEST_CASE("orchestrator: cancellation during cloning removes the copy") {
    Env env;
    CancelToken token;
    auto orch = env.orchestrator(std::make_shared<CancellingCloner>(token));

    auto op = orch.branch("app", "dev", token);
    CHECK(op.status == OperationStatus::Failed);
    REQUIRE(op.error.has_value());
    CHECK(op.error->rfind("cloning: ", 0) == 0);
    CHECK_FALSE(fs::exists(orch.path_for("dev")));
    CHECK(orch.list_databases().size() == 1);
}

TEST_CASE("orchestrator: ownership failure is recorded at its step") {
    Env env;
    auto orch = env.orchestrator(nullptr, std::make_shared<FailingFixer>());

    auto op = orch.branch("app", "dev");
    CHECK(op.status == OperationStatus::Failed);
    REQUIRE(op.error.has_value());
    CHECK(op.error->rfind("fixing_ownership: ", 0) == 0);
}

TEST_CASE("orchestrator: unknown owner fails the fixer") {
    TempDir dir;
    auto file = dir.path / "f.db";
    std::ofstream(file) << "x";

    PosixOwnershipFixer none(std::nullopt);
    none.fix(file);

    PosixOwnershipFixer bogus(OwnerConfig{"sqlbranch_no_such_user", ""});
    CHECK(error_of([&] { bogus.fix(file); }) == ErrorCode::CloneFailed);
}

TEST_CASE("orchestrator: snapshots are named after source and time") {
    Env env;
    auto orch = env.orchestrator();

    auto first = orch.snapshot("app");
    auto second = orch.snapshot("app");
    REQUIRE(first.status == OperationStatus::Succeeded);
    REQUIRE(second.status == OperationStatus::Succeeded);
    CHECK(first.kind == OperationKind::Snapshot);
    CHECK(first.database_name.rfind("snapshot_app_", 0) == 0);
    CHECK(first.database_name.size() >= std::string("snapshot_app_YYYYmmdd_HHMMSS").size());
    CHECK(first.database_name != second.database_name);

    auto snaps = orch.list_snapshots("app");
    REQUIRE(snaps.size() == 2);
    CHECK(snaps[0].origin == "snapshot");
    CHECK(orch.list_snapshots().size() == 2);
    CHECK(error_of([&] { orch.list_snapshots("ghost"); }) == ErrorCode::NotFound);
}

TEST_CASE("orchestrator: restore brings back snapshot contents") {
    Env env;
    auto orch = env.orchestrator();
    auto snap = orch.snapshot("app");
    REQUIRE(snap.status == OperationStatus::Succeeded);

    auto app_path = env.dir.path / "app.db";
    {
        DB app(app_path.string());
        Tracker tr(app.db);
        app.exec("INSERT INTO accounts VALUES (3, 'c')");
        app.exec("DELETE FROM accounts WHERE id = 1");
    }

    auto op = orch.restore("app", snap.database_name);
    CHECK(op.status == OperationStatus::Succeeded);
    CHECK(op.kind == OperationKind::Restore);

    DB app(app_path.string());
    CHECK(app.count("SELECT count(*) FROM accounts") == 2);
    CHECK(app.count("SELECT count(*) FROM accounts WHERE id = 1") == 1);
    CHECK(has_capture(app_path, "accounts"));
    CHECK_FALSE(fs::exists(env.dir.path / ".app.restore"));
}

TEST_CASE("orchestrator: restore only from own snapshots") {
    Env env;
    auto orch = env.orchestrator();
    REQUIRE(orch.branch("app", "dev").status == OperationStatus::Succeeded);
    auto snap = orch.snapshot("app");

    CHECK(error_of([&] { orch.restore("app", "dev"); }) == ErrorCode::InvalidState);
    CHECK(error_of([&] { orch.restore("dev", snap.database_name); }) == ErrorCode::InvalidState);
    CHECK(error_of([&] { orch.restore("app", "nope"); }) == ErrorCode::NotFound);
}

TEST_CASE("orchestrator: delete_snapshot removes storage and row") {
    Env env;
    auto orch = env.orchestrator();
    auto snap = orch.snapshot("app");
    REQUIRE(snap.status == OperationStatus::Succeeded);
    auto path = orch.path_for(snap.database_name);
    REQUIRE(fs::exists(path));

    auto op = orch.delete_snapshot(snap.database_name);
    CHECK(op.status == OperationStatus::Succeeded);
    CHECK(op.kind == OperationKind::DeleteSnapshot);
    CHECK_FALSE(fs::exists(path));
    CHECK(orch.list_snapshots("app").empty());
}

TEST_CASE("orchestrator: delete_snapshot refuses while branches depend on it") {
    Env env;
    auto orch = env.orchestrator();
    auto snap = orch.snapshot("app");
    REQUIRE(orch.branch(snap.database_name, "from_snap").status == OperationStatus::Succeeded);

    auto op = orch.delete_snapshot(snap.database_name);
    CHECK(op.status == OperationStatus::Failed);
    REQUIRE(op.error.has_value());
    CHECK(op.error->find("dependent") != std::string::npos);
    CHECK(orch.list_snapshots("app").size() == 1);
    CHECK(fs::exists(orch.path_for(snap.database_name)));

    CHECK(error_of([&] { orch.delete_snapshot("app"); }) == ErrorCode::InvalidState);
}

TEST_CASE("orchestrator: list_databases shows untracked and missing storage") {
    Env env;
    auto orch = env.orchestrator();
    REQUIRE(orch.branch("app", "dev").status == OperationStatus::Succeeded);
    {
        DB loose((env.dir.path / "loose.db").string());
        loose.exec("CREATE TABLE x (a)");
    }
    fs::remove(orch.path_for("dev"));

    auto dbs = orch.list_databases();
    REQUIRE(dbs.size() == 3);
    CHECK(dbs[1].name == "dev");
    CHECK_FALSE(dbs[1].storage_present);
    CHECK(dbs[2].name == "loose");
    CHECK(dbs[2].origin == "untracked");
    CHECK(dbs[2].id == 0);
}

TEST_CASE("orchestrator: digest reads without creating storage") {
    Env env;
    auto orch = env.orchestrator();

    std::string expected;
    {
        DB app((env.dir.path / "app.db").string());
        expected = RowDigester().digest(app.db, "accounts", 1000);
    }
    CHECK(orch.digest("app", "accounts") == expected);
    CHECK(orch.digest("app", "accounts", 1) == expected);

    CHECK(error_of([&] { orch.digest("typo", "accounts"); }) == ErrorCode::NotFound);
    CHECK_FALSE(fs::exists(orch.path_for("typo")));
    CHECK(error_of([&] { orch.digest("app", "missing"); }) == ErrorCode::NotFound);

    auto dbs = orch.list_databases();
    REQUIRE(dbs.size() == 1);
    CHECK(dbs[0].name == "app");
}

TEST_CASE("orchestrator: every attempt is an operation") {
    Env env;
    auto orch = env.orchestrator();
    auto ok = orch.branch("app", "dev");
    auto snap = orch.snapshot("dev");
    auto ops = orch.operations();
    REQUIRE(ops.size() == 2);
    CHECK(ops[0].id == ok.id);
    CHECK(ops[1].id == snap.id);
    CHECK(orch.operation(snap.id)->database_name == snap.database_name);
    CHECK_FALSE(orch.operation(9999).has_value());
}

TEST_CASE("orchestrator: storage_root is required") {
    DB registry;
    CHECK(error_of([&] { Orchestrator(registry.db, OrchestratorConfig{}); }) ==
          ErrorCode::ConfigError);
}
