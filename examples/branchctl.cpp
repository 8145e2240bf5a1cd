// Copyright 2026 The sqlbranch Authors
// SPDX-License-Identifier: Apache-2.0
#include <sqlbranch.h>

#include <spdlog/spdlog.h>

#include <sqlite3.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using namespace sqlbranch;

static void usage() {
    std::fprintf(stderr,
        "usage: branchctl [--config FILE] <command> [args]\n"
        "\n"
        "commands:\n"
        "  databases                      list tracked and untracked databases\n"
        "  branch <source> <target>       clone a database into a new branch\n"
        "  snapshot <source>              take a timestamped snapshot\n"
        "  snapshots [source]             list snapshots\n"
        "  restore <database> <snapshot>  replace a database with a snapshot\n"
        "  delete-snapshot <snapshot>     remove a snapshot\n"
        "  operations                     list branch operations\n"
        "  digest <database> <table> [batch]\n"
        "                                 content digest of a table\n"
        "\n"
        "The configuration file defaults to $SQLBRANCH_CONFIG.\n");
}

// RAII wrapper for a connection opened by this tool.
class Connection {
public:
    explicit Connection(const std::string& path) {
        int rc = sqlite3_open_v2(path.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
            sqlite3_close(db_);
            throw Error(ErrorCode::SqliteError, "open " + path + ": " + msg);
        }
        sqlite3_busy_timeout(db_, 5000);
    }
    ~Connection() { sqlite3_close(db_); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    sqlite3* get() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

static void print_databases(const std::vector<TrackedDatabase>& dbs) {
    std::printf("%-32s %-10s %-8s %s\n", "NAME", "ORIGIN", "PARENT", "PATH");
    for (const auto& db : dbs) {
        std::string parent = db.parent ? std::to_string(*db.parent) : "-";
        std::printf("%-32s %-10s %-8s %s%s\n", db.name.c_str(), db.origin.c_str(),
                    parent.c_str(), db.path.c_str(),
                    db.storage_present ? "" : " (missing)");
    }
}

static int report(const BranchOperation& op) {
    std::printf("operation %lld: %s %s %s\n", static_cast<long long>(op.id),
                std::string(kind_name(op.kind)).c_str(), op.database_name.c_str(),
                std::string(status_name(op.status)).c_str());
    if (op.status != OperationStatus::Succeeded) {
        std::fprintf(stderr, "error: %s\n", op.error.value_or("unknown").c_str());
        return 1;
    }
    return 0;
}

static int run(const Config& cfg, const std::vector<std::string>& args) {
    const auto& cmd = args[0];
    auto need = [&](std::size_t n) {
        if (args.size() < n + 1) {
            throw Error(ErrorCode::InvalidState, cmd + ": expected " + std::to_string(n) +
                                                 " argument(s)");
        }
    };

    Connection registry(cfg.registry_path().string());
    Orchestrator orch(registry.get(), cfg.orchestrator);

    if (cmd == "databases") {
        print_databases(orch.list_databases());
        return 0;
    }
    if (cmd == "branch") {
        need(2);
        return report(orch.branch(args[1], args[2]));
    }
    if (cmd == "snapshot") {
        need(1);
        return report(orch.snapshot(args[1]));
    }
    if (cmd == "snapshots") {
        print_databases(orch.list_snapshots(args.size() > 1 ? args[1] : std::string()));
        return 0;
    }
    if (cmd == "restore") {
        need(2);
        return report(orch.restore(args[1], args[2]));
    }
    if (cmd == "delete-snapshot") {
        need(1);
        return report(orch.delete_snapshot(args[1]));
    }
    if (cmd == "operations") {
        for (const auto& op : orch.operations()) {
            std::printf("%-6lld %-16s %-32s %-10s %-24s %s\n",
                        static_cast<long long>(op.id),
                        std::string(kind_name(op.kind)).c_str(), op.database_name.c_str(),
                        std::string(status_name(op.status)).c_str(),
                        std::string(step_name(op.step)).c_str(),
                        op.error.value_or("").c_str());
        }
        return 0;
    }
    if (cmd == "digest") {
        need(2);
        int batch = args.size() > 3 ? std::atoi(args[3].c_str()) : 1000;
        std::printf("%s\n", orch.digest(args[1], args[2], batch).c_str());
        return 0;
    }

    usage();
    return 1;
}

int main(int argc, char** argv) {
    std::string config_path;
    if (const char* env = std::getenv("SQLBRANCH_CONFIG")) config_path = env;

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            usage();
            return 0;
        } else {
            args.emplace_back(argv[i]);
        }
    }
    if (args.empty() || config_path.empty()) {
        usage();
        return 1;
    }

    try {
        auto cfg = load_config(config_path);
        init_logging(cfg.logging);
        return run(cfg, args);
    } catch (const Error& e) {
        SPDLOG_ERROR("{}", e.what());
        std::fprintf(stderr, "branchctl: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "branchctl: %s\n", e.what());
        return 1;
    }
}
