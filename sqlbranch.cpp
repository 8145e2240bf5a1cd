// Copyright 2026 The sqlbranch Authors
// SPDX-License-Identifier: Apache-2.0
#include "sqlbranch.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <grp.h>
#include <linux/fs.h>
#include <map>
#include <nlohmann/json.hpp>
#include <pwd.h>
#include <set>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <tuple>
#include <unistd.h>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

// ── sqlite_util.h ───────────────────────────────────────────────
namespace sqlbranch::detail {

/// RAII wrapper for sqlite3_stmt*.
class StmtGuard {
public:
    StmtGuard() = default;
    explicit StmtGuard(sqlite3_stmt* s) : stmt_(s) {}
    ~StmtGuard() { if (stmt_) sqlite3_finalize(stmt_); }

    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
    StmtGuard(StmtGuard&& o) noexcept : stmt_(o.stmt_) { o.stmt_ = nullptr; }
    StmtGuard& operator=(StmtGuard&& o) noexcept {
        if (this != &o) {
            if (stmt_) sqlite3_finalize(stmt_);
            stmt_ = o.stmt_;
            o.stmt_ = nullptr;
        }
        return *this;
    }

    sqlite3_stmt* get() const { return stmt_; }

    void reset() {
        if (stmt_) sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/// RAII wrapper for a sqlite3* the library opened itself.
class DbGuard {
public:
    DbGuard() = default;
    explicit DbGuard(sqlite3* db) : db_(db) {}
    ~DbGuard() { if (db_) sqlite3_close_v2(db_); }

    DbGuard(const DbGuard&) = delete;
    DbGuard& operator=(const DbGuard&) = delete;
    DbGuard(DbGuard&& o) noexcept : db_(o.db_) { o.db_ = nullptr; }
    DbGuard& operator=(DbGuard&& o) noexcept {
        if (this != &o) {
            if (db_) sqlite3_close_v2(db_);
            db_ = o.db_;
            o.db_ = nullptr;
        }
        return *this;
    }

    sqlite3* get() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

/// Execute SQL or throw.
inline void exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw Error(ErrorCode::SqliteError, msg);
    }
}

/// Prepare a statement or throw.
inline StmtGuard prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()),
                                &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
    return StmtGuard(stmt);
}

/// Step a statement expecting SQLITE_DONE, or throw.
inline void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
}

/// Step a statement: true on a row, false when done, throw otherwise.
inline bool step_row(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
}

inline void bind_text(sqlite3_stmt* stmt, int idx, std::string_view text) {
    sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()),
                      SQLITE_TRANSIENT);
}

inline void bind_optional(sqlite3_stmt* stmt, int idx,
                          const std::optional<std::string>& text) {
    if (text) bind_text(stmt, idx, *text);
    else sqlite3_bind_null(stmt, idx);
}

inline void bind_optional(sqlite3_stmt* stmt, int idx,
                          const std::optional<std::int64_t>& v) {
    if (v) sqlite3_bind_int64(stmt, idx, *v);
    else sqlite3_bind_null(stmt, idx);
}

inline void bind_value(sqlite3_stmt* stmt, int idx, const Value& v) {
    std::visit([&](const auto& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            sqlite3_bind_null(stmt, idx);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            sqlite3_bind_int64(stmt, idx, val);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, idx, val);
        } else if constexpr (std::is_same_v<T, std::string>) {
            bind_text(stmt, idx, val);
        } else {
            sqlite3_bind_blob(stmt, idx, val.data(),
                              static_cast<int>(val.size()), SQLITE_TRANSIENT);
        }
    }, v);
}

inline std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    if (!p) return {};
    return std::string(p, static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
}

inline std::optional<std::string> column_optional(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

inline std::optional<std::int64_t> column_optional_int(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt, col);
}

/// Convert a sqlite3_value* to our Value type.
inline Value to_value(sqlite3_value* v) {
    switch (sqlite3_value_type(v)) {
    case SQLITE_INTEGER:
        return sqlite3_value_int64(v);
    case SQLITE_FLOAT:
        return sqlite3_value_double(v);
    case SQLITE_TEXT: {
        auto* p = reinterpret_cast<const char*>(sqlite3_value_text(v));
        return std::string(p, static_cast<std::size_t>(sqlite3_value_bytes(v)));
    }
    case SQLITE_BLOB: {
        auto* p = static_cast<const std::uint8_t*>(sqlite3_value_blob(v));
        int n = sqlite3_value_bytes(v);
        return std::vector<std::uint8_t>(p, p + n);
    }
    default:
        return std::monostate{};
    }
}

inline Value column_value(sqlite3_stmt* stmt, int col) {
    return to_value(sqlite3_column_value(stmt, col));
}

/// "name" with embedded quotes doubled.
inline std::string quote_ident(std::string_view name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

/// 'text' with embedded quotes doubled.
inline std::string quote_literal(std::string_view text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

/// Schema-qualified object name for use in statements.
inline std::string qualified(const std::string& schema, const std::string& name) {
    return quote_ident(schema) + "." + quote_ident(name);
}

inline std::string upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

/// FNV-1a 64-bit.
class Fnv64 {
public:
    void add(const void* data, std::size_t n) {
        auto* p = static_cast<const std::uint8_t*>(data);
        for (std::size_t i = 0; i < n; ++i) {
            hash_ ^= p[i];
            hash_ *= 1099511628211ull;
        }
    }
    void add(std::string_view s) { add(s.data(), s.size()); }
    void add_byte(std::uint8_t b) { add(&b, 1); }

    std::uint64_t value() const { return hash_; }

private:
    std::uint64_t hash_ = 14695981039346656037ull;
};

/// Write scope: BEGIN IMMEDIATE when the connection is in autocommit
/// mode, a named savepoint otherwise. Rolls back unless committed.
class WriteScope {
public:
    WriteScope(sqlite3* db, std::string name)
        : db_(db), name_(std::move(name)), nested_(!sqlite3_get_autocommit(db)) {
        exec(db_, nested_ ? "SAVEPOINT " + name_ : std::string("BEGIN IMMEDIATE"));
    }

    ~WriteScope() {
        if (done_) return;
        if (!nested_ && sqlite3_get_autocommit(db_)) return;  // already rolled back
        std::string sql = nested_
            ? "ROLLBACK TO " + name_ + "; RELEASE " + name_
            : std::string("ROLLBACK");
        char* err = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            SPDLOG_WARN("rollback of {} failed: {}", name_, err ? err : "unknown error");
        }
        sqlite3_free(err);
    }

    WriteScope(const WriteScope&) = delete;
    WriteScope& operator=(const WriteScope&) = delete;

    void commit() {
        exec(db_, nested_ ? "RELEASE " + name_ : std::string("COMMIT"));
        done_ = true;
    }

private:
    sqlite3*    db_;
    std::string name_;
    bool        nested_;
    bool        done_ = false;
};

} // namespace sqlbranch::detail

// ── types.cpp ───────────────────────────────────────────────────
namespace sqlbranch {

char op_code(OpKind op) {
    switch (op) {
    case OpKind::Insert: return 'I';
    case OpKind::Update: return 'U';
    case OpKind::Delete: return 'D';
    }
    return '?';
}

OpKind op_from_code(char code) {
    switch (code) {
    case 'I': return OpKind::Insert;
    case 'U': return OpKind::Update;
    case 'D': return OpKind::Delete;
    default:
        throw Error(ErrorCode::InvalidState,
                    std::string("unknown operation code '") + code + "'");
    }
}

TypeDescriptor parse_type(std::string_view declared) {
    auto trim = [](std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    };
    declared = trim(declared);
    TypeDescriptor t;
    auto paren = declared.find('(');
    if (paren == std::string_view::npos) {
        t.base = detail::upper(declared);
        return t;
    }
    t.base = detail::upper(trim(declared.substr(0, paren)));
    for (char c : declared.substr(paren)) {
        if (!std::isspace(static_cast<unsigned char>(c))) t.modifier += c;
    }
    return t;
}

std::string_view storage_class_name(StorageClass s) {
    switch (s) {
    case StorageClass::Null:    return "null";
    case StorageClass::Integer: return "integer";
    case StorageClass::Real:    return "real";
    case StorageClass::Text:    return "text";
    case StorageClass::Blob:    return "blob";
    }
    return "null";
}

StorageClass storage_class_from_name(std::string_view name) {
    if (name == "null") return StorageClass::Null;
    if (name == "integer") return StorageClass::Integer;
    if (name == "real") return StorageClass::Real;
    if (name == "text") return StorageClass::Text;
    if (name == "blob") return StorageClass::Blob;
    throw Error(ErrorCode::InvalidState,
                "unknown storage class '" + std::string(name) + "'");
}

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::string to_hex(const std::vector<std::uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out += kHexDigits[b >> 4];
        out += kHexDigits[b & 0xf];
    }
    return out;
}

int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::vector<std::uint8_t> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw Error(ErrorCode::InvalidState, "malformed blob text: odd length");
    }
    std::vector<std::uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_nibble(hex[i]);
        int lo = hex_nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw Error(ErrorCode::InvalidState, "malformed blob text: bad hex digit");
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace

TypedValue to_typed(const TypeDescriptor& type, const Value& v) {
    TypedValue tv;
    tv.type = type;
    std::visit([&](const auto& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            tv.storage = StorageClass::Null;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            tv.storage = StorageClass::Integer;
            tv.text = std::to_string(val);
        } else if constexpr (std::is_same_v<T, double>) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", val);
            tv.storage = StorageClass::Real;
            tv.text = buf;
        } else if constexpr (std::is_same_v<T, std::string>) {
            tv.storage = StorageClass::Text;
            tv.text = val;
        } else {
            tv.storage = StorageClass::Blob;
            tv.text = to_hex(val);
        }
    }, v);
    return tv;
}

Value from_typed(const TypedValue& tv) {
    if (tv.storage == StorageClass::Null || !tv.text) return std::monostate{};
    const std::string& s = *tv.text;
    switch (tv.storage) {
    case StorageClass::Integer: {
        std::int64_t n = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            throw Error(ErrorCode::InvalidState, "malformed integer text '" + s + "'");
        }
        return n;
    }
    case StorageClass::Real: {
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size()) {
            throw Error(ErrorCode::InvalidState, "malformed real text '" + s + "'");
        }
        return d;
    }
    case StorageClass::Text:
        return s;
    case StorageClass::Blob:
        return from_hex(s);
    case StorageClass::Null:
        break;
    }
    return std::monostate{};
}

const ColumnValue* ChangeRecord::column(std::string_view name) const {
    for (const auto& c : columns) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

std::string_view phase_name(DdlPhase p) {
    return p == DdlPhase::Start ? "start" : "end";
}

std::string_view gap_name(AuditGap g) {
    switch (g) {
    case AuditGap::NonTableDrop:       return "non_table_drop";
    case AuditGap::AlterDefinition:    return "alter_definition";
    case AuditGap::UntrackedStatement: return "untracked_statement";
    }
    return "unknown";
}

std::string_view kind_name(OperationKind k) {
    switch (k) {
    case OperationKind::Branch:         return "branch";
    case OperationKind::Snapshot:       return "snapshot";
    case OperationKind::Restore:        return "restore";
    case OperationKind::DeleteSnapshot: return "delete_snapshot";
    }
    return "unknown";
}

std::string_view status_name(OperationStatus s) {
    switch (s) {
    case OperationStatus::Pending:   return "pending";
    case OperationStatus::Running:   return "running";
    case OperationStatus::Succeeded: return "succeeded";
    case OperationStatus::Failed:    return "failed";
    }
    return "unknown";
}

std::string_view step_name(BranchStep s) {
    switch (s) {
    case BranchStep::Pending:               return "pending";
    case BranchStep::EnsuringSourceCapture: return "ensuring_source_capture";
    case BranchStep::Cloning:               return "cloning";
    case BranchStep::FixingOwnership:       return "fixing_ownership";
    case BranchStep::EnsuringTargetCapture: return "ensuring_target_capture";
    case BranchStep::Succeeded:             return "succeeded";
    case BranchStep::Failed:                return "failed";
    }
    return "unknown";
}

namespace {

template <typename E, std::size_t N>
E enum_from_name(std::string_view name, const std::array<E, N>& all,
                 std::string_view (*to_name)(E), const char* what) {
    for (E e : all) {
        if (to_name(e) == name) return e;
    }
    throw Error(ErrorCode::InvalidState,
                std::string("unknown ") + what + " '" + std::string(name) + "'");
}

} // namespace

OperationKind kind_from_name(std::string_view name) {
    static constexpr std::array all{OperationKind::Branch, OperationKind::Snapshot,
                                    OperationKind::Restore, OperationKind::DeleteSnapshot};
    return enum_from_name(name, all, &kind_name, "operation kind");
}

OperationStatus status_from_name(std::string_view name) {
    static constexpr std::array all{OperationStatus::Pending, OperationStatus::Running,
                                    OperationStatus::Succeeded, OperationStatus::Failed};
    return enum_from_name(name, all, &status_name, "operation status");
}

BranchStep step_from_name(std::string_view name) {
    static constexpr std::array all{
        BranchStep::Pending, BranchStep::EnsuringSourceCapture, BranchStep::Cloning,
        BranchStep::FixingOwnership, BranchStep::EnsuringTargetCapture,
        BranchStep::Succeeded, BranchStep::Failed};
    return enum_from_name(name, all, &step_name, "branch step");
}

} // namespace sqlbranch

// ── config.cpp ──────────────────────────────────────────────────
namespace sqlbranch {

std::filesystem::path Config::registry_path() const {
    if (!registry.empty()) return registry;
    return orchestrator.storage_root /
           (std::string(kBookkeepingPrefix) + "registry.db");
}

namespace {

void check_keys(const YAML::Node& node, const std::string& where,
                std::initializer_list<std::string_view> allowed) {
    if (!node.IsMap()) {
        throw Error(ErrorCode::ConfigError, where + " must be a mapping");
    }
    for (const auto& entry : node) {
        auto key = entry.first.as<std::string>();
        if (std::find(allowed.begin(), allowed.end(), key) == allowed.end()) {
            throw Error(ErrorCode::ConfigError,
                        "unknown configuration key '" + where + key + "'");
        }
    }
}

template <typename T>
T scalar(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::ConfigError,
                    "configuration key '" + key + "' has the wrong type: " + e.what());
    }
}

Config from_yaml(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        throw Error(ErrorCode::ConfigError, "configuration is empty");
    }
    check_keys(root, "", {"storage_root", "registry", "owner", "actor",
                          "auto_install", "audited_kinds", "logging"});

    Config cfg;
    if (!root["storage_root"]) {
        throw Error(ErrorCode::ConfigError, "configuration key 'storage_root' is required");
    }
    cfg.orchestrator.storage_root = scalar<std::string>(root["storage_root"], "storage_root");
    if (root["registry"]) {
        cfg.registry = scalar<std::string>(root["registry"], "registry");
    }
    if (auto owner = root["owner"]) {
        check_keys(owner, "owner.", {"user", "group"});
        OwnerConfig oc;
        if (owner["user"]) oc.user = scalar<std::string>(owner["user"], "owner.user");
        if (owner["group"]) oc.group = scalar<std::string>(owner["group"], "owner.group");
        cfg.orchestrator.owner = oc;
    }
    if (root["actor"]) {
        cfg.orchestrator.tracker.actor = scalar<std::string>(root["actor"], "actor");
    }
    if (root["auto_install"]) {
        cfg.orchestrator.tracker.auto_install = scalar<bool>(root["auto_install"], "auto_install");
    }
    if (root["audited_kinds"]) {
        cfg.orchestrator.tracker.audited_kinds =
            scalar<std::vector<std::string>>(root["audited_kinds"], "audited_kinds");
    }
    if (auto logging = root["logging"]) {
        check_keys(logging, "logging.", {"level", "pattern"});
        if (logging["level"]) {
            cfg.logging.level = scalar<std::string>(logging["level"], "logging.level");
        }
        if (logging["pattern"]) {
            cfg.logging.pattern = scalar<std::string>(logging["pattern"], "logging.pattern");
        }
    }
    return cfg;
}

} // namespace

Config parse_config(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::ConfigError, std::string("malformed configuration: ") + e.what());
    }
    return from_yaml(root);
}

Config load_config(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::ConfigError,
                    "failed to load " + path.string() + ": " + e.what());
    }
    return from_yaml(root);
}

void init_logging(const LoggingConfig& config) {
    std::string level = config.level;
    if (const char* env = std::getenv("SQLBRANCH_LOG_LEVEL")) {
        level = env;
    }
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        throw Error(ErrorCode::ConfigError, "unknown log level '" + level + "'");
    }

    auto logger = spdlog::get("sqlbranch");
    if (!logger) logger = spdlog::stdout_color_mt("sqlbranch");
    logger->set_pattern(config.pattern);
    logger->set_level(lvl);
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace sqlbranch

// ── sql_lexer.h ─────────────────────────────────────────────────
namespace sqlbranch::detail {

enum class TokenKind : std::uint8_t {
    Word,
    Quoted,
    String,
    Number,
    Punct,
};

struct Token {
    TokenKind        kind;
    std::string_view text;
    std::size_t      begin;
    std::size_t      end;

    bool is(std::string_view keyword) const {
        return kind == TokenKind::Word && iequals(text, keyword);
    }
    bool punct(char c) const {
        return kind == TokenKind::Punct && text.size() == 1 && text[0] == c;
    }
};

/// Split SQL text into tokens, dropping whitespace and comments.
std::vector<Token> tokenize(std::string_view sql);

/// Identifier text with SQLite quoting removed.
std::string unquote(const Token& t);

/// Index of the ')' matching the '(' at `open`, or tokens.size().
std::size_t matching_paren(const std::vector<Token>& tokens, std::size_t open);

/// Clauses of a stored CREATE TABLE that the pragmas do not expose.
struct ParsedCheck {
    std::optional<std::string> name;
    std::string                expr;
    std::string                column;  ///< Empty for table-level checks.
};

struct ParsedKey {
    ConstraintKind             kind;
    std::optional<std::string> name;
    std::vector<std::string>   columns;
};

struct ParsedTable {
    std::map<std::string, std::string> generated;  ///< column -> expression
    std::vector<ParsedCheck>           checks;
    std::vector<ParsedKey>             keys;
};

ParsedTable parse_create_table(std::string_view sql);

} // namespace sqlbranch::detail

// ── sql_lexer.cpp ───────────────────────────────────────────────
namespace sqlbranch::detail {

namespace {

bool is_word_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '$' || u >= 0x80;
}

std::size_t scan_quoted(std::string_view sql, std::size_t i, char close) {
    ++i;
    while (i < sql.size()) {
        if (sql[i] == close) {
            if (close != ']' && i + 1 < sql.size() && sql[i + 1] == close) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return sql.size();
}

} // namespace

std::vector<Token> tokenize(std::string_view sql) {
    std::vector<Token> out;
    std::size_t i = 0;
    while (i < sql.size()) {
        char c = sql[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        if (c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') {
            auto nl = sql.find('\n', i);
            i = nl == std::string_view::npos ? sql.size() : nl + 1;
            continue;
        }
        if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            auto close = sql.find("*/", i + 2);
            i = close == std::string_view::npos ? sql.size() : close + 2;
            continue;
        }

        std::size_t start = i;
        TokenKind kind;
        if (c == '\'') {
            kind = TokenKind::String;
            i = scan_quoted(sql, i, '\'');
        } else if (c == '"' || c == '`') {
            kind = TokenKind::Quoted;
            i = scan_quoted(sql, i, c);
        } else if (c == '[') {
            kind = TokenKind::Quoted;
            i = scan_quoted(sql, i, ']');
        } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                   (c == '.' && i + 1 < sql.size() &&
                    std::isdigit(static_cast<unsigned char>(sql[i + 1])))) {
            kind = TokenKind::Number;
            while (i < sql.size() && (is_word_char(sql[i]) || sql[i] == '.')) ++i;
        } else if (is_word_char(c)) {
            kind = TokenKind::Word;
            while (i < sql.size() && is_word_char(sql[i])) ++i;
        } else {
            kind = TokenKind::Punct;
            ++i;
        }
        out.push_back(Token{kind, sql.substr(start, i - start), start, i});
    }
    return out;
}

std::string unquote(const Token& t) {
    if (t.kind != TokenKind::Quoted && t.kind != TokenKind::String) {
        return std::string(t.text);
    }
    if (t.text.size() < 2) return std::string(t.text);
    char close = t.text.back();
    std::string out;
    auto inner = t.text.substr(1, t.text.size() - 2);
    for (std::size_t i = 0; i < inner.size(); ++i) {
        out += inner[i];
        if (close != ']' && inner[i] == close && i + 1 < inner.size() && inner[i + 1] == close) {
            ++i;
        }
    }
    return out;
}

std::size_t matching_paren(const std::vector<Token>& tokens, std::size_t open) {
    int depth = 0;
    for (std::size_t i = open; i < tokens.size(); ++i) {
        if (tokens[i].punct('(')) ++depth;
        else if (tokens[i].punct(')') && --depth == 0) return i;
    }
    return tokens.size();
}

namespace {

/// Source text strictly between the parens at `open` and `close`.
std::string inner_text(std::string_view sql, const std::vector<Token>& tokens,
                       std::size_t open, std::size_t close) {
    if (close >= tokens.size() || close <= open + 1) return {};
    auto b = tokens[open + 1].begin;
    auto e = tokens[close - 1].end;
    return std::string(sql.substr(b, e - b));
}

/// Leading identifier of each comma-separated entry inside parens.
std::vector<std::string> ident_list(const std::vector<Token>& tokens,
                                    std::size_t open, std::size_t close) {
    std::vector<std::string> out;
    bool expect = true;
    int depth = 0;
    for (std::size_t i = open + 1; i < close; ++i) {
        const auto& t = tokens[i];
        if (t.punct('(')) ++depth;
        else if (t.punct(')')) --depth;
        else if (depth == 0 && t.punct(',')) expect = true;
        else if (depth == 0 && expect &&
                 (t.kind == TokenKind::Word || t.kind == TokenKind::Quoted)) {
            out.push_back(unquote(t));
            expect = false;
        }
    }
    return out;
}

bool starts_table_constraint(const Token& t) {
    return t.is("CONSTRAINT") || t.is("PRIMARY") || t.is("UNIQUE") ||
           t.is("CHECK") || t.is("FOREIGN");
}

void parse_column(std::string_view sql, const std::vector<Token>& tokens,
                  std::size_t b, std::size_t e, ParsedTable& out) {
    std::string column = unquote(tokens[b]);
    std::optional<std::string> pending;
    for (std::size_t i = b + 1; i < e; ++i) {
        const auto& t = tokens[i];
        if (t.is("CONSTRAINT") && i + 1 < e) {
            pending = unquote(tokens[++i]);
        } else if (t.is("PRIMARY")) {
            out.keys.push_back({ConstraintKind::PrimaryKey, std::move(pending), {column}});
            pending.reset();
        } else if (t.is("UNIQUE")) {
            out.keys.push_back({ConstraintKind::Unique, std::move(pending), {column}});
            pending.reset();
        } else if (t.is("REFERENCES")) {
            out.keys.push_back({ConstraintKind::ForeignKey, std::move(pending), {column}});
            pending.reset();
        } else if ((t.is("CHECK") || t.is("AS")) && i + 1 < e && tokens[i + 1].punct('(')) {
            auto close = matching_paren(tokens, i + 1);
            auto expr = inner_text(sql, tokens, i + 1, close);
            if (t.is("CHECK")) {
                out.checks.push_back({std::move(pending), std::move(expr), column});
            } else {
                out.generated[column] = std::move(expr);
            }
            pending.reset();
            i = close;
        } else if (t.punct('(')) {
            i = matching_paren(tokens, i);
        } else if (t.is("NOT") || t.is("NULL") || t.is("DEFAULT") || t.is("COLLATE")) {
            pending.reset();
        }
    }
}

void parse_table_constraint(std::string_view sql, const std::vector<Token>& tokens,
                            std::size_t b, std::size_t e, ParsedTable& out) {
    std::optional<std::string> name;
    std::size_t i = b;
    if (tokens[i].is("CONSTRAINT") && i + 1 < e) {
        name = unquote(tokens[i + 1]);
        i += 2;
    }
    if (i >= e) return;

    auto next_paren = [&](std::size_t from) {
        while (from < e && !tokens[from].punct('(')) ++from;
        return from;
    };

    const auto& t = tokens[i];
    std::size_t open = next_paren(i);
    if (open >= e) return;
    std::size_t close = matching_paren(tokens, open);
    if (t.is("CHECK")) {
        out.checks.push_back({std::move(name), inner_text(sql, tokens, open, close), {}});
    } else if (t.is("PRIMARY")) {
        out.keys.push_back({ConstraintKind::PrimaryKey, std::move(name),
                            ident_list(tokens, open, close)});
    } else if (t.is("UNIQUE")) {
        out.keys.push_back({ConstraintKind::Unique, std::move(name),
                            ident_list(tokens, open, close)});
    } else if (t.is("FOREIGN")) {
        out.keys.push_back({ConstraintKind::ForeignKey, std::move(name),
                            ident_list(tokens, open, close)});
    }
}

} // namespace

ParsedTable parse_create_table(std::string_view sql) {
    ParsedTable out;
    auto tokens = tokenize(sql);

    std::size_t open = 0;
    while (open < tokens.size() && !tokens[open].punct('(')) ++open;
    if (open >= tokens.size()) return out;  // CREATE TABLE ... AS SELECT
    std::size_t close = matching_paren(tokens, open);

    std::size_t item = open + 1;
    int depth = 0;
    for (std::size_t i = open + 1; i <= close && i < tokens.size(); ++i) {
        const auto& t = tokens[i];
        bool boundary = i == close || (depth == 0 && t.punct(','));
        if (t.punct('(')) ++depth;
        else if (t.punct(')') && i != close) --depth;
        if (!boundary) continue;
        if (item < i) {
            if (starts_table_constraint(tokens[item])) {
                parse_table_constraint(sql, tokens, item, i, out);
            } else {
                parse_column(sql, tokens, item, i, out);
            }
        }
        item = i + 1;
    }
    return out;
}

} // namespace sqlbranch::detail

// ── catalog.cpp ─────────────────────────────────────────────────
namespace sqlbranch {

bool is_bookkeeping(std::string_view name) {
    return name.size() >= kBookkeepingPrefix.size() &&
           detail::iequals(name.substr(0, kBookkeepingPrefix.size()), kBookkeepingPrefix);
}

const ColumnDescriptor* TableDescriptor::column(std::string_view n) const {
    for (const auto& c : columns) {
        if (detail::iequals(c.name, n)) return &c;
    }
    return nullptr;
}

std::vector<const ColumnDescriptor*> TableDescriptor::stored_columns() const {
    std::vector<const ColumnDescriptor*> out;
    for (const auto& c : columns) {
        if (c.generated == GeneratedKind::None) out.push_back(&c);
    }
    return out;
}

std::vector<std::string> CatalogInspector::list_tables(const std::string& schema) const {
    auto stmt = detail::prepare(db_,
        "SELECT name FROM " + detail::quote_ident(schema) + ".sqlite_schema "
        "WHERE type='table' ORDER BY name");
    std::vector<std::string> tables;
    while (detail::step_row(db_, stmt.get())) {
        auto name = detail::column_text(stmt.get(), 0);
        if (name.rfind("sqlite_", 0) == 0 || is_bookkeeping(name)) continue;
        tables.push_back(std::move(name));
    }
    return tables;
}

bool CatalogInspector::exists(const std::string& table, const std::string& schema) const {
    return object_type(table, schema) == "table";
}

std::string CatalogInspector::object_type(const std::string& name,
                                          const std::string& schema) const {
    auto stmt = detail::prepare(db_,
        "SELECT type FROM " + detail::quote_ident(schema) + ".sqlite_schema "
        "WHERE name=? COLLATE NOCASE");
    detail::bind_text(stmt.get(), 1, name);
    if (detail::step_row(db_, stmt.get())) return detail::column_text(stmt.get(), 0);
    return {};
}

std::optional<std::string> CatalogInspector::object_definition(
        const std::string& name, const std::string& schema) const {
    auto stmt = detail::prepare(db_,
        "SELECT sql FROM " + detail::quote_ident(schema) + ".sqlite_schema "
        "WHERE name=? COLLATE NOCASE");
    detail::bind_text(stmt.get(), 1, name);
    if (detail::step_row(db_, stmt.get())) return detail::column_optional(stmt.get(), 0);
    return std::nullopt;
}

std::int64_t CatalogInspector::schema_version() const {
    auto stmt = detail::prepare(db_, "PRAGMA schema_version");
    if (detail::step_row(db_, stmt.get())) return sqlite3_column_int64(stmt.get(), 0);
    return 0;
}

namespace {

std::string column_list(const std::vector<std::string>& cols) {
    std::string out;
    for (const auto& c : cols) {
        if (!out.empty()) out += ", ";
        out += detail::quote_ident(c);
    }
    return out;
}

bool same_columns(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](const auto& x, const auto& y) { return detail::iequals(x, y); });
}

std::string join(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += sep;
        out += p;
    }
    return out;
}

/// Take the declared name of a parsed key with these columns, if any.
std::optional<std::string> claim_name(std::vector<detail::ParsedKey>& keys,
                                      ConstraintKind kind,
                                      const std::vector<std::string>& cols) {
    for (auto it = keys.begin(); it != keys.end(); ++it) {
        if (it->kind == kind && same_columns(it->columns, cols)) {
            auto name = it->name;
            keys.erase(it);
            return name;
        }
    }
    return std::nullopt;
}

std::string unique_name(std::set<std::string>& used, const std::string& base) {
    std::string name = base;
    for (int n = 1; used.count(name); ++n) name = base + std::to_string(n);
    used.insert(name);
    return name;
}

} // namespace

TableDescriptor CatalogInspector::describe(const std::string& table,
                                           const std::string& schema) const {
    auto create_sql = object_definition(table, schema);
    if (!exists(table, schema) || !create_sql) {
        throw Error(ErrorCode::NotFound,
                    "relation \"" + schema + "." + table + "\" does not exist");
    }

    TableDescriptor desc;
    desc.schema = schema;
    auto parsed = detail::parse_create_table(*create_sql);

    {
        // schema, name, type, ncol, wr, strict
        auto stmt = detail::prepare(db_,
            "PRAGMA " + detail::quote_ident(schema) + ".table_list(" +
            detail::quote_literal(table) + ")");
        if (detail::step_row(db_, stmt.get())) {
            desc.name = detail::column_text(stmt.get(), 1);
            desc.without_rowid = sqlite3_column_int(stmt.get(), 4) != 0;
            desc.strict = sqlite3_column_int(stmt.get(), 5) != 0;
        } else {
            desc.name = table;
        }
    }

    bool autoincrement = false;
    {
        auto stmt = detail::prepare(db_,
            "SELECT cid, name, type, \"notnull\", dflt_value, pk, hidden "
            "FROM pragma_table_xinfo(?1, ?2) ORDER BY cid");
        detail::bind_text(stmt.get(), 1, desc.name);
        detail::bind_text(stmt.get(), 2, schema);
        while (detail::step_row(db_, stmt.get())) {
            ColumnDescriptor col;
            col.cid = sqlite3_column_int(stmt.get(), 0);
            col.name = detail::column_text(stmt.get(), 1);
            col.type = parse_type(detail::column_text(stmt.get(), 2));
            col.not_null = sqlite3_column_int(stmt.get(), 3) != 0;
            col.default_expr = detail::column_optional(stmt.get(), 4);
            col.pk_position = sqlite3_column_int(stmt.get(), 5);
            int hidden = sqlite3_column_int(stmt.get(), 6);
            if (hidden == 2) col.generated = GeneratedKind::Virtual;
            if (hidden == 3) col.generated = GeneratedKind::Stored;
            if (hidden == 1) continue;  // virtual-table hidden column
            if (col.generated != GeneratedKind::None) {
                auto it = parsed.generated.find(col.name);
                if (it != parsed.generated.end()) col.generated_expr = it->second;
            }

            const char* collseq = nullptr;
            int autoinc = 0;
            int rc = sqlite3_table_column_metadata(db_, schema.c_str(), desc.name.c_str(),
                                                   col.name.c_str(), nullptr, &collseq,
                                                   nullptr, nullptr, &autoinc);
            if (rc != SQLITE_OK) {
                throw Error(ErrorCode::SqliteError,
                            "column metadata for \"" + desc.name + "." + col.name +
                            "\": " + sqlite3_errmsg(db_));
            }
            if (collseq && !detail::iequals(collseq, "BINARY")) col.collation = collseq;
            if (autoinc) autoincrement = true;
            desc.columns.push_back(std::move(col));
        }
    }

    std::vector<const ColumnDescriptor*> pk_cols;
    for (const auto& c : desc.columns) {
        if (c.pk_position > 0) pk_cols.push_back(&c);
    }
    std::sort(pk_cols.begin(), pk_cols.end(),
              [](auto* a, auto* b) { return a->pk_position < b->pk_position; });
    for (auto* c : pk_cols) desc.primary_key.push_back(c->name);

    if (pk_cols.size() == 1 && !desc.without_rowid &&
        pk_cols[0]->type.base == "INTEGER" && pk_cols[0]->type.modifier.empty()) {
        for (auto& c : desc.columns) {
            if (c.pk_position == 1) {
                c.identity = autoincrement ? IdentityMode::Always : IdentityMode::ByDefault;
            }
        }
    }

    std::set<std::string> used;
    for (const auto& k : parsed.keys) {
        if (k.name) used.insert(*k.name);
    }
    for (const auto& c : parsed.checks) {
        if (c.name) used.insert(*c.name);
    }

    std::string pk_index;
    {
        auto stmt = detail::prepare(db_,
            "SELECT name, origin FROM pragma_index_list(?1, ?2) WHERE origin IN ('pk', 'u') "
            "ORDER BY name");
        detail::bind_text(stmt.get(), 1, desc.name);
        detail::bind_text(stmt.get(), 2, schema);
        while (detail::step_row(db_, stmt.get())) {
            auto index = detail::column_text(stmt.get(), 0);
            auto origin = detail::column_text(stmt.get(), 1);
            if (origin == "pk") {
                pk_index = index;
                continue;
            }
            auto info = detail::prepare(db_,
                "SELECT name FROM pragma_index_info(?1, ?2) ORDER BY seqno");
            detail::bind_text(info.get(), 1, index);
            detail::bind_text(info.get(), 2, schema);
            std::vector<std::string> cols;
            while (detail::step_row(db_, info.get())) {
                cols.push_back(detail::column_text(info.get(), 0));
            }
            ConstraintDescriptor con;
            con.kind = ConstraintKind::Unique;
            con.index_name = index;
            con.definition = "UNIQUE (" + column_list(cols) + ")";
            auto declared = claim_name(parsed.keys, ConstraintKind::Unique, cols);
            con.name = declared ? *declared
                                : unique_name(used, desc.name + "_" + join(cols, '_') + "_key");
            desc.constraints.push_back(std::move(con));
        }
    }

    if (!desc.primary_key.empty()) {
        ConstraintDescriptor con;
        con.kind = ConstraintKind::PrimaryKey;
        con.index_name = pk_index;
        con.definition = "PRIMARY KEY (" + column_list(desc.primary_key) + ")";
        auto declared = claim_name(parsed.keys, ConstraintKind::PrimaryKey, desc.primary_key);
        con.name = declared ? *declared : unique_name(used, desc.name + "_pkey");
        desc.constraints.push_back(std::move(con));
    }

    for (auto& chk : parsed.checks) {
        ConstraintDescriptor con;
        con.kind = ConstraintKind::Check;
        con.definition = "CHECK (" + chk.expr + ")";
        if (chk.name) {
            con.name = *chk.name;
        } else if (!chk.column.empty()) {
            con.name = unique_name(used, desc.name + "_" + chk.column + "_check");
        } else {
            con.name = unique_name(used, desc.name + "_check");
        }
        desc.constraints.push_back(std::move(con));
    }

    {
        auto stmt = detail::prepare(db_,
            "SELECT id, \"table\", \"from\", \"to\", on_update, on_delete "
            "FROM pragma_foreign_key_list(?1, ?2) ORDER BY id, seq");
        detail::bind_text(stmt.get(), 1, desc.name);
        detail::bind_text(stmt.get(), 2, schema);
        struct Fk {
            std::string parent, on_update, on_delete;
            std::vector<std::string> from, to;
            bool implicit_to = false;
        };
        std::map<int, Fk> fks;
        while (detail::step_row(db_, stmt.get())) {
            auto& fk = fks[sqlite3_column_int(stmt.get(), 0)];
            fk.parent = detail::column_text(stmt.get(), 1);
            fk.from.push_back(detail::column_text(stmt.get(), 2));
            auto to = detail::column_optional(stmt.get(), 3);
            if (to) fk.to.push_back(*to);
            else fk.implicit_to = true;
            fk.on_update = detail::column_text(stmt.get(), 4);
            fk.on_delete = detail::column_text(stmt.get(), 5);
        }
        for (auto& [id, fk] : fks) {
            ConstraintDescriptor con;
            con.kind = ConstraintKind::ForeignKey;
            con.definition = "FOREIGN KEY (" + column_list(fk.from) + ") REFERENCES " +
                             detail::quote_ident(fk.parent);
            if (!fk.implicit_to) con.definition += " (" + column_list(fk.to) + ")";
            if (fk.on_update != "NO ACTION") con.definition += " ON UPDATE " + fk.on_update;
            if (fk.on_delete != "NO ACTION") con.definition += " ON DELETE " + fk.on_delete;
            auto declared = claim_name(parsed.keys, ConstraintKind::ForeignKey, fk.from);
            con.name = declared ? *declared
                                : unique_name(used, desc.name + "_" + join(fk.from, '_') + "_fkey");
            desc.constraints.push_back(std::move(con));
        }
    }

    std::sort(desc.constraints.begin(), desc.constraints.end(),
              [](const auto& a, const auto& b) {
                  return std::tie(a.index_name, a.name) < std::tie(b.index_name, b.name);
              });

    detail::Fnv64 fp;
    fp.add(desc.name);
    fp.add_byte(desc.without_rowid ? 1 : 0);
    for (const auto& c : desc.columns) {
        fp.add_byte(0);
        fp.add(c.name);
        fp.add_byte(0);
        fp.add(c.type.str());
        fp.add_byte(static_cast<std::uint8_t>(c.pk_position));
        fp.add_byte(static_cast<std::uint8_t>(c.generated));
    }
    desc.fingerprint = fp.value();
    return desc;
}

} // namespace sqlbranch

// ── renderer.cpp ────────────────────────────────────────────────
namespace sqlbranch {

namespace {

/// True if a stored default can follow DEFAULT without parentheses.
bool is_plain_default(std::string_view expr) {
    auto tokens = detail::tokenize(expr);
    if (tokens.empty()) return false;
    std::size_t i = 0;
    if (tokens.size() == 2 && (tokens[0].punct('-') || tokens[0].punct('+'))) i = 1;
    if (tokens.size() != i + 1) {
        // X'..' blob literal tokenizes as a word plus a string.
        return tokens.size() == 2 && tokens[0].is("X") && tokens[1].kind == detail::TokenKind::String &&
               tokens[1].begin == tokens[0].end;
    }
    const auto& t = tokens[i];
    if (t.kind == detail::TokenKind::Number || t.kind == detail::TokenKind::String) return true;
    if (i == 0 && (t.is("NULL") || t.is("TRUE") || t.is("FALSE") || t.is("CURRENT_TIME") ||
                   t.is("CURRENT_DATE") || t.is("CURRENT_TIMESTAMP"))) {
        return true;
    }
    return false;
}

std::string render_column(const ColumnDescriptor& c, const TableDescriptor& desc) {
    std::string out = detail::quote_ident(c.name);
    if (!c.type.base.empty()) out += " " + c.type.str();

    if (c.identity == IdentityMode::Always) {
        for (const auto& con : desc.constraints) {
            if (con.kind == ConstraintKind::PrimaryKey) {
                out += " CONSTRAINT " + detail::quote_ident(con.name);
            }
        }
        out += " PRIMARY KEY AUTOINCREMENT";
    }
    if (c.collation) out += " COLLATE " + *c.collation;

    if (c.generated != GeneratedKind::None) {
        out += " GENERATED ALWAYS AS (" + c.generated_expr.value_or("NULL") + ")";
        out += c.generated == GeneratedKind::Stored ? " STORED" : " VIRTUAL";
    } else if (c.default_expr) {
        if (is_plain_default(*c.default_expr)) out += " DEFAULT " + *c.default_expr;
        else out += " DEFAULT (" + *c.default_expr + ")";
    }
    if (c.not_null) out += " NOT NULL";
    return out;
}

} // namespace

std::string SchemaRenderer::render(const TableDescriptor& desc) {
    std::string out = "CREATE TABLE ";
    if (desc.schema != "main") out += detail::quote_ident(desc.schema) + ".";
    out += detail::quote_ident(desc.name) + " (";

    bool inline_pk = false;
    bool first = true;
    for (const auto& c : desc.columns) {
        if (!first) out += ", ";
        first = false;
        out += render_column(c, desc);
        if (c.identity == IdentityMode::Always) inline_pk = true;
    }

    auto constraints = desc.constraints;
    std::sort(constraints.begin(), constraints.end(), [](const auto& a, const auto& b) {
        return std::tie(a.index_name, a.name) < std::tie(b.index_name, b.name);
    });
    for (const auto& con : constraints) {
        if (inline_pk && con.kind == ConstraintKind::PrimaryKey) continue;
        out += ", CONSTRAINT " + detail::quote_ident(con.name) + " " + con.definition;
    }
    out += ")";

    std::vector<std::string> options;
    if (desc.without_rowid) options.emplace_back("WITHOUT ROWID");
    if (desc.strict) options.emplace_back("STRICT");
    for (std::size_t i = 0; i < options.size(); ++i) {
        out += (i == 0 ? " " : ", ") + options[i];
    }
    return out;
}

std::string SchemaRenderer::render(const std::string& table, const std::string& schema) const {
    return render(catalog_.describe(table, schema));
}

} // namespace sqlbranch

// ── capture.h ───────────────────────────────────────────────────
namespace sqlbranch::detail {

inline constexpr std::string_view kChangeLog = "_sqlbranch_change_log";
inline constexpr std::string_view kDdlLog = "_sqlbranch_ddl_log";
inline constexpr std::string_view kCapturePrefix = "_sqlbranch_capture_";

/// Create the change and DDL logs if they don't exist.
void ensure_log_tables(sqlite3* db);

/// Name of the capture trigger for one operation ('i', 'u' or 'd').
std::string trigger_name(char op, const std::string& table);

/// The three trigger statements, as (name, CREATE TRIGGER text).
using CompiledCapture = std::array<std::pair<std::string, std::string>, 3>;

CompiledCapture compile_capture(const TableDescriptor& desc);

nlohmann::ordered_json encode_typed(const TypedValue& tv);
TypedValue decode_typed(const nlohmann::ordered_json& j);
std::vector<ColumnValue> decode_columns(const std::string& text);

/// IS DISTINCT FROM on raw values: storage class or content differs.
bool distinct(sqlite3_value* a, sqlite3_value* b);

/// Per-connection capture state: the capture and txid SQL functions,
/// the transaction hooks, and the descriptor cache they read.
class CaptureEngine {
public:
    explicit CaptureEngine(sqlite3* db);
    ~CaptureEngine();

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    bool install(const std::string& table);
    InstallReport ensure_installed();
    void uninstall(const std::string& table);
    bool installed(const std::string& table) const;

    /// Transaction id for the current write transaction.
    TxId current_tx();

private:
    std::shared_ptr<const TableDescriptor> descriptor(const std::string& table);
    void capture(sqlite3_context* ctx, int argc, sqlite3_value** argv);
    std::vector<std::string> remove_strays();

    static void capture_fn(sqlite3_context* ctx, int argc, sqlite3_value** argv);
    static void txid_fn(sqlite3_context* ctx, int argc, sqlite3_value** argv);
    static int on_commit(void* self);
    static void on_rollback(void* self);

    sqlite3*         db_;
    CatalogInspector catalog_;
    std::unordered_map<std::string, std::shared_ptr<const TableDescriptor>> cache_;
    std::int64_t     cache_version_ = -1;
    TxId             tx_ = 0;
    TxId             last_tx_ = 0;
};

} // namespace sqlbranch::detail

// ── capture.cpp ─────────────────────────────────────────────────
namespace sqlbranch::detail {

void ensure_log_tables(sqlite3* db) {
    exec(db,
        "CREATE TABLE IF NOT EXISTS _sqlbranch_change_log ("
        "  id   INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  rel  TEXT NOT NULL,"
        "  op   TEXT NOT NULL CHECK (op IN ('I', 'U', 'D')),"
        "  key  TEXT NOT NULL,"
        "  cols TEXT NOT NULL DEFAULT '{}',"
        "  tx   INTEGER NOT NULL,"
        "  ts   TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))"
        ")");

    exec(db,
        "CREATE TABLE IF NOT EXISTS _sqlbranch_ddl_log ("
        "  id              INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  ts              TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),"
        "  username        TEXT NOT NULL,"
        "  dbname          TEXT NOT NULL,"
        "  tx              INTEGER NOT NULL,"
        "  command_tag     TEXT NOT NULL,"
        "  object_type     TEXT NOT NULL,"
        "  schema_name     TEXT NOT NULL,"
        "  object_identity TEXT NOT NULL,"
        "  phase           TEXT NOT NULL CHECK (phase IN ('start', 'end')),"
        "  sql_text        TEXT,"
        "  pre_def         TEXT,"
        "  post_def        TEXT"
        ")");
}

std::string trigger_name(char op, const std::string& table) {
    return std::string(kCapturePrefix) + op + "_" + table;
}

CompiledCapture compile_capture(const TableDescriptor& desc) {
    auto stored = desc.stored_columns();
    auto fp = quote_literal(std::to_string(desc.fingerprint));
    auto rel = quote_literal(desc.name);

    auto args = [&](std::initializer_list<const char*> rows) {
        std::string out;
        for (const auto* c : stored) {
            for (const char* row : rows) {
                out += ", ";
                out += row;
                out += "." + quote_ident(c->name);
            }
        }
        return out;
    };

    auto body = [&](const char* event, char op, const std::string& values) {
        std::string name = trigger_name(static_cast<char>(std::tolower(op)), desc.name);
        std::string sql =
            "CREATE TRIGGER " + quote_ident(name) + " AFTER " + event + " ON " +
            quote_ident(desc.name) + " FOR EACH ROW BEGIN "
            "INSERT INTO " + std::string(kChangeLog) + " (rel, op, key, cols, tx) "
            "SELECT " + rel + ", '" + op + "', json_extract(p, '$.key'), "
            "json_extract(p, '$.cols'), sqlbranch_txid() "
            "FROM (SELECT sqlbranch_capture(" + rel + ", '" + op + "', " + fp + values +
            ") AS p) WHERE p IS NOT NULL; END";
        return std::make_pair(std::move(name), std::move(sql));
    };

    return {
        body("INSERT", 'I', args({"NEW"})),
        body("UPDATE", 'U', args({"OLD", "NEW"})),
        body("DELETE", 'D', args({"OLD"})),
    };
}

nlohmann::ordered_json encode_typed(const TypedValue& tv) {
    nlohmann::ordered_json j;
    j["t"] = tv.type.base;
    if (!tv.type.modifier.empty()) j["m"] = tv.type.modifier;
    j["s"] = std::string(storage_class_name(tv.storage));
    if (tv.text) j["v"] = *tv.text;
    else j["v"] = nullptr;
    return j;
}

TypedValue decode_typed(const nlohmann::ordered_json& j) {
    TypedValue tv;
    tv.type.base = j.value("t", "");
    tv.type.modifier = j.value("m", "");
    tv.storage = storage_class_from_name(j.value("s", "null"));
    if (j.contains("v") && !j["v"].is_null()) tv.text = j["v"].get<std::string>();
    return tv;
}

std::vector<ColumnValue> decode_columns(const std::string& text) {
    std::vector<ColumnValue> out;
    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorCode::InvalidState, std::string("malformed column payload: ") + e.what());
    }
    for (const auto& [name, entry] : j.items()) {
        out.push_back(ColumnValue{name, decode_typed(entry)});
    }
    return out;
}

bool distinct(sqlite3_value* a, sqlite3_value* b) {
    int ta = sqlite3_value_type(a);
    if (ta != sqlite3_value_type(b)) return true;
    switch (ta) {
    case SQLITE_NULL:
        return false;
    case SQLITE_INTEGER:
        return sqlite3_value_int64(a) != sqlite3_value_int64(b);
    case SQLITE_FLOAT:
        return sqlite3_value_double(a) != sqlite3_value_double(b);
    case SQLITE_TEXT: {
        auto* pa = sqlite3_value_text(a);
        auto* pb = sqlite3_value_text(b);
        int na = sqlite3_value_bytes(a);
        return na != sqlite3_value_bytes(b) || std::memcmp(pa, pb, static_cast<std::size_t>(na)) != 0;
    }
    default: {
        auto* pa = sqlite3_value_blob(a);
        auto* pb = sqlite3_value_blob(b);
        int na = sqlite3_value_bytes(a);
        if (na != sqlite3_value_bytes(b)) return true;
        return na > 0 && std::memcmp(pa, pb, static_cast<std::size_t>(na)) != 0;
    }
    }
}

CaptureEngine::CaptureEngine(sqlite3* db) : db_(db), catalog_(db) {
    int rc = sqlite3_create_function_v2(db_, "sqlbranch_capture", -1, SQLITE_UTF8, this,
                                        &CaptureEngine::capture_fn, nullptr, nullptr, nullptr);
    if (rc == SQLITE_OK) {
        rc = sqlite3_create_function_v2(db_, "sqlbranch_txid", 0, SQLITE_UTF8, this,
                                        &CaptureEngine::txid_fn, nullptr, nullptr, nullptr);
    }
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError,
                    std::string("registering capture functions: ") + sqlite3_errmsg(db_));
    }
    sqlite3_commit_hook(db_, &CaptureEngine::on_commit, this);
    sqlite3_rollback_hook(db_, &CaptureEngine::on_rollback, this);
}

CaptureEngine::~CaptureEngine() {
    sqlite3_commit_hook(db_, nullptr, nullptr);
    sqlite3_rollback_hook(db_, nullptr, nullptr);
    sqlite3_create_function_v2(db_, "sqlbranch_capture", -1, SQLITE_UTF8, nullptr,
                               nullptr, nullptr, nullptr, nullptr);
    sqlite3_create_function_v2(db_, "sqlbranch_txid", 0, SQLITE_UTF8, nullptr,
                               nullptr, nullptr, nullptr, nullptr);
}

int CaptureEngine::on_commit(void* self) {
    static_cast<CaptureEngine*>(self)->tx_ = 0;
    return 0;
}

void CaptureEngine::on_rollback(void* self) {
    static_cast<CaptureEngine*>(self)->tx_ = 0;
}

TxId CaptureEngine::current_tx() {
    if (tx_ != 0) return tx_;
    auto stmt = prepare(db_,
        "SELECT max(coalesce((SELECT max(tx) FROM _sqlbranch_change_log), 0),"
        "           coalesce((SELECT max(tx) FROM _sqlbranch_ddl_log), 0))");
    TxId logged = step_row(db_, stmt.get()) ? sqlite3_column_int64(stmt.get(), 0) : 0;
    tx_ = std::max(logged, last_tx_) + 1;
    last_tx_ = tx_;
    return tx_;
}

std::shared_ptr<const TableDescriptor> CaptureEngine::descriptor(const std::string& table) {
    auto version = catalog_.schema_version();
    if (version != cache_version_) {
        cache_.clear();
        cache_version_ = version;
    }
    auto it = cache_.find(table);
    if (it != cache_.end()) return it->second;

    auto desc = std::make_shared<const TableDescriptor>(catalog_.describe(table));
    cache_.emplace(table, desc);
    SPDLOG_DEBUG("cached descriptor for {} ({} columns)", table, desc->columns.size());
    return desc;
}

void CaptureEngine::capture_fn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    static_cast<CaptureEngine*>(sqlite3_user_data(ctx))->capture(ctx, argc, argv);
}

void CaptureEngine::txid_fn(sqlite3_context* ctx, int, sqlite3_value**) {
    try {
        sqlite3_result_int64(
            ctx, static_cast<CaptureEngine*>(sqlite3_user_data(ctx))->current_tx());
    } catch (const std::exception& e) {
        sqlite3_result_error(ctx, e.what(), -1);
    }
}

void CaptureEngine::capture(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc < 3) {
        sqlite3_result_error(ctx, "sqlbranch_capture: expected relation, operation, fingerprint", -1);
        return;
    }
    auto text = [&](int i) {
        auto* p = reinterpret_cast<const char*>(sqlite3_value_text(argv[i]));
        return p ? std::string(p) : std::string();
    };
    std::string rel = text(0);
    std::string op = text(1);

    try {
        auto desc = descriptor(rel);
        if (desc->primary_key.empty()) {
            throw Error(ErrorCode::PreconditionFailed,
                        "relation \"" + rel + "\" has no primary key; cannot capture changes");
        }
        auto kind = op_from_code(op.empty() ? '?' : op[0]);
        auto stored = desc->stored_columns();
        std::size_t width = kind == OpKind::Update ? 2 : 1;
        if (text(2) != std::to_string(desc->fingerprint) ||
            static_cast<std::size_t>(argc) != 3 + stored.size() * width) {
            throw Error(ErrorCode::PreconditionFailed,
                        "capture trigger on \"" + rel + "\" is stale; the relation changed "
                        "shape since installation, reinstall capture");
        }

        auto old_value = [&](std::size_t i) { return argv[3 + i * width]; };
        auto new_value = [&](std::size_t i) { return argv[3 + i * width + width - 1]; };
        auto entry = [&](std::size_t i, sqlite3_value* v) {
            return encode_typed(to_typed(stored[i]->type, to_value(v)));
        };

        auto key = nlohmann::ordered_json::object();
        for (const auto& pk : desc->primary_key) {
            for (std::size_t i = 0; i < stored.size(); ++i) {
                if (stored[i]->name != pk) continue;
                key[pk] = entry(i, kind == OpKind::Delete ? old_value(i) : new_value(i));
            }
        }

        auto cols = nlohmann::ordered_json::object();
        if (kind == OpKind::Insert) {
            for (std::size_t i = 0; i < stored.size(); ++i) {
                cols[stored[i]->name] = entry(i, new_value(i));
            }
        } else if (kind == OpKind::Update) {
            for (std::size_t i = 0; i < stored.size(); ++i) {
                if (distinct(old_value(i), new_value(i))) {
                    cols[stored[i]->name] = entry(i, new_value(i));
                }
            }
            if (cols.empty()) {
                sqlite3_result_null(ctx);
                return;
            }
        }

        nlohmann::ordered_json payload;
        payload["key"] = std::move(key);
        payload["cols"] = std::move(cols);
        auto out = payload.dump();
        sqlite3_result_text(ctx, out.data(), static_cast<int>(out.size()), SQLITE_TRANSIENT);
    } catch (const std::exception& e) {
        sqlite3_result_error(ctx, e.what(), -1);
    }
}

bool CaptureEngine::install(const std::string& table) {
    if (is_bookkeeping(table)) {
        throw Error(ErrorCode::PreconditionFailed,
                    "relation \"" + table + "\" is bookkeeping; it is never captured");
    }
    auto desc = catalog_.describe(table);
    if (desc.primary_key.empty()) {
        throw Error(ErrorCode::PreconditionFailed,
                    "relation \"" + desc.name + "\" has no primary key; change capture requires one");
    }

    bool changed = false;
    std::optional<WriteScope> scope;
    for (const auto& [name, sql] : compile_capture(desc)) {
        if (catalog_.object_definition(name) == sql) continue;
        if (!scope) scope.emplace(db_, "sqlbranch_install");
        exec(db_, "DROP TRIGGER IF EXISTS main." + quote_ident(name));
        exec(db_, sql);
        changed = true;
    }
    if (scope) scope->commit();
    cache_.erase(desc.name);

    if (changed) SPDLOG_INFO("installed change capture on {}", desc.name);
    return changed;
}

void CaptureEngine::uninstall(const std::string& table) {
    WriteScope scope(db_, "sqlbranch_uninstall");
    for (char op : {'i', 'u', 'd'}) {
        exec(db_, "DROP TRIGGER IF EXISTS main." + quote_ident(trigger_name(op, table)));
    }
    scope.commit();
    cache_.erase(table);
    SPDLOG_INFO("removed change capture from {}", table);
}

bool CaptureEngine::installed(const std::string& table) const {
    for (char op : {'i', 'u', 'd'}) {
        if (catalog_.object_type(trigger_name(op, table)) != "trigger") return false;
    }
    return true;
}

std::vector<std::string> CaptureEngine::remove_strays() {
    auto stmt = prepare(db_,
        "SELECT name, tbl_name FROM main.sqlite_schema "
        "WHERE type='trigger' AND substr(name, 1, ?1) = ?2");
    sqlite3_bind_int(stmt.get(), 1, static_cast<int>(kCapturePrefix.size()));
    bind_text(stmt.get(), 2, kCapturePrefix);

    std::vector<std::string> strays;
    while (step_row(db_, stmt.get())) {
        auto name = column_text(stmt.get(), 0);
        auto table = column_text(stmt.get(), 1);
        bool expected = false;
        for (char op : {'i', 'u', 'd'}) {
            if (name == trigger_name(op, table)) expected = true;
        }
        auto desc_ok = expected && !is_bookkeeping(table);
        if (desc_ok) {
            auto desc = catalog_.describe(table);
            desc_ok = !desc.primary_key.empty();
        }
        if (!desc_ok) strays.push_back(std::move(name));
    }
    stmt.reset();

    if (!strays.empty()) {
        WriteScope scope(db_, "sqlbranch_strays");
        for (const auto& name : strays) {
            exec(db_, "DROP TRIGGER IF EXISTS main." + quote_ident(name));
            SPDLOG_WARN("removed stray capture trigger {}", name);
        }
        scope.commit();
    }
    return strays;
}

InstallReport CaptureEngine::ensure_installed() {
    InstallReport report;
    for (const auto& table : catalog_.list_tables()) {
        try {
            if (install(table)) report.installed.push_back(table);
            else report.unchanged.push_back(table);
        } catch (const Error& e) {
            SPDLOG_WARN("skipping change capture on {}: {}", table, e.what());
            report.skipped.emplace_back(table, e.what());
        }
    }
    report.removed = remove_strays();
    SPDLOG_INFO("capture pass: {} installed, {} unchanged, {} skipped, {} removed",
                report.installed.size(), report.unchanged.size(),
                report.skipped.size(), report.removed.size());
    return report;
}

} // namespace sqlbranch::detail

// ── audit.h ─────────────────────────────────────────────────────
namespace sqlbranch::detail {

/// One schema object a statement touches, as the authorizer reported it.
struct TouchedObject {
    std::string command_tag;
    std::string object_type;
    std::string schema;
    std::string name;

    bool is_drop() const { return command_tag.rfind("DROP", 0) == 0; }
    bool is_create() const { return command_tag.rfind("CREATE", 0) == 0; }
    std::string identity() const { return schema + "." + name; }
};

/// Catalog state of the touched objects at one point of a command.
struct ReadPoint {
    struct Entry {
        bool                       exists = false;
        std::optional<std::string> definition;
        std::size_t                column_count = 0;
    };
    std::vector<Entry> entries;  ///< Parallel to the touched objects.
};

/// Schema-change audit for one connection. Objects are discovered by
/// the authorizer at prepare time; statements run through execute()
/// get start and end records around their step.
class DdlAuditor {
public:
    DdlAuditor(sqlite3* db, const TrackerConfig& config, std::string database_name,
               std::string actor, CaptureEngine& capture);
    ~DdlAuditor();

    DdlAuditor(const DdlAuditor&) = delete;
    DdlAuditor& operator=(const DdlAuditor&) = delete;

    void execute(std::string_view sql);

    std::size_t gap_count(AuditGap gap) const {
        return gaps_[static_cast<std::size_t>(gap)];
    }

private:
    enum class Mode : std::uint8_t { Idle, Preparing, Running };

    static int authorize(void* self, int action, const char* a1, const char* a2,
                         const char* db_name, const char* inner);
    void on_authorize(int action, const char* a1, const char* a2, const char* db_name);

    void run(sqlite3_stmt* stmt, const std::string& text);
    void audited(StmtGuard stmt, const std::vector<TouchedObject>& objects);
    ReadPoint read(const std::vector<TouchedObject>& objects) const;
    void write(const TouchedObject& obj, std::string_view tag, DdlPhase phase,
               const std::string& sql_text, const std::optional<std::string>& pre,
               const std::optional<std::string>& post);
    void note_gap(AuditGap gap, const std::string& what);

    sqlite3*                   db_;
    const TrackerConfig&       config_;
    std::string                database_name_;
    std::string                actor_;
    CaptureEngine&             capture_;
    CatalogInspector           catalog_;
    SchemaRenderer             renderer_;
    Mode                       mode_ = Mode::Idle;
    std::vector<TouchedObject> touched_;
    std::array<std::size_t, 3> gaps_{};
};

} // namespace sqlbranch::detail

// ── audit.cpp ───────────────────────────────────────────────────
namespace sqlbranch::detail {

namespace {

struct ActionInfo {
    const char* tag;
    const char* type;
    bool        temp;
};

std::optional<ActionInfo> ddl_action(int action) {
    switch (action) {
    case SQLITE_CREATE_TABLE:        return ActionInfo{"CREATE TABLE", "table", false};
    case SQLITE_CREATE_TEMP_TABLE:   return ActionInfo{"CREATE TABLE", "table", true};
    case SQLITE_CREATE_INDEX:        return ActionInfo{"CREATE INDEX", "index", false};
    case SQLITE_CREATE_TEMP_INDEX:   return ActionInfo{"CREATE INDEX", "index", true};
    case SQLITE_CREATE_VIEW:         return ActionInfo{"CREATE VIEW", "view", false};
    case SQLITE_CREATE_TEMP_VIEW:    return ActionInfo{"CREATE VIEW", "view", true};
    case SQLITE_CREATE_TRIGGER:      return ActionInfo{"CREATE TRIGGER", "trigger", false};
    case SQLITE_CREATE_TEMP_TRIGGER: return ActionInfo{"CREATE TRIGGER", "trigger", true};
    case SQLITE_DROP_TABLE:          return ActionInfo{"DROP TABLE", "table", false};
    case SQLITE_DROP_TEMP_TABLE:     return ActionInfo{"DROP TABLE", "table", true};
    case SQLITE_DROP_INDEX:          return ActionInfo{"DROP INDEX", "index", false};
    case SQLITE_DROP_TEMP_INDEX:     return ActionInfo{"DROP INDEX", "index", true};
    case SQLITE_DROP_VIEW:           return ActionInfo{"DROP VIEW", "view", false};
    case SQLITE_DROP_TEMP_VIEW:      return ActionInfo{"DROP VIEW", "view", true};
    case SQLITE_DROP_TRIGGER:        return ActionInfo{"DROP TRIGGER", "trigger", false};
    case SQLITE_DROP_TEMP_TRIGGER:   return ActionInfo{"DROP TRIGGER", "trigger", true};
    case SQLITE_ALTER_TABLE:         return ActionInfo{"ALTER TABLE", "table", false};
    default:                         return std::nullopt;
    }
}

/// Sets a value for the scope and restores the previous one on exit.
template <typename T>
class ScopedValue {
public:
    ScopedValue(T& slot, T value) : slot_(slot), old_(slot) { slot_ = value; }
    ~ScopedValue() { slot_ = old_; }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

private:
    T& slot_;
    T  old_;
};

} // namespace

DdlAuditor::DdlAuditor(sqlite3* db, const TrackerConfig& config, std::string database_name,
                       std::string actor, CaptureEngine& capture)
    : db_(db), config_(config), database_name_(std::move(database_name)),
      actor_(std::move(actor)), capture_(capture), catalog_(db), renderer_(db) {
    int rc = sqlite3_set_authorizer(db_, &DdlAuditor::authorize, this);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError,
                    std::string("installing DDL listener: ") + sqlite3_errmsg(db_));
    }
}

DdlAuditor::~DdlAuditor() {
    sqlite3_set_authorizer(db_, nullptr, nullptr);
}

int DdlAuditor::authorize(void* self, int action, const char* a1, const char* a2,
                          const char* db_name, const char*) {
    static_cast<DdlAuditor*>(self)->on_authorize(action, a1, a2, db_name);
    return SQLITE_OK;
}

void DdlAuditor::on_authorize(int action, const char* a1, const char* a2,
                              const char* db_name) {
    if (mode_ == Mode::Running) return;
    auto info = ddl_action(action);
    if (!info) return;

    TouchedObject obj;
    obj.command_tag = info->tag;
    obj.object_type = info->type;
    if (action == SQLITE_ALTER_TABLE) {
        obj.schema = a1 ? a1 : "main";
        obj.name = a2 ? a2 : "";
    } else {
        obj.schema = info->temp ? "temp" : (db_name ? db_name : "main");
        obj.name = a1 ? a1 : "";
    }
    if (obj.name.empty() || obj.name.rfind("sqlite_", 0) == 0 || is_bookkeeping(obj.name)) {
        return;
    }
    const auto& kinds = config_.audited_kinds;
    if (std::find(kinds.begin(), kinds.end(), obj.object_type) == kinds.end()) return;

    if (mode_ == Mode::Idle) {
        note_gap(AuditGap::UntrackedStatement, obj.command_tag + " " + obj.identity());
        return;
    }
    for (const auto& t : touched_) {
        if (t.command_tag == obj.command_tag && t.schema == obj.schema && t.name == obj.name) {
            return;
        }
    }
    touched_.push_back(std::move(obj));
}

void DdlAuditor::note_gap(AuditGap gap, const std::string& what) {
    ++gaps_[static_cast<std::size_t>(gap)];
    SPDLOG_WARN("schema change not fully audited ({}): {}", gap_name(gap), what);
}

void DdlAuditor::run(sqlite3_stmt* stmt, const std::string& text) {
    ScopedValue guard(mode_, Mode::Running);
    for (;;) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) return;
        if (rc != SQLITE_ROW) {
            throw Error(ErrorCode::SqliteError,
                        "executing \"" + text + "\": " + sqlite3_errmsg(db_));
        }
    }
}

void DdlAuditor::execute(std::string_view sql) {
    const char* p = sql.data();
    const char* end = sql.data() + sql.size();
    while (p < end) {
        touched_.clear();
        sqlite3_stmt* raw = nullptr;
        const char* tail = nullptr;
        int rc;
        {
            ScopedValue guard(mode_, Mode::Preparing);
            rc = sqlite3_prepare_v2(db_, p, static_cast<int>(end - p), &raw, &tail);
        }
        if (rc != SQLITE_OK) {
            throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db_));
        }
        p = tail;
        if (!raw) continue;  // whitespace or comment

        StmtGuard stmt(raw);
        auto objects = std::move(touched_);
        touched_.clear();
        if (objects.empty()) {
            run(stmt.get(), sqlite3_sql(stmt.get()));
        } else {
            audited(std::move(stmt), objects);
        }
    }
}

ReadPoint DdlAuditor::read(const std::vector<TouchedObject>& objects) const {
    ReadPoint point;
    for (const auto& obj : objects) {
        ReadPoint::Entry e;
        e.exists = !catalog_.object_type(obj.name, obj.schema).empty();
        if (e.exists && obj.object_type == "table") {
            auto stmt = prepare(db_, "SELECT count(*) FROM pragma_table_xinfo(?1, ?2)");
            bind_text(stmt.get(), 1, obj.name);
            bind_text(stmt.get(), 2, obj.schema);
            if (step_row(db_, stmt.get())) {
                e.column_count = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
            }
        } else if (e.exists) {
            e.definition = catalog_.object_definition(obj.name, obj.schema);
        }
        point.entries.push_back(std::move(e));
    }
    return point;
}

void DdlAuditor::write(const TouchedObject& obj, std::string_view tag, DdlPhase phase,
                       const std::string& sql_text, const std::optional<std::string>& pre,
                       const std::optional<std::string>& post) {
    auto stmt = prepare(db_,
        "INSERT INTO _sqlbranch_ddl_log (username, dbname, tx, command_tag, object_type, "
        "schema_name, object_identity, phase, sql_text, pre_def, post_def) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    bind_text(stmt.get(), 1, actor_);
    bind_text(stmt.get(), 2, database_name_);
    sqlite3_bind_int64(stmt.get(), 3, capture_.current_tx());
    bind_text(stmt.get(), 4, tag);
    bind_text(stmt.get(), 5, obj.object_type);
    bind_text(stmt.get(), 6, obj.schema);
    bind_text(stmt.get(), 7, obj.identity());
    bind_text(stmt.get(), 8, phase_name(phase));
    bind_text(stmt.get(), 9, sql_text);
    bind_optional(stmt.get(), 10, pre);
    bind_optional(stmt.get(), 11, post);
    step_done(db_, stmt.get());
    SPDLOG_DEBUG("ddl {} {} {}", phase_name(phase), tag, obj.identity());
}

void DdlAuditor::audited(StmtGuard stmt, const std::vector<TouchedObject>& objects) {
    std::string text = sqlite3_sql(stmt.get());
    WriteScope scope(db_, "sqlbranch_ddl");

    // Read point 1: before the command runs.
    auto before = read(objects);
    std::vector<std::string> lifted;
    for (std::size_t i = 0; i < objects.size(); ++i) {
        const auto& obj = objects[i];
        if (obj.is_drop()) continue;
        if (obj.is_create() && before.entries[i].exists) continue;  // IF NOT EXISTS
        std::optional<std::string> pre;
        if (obj.object_type != "table") pre = before.entries[i].definition;
        write(obj, obj.command_tag, DdlPhase::Start, text, pre, std::nullopt);

        // Capture triggers reference columns by name, which blocks some
        // ALTERs; lift them for the command and reinstall afterwards.
        if (obj.command_tag == "ALTER TABLE" && obj.schema == "main" &&
            capture_.installed(obj.name)) {
            capture_.uninstall(obj.name);
            lifted.push_back(obj.name);
        }
    }

    run(stmt.get(), text);
    stmt.reset();

    // Read point 2: after the command ran.
    auto after = read(objects);
    bool resweep = !lifted.empty();
    for (std::size_t i = 0; i < objects.size(); ++i) {
        const auto& obj = objects[i];
        const auto& was = before.entries[i];
        const auto& now = after.entries[i];

        if (obj.is_drop()) {
            if (obj.object_type == "table") {
                write(obj, obj.command_tag, DdlPhase::End, text, std::nullopt, std::nullopt);
            } else {
                note_gap(AuditGap::NonTableDrop, obj.command_tag + " " + obj.identity());
            }
            continue;
        }
        if (obj.is_create() && was.exists) continue;

        std::optional<std::string> post;
        if (obj.object_type == "table" && obj.command_tag == "CREATE TABLE") {
            if (!now.exists) {
                throw Error(ErrorCode::PreconditionFailed,
                            "cannot map " + obj.identity() + " back to a catalog entry");
            }
            try {
                post = renderer_.render(obj.name, obj.schema);
            } catch (const Error& e) {
                if (e.code() != ErrorCode::NotFound) throw;
                throw Error(ErrorCode::PreconditionFailed,
                            "cannot map " + obj.identity() + " back to a catalog entry: " +
                                e.what());
            }
            if (config_.auto_install && obj.schema == "main") {
                try {
                    capture_.install(obj.name);
                } catch (const Error& e) {
                    if (e.code() != ErrorCode::PreconditionFailed) throw;
                    SPDLOG_WARN("not capturing {}: {}", obj.name, e.what());
                }
            }
        } else if (obj.object_type == "table") {
            post = text;
            note_gap(AuditGap::AlterDefinition, obj.identity());
            if (now.exists && now.column_count < was.column_count) {
                write(obj, "TABLE REWRITE", DdlPhase::End, text, std::nullopt, std::nullopt);
            }
            if (config_.auto_install && obj.schema == "main") resweep = true;
        } else {
            post = now.definition;
        }
        write(obj, obj.command_tag, DdlPhase::End, text, std::nullopt, post);
    }

    if (resweep) capture_.ensure_installed();
    scope.commit();
}

} // namespace sqlbranch::detail

// ── tracker.cpp ─────────────────────────────────────────────────
namespace sqlbranch {

struct Tracker::Impl {
    sqlite3*                              db;
    TrackerConfig                         config;
    std::string                           database_name;
    std::unique_ptr<detail::CaptureEngine> capture;
    std::unique_ptr<detail::DdlAuditor>    audit;

    static std::string derive_name(sqlite3* db, const TrackerConfig& config) {
        if (!config.database_name.empty()) return config.database_name;
        const char* file = sqlite3_db_filename(db, "main");
        if (!file || !*file) return "main";
        return std::filesystem::path(file).stem().string();
    }

    static std::string derive_actor(const TrackerConfig& config) {
        if (!config.actor.empty()) return config.actor;
        if (const char* user = std::getenv("USER")) return user;
        return "unknown";
    }

    ChangeRecord read_change(sqlite3_stmt* stmt) const {
        ChangeRecord rec;
        rec.id = sqlite3_column_int64(stmt, 0);
        rec.relation = detail::column_text(stmt, 1);
        auto op = detail::column_text(stmt, 2);
        rec.op = op_from_code(op.empty() ? '?' : op[0]);
        rec.key = detail::decode_columns(detail::column_text(stmt, 3));
        rec.columns = detail::decode_columns(detail::column_text(stmt, 4));
        rec.tx = sqlite3_column_int64(stmt, 5);
        rec.timestamp = detail::column_text(stmt, 6);
        return rec;
    }
};

Tracker::Tracker(sqlite3* db, TrackerConfig config)
    : impl_(std::make_unique<Impl>()) {
    impl_->db = db;
    impl_->config = std::move(config);
    impl_->database_name = Impl::derive_name(db, impl_->config);
    detail::ensure_log_tables(db);
    // REPLACE conflict resolution fires delete triggers only when recursive.
    detail::exec(db, "PRAGMA recursive_triggers = ON");
    impl_->capture = std::make_unique<detail::CaptureEngine>(db);
    impl_->audit = std::make_unique<detail::DdlAuditor>(
        db, impl_->config, impl_->database_name, Impl::derive_actor(impl_->config),
        *impl_->capture);
    SPDLOG_INFO("tracker attached to {}", impl_->database_name);
}

Tracker::~Tracker() = default;
Tracker::Tracker(Tracker&&) noexcept = default;
Tracker& Tracker::operator=(Tracker&&) noexcept = default;

void Tracker::execute(std::string_view sql) {
    impl_->audit->execute(sql);
}

bool Tracker::install_capture(const std::string& table) {
    return impl_->capture->install(table);
}

InstallReport Tracker::ensure_capture() {
    return impl_->capture->ensure_installed();
}

void Tracker::remove_capture(const std::string& table) {
    impl_->capture->uninstall(table);
}

bool Tracker::capture_installed(const std::string& table) const {
    return impl_->capture->installed(table);
}

std::vector<ChangeRecord> Tracker::changes(RecordId after) const {
    auto stmt = detail::prepare(impl_->db,
        "SELECT id, rel, op, key, cols, tx, ts FROM _sqlbranch_change_log "
        "WHERE id > ? ORDER BY id");
    sqlite3_bind_int64(stmt.get(), 1, after);
    std::vector<ChangeRecord> out;
    while (detail::step_row(impl_->db, stmt.get())) {
        out.push_back(impl_->read_change(stmt.get()));
    }
    return out;
}

std::optional<ChangeRecord> Tracker::change(RecordId id) const {
    auto stmt = detail::prepare(impl_->db,
        "SELECT id, rel, op, key, cols, tx, ts FROM _sqlbranch_change_log WHERE id = ?");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (detail::step_row(impl_->db, stmt.get())) return impl_->read_change(stmt.get());
    return std::nullopt;
}

std::vector<DdlRecord> Tracker::ddl_records(RecordId after) const {
    auto stmt = detail::prepare(impl_->db,
        "SELECT id, ts, username, dbname, tx, command_tag, object_type, schema_name, "
        "object_identity, phase, sql_text, pre_def, post_def "
        "FROM _sqlbranch_ddl_log WHERE id > ? ORDER BY id");
    sqlite3_bind_int64(stmt.get(), 1, after);
    std::vector<DdlRecord> out;
    while (detail::step_row(impl_->db, stmt.get())) {
        DdlRecord r;
        r.id = sqlite3_column_int64(stmt.get(), 0);
        r.timestamp = detail::column_text(stmt.get(), 1);
        r.username = detail::column_text(stmt.get(), 2);
        r.database = detail::column_text(stmt.get(), 3);
        r.tx = sqlite3_column_int64(stmt.get(), 4);
        r.command_tag = detail::column_text(stmt.get(), 5);
        r.object_type = detail::column_text(stmt.get(), 6);
        r.schema_name = detail::column_text(stmt.get(), 7);
        r.object_identity = detail::column_text(stmt.get(), 8);
        r.phase = detail::column_text(stmt.get(), 9) == "start" ? DdlPhase::Start : DdlPhase::End;
        r.sql_text = detail::column_optional(stmt.get(), 10);
        r.pre_definition = detail::column_optional(stmt.get(), 11);
        r.post_definition = detail::column_optional(stmt.get(), 12);
        out.push_back(std::move(r));
    }
    return out;
}

void Tracker::replay(RecordId id, sqlite3* target) const {
    auto rec = change(id);
    if (!rec) {
        throw Error(ErrorCode::NotFound, "change record " + std::to_string(id) + " does not exist");
    }
    ReplayEngine(target).apply(*rec);
}

std::size_t Tracker::gap_count(AuditGap gap) const {
    return impl_->audit->gap_count(gap);
}

const std::string& Tracker::database_name() const {
    return impl_->database_name;
}

} // namespace sqlbranch

// ── replay.cpp ──────────────────────────────────────────────────
namespace sqlbranch {

namespace {

std::string record_label(const ChangeRecord& rec) {
    return "change record " + std::to_string(rec.id) + " on \"" + rec.relation + "\"";
}

} // namespace

std::optional<ReplayStatement> ReplayEngine::build_statement(const ChangeRecord& rec) {
    using detail::quote_ident;
    ReplayStatement st;
    auto table = quote_ident(rec.relation);

    auto where = [&] {
        if (rec.key.empty()) {
            throw Error(ErrorCode::ReplayMismatch, record_label(rec) + " has no key");
        }
        std::string w;
        for (const auto& k : rec.key) {
            if (!w.empty()) w += " AND ";
            w += quote_ident(k.name) + " IS ?";
            st.params.push_back(from_typed(k.value));
        }
        return w;
    };

    switch (rec.op) {
    case OpKind::Insert: {
        if (rec.columns.empty()) {
            st.sql = "INSERT INTO " + table + " DEFAULT VALUES";
            return st;
        }
        std::string names, marks;
        for (const auto& c : rec.columns) {
            if (!names.empty()) {
                names += ", ";
                marks += ", ";
            }
            names += quote_ident(c.name);
            marks += "?";
            st.params.push_back(from_typed(c.value));
        }
        st.sql = "INSERT INTO " + table + " (" + names + ") VALUES (" + marks + ")";
        return st;
    }
    case OpKind::Update: {
        if (rec.columns.empty()) return std::nullopt;
        std::string sets;
        for (const auto& c : rec.columns) {
            if (!sets.empty()) sets += ", ";
            sets += quote_ident(c.name) + " = ?";
            st.params.push_back(from_typed(c.value));
        }
        st.sql = "UPDATE " + table + " SET " + sets;
        st.sql += " WHERE " + where();
        return st;
    }
    case OpKind::Delete:
        st.sql = "DELETE FROM " + table;
        st.sql += " WHERE " + where();
        return st;
    }
    return std::nullopt;
}

void ReplayEngine::apply(const ChangeRecord& rec) {
    CatalogInspector catalog(target_);
    if (!catalog.exists(rec.relation)) {
        throw Error(ErrorCode::ReplayMismatch,
                    record_label(rec) + ": relation does not exist on the target");
    }
    auto desc = catalog.describe(rec.relation);
    for (const auto* set : {&rec.key, &rec.columns}) {
        for (const auto& c : *set) {
            const auto* col = desc.column(c.name);
            if (!col || col->generated != GeneratedKind::None) {
                throw Error(ErrorCode::ReplayMismatch,
                            record_label(rec) + ": column \"" + c.name +
                            "\" is not a writable column of the target relation");
            }
        }
    }

    auto st = build_statement(rec);
    if (!st) {
        SPDLOG_DEBUG("{}: nothing to apply", record_label(rec));
        return;
    }

    auto stmt = detail::prepare(target_, st->sql);
    for (std::size_t i = 0; i < st->params.size(); ++i) {
        detail::bind_value(stmt.get(), static_cast<int>(i + 1), st->params[i]);
    }
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError,
                    record_label(rec) + ": " + sqlite3_errmsg(target_));
    }
    if (rec.op != OpKind::Insert && sqlite3_changes(target_) == 0) {
        throw Error(ErrorCode::ReplayMismatch,
                    record_label(rec) + ": no row on the target matches the key");
    }
    SPDLOG_DEBUG("applied {}", record_label(rec));
}

} // namespace sqlbranch

// ── digest.cpp ──────────────────────────────────────────────────
namespace sqlbranch {

namespace {

void hash_value(detail::Fnv64& h, sqlite3_stmt* stmt, int col) {
    int type = sqlite3_column_type(stmt, col);
    h.add_byte(static_cast<std::uint8_t>(type));
    switch (type) {
    case SQLITE_INTEGER: {
        auto v = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, col));
        for (int i = 0; i < 8; ++i) h.add_byte(static_cast<std::uint8_t>(v >> (8 * i)));
        break;
    }
    case SQLITE_FLOAT: {
        double d = sqlite3_column_double(stmt, col);
        std::uint64_t v;
        std::memcpy(&v, &d, sizeof v);
        for (int i = 0; i < 8; ++i) h.add_byte(static_cast<std::uint8_t>(v >> (8 * i)));
        break;
    }
    case SQLITE_TEXT:
    case SQLITE_BLOB: {
        const void* p = type == SQLITE_TEXT
            ? static_cast<const void*>(sqlite3_column_text(stmt, col))
            : sqlite3_column_blob(stmt, col);
        auto n = static_cast<std::uint32_t>(sqlite3_column_bytes(stmt, col));
        for (int i = 0; i < 4; ++i) h.add_byte(static_cast<std::uint8_t>(n >> (8 * i)));
        if (n > 0) h.add(p, n);
        break;
    }
    default:
        break;
    }
}

void digest_fn(sqlite3_context* ctx, int, sqlite3_value** argv) {
    auto* digester = static_cast<Digester*>(sqlite3_user_data(ctx));
    try {
        auto* table = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
        if (!table) throw Error(ErrorCode::NotFound, "sqlbranch_digest: table name is NULL");
        auto out = digester->digest(sqlite3_context_db_handle(ctx), table,
                                    sqlite3_value_int(argv[1]));
        sqlite3_result_text(ctx, out.data(), static_cast<int>(out.size()), SQLITE_TRANSIENT);
    } catch (const std::exception& e) {
        sqlite3_result_error(ctx, e.what(), -1);
    }
}

} // namespace

std::string RowDigester::digest(sqlite3* db, const std::string& table, int batch_size) {
    if (batch_size <= 0) {
        throw Error(ErrorCode::InvalidState, "digest batch size must be positive");
    }
    auto desc = CatalogInspector(db).describe(table);
    if (desc.primary_key.empty()) {
        throw Error(ErrorCode::PreconditionFailed,
                    "relation \"" + desc.name + "\" has no primary key; cannot page it");
    }

    std::string cols, key, marks;
    std::vector<int> key_index;
    for (std::size_t i = 0; i < desc.columns.size(); ++i) {
        if (!cols.empty()) cols += ", ";
        cols += detail::quote_ident(desc.columns[i].name);
    }
    for (const auto& k : desc.primary_key) {
        if (!key.empty()) {
            key += ", ";
            marks += ", ";
        }
        key += detail::quote_ident(k);
        marks += "?";
        for (std::size_t i = 0; i < desc.columns.size(); ++i) {
            if (desc.columns[i].name == k) key_index.push_back(static_cast<int>(i));
        }
    }
    auto from = " FROM " + detail::quote_ident(desc.name);
    auto first_sql = "SELECT " + cols + from + " ORDER BY " + key + " LIMIT ?";
    auto next_sql = "SELECT " + cols + from + " WHERE (" + key + ") > (" + marks +
                    ") ORDER BY " + key + " LIMIT ?";

    detail::Fnv64 hash;
    std::vector<Value> last;
    std::size_t rows = 0;
    for (;;) {
        auto stmt = detail::prepare(db, last.empty() ? first_sql : next_sql);
        int idx = 1;
        for (const auto& v : last) detail::bind_value(stmt.get(), idx++, v);
        sqlite3_bind_int(stmt.get(), idx, batch_size);

        int fetched = 0;
        while (detail::step_row(db, stmt.get())) {
            for (int c = 0; c < static_cast<int>(desc.columns.size()); ++c) {
                hash_value(hash, stmt.get(), c);
            }
            last.clear();
            for (int k : key_index) last.push_back(detail::column_value(stmt.get(), k));
            ++fetched;
        }
        rows += static_cast<std::size_t>(fetched);
        if (fetched < batch_size) break;
    }

    char buf[17];
    std::snprintf(buf, sizeof buf, "%016" PRIx64, hash.value());
    SPDLOG_DEBUG("digest of {}: {} rows, {}", desc.name, rows, buf);
    return buf;
}

void register_digest_function(sqlite3* db, Digester& digester) {
    int rc = sqlite3_create_function_v2(db, "sqlbranch_digest", 2,
                                        SQLITE_UTF8 | SQLITE_DIRECTONLY, &digester,
                                        &digest_fn, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError,
                    std::string("registering sqlbranch_digest: ") + sqlite3_errmsg(db));
    }
}

} // namespace sqlbranch

// ── registry.cpp ────────────────────────────────────────────────
namespace sqlbranch {

namespace {

// Applied in order; PRAGMA user_version records how many have run.
constexpr const char* kRegistryMigrations[] = {
    "CREATE TABLE _sqlbranch_databases ("
    "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  name       TEXT NOT NULL UNIQUE,"
    "  path       TEXT NOT NULL,"
    "  parent     INTEGER REFERENCES _sqlbranch_databases (id) ON DELETE RESTRICT,"
    "  created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),"
    "  origin     TEXT NOT NULL"
    ")",

    "CREATE TABLE _sqlbranch_operations ("
    "  id            INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  source_id     INTEGER,"
    "  new_id        INTEGER,"
    "  database_name TEXT NOT NULL,"
    "  kind          TEXT NOT NULL,"
    "  created_at    TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),"
    "  started_at    TEXT,"
    "  finished_at   TEXT,"
    "  status        TEXT NOT NULL,"
    "  step          TEXT NOT NULL,"
    "  error         TEXT"
    ");"
    "CREATE INDEX _sqlbranch_operations_by_name ON _sqlbranch_operations (database_name)",
};

constexpr int kRegistryVersion =
    static_cast<int>(sizeof(kRegistryMigrations) / sizeof(kRegistryMigrations[0]));

constexpr const char* kDatabaseColumns =
    "SELECT id, name, path, parent, created_at, origin FROM _sqlbranch_databases ";

constexpr const char* kOperationColumns =
    "SELECT id, source_id, new_id, database_name, kind, created_at, started_at, "
    "finished_at, status, step, error FROM _sqlbranch_operations ";

constexpr const char* kNow = "strftime('%Y-%m-%dT%H:%M:%fZ', 'now')";

TrackedDatabase read_database(sqlite3_stmt* stmt) {
    TrackedDatabase db;
    db.id = sqlite3_column_int64(stmt, 0);
    db.name = detail::column_text(stmt, 1);
    db.path = detail::column_text(stmt, 2);
    db.parent = detail::column_optional_int(stmt, 3);
    db.created_at = detail::column_text(stmt, 4);
    db.origin = detail::column_text(stmt, 5);
    return db;
}

BranchOperation read_operation(sqlite3_stmt* stmt) {
    BranchOperation op;
    op.id = sqlite3_column_int64(stmt, 0);
    op.source_id = detail::column_optional_int(stmt, 1);
    op.new_id = detail::column_optional_int(stmt, 2);
    op.database_name = detail::column_text(stmt, 3);
    op.kind = kind_from_name(detail::column_text(stmt, 4));
    op.created_at = detail::column_text(stmt, 5);
    op.started_at = detail::column_optional(stmt, 6);
    op.finished_at = detail::column_optional(stmt, 7);
    op.status = status_from_name(detail::column_text(stmt, 8));
    op.step = step_from_name(detail::column_text(stmt, 9));
    op.error = detail::column_optional(stmt, 10);
    return op;
}

} // namespace

Registry::Registry(sqlite3* db) : db_(db) {
    detail::exec(db_, "PRAGMA foreign_keys = ON");
    int version = schema_version();
    if (version > kRegistryVersion) {
        throw Error(ErrorCode::InvalidState,
                    "registry schema version " + std::to_string(version) +
                    " is newer than this build supports (" +
                    std::to_string(kRegistryVersion) + ")");
    }
    for (int v = version; v < kRegistryVersion; ++v) {
        detail::WriteScope scope(db_, "sqlbranch_migrate");
        detail::exec(db_, kRegistryMigrations[v]);
        detail::exec(db_, "PRAGMA user_version = " + std::to_string(v + 1));
        scope.commit();
        SPDLOG_INFO("registry migrated to version {}", v + 1);
    }
}

int Registry::schema_version() const {
    auto stmt = detail::prepare(db_, "PRAGMA user_version");
    return detail::step_row(db_, stmt.get()) ? sqlite3_column_int(stmt.get(), 0) : 0;
}

std::optional<TrackedDatabase> Registry::find(const std::string& name) const {
    auto stmt = detail::prepare(db_, std::string(kDatabaseColumns) + "WHERE name = ?");
    detail::bind_text(stmt.get(), 1, name);
    if (detail::step_row(db_, stmt.get())) return read_database(stmt.get());
    return std::nullopt;
}

std::optional<TrackedDatabase> Registry::find(DatabaseId id) const {
    auto stmt = detail::prepare(db_, std::string(kDatabaseColumns) + "WHERE id = ?");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (detail::step_row(db_, stmt.get())) return read_database(stmt.get());
    return std::nullopt;
}

std::vector<TrackedDatabase> Registry::databases() const {
    auto stmt = detail::prepare(db_, std::string(kDatabaseColumns) + "ORDER BY id");
    std::vector<TrackedDatabase> out;
    while (detail::step_row(db_, stmt.get())) out.push_back(read_database(stmt.get()));
    return out;
}

std::vector<TrackedDatabase> Registry::children(DatabaseId parent) const {
    auto stmt = detail::prepare(db_, std::string(kDatabaseColumns) + "WHERE parent = ? ORDER BY id");
    sqlite3_bind_int64(stmt.get(), 1, parent);
    std::vector<TrackedDatabase> out;
    while (detail::step_row(db_, stmt.get())) out.push_back(read_database(stmt.get()));
    return out;
}

TrackedDatabase Registry::add_database(const std::string& name, const std::string& path,
                                       std::optional<DatabaseId> parent,
                                       const std::string& origin) {
    if (find(name)) {
        throw Error(ErrorCode::InvalidState, "database \"" + name + "\" is already tracked");
    }
    if (parent && !find(*parent)) {
        throw Error(ErrorCode::NotFound,
                    "parent database " + std::to_string(*parent) + " is not tracked");
    }
    auto stmt = detail::prepare(db_,
        "INSERT INTO _sqlbranch_databases (name, path, parent, origin) VALUES (?, ?, ?, ?)");
    detail::bind_text(stmt.get(), 1, name);
    detail::bind_text(stmt.get(), 2, path);
    detail::bind_optional(stmt.get(), 3, parent);
    detail::bind_text(stmt.get(), 4, origin);
    detail::step_done(db_, stmt.get());
    SPDLOG_INFO("tracking database {} ({})", name, origin);
    return *find(static_cast<DatabaseId>(sqlite3_last_insert_rowid(db_)));
}

void Registry::remove_database(DatabaseId id) {
    auto kids = children(id);
    if (!kids.empty()) {
        throw Error(ErrorCode::InvalidState,
                    "database " + std::to_string(id) + " has " +
                    std::to_string(kids.size()) + " dependent databases");
    }
    auto stmt = detail::prepare(db_, "DELETE FROM _sqlbranch_databases WHERE id = ?");
    sqlite3_bind_int64(stmt.get(), 1, id);
    detail::step_done(db_, stmt.get());
}

BranchOperation Registry::begin_operation(OperationKind kind,
                                          std::optional<DatabaseId> source,
                                          const std::string& database_name) {
    auto stmt = detail::prepare(db_,
        "INSERT INTO _sqlbranch_operations (source_id, database_name, kind, status, step) "
        "VALUES (?, ?, ?, 'pending', 'pending')");
    detail::bind_optional(stmt.get(), 1, source);
    detail::bind_text(stmt.get(), 2, database_name);
    detail::bind_text(stmt.get(), 3, kind_name(kind));
    detail::step_done(db_, stmt.get());
    return *operation(static_cast<OperationId>(sqlite3_last_insert_rowid(db_)));
}

namespace {

BranchOperation require_open(const Registry& reg, OperationId id) {
    auto op = reg.operation(id);
    if (!op) {
        throw Error(ErrorCode::NotFound, "operation " + std::to_string(id) + " does not exist");
    }
    if (is_terminal(op->step)) {
        throw Error(ErrorCode::InvalidState,
                    "operation " + std::to_string(id) + " is already " +
                    std::string(status_name(op->status)));
    }
    return *op;
}

} // namespace

void Registry::set_source(OperationId id, DatabaseId source) {
    require_open(*this, id);
    auto stmt = detail::prepare(db_, "UPDATE _sqlbranch_operations SET source_id = ? WHERE id = ?");
    sqlite3_bind_int64(stmt.get(), 1, source);
    sqlite3_bind_int64(stmt.get(), 2, id);
    detail::step_done(db_, stmt.get());
}

BranchOperation Registry::advance(OperationId id, BranchStep step) {
    auto op = require_open(*this, id);
    if (is_terminal(step) || static_cast<int>(step) <= static_cast<int>(op.step)) {
        throw Error(ErrorCode::InvalidState,
                    "operation " + std::to_string(id) + " cannot move from " +
                    std::string(step_name(op.step)) + " to " + std::string(step_name(step)));
    }
    auto stmt = detail::prepare(db_,
        std::string("UPDATE _sqlbranch_operations SET step = ?, status = 'running', "
                    "started_at = coalesce(started_at, ") + kNow + ") WHERE id = ?");
    detail::bind_text(stmt.get(), 1, step_name(step));
    sqlite3_bind_int64(stmt.get(), 2, id);
    detail::step_done(db_, stmt.get());
    SPDLOG_INFO("operation {} ({} {}): {}", id, kind_name(op.kind), op.database_name,
                step_name(step));
    return *operation(id);
}

BranchOperation Registry::succeed(OperationId id, std::optional<DatabaseId> new_id) {
    auto op = require_open(*this, id);
    auto stmt = detail::prepare(db_,
        std::string("UPDATE _sqlbranch_operations SET step = 'succeeded', status = 'succeeded', "
                    "new_id = ?, started_at = coalesce(started_at, ") + kNow +
        "), finished_at = " + kNow + " WHERE id = ?");
    detail::bind_optional(stmt.get(), 1, new_id);
    sqlite3_bind_int64(stmt.get(), 2, id);
    detail::step_done(db_, stmt.get());
    SPDLOG_INFO("operation {} ({} {}) succeeded", id, kind_name(op.kind), op.database_name);
    return *operation(id);
}

BranchOperation Registry::fail(OperationId id, const std::string& error) {
    auto op = require_open(*this, id);
    auto stmt = detail::prepare(db_,
        std::string("UPDATE _sqlbranch_operations SET step = 'failed', status = 'failed', "
                    "error = ?, finished_at = ") + kNow + " WHERE id = ?");
    detail::bind_text(stmt.get(), 1, error);
    sqlite3_bind_int64(stmt.get(), 2, id);
    detail::step_done(db_, stmt.get());
    SPDLOG_ERROR("operation {} ({} {}) failed: {}", id, kind_name(op.kind),
                 op.database_name, error);
    return *operation(id);
}

std::optional<BranchOperation> Registry::operation(OperationId id) const {
    auto stmt = detail::prepare(db_, std::string(kOperationColumns) + "WHERE id = ?");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (detail::step_row(db_, stmt.get())) return read_operation(stmt.get());
    return std::nullopt;
}

std::vector<BranchOperation> Registry::operations() const {
    auto stmt = detail::prepare(db_, std::string(kOperationColumns) + "ORDER BY id");
    std::vector<BranchOperation> out;
    while (detail::step_row(db_, stmt.get())) out.push_back(read_operation(stmt.get()));
    return out;
}

} // namespace sqlbranch

// ── storage.cpp ─────────────────────────────────────────────────
namespace sqlbranch {

namespace fs = std::filesystem;

namespace {

/// RAII wrapper for a file descriptor.
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) ::close(fd_); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

[[noreturn]] void throw_errno(const std::string& what) {
    throw Error(ErrorCode::CloneFailed, what + ": " + std::strerror(errno));
}

fs::path sibling(const fs::path& p, const char* suffix) {
    return fs::path(p.string() + suffix);
}

constexpr std::size_t kCopyChunk = 1 << 20;

/// Reflink `src` to `dst`, or copy it in chunks checking `cancel`.
void copy_file(const fs::path& src, const fs::path& dst, const CancelToken& cancel) {
    FdGuard in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0) throw_errno("open " + src.string());
    struct stat st {};
    if (::fstat(in.get(), &st) != 0) throw_errno("stat " + src.string());

    FdGuard out(::open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, st.st_mode & 0777));
    if (out.get() < 0) throw_errno("create " + dst.string());

    if (::ioctl(out.get(), FICLONE, in.get()) == 0) {
        SPDLOG_DEBUG("reflinked {} -> {}", src.string(), dst.string());
        return;
    }

    std::vector<char> buf(kCopyChunk);
    for (;;) {
        if (cancel.cancelled()) {
            throw Error(ErrorCode::Cancelled, "copy of " + src.string() + " cancelled");
        }
        ssize_t n = ::read(in.get(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno("read " + src.string());
        }
        if (n == 0) break;
        for (ssize_t off = 0; off < n;) {
            ssize_t w = ::write(out.get(), buf.data() + off, static_cast<std::size_t>(n - off));
            if (w < 0) {
                if (errno == EINTR) continue;
                throw_errno("write " + dst.string());
            }
            off += w;
        }
    }
    if (::fsync(out.get()) != 0) throw_errno("fsync " + dst.string());
    SPDLOG_DEBUG("copied {} -> {}", src.string(), dst.string());
}

void remove_storage(const fs::path& p) {
    std::error_code ec;
    for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
        fs::remove(sibling(p, suffix), ec);
        if (ec) SPDLOG_WARN("removing {}{}: {}", p.string(), suffix, ec.message());
    }
}

} // namespace

void FileCloner::clone(const fs::path& source, const fs::path& target,
                       const CancelToken& cancel) {
    if (cancel.cancelled()) {
        throw Error(ErrorCode::Cancelled, "clone of " + source.string() + " cancelled");
    }
    if (!fs::exists(source)) {
        throw Error(ErrorCode::CloneFailed, "source storage " + source.string() + " does not exist");
    }
    if (fs::exists(target)) {
        throw Error(ErrorCode::CloneFailed, "target storage " + target.string() + " already exists");
    }

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(source.c_str(), &raw, SQLITE_OPEN_READWRITE, nullptr);
    detail::DbGuard db(raw);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::CloneFailed,
                    "open " + source.string() + ": " + (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
    }
    sqlite3_busy_timeout(db.get(), 5000);

    // Fold the WAL into the main file, then hold the write lock so the
    // files stay consistent while they are duplicated.
    try {
        detail::exec(db.get(), "PRAGMA wal_checkpoint(TRUNCATE)");
        detail::exec(db.get(), "BEGIN IMMEDIATE");
    } catch (const Error& e) {
        throw Error(ErrorCode::CloneFailed,
                    "locking " + source.string() + " for clone: " + e.what());
    }

    try {
        copy_file(source, target, cancel);
        auto wal = sibling(source, "-wal");
        std::error_code ec;
        if (fs::exists(wal) && fs::file_size(wal, ec) > 0 && !ec) {
            copy_file(wal, sibling(target, "-wal"), cancel);
        }
    } catch (const Error&) {
        remove_storage(target);
        char* err = nullptr;
        if (sqlite3_exec(db.get(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            SPDLOG_WARN("releasing clone lock on {}: {}", source.string(), err ? err : "unknown error");
        }
        sqlite3_free(err);
        throw;
    }
    detail::exec(db.get(), "ROLLBACK");
    SPDLOG_INFO("cloned {} -> {}", source.string(), target.string());
}

void PosixOwnershipFixer::fix(const fs::path& path) {
    if (!owner_) return;

    uid_t uid = static_cast<uid_t>(-1);
    gid_t gid = static_cast<gid_t>(-1);
    std::vector<char> buf(16384);

    if (!owner_->user.empty()) {
        struct passwd pw {};
        struct passwd* found = nullptr;
        ::getpwnam_r(owner_->user.c_str(), &pw, buf.data(), buf.size(), &found);
        if (!found) {
            throw Error(ErrorCode::CloneFailed, "unknown user \"" + owner_->user + "\"");
        }
        uid = pw.pw_uid;
        if (owner_->group.empty()) gid = pw.pw_gid;
    }
    if (!owner_->group.empty()) {
        struct group gr {};
        struct group* found = nullptr;
        ::getgrnam_r(owner_->group.c_str(), &gr, buf.data(), buf.size(), &found);
        if (!found) {
            throw Error(ErrorCode::CloneFailed, "unknown group \"" + owner_->group + "\"");
        }
        gid = gr.gr_gid;
    }

    for (const char* suffix : {"", "-wal", "-shm"}) {
        auto p = sibling(path, suffix);
        if (!fs::exists(p)) continue;
        if (::chown(p.c_str(), uid, gid) != 0) throw_errno("chown " + p.string());
    }
    SPDLOG_DEBUG("ownership of {} set to {}:{}", path.string(), owner_->user, owner_->group);
}

} // namespace sqlbranch

// ── orchestrator.cpp ────────────────────────────────────────────
namespace sqlbranch {

struct Orchestrator::Impl {
    sqlite3*                        registry_db;
    Registry                        registry;
    OrchestratorConfig              config;
    std::shared_ptr<StorageCloner>  cloner;
    std::shared_ptr<OwnershipFixer> fixer;

    Impl(sqlite3* db, OrchestratorConfig cfg, std::shared_ptr<StorageCloner> c,
         std::shared_ptr<OwnershipFixer> f)
        : registry_db(db), registry(db), config(std::move(cfg)),
          cloner(std::move(c)), fixer(std::move(f)) {
        if (config.storage_root.empty()) {
            throw Error(ErrorCode::ConfigError, "storage_root is not configured");
        }
        fs::create_directories(config.storage_root);
        if (!cloner) cloner = std::make_shared<FileCloner>();
        if (!fixer) fixer = std::make_shared<PosixOwnershipFixer>(config.owner);
    }

    static void check_name(const std::string& name) {
        if (name.empty() || name.front() == '.' || name.find_first_of("/\\") != std::string::npos ||
            is_bookkeeping(name)) {
            throw Error(ErrorCode::InvalidState, "invalid database name \"" + name + "\"");
        }
    }

    fs::path path_for(const std::string& name) const {
        return config.storage_root / (name + ".db");
    }

    fs::path storage_of(const std::string& name) const {
        if (auto db = registry.find(name)) return db->path;
        return path_for(name);
    }

    /// Open a tracked database and install capture on every qualifying table.
    void ensure_capture(const std::string& name, const fs::path& path) {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE, nullptr);
        detail::DbGuard db(raw);
        if (rc != SQLITE_OK) {
            throw Error(ErrorCode::SqliteError,
                        "open " + path.string() + ": " + (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
        }
        sqlite3_busy_timeout(db.get(), 5000);
        TrackerConfig cfg = config.tracker;
        cfg.database_name = name;
        Tracker tracker(db.get(), cfg);
        tracker.ensure_capture();
    }

    /// Clone into `target`. Nothing is left at `target` when the cloner
    /// fails or cancellation was requested while it ran.
    void clone(const fs::path& source, const fs::path& target, const CancelToken& cancel) {
        try {
            cloner->clone(source, target, cancel);
        } catch (const std::exception&) {
            remove_storage(target);
            throw;
        }
        if (cancel.cancelled()) {
            remove_storage(target);
            throw Error(ErrorCode::Cancelled, "clone of " + source.string() + " cancelled");
        }
    }

    BranchOperation failed(const BranchOperation& op, const std::exception& e) {
        auto current = registry.operation(op.id).value_or(op);
        return registry.fail(op.id, std::string(step_name(current.step)) + ": " + e.what());
    }

    BranchOperation branch(OperationKind kind, const std::string& source,
                           const std::string& target, const std::string& origin,
                           const CancelToken& cancel) {
        check_name(source);
        check_name(target);
        auto src_path = storage_of(source);
        if (!fs::exists(src_path)) {
            throw Error(ErrorCode::NotFound,
                        "database \"" + source + "\" not found at " + src_path.string());
        }
        auto tgt_path = path_for(target);
        if (registry.find(target) || fs::exists(tgt_path)) {
            throw Error(ErrorCode::InvalidState, "database \"" + target + "\" already exists");
        }

        auto existing = registry.find(source);
        auto op = registry.begin_operation(
            kind, existing ? std::optional<DatabaseId>(existing->id) : std::nullopt, target);
        try {
            registry.advance(op.id, BranchStep::EnsuringSourceCapture);
            auto src = existing ? *existing
                                : registry.add_database(source, src_path.string(), std::nullopt, "source");
            registry.set_source(op.id, src.id);
            ensure_capture(source, src_path);

            registry.advance(op.id, BranchStep::Cloning);
            clone(src_path, tgt_path, cancel);
            auto created = registry.add_database(target, tgt_path.string(), src.id, origin);

            registry.advance(op.id, BranchStep::FixingOwnership);
            fixer->fix(tgt_path);

            registry.advance(op.id, BranchStep::EnsuringTargetCapture);
            ensure_capture(target, tgt_path);

            return registry.succeed(op.id, created.id);
        } catch (const std::exception& e) {
            return failed(op, e);
        }
    }
};

Orchestrator::Orchestrator(sqlite3* registry_db, OrchestratorConfig config,
                           std::shared_ptr<StorageCloner> cloner,
                           std::shared_ptr<OwnershipFixer> fixer)
    : impl_(std::make_unique<Impl>(registry_db, std::move(config), std::move(cloner),
                                   std::move(fixer))) {}

Orchestrator::~Orchestrator() = default;
Orchestrator::Orchestrator(Orchestrator&&) noexcept = default;
Orchestrator& Orchestrator::operator=(Orchestrator&&) noexcept = default;

BranchOperation Orchestrator::branch(const std::string& source, const std::string& target,
                                     const CancelToken& cancel) {
    return impl_->branch(OperationKind::Branch, source, target, "branch", cancel);
}

BranchOperation Orchestrator::snapshot(const std::string& source, const CancelToken& cancel) {
    std::time_t now = std::time(nullptr);
    std::tm tm {};
    ::localtime_r(&now, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof stamp, "%Y%m%d_%H%M%S", &tm);

    std::string base = "snapshot_" + source + "_" + stamp;
    std::string name = base;
    for (int n = 2; impl_->registry.find(name) || fs::exists(impl_->path_for(name)); ++n) {
        name = base + "_" + std::to_string(n);
    }
    return impl_->branch(OperationKind::Snapshot, source, name, "snapshot", cancel);
}

BranchOperation Orchestrator::restore(const std::string& database, const std::string& snapshot,
                                      const CancelToken& cancel) {
    auto db = impl_->registry.find(database);
    if (!db) throw Error(ErrorCode::NotFound, "database \"" + database + "\" is not tracked");
    auto snap = impl_->registry.find(snapshot);
    if (!snap) throw Error(ErrorCode::NotFound, "snapshot \"" + snapshot + "\" is not tracked");
    if (snap->origin != "snapshot" || snap->parent != db->id) {
        throw Error(ErrorCode::InvalidState,
                    "\"" + snapshot + "\" is not a snapshot of \"" + database + "\"");
    }

    auto& reg = impl_->registry;
    auto op = reg.begin_operation(OperationKind::Restore, snap->id, database);
    fs::path target = db->path;
    fs::path staging = impl_->config.storage_root / ("." + database + ".restore");
    try {
        reg.advance(op.id, BranchStep::EnsuringSourceCapture);
        impl_->ensure_capture(snap->name, snap->path);

        reg.advance(op.id, BranchStep::Cloning);
        remove_storage(staging);
        impl_->clone(snap->path, staging, cancel);
        for (const char* suffix : {"-wal", "-shm", "-journal"}) fs::remove(sibling(target, suffix));
        fs::rename(staging, target);
        if (fs::exists(sibling(staging, "-wal"))) {
            fs::rename(sibling(staging, "-wal"), sibling(target, "-wal"));
        }

        reg.advance(op.id, BranchStep::FixingOwnership);
        impl_->fixer->fix(target);

        reg.advance(op.id, BranchStep::EnsuringTargetCapture);
        impl_->ensure_capture(database, target);

        return reg.succeed(op.id, db->id);
    } catch (const std::exception& e) {
        remove_storage(staging);
        return impl_->failed(op, e);
    }
}

BranchOperation Orchestrator::delete_snapshot(const std::string& snapshot) {
    auto& reg = impl_->registry;
    auto snap = reg.find(snapshot);
    if (!snap) throw Error(ErrorCode::NotFound, "snapshot \"" + snapshot + "\" is not tracked");
    if (snap->origin != "snapshot") {
        throw Error(ErrorCode::InvalidState, "\"" + snapshot + "\" is not a snapshot");
    }

    auto op = reg.begin_operation(OperationKind::DeleteSnapshot, snap->id, snapshot);
    try {
        auto kids = reg.children(snap->id);
        if (!kids.empty()) {
            throw Error(ErrorCode::InvalidState,
                        "snapshot \"" + snapshot + "\" has " + std::to_string(kids.size()) +
                        " dependent databases");
        }
        reg.remove_database(snap->id);
        remove_storage(snap->path);
        return reg.succeed(op.id, std::nullopt);
    } catch (const std::exception& e) {
        return impl_->failed(op, e);
    }
}

std::vector<TrackedDatabase> Orchestrator::list_databases() const {
    auto out = impl_->registry.databases();
    std::set<std::string> known;
    for (auto& db : out) {
        db.storage_present = fs::exists(db.path);
        known.insert(db.name);
    }

    std::vector<TrackedDatabase> untracked;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(impl_->config.storage_root, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".db") continue;
        auto name = entry.path().stem().string();
        if (name.empty() || name.front() == '.' || is_bookkeeping(name) || known.count(name)) continue;
        TrackedDatabase db;
        db.name = name;
        db.path = entry.path().string();
        db.origin = "untracked";
        untracked.push_back(std::move(db));
    }
    if (ec) {
        SPDLOG_WARN("scanning {}: {}", impl_->config.storage_root.string(), ec.message());
    }
    std::sort(untracked.begin(), untracked.end(),
              [](const auto& a, const auto& b) { return a.name < b.name; });
    out.insert(out.end(), untracked.begin(), untracked.end());
    return out;
}

std::vector<TrackedDatabase> Orchestrator::list_snapshots(const std::string& source) const {
    std::optional<DatabaseId> parent;
    if (!source.empty()) {
        auto db = impl_->registry.find(source);
        if (!db) throw Error(ErrorCode::NotFound, "database \"" + source + "\" is not tracked");
        parent = db->id;
    }
    std::vector<TrackedDatabase> out;
    for (auto& db : impl_->registry.databases()) {
        if (db.origin != "snapshot") continue;
        if (parent && db.parent != parent) continue;
        db.storage_present = fs::exists(db.path);
        out.push_back(std::move(db));
    }
    return out;
}

std::vector<BranchOperation> Orchestrator::operations() const {
    return impl_->registry.operations();
}

std::optional<BranchOperation> Orchestrator::operation(OperationId id) const {
    return impl_->registry.operation(id);
}

fs::path Orchestrator::path_for(const std::string& name) const {
    return impl_->path_for(name);
}

std::string Orchestrator::digest(const std::string& database, const std::string& table,
                                 int batch_size) const {
    fs::path path = impl_->storage_of(database);
    if (!fs::exists(path)) {
        throw Error(ErrorCode::NotFound,
                    "database \"" + database + "\" has no storage at " + path.string());
    }
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
    detail::DbGuard db(raw);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError,
                    "open " + path.string() + ": " + (raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
    }
    sqlite3_busy_timeout(db.get(), 5000);
    return RowDigester().digest(db.get(), table, batch_size);
}

} // namespace sqlbranch
