// Copyright 2026 The sqlbranch Authors
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// ── types.h ─────────────────────────────────────────────────────
namespace sqlbranch {

/// Id of a row in one of the append-only logs.
using RecordId = std::int64_t;

/// Transaction identifier stamped on log rows.
using TxId = std::int64_t;

/// Registry id of a tracked database.
using DatabaseId = std::int64_t;

/// Registry id of a branch operation.
using OperationId = std::int64_t;

/// Prefix shared by every bookkeeping object. Objects carrying it are
/// never captured or audited.
inline constexpr std::string_view kBookkeepingPrefix = "_sqlbranch_";

/// Column value as SQLite stores it.
using Value = std::variant<
    std::monostate,            // NULL
    std::int64_t,              // INTEGER
    double,                    // REAL
    std::string,               // TEXT
    std::vector<std::uint8_t>  // BLOB
>;

/// The type of row operation.
enum class OpKind : std::uint8_t {
    Insert = 1,
    Update = 2,
    Delete = 3,
};

/// Single-letter code used in the change log ('I', 'U', 'D').
char op_code(OpKind op);
OpKind op_from_code(char code);

/// Declared column type split into base name and modifier, e.g.
/// NUMERIC(10,2) -> {"NUMERIC", "(10,2)"}.
struct TypeDescriptor {
    std::string base;
    std::string modifier;

    std::string str() const { return base + modifier; }
    bool operator==(const TypeDescriptor&) const = default;
};

TypeDescriptor parse_type(std::string_view declared);

/// SQLite storage class of a single value.
enum class StorageClass : std::uint8_t {
    Null,
    Integer,
    Real,
    Text,
    Blob,
};

std::string_view storage_class_name(StorageClass s);
StorageClass storage_class_from_name(std::string_view name);

/// A value in textual form together with everything needed to cast it
/// back losslessly: the column's type descriptor and the storage class.
/// `text` is empty for NULL; blobs are hex encoded; reals use 17
/// significant digits.
struct TypedValue {
    TypeDescriptor             type;
    StorageClass               storage = StorageClass::Null;
    std::optional<std::string> text;

    bool operator==(const TypedValue&) const = default;
};

TypedValue to_typed(const TypeDescriptor& type, const Value& v);
Value from_typed(const TypedValue& tv);

struct ColumnValue {
    std::string name;
    TypedValue  value;

    bool operator==(const ColumnValue&) const = default;
};

/// One captured row mutation. Immutable once written.
struct ChangeRecord {
    RecordId                 id = 0;
    std::string              relation;
    OpKind                   op = OpKind::Insert;
    std::vector<ColumnValue> key;      ///< Primary-key values, in key order. Never empty.
    std::vector<ColumnValue> columns;  ///< All columns (insert), changed columns (update), none (delete).
    TxId                     tx = 0;
    std::string              timestamp;

    const ColumnValue* column(std::string_view name) const;
};

enum class DdlPhase : std::uint8_t {
    Start,
    End,
};

std::string_view phase_name(DdlPhase p);

/// One schema-change event. Start and end records of one command are
/// independent rows linked only by transaction id and identity.
struct DdlRecord {
    RecordId                   id = 0;
    std::string                timestamp;
    std::string                username;
    std::string                database;
    TxId                       tx = 0;
    std::string                command_tag;
    std::string                object_type;
    std::string                schema_name;
    std::string                object_identity;
    DdlPhase                   phase = DdlPhase::Start;
    std::optional<std::string> sql_text;
    std::optional<std::string> pre_definition;
    std::optional<std::string> post_definition;
};

/// Classes of schema events the audit deliberately leaves incomplete.
enum class AuditGap : std::uint8_t {
    NonTableDrop,        ///< DROP of a view, index or trigger: not logged.
    AlterDefinition,     ///< ALTER TABLE: post-definition is the issued text only.
    UntrackedStatement,  ///< DDL prepared outside Tracker::execute: not logged.
};

std::string_view gap_name(AuditGap g);

/// A database participating in branching. Roots have no parent.
struct TrackedDatabase {
    DatabaseId                id = 0;
    std::string               name;
    std::string               path;
    std::optional<DatabaseId> parent;
    std::string               created_at;
    std::string               origin;  ///< "source", "branch" or "snapshot".
    bool                      storage_present = true;
};

enum class OperationKind : std::uint8_t {
    Branch,
    Snapshot,
    Restore,
    DeleteSnapshot,
};

enum class OperationStatus : std::uint8_t {
    Pending,
    Running,
    Succeeded,
    Failed,
};

/// Orchestrator state machine. Succeeded and Failed are terminal.
enum class BranchStep : std::uint8_t {
    Pending,
    EnsuringSourceCapture,
    Cloning,
    FixingOwnership,
    EnsuringTargetCapture,
    Succeeded,
    Failed,
};

std::string_view kind_name(OperationKind k);
std::string_view status_name(OperationStatus s);
std::string_view step_name(BranchStep s);
OperationKind kind_from_name(std::string_view name);
OperationStatus status_from_name(std::string_view name);
BranchStep step_from_name(std::string_view name);

constexpr bool is_terminal(BranchStep s) {
    return s == BranchStep::Succeeded || s == BranchStep::Failed;
}

/// One orchestration attempt, mutated in place until terminal.
struct BranchOperation {
    OperationId                id = 0;
    std::optional<DatabaseId>  source_id;
    std::optional<DatabaseId>  new_id;
    std::string                database_name;
    OperationKind              kind = OperationKind::Branch;
    std::string                created_at;
    std::optional<std::string> started_at;
    std::optional<std::string> finished_at;
    OperationStatus            status = OperationStatus::Pending;
    BranchStep                 step = BranchStep::Pending;
    std::optional<std::string> error;
};

} // namespace sqlbranch

// ── error.h ─────────────────────────────────────────────────────
namespace sqlbranch {

/// Error codes carried by sqlbranch::Error.
enum class ErrorCode : int {
    Ok = 0,
    SqliteError,         ///< An underlying SQLite call failed.
    PreconditionFailed,  ///< Relation unfit for capture, or identity not resolvable.
    ReplayMismatch,      ///< Change record no longer matches the target relation.
    CloneFailed,         ///< Storage clone or ownership fix failed.
    InvalidState,        ///< Operation not valid in the current state.
    NotFound,            ///< Named database, relation, record or operation is unknown.
    Cancelled,           ///< A cancellable step was interrupted.
    ConfigError,         ///< Malformed configuration.
};

/// Exception thrown by sqlbranch operations.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace sqlbranch

// ── config.h ────────────────────────────────────────────────────
namespace sqlbranch {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
};

struct TrackerConfig {
    /// Name recorded in DDL records. Empty: derived from the file name.
    std::string database_name;

    /// Acting user recorded in DDL records. Empty: $USER.
    std::string actor;

    /// Object kinds the DDL audit listens to.
    std::vector<std::string> audited_kinds = {"table", "view", "index", "trigger"};

    /// Install capture on tables created or altered through execute().
    bool auto_install = true;
};

struct OwnerConfig {
    std::string user;
    std::string group;
};

struct OrchestratorConfig {
    /// Directory holding <name>.db files.
    std::filesystem::path storage_root;

    /// Owner applied to cloned storage. Unset: ownership is left alone.
    std::optional<OwnerConfig> owner;

    /// Template for capture installation on source and clone.
    TrackerConfig tracker;
};

struct Config {
    std::filesystem::path registry;  ///< Empty: <storage_root>/_sqlbranch_registry.db.
    OrchestratorConfig    orchestrator;
    LoggingConfig         logging;

    std::filesystem::path registry_path() const;
};

/// Load a YAML configuration file. Throws Error(ConfigError).
Config load_config(const std::filesystem::path& path);

/// Parse YAML configuration text. Throws Error(ConfigError).
Config parse_config(std::string_view yaml);

/// Install the process logger. SQLBRANCH_LOG_LEVEL overrides the level.
void init_logging(const LoggingConfig& config);

} // namespace sqlbranch

// ── catalog.h ───────────────────────────────────────────────────
namespace sqlbranch {

enum class GeneratedKind : std::uint8_t {
    None,
    Virtual,
    Stored,
};

enum class IdentityMode : std::uint8_t {
    None,
    ByDefault,  ///< Rowid alias.
    Always,     ///< AUTOINCREMENT.
};

struct ColumnDescriptor {
    int                        cid = 0;
    std::string                name;
    TypeDescriptor             type;
    bool                       not_null = false;
    std::optional<std::string> default_expr;
    GeneratedKind              generated = GeneratedKind::None;
    std::optional<std::string> generated_expr;
    std::optional<std::string> collation;  ///< Only when not BINARY.
    int                        pk_position = 0;  ///< 1-based; 0 when not in the key.
    IdentityMode               identity = IdentityMode::None;
};

enum class ConstraintKind : std::uint8_t {
    PrimaryKey,
    Unique,
    Check,
    ForeignKey,
};

struct ConstraintDescriptor {
    std::string    name;
    ConstraintKind kind = ConstraintKind::Check;
    std::string    definition;  ///< e.g. CHECK (balance >= 0)
    std::string    index_name;  ///< Supporting index; empty for CHECK/FK.
};

/// Typed shape of one relation, built once and reused per row.
struct TableDescriptor {
    std::string                       schema = "main";
    std::string                       name;
    std::vector<ColumnDescriptor>     columns;
    std::vector<std::string>          primary_key;
    std::vector<ConstraintDescriptor> constraints;
    bool                              without_rowid = false;
    bool                              strict = false;
    std::uint64_t                     fingerprint = 0;

    const ColumnDescriptor* column(std::string_view name) const;

    /// Columns that can be written (generated columns excluded).
    std::vector<const ColumnDescriptor*> stored_columns() const;
};

/// Read-only metadata queries. Does NOT own the sqlite3* handle.
class CatalogInspector {
public:
    explicit CatalogInspector(sqlite3* db) : db_(db) {}

    /// User tables in `schema`, excluding sqlite_* and bookkeeping tables.
    std::vector<std::string> list_tables(const std::string& schema = "main") const;

    bool exists(const std::string& table, const std::string& schema = "main") const;

    /// Throws Error(NotFound) if the table does not exist.
    TableDescriptor describe(const std::string& table,
                             const std::string& schema = "main") const;

    /// "table", "view", "index", "trigger", or empty if absent.
    std::string object_type(const std::string& name,
                            const std::string& schema = "main") const;

    /// The engine's stored definition text of a view, index or trigger.
    std::optional<std::string> object_definition(const std::string& name,
                                                 const std::string& schema = "main") const;

    /// Current PRAGMA schema_version.
    std::int64_t schema_version() const;

private:
    sqlite3* db_;
};

bool is_bookkeeping(std::string_view name);

} // namespace sqlbranch

// ── renderer.h ──────────────────────────────────────────────────
namespace sqlbranch {

/// Emits a CREATE TABLE statement from catalog state. Reconstructs
/// creation-time shape only; ALTER history is not replayed.
class SchemaRenderer {
public:
    explicit SchemaRenderer(sqlite3* db) : catalog_(db) {}

    std::string render(const std::string& table,
                       const std::string& schema = "main") const;

    static std::string render(const TableDescriptor& desc);

private:
    CatalogInspector catalog_;
};

} // namespace sqlbranch

// ── replay.h ────────────────────────────────────────────────────
namespace sqlbranch {

/// A statement ready to run: SQL text plus positional parameters.
struct ReplayStatement {
    std::string        sql;
    std::vector<Value> params;
};

/// Re-applies change records to a target database. Does NOT own the
/// sqlite3* handle.
class ReplayEngine {
public:
    explicit ReplayEngine(sqlite3* target) : target_(target) {}

    /// Pure: builds the statement for a record. Returns nullopt for an
    /// update without columns.
    static std::optional<ReplayStatement> build_statement(const ChangeRecord& rec);

    /// Applies one record. Throws Error(ReplayMismatch) when the target
    /// relation or a recorded column is missing, or no row matched the key.
    void apply(const ChangeRecord& rec);

private:
    sqlite3* target_;
};

} // namespace sqlbranch

// ── tracker.h ───────────────────────────────────────────────────
namespace sqlbranch {

/// Outcome of a capture installation pass.
struct InstallReport {
    std::vector<std::string>                         installed;
    std::vector<std::string>                         unchanged;
    std::vector<std::pair<std::string, std::string>> skipped;  ///< table, reason
    std::vector<std::string>                         removed;  ///< stray installations

    bool changed() const { return !installed.empty() || !removed.empty(); }
};

/// Attaches change capture and DDL audit to one connection.
///
/// Construction registers the capture functions and hooks and creates
/// the bookkeeping tables; destruction removes them. Writes to captured
/// tables fail on connections without a live Tracker.
///
/// Does NOT own the sqlite3* handle. Caller must keep it open for
/// the Tracker's lifetime.
class Tracker {
public:
    explicit Tracker(sqlite3* db, TrackerConfig config = {});
    ~Tracker();

    Tracker(const Tracker&) = delete;
    Tracker& operator=(const Tracker&) = delete;
    Tracker(Tracker&&) noexcept;
    Tracker& operator=(Tracker&&) noexcept;

    /// Run SQL (one or more statements) through the audited path.
    void execute(std::string_view sql);

    /// Install capture on one table. Returns true if triggers changed.
    /// Throws Error(PreconditionFailed) if the table has no primary key.
    bool install_capture(const std::string& table);

    /// Install capture on every qualifying table; per-table failures
    /// are reported, not thrown.
    InstallReport ensure_capture();

    void remove_capture(const std::string& table);
    bool capture_installed(const std::string& table) const;

    std::vector<ChangeRecord> changes(RecordId after = 0) const;
    std::optional<ChangeRecord> change(RecordId id) const;
    std::vector<DdlRecord> ddl_records(RecordId after = 0) const;

    /// Replay one record of this database's change log onto `target`.
    void replay(RecordId id, sqlite3* target) const;

    /// Events of the given class seen since construction.
    std::size_t gap_count(AuditGap gap) const;

    const std::string& database_name() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqlbranch

// ── digest.h ────────────────────────────────────────────────────
namespace sqlbranch {

/// Content digest of a table. Implementations iterate the table in
/// batches and must not be treated as deterministic SQL functions.
class Digester {
public:
    virtual ~Digester() = default;
    virtual std::string digest(sqlite3* db, const std::string& table,
                               int batch_size) = 0;
};

/// FNV-1a 64 over rows in primary-key order, fetched by keyset pages.
class RowDigester : public Digester {
public:
    std::string digest(sqlite3* db, const std::string& table,
                       int batch_size) override;
};

/// Register sqlbranch_digest(table, batch_size) on a connection. The
/// function is non-deterministic; SQLite refuses it wherever a
/// deterministic expression is required. `digester` must outlive `db`'s
/// use of the function.
void register_digest_function(sqlite3* db, Digester& digester);

} // namespace sqlbranch

// ── registry.h ──────────────────────────────────────────────────
namespace sqlbranch {

/// Orchestrator metadata: tracked databases and branch operations.
/// Does NOT own the sqlite3* handle.
class Registry {
public:
    explicit Registry(sqlite3* db);

    int schema_version() const;

    std::optional<TrackedDatabase> find(const std::string& name) const;
    std::optional<TrackedDatabase> find(DatabaseId id) const;
    std::vector<TrackedDatabase> databases() const;
    std::vector<TrackedDatabase> children(DatabaseId parent) const;

    TrackedDatabase add_database(const std::string& name, const std::string& path,
                                 std::optional<DatabaseId> parent,
                                 const std::string& origin);
    void remove_database(DatabaseId id);

    BranchOperation begin_operation(OperationKind kind,
                                    std::optional<DatabaseId> source,
                                    const std::string& database_name);

    /// Link an operation to its source once the source is registered.
    void set_source(OperationId id, DatabaseId source);

    /// Move a non-terminal operation to a non-terminal step.
    BranchOperation advance(OperationId id, BranchStep step);
    BranchOperation succeed(OperationId id, std::optional<DatabaseId> new_id);
    BranchOperation fail(OperationId id, const std::string& error);

    std::optional<BranchOperation> operation(OperationId id) const;
    std::vector<BranchOperation> operations() const;

private:
    sqlite3* db_;
};

} // namespace sqlbranch

// ── orchestrator.h ──────────────────────────────────────────────
namespace sqlbranch {

/// Cooperative cancellation flag checked by long-running steps.
class CancelToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/// Duplicates database storage. Must leave nothing at `target` on failure.
class StorageCloner {
public:
    virtual ~StorageCloner() = default;
    virtual void clone(const std::filesystem::path& source,
                       const std::filesystem::path& target,
                       const CancelToken& cancel) = 0;
};

/// Checkpoints and write-locks the source, then reflinks (or copies in
/// chunks) the database file and its WAL.
class FileCloner : public StorageCloner {
public:
    void clone(const std::filesystem::path& source,
               const std::filesystem::path& target,
               const CancelToken& cancel) override;
};

/// Adjusts ownership of cloned storage.
class OwnershipFixer {
public:
    virtual ~OwnershipFixer() = default;
    virtual void fix(const std::filesystem::path& path) = 0;
};

/// chown to a configured user/group. No-op without an owner.
class PosixOwnershipFixer : public OwnershipFixer {
public:
    explicit PosixOwnershipFixer(std::optional<OwnerConfig> owner)
        : owner_(std::move(owner)) {}

    void fix(const std::filesystem::path& path) override;

private:
    std::optional<OwnerConfig> owner_;
};

/// Drives branch, snapshot, restore and snapshot deletion.
///
/// Does NOT own the registry sqlite3* handle.
class Orchestrator {
public:
    Orchestrator(sqlite3* registry_db, OrchestratorConfig config,
                 std::shared_ptr<StorageCloner> cloner = nullptr,
                 std::shared_ptr<OwnershipFixer> fixer = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) noexcept;
    Orchestrator& operator=(Orchestrator&&) noexcept;

    /// Clone `source` into a new independently writable database. The
    /// returned operation is terminal; failures are recorded, not thrown.
    /// Throws only when `source` does not exist or `target` is taken.
    BranchOperation branch(const std::string& source, const std::string& target,
                           const CancelToken& cancel = CancelToken{});

    /// Branch into snapshot_<source>_<YYYYmmdd_HHMMSS>.
    BranchOperation snapshot(const std::string& source,
                             const CancelToken& cancel = CancelToken{});

    /// Replace `database`'s storage with a copy of one of its snapshots.
    BranchOperation restore(const std::string& database, const std::string& snapshot,
                            const CancelToken& cancel = CancelToken{});

    /// Remove a snapshot's storage and registry row.
    BranchOperation delete_snapshot(const std::string& snapshot);

    std::vector<TrackedDatabase> list_databases() const;
    std::vector<TrackedDatabase> list_snapshots(const std::string& source = {}) const;
    std::vector<BranchOperation> operations() const;
    std::optional<BranchOperation> operation(OperationId id) const;

    std::filesystem::path path_for(const std::string& name) const;

    /// Content digest of `table` in `database`, opened read-only. Throws
    /// NotFound when the database has no storage.
    std::string digest(const std::string& database, const std::string& table,
                       int batch_size = 1000) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqlbranch
