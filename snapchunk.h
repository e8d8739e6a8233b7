// Copyright 2026 The snapchunk Authors
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// ── types.h ─────────────────────────────────────────────────────
namespace snapchunk {

/// Column value. Uses std::variant to represent source types.
using Value = std::variant<
    std::monostate,            // NULL
    std::int64_t,              // INTEGER
    double,                    // REAL
    std::string,               // TEXT
    std::vector<std::uint8_t>  // BLOB
>;

/// One result row as returned by a source.
using Row = std::vector<Value>;

/// The values of the key columns of one row, in declared key order.
using KeyTuple = std::vector<Value>;

/// Called once per result row. Return false to stop iteration.
using RowCallback = std::function<bool(const Row&)>;

bool is_null(const Value& v);

/// Three-way comparison in source order: NULL < numeric < text < blob.
/// Integers and reals compare numerically.
int compare_values(const Value& a, const Value& b);

/// Human-readable rendering for logs and error messages.
std::string to_string(const Value& v);

/// Logical type of a column, as declared by the schema catalog.
enum class LogicalType : std::uint8_t {
    Integer,
    Real,
    Text,
    Blob,
    Numeric,  ///< Exact numbers (DECIMAL, NUMERIC, MONEY, dates); storage value kept as is.
    Any,      ///< No declared type; every storage class passes through.
};

/// Map a declared column type (e.g. "BIGINT", "nvarchar(40)") to a logical type.
LogicalType logical_type_from_declared(std::string_view declared);

const char* to_string(LogicalType t);

/// Catalog/schema/table name triple.
struct TableId {
    std::string catalog;
    std::string schema;
    std::string table;

    std::string to_string() const;
};

struct Column {
    std::string name;
    std::string declared_type;
    LogicalType type = LogicalType::Blob;
    int         pk_ordinal = 0;  ///< 1-based position in the primary key, 0 if not a key column.
};

struct Table {
    TableId             id;
    std::vector<Column> columns;

    /// Primary key columns ordered by key position.
    std::vector<Column> primary_key_columns() const;
};

/// The ordered column a table is chunked on.
struct KeyColumn {
    std::string name;
    LogicalType type = LogicalType::Blob;
};

/// Where a chunk sits in its table's chunk sequence.
enum class ChunkPosition : std::uint8_t {
    Only,    ///< Unbounded on both sides; covers the whole table.
    First,   ///< Unbounded below.
    Middle,
    Last,    ///< Unbounded above.
};

const char* to_string(ChunkPosition p);

/// Key range of one chunk. A missing start means unbounded below, a
/// missing end means unbounded above. Rows equal to `end` belong to the
/// following chunk, whose `start` is the same tuple.
struct ChunkBound {
    std::optional<KeyTuple> start;
    std::optional<KeyTuple> end;

    ChunkPosition position() const;

    bool operator==(const ChunkBound& o) const;
};

std::string to_string(const ChunkBound& b);

} // namespace snapchunk

// ── error.h ─────────────────────────────────────────────────────
namespace snapchunk {

/// Error codes carried by snapchunk::Error.
enum class ErrorCode : int {
    Ok = 0,
    Validation,         ///< The table cannot be chunked (e.g. no primary key) or bad config.
    EmptyResult,        ///< An aggregate query returned no row.
    MalformedPosition,  ///< An offset record is missing fields or holds unparsable LSNs.
    SourceUnavailable,  ///< Contacting the source failed.
    StatementBind,      ///< Binding chunk parameters to a statement failed.
    TypeMismatch,       ///< A result value does not match the declared column type.
    SqliteError,        ///< An underlying SQLite call failed.
};

const char* to_string(ErrorCode code);

/// Exception thrown by snapchunk operations. Errors that wrap a lower-level
/// failure are thrown with std::throw_with_nested; the cause is reachable
/// with std::rethrow_if_nested.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace snapchunk

// ── quote.h ─────────────────────────────────────────────────────
// Every identifier and literal that ends up in generated SQL passes
// through these functions.
namespace snapchunk::sql {

/// [name] with embedded ']' doubled.
std::string quote_bracket(std::string_view ident);

/// "name" with embedded '"' doubled.
std::string quote_double(std::string_view ident);

/// 'text' with embedded '\'' doubled.
std::string quote_string(std::string_view text);

/// Uppercase hex digits of a byte string, no prefix.
std::string hex(std::span<const std::uint8_t> bytes);

} // namespace snapchunk::sql

// ── dialect.h ───────────────────────────────────────────────────
namespace snapchunk {

/// Source-specific SQL text generation.
class Dialect {
public:
    virtual ~Dialect() = default;

    virtual const char* name() const = 0;

    virtual std::string quote_identifier(std::string_view ident) const = 0;

    /// Render a value as a SQL literal.
    virtual std::string literal(const Value& v) const = 0;

    /// Text placed right after SELECT to limit the row count ("" if none).
    virtual std::string limit_prefix(int limit) const = 0;

    /// Text appended after ORDER BY to limit the row count ("" if none).
    virtual std::string limit_suffix(int limit) const = 0;

    /// Statement to run (without committing) before the approximate row
    /// count query, if the source needs one.
    virtual std::optional<std::string> use_catalog_statement(const TableId& id) const = 0;

    /// Single-row, single-column query yielding a statistics-based row count.
    virtual std::string approximate_row_count_query(const TableId& id) const = 0;

    /// Single-row, single-column query yielding the largest committed LSN.
    virtual std::string max_lsn_query(const std::string& database) const = 0;

    /// [schema].[table], or [table] when no schema is set.
    std::string quote_table(const TableId& id) const;

    /// SELECT with optional WHERE / ORDER BY and a row limit (limit <= 0: none).
    std::string select_with_limit(const std::string& projection,
                                  const std::string& from,
                                  const std::string& where,
                                  const std::string& order_by,
                                  int limit) const;
};

/// Microsoft SQL Server.
class SqlServerDialect final : public Dialect {
public:
    const char* name() const override { return "sqlserver"; }
    std::string quote_identifier(std::string_view ident) const override;
    std::string literal(const Value& v) const override;
    std::string limit_prefix(int limit) const override;
    std::string limit_suffix(int limit) const override;
    std::optional<std::string> use_catalog_statement(const TableId& id) const override;
    std::string approximate_row_count_query(const TableId& id) const override;
    std::string max_lsn_query(const std::string& database) const override;
};

/// SQLite. LSNs are read from a `lsn_time_mapping` table shaped like
/// SQL Server's cdc.lsn_time_mapping (start_lsn BLOB, tran_id BLOB).
class SqliteDialect final : public Dialect {
public:
    const char* name() const override { return "sqlite"; }
    std::string quote_identifier(std::string_view ident) const override;
    std::string literal(const Value& v) const override;
    std::string limit_prefix(int limit) const override;
    std::string limit_suffix(int limit) const override;
    std::optional<std::string> use_catalog_statement(const TableId& id) const override;
    std::string approximate_row_count_query(const TableId& id) const override;
    std::string max_lsn_query(const std::string& database) const override;
};

} // namespace snapchunk

// ── connection.h ────────────────────────────────────────────────
namespace snapchunk {

/// A prepared, parameterized statement.
class Statement {
public:
    virtual ~Statement() = default;

    virtual const std::string& sql() const = 0;
    virtual std::size_t parameter_count() const = 0;

    /// Bind a value to a 1-based parameter slot.
    virtual void bind(std::size_t index, const Value& v) = 0;

    virtual void set_fetch_size(int rows) = 0;
    virtual int fetch_size() const = 0;

    /// Execute and deliver each result row to on_row.
    virtual void query(const RowCallback& on_row) = 0;
};

/// A live session with a source. Implementations throw snapchunk::Error.
class Connection {
public:
    virtual ~Connection() = default;

    virtual const Dialect& dialect() const = 0;
    virtual std::string database() const = 0;

    /// Run a read-only query with positional parameters and map each row.
    virtual void query(const std::string& sql,
                       const std::vector<Value>& params,
                       const RowCallback& on_row) = 0;

    virtual void execute_without_committing(const std::string& sql) = 0;

    virtual std::unique_ptr<Statement> prepare(const std::string& sql,
                                               int fetch_size) = 0;

    virtual bool auto_commit() const = 0;
    virtual void set_auto_commit(bool enabled) = 0;
};

/// Connection over a SQLite database.
///
/// Does NOT own the sqlite3* handle. Caller must keep it open for
/// the SqliteConnection's lifetime.
class SqliteConnection final : public Connection {
public:
    explicit SqliteConnection(sqlite3* db, std::string database = "main");

    const Dialect& dialect() const override { return dialect_; }
    std::string database() const override { return database_; }

    void query(const std::string& sql,
               const std::vector<Value>& params,
               const RowCallback& on_row) override;
    void execute_without_committing(const std::string& sql) override;
    std::unique_ptr<Statement> prepare(const std::string& sql,
                                       int fetch_size) override;
    bool auto_commit() const override;
    void set_auto_commit(bool enabled) override;

    /// Read column and primary key metadata from PRAGMA table_info.
    /// The schema part of the id selects the attached database.
    Table describe_table(const TableId& id);

    sqlite3* handle() const { return db_; }

private:
    sqlite3*      db_;
    std::string   database_;
    SqliteDialect dialect_;
};

/// Decodes raw result rows into key tuples according to the declared
/// logical types of the key columns.
class RowDecoder {
public:
    explicit RowDecoder(std::vector<LogicalType> types);

    std::size_t arity() const { return types_.size(); }

    /// Decode the leading arity() values of a row. NULLs pass through.
    KeyTuple decode(const Row& row) const;

    template <std::size_t N>
    std::array<Value, N> decode_fixed(const Row& row) const {
        if (N != types_.size()) {
            throw Error(ErrorCode::TypeMismatch,
                        "decoder arity " + std::to_string(types_.size()) +
                        " does not match requested arity " + std::to_string(N));
        }
        auto tuple = decode(row);
        std::array<Value, N> out;
        for (std::size_t i = 0; i < N; ++i) out[i] = std::move(tuple[i]);
        return out;
    }

private:
    std::vector<LogicalType> types_;
};

} // namespace snapchunk

// ── session.h ───────────────────────────────────────────────────
namespace snapchunk {

struct SessionOptions {
    /// Auto-commit mode applied for the lifetime of the session.
    bool auto_commit = false;

    /// Rows fetched per round trip by statements prepared in the session.
    int fetch_size = 1024;
};

/// Scoped session configuration. Applies SessionOptions to a connection
/// on construction and restores the previous auto-commit mode on
/// destruction, also when unwinding.
///
/// Does NOT own the connection.
class Session {
public:
    explicit Session(Connection& conn, SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Connection& connection() const { return conn_; }
    const Dialect& dialect() const { return conn_.dialect(); }
    const SessionOptions& options() const { return options_; }

private:
    Connection&    conn_;
    SessionOptions options_;
    bool           saved_auto_commit_;
};

} // namespace snapchunk

// ── key_selector.h ──────────────────────────────────────────────
namespace snapchunk {

/// The first primary key column. Throws Error(Validation) when the table
/// has no primary key.
KeyColumn select_key_column(const Table& table);

/// All primary key columns in key order. Throws Error(Validation) when
/// the table has no primary key.
std::vector<KeyColumn> select_key_columns(const Table& table);

} // namespace snapchunk

// ── split_query.h ───────────────────────────────────────────────
namespace snapchunk {

enum class QueryKind : std::uint8_t {
    DataScan,           ///< Read the chunk's rows.
    BoundaryDiscovery,  ///< Find the key value at the limit-th row.
};

/// Filter for one chunk, with '?' parameter slots.
struct ChunkPredicate {
    std::string condition;        ///< Empty when the chunk is unbounded.
    std::string order_by;         ///< Key columns in key order.
    std::size_t parameter_count = 0;
};

ChunkPredicate build_chunk_predicate(const Dialect& dialect,
                                     std::span<const KeyColumn> keys,
                                     ChunkPosition position,
                                     QueryKind kind);

/// A complete query for one chunk. Never mutated after construction.
struct SplitQuery {
    std::string              sql;
    QueryKind                kind = QueryKind::DataScan;
    ChunkPosition            position = ChunkPosition::Only;
    int                      limit = -1;   ///< <= 0: no limit.
    std::vector<std::string> order_by;     ///< Quoted key columns, empty if unordered.
    bool                     has_condition = false;
    std::size_t              parameter_count = 0;
};

/// Data scan: SELECT * FROM table [WHERE predicate] [ORDER BY keys].
SplitQuery build_split_scan_query(const Dialect& dialect,
                                  const TableId& table,
                                  std::span<const KeyColumn> keys,
                                  ChunkPosition position,
                                  bool ordered = false);

/// Boundary discovery: the MAX of each key column over the first `limit`
/// rows matching the chunk predicate, in ascending key order.
SplitQuery build_boundary_query(const Dialect& dialect,
                                const TableId& table,
                                std::span<const KeyColumn> keys,
                                ChunkPosition position,
                                int limit);

/// Replace each '?' outside quoted text with a literal. For logging and
/// diagnostics only; execution always binds.
std::string render_with_parameters(const Dialect& dialect,
                                   std::string_view sql,
                                   const std::vector<Value>& params);

} // namespace snapchunk

// ── binder.h ────────────────────────────────────────────────────
namespace snapchunk {

/// Parameter values for a chunk query, in slot order. Data scan:
/// Only: none. First: end, end. Last: start. Middle: start, end, end.
/// Boundary discovery drops the equality exclusion: First: end.
/// Middle: start, end.
std::vector<Value> chunk_parameters(const ChunkBound& bound, std::size_t key_arity,
                                    QueryKind kind = QueryKind::DataScan);

/// Bind chunk_parameters() into a statement. Any failure is rethrown as
/// Error(StatementBind) with the cause nested.
void bind_chunk(Statement& stmt, const ChunkBound& bound, std::size_t key_arity);

/// A prepared, bound data scan for one chunk.
struct ChunkRead {
    ChunkBound                 bound;
    SplitQuery                 query;
    std::unique_ptr<Statement> statement;
};

ChunkRead prepare_chunk_read(Session& session,
                             const TableId& table,
                             std::span<const KeyColumn> keys,
                             const ChunkBound& bound);

} // namespace snapchunk

// ── estimator.h ─────────────────────────────────────────────────
// Each call is one round trip. Source failures are rethrown as
// Error(SourceUnavailable) with the cause nested.
namespace snapchunk {

/// Global MIN and MAX of the key column. Both are NULL for an empty table.
std::pair<Value, Value> query_min_max(Session& session, const TableId& table,
                                      const KeyColumn& key);

/// Statistics-based row count. Cheap and approximate.
std::int64_t query_approximate_row_count(Session& session, const TableId& table);

/// Smallest key value strictly greater than `excluded_lower_bound`, or NULL.
Value query_min(Session& session, const TableId& table, const KeyColumn& key,
                const Value& excluded_lower_bound);

/// Largest key value among the first `chunk_size` rows (ascending) whose
/// key is >= `included_lower_bound`, or NULL when no row qualifies.
Value query_next_chunk_bound(Session& session, const TableId& table,
                             const KeyColumn& key, int chunk_size,
                             const Value& included_lower_bound);

/// Exact number of rows with key in (min, max].
int query_row_count_in_range(Session& session, const TableId& table,
                             const KeyColumn& key,
                             const Value& min, const Value& max);

} // namespace snapchunk

// ── splitter.h ──────────────────────────────────────────────────
namespace snapchunk {

struct SplitterConfig {
    /// Rows per boundary discovery step.
    int chunk_size = 8096;

    /// Split integer keys arithmetically when their distribution is even
    /// enough, instead of walking them with boundary queries.
    bool evenly_split_integral_keys = false;

    double distribution_factor_upper = 1000.0;
    double distribution_factor_lower = 0.05;
};

/// Computes a table's chunk boundaries. Boundaries are contiguous and
/// ordered; together they cover the whole key space.
class ChunkSplitter {
public:
    explicit ChunkSplitter(SplitterConfig config = {});

    const SplitterConfig& config() const { return config_; }

    /// Select the key column and split the table on it.
    std::vector<ChunkBound> split(Session& session, const Table& table) const;

    std::vector<ChunkBound> split(Session& session, const TableId& table,
                                  const KeyColumn& key) const;

    /// Walk the key space with boundary discovery queries.
    std::vector<ChunkBound> split_unevenly(Session& session, const TableId& table,
                                           const KeyColumn& key,
                                           const Value& min, const Value& max) const;

    /// Arithmetic split of an integer key range.
    std::vector<ChunkBound> split_evenly(std::int64_t min, std::int64_t max,
                                         std::int64_t approximate_row_count,
                                         int dynamic_chunk_size) const;

    /// (max - min + 1) / approximate_row_count; infinity for a zero count.
    static double distribution_factor(std::int64_t min, std::int64_t max,
                                      std::int64_t approximate_row_count);

private:
    SplitterConfig config_;
};

} // namespace snapchunk

// ── position.h ──────────────────────────────────────────────────
namespace snapchunk {

/// A SQL Server log sequence number: VLF sequence (4 bytes), log block
/// (4 bytes) and slot (2 bytes), big-endian. Text form is
/// "xxxxxxxx:xxxxxxxx:xxxx".
class Lsn {
public:
    static constexpr std::size_t kSize = 10;

    Lsn() = default;
    explicit Lsn(const std::array<std::uint8_t, kSize>& bytes) : bytes_(bytes) {}

    static Lsn from_parts(std::uint32_t vlf, std::uint32_t block, std::uint16_t slot);

    /// Throws Error(MalformedPosition) unless `data` is exactly kSize bytes.
    static Lsn from_bytes(std::span<const std::uint8_t> data);

    /// Throws Error(MalformedPosition) on anything but the text form.
    static Lsn parse(std::string_view text);

    std::string to_string() const;
    const std::array<std::uint8_t, kSize>& bytes() const { return bytes_; }

    int compare(const Lsn& o) const;

    bool operator==(const Lsn& o) const { return compare(o) == 0; }
    bool operator!=(const Lsn& o) const { return compare(o) != 0; }
    bool operator<(const Lsn& o) const { return compare(o) < 0; }
    bool operator<=(const Lsn& o) const { return compare(o) <= 0; }
    bool operator>(const Lsn& o) const { return compare(o) > 0; }
    bool operator>=(const Lsn& o) const { return compare(o) >= 0; }

private:
    std::array<std::uint8_t, kSize> bytes_{};
};

/// Raw offset record as produced by the change log reader.
using OffsetRecord = std::map<std::string, std::optional<std::string>>;

inline constexpr const char* kChangeLsnKey = "change_lsn";
inline constexpr const char* kCommitLsnKey = "commit_lsn";
inline constexpr const char* kEventSerialNoKey = "event_serial_no";

/// Position in the source's change log. Ordered by commit LSN, then
/// change LSN, then event serial number (absent before present).
class LogPosition {
public:
    LogPosition(Lsn change_lsn, Lsn commit_lsn,
                std::optional<std::int64_t> event_serial_no = std::nullopt);

    /// Before every real position.
    static LogPosition initial();

    /// After every real position.
    static LogPosition no_stopping();

    const Lsn& change_lsn() const { return change_lsn_; }
    const Lsn& commit_lsn() const { return commit_lsn_; }
    const std::optional<std::int64_t>& event_serial_no() const { return event_serial_no_; }

    int compare(const LogPosition& o) const;

    bool operator==(const LogPosition& o) const { return compare(o) == 0; }
    bool operator!=(const LogPosition& o) const { return compare(o) != 0; }
    bool operator<(const LogPosition& o) const { return compare(o) < 0; }
    bool operator<=(const LogPosition& o) const { return compare(o) <= 0; }
    bool operator>(const LogPosition& o) const { return compare(o) > 0; }
    bool operator>=(const LogPosition& o) const { return compare(o) >= 0; }

    OffsetRecord to_offset_record() const;
    std::string to_string() const;

private:
    Lsn                         change_lsn_;
    Lsn                         commit_lsn_;
    std::optional<std::int64_t> event_serial_no_;
};

/// Throws Error(MalformedPosition) if either LSN key is missing, null or
/// unparsable, or if a present serial number is not a decimal integer.
LogPosition parse_position(const OffsetRecord& record);

/// The source's current largest LSN as (max, max). Any failure is
/// rethrown as Error(SourceUnavailable) with the cause nested.
LogPosition current_position(Connection& conn);

} // namespace snapchunk
