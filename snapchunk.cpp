// Copyright 2026 The snapchunk Authors
// SPDX-License-Identifier: Apache-2.0
#include "snapchunk.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <exception>
#include <limits>
#include <spdlog/spdlog.h>

// ── sqlite_util.h ───────────────────────────────────────────────
namespace snapchunk::detail {

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

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/// Execute SQL or throw.
inline void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
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
        throw Error(ErrorCode::SqliteError,
                    std::string(sqlite3_errmsg(db)) + " in [" + sql + "]");
    }
    return StmtGuard(stmt);
}

/// Convert a sqlite3_value* to our Value variant.
Value to_value(sqlite3_value* val) {
    if (!val) return std::monostate{};

    switch (sqlite3_value_type(val)) {
    case SQLITE_NULL:
        return std::monostate{};
    case SQLITE_INTEGER:
        return static_cast<std::int64_t>(sqlite3_value_int64(val));
    case SQLITE_FLOAT:
        return sqlite3_value_double(val);
    case SQLITE_TEXT: {
        auto* text = reinterpret_cast<const char*>(sqlite3_value_text(val));
        int len = sqlite3_value_bytes(val);
        return std::string(text, static_cast<std::size_t>(len));
    }
    case SQLITE_BLOB: {
        auto* data = static_cast<const std::uint8_t*>(sqlite3_value_blob(val));
        int len = sqlite3_value_bytes(val);
        return std::vector<std::uint8_t>(data, data + len);
    }
    default:
        return std::monostate{};
    }
}

/// Bind a Value to a 1-based slot. Returns the SQLite result code.
int bind_value(sqlite3_stmt* stmt, int index, const Value& v) {
    return std::visit([&](const auto& x) -> int {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return sqlite3_bind_null(stmt, index);
        }
        else if constexpr (std::is_same_v<T, std::int64_t>) {
            return sqlite3_bind_int64(stmt, index, x);
        }
        else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, x);
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt, index, x.data(),
                                     static_cast<int>(x.size()), SQLITE_TRANSIENT);
        }
        else {
            // A null data pointer would bind NULL instead of an empty blob.
            if (x.empty()) return sqlite3_bind_zeroblob(stmt, index, 0);
            return sqlite3_bind_blob(stmt, index, x.data(),
                                     static_cast<int>(x.size()), SQLITE_TRANSIENT);
        }
    }, v);
}

/// Step through all rows of a statement, stopping early if on_row returns false.
void for_each_row(sqlite3* db, sqlite3_stmt* stmt, const RowCallback& on_row) {
    int ncol = sqlite3_column_count(stmt);
    for (;;) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) return;
        if (rc != SQLITE_ROW) {
            throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
        }
        Row row(static_cast<std::size_t>(ncol));
        for (int i = 0; i < ncol; ++i) {
            row[static_cast<std::size_t>(i)] = to_value(sqlite3_column_value(stmt, i));
        }
        if (!on_row(row)) return;
    }
}

} // namespace snapchunk::detail

// ── types.cpp ───────────────────────────────────────────────────
namespace snapchunk {

namespace {

int type_rank(const Value& v) {
    switch (v.index()) {
    case 0: return 0;          // NULL
    case 1: case 2: return 1;  // numeric
    case 3: return 2;          // text
    default: return 3;         // blob
    }
}

template <typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

// Exact comparison of an integer with a real; NaN sorts after every number.
int compare_int_real(std::int64_t i, double d) {
    if (std::isnan(d) || d >= 9223372036854775808.0) return -1;
    if (d < -9223372036854775808.0) return 1;
    auto whole = static_cast<std::int64_t>(d);
    if (i != whole) return i < whole ? -1 : 1;
    double frac = d - static_cast<double>(whole);
    return frac > 0 ? -1 : (frac < 0 ? 1 : 0);
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

bool is_null(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

int compare_values(const Value& a, const Value& b) {
    int ra = type_rank(a);
    int rb = type_rank(b);
    if (ra != rb) return ra < rb ? -1 : 1;

    switch (ra) {
    case 0:
        return 0;
    case 1: {
        auto* ia = std::get_if<std::int64_t>(&a);
        auto* ib = std::get_if<std::int64_t>(&b);
        if (ia && ib) return three_way(*ia, *ib);
        if (ia) return compare_int_real(*ia, std::get<double>(b));
        if (ib) return -compare_int_real(*ib, std::get<double>(a));
        double da = std::get<double>(a);
        double db = std::get<double>(b);
        if (std::isnan(da) || std::isnan(db)) {
            return three_way(std::isnan(da) ? 1 : 0, std::isnan(db) ? 1 : 0);
        }
        return three_way(da, db);
    }
    case 2: {
        int c = std::get<std::string>(a).compare(std::get<std::string>(b));
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    default: {
        const auto& ba = std::get<std::vector<std::uint8_t>>(a);
        const auto& bb = std::get<std::vector<std::uint8_t>>(b);
        std::size_t n = std::min(ba.size(), bb.size());
        int c = n ? std::memcmp(ba.data(), bb.data(), n) : 0;
        if (c != 0) return c < 0 ? -1 : 1;
        return three_way(ba.size(), bb.size());
    }
    }
}

std::string to_string(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        }
        else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(x);
        }
        else if constexpr (std::is_same_v<T, double>) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", x);
            return buf;
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        }
        else {
            return "0x" + sql::hex(x);
        }
    }, v);
}

LogicalType logical_type_from_declared(std::string_view declared) {
    std::string t(declared);
    for (auto& c : t) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    // Affinity rules, in SQLite's precedence order, extended with the
    // SQL Server type names that do not follow them.
    if (contains(t, "INT") || t == "BIT") return LogicalType::Integer;
    if (contains(t, "CHAR") || contains(t, "CLOB") || contains(t, "TEXT") ||
        contains(t, "UNIQUEIDENTIFIER") || contains(t, "XML")) {
        return LogicalType::Text;
    }
    if (t.empty()) return LogicalType::Any;
    if (contains(t, "BLOB") || contains(t, "BINARY") || contains(t, "IMAGE")) {
        return LogicalType::Blob;
    }
    if (contains(t, "REAL") || contains(t, "FLOA") || contains(t, "DOUB")) {
        return LogicalType::Real;
    }
    return LogicalType::Numeric;
}

const char* to_string(LogicalType t) {
    switch (t) {
    case LogicalType::Integer: return "INTEGER";
    case LogicalType::Real:    return "REAL";
    case LogicalType::Text:    return "TEXT";
    case LogicalType::Blob:    return "BLOB";
    case LogicalType::Numeric: return "NUMERIC";
    case LogicalType::Any:     return "ANY";
    }
    return "?";
}

std::string TableId::to_string() const {
    std::string s;
    if (!catalog.empty()) s += catalog + ".";
    if (!schema.empty()) s += schema + ".";
    s += table;
    return s;
}

std::vector<Column> Table::primary_key_columns() const {
    std::vector<Column> pk;
    for (const auto& c : columns) {
        if (c.pk_ordinal > 0) pk.push_back(c);
    }
    std::stable_sort(pk.begin(), pk.end(), [](const Column& a, const Column& b) {
        return a.pk_ordinal < b.pk_ordinal;
    });
    return pk;
}

const char* to_string(ChunkPosition p) {
    switch (p) {
    case ChunkPosition::Only:   return "ONLY";
    case ChunkPosition::First:  return "FIRST";
    case ChunkPosition::Middle: return "MIDDLE";
    case ChunkPosition::Last:   return "LAST";
    }
    return "?";
}

ChunkPosition ChunkBound::position() const {
    if (!start && !end) return ChunkPosition::Only;
    if (!start) return ChunkPosition::First;
    if (!end) return ChunkPosition::Last;
    return ChunkPosition::Middle;
}

bool ChunkBound::operator==(const ChunkBound& o) const {
    auto same = [](const std::optional<KeyTuple>& a, const std::optional<KeyTuple>& b) {
        if (a.has_value() != b.has_value()) return false;
        if (!a) return true;
        if (a->size() != b->size()) return false;
        for (std::size_t i = 0; i < a->size(); ++i) {
            if (compare_values((*a)[i], (*b)[i]) != 0) return false;
        }
        return true;
    };
    return same(start, o.start) && same(end, o.end);
}

std::string to_string(const ChunkBound& b) {
    auto side = [](const std::optional<KeyTuple>& t) -> std::string {
        if (!t) return "null";
        std::string s = "[";
        for (std::size_t i = 0; i < t->size(); ++i) {
            if (i) s += ", ";
            s += to_string((*t)[i]);
        }
        return s + "]";
    };
    return "(" + side(b.start) + ", " + side(b.end) + ")";
}

const char* to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::Ok:                return "Ok";
    case ErrorCode::Validation:        return "Validation";
    case ErrorCode::EmptyResult:       return "EmptyResult";
    case ErrorCode::MalformedPosition: return "MalformedPosition";
    case ErrorCode::SourceUnavailable: return "SourceUnavailable";
    case ErrorCode::StatementBind:     return "StatementBind";
    case ErrorCode::TypeMismatch:      return "TypeMismatch";
    case ErrorCode::SqliteError:       return "SqliteError";
    }
    return "?";
}

} // namespace snapchunk

// ── quote.cpp ───────────────────────────────────────────────────
namespace snapchunk::sql {

namespace {

std::string wrap_doubling(std::string_view s, char open, char close) {
    std::string out;
    out.reserve(s.size() + 2);
    out += open;
    for (char c : s) {
        out += c;
        if (c == close) out += close;
    }
    out += close;
    return out;
}

} // namespace

std::string quote_bracket(std::string_view ident) {
    return wrap_doubling(ident, '[', ']');
}

std::string quote_double(std::string_view ident) {
    return wrap_doubling(ident, '"', '"');
}

std::string quote_string(std::string_view text) {
    return wrap_doubling(text, '\'', '\'');
}

std::string hex(std::span<const std::uint8_t> bytes) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0F];
    }
    return out;
}

} // namespace snapchunk::sql

// ── dialect.cpp ─────────────────────────────────────────────────
namespace snapchunk {

namespace {

std::string number_literal(const Value& v) {
    if (auto* i = std::get_if<std::int64_t>(&v)) return std::to_string(*i);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", std::get<double>(v));
    return buf;
}

} // namespace

std::string Dialect::quote_table(const TableId& id) const {
    if (id.schema.empty()) return quote_identifier(id.table);
    return quote_identifier(id.schema) + "." + quote_identifier(id.table);
}

std::string Dialect::select_with_limit(const std::string& projection,
                                       const std::string& from,
                                       const std::string& where,
                                       const std::string& order_by,
                                       int limit) const {
    std::string sql = "SELECT ";
    sql += limit_prefix(limit);
    sql += projection;
    sql += " FROM ";
    sql += from;
    if (!where.empty()) sql += " WHERE " + where;
    if (!order_by.empty()) sql += " ORDER BY " + order_by;
    sql += limit_suffix(limit);
    return sql;
}

// SQL Server

std::string SqlServerDialect::quote_identifier(std::string_view ident) const {
    return sql::quote_bracket(ident);
}

std::string SqlServerDialect::literal(const Value& v) const {
    switch (v.index()) {
    case 0: return "NULL";
    case 1: case 2: return number_literal(v);
    case 3: return "N" + sql::quote_string(std::get<std::string>(v));
    default: return "0x" + sql::hex(std::get<std::vector<std::uint8_t>>(v));
    }
}

std::string SqlServerDialect::limit_prefix(int limit) const {
    if (limit <= 0) return {};
    return "TOP (" + std::to_string(limit) + ") ";
}

std::string SqlServerDialect::limit_suffix(int) const {
    return {};
}

std::optional<std::string> SqlServerDialect::use_catalog_statement(const TableId& id) const {
    if (id.catalog.empty()) return std::nullopt;
    return "USE " + quote_identifier(id.catalog) + ";";
}

std::string SqlServerDialect::approximate_row_count_query(const TableId& id) const {
    // Less accurate than COUNT(*), but does not touch the table.
    return "SELECT Total_Rows = SUM(st.row_count) FROM sys.dm_db_partition_stats st "
           "WHERE object_name(object_id) = " + sql::quote_string(id.table) +
           " AND index_id < 2;";
}

std::string SqlServerDialect::max_lsn_query(const std::string& database) const {
    std::string from;
    if (!database.empty()) from = quote_identifier(database) + ".";
    from += "[cdc].[lsn_time_mapping]";
    return "SELECT MAX(start_lsn) FROM " + from + " WHERE tran_id <> 0x00";
}

// SQLite

std::string SqliteDialect::quote_identifier(std::string_view ident) const {
    // SQLite has no escape for ']' inside brackets.
    if (ident.find(']') != std::string_view::npos) return sql::quote_double(ident);
    return sql::quote_bracket(ident);
}

std::string SqliteDialect::literal(const Value& v) const {
    switch (v.index()) {
    case 0: return "NULL";
    case 1: case 2: return number_literal(v);
    case 3: return sql::quote_string(std::get<std::string>(v));
    default: return "X'" + sql::hex(std::get<std::vector<std::uint8_t>>(v)) + "'";
    }
}

std::string SqliteDialect::limit_prefix(int) const {
    return {};
}

std::string SqliteDialect::limit_suffix(int limit) const {
    if (limit <= 0) return {};
    return " LIMIT " + std::to_string(limit);
}

std::optional<std::string> SqliteDialect::use_catalog_statement(const TableId&) const {
    return std::nullopt;
}

std::string SqliteDialect::approximate_row_count_query(const TableId& id) const {
    // Every sqlite_stat1 row for a table starts with its row count.
    std::string stat = "sqlite_stat1";
    if (!id.schema.empty()) stat = quote_identifier(id.schema) + "." + stat;
    return "SELECT COALESCE(MAX(CAST(stat AS INTEGER)), 0) FROM " + stat +
           " WHERE tbl = " + sql::quote_string(id.table);
}

std::string SqliteDialect::max_lsn_query(const std::string& database) const {
    std::string from;
    if (!database.empty()) from = quote_identifier(database) + ".";
    from += "[lsn_time_mapping]";
    return "SELECT MAX(start_lsn) FROM " + from + " WHERE tran_id <> X'00'";
}

} // namespace snapchunk

// ── sqlite_connection.cpp ───────────────────────────────────────
namespace snapchunk {

namespace {

class SqliteStatement final : public Statement {
public:
    SqliteStatement(sqlite3* db, std::string sql, int fetch_size)
        : db_(db), sql_(std::move(sql)), fetch_size_(fetch_size) {
        stmt_ = detail::prepare(db_, sql_);
    }

    const std::string& sql() const override { return sql_; }

    std::size_t parameter_count() const override {
        return static_cast<std::size_t>(sqlite3_bind_parameter_count(stmt_.get()));
    }

    void bind(std::size_t index, const Value& v) override {
        int rc = detail::bind_value(stmt_.get(), static_cast<int>(index), v);
        if (rc != SQLITE_OK) {
            throw Error(ErrorCode::SqliteError,
                        "bind parameter " + std::to_string(index) + ": " +
                        sqlite3_errstr(rc));
        }
    }

    // SQLite steps one row at a time; the fetch size is kept for callers only.
    void set_fetch_size(int rows) override { fetch_size_ = rows; }
    int fetch_size() const override { return fetch_size_; }

    void query(const RowCallback& on_row) override {
        sqlite3_reset(stmt_.get());
        detail::for_each_row(db_, stmt_.get(), on_row);
    }

private:
    sqlite3*          db_;
    std::string       sql_;
    int               fetch_size_;
    detail::StmtGuard stmt_;
};

} // namespace

SqliteConnection::SqliteConnection(sqlite3* db, std::string database)
    : db_(db), database_(std::move(database)) {}

void SqliteConnection::query(const std::string& sql,
                             const std::vector<Value>& params,
                             const RowCallback& on_row) {
    auto stmt = detail::prepare(db_, sql);
    for (std::size_t i = 0; i < params.size(); ++i) {
        int rc = detail::bind_value(stmt.get(), static_cast<int>(i + 1), params[i]);
        if (rc != SQLITE_OK) {
            throw Error(ErrorCode::SqliteError,
                        "bind parameter " + std::to_string(i + 1) + ": " +
                        sqlite3_errstr(rc));
        }
    }
    detail::for_each_row(db_, stmt.get(), on_row);
}

void SqliteConnection::execute_without_committing(const std::string& sql) {
    detail::exec(db_, sql.c_str());
}

std::unique_ptr<Statement> SqliteConnection::prepare(const std::string& sql,
                                                     int fetch_size) {
    return std::make_unique<SqliteStatement>(db_, sql, fetch_size);
}

bool SqliteConnection::auto_commit() const {
    return sqlite3_get_autocommit(db_) != 0;
}

void SqliteConnection::set_auto_commit(bool enabled) {
    if (enabled == auto_commit()) return;
    // Leaving manual mode commits the open transaction, as JDBC does.
    detail::exec(db_, enabled ? "COMMIT" : "BEGIN");
}

Table SqliteConnection::describe_table(const TableId& id) {
    const std::string& schema = id.schema.empty() ? database_ : id.schema;
    std::string pragma = "PRAGMA " + sql::quote_double(schema) +
                         ".table_info(" + sql::quote_double(id.table) + ")";
    auto stmt = detail::prepare(db_, pragma);

    Table table;
    table.id = id;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        Column col;
        col.name = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
        auto* decl = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 2));
        col.declared_type = decl ? decl : "";
        col.type = logical_type_from_declared(col.declared_type);
        col.pk_ordinal = sqlite3_column_int(stmt.get(), 5);
        table.columns.push_back(std::move(col));
    }

    if (table.columns.empty()) {
        throw Error(ErrorCode::Validation,
                    "table '" + id.to_string() + "' not found");
    }
    return table;
}

} // namespace snapchunk

// ── row_decoder.cpp ─────────────────────────────────────────────
namespace snapchunk {

namespace {

Value coerce(const Value& v, LogicalType type, std::size_t column) {
    if (is_null(v)) return v;

    switch (type) {
    case LogicalType::Integer:
        if (std::holds_alternative<std::int64_t>(v)) return v;
        if (auto* d = std::get_if<double>(&v)) {
            // Only integral reals inside the int64 range convert exactly.
            if (*d >= -9223372036854775808.0 && *d < 9223372036854775808.0 &&
                *d == static_cast<double>(static_cast<std::int64_t>(*d))) {
                return static_cast<std::int64_t>(*d);
            }
        }
        break;
    case LogicalType::Real:
        if (std::holds_alternative<double>(v)) return v;
        if (auto* i = std::get_if<std::int64_t>(&v)) {
            // Beyond 2^53 a double no longer holds every integer; keep the exact value.
            constexpr std::int64_t kExact = std::int64_t{1} << 53;
            if (*i >= -kExact && *i <= kExact) return static_cast<double>(*i);
            return v;
        }
        break;
    case LogicalType::Text:
        if (std::holds_alternative<std::string>(v)) return v;
        break;
    case LogicalType::Blob:
        if (std::holds_alternative<std::vector<std::uint8_t>>(v)) return v;
        break;
    case LogicalType::Numeric:
        // Numeric affinity keeps whichever storage class the value fits.
        if (!std::holds_alternative<std::vector<std::uint8_t>>(v)) return v;
        break;
    case LogicalType::Any:
        return v;
    }
    throw Error(ErrorCode::TypeMismatch,
                "column " + std::to_string(column) + ": value " + to_string(v) +
                " is not a " + to_string(type));
}

} // namespace

RowDecoder::RowDecoder(std::vector<LogicalType> types) : types_(std::move(types)) {}

KeyTuple RowDecoder::decode(const Row& row) const {
    if (row.size() < types_.size()) {
        throw Error(ErrorCode::TypeMismatch,
                    "row has " + std::to_string(row.size()) + " columns, expected " +
                    std::to_string(types_.size()));
    }
    KeyTuple tuple;
    tuple.reserve(types_.size());
    for (std::size_t i = 0; i < types_.size(); ++i) {
        tuple.push_back(coerce(row[i], types_[i], i));
    }
    return tuple;
}

} // namespace snapchunk

// ── session.cpp ─────────────────────────────────────────────────
namespace snapchunk {

Session::Session(Connection& conn, SessionOptions options)
    : conn_(conn), options_(options), saved_auto_commit_(conn.auto_commit()) {
    if (saved_auto_commit_ != options_.auto_commit) {
        conn_.set_auto_commit(options_.auto_commit);
    }
    SPDLOG_DEBUG("session opened on {} (auto_commit={}, fetch_size={})",
                 conn_.database(), options_.auto_commit, options_.fetch_size);
}

Session::~Session() {
    try {
        if (conn_.auto_commit() != saved_auto_commit_) {
            conn_.set_auto_commit(saved_auto_commit_);
        }
    } catch (const std::exception& e) {
        SPDLOG_ERROR("failed to restore auto_commit={} on {}: {}",
                     saved_auto_commit_, conn_.database(), e.what());
    }
}

} // namespace snapchunk

// ── key_selector.cpp ────────────────────────────────────────────
namespace snapchunk {

std::vector<KeyColumn> select_key_columns(const Table& table) {
    auto pk = table.primary_key_columns();
    if (pk.empty()) {
        throw Error(ErrorCode::Validation,
                    "Incremental snapshot for tables requires primary key, but table " +
                    table.id.to_string() + " doesn't have primary key.");
    }
    std::vector<KeyColumn> keys;
    keys.reserve(pk.size());
    for (const auto& c : pk) keys.push_back(KeyColumn{c.name, c.type});
    return keys;
}

KeyColumn select_key_column(const Table& table) {
    // The leading primary key column is the split key.
    return select_key_columns(table).front();
}

} // namespace snapchunk

// ── split_query.cpp ─────────────────────────────────────────────
namespace snapchunk {

namespace {

void add_key_condition(std::string& sql, const Dialect& dialect,
                       std::span<const KeyColumn> keys, const char* predicate) {
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (i) sql += " AND ";
        sql += dialect.quote_identifier(keys[i].name);
        sql += predicate;
    }
}

std::string join_keys(const Dialect& dialect, std::span<const KeyColumn> keys,
                      const char* before, const char* after) {
    std::string out;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (i) out += ", ";
        out += before;
        out += dialect.quote_identifier(keys[i].name);
        out += after;
    }
    return out;
}

std::vector<std::string> quoted_keys(const Dialect& dialect, std::span<const KeyColumn> keys) {
    std::vector<std::string> out;
    for (const auto& k : keys) out.push_back(dialect.quote_identifier(k.name));
    return out;
}

} // namespace

ChunkPredicate build_chunk_predicate(const Dialect& dialect,
                                     std::span<const KeyColumn> keys,
                                     ChunkPosition position,
                                     QueryKind kind) {
    if (keys.empty()) {
        throw Error(ErrorCode::Validation, "chunk predicate needs at least one key column");
    }

    const bool scanning = kind == QueryKind::DataScan;
    const std::size_t k = keys.size();

    ChunkPredicate p;
    p.order_by = join_keys(dialect, keys, "", "");

    switch (position) {
    case ChunkPosition::Only:
        break;
    case ChunkPosition::First:
        add_key_condition(p.condition, dialect, keys, " <= ?");
        p.parameter_count = k;
        if (scanning) {
            // Rows equal to the end belong to the next chunk.
            p.condition += " AND NOT (";
            add_key_condition(p.condition, dialect, keys, " = ?");
            p.condition += ")";
            p.parameter_count += k;
        }
        break;
    case ChunkPosition::Last:
        add_key_condition(p.condition, dialect, keys, " >= ?");
        p.parameter_count = k;
        break;
    case ChunkPosition::Middle:
        add_key_condition(p.condition, dialect, keys, " >= ?");
        p.parameter_count = k;
        if (scanning) {
            p.condition += " AND NOT (";
            add_key_condition(p.condition, dialect, keys, " = ?");
            p.condition += ")";
            p.parameter_count += k;
        }
        p.condition += " AND ";
        add_key_condition(p.condition, dialect, keys, " <= ?");
        p.parameter_count += k;
        break;
    }
    return p;
}

SplitQuery build_split_scan_query(const Dialect& dialect,
                                  const TableId& table,
                                  std::span<const KeyColumn> keys,
                                  ChunkPosition position,
                                  bool ordered) {
    auto predicate = build_chunk_predicate(dialect, keys, position, QueryKind::DataScan);

    SplitQuery q;
    q.kind = QueryKind::DataScan;
    q.position = position;
    q.has_condition = !predicate.condition.empty();
    q.parameter_count = predicate.parameter_count;
    if (ordered) q.order_by = quoted_keys(dialect, keys);
    q.sql = dialect.select_with_limit("*", dialect.quote_table(table),
                                      predicate.condition,
                                      ordered ? predicate.order_by : std::string{},
                                      q.limit);
    return q;
}

SplitQuery build_boundary_query(const Dialect& dialect,
                                const TableId& table,
                                std::span<const KeyColumn> keys,
                                ChunkPosition position,
                                int limit) {
    if (limit <= 0) {
        throw Error(ErrorCode::Validation,
                    "boundary query limit must be positive, got " + std::to_string(limit));
    }
    auto predicate = build_chunk_predicate(dialect, keys, position,
                                           QueryKind::BoundaryDiscovery);

    SplitQuery q;
    q.kind = QueryKind::BoundaryDiscovery;
    q.position = position;
    q.limit = limit;
    q.order_by = quoted_keys(dialect, keys);
    q.has_condition = !predicate.condition.empty();
    q.parameter_count = predicate.parameter_count;

    auto inner = dialect.select_with_limit(join_keys(dialect, keys, "", ""),
                                           dialect.quote_table(table),
                                           predicate.condition,
                                           join_keys(dialect, keys, "", " ASC"),
                                           limit);
    q.sql = "SELECT " + join_keys(dialect, keys, "MAX(", ")") +
            " FROM (" + inner + ") AS T";
    return q;
}

std::string render_with_parameters(const Dialect& dialect,
                                   std::string_view sql,
                                   const std::vector<Value>& params) {
    std::string out;
    out.reserve(sql.size());
    std::size_t next = 0;
    char close = 0;       // closing quote character while inside quoted text
    char last_close = 0;  // quote that closed on the previous character

    for (char c : sql) {
        if (close) {
            out += c;
            if (c == close) {
                last_close = close;
                close = 0;
            }
            continue;
        }
        if (last_close && c == last_close) {
            // Doubled closing quote: still inside the same quoted text.
            close = last_close;
            last_close = 0;
            out += c;
            continue;
        }
        last_close = 0;
        switch (c) {
        case '\'': close = '\''; out += c; break;
        case '"':  close = '"';  out += c; break;
        case '[':  close = ']';  out += c; break;
        case '?':
            if (next >= params.size()) {
                throw Error(ErrorCode::StatementBind,
                            "query has more parameter slots than the " +
                            std::to_string(params.size()) + " values given");
            }
            out += dialect.literal(params[next++]);
            break;
        default:
            out += c;
        }
    }

    if (next != params.size()) {
        throw Error(ErrorCode::StatementBind,
                    "query has " + std::to_string(next) + " parameter slots but " +
                    std::to_string(params.size()) + " values were given");
    }
    return out;
}

} // namespace snapchunk

// ── binder.cpp ──────────────────────────────────────────────────
namespace snapchunk {

namespace {

void append_key(std::vector<Value>& out, const std::optional<KeyTuple>& key,
                std::size_t arity, const char* side) {
    if (key->size() < arity) {
        throw Error(ErrorCode::StatementBind,
                    std::string("chunk ") + side + " has " + std::to_string(key->size()) +
                    " values, key arity is " + std::to_string(arity));
    }
    out.insert(out.end(), key->begin(), key->begin() + static_cast<std::ptrdiff_t>(arity));
}

} // namespace

std::vector<Value> chunk_parameters(const ChunkBound& bound, std::size_t key_arity,
                                    QueryKind kind) {
    const bool scanning = kind == QueryKind::DataScan;
    std::vector<Value> params;

    switch (bound.position()) {
    case ChunkPosition::Only:
        break;
    case ChunkPosition::First:
        append_key(params, bound.end, key_arity, "end");
        if (scanning) append_key(params, bound.end, key_arity, "end");
        break;
    case ChunkPosition::Last:
        append_key(params, bound.start, key_arity, "start");
        break;
    case ChunkPosition::Middle:
        append_key(params, bound.start, key_arity, "start");
        if (scanning) append_key(params, bound.end, key_arity, "end");
        append_key(params, bound.end, key_arity, "end");
        break;
    }
    return params;
}

void bind_chunk(Statement& stmt, const ChunkBound& bound, std::size_t key_arity) {
    auto params = chunk_parameters(bound, key_arity);
    if (stmt.parameter_count() != params.size()) {
        throw Error(ErrorCode::StatementBind,
                    std::string(to_string(bound.position())) + " chunk needs " +
                    std::to_string(params.size()) + " parameters, statement has " +
                    std::to_string(stmt.parameter_count()));
    }

    try {
        for (std::size_t i = 0; i < params.size(); ++i) {
            stmt.bind(i + 1, params[i]);
        }
    } catch (const std::exception&) {
        std::throw_with_nested(Error(ErrorCode::StatementBind,
                                     "Failed to build the split data read statement."));
    }
}

ChunkRead prepare_chunk_read(Session& session,
                             const TableId& table,
                             std::span<const KeyColumn> keys,
                             const ChunkBound& bound) {
    ChunkRead read;
    read.bound = bound;
    read.query = build_split_scan_query(session.dialect(), table, keys, bound.position());

    try {
        read.statement = session.connection().prepare(read.query.sql,
                                                      session.options().fetch_size);
    } catch (const std::exception&) {
        std::throw_with_nested(Error(ErrorCode::SourceUnavailable,
                                     "failed to prepare [" + read.query.sql + "]"));
    }
    bind_chunk(*read.statement, bound, keys.size());

    SPDLOG_DEBUG("chunk {} of {}: {}", to_string(bound), table.to_string(),
                 render_with_parameters(session.dialect(), read.query.sql,
                                        chunk_parameters(bound, keys.size())));
    return read;
}

} // namespace snapchunk

// ── estimator.cpp ───────────────────────────────────────────────
namespace snapchunk {

namespace {

/// Run a query that must return exactly one row and return that row.
Row query_single_row(Session& session, const std::string& sql,
                     const std::vector<Value>& params) {
    SPDLOG_DEBUG("{}", sql);
    std::optional<Row> result;
    try {
        session.connection().query(sql, params, [&](const Row& row) {
            result = row;
            return false;
        });
    } catch (const std::exception&) {
        std::throw_with_nested(Error(ErrorCode::SourceUnavailable,
                                     "query failed [" + sql + "]"));
    }
    if (!result) {
        throw Error(ErrorCode::EmptyResult,
                    "No result returned after running query [" + sql + "]");
    }
    return std::move(*result);
}

Value decode_key(const Row& row, const KeyColumn& key) {
    return RowDecoder({key.type}).decode_fixed<1>(row)[0];
}

std::int64_t decode_count(const Row& row, const std::string& sql) {
    const Value& v = row.at(0);
    if (is_null(v)) return 0;
    if (auto* i = std::get_if<std::int64_t>(&v)) return *i;
    if (auto* d = std::get_if<double>(&v)) {
        if (*d >= -9223372036854775808.0 && *d < 9223372036854775808.0) {
            return static_cast<std::int64_t>(*d);
        }
    }
    throw Error(ErrorCode::TypeMismatch,
                "invalid count " + to_string(v) + " from [" + sql + "]");
}

} // namespace

std::pair<Value, Value> query_min_max(Session& session, const TableId& table,
                                      const KeyColumn& key) {
    const auto& d = session.dialect();
    auto col = d.quote_identifier(key.name);
    auto sql = "SELECT MIN(" + col + "), MAX(" + col + ") FROM " + d.quote_table(table);

    auto row = query_single_row(session, sql, {});
    auto minmax = RowDecoder({key.type, key.type}).decode_fixed<2>(row);
    return {std::move(minmax[0]), std::move(minmax[1])};
}

std::int64_t query_approximate_row_count(Session& session, const TableId& table) {
    const auto& d = session.dialect();
    if (auto use = d.use_catalog_statement(table)) {
        try {
            session.connection().execute_without_committing(*use);
        } catch (const std::exception&) {
            std::throw_with_nested(Error(ErrorCode::SourceUnavailable,
                                         "statement failed [" + *use + "]"));
        }
    }
    auto sql = d.approximate_row_count_query(table);
    return decode_count(query_single_row(session, sql, {}), sql);
}

Value query_min(Session& session, const TableId& table, const KeyColumn& key,
                const Value& excluded_lower_bound) {
    const auto& d = session.dialect();
    auto col = d.quote_identifier(key.name);
    auto sql = "SELECT MIN(" + col + ") FROM " + d.quote_table(table) +
               " WHERE " + col + " > ?";
    return decode_key(query_single_row(session, sql, {excluded_lower_bound}), key);
}

Value query_next_chunk_bound(Session& session, const TableId& table,
                             const KeyColumn& key, int chunk_size,
                             const Value& included_lower_bound) {
    // A LAST-shaped boundary query: MAX over the first chunk_size keys >= bound.
    auto q = build_boundary_query(session.dialect(), table,
                                  std::span<const KeyColumn>(&key, 1),
                                  ChunkPosition::Last, chunk_size);
    return decode_key(query_single_row(session, q.sql, {included_lower_bound}), key);
}

int query_row_count_in_range(Session& session, const TableId& table,
                             const KeyColumn& key,
                             const Value& min, const Value& max) {
    const auto& d = session.dialect();
    auto col = d.quote_identifier(key.name);
    auto sql = "SELECT COUNT(" + col + ") FROM " + d.quote_table(table) +
               " WHERE " + col + " > ? AND " + col + " <= ?";
    auto count = decode_count(query_single_row(session, sql, {min, max}), sql);
    if (count < 0 || count > std::numeric_limits<int>::max()) {
        throw Error(ErrorCode::TypeMismatch,
                    "row count " + std::to_string(count) + " from [" + sql +
                    "] does not fit an int");
    }
    return static_cast<int>(count);
}

} // namespace snapchunk

// ── splitter.cpp ────────────────────────────────────────────────
namespace snapchunk {

ChunkSplitter::ChunkSplitter(SplitterConfig config) : config_(config) {
    if (config_.chunk_size <= 0) {
        throw Error(ErrorCode::Validation,
                    "chunk size must be positive, got " + std::to_string(config_.chunk_size));
    }
    if (config_.distribution_factor_lower > config_.distribution_factor_upper) {
        throw Error(ErrorCode::Validation,
                    "distribution factor lower bound exceeds the upper bound");
    }
}

std::vector<ChunkBound> ChunkSplitter::split(Session& session, const Table& table) const {
    return split(session, table.id, select_key_column(table));
}

std::vector<ChunkBound> ChunkSplitter::split(Session& session, const TableId& table,
                                             const KeyColumn& key) const {
    auto [min, max] = query_min_max(session, table, key);
    if (is_null(min) || is_null(max)) {
        SPDLOG_INFO("table {} is empty, using a single chunk", table.to_string());
        return {ChunkBound{}};
    }

    auto* imin = std::get_if<std::int64_t>(&min);
    auto* imax = std::get_if<std::int64_t>(&max);
    bool integral = key.type == LogicalType::Integer || key.type == LogicalType::Numeric;
    if (config_.evenly_split_integral_keys && integral && imin && imax) {
        auto rows = query_approximate_row_count(session, table);
        double factor = distribution_factor(*imin, *imax, rows);
        if (factor >= config_.distribution_factor_lower &&
            factor <= config_.distribution_factor_upper) {
            double scaled = factor * config_.chunk_size;
            int dynamic = scaled >= std::numeric_limits<int>::max()
                ? std::numeric_limits<int>::max()
                : std::max(static_cast<int>(scaled), 1);
            SPDLOG_INFO("splitting {} evenly on {}: factor={:.2f}, chunk={}",
                        table.to_string(), key.name, factor, dynamic);
            return split_evenly(*imin, *imax, rows, dynamic);
        }
        SPDLOG_WARN("key {} of {} has distribution factor {:.2f} outside [{}, {}], "
                    "splitting unevenly", key.name, table.to_string(), factor,
                    config_.distribution_factor_lower, config_.distribution_factor_upper);
    }
    return split_unevenly(session, table, key, min, max);
}

std::vector<ChunkBound> ChunkSplitter::split_unevenly(Session& session, const TableId& table,
                                                      const KeyColumn& key,
                                                      const Value& min,
                                                      const Value& max) const {
    std::vector<ChunkBound> chunks;
    std::optional<KeyTuple> start;

    Value end = query_next_chunk_bound(session, table, key, config_.chunk_size, min);
    while (!is_null(end) && compare_values(end, max) < 0) {
        if (start && compare_values(end, start->front()) <= 0) {
            throw Error(ErrorCode::Validation,
                        "chunk boundary walk on " + key.name + " of " + table.to_string() +
                        " did not advance past " + to_string(start->front()));
        }
        chunks.push_back(ChunkBound{start, KeyTuple{end}});
        SPDLOG_DEBUG("{}: chunk {} {}", table.to_string(), chunks.size(),
                     to_string(chunks.back()));
        start = KeyTuple{end};

        // The next chunk starts at end inclusive; its first row after end
        // anchors the next discovery step.
        Value lower = query_min(session, table, key, end);
        if (is_null(lower)) break;
        end = query_next_chunk_bound(session, table, key, config_.chunk_size, lower);
    }
    chunks.push_back(ChunkBound{start, std::nullopt});

    SPDLOG_INFO("split {} into {} chunks on {}", table.to_string(), chunks.size(), key.name);
    return chunks;
}

std::vector<ChunkBound> ChunkSplitter::split_evenly(std::int64_t min, std::int64_t max,
                                                    std::int64_t approximate_row_count,
                                                    int dynamic_chunk_size) const {
    if (approximate_row_count <= config_.chunk_size) {
        return {ChunkBound{}};
    }

    std::vector<ChunkBound> chunks;
    std::optional<KeyTuple> start;
    const auto step = static_cast<std::uint64_t>(std::max(dynamic_chunk_size, 1));

    // Unsigned distance so that wide ranges do not overflow.
    std::int64_t prev = min;
    while (static_cast<std::uint64_t>(max) - static_cast<std::uint64_t>(prev) >= step) {
        auto end = static_cast<std::int64_t>(static_cast<std::uint64_t>(prev) + step);
        chunks.push_back(ChunkBound{start, KeyTuple{end}});
        start = KeyTuple{end};
        prev = end;
    }
    chunks.push_back(ChunkBound{start, std::nullopt});
    return chunks;
}

double ChunkSplitter::distribution_factor(std::int64_t min, std::int64_t max,
                                          std::int64_t approximate_row_count) {
    if (approximate_row_count <= 0) return std::numeric_limits<double>::infinity();
    return (static_cast<double>(max) - static_cast<double>(min) + 1.0) /
           static_cast<double>(approximate_row_count);
}

} // namespace snapchunk

// ── position.cpp ────────────────────────────────────────────────
namespace snapchunk {

namespace {

bool parse_hex(std::string_view part, std::size_t max_digits, std::uint32_t& out) {
    if (part.empty() || part.size() > max_digits) return false;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), out, 16);
    return ec == std::errc{} && ptr == part.data() + part.size();
}

void put_be(std::array<std::uint8_t, Lsn::kSize>& b, std::size_t at,
            std::uint32_t v, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i) {
        b[at + i] = static_cast<std::uint8_t>(v >> (8 * (width - 1 - i)));
    }
}

std::uint32_t get_be(const std::array<std::uint8_t, Lsn::kSize>& b, std::size_t at,
                     std::size_t width) {
    std::uint32_t v = 0;
    for (std::size_t i = 0; i < width; ++i) v = (v << 8) | b[at + i];
    return v;
}

Lsn lsn_from_value(const Value& v) {
    if (auto* blob = std::get_if<std::vector<std::uint8_t>>(&v)) {
        return Lsn::from_bytes(*blob);
    }
    if (auto* text = std::get_if<std::string>(&v)) {
        return Lsn::parse(*text);
    }
    throw Error(ErrorCode::MalformedPosition,
                "LSN must be binary or text, got " + to_string(v));
}

} // namespace

Lsn Lsn::from_parts(std::uint32_t vlf, std::uint32_t block, std::uint16_t slot) {
    std::array<std::uint8_t, kSize> b{};
    put_be(b, 0, vlf, 4);
    put_be(b, 4, block, 4);
    put_be(b, 8, slot, 2);
    return Lsn(b);
}

Lsn Lsn::from_bytes(std::span<const std::uint8_t> data) {
    if (data.size() != kSize) {
        throw Error(ErrorCode::MalformedPosition,
                    "LSN must be " + std::to_string(kSize) + " bytes, got " +
                    std::to_string(data.size()));
    }
    std::array<std::uint8_t, kSize> b{};
    std::copy(data.begin(), data.end(), b.begin());
    return Lsn(b);
}

Lsn Lsn::parse(std::string_view text) {
    auto first = text.find(':');
    auto second = first == std::string_view::npos ? first : text.find(':', first + 1);
    std::uint32_t vlf = 0, block = 0, slot = 0;

    if (second == std::string_view::npos ||
        text.find(':', second + 1) != std::string_view::npos ||
        !parse_hex(text.substr(0, first), 8, vlf) ||
        !parse_hex(text.substr(first + 1, second - first - 1), 8, block) ||
        !parse_hex(text.substr(second + 1), 4, slot)) {
        throw Error(ErrorCode::MalformedPosition,
                    "invalid LSN '" + std::string(text) + "'");
    }
    return from_parts(vlf, block, static_cast<std::uint16_t>(slot));
}

std::string Lsn::to_string() const {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%08x:%08x:%04x",
                  static_cast<unsigned>(get_be(bytes_, 0, 4)),
                  static_cast<unsigned>(get_be(bytes_, 4, 4)),
                  static_cast<unsigned>(get_be(bytes_, 8, 2)));
    return buf;
}

int Lsn::compare(const Lsn& o) const {
    int c = std::memcmp(bytes_.data(), o.bytes_.data(), kSize);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

LogPosition::LogPosition(Lsn change_lsn, Lsn commit_lsn,
                         std::optional<std::int64_t> event_serial_no)
    : change_lsn_(change_lsn), commit_lsn_(commit_lsn),
      event_serial_no_(event_serial_no) {}

LogPosition LogPosition::initial() {
    return LogPosition(Lsn{}, Lsn{});
}

LogPosition LogPosition::no_stopping() {
    std::array<std::uint8_t, Lsn::kSize> ff;
    ff.fill(0xFF);
    return LogPosition(Lsn(ff), Lsn(ff));
}

int LogPosition::compare(const LogPosition& o) const {
    if (int c = commit_lsn_.compare(o.commit_lsn_)) return c;
    if (int c = change_lsn_.compare(o.change_lsn_)) return c;
    if (event_serial_no_ == o.event_serial_no_) return 0;
    if (!event_serial_no_) return -1;
    if (!o.event_serial_no_) return 1;
    return *event_serial_no_ < *o.event_serial_no_ ? -1 : 1;
}

OffsetRecord LogPosition::to_offset_record() const {
    OffsetRecord record;
    record[kChangeLsnKey] = change_lsn_.to_string();
    record[kCommitLsnKey] = commit_lsn_.to_string();
    if (event_serial_no_) record[kEventSerialNoKey] = std::to_string(*event_serial_no_);
    return record;
}

std::string LogPosition::to_string() const {
    std::string s = "{change_lsn=" + change_lsn_.to_string() +
                    ", commit_lsn=" + commit_lsn_.to_string();
    if (event_serial_no_) s += ", event_serial_no=" + std::to_string(*event_serial_no_);
    return s + "}";
}

LogPosition parse_position(const OffsetRecord& record) {
    auto field = [&](const char* key) -> const std::string& {
        auto it = record.find(key);
        if (it == record.end() || !it->second) {
            throw Error(ErrorCode::MalformedPosition,
                        std::string("offset record has no '") + key + "'");
        }
        return *it->second;
    };

    auto lsn = [&](const char* key) {
        const auto& text = field(key);
        try {
            return Lsn::parse(text);
        } catch (const Error&) {
            std::throw_with_nested(Error(ErrorCode::MalformedPosition,
                                         std::string("offset record field '") + key +
                                         "' is not an LSN"));
        }
    };

    Lsn change = lsn(kChangeLsnKey);
    Lsn commit = lsn(kCommitLsnKey);

    std::optional<std::int64_t> serial;
    auto it = record.find(kEventSerialNoKey);
    if (it != record.end() && it->second) {
        const auto& text = *it->second;
        std::int64_t n = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
            throw Error(ErrorCode::MalformedPosition,
                        "offset record field 'event_serial_no' is not an integer: '" +
                        text + "'");
        }
        serial = n;
    }
    return LogPosition(change, commit, serial);
}

LogPosition current_position(Connection& conn) {
    auto sql = conn.dialect().max_lsn_query(conn.database());
    std::optional<Value> max;
    try {
        conn.query(sql, {}, [&](const Row& row) {
            if (!row.empty()) max = row[0];
            return false;
        });
    } catch (const std::exception& e) {
        std::throw_with_nested(Error(ErrorCode::SourceUnavailable,
                                     std::string("failed to read the maximum LSN: ") +
                                     e.what()));
    }

    if (!max || is_null(*max)) {
        throw Error(ErrorCode::SourceUnavailable,
                    "No maximum LSN recorded in the database; "
                    "please ensure that the SQL Server Agent is running");
    }

    Lsn lsn = lsn_from_value(*max);
    SPDLOG_DEBUG("current maximum LSN of {} is {}", conn.database(), lsn.to_string());
    return LogPosition(lsn, lsn);
}

} // namespace snapchunk
