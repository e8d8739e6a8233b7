// Copyright 2026 The snapchunk Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <snapchunk.h>

#include <sqlite3.h>

#include <cmath>

using namespace snapchunk;

namespace {

Value I(std::int64_t v) { return v; }
Value T(const char* s) { return std::string(s); }

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

    /// orders(id 1..n)
    void fill_orders(int n) {
        exec("CREATE TABLE orders (id INTEGER PRIMARY KEY, total REAL)");
        std::string insert =
            "WITH RECURSIVE n(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM n WHERE x < " +
            std::to_string(n) + ") INSERT INTO orders SELECT x, x * 0.5 FROM n";
        exec(insert.c_str());
    }
};

/// SQL Server-flavored connection answering every query with a fixed row
/// (or none), recording what it was asked.
class ScriptedConnection : public Connection {
public:
    const Dialect& dialect() const override { return dialect_; }
    std::string database() const override { return "inventory"; }

    void query(const std::string& sql, const std::vector<Value>&,
               const RowCallback& on_row) override {
        queries.push_back(sql);
        if (reply) on_row(*reply);
    }
    void execute_without_committing(const std::string& sql) override {
        executed.push_back(sql);
    }
    std::unique_ptr<Statement> prepare(const std::string&, int) override { return nullptr; }
    bool auto_commit() const override { return false; }
    void set_auto_commit(bool) override {}

    std::optional<Row>       reply;
    std::vector<std::string> queries;
    std::vector<std::string> executed;

private:
    SqlServerDialect dialect_;
};

const TableId kOrders{"", "", "orders"};
const KeyColumn kId{"id", LogicalType::Integer};

} // namespace

TEST_CASE("estimator: min and max") {
    DB d;
    d.fill_orders(1000);
    SqliteConnection conn(d.db);
    Session session(conn);

    auto [min, max] = query_min_max(session, kOrders, kId);
    CHECK(std::get<std::int64_t>(min) == 1);
    CHECK(std::get<std::int64_t>(max) == 1000);
}

TEST_CASE("estimator: min and max of an empty table are NULL") {
    DB d;
    d.exec("CREATE TABLE orders (id INTEGER PRIMARY KEY)");
    SqliteConnection conn(d.db);
    Session session(conn);

    auto [min, max] = query_min_max(session, kOrders, kId);
    CHECK(is_null(min));
    CHECK(is_null(max));
}

TEST_CASE("estimator: query_min excludes its lower bound") {
    DB d;
    d.fill_orders(1000);
    SqliteConnection conn(d.db);
    Session session(conn);

    CHECK(std::get<std::int64_t>(query_min(session, kOrders, kId, I(100))) == 101);
    CHECK(std::get<std::int64_t>(query_min(session, kOrders, kId, I(0))) == 1);
    CHECK(is_null(query_min(session, kOrders, kId, I(1000))));
}

TEST_CASE("estimator: next chunk bound") {
    DB d;
    d.fill_orders(1000);
    SqliteConnection conn(d.db);
    Session session(conn);

    CHECK(std::get<std::int64_t>(query_next_chunk_bound(session, kOrders, kId, 100, I(1))) == 100);
    CHECK(std::get<std::int64_t>(query_next_chunk_bound(session, kOrders, kId, 100, I(101))) == 200);
    CHECK(std::get<std::int64_t>(query_next_chunk_bound(session, kOrders, kId, 100, I(950))) == 1000);
    CHECK(is_null(query_next_chunk_bound(session, kOrders, kId, 100, I(1001))));
}

TEST_CASE("estimator: exact row count in a half-open range") {
    DB d;
    d.fill_orders(1000);
    SqliteConnection conn(d.db);
    Session session(conn);

    CHECK(query_row_count_in_range(session, kOrders, kId, I(100), I(200)) == 100);
    CHECK(query_row_count_in_range(session, kOrders, kId, I(0), I(1000)) == 1000);
    CHECK(query_row_count_in_range(session, kOrders, kId, I(1000), I(2000)) == 0);
}

TEST_CASE("estimator: approximate row count comes from statistics") {
    DB d;
    d.fill_orders(1000);
    d.exec("ANALYZE");
    SqliteConnection conn(d.db);
    Session session(conn);

    CHECK(query_approximate_row_count(session, kOrders) == 1000);
    CHECK(query_approximate_row_count(session, TableId{"", "", "other"}) == 0);
}

TEST_CASE("estimator: approximate row count without statistics") {
    DB d;
    d.fill_orders(10);
    SqliteConnection conn(d.db);
    Session session(conn);

    try {
        query_approximate_row_count(session, kOrders);
        FAIL("expected SourceUnavailable");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::SourceUnavailable);
    }
}

TEST_CASE("estimator: SQL Server switches catalog before counting") {
    ScriptedConnection conn;
    conn.reply = Row{I(42)};
    Session session(conn);

    CHECK(query_approximate_row_count(session, TableId{"inventory", "dbo", "orders"}) == 42);
    REQUIRE(conn.executed.size() == 1);
    CHECK(conn.executed[0] == "USE [inventory];");
    REQUIRE(conn.queries.size() == 1);
    CHECK(conn.queries[0].find("sys.dm_db_partition_stats") != std::string::npos);
}

TEST_CASE("estimator: missing table fails with the source error nested") {
    DB d;
    SqliteConnection conn(d.db);
    Session session(conn);

    try {
        query_min_max(session, kOrders, kId);
        FAIL("expected SourceUnavailable");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::SourceUnavailable);
        try {
            std::rethrow_if_nested(e);
            FAIL("expected a nested cause");
        } catch (const Error& cause) {
            CHECK(cause.code() == ErrorCode::SqliteError);
        }
    }
}

TEST_CASE("estimator: aggregate query returning no row") {
    ScriptedConnection conn;
    Session session(conn);

    try {
        query_min(session, TableId{"inventory", "dbo", "orders"}, kId, I(5));
        FAIL("expected EmptyResult");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::EmptyResult);
        CHECK(std::string(e.what()).find("No result returned after running query [") == 0);
    }
}

TEST_CASE("estimator: SQL Server boundary query text") {
    ScriptedConnection conn;
    conn.reply = Row{I(100)};
    Session session(conn);

    auto v = query_next_chunk_bound(session, TableId{"inventory", "dbo", "orders"}, kId, 100, I(1));
    CHECK(std::get<std::int64_t>(v) == 100);
    REQUIRE(conn.queries.size() == 1);
    CHECK(conn.queries[0] ==
          "SELECT MAX([id]) FROM (SELECT TOP (100) [id] FROM [dbo].[orders] "
          "WHERE [id] >= ? ORDER BY [id] ASC) AS T");
}

TEST_CASE("estimator: text keys") {
    DB d;
    d.exec("CREATE TABLE tags (name TEXT PRIMARY KEY);"
           "INSERT INTO tags VALUES ('a'), ('b'), ('c'), ('d'), ('e');");
    SqliteConnection conn(d.db);
    Session session(conn);
    TableId tags{"", "", "tags"};
    KeyColumn name{"name", LogicalType::Text};

    auto [min, max] = query_min_max(session, tags, name);
    CHECK(std::get<std::string>(min) == "a");
    CHECK(std::get<std::string>(max) == "e");
    CHECK(std::get<std::string>(query_next_chunk_bound(session, tags, name, 2, T("a"))) == "b");
    CHECK(std::get<std::string>(query_min(session, tags, name, T("b"))) == "c");
    CHECK(query_row_count_in_range(session, tags, name, T("a"), T("c")) == 2);
}

TEST_CASE("estimator: key values that do not match the declared type") {
    DB d;
    d.exec("CREATE TABLE odd (id INT PRIMARY KEY);"
           "INSERT INTO odd VALUES (1), ('abc');");
    SqliteConnection conn(d.db);
    Session session(conn);

    try {
        query_min_max(session, TableId{"", "", "odd"}, kId);
        FAIL("expected TypeMismatch");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::TypeMismatch);
    }
}

TEST_CASE("estimator: counts outside the representable range") {
    ScriptedConnection conn;
    Session session(conn);
    TableId orders{"inventory", "dbo", "orders"};

    auto expect_mismatch = [&](auto&& call) {
        try {
            call();
            FAIL("expected TypeMismatch");
        } catch (const Error& e) {
            CHECK(e.code() == ErrorCode::TypeMismatch);
        }
    };

    conn.reply = Row{I(3000000000)};
    expect_mismatch([&] { query_row_count_in_range(session, orders, kId, I(1), I(2)); });
    conn.reply = Row{I(-1)};
    expect_mismatch([&] { query_row_count_in_range(session, orders, kId, I(1), I(2)); });

    conn.reply = Row{Value{1e300}};
    expect_mismatch([&] { query_approximate_row_count(session, orders); });
    conn.reply = Row{Value{std::nan("")}};
    expect_mismatch([&] { query_approximate_row_count(session, orders); });

    conn.reply = Row{Value{1234.0}};
    CHECK(query_approximate_row_count(session, orders) == 1234);
}
