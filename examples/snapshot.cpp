// Copyright 2026 The snapchunk Authors
// SPDX-License-Identifier: Apache-2.0
#include <snapchunk.h>

#include <spdlog/spdlog.h>

#include <sqlite3.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace snapchunk;

static void run(sqlite3* db, const std::string& statement) {
    char* err = nullptr;
    if (sqlite3_exec(db, statement.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw Error(ErrorCode::SqliteError, msg);
    }
}

// Record a committed transaction in the LSN mapping table.
static void commit_lsn(sqlite3* db, const Lsn& lsn) {
    run(db, "INSERT INTO lsn_time_mapping (start_lsn, tran_id) VALUES (X'" +
            sql::hex(lsn.bytes()) + "', X'01')");
}

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::info);

    int chunk_size = argc > 1 ? std::atoi(argv[1]) : 250;

    if (chunk_size <= 0) {
        std::fprintf(stderr, "usage: %s [chunk_size > 0]\n", argv[0]);
        return 2;
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(":memory:", &db) != SQLITE_OK) {
        std::fprintf(stderr, "cannot open database\n");
        sqlite3_close(db);
        return 1;
    }

    try {
        run(db,
            "CREATE TABLE orders (id INTEGER PRIMARY KEY, customer TEXT, total REAL);"
            "CREATE TABLE lsn_time_mapping (start_lsn BLOB, tran_id BLOB);"
            "WITH RECURSIVE n(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM n WHERE x < 1000) "
            "INSERT INTO orders SELECT x, 'customer-' || (x % 37), x * 1.25 FROM n;");
        commit_lsn(db, Lsn::from_parts(0x2b, 0x98, 3));

        SqliteConnection conn(db);
        auto table = conn.describe_table(TableId{"", "", "orders"});
        std::vector<KeyColumn> keys{select_key_column(table)};

        // 1. Low watermark.
        auto before = current_position(conn);
        std::printf("=== Position before snapshot: %s ===\n", before.to_string().c_str());

        // 2. Split and read each chunk.
        Session session(conn);
        ChunkSplitter splitter(SplitterConfig{chunk_size});
        auto chunks = splitter.split(session, table);

        std::printf("=== %zu chunks of ~%d rows ===\n", chunks.size(), chunk_size);
        std::size_t total = 0;
        for (const auto& bound : chunks) {
            auto read = prepare_chunk_read(session, table.id, keys, bound);
            std::size_t rows = 0;
            read.statement->query([&](const Row&) {
                ++rows;
                return true;
            });
            total += rows;
            std::printf("  %-6s %-16s %4zu rows  %s\n",
                        to_string(bound.position()), to_string(bound).c_str(), rows,
                        render_with_parameters(session.dialect(), read.query.sql,
                                               chunk_parameters(bound, keys.size())).c_str());
        }
        std::printf("Read %zu rows\n", total);

        // 3. High watermark, after a concurrent commit.
        commit_lsn(db, Lsn::from_parts(0x2b, 0x99, 1));
        auto after = current_position(conn);
        std::printf("=== Position after snapshot: %s (%s) ===\n",
                    after.to_string().c_str(),
                    after > before ? "advanced" : "unchanged");
    } catch (const Error& e) {
        std::fprintf(stderr, "error (%s): %s\n", to_string(e.code()), e.what());
        sqlite3_close(db);
        return 1;
    }

    sqlite3_close(db);
    return 0;
}
