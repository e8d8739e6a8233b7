// Copyright 2026 The snapchunk Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <snapchunk.h>

#include <cmath>
#include <limits>

using namespace snapchunk;

namespace {

Value I(std::int64_t v) { return v; }
Value T(const char* s) { return std::string(s); }
Value B(std::vector<std::uint8_t> b) { return b; }

} // namespace

TEST_CASE("compare_values: source order across types") {
    CHECK(compare_values(Value{}, I(0)) < 0);
    CHECK(compare_values(I(1), Value{1.5}) < 0);
    CHECK(compare_values(Value{1.5}, I(2)) < 0);
    CHECK(compare_values(I(2), T("")) < 0);
    CHECK(compare_values(T("zzz"), B({0x00})) < 0);
    CHECK(compare_values(B({0x00}), Value{}) > 0);
}

TEST_CASE("compare_values: integers and reals compare exactly") {
    const std::int64_t big = (std::int64_t{1} << 53) + 1;
    CHECK(compare_values(I(big), Value{static_cast<double>(big)}) > 0);
    CHECK(compare_values(Value{static_cast<double>(big)}, I(big)) < 0);
    CHECK(compare_values(I(big), I(big - 1)) > 0);
    CHECK(compare_values(I(-3), Value{-2.5}) < 0);
    CHECK(compare_values(I(-2), Value{-2.5}) > 0);
    CHECK(compare_values(I(std::numeric_limits<std::int64_t>::max()), Value{1e19}) < 0);
    CHECK(compare_values(I(0), Value{std::nan("")}) < 0);
}

TEST_CASE("compare_values: within a type") {
    CHECK(compare_values(Value{}, Value{}) == 0);
    CHECK(compare_values(I(2), Value{2.0}) == 0);
    CHECK(compare_values(I(-5), I(3)) < 0);
    CHECK(compare_values(T("abc"), T("abd")) < 0);
    CHECK(compare_values(T("b"), T("abc")) > 0);
    CHECK(compare_values(B({0x01, 0x02}), B({0x01, 0x02, 0x00})) < 0);
    CHECK(compare_values(B({0x02}), B({0x01, 0xFF})) > 0);
}

TEST_CASE("to_string renders values for logs") {
    CHECK(to_string(Value{}) == "NULL");
    CHECK(to_string(I(-42)) == "-42");
    CHECK(to_string(T("abc")) == "abc");
    CHECK(to_string(B({0xDE, 0xAD})) == "0xDEAD");
}

TEST_CASE("logical_type_from_declared") {
    CHECK(logical_type_from_declared("INTEGER") == LogicalType::Integer);
    CHECK(logical_type_from_declared("bigint") == LogicalType::Integer);
    CHECK(logical_type_from_declared("bit") == LogicalType::Integer);
    CHECK(logical_type_from_declared("nvarchar(40)") == LogicalType::Text);
    CHECK(logical_type_from_declared("TEXT") == LogicalType::Text);
    CHECK(logical_type_from_declared("uniqueidentifier") == LogicalType::Text);
    CHECK(logical_type_from_declared("varbinary(16)") == LogicalType::Blob);
    CHECK(logical_type_from_declared("BLOB") == LogicalType::Blob);
    CHECK(logical_type_from_declared("") == LogicalType::Any);
    CHECK(logical_type_from_declared("float") == LogicalType::Real);
    CHECK(logical_type_from_declared("DOUBLE PRECISION") == LogicalType::Real);
    CHECK(logical_type_from_declared("decimal(10,2)") == LogicalType::Numeric);
    CHECK(logical_type_from_declared("NUMERIC(20,0)") == LogicalType::Numeric);
    CHECK(logical_type_from_declared("money") == LogicalType::Numeric);
    CHECK(logical_type_from_declared("datetime2") == LogicalType::Numeric);
    CHECK(logical_type_from_declared("DATE") == LogicalType::Numeric);
}

TEST_CASE("ChunkBound: position follows the open sides") {
    CHECK(ChunkBound{}.position() == ChunkPosition::Only);
    CHECK(ChunkBound{std::nullopt, KeyTuple{I(10)}}.position() == ChunkPosition::First);
    CHECK(ChunkBound{KeyTuple{I(10)}, KeyTuple{I(20)}}.position() == ChunkPosition::Middle);
    CHECK(ChunkBound{KeyTuple{I(20)}, std::nullopt}.position() == ChunkPosition::Last);
}

TEST_CASE("ChunkBound: equality and rendering") {
    ChunkBound a{KeyTuple{I(10)}, KeyTuple{I(20)}};
    ChunkBound b{KeyTuple{Value{10.0}}, KeyTuple{I(20)}};
    ChunkBound c{KeyTuple{I(10)}, std::nullopt};
    CHECK(a == b);
    CHECK_FALSE(a == c);
    CHECK(to_string(a) == "([10], [20])");
    CHECK(to_string(c) == "([10], null)");
}

TEST_CASE("RowDecoder: coerces to declared types") {
    RowDecoder d({LogicalType::Integer, LogicalType::Real, LogicalType::Text});
    auto t = d.decode(Row{Value{2.0}, I(3), T("x"), T("ignored")});
    REQUIRE(t.size() == 3);
    CHECK(std::get<std::int64_t>(t[0]) == 2);
    CHECK(std::get<double>(t[1]) == 3.0);
    CHECK(std::get<std::string>(t[2]) == "x");
}

TEST_CASE("RowDecoder: large integers keep their exact value") {
    const std::int64_t big = (std::int64_t{1} << 53) + 3;
    RowDecoder d({LogicalType::Numeric, LogicalType::Real});
    auto t = d.decode(Row{I(big), I(big)});
    CHECK(std::get<std::int64_t>(t[0]) == big);
    CHECK(std::get<std::int64_t>(t[1]) == big);
}

TEST_CASE("RowDecoder: numeric and untyped columns keep the storage class") {
    RowDecoder numeric({LogicalType::Numeric});
    CHECK(std::get<double>(numeric.decode(Row{Value{12.5}})[0]) == 12.5);
    CHECK(std::get<std::string>(numeric.decode(Row{T("2026-10-18")})[0]) == "2026-10-18");
    CHECK_THROWS_AS(numeric.decode(Row{B({0x01})}), Error);

    RowDecoder any({LogicalType::Any});
    CHECK(std::get<std::int64_t>(any.decode(Row{I(7)})[0]) == 7);
    CHECK(std::get<std::vector<std::uint8_t>>(any.decode(Row{B({0x01})})[0]).size() == 1);
}

TEST_CASE("RowDecoder: NULL passes through") {
    RowDecoder d({LogicalType::Integer});
    auto t = d.decode(Row{Value{}});
    CHECK(is_null(t[0]));
}

TEST_CASE("RowDecoder: rejects mismatched values") {
    RowDecoder d({LogicalType::Integer});
    try {
        d.decode(Row{Value{2.5}});
        FAIL("expected TypeMismatch");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::TypeMismatch);
    }
    CHECK_THROWS_AS(d.decode(Row{T("7")}), Error);
    CHECK_THROWS_AS(RowDecoder({LogicalType::Blob}).decode(Row{T("x")}), Error);
}

TEST_CASE("RowDecoder: short rows and fixed arity") {
    RowDecoder d({LogicalType::Integer, LogicalType::Integer});
    CHECK_THROWS_AS(d.decode(Row{I(1)}), Error);

    auto pair = d.decode_fixed<2>(Row{I(1), I(9)});
    CHECK(std::get<std::int64_t>(pair[0]) == 1);
    CHECK(std::get<std::int64_t>(pair[1]) == 9);

    try {
        d.decode_fixed<1>(Row{I(1), I(9)});
        FAIL("expected TypeMismatch");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::TypeMismatch);
    }
}
