// Copyright 2026 The snapchunk Authors
// SPDX-License-Identifier: Apache-2.0
//
// libFuzzer harness for snapchunk::Lsn::parse and snapchunk::parse_position.
// Build with: cmake -DSNAPCHUNK_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++
// Run with:   ./build/fuzz_parse_position corpus/positions -max_total_time=60

#include "snapchunk.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::string_view text(reinterpret_cast<const char*>(data), size);

    // Fuzz Lsn::parse; a parsed LSN must print back to an equal LSN.
    try {
        auto lsn = snapchunk::Lsn::parse(text);
        if (snapchunk::Lsn::parse(lsn.to_string()) != lsn) __builtin_trap();
    } catch (const snapchunk::Error&) {
        // Expected for malformed input.
    }

    // Fuzz parse_position: split the input into the three record fields.
    auto a = text.find('\n');
    auto b = a == std::string_view::npos ? a : text.find('\n', a + 1);
    snapchunk::OffsetRecord record;
    record[snapchunk::kChangeLsnKey] = std::string(text.substr(0, a));
    if (a != std::string_view::npos) {
        record[snapchunk::kCommitLsnKey] = std::string(text.substr(a + 1, b - a - 1));
    }
    if (b != std::string_view::npos) {
        record[snapchunk::kEventSerialNoKey] = std::string(text.substr(b + 1));
    }
    try {
        auto pos = snapchunk::parse_position(record);
        if (snapchunk::parse_position(pos.to_offset_record()) != pos) __builtin_trap();
    } catch (const snapchunk::Error&) {
        // Expected for malformed input.
    }

    return 0;
}
