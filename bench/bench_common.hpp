// bench/bench_common.hpp
// Shared benchmark scenarios: synthetic Report_RM buffers of various sizes.

#pragma once

#include "codec.hpp"

#include <cstddef>
#include <string>

namespace stk_bench {

struct BenchScenario {
    const char* name;
    size_t rows;
    size_t row_size;

    size_t total_bytes() const { return rows * row_size; }
};

constexpr BenchScenario SCENARIOS[] = {
    {"short_report", 10, 80},
    {"typical", 1440, 120},
    {"day_at_10s", 8640, 120},
    {"wide_rows", 1000, 1000},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// One CSV-like report row of approximately the given size.
inline std::string generate_row(size_t index, size_t size) {
    std::string row = std::to_string(index) + ",7000.123456,-1234.5,42.0";
    if (row.size() < size) row.append(size - row.size(), '0');
    return row;
}

// Report_RM buffer as the async remote sends it: one envelope per row.
inline std::string generate_report_buffer(const BenchScenario& scenario) {
    std::string buffer;
    buffer.reserve(scenario.rows * (scenario.row_size + stk::Wire::ASYNC_HEADER_SIZE));
    for (size_t i = 0; i < scenario.rows; ++i) {
        auto row = generate_row(i, scenario.row_size);
        stk::AsyncHeader h;
        h.async_type = "REPORT_RM";
        h.identifier = 1;
        h.total_packets = static_cast<uint32_t>(scenario.rows % 10000);
        h.packet_number = static_cast<uint32_t>((i + 1) % 10000);
        h.data_length = static_cast<uint32_t>(row.size());
        buffer += stk::codec::encode_async_header(h);
        buffer += row;
    }
    return buffer;
}

} // namespace stk_bench
