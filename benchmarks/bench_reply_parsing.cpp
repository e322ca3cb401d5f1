/**
 * @file bench_reply_parsing.cpp
 * @brief Benchmarks for control-channel reply parsing
 */

#include <benchmark/benchmark.h>

#include <cymo/protocol/ftp_reply.h>

#include <string>
#include <vector>

namespace cymo::benchmark {

static void BM_ParseSingleLineReply(::benchmark::State& state) {
    for (auto _ : state) {
        protocol::ftp_reply_parser parser;
        auto reply = parser.feed("226 Transfer complete");
        ::benchmark::DoNotOptimize(reply);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ParseSingleLineReply);

static void BM_ParseMultiLineReply(::benchmark::State& state) {
    const auto line_count = static_cast<std::size_t>(state.range(0));
    std::vector<std::string> lines;
    lines.emplace_back("220-Welcome");
    for (std::size_t i = 0; i < line_count; ++i) {
        lines.push_back(" banner line " + std::to_string(i));
    }
    lines.emplace_back("220 Ready");

    for (auto _ : state) {
        protocol::ftp_reply_parser parser;
        for (const auto& line : lines) {
            auto reply = parser.feed(line);
            ::benchmark::DoNotOptimize(reply);
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(lines.size()) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ParseMultiLineReply)->Arg(1)->Arg(10)->Arg(100);

static void BM_ParsePasvReply(::benchmark::State& state) {
    for (auto _ : state) {
        auto address = protocol::parse_pasv_reply("Entering Passive Mode (192,168,1,10,195,80)");
        ::benchmark::DoNotOptimize(address);
    }
}
BENCHMARK(BM_ParsePasvReply);

static void BM_ParseEpsvReply(::benchmark::State& state) {
    for (auto _ : state) {
        auto address = protocol::parse_epsv_reply("Entering Extended Passive Mode (|||50000|)");
        ::benchmark::DoNotOptimize(address);
    }
}
BENCHMARK(BM_ParseEpsvReply);

}  // namespace cymo::benchmark
