#include <benchmark/benchmark.h>
#include "hillclimb/Solver.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

using namespace hillclimb;

// Smooth-ish random terrain: each cell drifts at most +-1 from its left/upper
// neighbour, so most of the map stays climbable.
static std::string make_terrain(int w, int h, uint32_t seed = 1337) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> drift(-1, 1);
    std::vector<int> elev(static_cast<size_t>(w * h), 0);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            int base = 0;
            if (x > 0 && y > 0) base = (elev[y*w + x - 1] + elev[(y-1)*w + x]) / 2;
            else if (x > 0)     base = elev[y*w + x - 1];
            else if (y > 0)     base = elev[(y-1)*w + x];
            int v = base + drift(rng);
            elev[y*w + x] = v < 0 ? 0 : (v > 25 ? 25 : v);
        }
    }
    std::string text;
    text.reserve(static_cast<size_t>((w + 1) * h));
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            if (x == 0 && y == 0)          text.push_back('S');
            else if (x == w-1 && y == h-1) text.push_back('E');
            else                           text.push_back(static_cast<char>('a' + elev[y*w + x]));
        }
        text.push_back('\n');
    }
    return text;
}

static void bench_parse(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    const std::string text = make_terrain(w, w);
    for (auto _ : st) {
        auto map = terrain::ParseHeightMap(text);
        benchmark::DoNotOptimize(map.has_value());
    }
}
BENCHMARK(bench_parse)->Arg(128)->Arg(512);

static void bench_build_graph(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    const auto map = terrain::ParseHeightMap(make_terrain(w, w));
    if (!map) { st.SkipWithError(map.error().message.c_str()); return; }
    for (auto _ : st) {
        auto g = graph::ClimbGraph::Build(*map);
        benchmark::DoNotOptimize(g.edge_count());
    }
}
BENCHMARK(bench_build_graph)->Arg(128)->Arg(512);

static void bench_forward(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    const auto map = terrain::ParseHeightMap(make_terrain(w, w));
    if (!map) { st.SkipWithError(map.error().message.c_str()); return; }
    const auto g = graph::ClimbGraph::Build(*map);
    for (auto _ : st) {
        auto r = search::FindForward(g, g.node(map->start()), g.node(map->end()));
        benchmark::DoNotOptimize(r.has_value());
    }
}
BENCHMARK(bench_forward)->Arg(128)->Arg(256)->Arg(512);

static void bench_reverse(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    const auto map = terrain::ParseHeightMap(make_terrain(w, w));
    if (!map) { st.SkipWithError(map.error().message.c_str()); return; }
    const auto reversed = graph::ClimbGraph::Build(*map).Reversed();
    for (auto _ : st) {
        auto r = search::FindReverse(reversed, reversed.node(map->end()));
        benchmark::DoNotOptimize(r.has_value());
    }
}
BENCHMARK(bench_reverse)->Arg(128)->Arg(256)->Arg(512);

BENCHMARK_MAIN();
