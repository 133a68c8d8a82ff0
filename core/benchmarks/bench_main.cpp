// ===========================================================================
// Read path: open, neighbor traversal, payload decode
// ---------------------------------------------------------------------------
// Store under test:
//   - Generic graph, 100K nodes, 64-ary BFS tree plus one back edge per node
//   - Every node carries an int64 payload, every edge a float32 cost
//
// Methodology:
//   - Store is built once per fixture instance, reopened read-only
//   - Random node ids from a fixed seed
// ===========================================================================

#include "trigraph/marshaller.hpp"
#include "trigraph/stored_graph.hpp"
#include <benchmark/benchmark.h>
#include <filesystem>
#include <random>
#include <string>

namespace {

constexpr int BRANCHING_FACTOR = 64;
constexpr int64_t NODES = 100'000;

trigraph::MemoryGraph build_graph(int64_t n) {
  trigraph::MemoryGraph g;
  for (int64_t i = 0; i < n; ++i)
    g.add_node(trigraph::Payload::of<int64_t>(i * 7));
  for (int64_t child = 2; child <= n; ++child) {
    int64_t parent = (child - 2) / BRANCHING_FACTOR + 1;
    (void)g.add_edge(parent, child, trigraph::Payload::of(1.0f));
    (void)g.add_edge(child, parent, trigraph::Payload::of(2.0f));
  }
  return g;
}

} // namespace

class StoreFixture : public benchmark::Fixture {
public:
  std::shared_ptr<trigraph::StoredGraph> graph;
  std::string node_path = "/tmp/trigraph_bench_read.nodes.graph";

  void SetUp(benchmark::State &state) override {
    trigraph::MarshalOptions opts;
    opts.node_path = node_path;
    auto stored = trigraph::Marshaller(opts).marshal(build_graph(NODES));
    if (!stored) {
      state.SkipWithError(stored.error().describe().c_str());
      return;
    }
    (*stored)->close();

    opts.store.read_only = true;
    auto opened = trigraph::Unmarshaller(opts).unmarshal();
    if (!opened) {
      state.SkipWithError(opened.error().describe().c_str());
      return;
    }
    graph = *opened;
  }

  void TearDown(benchmark::State &) override {
    graph.reset();
    auto paths = trigraph::StorePaths::from_node_path(node_path);
    std::filesystem::remove(paths.nodes);
    std::filesystem::remove(paths.edges);
    std::filesystem::remove(paths.data);
  }
};

// ---------------------------------------------------------------------------
// BM_Neighbors: lazy neighbor iteration of a random node
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(StoreFixture, BM_Neighbors)(benchmark::State &state) {
  std::mt19937_64 rng(42);
  std::uniform_int_distribution<int64_t> pick(1, NODES);
  uint64_t visited = 0;
  for (auto _ : state) {
    for (const trigraph::NodeHandle &n : graph->neighbors(pick(rng))) {
      benchmark::DoNotOptimize(n.id);
      ++visited;
    }
  }
  state.SetItemsProcessed(state.iterations());
  state.counters["NeighborsVisited"] = static_cast<double>(visited);
}
BENCHMARK_REGISTER_F(StoreFixture, BM_Neighbors)->Unit(benchmark::kNanosecond);

// ---------------------------------------------------------------------------
// BM_NodeData: payload decode through the data file
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(StoreFixture, BM_NodeData)(benchmark::State &state) {
  std::mt19937_64 rng(7);
  std::uniform_int_distribution<int64_t> pick(1, NODES);
  for (auto _ : state) {
    auto data = graph->node_data(pick(rng));
    benchmark::DoNotOptimize(data);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(StoreFixture, BM_NodeData)->Unit(benchmark::kNanosecond);

// ---------------------------------------------------------------------------
// BM_Cost: default cost callback (float32 edge payload)
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(StoreFixture, BM_Cost)(benchmark::State &state) {
  std::mt19937_64 rng(9);
  std::uniform_int_distribution<int64_t> pick(2, NODES);
  for (auto _ : state) {
    int64_t child = pick(rng);
    auto cost = graph->cost(child, (child - 2) / BRANCHING_FACTOR + 1);
    benchmark::DoNotOptimize(cost);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(StoreFixture, BM_Cost)->Unit(benchmark::kNanosecond);

// ---------------------------------------------------------------------------
// BM_Open: full open, index rebuild included
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(StoreFixture, BM_Open)(benchmark::State &state) {
  trigraph::MarshalOptions opts;
  opts.node_path = node_path;
  opts.store.read_only = true;
  for (auto _ : state) {
    auto g = trigraph::Unmarshaller(opts).unmarshal();
    benchmark::DoNotOptimize(g);
  }
}
BENCHMARK_REGISTER_F(StoreFixture, BM_Open)
    ->Unit(benchmark::kMillisecond)
    ->Iterations(10);

BENCHMARK_MAIN();
