// ===========================================================================
// Write path: transaction commit and defragmentation
// ---------------------------------------------------------------------------
// Methodology:
//   - Fresh 10K-node chain per fixture instance
//   - BM_Commit: range(0) nodes appended per transaction
//   - BM_UpdateInPlace vs BM_UpdateGrowing: same-size rewrite against
//     an append that leaves a hole
//   - BM_Defragment: compaction after deleting every other edge
// ===========================================================================

#include "trigraph/marshaller.hpp"
#include "trigraph/transaction.hpp"
#include <benchmark/benchmark.h>
#include <filesystem>
#include <string>
#include <vector>

namespace {

constexpr int64_t NODES = 10'000;

trigraph::MemoryGraph build_chain(int64_t n) {
  trigraph::MemoryGraph g;
  for (int64_t i = 0; i < n; ++i)
    g.add_node(trigraph::Payload::of_bytes(std::vector<uint8_t>(16, 0x5A)));
  for (int64_t i = 1; i < n; ++i)
    (void)g.add_edge(i, i + 1, trigraph::Payload::of(1.0f));
  return g;
}

} // namespace

class CommitFixture : public benchmark::Fixture {
public:
  std::shared_ptr<trigraph::StoredGraph> graph;
  std::string node_path = "/tmp/trigraph_bench_commit.nodes.graph";

  void SetUp(benchmark::State &state) override {
    trigraph::MarshalOptions opts;
    opts.node_path = node_path;
    auto stored = trigraph::Marshaller(opts).marshal(build_chain(NODES));
    if (!stored) {
      state.SkipWithError(stored.error().describe().c_str());
      return;
    }
    graph = *stored;
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
// BM_Commit: batch append, fsync cost amortized over range(0) nodes
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(CommitFixture, BM_Commit)(benchmark::State &state) {
  const int64_t batch = state.range(0);
  for (auto _ : state) {
    auto txn = graph->begin_transaction();
    if (!txn) {
      state.SkipWithError(txn.error().describe().c_str());
      break;
    }
    for (int64_t i = 0; i < batch; ++i)
      benchmark::DoNotOptimize(txn->add_node(trigraph::Payload::of<int64_t>(i)));
    if (auto r = txn->commit(); !r) {
      state.SkipWithError(r.error().describe().c_str());
      break;
    }
  }
  state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK_REGISTER_F(CommitFixture, BM_Commit)
    ->Arg(1)
    ->Arg(64)
    ->Arg(1024)
    ->Unit(benchmark::kMicrosecond);

// ---------------------------------------------------------------------------
// BM_UpdateInPlace / BM_UpdateGrowing
// ---------------------------------------------------------------------------
static void run_updates(benchmark::State &state, trigraph::StoredGraph &graph,
                        size_t payload_size) {
  int64_t id = 1;
  for (auto _ : state) {
    auto txn = graph.begin_transaction();
    if (!txn) {
      state.SkipWithError(txn.error().describe().c_str());
      break;
    }
    auto payload = trigraph::Payload::of_bytes(std::vector<uint8_t>(payload_size, 0x11));
    if (auto r = txn->update_node(id, payload); !r) {
      state.SkipWithError(r.error().describe().c_str());
      break;
    }
    if (auto r = txn->commit(); !r) {
      state.SkipWithError(r.error().describe().c_str());
      break;
    }
    id = id % NODES + 1;
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK_DEFINE_F(CommitFixture, BM_UpdateInPlace)(benchmark::State &state) {
  run_updates(state, *graph, 16);
}
BENCHMARK_REGISTER_F(CommitFixture, BM_UpdateInPlace)->Unit(benchmark::kMicrosecond);

BENCHMARK_DEFINE_F(CommitFixture, BM_UpdateGrowing)(benchmark::State &state) {
  run_updates(state, *graph, 256);
}
BENCHMARK_REGISTER_F(CommitFixture, BM_UpdateGrowing)->Unit(benchmark::kMicrosecond);

// ---------------------------------------------------------------------------
// BM_Defragment
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(CommitFixture, BM_Defragment)(benchmark::State &state) {
  for (auto _ : state) {
    state.PauseTiming();
    {
      auto txn = graph->begin_transaction();
      if (!txn) {
        state.SkipWithError(txn.error().describe().c_str());
        break;
      }
      for (const trigraph::EdgeHandle &e : graph->edges()) {
        if (e.from_id % 2 == 0)
          (void)txn->delete_edge(e.from_id, e.to_id);
      }
      if (auto r = txn->commit(); !r) {
        state.SkipWithError(r.error().describe().c_str());
        break;
      }
    }
    state.ResumeTiming();

    if (auto r = graph->defragment(); !r) {
      state.SkipWithError(r.error().describe().c_str());
      break;
    }
  }
}
BENCHMARK_REGISTER_F(CommitFixture, BM_Defragment)
    ->Unit(benchmark::kMillisecond)
    ->Iterations(5);
