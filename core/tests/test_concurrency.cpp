#include "trigraph/transaction.hpp"
#include "test_support.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace trigraph;
using namespace trigraph::test_support;

// ============================================================================
// Readers during commits (4 readers + 1 writer)
// ============================================================================

TEST(Concurrency, ReadersSeeCommittedStatesOnly) {
  TempDir dir;
  auto stored = Marshaller(options_for(dir)).marshal(three_node_chain());
  ASSERT_TRUE(stored.has_value());
  std::shared_ptr<StoredGraph> graph = *stored;

  constexpr int kCommits = 50;
  std::atomic<bool> done{false};
  std::atomic<int> failures{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      uint64_t last = 0;
      while (!done.load(std::memory_order_acquire)) {
        uint64_t count = graph->node_count();
        if (count < last || count < 3)
          ++failures;
        last = count;

        auto data = graph->node_data(2);
        if (!data || !data->has_value() || (*data)->size() != 4)
          ++failures;
        if (graph->out_edges(1).size() != 1)
          ++failures;
        if (!graph->cost(1, 2).has_value())
          ++failures;
      }
    });
  }

  // Readers must be joined before any assertion can return.
  int commits = 0;
  for (; commits < kCommits; ++commits) {
    auto txn = graph->begin_transaction();
    if (!txn)
      break;
    auto id = txn->add_node(Payload::of<int32_t>(commits));
    if (!id || !txn->add_edge(3, *id, Payload::of(static_cast<float>(commits))) ||
        !txn->commit())
      break;
  }
  done.store(true, std::memory_order_release);
  for (auto &t : readers)
    t.join();

  ASSERT_EQ(commits, kCommits);
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(graph->node_count(), 3u + kCommits);
  EXPECT_EQ(graph->out_edges(3).size(), 1u + kCommits);
}

// ============================================================================
// Writer exclusion
// ============================================================================

TEST(Concurrency, OnlyOneTransactionAtATime) {
  TempDir dir;
  auto stored = Marshaller(options_for(dir)).marshal(three_node_chain());
  ASSERT_TRUE(stored.has_value());
  std::shared_ptr<StoredGraph> graph = *stored;

  constexpr int kThreads = 8;
  constexpr int kAttempts = 25;
  std::atomic<int> committed{0};
  std::atomic<int> refused{0};
  std::atomic<int> errors{0};

  std::vector<std::thread> writers;
  for (int w = 0; w < kThreads; ++w) {
    writers.emplace_back([&] {
      for (int i = 0; i < kAttempts; ++i) {
        auto txn = graph->begin_transaction();
        if (!txn) {
          if (txn.error().code == ErrorCode::InvalidArgument)
            ++refused;
          else
            ++errors;
          continue;
        }
        if (!txn->add_node() || !txn->commit())
          ++errors;
        else
          ++committed;
      }
    });
  }
  for (auto &t : writers)
    t.join();

  EXPECT_EQ(errors.load(), 0);
  EXPECT_EQ(committed.load() + refused.load(), kThreads * kAttempts);
  EXPECT_EQ(graph->node_count(), 3u + static_cast<uint64_t>(committed.load()));
  EXPECT_EQ(graph->node_header().max_id, 3 + committed.load());
}

TEST(Concurrency, ReadersDuringDefragment) {
  TempDir dir;
  auto stored = Marshaller(options_for(dir)).marshal(three_node_chain());
  ASSERT_TRUE(stored.has_value());
  std::shared_ptr<StoredGraph> graph = *stored;
  {
    auto txn = graph->begin_transaction();
    ASSERT_TRUE(txn.has_value());
    ASSERT_TRUE(txn->update_node(2, Payload::of_bytes(std::vector<uint8_t>(32, 1)))
                    .has_value());
    ASSERT_TRUE(txn->commit().has_value());
  }

  std::atomic<bool> done{false};
  std::atomic<int> failures{0};
  std::thread reader([&] {
    while (!done.load(std::memory_order_acquire)) {
      auto data = graph->node_data(2);
      if (!data || !data->has_value() || (*data)->size() != 32)
        ++failures;
    }
  });

  int passes = 0;
  while (passes < 10 && graph->defragment())
    ++passes;
  done.store(true, std::memory_order_release);
  reader.join();

  EXPECT_EQ(passes, 10);
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(graph->node_data(2).value()->size(), 32u);
}
