#include "trigraph/file_storage.hpp"
#include "trigraph/transaction.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <limits>

using namespace trigraph;
using namespace trigraph::test_support;

namespace {

std::vector<uint8_t> snapshot(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>());
}

} // namespace

class TransactionTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto stored = Marshaller(options_for(dir)).marshal(three_node_chain());
    ASSERT_TRUE(stored.has_value()) << stored.error().describe();
    graph = *stored;
  }

  TempDir dir;
  std::shared_ptr<StoredGraph> graph;
};

// ============================================================================
// Updates in place and with growth
// ============================================================================

TEST_F(TransactionTest, SameSizeUpdateKeepsOffset) {
  uint64_t offset = graph->node_by_id(2)->data_offset;
  uint64_t size = graph->data_size();

  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(
      txn->update_node(2, Payload::of_bytes({0x11, 0x22, 0x33, 0x44})).has_value());
  ASSERT_TRUE(txn->commit().has_value());

  EXPECT_EQ(graph->node_by_id(2)->data_offset, offset);
  EXPECT_EQ(graph->data_size(), size);
  EXPECT_EQ(file_size(dir.store().data), size);

  auto data = graph->node_data(2);
  ASSERT_TRUE(data.has_value());
  std::vector<uint8_t> bytes((*data)->bytes().begin(), (*data)->bytes().end());
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x11, 0x22, 0x33, 0x44}));
}

TEST_F(TransactionTest, GrowingUpdateAppendsAtTail) {
  uint64_t old_offset = graph->node_by_id(2)->data_offset;
  uint64_t old_tail = graph->data_size();
  uint64_t entries = graph->data_header().entry_count;

  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->update_node(2, Payload::of_bytes(std::vector<uint8_t>(64, 0xAB)))
                  .has_value());
  ASSERT_TRUE(txn->commit().has_value());

  EXPECT_EQ(graph->node_by_id(2)->data_offset, old_tail);
  EXPECT_EQ(graph->data_size(), old_tail + ENTRY_HEADER_SIZE + 64);
  EXPECT_EQ(graph->data_header().entry_count, entries + 1);

  // The old entry is left behind as a hole.
  auto old_bytes = snapshot(dir.store().data);
  ASSERT_GT(old_bytes.size(), old_offset + ENTRY_HEADER_SIZE + 4);
  EXPECT_EQ(old_bytes[old_offset + ENTRY_HEADER_SIZE], 0xDE);

  auto data = graph->node_data(2);
  ASSERT_TRUE(data.has_value());
  EXPECT_EQ((*data)->size(), 64u);
}

TEST_F(TransactionTest, ClearingPayloadZeroesOffset) {
  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->update_node(2, std::nullopt).has_value());
  ASSERT_TRUE(txn->commit().has_value());

  EXPECT_EQ(graph->node_by_id(2)->data_offset, 0u);
  auto data = graph->node_data(2);
  ASSERT_TRUE(data.has_value());
  EXPECT_FALSE(data->has_value());
}

TEST_F(TransactionTest, UpdateEdgeByEndpointsAndIndex) {
  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->update_edge(1, 2, Payload::of(9.0f)).has_value());
  ASSERT_TRUE(txn->update_edge_at(1, Payload::of_string("last")).has_value());

  auto missing = txn->update_edge(3, 1, Payload::of(1.0f));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
  ASSERT_TRUE(txn->commit().has_value());

  EXPECT_FLOAT_EQ(graph->cost(1, 2).value(), 9.0f);
  EXPECT_EQ(graph->edge_data(1).value()->as_string().value(), "last");
}

// ============================================================================
// Additions and deletions
// ============================================================================

TEST_F(TransactionTest, AddNodesAndEdges) {
  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  auto a = txn->add_node(Payload::of<int64_t>(40));
  auto b = txn->add_node();
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(*a, 4);
  EXPECT_EQ(*b, 5);

  auto e = txn->add_edge(3, *a);
  ASSERT_TRUE(e.has_value());
  EXPECT_EQ(*e, 3u);
  ASSERT_TRUE(txn->add_edge(*a, *b).has_value());

  auto dangling = txn->add_edge(*b, 77);
  ASSERT_FALSE(dangling.has_value());
  EXPECT_EQ(dangling.error().code, ErrorCode::NotFound);

  // Nothing is visible before commit.
  EXPECT_FALSE(graph->node_by_id(4).has_value());
  EXPECT_EQ(txn->size(), 4u);
  ASSERT_TRUE(txn->commit().has_value());
  EXPECT_EQ(txn->state(), Transaction::State::Committed);

  EXPECT_EQ(graph->node_count(), 5u);
  EXPECT_EQ(graph->edge_count(), 4u);
  EXPECT_EQ(graph->node_header().max_id, 5);
  EXPECT_EQ(graph->edge_header().max_id, 4);
  EXPECT_EQ(neighbor_ids(*graph, 3), std::vector<int64_t>{4});
  EXPECT_EQ(graph->node_data(4).value()->as<int64_t>().value(), 40);
  EXPECT_EQ(file_size(dir.store().nodes), record_position(5));

  graph->close();
  auto reopened = StoredGraph::open(nullptr, dir.store());
  ASSERT_TRUE(reopened.has_value()) << reopened.error().describe();
  EXPECT_EQ(neighbor_ids(**reopened, 4), std::vector<int64_t>{5});
}

TEST_F(TransactionTest, DeleteNodeCascadesToEdges) {
  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->delete_node(2).has_value());
  auto again = txn->delete_node(2);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, ErrorCode::NotFound);
  ASSERT_TRUE(txn->commit().has_value());

  EXPECT_FALSE(graph->node_by_id(2).has_value());
  EXPECT_EQ(graph->node_count(), 2u);
  EXPECT_EQ(graph->edge_count(), 0u);
  EXPECT_TRUE(neighbor_ids(*graph, 1).empty());
  // Soft delete keeps the records and the MaxID.
  EXPECT_EQ(graph->node_header().max_id, 3);
  EXPECT_EQ(file_size(dir.store().nodes), record_position(3));
}

TEST_F(TransactionTest, DeleteEdgeHidesNeighbor) {
  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->delete_edge(1, 2).has_value());
  ASSERT_TRUE(txn->commit().has_value());

  EXPECT_TRUE(neighbor_ids(*graph, 1).empty());
  EXPECT_EQ(graph->edge_count(), 1u);
  EXPECT_EQ(graph->edge_header().max_id, 2);
  EXPECT_FALSE(graph->edge_at(0).has_value());
}

TEST_F(TransactionTest, OversizedTypeNameRejected) {
  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  Payload huge(DataType::Protobuf, std::string(65536, 'x'), {});
  auto r = txn->add_node(huge);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(txn->state(), Transaction::State::Open);
}

TEST_F(TransactionTest, EdgeEntryBeyondThirtyTwoBitsRejected) {
  // Sparse growth pushes the data tail past what an edge record can address.
  StorePaths p = dir.store();
  graph->close();
  const uint64_t big = uint64_t{std::numeric_limits<uint32_t>::max()} + 4096;
  std::filesystem::resize_file(p.data, big);
  auto reopened = StoredGraph::open(nullptr, p);
  ASSERT_TRUE(reopened.has_value()) << reopened.error().describe();
  graph = *reopened;

  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->add_edge(3, 1, Payload::of(2.0f)).has_value());
  auto r = txn->commit();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(txn->state(), Transaction::State::RolledBack);
  EXPECT_EQ(graph->edge_count(), 2u);
  EXPECT_EQ(file_size(p.data), big);
  EXPECT_EQ(file_size(p.edges), record_position(2));

  // Node records carry 64-bit offsets and are unaffected.
  auto node_txn = graph->begin_transaction();
  ASSERT_TRUE(node_txn.has_value());
  auto id = node_txn->add_node(Payload::of_string("far"));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(node_txn->commit().has_value());
  EXPECT_EQ(graph->node_by_id(*id)->data_offset, big);
  EXPECT_EQ(graph->node_data(*id).value()->as_string().value(), "far");
}

// ============================================================================
// Parallel edges
// ============================================================================

class ParallelEdgeTest : public TransactionTest {
protected:
  /// Adds a second 1 -> 2 edge (record index 2) carrying "second".
  void SetUp() override {
    TransactionTest::SetUp();
    auto txn = graph->begin_transaction();
    ASSERT_TRUE(txn.has_value());
    auto id = txn->add_edge(1, 2, Payload::of_string("second"));
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(*id, 3u);
    ASSERT_TRUE(txn->commit().has_value());
  }
};

TEST_F(ParallelEdgeTest, NeighborsYieldEveryParallelEdge) {
  EXPECT_EQ(neighbor_ids(*graph, 1), (std::vector<int64_t>{2, 2}));
  auto out = graph->out_edges(1);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].index, 0u);
  EXPECT_EQ(out[1].index, 2u);
  EXPECT_EQ(graph->find_edge(1, 2)->index, 0u);
}

TEST_F(ParallelEdgeTest, DeleteEdgeTakesFirstInRecordOrder) {
  {
    auto txn = graph->begin_transaction();
    ASSERT_TRUE(txn.has_value());
    ASSERT_TRUE(txn->delete_edge(1, 2).has_value());
    ASSERT_TRUE(txn->commit().has_value());
  }
  EXPECT_FALSE(graph->edge_at(0).has_value());
  ASSERT_TRUE(graph->edge_at(2).has_value());
  EXPECT_EQ(neighbor_ids(*graph, 1), std::vector<int64_t>{2});
  EXPECT_EQ(graph->edge_count(), 2u);

  // The next delete reaches the remaining parallel edge.
  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->delete_edge(1, 2).has_value());
  auto none = txn->delete_edge(1, 2);
  ASSERT_FALSE(none.has_value());
  EXPECT_EQ(none.error().code, ErrorCode::NotFound);
  ASSERT_TRUE(txn->commit().has_value());
  EXPECT_TRUE(neighbor_ids(*graph, 1).empty());
}

TEST_F(ParallelEdgeTest, UpdateEdgeTakesFirstInRecordOrder) {
  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->update_edge(1, 2, Payload::of(4.0f)).has_value());
  ASSERT_TRUE(txn->commit().has_value());

  EXPECT_FLOAT_EQ(graph->edge_data(0).value()->as<float>().value(), 4.0f);
  EXPECT_EQ(graph->edge_data(2).value()->as_string().value(), "second");
}

TEST_F(ParallelEdgeTest, UpdateEdgeAtChangesExactlyOneRecord) {
  auto before = snapshot(dir.store().edges);
  uint64_t first_offset = graph->edge_at(0)->data_offset;

  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->update_edge_at(2, Payload::of_string("third, and longer")).has_value());
  ASSERT_TRUE(txn->commit().has_value());

  EXPECT_EQ(graph->edge_data(2).value()->as_string().value(), "third, and longer");
  EXPECT_FLOAT_EQ(graph->edge_data(0).value()->as<float>().value(), 1.5f);
  EXPECT_EQ(graph->edge_at(0)->data_offset, first_offset);

  // Only record 2 may differ from the previous record array.
  auto after = snapshot(dir.store().edges);
  ASSERT_EQ(after.size(), before.size());
  for (uint64_t i = 0; i < 3; ++i) {
    bool same = std::equal(before.begin() + record_position(i),
                           before.begin() + record_position(i + 1),
                           after.begin() + record_position(i));
    EXPECT_EQ(same, i != 2) << "record " << i;
  }
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(TransactionTest, ClosedTransactionRejectsEverything) {
  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->commit().has_value());

  auto add = txn->add_node();
  ASSERT_FALSE(add.has_value());
  EXPECT_EQ(add.error().code, ErrorCode::ClosedTransaction);
  EXPECT_EQ(txn->commit().error().code, ErrorCode::ClosedTransaction);
  EXPECT_EQ(txn->rollback().error().code, ErrorCode::ClosedTransaction);
}

TEST_F(TransactionTest, OneWriterAtATime) {
  auto first = graph->begin_transaction();
  ASSERT_TRUE(first.has_value());
  auto second = graph->begin_transaction();
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().code, ErrorCode::InvalidArgument);

  ASSERT_TRUE(first->rollback().has_value());
  EXPECT_TRUE(graph->begin_transaction().has_value());
}

TEST_F(TransactionTest, DropRollsBack) {
  {
    auto txn = graph->begin_transaction();
    ASSERT_TRUE(txn.has_value());
    ASSERT_TRUE(txn->add_node().has_value());
  }
  EXPECT_EQ(graph->node_count(), 3u);
  EXPECT_TRUE(graph->begin_transaction().has_value());
}

TEST_F(TransactionTest, RollbackAfterPrepareRestoresFiles) {
  StorePaths p = dir.store();
  auto nodes = snapshot(p.nodes);
  auto edges = snapshot(p.edges);
  auto data = snapshot(p.data);

  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  auto id = txn->add_node(Payload::of_string("fresh"));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(txn->add_edge(3, *id, Payload::of(0.5)).has_value());
  ASSERT_TRUE(txn->update_node(1, Payload::of_bytes({1})).has_value());
  ASSERT_TRUE(txn->prepare().has_value());
  EXPECT_EQ(txn->state(), Transaction::State::Prepared);
  EXPECT_GT(file_size(p.nodes), nodes.size());

  ASSERT_TRUE(txn->rollback().has_value());
  EXPECT_EQ(txn->state(), Transaction::State::RolledBack);
  EXPECT_EQ(snapshot(p.nodes), nodes);
  EXPECT_EQ(snapshot(p.edges), edges);
  EXPECT_EQ(snapshot(p.data), data);
  EXPECT_EQ(graph->node_count(), 3u);
}

TEST_F(TransactionTest, CorruptHeaderBeforePublishFailsReopen) {
  StorePaths p = dir.store();
  auto edges = snapshot(p.edges);
  auto data = snapshot(p.data);

  auto txn = graph->begin_transaction();
  ASSERT_TRUE(txn.has_value());
  ASSERT_TRUE(txn->add_node(Payload::of_string("lost")).has_value());
  ASSERT_TRUE(txn->prepare().has_value());

  // Simulated crash: the node header is zeroed and publish never runs.
  {
    auto raw = FileStorage::open(p.nodes, OpenMode::ReadWrite);
    ASSERT_TRUE(raw.has_value());
    HeaderBytes zero{};
    ASSERT_TRUE((*raw)->write(0, zero).has_value());
    ASSERT_TRUE((*raw)->sync().has_value());
  }
  ASSERT_TRUE(txn->rollback().has_value());
  graph->close();

  auto reopened = StoredGraph::open(nullptr, p);
  ASSERT_FALSE(reopened.has_value());
  EXPECT_EQ(reopened.error().code, ErrorCode::Format);
  EXPECT_NE(reopened.error().message.find("bad magic"), std::string::npos);

  EXPECT_EQ(snapshot(p.edges), edges);
  EXPECT_EQ(snapshot(p.data), data);
}

TEST_F(TransactionTest, RecordRewriteWithoutHeaderIsRefusedAtOpen) {
  // Simulated crash inside publish: node 2's delete flag reached the record
  // array but the node header (count 3) never followed.
  StorePaths p = dir.store();
  graph->close();
  {
    auto raw = FileStorage::open(p.nodes, OpenMode::ReadWrite);
    ASSERT_TRUE(raw.has_value());
    auto file = open_node_file(**raw);
    ASSERT_TRUE(file.has_value());
    auto rec = read_node_record(file->records, 1);
    ASSERT_TRUE(rec.has_value());
    NodeRecord deleted = *rec;
    deleted.flags = FLAG_DELETED;
    file->records.unmap();
    ASSERT_TRUE(write_record(**raw, 1, encode_node_record(deleted)).has_value());
    ASSERT_TRUE((*raw)->sync().has_value());
  }

  auto reopened = StoredGraph::open(nullptr, p);
  ASSERT_FALSE(reopened.has_value());
  EXPECT_EQ(reopened.error().code, ErrorCode::InconsistentState);
}

TEST_F(TransactionTest, TransactionKeepsStoreAlive) {
  StorePaths p = dir.store();
  int64_t id = 0;
  {
    auto txn = graph->begin_transaction();
    ASSERT_TRUE(txn.has_value());
    graph.reset();

    auto added = txn->add_node(Payload::of<int64_t>(7));
    ASSERT_TRUE(added.has_value());
    id = *added;
    ASSERT_TRUE(txn->commit().has_value());
  }

  auto reopened = StoredGraph::open(nullptr, p);
  ASSERT_TRUE(reopened.has_value()) << reopened.error().describe();
  EXPECT_EQ((*reopened)->node_count(), 4u);
  EXPECT_EQ((*reopened)->node_data(id).value()->as<int64_t>().value(), 7);
}

TEST(TransactionState, Names) {
  EXPECT_STREQ(to_string(Transaction::State::Open), "open");
  EXPECT_STREQ(to_string(Transaction::State::RolledBack), "rolled back");
}
