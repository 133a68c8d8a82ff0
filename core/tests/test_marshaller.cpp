#include "trigraph/marshaller.hpp"
#include "trigraph/memory_storage.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <gtest/gtest.h>

using namespace trigraph;
using namespace trigraph::test_support;

// ============================================================================
// MemoryGraph
// ============================================================================

TEST(MemoryGraph, SequentialIdsAndEndpointChecks) {
  MemoryGraph g;
  EXPECT_EQ(g.add_node(), 1);
  EXPECT_EQ(g.add_node(), 2);
  EXPECT_TRUE(g.contains(2));
  EXPECT_FALSE(g.contains(3));

  EXPECT_TRUE(g.add_edge(1, 2).has_value());
  auto bad = g.add_edge(2, 3);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().code, ErrorCode::NotFound);

  EXPECT_EQ(g.set_root(9).error().code, ErrorCode::NotFound);
  EXPECT_EQ(g.set_node_op(9, "x").error().code, ErrorCode::NotFound);
  EXPECT_EQ(g.set_edge_op(2, 1, "x").error().code, ErrorCode::NotFound);
}

TEST(MemoryGraph, DerivedRootIsFirstNodeWithoutParents) {
  MemoryGraph g(GraphKind::Tree);
  g.add_node();
  g.add_node();
  g.add_node();
  ASSERT_TRUE(g.add_edge(2, 1).has_value());
  ASSERT_TRUE(g.add_edge(2, 3).has_value());
  EXPECT_EQ(g.derive_root().value(), 2);

  pb::GraphMetadata meta = g.metadata();
  EXPECT_EQ(meta.kind(), pb::GRAPH_KIND_TREE);
  ASSERT_TRUE(meta.has_root_id());
  EXPECT_EQ(meta.root_id(), 2);

  ASSERT_TRUE(g.set_root(3).has_value());
  EXPECT_EQ(g.metadata().root_id(), 3);
}

TEST(MemoryGraph, GenericGraphRecordsNoRoot) {
  MemoryGraph g;
  g.add_node();
  EXPECT_FALSE(g.metadata().has_root_id());
  EXPECT_FALSE(g.metadata().has_decision());
}

TEST(MemoryGraph, ExpressionMetadataCarriesWiring) {
  MemoryGraph g(GraphKind::ExpressionGraph);
  g.add_node();
  g.add_node();
  ASSERT_TRUE(g.add_edge(1, 2).has_value());
  ASSERT_TRUE(g.set_node_op(1, "sum").has_value());

  pb::GraphMetadata meta = g.metadata();
  ASSERT_TRUE(meta.has_expression());
  EXPECT_EQ(meta.expression().root_id(), 1);
  EXPECT_EQ(meta.expression().node_ops().at(1), "sum");
  EXPECT_FALSE(meta.has_decision());
}

// ============================================================================
// Marshal / unmarshal
// ============================================================================

TEST(Marshaller, RoundTripOnDisk) {
  TempDir dir;
  auto stored = Marshaller(options_for(dir)).marshal(three_node_chain());
  ASSERT_TRUE(stored.has_value()) << stored.error().describe();
  EXPECT_EQ((*stored)->node_count(), 3u);
  (*stored)->close();

  auto g = Unmarshaller(options_for(dir)).unmarshal();
  ASSERT_TRUE(g.has_value()) << g.error().describe();
  EXPECT_EQ((*g)->node_count(), 3u);
  EXPECT_EQ((*g)->edge_count(), 2u);
  EXPECT_EQ(neighbor_ids(**g, 1), std::vector<int64_t>{2});
  auto meta = (*g)->metadata();
  ASSERT_TRUE(meta.has_value());
  EXPECT_EQ(meta->kind(), pb::GRAPH_KIND_GENERIC);
}

TEST(Marshaller, RoundTripInMemory) {
  auto provider = std::make_shared<MemoryStorageProvider>();
  MarshalOptions opts;
  opts.node_path = "mem.nodes.graph";
  opts.provider = provider;

  auto stored = Marshaller(opts).marshal(three_node_chain());
  ASSERT_TRUE(stored.has_value()) << stored.error().describe();
  (*stored)->close();
  EXPECT_TRUE(provider->exists("mem.edges.graph"));
  EXPECT_EQ(provider->contents("mem.nodes.graph").size(), record_position(3));

  auto g = Unmarshaller(opts).unmarshal();
  ASSERT_TRUE(g.has_value());
  EXPECT_EQ((*g)->edge_data(1).value()->as_string().value(), "next");
}

TEST(Marshaller, ExplicitSiblingPaths) {
  TempDir dir;
  MarshalOptions opts;
  opts.node_path = dir.file("n.bin");
  opts.edge_path = dir.file("e.bin");
  opts.data_path = dir.file("d.bin");

  StorePaths p = opts.paths();
  EXPECT_EQ(p.edges, dir.file("e.bin"));

  auto stored = Marshaller(opts).marshal(three_node_chain());
  ASSERT_TRUE(stored.has_value());
  EXPECT_TRUE(std::filesystem::exists(dir.file("e.bin")));
  EXPECT_TRUE(std::filesystem::exists(dir.file("d.bin")));
}

TEST(Marshaller, MarshalTruncatesExistingStore) {
  TempDir dir;
  MemoryGraph big;
  for (int i = 0; i < 10; ++i)
    big.add_node(Payload::of(i));
  ASSERT_TRUE(Marshaller(options_for(dir)).marshal(big).has_value());

  auto stored = Marshaller(options_for(dir)).marshal(three_node_chain());
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ((*stored)->node_count(), 3u);
  EXPECT_EQ(file_size(dir.store().nodes), record_position(3));
}

TEST(Marshaller, UnregisteredOpsFailBeforeWriting) {
  TempDir dir;
  MemoryGraph g(GraphKind::ExpressionGraph);
  g.add_node();
  ASSERT_TRUE(g.set_node_op(1, "mystery").has_value());

  MarshalOptions opts = options_for(dir);
  opts.ops = std::make_shared<OpsRegistry>();
  auto stored = Marshaller(opts).marshal(g);
  ASSERT_FALSE(stored.has_value());
  EXPECT_EQ(stored.error().code, ErrorCode::UnregisteredOperation);
  EXPECT_EQ(stored.error().message, "mystery");
  EXPECT_FALSE(std::filesystem::exists(dir.store().nodes));

  // Without a registry the names are stored unchecked.
  EXPECT_TRUE(Marshaller(options_for(dir)).marshal(g).has_value());
}

TEST(Marshaller, UnmarshalMissingStore) {
  TempDir dir;
  auto g = Unmarshaller(options_for(dir)).unmarshal();
  ASSERT_FALSE(g.has_value());
  EXPECT_EQ(g.error().code, ErrorCode::Storage);
}

TEST(Marshaller, UnmarshalTreeAndExpression) {
  TempDir dir;
  MemoryGraph tree(GraphKind::Tree);
  tree.add_node();
  tree.add_node();
  ASSERT_TRUE(tree.add_edge(1, 2).has_value());
  ASSERT_TRUE(Marshaller(options_for(dir, "t")).marshal(tree).has_value());

  auto t = Unmarshaller(options_for(dir, "t")).unmarshal_tree();
  ASSERT_TRUE(t.has_value()) << t.error().describe();
  EXPECT_EQ(t->root(), 1);
  EXPECT_EQ(t->height(), 1u);

  // A tree is not an expression graph.
  auto e = Unmarshaller(options_for(dir, "t")).unmarshal_expression_graph();
  ASSERT_FALSE(e.has_value());
  EXPECT_EQ(e.error().code, ErrorCode::InvalidArgument);
}
