#pragma once

#include "trigraph/marshaller.hpp"
#include "trigraph/memory_graph.hpp"
#include "trigraph/stored_graph.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace trigraph::test_support {

/// Helper: unique scratch directory removed on destruction
class TempDir {
public:
  TempDir() {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = info ? std::string(info->test_suite_name()) + "_" +
                                  info->name()
                            : "trigraph";
    path_ = std::filesystem::temp_directory_path() /
            ("trigraph_" + name + "_" + std::to_string(counter_++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }

  StorePaths store(const std::string &base = "graph") const {
    return StorePaths::from_node_path(file(base + ".nodes.graph"));
  }

  const std::filesystem::path &path() const { return path_; }

private:
  static inline int counter_ = 0;
  std::filesystem::path path_;
};

inline uint64_t file_size(const std::string &path) {
  return static_cast<uint64_t>(std::filesystem::file_size(path));
}

/// Three-node chain: nodes 1, 2, 3; edges 1->2 (float 1.5) and 2->3.
/// Node 2 carries DE AD BE EF; edge 2->3 carries the string "next".
inline MemoryGraph three_node_chain() {
  MemoryGraph g;
  g.add_node();
  g.add_node(Payload::of_bytes({0xDE, 0xAD, 0xBE, 0xEF}));
  g.add_node();
  EXPECT_TRUE(g.add_edge(1, 2, Payload::of(1.5f)).has_value());
  EXPECT_TRUE(g.add_edge(2, 3, Payload::of_string("next")).has_value());
  return g;
}

inline std::vector<int64_t> neighbor_ids(const StoredGraph &g, int64_t id) {
  std::vector<int64_t> out;
  for (const NodeHandle &n : g.neighbors(id))
    out.push_back(n.id);
  return out;
}

inline MarshalOptions options_for(const TempDir &dir,
                                  const std::string &base = "graph") {
  MarshalOptions opts;
  opts.node_path = dir.file(base + ".nodes.graph");
  return opts;
}

} // namespace trigraph::test_support
