#include "trigraph/stored_tree.hpp"

#include "trigraph/graph_metadata.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace trigraph {

Result<pb::GraphMetadata> require_metadata(const StoredGraph &graph) {
  auto meta = graph.metadata();
  if (!meta)
    return fail(ErrorCode::InconsistentState,
                "store " + graph.paths().nodes + " carries no graph metadata");
  return std::move(*meta);
}

Result<int64_t> require_root(const StoredGraph &graph,
                             const pb::GraphMetadata &meta) {
  auto root = metadata_root(meta);
  if (!root)
    return fail(ErrorCode::InconsistentState,
                "graph metadata of " + graph.paths().nodes +
                    " records no root id");
  if (!graph.node_by_id(*root))
    return fail(ErrorCode::InconsistentState,
                "root node " + std::to_string(*root) + " is not a live node");
  return *root;
}

Result<StoredTree> StoredTree::open(std::shared_ptr<StoredGraph> graph) {
  auto meta = require_metadata(*graph);
  if (!meta)
    return std::unexpected(meta.error());
  GraphKind kind = from_proto(meta->kind());
  if (kind != GraphKind::Tree && kind != GraphKind::DecisionTree)
    return fail(ErrorCode::InvalidArgument,
                std::string("store holds a ") + to_string(kind) +
                    " graph, not a tree");
  auto root = require_root(*graph, *meta);
  if (!root)
    return std::unexpected(root.error());
  return StoredTree(std::move(graph), *root,
                    meta->has_tree_type() ? meta->tree_type() : std::string());
}

std::vector<int64_t> StoredTree::children(int64_t id) const {
  std::vector<int64_t> out;
  for (const NodeHandle &child : graph_->neighbors(id))
    out.push_back(child.id);
  return out;
}

uint64_t StoredTree::height() const {
  // Iterative post-order DFS with memoized subtree heights.
  std::unordered_map<int64_t, uint64_t> memo;
  std::unordered_set<int64_t> on_path;

  struct Frame {
    int64_t id;
    std::vector<int64_t> children;
    size_t next = 0;
    uint64_t best = 0;
  };
  std::vector<Frame> stack;
  stack.push_back(Frame{root_, children(root_)});
  on_path.insert(root_);

  uint64_t result = 0;
  while (!stack.empty()) {
    Frame &top = stack.back();
    if (top.next < top.children.size()) {
      int64_t child = top.children[top.next++];
      if (on_path.count(child))
        continue;
      if (auto it = memo.find(child); it != memo.end()) {
        top.best = std::max(top.best, it->second + 1);
        continue;
      }
      on_path.insert(child);
      stack.push_back(Frame{child, children(child)});
      continue;
    }

    uint64_t h = top.best;
    int64_t id = top.id;
    memo[id] = h;
    on_path.erase(id);
    stack.pop_back();
    if (stack.empty())
      result = h;
    else
      stack.back().best = std::max(stack.back().best, h + 1);
  }
  return result;
}

} // namespace trigraph
