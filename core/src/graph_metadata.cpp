#include "trigraph/graph_metadata.hpp"

namespace trigraph {

GraphKind from_proto(pb::GraphKind kind) noexcept {
  switch (kind) {
  case pb::GRAPH_KIND_TREE:
    return GraphKind::Tree;
  case pb::GRAPH_KIND_DECISION_TREE:
    return GraphKind::DecisionTree;
  case pb::GRAPH_KIND_EXPRESSION_GRAPH:
    return GraphKind::ExpressionGraph;
  default:
    return GraphKind::Generic;
  }
}

pb::GraphKind to_proto(GraphKind kind) noexcept {
  switch (kind) {
  case GraphKind::Tree:
    return pb::GRAPH_KIND_TREE;
  case GraphKind::DecisionTree:
    return pb::GRAPH_KIND_DECISION_TREE;
  case GraphKind::ExpressionGraph:
    return pb::GRAPH_KIND_EXPRESSION_GRAPH;
  case GraphKind::Generic:
    break;
  }
  return pb::GRAPH_KIND_GENERIC;
}

Result<std::vector<uint8_t>> encode_metadata(const pb::GraphMetadata &meta) {
  std::string wire;
  if (!meta.SerializeToString(&wire))
    return fail(ErrorCode::InvalidArgument, "graph metadata does not serialize");
  return std::vector<uint8_t>(wire.begin(), wire.end());
}

Result<pb::GraphMetadata> decode_metadata(const DataEntry &entry) {
  if (entry.type_name != METADATA_TYPE_NAME)
    return fail(ErrorCode::Format, "entry \"" + entry.type_name +
                                       "\" is not the graph metadata entry");
  if (entry.type != DataType::Protobuf)
    return fail(ErrorCode::Format, "graph metadata entry is tagged " +
                                       std::string(to_string(entry.type)));
  pb::GraphMetadata meta;
  if (!meta.ParseFromArray(entry.payload.data(),
                           static_cast<int>(entry.payload.size())))
    return fail(ErrorCode::Format, "graph metadata payload does not parse");
  return meta;
}

std::optional<int64_t> metadata_root(const pb::GraphMetadata &meta) {
  if (meta.has_root_id())
    return meta.root_id();
  if (meta.has_expression() && meta.expression().root_id() != 0)
    return meta.expression().root_id();
  return std::nullopt;
}

} // namespace trigraph
