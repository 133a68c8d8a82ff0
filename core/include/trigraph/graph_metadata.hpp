#pragma once

#include "trigraph/codec.hpp"
#include "trigraph/data_section.hpp"
#include "trigraph/error.hpp"

#include "graph_metadata.pb.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace trigraph {

GraphKind from_proto(pb::GraphKind kind) noexcept;
pb::GraphKind to_proto(GraphKind kind) noexcept;

/// Protobuf bytes of `meta`, ready for a "__graph_metadata__" entry.
Result<std::vector<uint8_t>> encode_metadata(const pb::GraphMetadata &meta);

/// Format error unless `entry` is a well-formed metadata entry.
Result<pb::GraphMetadata> decode_metadata(const DataEntry &entry);

/// Root recorded in the metadata: root_id, else the expression root.
std::optional<int64_t> metadata_root(const pb::GraphMetadata &meta);

} // namespace trigraph
