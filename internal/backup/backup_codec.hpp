#pragma once

#include <string>
#include <string_view>

#include "internal/backup/entity_graph.hpp"
#include "internal/util/time.hpp"

namespace nutrition::backup {

/*
  Backup document codec.

  JSON layout is nutrition.backup.v1.BackupDocument printed by the
  protobuf JSON printer: camelCase keys in sorted order, images as base64,
  times as RFC 3339, one flat list per entity type sorted by id. Encoding
  the same graph with the same export date is byte-identical.

  Decode is pure: no store access, foreign keys are left unresolved.
  Throws util::MalformedBackup for unparseable JSON, a missing version or
  missing required keys (entity id, names, dates, entry amounts), and
  util::UnsupportedVersion for any version other than kSchemaVersion.
  Unknown keys are ignored. Ids are returned in canonical lower-case form.
*/
class BackupCodec {
 public:
  static constexpr int kSchemaVersion = 1;

  static std::string Encode(const EntityGraph& graph, util::TimePoint export_date);

  static DecodedGraph Decode(std::string_view json);
};

} // namespace nutrition::backup
