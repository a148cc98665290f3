#pragma once

#include <cstddef>
#include <string>

namespace nutrition::backup {

struct EntityCounts {
  std::size_t imported = 0;
  std::size_t skipped  = 0;
};

/*
  Outcome of one import. Only non-zero parts are mentioned in the text
  forms, e.g. "Imported: 3 products, 2 days" / "5 duplicate items skipped".
*/
struct ImportSummary {
  EntityCounts products;
  EntityCounts daily_logs;
  EntityCounts food_entries;
  EntityCounts ai_templates;
  EntityCounts supplements;
  EntityCounts supplement_entries;

  // Foreign keys dropped because the referenced entity was in neither the
  // store nor the document.
  std::size_t dangling_references = 0;

  std::size_t TotalImported() const;
  std::size_t TotalSkipped() const;

  std::string Summary() const;

  // Empty when nothing was skipped.
  std::string SkippedSummary() const;
};

} // namespace nutrition::backup
