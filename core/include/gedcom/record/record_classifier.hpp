// gedcom/record/record_classifier.hpp - Parse forest to typed records
#pragma once

#include <vector>

#include "gedcom/record/record.hpp"
#include "gedcom/record/record_context.hpp"
#include "gedcom/record/tag_registry.hpp"
#include "gedcom/syntax/tree_builder.hpp"

namespace gedcom
{

/**
 * Turns merged parse nodes into arena records.
 *
 * Children are classified before their parent, so a record is created with
 * its final children span. The tag alone picks the record type; pointer-id
 * prefixes are ignored.
 */
class RecordClassifier
{
public:
  RecordClassifier(RecordContext & ctx, const TagRegistry & registry)
  : ctx_(ctx), registry_(registry)
  {
  }

  [[nodiscard]] Record * classify(const syntax::ParseNode & node);

  [[nodiscard]] std::vector<Record *> classify_forest(const syntax::ParseForest & forest);

private:
  RecordContext & ctx_;
  const TagRegistry & registry_;
};

}  // namespace gedcom
