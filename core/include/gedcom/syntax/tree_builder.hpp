// gedcom/syntax/tree_builder.hpp - Level-numbered lines to a parse forest
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gedcom/basic/diagnostic.hpp"
#include "gedcom/syntax/line_scanner.hpp"

namespace gedcom::syntax
{

/**
 * Generic node of the parse forest, before classification.
 *
 * The value is owned because the continuation merger rewrites it. Tag and
 * pointer still view the scanned text.
 */
struct ParseNode
{
  uint32_t level = 0;
  std::string_view tag;
  std::string_view pointer;
  std::string value;
  SourceRange range;
  std::vector<std::unique_ptr<ParseNode>> children;
};

using ParseForest = std::vector<std::unique_ptr<ParseNode>>;

/**
 * Rebuilds nesting from level numbers with an ancestor stack.
 *
 * The first line must be level 0 and no line may be more than one level
 * deeper than the line before it; either violation reports E010 and
 * build() returns std::nullopt.
 */
class TreeBuilder
{
public:
  explicit TreeBuilder(DiagnosticBag & diags) : diags_(diags) {}

  [[nodiscard]] std::optional<ParseForest> build(const std::vector<Line> & lines);

private:
  DiagnosticBag & diags_;
};

}  // namespace gedcom::syntax
