// gedcom/syntax/tree_builder.cpp - Ancestor-stack tree builder
#include "gedcom/syntax/tree_builder.hpp"

#include <fmt/core.h>

namespace gedcom::syntax
{

std::optional<ParseForest> TreeBuilder::build(const std::vector<Line> & lines)
{
  ParseForest roots;
  // stack[i] is the open node at level i
  std::vector<ParseNode *> stack;

  for (const Line & line : lines) {
    if (stack.empty() && line.level != 0) {
      diags_
        .report_error(
          line.range, fmt::format("first record must be at level 0, found level {}", line.level),
          "expected level 0")
        .with_code(diag_code::k_level_skip);
      return std::nullopt;
    }

    if (line.level > stack.size()) {
      diags_
        .report_error(
          line.range,
          fmt::format("level jumps from {} to {}", stack.size() - 1, line.level),
          fmt::format("expected level {} or lower", stack.size()))
        .with_code(diag_code::k_level_skip)
        .with_help("a record can only be one level deeper than the line before it");
      return std::nullopt;
    }

    stack.resize(line.level);

    auto node = std::make_unique<ParseNode>();
    node->level = line.level;
    node->tag = line.tag;
    node->pointer = line.pointer;
    node->value = std::string(line.value);
    node->range = line.range;

    ParseNode * raw = node.get();
    if (stack.empty()) {
      roots.push_back(std::move(node));
    } else {
      stack.back()->children.push_back(std::move(node));
    }
    stack.push_back(raw);
  }

  return roots;
}

}  // namespace gedcom::syntax
