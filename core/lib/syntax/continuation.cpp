// gedcom/syntax/continuation.cpp - CONT/CONC folding
#include "gedcom/syntax/continuation.hpp"

#include <fmt/core.h>

#include <utility>

namespace gedcom::syntax
{
namespace
{

bool merge_node(ParseNode & node, DiagnosticBag & diags)
{
  const bool is_continuation = is_continuation_tag(node.tag);

  std::vector<std::unique_ptr<ParseNode>> kept;
  kept.reserve(node.children.size());

  for (auto & child : node.children) {
    if (is_continuation && !is_continuation_tag(child->tag)) {
      diags
        .report_error(
          child->range, fmt::format("{} line cannot carry a {} sub-record", node.tag, child->tag),
          "unexpected sub-record")
        .with_code(diag_code::k_continuation_children)
        .with_secondary_label(node.range, "continuation line starts here");
      return false;
    }

    if (!merge_node(*child, diags)) {
      return false;
    }

    if (is_continuation_tag(child->tag)) {
      if (child->tag == "CONT") {
        node.value += '\n';
      }
      node.value += child->value;
    } else {
      kept.push_back(std::move(child));
    }
  }

  node.children = std::move(kept);
  return true;
}

}  // namespace

bool merge_continuations(ParseForest & forest, DiagnosticBag & diags)
{
  for (auto & root : forest) {
    if (is_continuation_tag(root->tag)) {
      diags
        .report_error(
          root->range, fmt::format("{} line has no record to continue", root->tag),
          "continuation at level 0")
        .with_code(diag_code::k_orphan_continuation);
      return false;
    }
    if (!merge_node(*root, diags)) {
      return false;
    }
  }
  return true;
}

}  // namespace gedcom::syntax
