// gedcom/syntax/continuation.hpp - CONT/CONC folding
#pragma once

#include <string_view>

#include "gedcom/basic/diagnostic.hpp"
#include "gedcom/syntax/tree_builder.hpp"

namespace gedcom::syntax
{

[[nodiscard]] inline bool is_continuation_tag(std::string_view tag) noexcept
{
  return tag == "CONT" || tag == "CONC";
}

/**
 * Fold every CONT/CONC child into its parent's value, bottom-up.
 *
 * CONT appends "\n" + value, CONC appends value. Running it twice is a
 * no-op. A top-level continuation (E011) or a continuation carrying other
 * sub-records (E012) is reported and makes the call return false.
 */
[[nodiscard]] bool merge_continuations(ParseForest & forest, DiagnosticBag & diags);

}  // namespace gedcom::syntax
