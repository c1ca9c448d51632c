// gedcom/record/structural_equal.hpp - Structural comparison of record trees
#pragma once

#include "gedcom/record/gedcom_file.hpp"
#include "gedcom/record/record.hpp"

namespace gedcom
{

/**
 * Compare tag, pointer, value and children recursively, in order.
 * Levels and source ranges are ignored.
 */
[[nodiscard]] bool structurally_equal(const Record & a, const Record & b);

/// Same top-level records, pairwise structurally equal
[[nodiscard]] bool structurally_equal(const GedcomFile & a, const GedcomFile & b);

}  // namespace gedcom
