// gedcom/record/structural_equal.cpp - Structural comparison of record trees
#include "gedcom/record/structural_equal.hpp"

namespace gedcom
{

bool structurally_equal(const Record & a, const Record & b)
{
  if (&a == &b) return true;
  if (a.tag != b.tag || a.pointer != b.pointer || a.value != b.value) return false;

  const auto lhs = a.children();
  const auto rhs = b.children();
  if (lhs.size() != rhs.size()) return false;
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (!structurally_equal(*lhs[i], *rhs[i])) return false;
  }
  return true;
}

bool structurally_equal(const GedcomFile & a, const GedcomFile & b)
{
  const auto & lhs = a.roots();
  const auto & rhs = b.roots();
  if (lhs.size() != rhs.size()) return false;
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (!structurally_equal(*lhs[i], *rhs[i])) return false;
  }
  return true;
}

}  // namespace gedcom
