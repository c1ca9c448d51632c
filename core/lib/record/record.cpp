// gedcom/record/record.cpp - Record accessors
#include "gedcom/record/record.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "gedcom/record/xref_index.hpp"

namespace gedcom
{
namespace
{

std::string describe(const Record & rec)
{
  std::string out(rec.tag);
  if (!rec.id().empty()) {
    out += ' ';
    out += rec.id();
  }
  return out;
}

std::string_view trim(std::string_view s)
{
  const auto is_blank = [](char c) { return c == ' ' || c == '\t'; };
  while (!s.empty() && is_blank(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_blank(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

bool iequals(std::string_view a, std::string_view b)
{
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

template <typename T>
LookupResult<T> not_found(const Record & rec, std::string_view what)
{
  return LookupResult<T>::failure(
    LookupError::NotFound, describe(rec) + " has no " + std::string(what));
}

/// Follow the pointer held in `link.value` to a record of type T.
template <typename T>
LookupResult<const T *> resolve_link(
  const XrefIndex & index, const Record & link, std::string_view expected_tag)
{
  if (link.value.empty()) {
    return LookupResult<const T *>::failure(
      LookupError::UnresolvedReference, std::string(link.tag) + " line carries no pointer");
  }

  const Record * target = index.lookup(link.value);
  if (target == nullptr) {
    return LookupResult<const T *>::failure(
      LookupError::UnresolvedReference,
      std::string(link.tag) + " points to " + std::string(link.value) +
        ", which no record declares");
  }

  const T * typed = dyn_cast<T>(target);
  if (typed == nullptr) {
    return LookupResult<const T *>::failure(
      LookupError::UnresolvedReference, std::string(link.tag) + " points to " +
                                          describe(*target) + ", expected a " +
                                          std::string(expected_tag) + " record");
  }
  return typed;
}

/// Resolve every direct child with `link_tag` in document order.
template <typename T>
LookupResult<std::vector<const T *>> resolve_links(
  const XrefIndex & index, const Record & owner, std::string_view link_tag,
  std::string_view expected_tag)
{
  std::vector<const T *> out;
  for (const Record * link : owner.children_with(link_tag)) {
    auto target = resolve_link<T>(index, *link, expected_tag);
    if (!target) {
      return target.failure_info();
    }
    out.push_back(*target);
  }
  return out;
}

template <typename T>
LookupResult<const T *> first_of(const Record & rec, std::string_view tag)
{
  if (const T * found = rec.first_child<T>()) {
    return found;
  }
  return not_found<const T *>(rec, tag);
}

}  // namespace

bool is_pointer_value(std::string_view value) noexcept
{
  return value.size() > 2 && value.front() == '@' && value.back() == '@';
}

// ============================================================================
// Record
// ============================================================================

const Record * Record::child(std::string_view child_tag) const noexcept
{
  for (const Record * c : children_) {
    if (c->tag == child_tag) {
      return c;
    }
  }
  return nullptr;
}

std::vector<const Record *> Record::children_with(std::string_view child_tag) const
{
  std::vector<const Record *> out;
  for (const Record * c : children_) {
    if (c->tag == child_tag) {
      out.push_back(c);
    }
  }
  return out;
}

LookupResult<std::string_view> Record::child_value(std::string_view child_tag) const
{
  const Record * c = child(child_tag);
  if (c == nullptr || c->value.empty()) {
    return not_found<std::string_view>(*this, child_tag);
  }
  return c->value;
}

LookupResult<std::string_view> Record::note(const XrefIndex & index) const
{
  const Note * n = first_child<Note>();
  if (n == nullptr) {
    return not_found<std::string_view>(*this, "NOTE");
  }
  return n->text(index);
}

LookupResult<std::vector<const Source *>> Record::sources(const XrefIndex & index) const
{
  std::vector<const Source *> out;
  for (const Source * citation : children_of<Source>()) {
    auto resolved = citation->resolve(index);
    if (!resolved) {
      return resolved.failure_info();
    }
    out.push_back(*resolved);
  }
  return out;
}

// ============================================================================
// Spouse
// ============================================================================

LookupResult<const Individual *> Spouse::as_individual(const XrefIndex & index) const
{
  return resolve_link<Individual>(index, *this, "INDI");
}

// ============================================================================
// Names
// ============================================================================

LookupResult<PersonName> split_name(const Record & name)
{
  PersonName out;

  if (name.value.empty()) {
    if (auto given = name.child_value("GIVN")) {
      out.given = *given;
    }
    if (auto surname = name.child_value("SURN")) {
      out.surname = *surname;
    }
    return out;
  }

  const std::string_view v = name.value;
  const auto slashes = std::count(v.begin(), v.end(), '/');

  if (slashes == 0) {
    out.given = trim(v);
    return out;
  }
  if (slashes != 2) {
    return LookupResult<PersonName>::failure(
      LookupError::MalformedValue, "malformed name '" + std::string(v) +
                                     "': the surname must be enclosed in exactly two '/'");
  }

  const size_t open = v.find('/');
  const size_t close = v.find('/', open + 1);
  out.given = trim(v.substr(0, open));
  out.surname = trim(v.substr(open + 1, close - open - 1));
  return out;
}

// ============================================================================
// Individual
// ============================================================================

LookupResult<PersonName> Individual::name() const
{
  const auto names = children_with("NAME");
  if (names.empty()) {
    return not_found<PersonName>(*this, "NAME");
  }

  auto preferred = std::find_if(
    names.begin(), names.end(), [](const Record * n) { return !n->has_child("TYPE"); });
  return split_name(preferred != names.end() ? **preferred : *names.front());
}

LookupResult<std::vector<PersonName>> Individual::aka() const
{
  std::vector<PersonName> out;
  for (const Record * n : children_with("NAME")) {
    const Record * type = n->child("TYPE");
    if (type == nullptr || !iequals(type->value, "aka")) {
      continue;
    }
    auto split = split_name(*n);
    if (!split) {
      return split.failure_info();
    }
    out.push_back(*split);
  }
  return out;
}

LookupResult<const Birth *> Individual::birth() const { return first_of<Birth>(*this, "BIRT"); }

LookupResult<const Death *> Individual::death() const { return first_of<Death>(*this, "DEAT"); }

LookupResult<const Residence *> Individual::residence() const
{
  return first_of<Residence>(*this, "RESI");
}

bool Individual::is_male() const
{
  auto s = sex();
  return s && iequals(*s, "M");
}

bool Individual::is_female() const
{
  auto s = sex();
  return s && iequals(*s, "F");
}

LookupResult<const Family *> Individual::family_as_child(const XrefIndex & index) const
{
  const Record * famc = child("FAMC");
  if (famc == nullptr) {
    return not_found<const Family *>(*this, "FAMC");
  }
  return resolve_link<Family>(index, *famc, "FAM");
}

LookupResult<std::vector<const Individual *>> Individual::parents(const XrefIndex & index) const
{
  if (!has_child("FAMC")) {
    return std::vector<const Individual *>{};
  }
  auto family = family_as_child(index);
  if (!family) {
    return family.failure_info();
  }
  return (*family)->partner_individuals(index);
}

LookupResult<const Individual *> Individual::parent_at(
  const XrefIndex & index, size_t position) const
{
  auto all = parents(index);
  if (!all) {
    return all.failure_info();
  }
  if (position >= all->size()) {
    return LookupResult<const Individual *>::failure(
      LookupError::OutOfRange, describe(*this) + " has " + std::to_string(all->size()) +
                                 " parent(s), no parent at position " + std::to_string(position));
  }
  return (*all)[position];
}

LookupResult<const Individual *> Individual::father(const XrefIndex & index) const
{
  auto family = family_as_child(index);
  if (!family) {
    return family.failure_info();
  }
  return (*family)->husband(index);
}

LookupResult<const Individual *> Individual::mother(const XrefIndex & index) const
{
  auto family = family_as_child(index);
  if (!family) {
    return family.failure_info();
  }
  return (*family)->wife(index);
}

LookupResult<std::vector<const Family *>> Individual::families_as_spouse(
  const XrefIndex & index) const
{
  return resolve_links<Family>(index, *this, "FAMS", "FAM");
}

// ============================================================================
// Family
// ============================================================================

std::vector<const Spouse *> Family::husbands() const
{
  std::vector<const Spouse *> out;
  for (const Husband * h : children_of<Husband>()) {
    out.push_back(h);
  }
  return out;
}

std::vector<const Spouse *> Family::wives() const
{
  std::vector<const Spouse *> out;
  for (const Wife * w : children_of<Wife>()) {
    out.push_back(w);
  }
  return out;
}

std::vector<const Spouse *> Family::partners() const
{
  std::vector<const Spouse *> out = husbands();
  const auto w = wives();
  out.insert(out.end(), w.begin(), w.end());
  return out;
}

LookupResult<const Individual *> Family::husband(const XrefIndex & index) const
{
  const Husband * h = first_child<Husband>();
  if (h == nullptr) {
    return not_found<const Individual *>(*this, "HUSB");
  }
  return h->as_individual(index);
}

LookupResult<const Individual *> Family::wife(const XrefIndex & index) const
{
  const Wife * w = first_child<Wife>();
  if (w == nullptr) {
    return not_found<const Individual *>(*this, "WIFE");
  }
  return w->as_individual(index);
}

LookupResult<std::vector<const Individual *>> Family::partner_individuals(
  const XrefIndex & index) const
{
  std::vector<const Individual *> out;
  for (const Spouse * partner : partners()) {
    auto person = partner->as_individual(index);
    if (!person) {
      return person.failure_info();
    }
    out.push_back(*person);
  }
  return out;
}

LookupResult<std::vector<const Individual *>> Family::children(const XrefIndex & index) const
{
  return resolve_links<Individual>(index, *this, "CHIL", "INDI");
}

LookupResult<const Marriage *> Family::marriage() const
{
  return first_of<Marriage>(*this, "MARR");
}

// ============================================================================
// Source / Note
// ============================================================================

LookupResult<const Source *> Source::resolve(const XrefIndex & index) const
{
  if (!is_citation()) {
    return this;
  }
  return resolve_link<Source>(index, *this, "SOUR");
}

LookupResult<std::string_view> Note::text(const XrefIndex & index) const
{
  if (!is_pointer_value(value)) {
    return value;
  }
  auto target = resolve_link<Note>(index, *this, "NOTE");
  if (!target) {
    return target.failure_info();
  }
  return (*target)->value;
}

}  // namespace gedcom
