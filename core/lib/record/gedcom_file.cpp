// gedcom/record/gedcom_file.cpp - GedcomFile implementation
#include "gedcom/record/gedcom_file.hpp"

#include <fmt/core.h>

#include <stdexcept>
#include <utility>

namespace gedcom
{
namespace
{

/// Upper bound on the id search; reaching it means the index is corrupt
constexpr uint32_t k_max_id_attempts = 1000000;

}  // namespace

GedcomFile::GedcomFile(const TagRegistry & registry)
: ctx_(std::make_unique<RecordContext>()), registry_(registry)
{
}

GedcomFile::GedcomFile(
  std::unique_ptr<RecordContext> ctx, std::vector<Record *> roots, XrefIndex index,
  const TagRegistry & registry)
: ctx_(std::move(ctx)), roots_(std::move(roots)), index_(std::move(index)), registry_(registry)
{
}

// ============================================================================
// Record creation helpers
// ============================================================================

Record * GedcomFile::new_record(
  uint32_t level, std::string_view tag, std::string_view pointer, std::string_view value)
{
  RecordFields fields;
  fields.level = level;
  fields.tag = ctx_->intern(tag);
  fields.pointer = ctx_->intern(pointer);
  fields.value = ctx_->intern(value);
  return registry_.create(*ctx_, fields);
}

std::string GedcomFile::next_free_id(char prefix)
{
  for (uint32_t attempt = 0; attempt < k_max_id_attempts; ++attempt) {
    std::string candidate = fmt::format("@{}{}@", prefix, next_free_id_++);
    if (!index_.contains(candidate)) {
      return candidate;
    }
  }
  throw std::runtime_error("no free record id left");
}

Record * GedcomFile::add_top_level(std::string_view tag, char id_prefix)
{
  const std::string id = next_free_id(id_prefix);
  Record * rec = new_record(0, tag, id, {});
  index_.define(rec);
  roots_.push_back(rec);
  return rec;
}

// ============================================================================
// Mutation
// ============================================================================

Individual * GedcomFile::create_individual()
{
  auto * person = dyn_cast<Individual>(add_top_level("INDI", 'I'));
  if (person == nullptr) {
    throw std::logic_error("tag registry does not classify INDI as an individual");
  }
  return person;
}

Family * GedcomFile::create_family()
{
  auto * family = dyn_cast<Family>(add_top_level("FAM", 'F'));
  if (family == nullptr) {
    throw std::logic_error("tag registry does not classify FAM as a family");
  }
  return family;
}

Record * GedcomFile::append_child(Record & parent, std::string_view tag, std::string_view value)
{
  Record * child = new_record(parent.level + 1, tag, {}, value);
  parent.children_ = ctx_->append(parent.children_, child);
  return child;
}

void GedcomFile::set_value(Record & rec, std::string_view value)
{
  rec.value = ctx_->intern(value);
}

bool GedcomFile::set_sex(Individual & person, std::string_view sex)
{
  std::string normalized;
  if (sex == "M" || sex == "m") {
    normalized = "M";
  } else if (sex == "F" || sex == "f") {
    normalized = "F";
  } else {
    return false;
  }

  for (Record * c : person.children_) {
    if (c->tag == "SEX") {
      set_value(*c, normalized);
      return true;
    }
  }
  append_child(person, "SEX", normalized);
  return true;
}

void GedcomFile::ensure_header_trailer(const HeaderOptions & header)
{
  if (roots_.empty() || roots_.front()->tag != "HEAD") {
    Record * head = new_record(0, "HEAD", {}, {});
    append_child(*head, "SOUR", header.source);
    append_child(*head, "CHAR", header.charset);
    Record * gedc = append_child(*head, "GEDC");
    append_child(*gedc, "VERS", "5.5");
    append_child(*gedc, "FORM", "LINEAGE-LINKED");
    roots_.insert(roots_.begin(), head);
  }
  if (roots_.back()->tag != "TRLR") {
    roots_.push_back(new_record(0, "TRLR", {}, {}));
  }
}

}  // namespace gedcom
