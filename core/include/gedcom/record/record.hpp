// gedcom/record/record.hpp - Typed GEDCOM record classes
//
// Every line of a GEDCOM file becomes one record. Records are classified by
// tag into the kinds listed in record_kinds.def and use classof() for RTTI
// (see gedcom/basic/casting.hpp). Cross-references are never stored as
// links: accessors that follow a pointer take the XrefIndex explicitly.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>
#include <vector>

#include "gedcom/basic/casting.hpp"
#include "gedcom/basic/source_manager.hpp"
#include "gedcom/record/lookup_result.hpp"
#include "gedcom/record/record_kind.hpp"

namespace gedcom
{

class Record;
class XrefIndex;
class Individual;
class Family;
class Source;
class Birth;
class Death;
class Marriage;
class Residence;
class Spouse;

/// True for a value of the form "@...@" with at least one character inside
[[nodiscard]] bool is_pointer_value(std::string_view value) noexcept;

// ============================================================================
// RecordFields - Construction arguments shared by every record
// ============================================================================

/**
 * The generic contract of a record. All views must already be interned in
 * the owning RecordContext.
 */
struct RecordFields
{
  uint32_t level = 0;
  std::string_view tag;
  std::string_view pointer;
  std::string_view value;
  gsl::span<Record *> children;
  SourceRange range;
};

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all records.
 *
 * Records are non-copyable and live in a RecordContext. The empty value and
 * an absent value are the same thing.
 */
class Record
{
public:
  const RecordKind kind;
  uint32_t level;
  std::string_view tag;
  std::string_view pointer;  ///< "@I1@" or empty
  std::string_view value;    ///< continuation lines already merged
  gsl::span<Record *> children_;
  SourceRange range_;  ///< Line of the record in its source (invalid for created records)

  Record(const Record &) = delete;
  Record & operator=(const Record &) = delete;
  Record(Record &&) = delete;
  Record & operator=(Record &&) = delete;

  static bool classof(const Record * /*rec*/) { return true; }

  [[nodiscard]] RecordKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

  /// Pointer-id verbatim, e.g. "@I1@" (empty when the record has none)
  [[nodiscard]] std::string_view id() const noexcept { return pointer; }
  [[nodiscard]] bool has_value() const noexcept { return !value.empty(); }

  /// Direct children in document order
  [[nodiscard]] gsl::span<Record *> children() const noexcept { return children_; }

  // ===========================================================================
  // Children
  // ===========================================================================

  /// First direct child with this tag, or nullptr
  [[nodiscard]] const Record * child(std::string_view child_tag) const noexcept;
  [[nodiscard]] std::vector<const Record *> children_with(std::string_view child_tag) const;
  [[nodiscard]] bool has_child(std::string_view child_tag) const noexcept
  {
    return child(child_tag) != nullptr;
  }

  /// First direct child of record type T, or nullptr
  template <typename T>
  [[nodiscard]] const T * first_child() const noexcept
  {
    for (const Record * c : children_) {
      if (const auto * typed = dyn_cast<T>(c)) {
        return typed;
      }
    }
    return nullptr;
  }

  template <typename T>
  [[nodiscard]] std::vector<const T *> children_of() const
  {
    std::vector<const T *> out;
    for (const Record * c : children_) {
      if (const auto * typed = dyn_cast<T>(c)) {
        out.push_back(typed);
      }
    }
    return out;
  }

  /// Non-empty value of the first child with this tag; NotFound otherwise
  [[nodiscard]] LookupResult<std::string_view> child_value(std::string_view child_tag) const;

  // ===========================================================================
  // Shared accessors
  // ===========================================================================

  /**
   * Text of the first NOTE child. A NOTE whose value is a pointer is
   * followed to the top-level note it names.
   */
  [[nodiscard]] LookupResult<std::string_view> note(const XrefIndex & index) const;

  /// Every SOUR child, citations resolved to their top-level Source
  [[nodiscard]] LookupResult<std::vector<const Source *>> sources(const XrefIndex & index) const;

protected:
  Record(RecordKind k, const RecordFields & f)
  : kind(k),
    level(f.level),
    tag(f.tag),
    pointer(f.pointer),
    value(f.value),
    children_(f.children),
    range_(f.range)
  {
  }
  ~Record() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * @tparam Derived The concrete record class
 * @tparam Base The base class to inherit from
 * @tparam K The RecordKind for this record type
 */
template <typename Derived, typename Base, RecordKind K>
class RecordBase : public Base
{
public:
  static constexpr RecordKind kind_value = K;

  static bool classof(const Record * rec) { return rec->get_kind() == K; }

  explicit RecordBase(const RecordFields & f) : Base(K, f) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/**
 * Birth, death, marriage and residence records.
 */
class Event : public Record
{
public:
  static bool classof(const Record * rec) { return is_event_kind(rec->get_kind()); }

  [[nodiscard]] LookupResult<std::string_view> date() const { return child_value("DATE"); }
  [[nodiscard]] LookupResult<std::string_view> place() const { return child_value("PLAC"); }

protected:
  Event(RecordKind k, const RecordFields & f) : Record(k, f) {}
};

/**
 * A HUSB or WIFE line of a family; its value points at the individual.
 */
class Spouse : public Record
{
public:
  static bool classof(const Record * rec) { return is_spouse_kind(rec->get_kind()); }

  [[nodiscard]] LookupResult<const Individual *> as_individual(const XrefIndex & index) const;

protected:
  Spouse(RecordKind k, const RecordFields & f) : Record(k, f) {}
};

// ============================================================================
// Generic
// ============================================================================

/// Any tag without a dedicated class, vendor tags included.
class GenericRecord : public RecordBase<GenericRecord, Record, RecordKind::Generic>
{
public:
  using RecordBase::RecordBase;
};

// ============================================================================
// Individuals and Families
// ============================================================================

/**
 * Split form of a NAME value: "Given /Surname/ suffix".
 */
struct PersonName
{
  std::optional<std::string_view> given;
  std::optional<std::string_view> surname;

  [[nodiscard]] bool operator==(const PersonName & other) const
  {
    return given == other.given && surname == other.surname;
  }
  [[nodiscard]] bool operator!=(const PersonName & other) const { return !(*this == other); }
};

/**
 * Split a NAME record into given name and surname.
 *
 * An empty value falls back to the GIVN and SURN children.
 */
[[nodiscard]] LookupResult<PersonName> split_name(const Record & name);

/**
 * INDI record.
 */
class Individual : public RecordBase<Individual, Record, RecordKind::Individual>
{
public:
  using RecordBase::RecordBase;

  /// Preferred NAME: the first without a TYPE child, else the first
  [[nodiscard]] LookupResult<PersonName> name() const;

  /// Names whose TYPE is "aka" (case-insensitive)
  [[nodiscard]] LookupResult<std::vector<PersonName>> aka() const;

  [[nodiscard]] LookupResult<const Birth *> birth() const;
  [[nodiscard]] LookupResult<const Death *> death() const;
  [[nodiscard]] LookupResult<const Residence *> residence() const;

  [[nodiscard]] LookupResult<std::string_view> sex() const { return child_value("SEX"); }
  [[nodiscard]] bool is_male() const;
  [[nodiscard]] bool is_female() const;

  [[nodiscard]] LookupResult<std::string_view> title() const { return child_value("TITL"); }

  /**
   * Partners of the family named by the first FAMC, husbands first.
   * No FAMC gives an empty list.
   */
  [[nodiscard]] LookupResult<std::vector<const Individual *>> parents(
    const XrefIndex & index) const;
  [[nodiscard]] LookupResult<const Individual *> parent_at(
    const XrefIndex & index, size_t position) const;

  [[nodiscard]] LookupResult<const Individual *> father(const XrefIndex & index) const;
  [[nodiscard]] LookupResult<const Individual *> mother(const XrefIndex & index) const;

  /// Families linked through FAMS, in document order
  [[nodiscard]] LookupResult<std::vector<const Family *>> families_as_spouse(
    const XrefIndex & index) const;

private:
  /// Family named by the first FAMC; NotFound when there is none
  [[nodiscard]] LookupResult<const Family *> family_as_child(const XrefIndex & index) const;
};

/**
 * FAM record.
 */
class Family : public RecordBase<Family, Record, RecordKind::Family>
{
public:
  using RecordBase::RecordBase;

  [[nodiscard]] std::vector<const Spouse *> husbands() const;
  [[nodiscard]] std::vector<const Spouse *> wives() const;
  /// Husbands first, then wives
  [[nodiscard]] std::vector<const Spouse *> partners() const;

  [[nodiscard]] LookupResult<const Individual *> husband(const XrefIndex & index) const;
  [[nodiscard]] LookupResult<const Individual *> wife(const XrefIndex & index) const;
  [[nodiscard]] LookupResult<std::vector<const Individual *>> partner_individuals(
    const XrefIndex & index) const;

  using Record::children;

  /// CHIL links in document order
  [[nodiscard]] LookupResult<std::vector<const Individual *>> children(
    const XrefIndex & index) const;

  [[nodiscard]] LookupResult<const Marriage *> marriage() const;
};

// ============================================================================
// Sources and Notes
// ============================================================================

/**
 * SOUR record: either a top-level source or a citation pointing at one.
 */
class Source : public RecordBase<Source, Record, RecordKind::Source>
{
public:
  using RecordBase::RecordBase;

  [[nodiscard]] bool is_citation() const noexcept { return is_pointer_value(value); }

  /// The top-level source (itself when this is not a citation)
  [[nodiscard]] LookupResult<const Source *> resolve(const XrefIndex & index) const;

  [[nodiscard]] LookupResult<std::string_view> title() const { return child_value("TITL"); }
};

/**
 * NOTE record: inline text or a pointer to a top-level note.
 */
class Note : public RecordBase<Note, Record, RecordKind::Note>
{
public:
  using RecordBase::RecordBase;

  [[nodiscard]] LookupResult<std::string_view> text(const XrefIndex & index) const;
};

// ============================================================================
// Events and Spouse roles
// ============================================================================

class Birth : public RecordBase<Birth, Event, RecordKind::Birth>
{
public:
  using RecordBase::RecordBase;
};

class Death : public RecordBase<Death, Event, RecordKind::Death>
{
public:
  using RecordBase::RecordBase;
};

class Marriage : public RecordBase<Marriage, Event, RecordKind::Marriage>
{
public:
  using RecordBase::RecordBase;
};

class Residence : public RecordBase<Residence, Event, RecordKind::Residence>
{
public:
  using RecordBase::RecordBase;
};

class Husband : public RecordBase<Husband, Spouse, RecordKind::Husband>
{
public:
  using RecordBase::RecordBase;
};

class Wife : public RecordBase<Wife, Spouse, RecordKind::Wife>
{
public:
  using RecordBase::RecordBase;
};

}  // namespace gedcom
