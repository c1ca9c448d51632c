// gedcom/record/gedcom_file.hpp - A parsed GEDCOM file
//
// GedcomFile owns the record arena, the top-level records in document order
// and the cross-reference index built over them.
//
#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "gedcom/record/record.hpp"
#include "gedcom/record/record_context.hpp"
#include "gedcom/record/tag_registry.hpp"
#include "gedcom/record/xref_index.hpp"
#include "gedcom/writer/serializer.hpp"

namespace gedcom
{

// ============================================================================
// RecordRange - Filtered view over top-level records
// ============================================================================

/**
 * Lazy, restartable range over the top-level records of kind T.
 * Iterating never modifies the file.
 */
template <typename T>
class RecordRange
{
public:
  class iterator
  {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = const T *;
    using difference_type = std::ptrdiff_t;
    using pointer = const T * const *;
    using reference = const T *;

    iterator(const std::vector<Record *> * roots, size_t pos) : roots_(roots), pos_(pos)
    {
      skip_mismatches();
    }

    reference operator*() const { return cast<T>(static_cast<const Record *>((*roots_)[pos_])); }

    iterator & operator++()
    {
      ++pos_;
      skip_mismatches();
      return *this;
    }

    iterator operator++(int)
    {
      iterator tmp = *this;
      ++*this;
      return tmp;
    }

    bool operator==(const iterator & other) const { return pos_ == other.pos_; }
    bool operator!=(const iterator & other) const { return pos_ != other.pos_; }

  private:
    void skip_mismatches()
    {
      while (pos_ < roots_->size() && !isa<T>((*roots_)[pos_])) {
        ++pos_;
      }
    }

    const std::vector<Record *> * roots_;
    size_t pos_;
  };

  explicit RecordRange(const std::vector<Record *> & roots) : roots_(&roots) {}

  [[nodiscard]] iterator begin() const { return iterator(roots_, 0); }
  [[nodiscard]] iterator end() const { return iterator(roots_, roots_->size()); }

  [[nodiscard]] size_t size() const
  {
    return static_cast<size_t>(std::distance(begin(), end()));
  }
  [[nodiscard]] bool empty() const { return begin() == end(); }

private:
  const std::vector<Record *> * roots_;
};

// ============================================================================
// GedcomFile
// ============================================================================

/// Values written by GedcomFile::ensure_header_trailer()
struct HeaderOptions
{
  std::string source = "gedcom-core";  ///< HEAD.SOUR
  std::string charset = "UTF-8";       ///< HEAD.CHAR
};

class GedcomFile
{
public:
  /// An empty file (no records)
  explicit GedcomFile(const TagRegistry & registry = TagRegistry::default_registry());

  /// Take over records built by the parser. `index` must cover `roots`.
  GedcomFile(
    std::unique_ptr<RecordContext> ctx, std::vector<Record *> roots, XrefIndex index,
    const TagRegistry & registry);

  GedcomFile(const GedcomFile &) = delete;
  GedcomFile & operator=(const GedcomFile &) = delete;

  // ===========================================================================
  // Reading
  // ===========================================================================

  [[nodiscard]] RecordRange<Individual> individuals() const { return RecordRange<Individual>(roots_); }
  [[nodiscard]] RecordRange<Family> families() const { return RecordRange<Family>(roots_); }
  [[nodiscard]] RecordRange<Record> records() const { return RecordRange<Record>(roots_); }

  /// Top-level records in document order
  [[nodiscard]] const std::vector<Record *> & roots() const noexcept { return roots_; }

  [[nodiscard]] const XrefIndex & index() const noexcept { return index_; }

  /// Top-level record declaring `id` ("@I1@"), or nullptr
  [[nodiscard]] Record * find(std::string_view id) const { return index_.lookup(id); }

  [[nodiscard]] std::string serialize(const WriterOptions & options = {}) const
  {
    return gedcom::serialize(*this, options);
  }

  // ===========================================================================
  // Mutation
  // ===========================================================================

  /// New level-0 INDI record with a fresh "@I<n>@" id
  Individual * create_individual();

  /// New level-0 FAM record with a fresh "@F<n>@" id
  Family * create_family();

  /**
   * Append a child record, classified through the registry, one level below
   * `parent`.
   */
  Record * append_child(Record & parent, std::string_view tag, std::string_view value = {});

  void set_value(Record & rec, std::string_view value);

  /**
   * Set the SEX of an individual, updating the existing SEX child or
   * appending one.
   *
   * @return false (nothing changed) unless `sex` is "M" or "F" in any case
   */
  bool set_sex(Individual & person, std::string_view sex);

  /**
   * Insert a HEAD record if the first record is not one, and append a TRLR
   * record if the last record is not one.
   */
  void ensure_header_trailer(const HeaderOptions & header = {});

  [[nodiscard]] RecordContext & context() noexcept { return *ctx_; }

private:
  Record * new_record(uint32_t level, std::string_view tag, std::string_view pointer,
                      std::string_view value);
  Record * add_top_level(std::string_view tag, char id_prefix);
  std::string next_free_id(char prefix);

  std::unique_ptr<RecordContext> ctx_;
  std::vector<Record *> roots_;
  XrefIndex index_;
  TagRegistry registry_;
  uint32_t next_free_id_ = 1;
};

}  // namespace gedcom
