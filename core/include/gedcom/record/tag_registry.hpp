// gedcom/record/tag_registry.hpp - Tag to record factory table
#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "gedcom/record/record.hpp"
#include "gedcom/record/record_context.hpp"

namespace gedcom
{

/// Builds a record of one concrete type in the arena
using RecordFactory = Record * (*)(RecordContext & ctx, const RecordFields & fields);

template <typename T>
Record * make_record(RecordContext & ctx, const RecordFields & fields)
{
  return ctx.create<T>(fields);
}

/**
 * Maps tags to record factories. Tags without an entry become
 * GenericRecord, so unknown and vendor tags survive untouched.
 *
 * @code
 *   TagRegistry registry = TagRegistry::default_registry();
 *   registry.register_tag("_MARR", &make_record<Marriage>);
 * @endcode
 */
class TagRegistry
{
public:
  /// An empty registry: every tag classifies as Generic
  TagRegistry() = default;

  /// INDI, FAM, BIRT, DEAT, MARR, RESI, HUSB, WIFE, SOUR and NOTE
  [[nodiscard]] static const TagRegistry & default_registry();

  /**
   * Map `tag` to `factory`, replacing any earlier mapping.
   *
   * @return false if the tag was already registered
   */
  bool register_tag(std::string_view tag, RecordFactory factory);

  [[nodiscard]] bool contains(std::string_view tag) const
  {
    return factories_.find(tag) != factories_.end();
  }

  [[nodiscard]] size_t size() const noexcept { return factories_.size(); }

  /// Factory for `tag`, or the Generic fallback
  [[nodiscard]] RecordFactory lookup(std::string_view tag) const;

  [[nodiscard]] Record * create(RecordContext & ctx, const RecordFields & fields) const
  {
    return lookup(fields.tag)(ctx, fields);
  }

private:
  std::map<std::string, RecordFactory, std::less<>> factories_;
};

}  // namespace gedcom
