// gedcom/record/tag_registry.cpp - Tag registry implementation
#include "gedcom/record/tag_registry.hpp"

namespace gedcom
{
namespace
{

TagRegistry build_default_registry()
{
  TagRegistry registry;
#define RECORD_PLAIN(Class, Tag) registry.register_tag(Tag, &make_record<Class>);
#define RECORD_EVENT(Class, Tag) registry.register_tag(Tag, &make_record<Class>);
#define RECORD_SPOUSE(Class, Tag) registry.register_tag(Tag, &make_record<Class>);
#include "gedcom/record/record_kinds.def"
  return registry;
}

}  // namespace

const TagRegistry & TagRegistry::default_registry()
{
  static const TagRegistry registry = build_default_registry();
  return registry;
}

bool TagRegistry::register_tag(std::string_view tag, RecordFactory factory)
{
  auto it = factories_.find(tag);
  if (it != factories_.end()) {
    it->second = factory;
    return false;
  }
  factories_.emplace(std::string(tag), factory);
  return true;
}

RecordFactory TagRegistry::lookup(std::string_view tag) const
{
  auto it = factories_.find(tag);
  return it != factories_.end() ? it->second : &make_record<GenericRecord>;
}

}  // namespace gedcom
