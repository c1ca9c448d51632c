// gedcom/writer/json_writer.cpp - JSON dump implementation
//
#include "gedcom/writer/json_writer.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "gedcom/basic/source_manager.hpp"

namespace gedcom
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

}  // namespace

json to_json(const Record * rec)
{
  if (rec == nullptr) return json(nullptr);

  json j{
    {"kind", std::string(to_string(rec->get_kind()))},
    {"tag", std::string(rec->tag)},
    {"level", rec->level},
    {"range", j_range(rec->get_range())}};
  if (!rec->id().empty()) {
    j["id"] = std::string(rec->id());
  }
  if (rec->has_value()) {
    j["value"] = std::string(rec->value);
  }

  json children = json::array();
  for (const Record * child : rec->children()) {
    children.push_back(to_json(child));
  }
  j["children"] = std::move(children);
  return j;
}

json to_json(const GedcomFile & file)
{
  json records = json::array();
  for (const Record * rec : file.records()) {
    records.push_back(to_json(rec));
  }
  return json{{"type", "GedcomFile"}, {"records", std::move(records)}};
}

}  // namespace gedcom
