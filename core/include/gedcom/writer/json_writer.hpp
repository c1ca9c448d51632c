// gedcom/writer/json_writer.hpp - JSON dump of the record forest
//
// Structural dump for tooling and debugging; returns nlohmann::json objects.
//
#pragma once

#include <nlohmann/json.hpp>

#include "gedcom/record/gedcom_file.hpp"
#include "gedcom/record/record.hpp"

namespace gedcom
{

/**
 * Serialize a record and its subtree.
 *
 * @return {"kind", "tag", "level", "id"?, "value"?, "range", "children"}
 */
[[nodiscard]] nlohmann::json to_json(const Record * rec);

/// {"type": "GedcomFile", "records": [...]}
[[nodiscard]] nlohmann::json to_json(const GedcomFile & file);

}  // namespace gedcom
