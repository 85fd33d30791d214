// castlist/render/json_dump.hpp - JSON serialization of parse results
//
// Returns nlohmann::json objects for a Dataset and its issues.
//
// Layout:
//   { "entries": [node...], "roots": [index...], "issuesDetailed": [issue...] }
//   node   = { "kind": "node", "name", "fragments": [...] }
//   group members reference nodes by their index in "entries".
//
#pragma once

#include <nlohmann/json.hpp>

#include "castlist/basic/issue.hpp"
#include "castlist/model/dataset.hpp"

namespace castlist
{

/**
 * Serialize a Dataset, including its issues.
 *
 * @param dataset The parse result
 * @return JSON representation with entries, roots and issuesDetailed
 */
[[nodiscard]] nlohmann::json to_json(const Dataset & dataset);

/**
 * Serialize one issue. `path` and `message` are omitted when absent.
 */
[[nodiscard]] nlohmann::json to_json(const ParseIssue & issue);

}  // namespace castlist
