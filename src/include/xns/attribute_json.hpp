#pragma once

#include <xns/attribute_map.hpp>

#include <nlohmann/json_fwd.hpp>

namespace xns {

  // {"<namespace>": {"<name>": "<value>", ...}, ...}
  // Namespaces without attributes are left out.
  void
  to_json(nlohmann::json& j, const string_attribute_map& attributes);

  // Replaces the content of attributes. Namespaces are inserted in sorted
  // order, so the lexicographically smallest one becomes the singleton.
  void
  from_json(const nlohmann::json& j, string_attribute_map& attributes);

} // namespace xns
