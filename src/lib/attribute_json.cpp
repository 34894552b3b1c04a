#include <xns/attribute_json.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <utility>

namespace xns {

  void
  to_json(nlohmann::json& j, const string_attribute_map& attributes) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& ns : attributes.get_namespaces()) {
      const auto& content = attributes.get_attributes(ns);
      if (content.empty()) { continue; }

      nlohmann::json& entry = out[ns];
      for (const auto& [name, value] : content) {
        entry[name] = value;
      }
    }
    j = std::move(out);
  }

  void
  from_json(const nlohmann::json& j, string_attribute_map& attributes) {
    // Throws nlohmann::json::type_error for anything but an object of
    // objects of strings.
    auto namespaces =
        j.get<std::map<std::string, std::map<std::string, std::string>>>();

    string_attribute_map result;
    for (auto& [ns, content] : namespaces) {
      for (auto& [name, value] : content) {
        result.set_attribute(ns, name, std::move(value));
      }
    }
    attributes = std::move(result);
  }

} // namespace xns
