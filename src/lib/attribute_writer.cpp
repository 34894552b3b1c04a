#include <xns/attribute_writer.hpp>
#include <xns/xml_escape.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace xns {

  namespace {

    void
    write_pair(std::ostream& os, std::string_view prefix,
               std::string_view name, std::string_view value) {
      os << ' ';
      if (!prefix.empty()) { os << prefix << ':'; }
      os << name << "=\"";
      escape_attribute(os, value);
      os << '"';
    }

    std::vector<std::string>
    sorted(std::vector<std::string> items) {
      std::sort(items.begin(), items.end());
      return items;
    }

  } // namespace

  void
  write_attributes(std::ostream& os, const string_attribute_map& attributes) {
    struct scope {
      std::string uri;
      std::string prefix;
    };

    // An emptied singleton namespace still shows up here; skip it so no
    // unused xmlns declaration is written.
    std::vector<scope> scopes;
    int counter = 0;
    for (auto& uri : sorted(attributes.get_namespaces())) {
      if (attributes.get_attributes(uri).empty()) { continue; }
      std::string prefix;
      if (uri == xml_namespace_uri) {
        prefix = "xml";
      } else if (!uri.empty()) {
        prefix = "ns" + std::to_string(counter++);
      }
      scopes.push_back({std::move(uri), std::move(prefix)});
    }

    // The xml prefix is bound by definition and must not be redeclared.
    for (const auto& s : scopes) {
      if (s.prefix.empty() || s.uri == xml_namespace_uri) { continue; }
      write_pair(os, "xmlns", s.prefix, s.uri);
    }

    for (const auto& s : scopes) {
      const auto& content = attributes.get_attributes(s.uri);
      for (const auto& name : sorted(attributes.get_names(s.uri))) {
        write_pair(os, s.prefix, name, content.find(name)->second);
      }
    }
  }

  void
  write_empty_element(std::ostream& os, std::string_view local_name,
                      const string_attribute_map& attributes) {
    os << '<' << local_name;
    write_attributes(os, attributes);
    os << "/>";
  }

  std::string
  format_attributes(const string_attribute_map& attributes) {
    std::ostringstream os;
    write_attributes(os, attributes);
    return os.str();
  }

} // namespace xns
