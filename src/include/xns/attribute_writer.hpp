#pragma once

#include <xns/attribute_map.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace xns {

  inline constexpr std::string_view xml_namespace_uri =
      "http://www.w3.org/XML/1998/namespace";

  // Writes ` xmlns:nsN="uri"` for every qualified namespace, then
  // ` nsN:name="value"` for every attribute. Namespaces and names are
  // emitted in sorted order; unqualified attributes carry no prefix.
  // Attributes in xml_namespace_uri are written as xml:name with no
  // declaration.
  void
  write_attributes(std::ostream& os, const string_attribute_map& attributes);

  // <local_name attributes.../>
  void
  write_empty_element(std::ostream& os, std::string_view local_name,
                      const string_attribute_map& attributes);

  std::string
  format_attributes(const string_attribute_map& attributes);

} // namespace xns
