#include <xns/attribute_map.hpp>

#include <string>

namespace xns {

  // Maps filled from XML documents hold attribute text; instantiate that one
  // here so the reader, writer and JSON code share a single copy.
  template class attribute_map<std::string>;

} // namespace xns
