#pragma once

#include <xns/attribute_map.hpp>

#include <cstddef>
#include <string>

namespace xns {

  struct element_name {
    std::string namespace_uri;
    std::string local_name;

    bool
    operator==(const element_name&) const = default;
  };

  // Pull interface over the start elements of a document. Only elements are
  // reported; text, comments and end tags are skipped.
  //
  // name(), depth() and attributes() describe the element the last
  // successful read() moved to. Calling them before the first read()
  // throws std::logic_error.
  class xml_attribute_reader {
  public:
    virtual ~xml_attribute_reader() = default;

    // Advance to the next start element. Returns false at end of document.
    virtual bool
    read() = 0;

    virtual const element_name&
    name() const = 0;

    // 1 for the document element.
    virtual std::size_t
    depth() const = 0;

    virtual const string_attribute_map&
    attributes() const = 0;
  };

} // namespace xns
