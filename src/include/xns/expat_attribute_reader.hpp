#pragma once

#include <xns/xml_attribute_reader.hpp>

#include <memory>
#include <string_view>

namespace xns {

  class expat_attribute_reader : public xml_attribute_reader {
  public:
    explicit expat_attribute_reader(std::string_view xml);
    ~expat_attribute_reader() override;

    expat_attribute_reader(const expat_attribute_reader&) = delete;
    expat_attribute_reader&
    operator=(const expat_attribute_reader&) = delete;
    expat_attribute_reader(expat_attribute_reader&&) noexcept;
    expat_attribute_reader&
    operator=(expat_attribute_reader&&) noexcept;

    bool
    read() override;

    const element_name&
    name() const override;

    std::size_t
    depth() const override;

    const string_attribute_map&
    attributes() const override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace xns
