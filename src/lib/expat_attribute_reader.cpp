#include <xns/expat_attribute_reader.hpp>

#include <expat.h>

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace xns {

  namespace {

    struct element_event {
      element_name name;
      std::size_t depth = 0;
      string_attribute_map attributes;
    };

    // expat reports "uri\nlocal" for qualified names and just "local"
    // otherwise.
    std::pair<std::string_view, std::string_view>
    split_expat_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) { return {std::string_view(), expat_name}; }
      auto uri_length = static_cast<std::size_t>(sep - expat_name);
      return {std::string_view(expat_name, uri_length),
              std::string_view(sep + 1)};
    }

    struct parser_deleter {
      void
      operator()(XML_Parser parser) const {
        XML_ParserFree(parser);
      }
    };

    using parser_ptr = std::unique_ptr<XML_ParserStruct, parser_deleter>;

  } // namespace

  struct expat_attribute_reader::impl {
    std::vector<element_event> events;
    std::size_t cursor = 0;
    std::size_t current_depth = 0;

    const element_event&
    current() const {
      if (cursor == 0) {
        throw std::logic_error("read() has not been called");
      }
      return events[cursor - 1];
    }

    static void XMLCALL
    on_start_element(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      self->current_depth++;

      element_event ev;
      auto [ns, local] = split_expat_name(name);
      ev.name = element_name{std::string(ns), std::string(local)};
      ev.depth = self->current_depth;

      for (const char** p = atts; *p != nullptr; p += 2) {
        auto [attr_ns, attr_local] = split_expat_name(p[0]);
        ev.attributes.set_attribute(attr_ns, attr_local, std::string(p[1]));
      }

      self->events.push_back(std::move(ev));
    }

    static void XMLCALL
    on_end_element(void* user_data, const char* /*name*/) {
      auto* self = static_cast<impl*>(user_data);
      self->current_depth--;
    }
  };

  expat_attribute_reader::expat_attribute_reader(std::string_view xml)
      : impl_(std::make_unique<impl>()) {
    // '\n' as the namespace separator
    parser_ptr parser(XML_ParserCreateNS(nullptr, '\n'));
    if (!parser) { throw std::runtime_error("failed to create expat parser"); }

    XML_SetUserData(parser.get(), impl_.get());
    XML_SetElementHandler(parser.get(), impl::on_start_element,
                          impl::on_end_element);

    XML_Status status = XML_Parse(parser.get(), xml.data(),
                                  static_cast<int>(xml.size()), XML_TRUE);

    if (status == XML_STATUS_ERROR) {
      std::string msg = "XML parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(parser.get()));
      msg += ": ";
      msg += XML_ErrorString(XML_GetErrorCode(parser.get()));
      throw std::runtime_error(msg);
    }

    if (impl_->events.empty()) {
      throw std::runtime_error("XML parse error: no content");
    }
  }

  expat_attribute_reader::~expat_attribute_reader() = default;
  expat_attribute_reader::expat_attribute_reader(
      expat_attribute_reader&&) noexcept = default;
  expat_attribute_reader&
  expat_attribute_reader::operator=(expat_attribute_reader&&) noexcept =
      default;

  bool
  expat_attribute_reader::read() {
    if (impl_->cursor >= impl_->events.size()) { return false; }
    impl_->cursor++;
    return true;
  }

  const element_name&
  expat_attribute_reader::name() const {
    return impl_->current().name;
  }

  std::size_t
  expat_attribute_reader::depth() const {
    return impl_->current().depth;
  }

  const string_attribute_map&
  expat_attribute_reader::attributes() const {
    return impl_->current().attributes;
  }

} // namespace xns
