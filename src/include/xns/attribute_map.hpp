#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace xns {

  namespace detail {

    // Lets the maps below be probed with a string_view without building a
    // temporary std::string.
    struct string_hash {
      using is_transparent = void;

      std::size_t
      operator()(std::string_view s) const noexcept {
        return std::hash<std::string_view>{}(s);
      }
    };

    inline std::string_view
    require_namespace(const char* ns) {
      if (ns == nullptr) {
        throw std::invalid_argument("attribute namespace must not be null");
      }
      return ns;
    }

    inline std::string_view
    require_name(const char* name) {
      if (name == nullptr) {
        throw std::invalid_argument("attribute name must not be null");
      }
      return name;
    }

  } // namespace detail

  // A map of (namespace, local name) -> value.
  //
  // Most documents use a single namespace per element, so the first namespace
  // ever written is kept in a dedicated slot (the singleton) and the nested
  // map-of-maps for the remaining namespaces is only allocated once a second
  // namespace shows up. The singleton is never reassigned; it stays even when
  // all of its attributes have been removed. Only clear() resets it.
  template <typename T>
  class attribute_map {
  public:
    using value_type = T;
    using content_type =
        std::unordered_map<std::string, T, detail::string_hash,
                           std::equal_to<>>;
    using overflow_type =
        std::unordered_map<std::string, content_type, detail::string_hash,
                           std::equal_to<>>;

  private:
    struct singleton {
      std::string ns;
      content_type content;

      bool
      operator==(const singleton&) const = default;
    };

    struct multiple {
      singleton primary;
      // Never holds primary.ns, never holds an empty inner map, never empty.
      overflow_type overflow;

      bool
      operator==(const multiple&) const = default;
    };

    std::variant<std::monostate, singleton, multiple> state_;

  public:
    attribute_map() = default;

    // Shared immutable map returned for namespaces that hold nothing.
    static const content_type&
    empty_attributes() {
      static const content_type instance;
      return instance;
    }

    // Stores value under (ns, name), or removes the entry when value is
    // nullopt. Returns the value previously stored there.
    std::optional<T>
    set_attribute(std::string_view ns, std::string_view name,
                  std::optional<T> value) {
      if (singleton* p = primary()) {
        if (p->ns == ns) {
          if (value) { return put(p->content, name, std::move(*value)); }
          return take(p->content, name);
        }
        return set_overflow(ns, name, std::move(value));
      }

      if (value) {
        singleton s{std::string(ns), {}};
        s.content.emplace(std::string(name), std::move(*value));
        state_ = std::move(s);
      }
      return std::nullopt;
    }

    std::optional<T>
    set_attribute(const char* ns, const char* name, std::optional<T> value) {
      std::string_view ns_view = detail::require_namespace(ns);
      std::string_view name_view = detail::require_name(name);
      return set_attribute(ns_view, name_view, std::move(value));
    }

    std::optional<T>
    remove_attribute(std::string_view ns, std::string_view name) {
      return set_attribute(ns, name, std::nullopt);
    }

    std::optional<T>
    remove_attribute(const char* ns, const char* name) {
      return set_attribute(ns, name, std::nullopt);
    }

    // nullptr if nothing is stored under (ns, name).
    const T*
    get_attribute(std::string_view ns, std::string_view name) const {
      const content_type& content = get_attributes(ns);
      auto it = content.find(name);
      return it == content.end() ? nullptr : &it->second;
    }

    const T*
    get_attribute(const char* ns, const char* name) const {
      std::string_view ns_view = detail::require_namespace(ns);
      std::string_view name_view = detail::require_name(name);
      return get_attribute(ns_view, name_view);
    }

    // Value of name from whichever namespace carries it. When several
    // namespaces do, which one answers is unspecified.
    const T*
    get_first_attribute(std::string_view name) const {
      if (const singleton* p = primary()) {
        auto it = p->content.find(name);
        if (it != p->content.end()) { return &it->second; }
      }
      if (const overflow_type* tier = overflow()) {
        for (const auto& [ns, content] : *tier) {
          auto it = content.find(name);
          if (it != content.end()) { return &it->second; }
        }
      }
      return nullptr;
    }

    const T*
    get_first_attribute(const char* name) const {
      return get_first_attribute(detail::require_name(name));
    }

    const content_type&
    get_attributes(std::string_view ns) const {
      const singleton* p = primary();
      if (p == nullptr) { return empty_attributes(); }
      if (p->ns == ns) { return p->content; }

      if (const overflow_type* tier = overflow()) {
        auto it = tier->find(ns);
        if (it != tier->end()) { return it->second; }
      }
      return empty_attributes();
    }

    const content_type&
    get_attributes(const char* ns) const {
      return get_attributes(detail::require_namespace(ns));
    }

    std::vector<std::string>
    get_names(std::string_view ns) const {
      const content_type& content = get_attributes(ns);
      std::vector<std::string> names;
      names.reserve(content.size());
      for (const auto& [name, value] : content) {
        names.push_back(name);
      }
      return names;
    }

    std::vector<std::string>
    get_names(const char* ns) const {
      return get_names(detail::require_namespace(ns));
    }

    // The singleton (even if emptied) followed by every overflow namespace.
    std::vector<std::string>
    get_namespaces() const {
      std::vector<std::string> result;
      const singleton* p = primary();
      if (p == nullptr) { return result; }

      const overflow_type* tier = overflow();
      result.reserve(1 + (tier ? tier->size() : 0));
      result.push_back(p->ns);
      if (tier) {
        for (const auto& [ns, content] : *tier) {
          result.push_back(ns);
        }
      }
      return result;
    }

    const std::string*
    singleton_namespace() const {
      const singleton* p = primary();
      return p ? &p->ns : nullptr;
    }

    std::size_t
    namespace_count() const {
      if (primary() == nullptr) { return 0; }
      const overflow_type* tier = overflow();
      return 1 + (tier ? tier->size() : 0);
    }

    // Number of stored values across all namespaces.
    std::size_t
    size() const {
      const singleton* p = primary();
      if (p == nullptr) { return 0; }
      std::size_t n = p->content.size();
      if (const overflow_type* tier = overflow()) {
        for (const auto& [ns, content] : *tier) {
          n += content.size();
        }
      }
      return n;
    }

    bool
    empty() const {
      return size() == 0;
    }

    void
    clear() {
      state_ = std::monostate{};
    }

    // Union of other into *this; other's value wins when both hold the same
    // (namespace, name).
    void
    merge(const attribute_map& other) {
      if (this == &other) { return; }
      const singleton* source = other.primary();
      if (source == nullptr) { return; }

      if (primary() == nullptr) {
        state_ = singleton{source->ns, source->content};
      } else {
        merge_namespace(source->ns, source->content);
      }

      if (const overflow_type* tier = other.overflow()) {
        for (const auto& [ns, content] : *tier) {
          merge_namespace(ns, content);
        }
      }
    }

    attribute_map
    clone() const {
      return *this;
    }

    // Compares the stored layout: the singleton namespace, its content and
    // the overflow namespaces. Two maps holding the same attributes but with
    // a different singleton compare unequal; use equivalent() to compare
    // content only.
    bool
    operator==(const attribute_map&) const = default;

    // True when both maps answer every (namespace, name) lookup alike.
    bool
    equivalent(const attribute_map& other) const {
      return covered_by(*this, other) && covered_by(other, *this);
    }

    std::size_t
    hash() const noexcept {
      const singleton* p = primary();
      const overflow_type* tier = overflow();

      std::size_t result = 0;
      if (tier) {
        for (const auto& [ns, content] : *tier) {
          result += detail::string_hash{}(ns) ^ hash_content(content);
        }
      }
      result = 31 * result + (p ? detail::string_hash{}(p->ns) : 0);
      result = 31 * result + (p ? hash_content(p->content) : 0);
      return result;
    }

  private:
    singleton*
    primary() {
      if (auto* s = std::get_if<singleton>(&state_)) { return s; }
      if (auto* m = std::get_if<multiple>(&state_)) { return &m->primary; }
      return nullptr;
    }

    const singleton*
    primary() const {
      if (const auto* s = std::get_if<singleton>(&state_)) { return s; }
      if (const auto* m = std::get_if<multiple>(&state_)) {
        return &m->primary;
      }
      return nullptr;
    }

    overflow_type*
    overflow() {
      auto* m = std::get_if<multiple>(&state_);
      return m ? &m->overflow : nullptr;
    }

    const overflow_type*
    overflow() const {
      const auto* m = std::get_if<multiple>(&state_);
      return m ? &m->overflow : nullptr;
    }

    // Requires a singleton. Switches to the two-tier layout if needed.
    overflow_type&
    grow_overflow() {
      if (auto* m = std::get_if<multiple>(&state_)) { return m->overflow; }
      singleton s = std::move(std::get<singleton>(state_));
      state_ = multiple{std::move(s), {}};
      return std::get<multiple>(state_).overflow;
    }

    void
    drop_overflow() {
      singleton s = std::move(std::get<multiple>(state_).primary);
      state_ = std::move(s);
    }

    std::optional<T>
    set_overflow(std::string_view ns, std::string_view name,
                 std::optional<T> value) {
      if (overflow_type* tier = overflow()) {
        auto it = tier->find(ns);
        if (it != tier->end()) {
          if (value) { return put(it->second, name, std::move(*value)); }

          std::optional<T> previous = take(it->second, name);
          if (it->second.empty()) {
            tier->erase(it);
            if (tier->empty()) { drop_overflow(); }
          }
          return previous;
        }
      }

      if (!value) { return std::nullopt; }

      content_type content;
      content.emplace(std::string(name), std::move(*value));
      grow_overflow().emplace(std::string(ns), std::move(content));
      return std::nullopt;
    }

    // Requires a singleton.
    void
    merge_namespace(const std::string& ns, const content_type& source) {
      singleton* p = primary();
      if (p->ns == ns) {
        merge_content(p->content, source);
        return;
      }
      if (source.empty()) { return; }

      overflow_type& tier = grow_overflow();
      auto it = tier.find(ns);
      if (it == tier.end()) {
        tier.emplace(ns, source);
      } else {
        merge_content(it->second, source);
      }
    }

    static void
    merge_content(content_type& target, const content_type& source) {
      for (const auto& [name, value] : source) {
        target.insert_or_assign(name, value);
      }
    }

    static std::optional<T>
    put(content_type& content, std::string_view name, T value) {
      auto it = content.find(name);
      if (it == content.end()) {
        content.emplace(std::string(name), std::move(value));
        return std::nullopt;
      }
      return std::exchange(it->second, std::move(value));
    }

    static std::optional<T>
    take(content_type& content, std::string_view name) {
      auto it = content.find(name);
      if (it == content.end()) { return std::nullopt; }
      std::optional<T> previous(std::move(it->second));
      content.erase(it);
      return previous;
    }

    // Order-independent: unordered maps with equal entries hash equal.
    static std::size_t
    hash_content(const content_type& content) noexcept {
      std::size_t h = 0;
      for (const auto& [name, value] : content) {
        h += detail::string_hash{}(name) ^ std::hash<T>{}(value);
      }
      return h;
    }

    static bool
    covered_by(const attribute_map& a, const attribute_map& b) {
      const singleton* p = a.primary();
      if (p == nullptr) { return true; }
      if (p->content != b.get_attributes(p->ns)) { return false; }
      if (const overflow_type* tier = a.overflow()) {
        for (const auto& [ns, content] : *tier) {
          if (content != b.get_attributes(ns)) { return false; }
        }
      }
      return true;
    }
  };

  using string_attribute_map = attribute_map<std::string>;

  extern template class attribute_map<std::string>;

} // namespace xns

template <typename T>
struct std::hash<xns::attribute_map<T>> {
  std::size_t
  operator()(const xns::attribute_map<T>& m) const noexcept {
    return m.hash();
  }
};
