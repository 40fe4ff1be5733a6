#pragma once

#include <shacl/term.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace shacl {

  enum class severity {
    violation,
    warning,
    info,
    engine_error,
  };

  std::string_view
  to_string(severity s);

  using detail_value = std::variant<term, std::string, std::int64_t, bool>;

  // Insertion-ordered key/value details attached to a result. Setting an
  // existing key replaces its value in place.
  class result_details {
  public:
    using entry = std::pair<std::string, detail_value>;

  private:
    std::vector<entry> entries_;

  public:
    result_details() = default;

    result_details&
    set(std::string key, detail_value value);

    const detail_value*
    find(std::string_view key) const;

    bool
    contains(std::string_view key) const {
      return find(key) != nullptr;
    }

    // Typed lookup; std::nullopt when absent or holding another type.
    template <typename T>
    std::optional<T>
    get(std::string_view key) const {
      const auto* v = find(key);
      if (!v || !std::holds_alternative<T>(*v)) return std::nullopt;
      return std::get<T>(*v);
    }

    std::size_t
    size() const {
      return entries_.size();
    }

    bool
    empty() const {
      return entries_.empty();
    }

    std::vector<entry>::const_iterator
    begin() const {
      return entries_.begin();
    }

    std::vector<entry>::const_iterator
    end() const {
      return entries_.end();
    }

    bool
    operator==(const result_details&) const = default;
  };

  struct validation_result {
    term focus_node;
    std::optional<iri> path;
    term source_shape;
    shacl::severity severity = shacl::severity::violation;
    std::string message;
    result_details details;

    bool
    operator==(const validation_result&) const = default;
  };

} // namespace shacl
