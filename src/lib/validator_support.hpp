#pragma once

#include <shacl/graph.hpp>
#include <shacl/shapes.hpp>
#include <shacl/validation_result.hpp>
#include <shacl/vocabulary.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shacl::validators::detail {

  inline term
  rdf_type() {
    return term::make_iri(std::string(vocab::rdf::type));
  }

  inline std::vector<term>
  path_values(const graph& g, const term& focus_node,
              const property_shape& shape) {
    return g.values(focus_node, term(shape.path));
  }

  // Exact rdf:type membership; literals are never instances.
  inline bool
  is_instance_of(const graph& g, const term& value, const iri& cls) {
    if (value.is_literal()) return false;
    return g.has_triple(value, rdf_type(), term(cls));
  }

  // Number of code points in a UTF-8 string. Continuation bytes are not
  // counted, so malformed input still yields a bounded length.
  inline std::size_t
  utf8_length(std::string_view text) {
    std::size_t n = 0;
    for (unsigned char c : text) {
      if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
  }

  inline std::int64_t
  as_count(std::size_t n) {
    return static_cast<std::int64_t>(n);
  }

  // A violation for a property shape; shape.message overrides the default
  // text. details starts with the constraint component IRI.
  inline validation_result
  make_violation(const term& focus_node, const property_shape& shape,
                 std::string_view component, std::string default_message) {
    validation_result r;
    r.focus_node = focus_node;
    r.path = shape.path;
    r.source_shape = shape.id;
    r.severity = severity::violation;
    r.message = shape.message ? *shape.message : std::move(default_message);
    r.details.set("constraint_component",
                  term::make_iri(std::string(component)));
    return r;
  }

} // namespace shacl::validators::detail
