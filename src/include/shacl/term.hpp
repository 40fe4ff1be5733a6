#pragma once

#include <compare>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace shacl {

  struct iri {
    std::string value;

    auto
    operator<=>(const iri&) const = default;

    bool
    operator==(const iri&) const = default;
  };

  struct blank_node {
    std::string label;

    auto
    operator<=>(const blank_node&) const = default;

    bool
    operator==(const blank_node&) const = default;
  };

  struct literal {
    std::string lexical;
    std::string datatype;
    std::optional<std::string> language;

    auto
    operator<=>(const literal&) const = default;

    bool
    operator==(const literal&) const = default;
  };

  // An RDF term. Equality is structural: no value canonicalization is done,
  // so "1"^^xsd:integer and "01"^^xsd:integer are different terms.
  class term {
  public:
    using variant_type = std::variant<iri, blank_node, literal>;

    term() = default;

    term(iri v) : data_(std::move(v)) {}

    term(blank_node v) : data_(std::move(v)) {}

    term(literal v) : data_(std::move(v)) {}

    static term
    make_iri(std::string value) {
      return term(iri{std::move(value)});
    }

    static term
    make_blank(std::string label) {
      return term(blank_node{std::move(label)});
    }

    // Plain literal, typed xsd:string.
    static term
    make_literal(std::string lexical);

    static term
    make_literal(std::string lexical, std::string datatype);

    // Language-tagged literal, typed rdf:langString.
    static term
    make_lang_literal(std::string lexical, std::string language);

    const variant_type&
    data() const {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    bool
    is_iri() const {
      return holds<iri>();
    }

    bool
    is_blank() const {
      return holds<blank_node>();
    }

    bool
    is_literal() const {
      return holds<literal>();
    }

    // Canonical N-Triples form: <iri>, _:label, "lex"^^<dt> or "lex"@lang.
    // Plain xsd:string literals are written without a datatype suffix.
    std::string
    to_string() const;

    auto
    operator<=>(const term&) const = default;

    bool
    operator==(const term&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const term& t) {
      return os << t.to_string();
    }

  private:
    variant_type data_;
  };

} // namespace shacl

template <>
struct std::hash<shacl::term> {
  std::size_t
  operator()(const shacl::term& t) const noexcept {
    std::size_t seed = t.data().index();
    auto mix = [&seed](const std::string& s) {
      seed ^= std::hash<std::string>{}(s) + 0x9e3779b9 + (seed << 6) +
              (seed >> 2);
    };
    if (t.is_iri()) {
      mix(t.get<shacl::iri>().value);
    } else if (t.is_blank()) {
      mix(t.get<shacl::blank_node>().label);
    } else {
      const auto& l = t.get<shacl::literal>();
      mix(l.lexical);
      mix(l.datatype);
      if (l.language) mix(*l.language);
    }
    return seed;
  }
};
