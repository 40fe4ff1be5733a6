#include <shacl/term.hpp>

#include <shacl/vocabulary.hpp>

namespace shacl {

  namespace {

    void
    append_escaped(std::string& out, const std::string& text) {
      for (char c : text) {
        switch (c) {
          case '"':
            out += "\\\"";
            break;
          case '\\':
            out += "\\\\";
            break;
          case '\n':
            out += "\\n";
            break;
          case '\r':
            out += "\\r";
            break;
          case '\t':
            out += "\\t";
            break;
          default:
            out += c;
        }
      }
    }

  } // namespace

  term
  term::make_literal(std::string lexical) {
    return term(literal{std::move(lexical), std::string(vocab::xsd::string),
                        std::nullopt});
  }

  term
  term::make_literal(std::string lexical, std::string datatype) {
    return term(literal{std::move(lexical), std::move(datatype), std::nullopt});
  }

  term
  term::make_lang_literal(std::string lexical, std::string language) {
    return term(literal{std::move(lexical),
                        std::string(vocab::rdf::lang_string),
                        std::move(language)});
  }

  std::string
  term::to_string() const {
    if (is_iri()) { return "<" + get<iri>().value + ">"; }
    if (is_blank()) { return "_:" + get<blank_node>().label; }

    const auto& l = get<literal>();
    std::string out = "\"";
    append_escaped(out, l.lexical);
    out += '"';
    if (l.language) {
      out += '@';
      out += *l.language;
    } else if (l.datatype != vocab::xsd::string) {
      out += "^^<" + l.datatype + ">";
    }
    return out;
  }

} // namespace shacl
