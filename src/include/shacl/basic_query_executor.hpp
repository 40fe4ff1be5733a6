#pragma once

#include <shacl/query_executor.hpp>

namespace shacl {

  // In-process evaluator for the SELECT queries found in rule constraints.
  //
  // Supported: PREFIX and BASE declarations (rdf, rdfs, xsd, owl and sh are
  // predeclared); SELECT [DISTINCT] with a variable list or '*'; a WHERE
  // group of triple patterns with the ';' ',' and 'a' abbreviations, FILTER,
  // BIND, OPTIONAL, UNION and nested groups; LIMIT. Filter expressions
  // support || && ! = != < <= > >= + - * /, BOUND, isIRI, isURI, isBlank,
  // isLiteral, isNumeric, STR, LANG, DATATYPE, STRLEN, REGEX, sameTerm,
  // EXISTS and NOT EXISTS.
  //
  // Blank node labels in patterns match that exact blank node. Property
  // paths, aggregates, subqueries and solution modifiers other than LIMIT
  // raise query_error.
  class basic_query_executor : public query_executor {
  public:
    std::vector<binding_row>
    execute(const graph& g, std::string_view query,
            std::stop_token stop) const override;
  };

} // namespace shacl
