#pragma once

#include <string_view>

namespace shacl::vocab {

  namespace rdf {
    inline constexpr std::string_view ns =
        "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    inline constexpr std::string_view type =
        "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
    inline constexpr std::string_view lang_string =
        "http://www.w3.org/1999/02/22-rdf-syntax-ns#langString";
  } // namespace rdf

  namespace xsd {
    inline constexpr std::string_view ns = "http://www.w3.org/2001/XMLSchema#";
    inline constexpr std::string_view string =
        "http://www.w3.org/2001/XMLSchema#string";
    inline constexpr std::string_view boolean =
        "http://www.w3.org/2001/XMLSchema#boolean";
    inline constexpr std::string_view integer =
        "http://www.w3.org/2001/XMLSchema#integer";
    inline constexpr std::string_view decimal =
        "http://www.w3.org/2001/XMLSchema#decimal";
    inline constexpr std::string_view double_ =
        "http://www.w3.org/2001/XMLSchema#double";
    inline constexpr std::string_view float_ =
        "http://www.w3.org/2001/XMLSchema#float";
    inline constexpr std::string_view non_negative_integer =
        "http://www.w3.org/2001/XMLSchema#nonNegativeInteger";
    inline constexpr std::string_view positive_integer =
        "http://www.w3.org/2001/XMLSchema#positiveInteger";
    inline constexpr std::string_view date_time =
        "http://www.w3.org/2001/XMLSchema#dateTime";
  } // namespace xsd

  namespace sh {
    inline constexpr std::string_view ns = "http://www.w3.org/ns/shacl#";
    inline constexpr std::string_view min_count_component =
        "http://www.w3.org/ns/shacl#MinCountConstraintComponent";
    inline constexpr std::string_view max_count_component =
        "http://www.w3.org/ns/shacl#MaxCountConstraintComponent";
    inline constexpr std::string_view datatype_component =
        "http://www.w3.org/ns/shacl#DatatypeConstraintComponent";
    inline constexpr std::string_view class_component =
        "http://www.w3.org/ns/shacl#ClassConstraintComponent";
    inline constexpr std::string_view pattern_component =
        "http://www.w3.org/ns/shacl#PatternConstraintComponent";
    inline constexpr std::string_view min_length_component =
        "http://www.w3.org/ns/shacl#MinLengthConstraintComponent";
    inline constexpr std::string_view in_component =
        "http://www.w3.org/ns/shacl#InConstraintComponent";
    inline constexpr std::string_view has_value_component =
        "http://www.w3.org/ns/shacl#HasValueConstraintComponent";
    inline constexpr std::string_view max_inclusive_component =
        "http://www.w3.org/ns/shacl#MaxInclusiveConstraintComponent";
    inline constexpr std::string_view qualified_min_count_component =
        "http://www.w3.org/ns/shacl#QualifiedMinCountConstraintComponent";
    inline constexpr std::string_view sparql_component =
        "http://www.w3.org/ns/shacl#SPARQLConstraintComponent";
  } // namespace sh

} // namespace shacl::vocab
