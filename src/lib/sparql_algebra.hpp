#pragma once

#include <shacl/term.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Parsed form of the SELECT subset understood by basic_query_executor.
namespace shacl::sparql {

  struct variable {
    std::string name;
  };

  using pattern_term = std::variant<term, variable>;

  struct triple_pattern {
    pattern_term subject;
    pattern_term predicate;
    pattern_term object;
  };

  struct group;
  struct expression;

  using expression_ptr = std::shared_ptr<const expression>;
  using group_ptr = std::shared_ptr<const group>;

  enum class expr_kind {
    constant,
    var,
    logical_or,
    logical_and,
    logical_not,
    equal,
    not_equal,
    less,
    less_equal,
    greater,
    greater_equal,
    add,
    subtract,
    multiply,
    divide,
    negate,
    call,
    exists,
    not_exists,
  };

  struct expression {
    expr_kind kind = expr_kind::constant;
    term value;                  // constant
    std::string name;            // var name, or upper-cased function name
    std::vector<expression_ptr> args;
    group_ptr pattern;           // exists / not_exists
  };

  struct filter_element {
    expression_ptr condition;
  };

  struct bind_element {
    expression_ptr value;
    std::string target;
  };

  struct optional_element {
    group_ptr body;
  };

  struct union_element {
    std::vector<group_ptr> branches;
  };

  using group_element = std::variant<triple_pattern, filter_element,
                                     bind_element, optional_element,
                                     union_element>;

  struct group {
    std::vector<group_element> elements;
  };

  struct select_query {
    bool distinct = false;
    // Empty projection means SELECT *, resolved to mentioned_variables.
    std::vector<std::string> projection;
    std::vector<std::string> mentioned_variables;
    group where;
    std::optional<std::size_t> limit;
  };

  // Throws query_error on malformed or unsupported syntax.
  select_query
  parse_select(std::string_view text);

} // namespace shacl::sparql
