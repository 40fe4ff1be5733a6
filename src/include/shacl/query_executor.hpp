#pragma once

#include <shacl/graph.hpp>
#include <shacl/term.hpp>

#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shacl {

  // One solution of a SELECT query: variable name (without '?') -> term, in
  // projection order. Unbound variables are absent.
  using binding_row = std::vector<std::pair<std::string, term>>;

  class query_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class query_executor {
  public:
    virtual ~query_executor() = default;

    // Runs a SELECT query against g. Throws query_error when the query
    // cannot be parsed or evaluated. Long evaluations should give up with
    // query_error once stop is requested.
    virtual std::vector<binding_row>
    execute(const graph& g, std::string_view query,
            std::stop_token stop) const = 0;
  };

} // namespace shacl
