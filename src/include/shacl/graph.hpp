#pragma once

#include <shacl/term.hpp>

#include <optional>
#include <vector>

namespace shacl {

  struct triple {
    term subject;
    term predicate;
    term object;

    bool
    operator==(const triple&) const = default;
  };

  // Read-only view of a data graph. Implementations must allow any number of
  // threads to call these members concurrently.
  class graph {
  public:
    virtual ~graph() = default;

    // Objects of (subject, predicate, *) in store order.
    virtual std::vector<term>
    values(const term& subject, const term& predicate) const = 0;

    virtual bool
    has_triple(const term& subject, const term& predicate,
               const term& object) const = 0;

    // Subjects of (*, predicate, object) in store order.
    virtual std::vector<term>
    subjects(const term& predicate, const term& object) const = 0;

    // All triples matching the pattern; an empty position is a wildcard.
    virtual std::vector<triple>
    match(const std::optional<term>& subject,
          const std::optional<term>& predicate,
          const std::optional<term>& object) const = 0;

    virtual std::size_t
    size() const = 0;
  };

} // namespace shacl
