#pragma once

#include <shacl/graph.hpp>

#include <cstddef>
#include <initializer_list>
#include <unordered_map>
#include <vector>

namespace shacl {

  // Insertion-ordered in-memory triple store. A triple added twice is kept
  // once. Not safe to mutate while other threads read it.
  class memory_graph : public graph {
    std::vector<triple> triples_;
    // Positions in triples_, keyed by the term in each position.
    std::unordered_map<term, std::vector<std::size_t>> by_subject_;
    std::unordered_map<term, std::vector<std::size_t>> by_predicate_;
    std::unordered_map<term, std::vector<std::size_t>> by_object_;

  public:
    memory_graph() = default;

    memory_graph(std::initializer_list<triple> triples);

    // Returns false when the triple was already present.
    bool
    add(triple t);

    bool
    add(term subject, term predicate, term object) {
      return add(triple{std::move(subject), std::move(predicate),
                        std::move(object)});
    }

    const std::vector<triple>&
    triples() const {
      return triples_;
    }

    std::vector<term>
    values(const term& subject, const term& predicate) const override;

    bool
    has_triple(const term& subject, const term& predicate,
               const term& object) const override;

    std::vector<term>
    subjects(const term& predicate, const term& object) const override;

    std::vector<triple>
    match(const std::optional<term>& subject,
          const std::optional<term>& predicate,
          const std::optional<term>& object) const override;

    std::size_t
    size() const override {
      return triples_.size();
    }

  private:
    const std::vector<std::size_t>*
    index_for(const std::unordered_map<term, std::vector<std::size_t>>& index,
              const term& key) const;

    bool
    contains(const triple& t) const;
  };

} // namespace shacl
