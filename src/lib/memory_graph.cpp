#include <shacl/memory_graph.hpp>

#include <algorithm>

namespace shacl {

  memory_graph::memory_graph(std::initializer_list<triple> triples) {
    for (const auto& t : triples) {
      add(t);
    }
  }

  bool
  memory_graph::add(triple t) {
    if (contains(t)) return false;

    auto pos = triples_.size();
    by_subject_[t.subject].push_back(pos);
    by_predicate_[t.predicate].push_back(pos);
    by_object_[t.object].push_back(pos);
    triples_.push_back(std::move(t));
    return true;
  }

  const std::vector<std::size_t>*
  memory_graph::index_for(
      const std::unordered_map<term, std::vector<std::size_t>>& index,
      const term& key) const {
    auto it = index.find(key);
    if (it == index.end()) return nullptr;
    return &it->second;
  }

  bool
  memory_graph::contains(const triple& t) const {
    const auto* positions = index_for(by_subject_, t.subject);
    if (!positions) return false;
    return std::any_of(positions->begin(), positions->end(),
                       [&](std::size_t pos) { return triples_[pos] == t; });
  }

  std::vector<term>
  memory_graph::values(const term& subject, const term& predicate) const {
    std::vector<term> out;
    const auto* positions = index_for(by_subject_, subject);
    if (!positions) return out;
    for (auto pos : *positions) {
      if (triples_[pos].predicate == predicate)
        out.push_back(triples_[pos].object);
    }
    return out;
  }

  bool
  memory_graph::has_triple(const term& subject, const term& predicate,
                           const term& object) const {
    return contains(triple{subject, predicate, object});
  }

  std::vector<term>
  memory_graph::subjects(const term& predicate, const term& object) const {
    std::vector<term> out;
    const auto* positions = index_for(by_object_, object);
    if (!positions) return out;
    for (auto pos : *positions) {
      if (triples_[pos].predicate == predicate)
        out.push_back(triples_[pos].subject);
    }
    return out;
  }

  std::vector<triple>
  memory_graph::match(const std::optional<term>& subject,
                      const std::optional<term>& predicate,
                      const std::optional<term>& object) const {
    // Scan the narrowest bound index; fall back to every triple.
    const std::vector<std::size_t>* candidates = nullptr;
    bool bound = false;
    auto narrow = [&](const std::unordered_map<term, std::vector<std::size_t>>&
                          index,
                      const std::optional<term>& key) {
      if (!key) return;
      static const std::vector<std::size_t> none;
      const auto* positions = index_for(index, *key);
      if (!positions) positions = &none;
      if (!bound || positions->size() < candidates->size())
        candidates = positions;
      bound = true;
    };
    narrow(by_subject_, subject);
    narrow(by_predicate_, predicate);
    narrow(by_object_, object);

    auto matches = [&](const triple& t) {
      return (!subject || t.subject == *subject) &&
             (!predicate || t.predicate == *predicate) &&
             (!object || t.object == *object);
    };

    std::vector<triple> out;
    if (!bound) {
      out = triples_;
      return out;
    }
    for (auto pos : *candidates) {
      if (matches(triples_[pos])) out.push_back(triples_[pos]);
    }
    return out;
  }

} // namespace shacl
