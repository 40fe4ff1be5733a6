#include <shacl/validation_result.hpp>

#include <algorithm>

namespace shacl {

  std::string_view
  to_string(severity s) {
    switch (s) {
      case severity::violation:
        return "Violation";
      case severity::warning:
        return "Warning";
      case severity::info:
        return "Info";
      case severity::engine_error:
        return "EngineError";
    }
    return "Unknown";
  }

  result_details&
  result_details::set(std::string key, detail_value value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const entry& e) { return e.first == key; });
    if (it != entries_.end()) {
      it->second = std::move(value);
    } else {
      entries_.emplace_back(std::move(key), std::move(value));
    }
    return *this;
  }

  const detail_value*
  result_details::find(std::string_view key) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const entry& e) { return e.first == key; });
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

} // namespace shacl
