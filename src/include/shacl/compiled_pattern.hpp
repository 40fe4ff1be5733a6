#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace re2 {
  class RE2;
}

namespace shacl {

  // An sh:pattern regular expression, compiled once when the shape is built
  // and shared read-only between copies of the shape and between threads.
  class compiled_pattern {
    std::string source_;
    std::string flags_;
    std::shared_ptr<const re2::RE2> regex_;

  public:
    // Flags follow sh:flags: i (case-insensitive), s (dot matches newline),
    // m (multi-line anchors), q (literal pattern). Throws
    // std::invalid_argument for a pattern that does not compile or an
    // unsupported flag.
    explicit compiled_pattern(std::string source, std::string flags = "");

    const std::string&
    source() const {
      return source_;
    }

    const std::string&
    flags() const {
      return flags_;
    }

    // True when the whole of text (UTF-8) matches.
    bool
    full_match(std::string_view text) const;

    // True when any part of text matches.
    bool
    search(std::string_view text) const;
  };

} // namespace shacl
