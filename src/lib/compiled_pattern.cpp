#include <shacl/compiled_pattern.hpp>

#include <re2/re2.h>

#include <stdexcept>

namespace shacl {

  compiled_pattern::compiled_pattern(std::string source, std::string flags)
      : source_(std::move(source)), flags_(std::move(flags)) {
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingUTF8);
    options.set_log_errors(false);

    std::string prefix;
    for (char f : flags_) {
      switch (f) {
        case 'i':
          options.set_case_sensitive(false);
          break;
        case 's':
          options.set_dot_nl(true);
          break;
        case 'm':
          prefix = "(?m)";
          break;
        case 'q':
          options.set_literal(true);
          break;
        default:
          throw std::invalid_argument("pattern: unsupported flag '" +
                                      std::string(1, f) + "' in \"" + flags_ +
                                      "\"");
      }
    }
    if (options.literal()) prefix.clear();

    auto regex = std::make_shared<const RE2>(prefix + source_, options);
    if (!regex->ok()) {
      throw std::invalid_argument("pattern: cannot compile \"" + source_ +
                                  "\": " + regex->error());
    }
    regex_ = std::move(regex);
  }

  bool
  compiled_pattern::full_match(std::string_view text) const {
    return RE2::FullMatch(re2::StringPiece(text.data(), text.size()), *regex_);
  }

  bool
  compiled_pattern::search(std::string_view text) const {
    return RE2::PartialMatch(re2::StringPiece(text.data(), text.size()),
                             *regex_);
  }

} // namespace shacl
