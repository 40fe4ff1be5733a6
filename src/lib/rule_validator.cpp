#include <shacl/rule_validator.hpp>

#include <cctype>

namespace shacl {

  namespace {

    constexpr std::string_view placeholder = "$this";
    constexpr std::string_view default_message = "Rule constraint violated";

    bool
    is_name_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    // Case-insensitive keyword search starting at from, requiring word
    // boundaries on both sides.
    std::size_t
    find_keyword(std::string_view text, std::string_view kw,
                 std::size_t from = 0) {
      for (std::size_t i = from; i + kw.size() <= text.size(); ++i) {
        bool same = true;
        for (std::size_t j = 0; j < kw.size() && same; ++j) {
          same = std::toupper(static_cast<unsigned char>(text[i + j])) ==
                 std::toupper(static_cast<unsigned char>(kw[j]));
        }
        if (!same) continue;
        if (i > 0 && is_name_char(text[i - 1])) continue;
        auto after = i + kw.size();
        if (after < text.size() && is_name_char(text[after])) continue;
        return i;
      }
      return std::string_view::npos;
    }

    std::size_t
    skip_space(std::string_view text, std::size_t pos) {
      while (pos < text.size() &&
             std::isspace(static_cast<unsigned char>(text[pos])))
        ++pos;
      return pos;
    }

    // Replaces whole-name occurrences only; $thisNode is another variable.
    void
    replace_placeholder(std::string& text, const std::string& to) {
      std::size_t pos = 0;
      while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        auto after = pos + placeholder.size();
        if (after < text.size() && is_name_char(text[after])) {
          pos = after;
          continue;
        }
        text.replace(pos, placeholder.size(), to);
        pos += to.size();
      }
    }

    // When the projection starts with $this, turn it into ?this and bind it
    // at the top of the query group so the focus node appears in each row.
    void
    project_focus_node(std::string& query, const std::string& focus) {
      auto select = find_keyword(query, "SELECT");
      if (select == std::string_view::npos) return;
      auto pos = skip_space(query, select + 6);
      auto distinct = find_keyword(query, "DISTINCT", pos);
      if (distinct == pos) pos = skip_space(query, pos + 8);
      if (query.compare(pos, placeholder.size(), placeholder) != 0) return;
      auto after = pos + placeholder.size();
      if (after < query.size() && is_name_char(query[after])) return;

      // WHERE is optional; the group opens at the first brace either way.
      auto brace = query.find('{', after);
      if (brace == std::string::npos) return;

      query.insert(brace + 1, " BIND(" + focus + " AS ?this) .");
      query[pos] = '?';
    }

  } // namespace

  std::string
  bind_focus_node(std::string_view query_template, const term& focus_node) {
    std::string query(query_template);
    auto focus = focus_node.to_string();
    project_focus_node(query, focus);
    replace_placeholder(query, focus);
    return query;
  }

  std::vector<validation_result>
  validate_rules(const graph& g, const term& focus_node,
                 const std::vector<rule_constraint>& constraints,
                 const query_executor& executor, std::stop_token stop) {
    std::vector<validation_result> results;
    for (const auto& constraint : constraints) {
      auto query = bind_focus_node(constraint.query_template, focus_node);
      auto rows = executor.execute(g, query, stop);

      for (auto& row : rows) {
        validation_result r;
        r.focus_node = focus_node;
        r.source_shape = constraint.source_shape_id;
        r.severity = severity::violation;
        r.message = constraint.message ? *constraint.message
                                       : std::string(default_message);
        for (auto& [name, value] : row) {
          r.details.set(std::move(name), std::move(value));
        }
        results.push_back(std::move(r));
      }
    }
    return results;
  }

} // namespace shacl
