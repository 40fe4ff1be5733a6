#include <shacl/basic_query_executor.hpp>

#include <shacl/compiled_pattern.hpp>
#include <shacl/decimal.hpp>
#include <shacl/vocabulary.hpp>

#include "sparql_algebra.hpp"
#include "validator_support.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <limits>
#include <map>
#include <set>

namespace shacl {

  namespace {

    using namespace sparql;

    using solution = std::map<std::string, term>;

    // -----------------------------------------------------------------------
    // Literal helpers
    // -----------------------------------------------------------------------

    const std::set<std::string>&
    integer_datatypes() {
      static const std::set<std::string> types = [] {
        std::set<std::string> s;
        for (auto local :
             {"integer", "int", "long", "short", "byte", "nonNegativeInteger",
              "positiveInteger", "negativeInteger", "nonPositiveInteger",
              "unsignedInt", "unsignedLong", "unsignedShort", "unsignedByte"}) {
          s.insert(std::string(vocab::xsd::ns) + local);
        }
        return s;
      }();
      return types;
    }

    bool
    is_integer_type(const std::string& dt) {
      return integer_datatypes().count(dt) > 0;
    }

    bool
    is_floating_type(const std::string& dt) {
      return dt == vocab::xsd::double_ || dt == vocab::xsd::float_;
    }

    bool
    is_numeric_type(const std::string& dt) {
      return is_integer_type(dt) || is_floating_type(dt) ||
             dt == vocab::xsd::decimal;
    }

    bool
    is_numeric(const term& t) {
      return t.is_literal() && is_numeric_type(t.get<literal>().datatype);
    }

    bool
    is_string_like(const term& t) {
      if (!t.is_literal()) return false;
      const auto& dt = t.get<literal>().datatype;
      return dt == vocab::xsd::string || dt == vocab::rdf::lang_string;
    }

    term
    make_boolean(bool b) {
      return term::make_literal(b ? "true" : "false",
                                std::string(vocab::xsd::boolean));
    }

    term
    make_integer(std::int64_t v) {
      return term::make_literal(std::to_string(v),
                                std::string(vocab::xsd::integer));
    }

    std::optional<std::int64_t>
    to_int64(const literal& l) {
      std::string_view text = l.lexical;
      if (!text.empty() && text.front() == '+') text.remove_prefix(1);
      std::int64_t v = 0;
      auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
      if (ec != std::errc() || ptr != text.data() + text.size())
        return std::nullopt;
      return v;
    }

    std::optional<double>
    to_double(const literal& l) {
      auto d = decimal::parse(l.lexical);
      if (!d) return std::nullopt;
      switch (d->kind()) {
        case decimal::kind_type::positive_infinity:
          return std::numeric_limits<double>::infinity();
        case decimal::kind_type::negative_infinity:
          return -std::numeric_limits<double>::infinity();
        case decimal::kind_type::not_a_number:
          return std::numeric_limits<double>::quiet_NaN();
        case decimal::kind_type::finite:
          break;
      }
      try {
        return std::stod(d->to_string());
      } catch (const std::out_of_range&) {
        return std::nullopt;
      }
    }

    // Effective boolean value; std::nullopt is a type error.
    std::optional<bool>
    effective_boolean(const std::optional<term>& value) {
      if (!value || !value->is_literal()) return std::nullopt;
      const auto& l = value->get<literal>();
      if (l.datatype == vocab::xsd::boolean) {
        if (l.lexical == "true" || l.lexical == "1") return true;
        if (l.lexical == "false" || l.lexical == "0") return false;
        return std::nullopt;
      }
      if (is_numeric_type(l.datatype)) {
        auto d = decimal::parse(l.lexical);
        if (!d) return false;
        return !d->is_zero() && !d->is_nan();
      }
      if (is_string_like(*value)) return !l.lexical.empty();
      return std::nullopt;
    }

    // -----------------------------------------------------------------------
    // Evaluator
    // -----------------------------------------------------------------------

    class evaluator {
    public:
      evaluator(const graph& g, std::stop_token stop)
          : g_(g), stop_(std::move(stop)) {}

      std::vector<solution>
      eval_group(const group& grp, std::vector<solution> input) {
        std::vector<expression_ptr> filters;
        auto current = std::move(input);

        for (const auto& element : grp.elements) {
          if (current.empty()) break;

          if (auto tp = std::get_if<triple_pattern>(&element)) {
            current = join(current, *tp);
          } else if (auto f = std::get_if<filter_element>(&element)) {
            filters.push_back(f->condition);
          } else if (auto b = std::get_if<bind_element>(&element)) {
            for (auto& s : current) {
              if (s.count(b->target))
                throw query_error("BIND target ?" + b->target +
                                  " is already bound");
              if (auto v = eval(*b->value, s)) s.emplace(b->target, *v);
            }
          } else if (auto o = std::get_if<optional_element>(&element)) {
            std::vector<solution> next;
            for (auto& s : current) {
              auto extended = eval_group(*o->body, {s});
              if (extended.empty()) {
                next.push_back(std::move(s));
              } else {
                std::move(extended.begin(), extended.end(),
                          std::back_inserter(next));
              }
            }
            current = std::move(next);
          } else if (auto u = std::get_if<union_element>(&element)) {
            std::vector<solution> next;
            for (const auto& branch : u->branches) {
              auto part = eval_group(*branch, current);
              std::move(part.begin(), part.end(), std::back_inserter(next));
            }
            current = std::move(next);
          }
        }

        if (filters.empty()) return current;

        std::vector<solution> kept;
        for (auto& s : current) {
          bool pass = std::all_of(
              filters.begin(), filters.end(), [&](const expression_ptr& f) {
                return effective_boolean(eval(*f, s)).value_or(false);
              });
          if (pass) kept.push_back(std::move(s));
        }
        return kept;
      }

    private:
      const graph& g_;
      std::stop_token stop_;
      std::map<std::pair<std::string, std::string>, compiled_pattern> regex_cache_;

      void
      check_stop() const {
        if (stop_.stop_requested())
          throw query_error("query evaluation cancelled");
      }

      static std::optional<term>
      resolve(const pattern_term& pt, const solution& s) {
        if (auto t = std::get_if<term>(&pt)) return *t;
        auto it = s.find(std::get<variable>(pt).name);
        if (it == s.end()) return std::nullopt;
        return it->second;
      }

      // Binds pt to value in s; false when pt is already bound differently.
      static bool
      unify(const pattern_term& pt, const term& value, solution& s) {
        if (auto t = std::get_if<term>(&pt)) return *t == value;
        const auto& name = std::get<variable>(pt).name;
        auto [it, inserted] = s.emplace(name, value);
        return inserted || it->second == value;
      }

      std::vector<solution>
      join(const std::vector<solution>& input, const triple_pattern& tp) {
        std::vector<solution> out;
        for (const auto& s : input) {
          check_stop();
          auto subject = resolve(tp.subject, s);
          auto predicate = resolve(tp.predicate, s);
          auto object = resolve(tp.object, s);
          for (const auto& t : g_.match(subject, predicate, object)) {
            solution extended = s;
            if (unify(tp.subject, t.subject, extended) &&
                unify(tp.predicate, t.predicate, extended) &&
                unify(tp.object, t.object, extended)) {
              out.push_back(std::move(extended));
            }
          }
        }
        return out;
      }

      // -- Expressions --------------------------------------------------------

      std::optional<term>
      eval(const expression& e, const solution& s) {
        switch (e.kind) {
          case expr_kind::constant:
            return e.value;
          case expr_kind::var: {
            auto it = s.find(e.name);
            if (it == s.end()) return std::nullopt;
            return it->second;
          }
          case expr_kind::logical_or: {
            auto l = effective_boolean(eval(*e.args[0], s));
            auto r = effective_boolean(eval(*e.args[1], s));
            if ((l && *l) || (r && *r)) return make_boolean(true);
            if (l && r) return make_boolean(false);
            return std::nullopt;
          }
          case expr_kind::logical_and: {
            auto l = effective_boolean(eval(*e.args[0], s));
            auto r = effective_boolean(eval(*e.args[1], s));
            if ((l && !*l) || (r && !*r)) return make_boolean(false);
            if (l && r) return make_boolean(true);
            return std::nullopt;
          }
          case expr_kind::logical_not: {
            auto v = effective_boolean(eval(*e.args[0], s));
            if (!v) return std::nullopt;
            return make_boolean(!*v);
          }
          case expr_kind::equal:
          case expr_kind::not_equal:
          case expr_kind::less:
          case expr_kind::less_equal:
          case expr_kind::greater:
          case expr_kind::greater_equal:
            return compare(e.kind, eval(*e.args[0], s), eval(*e.args[1], s));
          case expr_kind::add:
          case expr_kind::subtract:
          case expr_kind::multiply:
          case expr_kind::divide:
            return arithmetic(e.kind, eval(*e.args[0], s),
                              eval(*e.args[1], s));
          case expr_kind::negate:
            return negate(eval(*e.args[0], s));
          case expr_kind::call:
            return call(e, s);
          case expr_kind::exists:
          case expr_kind::not_exists: {
            check_stop();
            bool found = !eval_group(*e.pattern, {s}).empty();
            return make_boolean(e.kind == expr_kind::exists ? found : !found);
          }
        }
        return std::nullopt;
      }

      static std::optional<term>
      compare(expr_kind op, const std::optional<term>& a,
              const std::optional<term>& b) {
        if (!a || !b) return std::nullopt;

        std::partial_ordering order = std::partial_ordering::unordered;
        bool comparable = false;

        if (is_numeric(*a) && is_numeric(*b)) {
          auto x = decimal::parse(a->get<literal>().lexical);
          auto y = decimal::parse(b->get<literal>().lexical);
          if (!x || !y) return std::nullopt;
          order = *x <=> *y;
          comparable = true;
        } else if (a->is_literal() && b->is_literal()) {
          const auto& x = a->get<literal>();
          const auto& y = b->get<literal>();
          bool same_kind =
              x.datatype == y.datatype && x.language == y.language &&
              (x.datatype == vocab::xsd::string ||
               x.datatype == vocab::rdf::lang_string ||
               x.datatype == vocab::xsd::boolean ||
               x.datatype == vocab::xsd::date_time);
          if (same_kind) {
            order = x.lexical <=> y.lexical;
            comparable = true;
          }
        }

        if (op == expr_kind::equal || op == expr_kind::not_equal) {
          bool equal = comparable ? order == std::partial_ordering::equivalent
                                  : *a == *b;
          return make_boolean(op == expr_kind::equal ? equal : !equal);
        }

        if (!comparable) return std::nullopt;
        switch (op) {
          case expr_kind::less:
            return make_boolean(order == std::partial_ordering::less);
          case expr_kind::less_equal:
            return make_boolean(order == std::partial_ordering::less ||
                                order == std::partial_ordering::equivalent);
          case expr_kind::greater:
            return make_boolean(order == std::partial_ordering::greater);
          case expr_kind::greater_equal:
            return make_boolean(order == std::partial_ordering::greater ||
                                order == std::partial_ordering::equivalent);
          default:
            return std::nullopt;
        }
      }

      // Integer result of op, or nullopt when it would overflow int64.
      static std::optional<std::int64_t>
      checked_integer_op(expr_kind op, std::int64_t l, std::int64_t r) {
        using limits = std::numeric_limits<std::int64_t>;
        switch (op) {
          case expr_kind::add:
            if (r > 0 ? l > limits::max() - r : l < limits::min() - r)
              return std::nullopt;
            return l + r;
          case expr_kind::subtract:
            if (r < 0 ? l > limits::max() + r : l < limits::min() + r)
              return std::nullopt;
            return l - r;
          default:
            if (l == 0 || r == 0) return std::int64_t{0};
            if ((l == -1 && r == limits::min()) ||
                (r == -1 && l == limits::min()))
              return std::nullopt;
            if (l > 0 ? (r > 0 ? l > limits::max() / r : r < limits::min() / l)
                      : (r > 0 ? l < limits::min() / r
                               : r < limits::max() / l))
              return std::nullopt;
            return l * r;
        }
      }

      static std::optional<term>
      arithmetic(expr_kind op, const std::optional<term>& a,
                 const std::optional<term>& b) {
        if (!a || !b || !is_numeric(*a) || !is_numeric(*b))
          return std::nullopt;
        const auto& x = a->get<literal>();
        const auto& y = b->get<literal>();

        if (op != expr_kind::divide && is_integer_type(x.datatype) &&
            is_integer_type(y.datatype)) {
          auto l = to_int64(x);
          auto r = to_int64(y);
          if (l && r) {
            if (auto out = checked_integer_op(op, *l, *r))
              return make_integer(*out);
          }
        }

        auto l = to_double(x);
        auto r = to_double(y);
        if (!l || !r) return std::nullopt;
        bool floating =
            is_floating_type(x.datatype) || is_floating_type(y.datatype);
        double out = 0;
        switch (op) {
          case expr_kind::add:
            out = *l + *r;
            break;
          case expr_kind::subtract:
            out = *l - *r;
            break;
          case expr_kind::multiply:
            out = *l * *r;
            break;
          default:
            if (*r == 0 && !floating) return std::nullopt;
            out = *l / *r;
            break;
        }
        return term::make_literal(fmt::format("{}", out),
                                  std::string(floating ? vocab::xsd::double_
                                                       : vocab::xsd::decimal));
      }

      static std::optional<term>
      negate(const std::optional<term>& a) {
        if (!a || !is_numeric(*a)) return std::nullopt;
        const auto& x = a->get<literal>();
        if (is_integer_type(x.datatype)) {
          auto v = to_int64(x);
          if (v && *v != std::numeric_limits<std::int64_t>::min())
            return make_integer(-*v);
        }
        auto v = to_double(x);
        if (!v) return std::nullopt;
        return term::make_literal(fmt::format("{}", -*v),
                                  std::string(is_floating_type(x.datatype)
                                                  ? vocab::xsd::double_
                                                  : vocab::xsd::decimal));
      }

      std::optional<term>
      call(const expression& e, const solution& s) {
        const auto& f = e.name;

        if (f == "BOUND") return make_boolean(s.count(e.args[0]->name) > 0);

        auto a = eval(*e.args[0], s);
        if (!a) return std::nullopt;

        if (f == "ISIRI" || f == "ISURI") return make_boolean(a->is_iri());
        if (f == "ISBLANK") return make_boolean(a->is_blank());
        if (f == "ISLITERAL") return make_boolean(a->is_literal());
        if (f == "ISNUMERIC")
          return make_boolean(is_numeric(*a) &&
                              decimal::parse(a->get<literal>().lexical));
        if (f == "SAMETERM") {
          auto b = eval(*e.args[1], s);
          if (!b) return std::nullopt;
          return make_boolean(*a == *b);
        }
        if (f == "STR") {
          if (a->is_iri()) return term::make_literal(a->get<iri>().value);
          if (a->is_literal()) return term::make_literal(a->get<literal>().lexical);
          return std::nullopt;
        }
        if (f == "LANG") {
          if (!a->is_literal()) return std::nullopt;
          return term::make_literal(a->get<literal>().language.value_or(""));
        }
        if (f == "DATATYPE") {
          if (!a->is_literal()) return std::nullopt;
          return term::make_iri(a->get<literal>().datatype);
        }
        if (f == "STRLEN") {
          if (!is_string_like(*a)) return std::nullopt;
          return make_integer(validators::detail::as_count(
              validators::detail::utf8_length(a->get<literal>().lexical)));
        }
        if (f == "REGEX") return regex(e, *a, s);

        throw query_error("unsupported function " + f);
      }

      std::optional<term>
      regex(const expression& e, const term& text, const solution& s) {
        if (!is_string_like(text)) return std::nullopt;
        auto pattern = eval(*e.args[1], s);
        if (!pattern || !is_string_like(*pattern)) return std::nullopt;
        std::string flags;
        if (e.args.size() == 3) {
          auto f = eval(*e.args[2], s);
          if (!f || !is_string_like(*f)) return std::nullopt;
          flags = f->get<literal>().lexical;
        }

        auto key = std::make_pair(pattern->get<literal>().lexical, flags);
        auto it = regex_cache_.find(key);
        if (it == regex_cache_.end()) {
          try {
            it = regex_cache_.emplace(key, compiled_pattern(key.first, key.second))
                     .first;
          } catch (const std::invalid_argument& ex) {
            throw query_error(std::string("REGEX: ") + ex.what());
          }
        }
        return make_boolean(it->second.search(text.get<literal>().lexical));
      }
    };

  } // namespace

  std::vector<binding_row>
  basic_query_executor::execute(const graph& g, std::string_view query,
                                std::stop_token stop) const {
    auto q = sparql::parse_select(query);
    const auto& projection =
        q.projection.empty() ? q.mentioned_variables : q.projection;

    evaluator ev(g, stop);
    auto solutions = ev.eval_group(q.where, {solution{}});

    std::vector<binding_row> rows;
    for (const auto& s : solutions) {
      if (q.limit && rows.size() >= *q.limit) break;

      binding_row row;
      for (const auto& name : projection) {
        auto it = s.find(name);
        if (it != s.end()) row.emplace_back(name, it->second);
      }
      if (q.distinct &&
          std::find(rows.begin(), rows.end(), row) != rows.end())
        continue;
      rows.push_back(std::move(row));
    }

    spdlog::trace("query returned {} row(s) from {} solution(s)", rows.size(),
                  solutions.size());
    return rows;
  }

} // namespace shacl
