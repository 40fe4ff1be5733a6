#include "sparql_algebra.hpp"

#include <shacl/query_executor.hpp>
#include <shacl/vocabulary.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace shacl::sparql {

  namespace {

    // -----------------------------------------------------------------------
    // Tokens
    // -----------------------------------------------------------------------

    enum class token_kind {
      eof,
      iri_ref,    // <http://...>, value without brackets
      pname,      // prefix:local (value is the whole name)
      blank,      // _:label, value is the label
      var,        // ?x or $x, value is the name
      string,     // "..." or '...', value unescaped
      lang_tag,   // @en, value without '@'
      number,     // lexical form as written
      word,       // keyword, function name, true/false, 'a'
      lbrace,     // {
      rbrace,     // }
      lparen,     // (
      rparen,     // )
      dot,        // .
      semicolon,  // ;
      comma,      // ,
      star,       // *
      plus,       // +
      minus,      // -
      slash,      // /
      bang,       // !
      eq,         // =
      ne,         // !=
      lt,         // <
      le,         // <=
      gt,         // >
      ge,         // >=
      and_and,    // &&
      or_or,      // ||
      caret_caret // ^^
    };

    struct token {
      token_kind kind = token_kind::eof;
      std::string value;
    };

    bool
    is_name_start(char c) {
      return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    bool
    is_name_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
             c == '-';
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    std::string
    upper(std::string_view s) {
      std::string out(s);
      std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
      });
      return out;
    }

    // -----------------------------------------------------------------------
    // Lexer
    // -----------------------------------------------------------------------

    class lexer {
    public:
      explicit lexer(std::string_view source) : src_(source) {}

      token
      next() {
        skip_whitespace_and_comments();
        if (pos_ >= src_.size()) return {token_kind::eof, ""};

        char c = src_[pos_];

        if (c == '<') {
          if (auto iri = try_read_iri_ref()) return *iri;
          ++pos_;
          if (consume('=')) return {token_kind::le, "<="};
          return {token_kind::lt, "<"};
        }
        if (c == '?' || c == '$') return read_var();
        if (c == '"' || c == '\'') return read_string();
        if (c == '@') return read_lang_tag();
        if (is_digit(c) ||
            (c == '.' && pos_ + 1 < src_.size() && is_digit(src_[pos_ + 1])))
          return read_number();
        if (c == '_' && pos_ + 1 < src_.size() && src_[pos_ + 1] == ':')
          return read_blank();
        if (is_name_start(c) || c == ':') return read_name();

        ++pos_;
        switch (c) {
          case '{':
            return {token_kind::lbrace, "{"};
          case '}':
            return {token_kind::rbrace, "}"};
          case '(':
            return {token_kind::lparen, "("};
          case ')':
            return {token_kind::rparen, ")"};
          case '.':
            return {token_kind::dot, "."};
          case ';':
            return {token_kind::semicolon, ";"};
          case ',':
            return {token_kind::comma, ","};
          case '*':
            return {token_kind::star, "*"};
          case '+':
            return {token_kind::plus, "+"};
          case '-':
            return {token_kind::minus, "-"};
          case '/':
            return {token_kind::slash, "/"};
          case '=':
            return {token_kind::eq, "="};
          case '!':
            if (consume('=')) return {token_kind::ne, "!="};
            return {token_kind::bang, "!"};
          case '>':
            if (consume('=')) return {token_kind::ge, ">="};
            return {token_kind::gt, ">"};
          case '&':
            if (consume('&')) return {token_kind::and_and, "&&"};
            break;
          case '|':
            if (consume('|')) return {token_kind::or_or, "||"};
            break;
          case '^':
            if (consume('^')) return {token_kind::caret_caret, "^^"};
            break;
          default:
            break;
        }
        throw query_error(std::string("unexpected character '") + c +
                          "' at offset " + std::to_string(pos_ - 1));
      }

    private:
      std::string_view src_;
      std::size_t pos_ = 0;

      bool
      consume(char c) {
        if (pos_ < src_.size() && src_[pos_] == c) {
          ++pos_;
          return true;
        }
        return false;
      }

      void
      skip_whitespace_and_comments() {
        while (pos_ < src_.size()) {
          char c = src_[pos_];
          if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos_;
            continue;
          }
          if (c == '#') {
            while (pos_ < src_.size() && src_[pos_] != '\n')
              ++pos_;
            continue;
          }
          break;
        }
      }

      // An IRI reference has no whitespace or delimiter characters between
      // its brackets; anything else starting with '<' is an operator.
      std::optional<token>
      try_read_iri_ref() {
        std::size_t end = pos_ + 1;
        while (end < src_.size()) {
          char c = src_[end];
          if (c == '>') break;
          if (std::isspace(static_cast<unsigned char>(c)) || c == '<' ||
              c == '"' || c == '{' || c == '}' || c == '|' || c == '^' ||
              c == '`' || c == '\\')
            return std::nullopt;
          ++end;
        }
        if (end >= src_.size()) return std::nullopt;
        token t{token_kind::iri_ref,
                std::string(src_.substr(pos_ + 1, end - pos_ - 1))};
        pos_ = end + 1;
        return t;
      }

      token
      read_var() {
        ++pos_;
        std::string name;
        while (pos_ < src_.size() && is_name_char(src_[pos_]) &&
               src_[pos_] != '-')
          name += src_[pos_++];
        if (name.empty()) throw query_error("expected variable name");
        return {token_kind::var, name};
      }

      token
      read_string() {
        char quote = src_[pos_++];
        bool triple = pos_ + 1 < src_.size() && src_[pos_] == quote &&
                      src_[pos_ + 1] == quote;
        if (triple) pos_ += 2;

        std::string value;
        while (pos_ < src_.size()) {
          char c = src_[pos_];
          if (c == quote) {
            if (!triple) {
              ++pos_;
              return {token_kind::string, value};
            }
            if (pos_ + 2 < src_.size() + 0 && src_[pos_ + 1] == quote &&
                src_[pos_ + 2] == quote) {
              pos_ += 3;
              return {token_kind::string, value};
            }
          }
          if (c == '\\') {
            if (pos_ + 1 >= src_.size()) break;
            value += unescape(src_[pos_ + 1]);
            pos_ += 2;
            continue;
          }
          if (!triple && (c == '\n' || c == '\r'))
            throw query_error("line break in string literal");
          value += c;
          ++pos_;
        }
        throw query_error("unterminated string literal");
      }

      static char
      unescape(char c) {
        switch (c) {
          case 't':
            return '\t';
          case 'n':
            return '\n';
          case 'r':
            return '\r';
          case 'b':
            return '\b';
          case 'f':
            return '\f';
          case '"':
          case '\'':
          case '\\':
            return c;
          default:
            throw query_error(std::string("unsupported escape '\\") + c +
                              "'");
        }
      }

      token
      read_lang_tag() {
        ++pos_;
        std::string tag;
        while (pos_ < src_.size() &&
               (std::isalnum(static_cast<unsigned char>(src_[pos_])) ||
                src_[pos_] == '-'))
          tag += src_[pos_++];
        if (tag.empty()) throw query_error("expected language tag after '@'");
        return {token_kind::lang_tag, tag};
      }

      token
      read_number() {
        std::string lexical;
        while (pos_ < src_.size() && is_digit(src_[pos_]))
          lexical += src_[pos_++];
        if (pos_ + 1 < src_.size() && src_[pos_] == '.' &&
            is_digit(src_[pos_ + 1])) {
          lexical += src_[pos_++];
          while (pos_ < src_.size() && is_digit(src_[pos_]))
            lexical += src_[pos_++];
        }
        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
          std::size_t save = pos_;
          std::string exp(1, src_[pos_++]);
          if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-'))
            exp += src_[pos_++];
          if (pos_ < src_.size() && is_digit(src_[pos_])) {
            while (pos_ < src_.size() && is_digit(src_[pos_]))
              exp += src_[pos_++];
            lexical += exp;
          } else {
            pos_ = save;
          }
        }
        return {token_kind::number, lexical};
      }

      token
      read_blank() {
        pos_ += 2;
        std::string label;
        while (pos_ < src_.size() &&
               (is_name_char(src_[pos_]) || src_[pos_] == '.')) {
          label += src_[pos_++];
        }
        while (!label.empty() && label.back() == '.') {
          label.pop_back();
          --pos_;
        }
        if (label.empty()) throw query_error("expected blank node label");
        return {token_kind::blank, label};
      }

      // A bare word, or a prefixed name when a ':' follows the prefix.
      token
      read_name() {
        std::string name;
        while (pos_ < src_.size() &&
               (is_name_char(src_[pos_]) || src_[pos_] == '.')) {
          name += src_[pos_++];
        }
        if (pos_ < src_.size() && src_[pos_] == ':') {
          name += src_[pos_++];
          while (pos_ < src_.size() &&
                 (is_name_char(src_[pos_]) || src_[pos_] == '.' ||
                  src_[pos_] == ':'))
            name += src_[pos_++];
          // A trailing '.' ends the triple rather than the name.
          while (name.back() == '.') {
            name.pop_back();
            --pos_;
          }
          return {token_kind::pname, name};
        }
        while (!name.empty() && name.back() == '.') {
          name.pop_back();
          --pos_;
        }
        return {token_kind::word, name};
      }
    };

    // -----------------------------------------------------------------------
    // Parser
    // -----------------------------------------------------------------------

    class parser {
    public:
      explicit parser(std::string_view source) : lex_(source) {
        prefixes_ = {
            {"rdf", std::string(vocab::rdf::ns)},
            {"rdfs", "http://www.w3.org/2000/01/rdf-schema#"},
            {"xsd", std::string(vocab::xsd::ns)},
            {"owl", "http://www.w3.org/2002/07/owl#"},
            {"sh", std::string(vocab::sh::ns)},
        };
        advance();
      }

      select_query
      parse_query() {
        parse_prologue();

        select_query q;
        expect_word("SELECT");
        if (match_word("DISTINCT")) {
          q.distinct = true;
        } else {
          match_word("REDUCED");
        }

        if (match(token_kind::star)) {
          // projection stays empty
        } else {
          while (current_.kind == token_kind::var) {
            q.projection.push_back(current_.value);
            note_variable(current_.value);
            advance();
          }
          if (current_.kind == token_kind::lparen)
            error("projection expressions are not supported");
          if (q.projection.empty()) error("expected '*' or variables after SELECT");
        }

        match_word("WHERE");
        q.where = parse_group_body();

        if (match_word("LIMIT")) {
          if (current_.kind != token_kind::number ||
              current_.value.find_first_not_of("0123456789") !=
                  std::string::npos)
            error("expected integer after LIMIT");
          q.limit = std::stoull(current_.value);
          advance();
        }

        if (current_.kind != token_kind::eof)
          error("unexpected '" + current_.value + "' after query");

        q.mentioned_variables = std::move(variables_);
        return q;
      }

    private:
      lexer lex_;
      token current_;
      std::unordered_map<std::string, std::string> prefixes_;
      std::vector<std::string> variables_;

      void
      advance() {
        current_ = lex_.next();
      }

      [[noreturn]] void
      error(const std::string& msg) {
        throw query_error("query parse error: " + msg);
      }

      void
      expect(token_kind k, const std::string& what) {
        if (current_.kind != k) {
          auto got = current_.kind == token_kind::eof
                         ? std::string("end of input")
                         : "'" + current_.value + "'";
          error("expected " + what + ", got " + got);
        }
        advance();
      }

      bool
      match(token_kind k) {
        if (current_.kind == k) {
          advance();
          return true;
        }
        return false;
      }

      bool
      at_word(std::string_view kw) const {
        return current_.kind == token_kind::word && upper(current_.value) == kw;
      }

      bool
      match_word(std::string_view kw) {
        if (!at_word(kw)) return false;
        advance();
        return true;
      }

      void
      expect_word(std::string_view kw) {
        if (!match_word(kw)) error("expected " + std::string(kw));
      }

      void
      note_variable(const std::string& name) {
        if (std::find(variables_.begin(), variables_.end(), name) ==
            variables_.end())
          variables_.push_back(name);
      }

      // PREFIX p: <iri> | BASE <iri>
      void
      parse_prologue() {
        while (true) {
          if (match_word("PREFIX")) {
            if (current_.kind != token_kind::pname ||
                current_.value.back() != ':' ||
                std::count(current_.value.begin(), current_.value.end(),
                           ':') != 1)
              error("expected prefix name after PREFIX");
            auto prefix = current_.value.substr(0, current_.value.size() - 1);
            advance();
            if (current_.kind != token_kind::iri_ref)
              error("expected IRI for prefix '" + prefix + "'");
            prefixes_[prefix] = current_.value;
            advance();
            continue;
          }
          if (match_word("BASE")) {
            expect(token_kind::iri_ref, "IRI after BASE");
            continue;
          }
          return;
        }
      }

      std::string
      expand(const std::string& pname) {
        auto colon = pname.find(':');
        auto prefix = pname.substr(0, colon);
        auto it = prefixes_.find(prefix);
        if (it == prefixes_.end()) error("undeclared prefix '" + prefix + "'");
        return it->second + pname.substr(colon + 1);
      }

      // -- Group patterns -----------------------------------------------------

      group_ptr
      parse_group() {
        return std::make_shared<const group>(parse_group_body());
      }

      group
      parse_group_body() {
        expect(token_kind::lbrace, "'{'");
        group g;
        while (current_.kind != token_kind::rbrace) {
          if (current_.kind == token_kind::eof) error("unterminated group");
          if (match(token_kind::dot)) continue;

          if (match_word("FILTER")) {
            g.elements.emplace_back(filter_element{parse_constraint()});
          } else if (match_word("BIND")) {
            expect(token_kind::lparen, "'(' after BIND");
            auto value = parse_expression();
            expect_word("AS");
            if (current_.kind != token_kind::var)
              error("expected variable after AS");
            auto target = current_.value;
            note_variable(target);
            advance();
            expect(token_kind::rparen, "')'");
            g.elements.emplace_back(bind_element{value, target});
          } else if (match_word("OPTIONAL")) {
            g.elements.emplace_back(optional_element{parse_group()});
          } else if (current_.kind == token_kind::lbrace) {
            union_element u;
            u.branches.push_back(parse_group());
            while (match_word("UNION")) {
              u.branches.push_back(parse_group());
            }
            g.elements.emplace_back(std::move(u));
          } else if (at_word("MINUS") || at_word("GRAPH") ||
                     at_word("SERVICE") || at_word("VALUES") ||
                     at_word("SELECT")) {
            error(current_.value + " is not supported");
          } else {
            parse_triples(g);
          }
        }
        advance();
        return g;
      }

      // subject verb objects (';' verb objects)*
      void
      parse_triples(group& g) {
        auto subject = parse_term_or_var("subject");
        while (true) {
          auto predicate = parse_verb();
          while (true) {
            auto object = parse_term_or_var("object");
            g.elements.emplace_back(triple_pattern{subject, predicate, object});
            if (!match(token_kind::comma)) break;
          }
          if (!match(token_kind::semicolon)) break;
          // Allow a dangling ';' before '.' or '}'.
          if (current_.kind == token_kind::dot ||
              current_.kind == token_kind::rbrace)
            break;
        }
      }

      pattern_term
      parse_verb() {
        if (current_.kind == token_kind::word && current_.value == "a") {
          advance();
          return term::make_iri(std::string(vocab::rdf::type));
        }
        return parse_term_or_var("predicate");
      }

      pattern_term
      parse_term_or_var(const std::string& what) {
        if (current_.kind == token_kind::var) {
          auto name = current_.value;
          note_variable(name);
          advance();
          return variable{name};
        }
        if (current_.kind == token_kind::blank) {
          auto label = current_.value;
          advance();
          return term::make_blank(label);
        }
        auto t = parse_constant_term();
        if (!t) {
          auto got = current_.kind == token_kind::eof
                         ? std::string("end of input")
                         : "'" + current_.value + "'";
          error("expected " + what + ", got " + got);
        }
        return *t;
      }

      // IRI, prefixed name, literal, number or boolean.
      std::optional<term>
      parse_constant_term() {
        switch (current_.kind) {
          case token_kind::iri_ref: {
            auto t = term::make_iri(current_.value);
            advance();
            return t;
          }
          case token_kind::pname: {
            auto t = term::make_iri(expand(current_.value));
            advance();
            return t;
          }
          case token_kind::string:
            return parse_literal();
          case token_kind::number:
          case token_kind::minus:
          case token_kind::plus:
            return parse_number();
          case token_kind::word:
            if (current_.value == "true" || current_.value == "false") {
              auto t = term::make_literal(current_.value,
                                          std::string(vocab::xsd::boolean));
              advance();
              return t;
            }
            return std::nullopt;
          default:
            return std::nullopt;
        }
      }

      term
      parse_literal() {
        auto lexical = current_.value;
        advance();
        if (current_.kind == token_kind::lang_tag) {
          auto tag = current_.value;
          advance();
          return term::make_lang_literal(lexical, tag);
        }
        if (match(token_kind::caret_caret)) {
          if (current_.kind == token_kind::iri_ref) {
            auto dt = current_.value;
            advance();
            return term::make_literal(lexical, dt);
          }
          if (current_.kind == token_kind::pname) {
            auto dt = expand(current_.value);
            advance();
            return term::make_literal(lexical, dt);
          }
          error("expected datatype IRI after '^^'");
        }
        return term::make_literal(lexical);
      }

      term
      parse_number() {
        std::string sign;
        if (current_.kind == token_kind::minus ||
            current_.kind == token_kind::plus) {
          sign = current_.value;
          advance();
          if (current_.kind != token_kind::number)
            error("expected number after '" + sign + "'");
        }
        auto lexical = sign + current_.value;
        advance();
        if (lexical.find_first_of("eE") != std::string::npos)
          return term::make_literal(lexical, std::string(vocab::xsd::double_));
        if (lexical.find('.') != std::string::npos)
          return term::make_literal(lexical,
                                    std::string(vocab::xsd::decimal));
        return term::make_literal(lexical, std::string(vocab::xsd::integer));
      }

      // -- Expressions --------------------------------------------------------

      static expression_ptr
      make(expr_kind kind, std::vector<expression_ptr> args = {}) {
        auto e = std::make_shared<expression>();
        e->kind = kind;
        e->args = std::move(args);
        return e;
      }

      // FILTER '(' expr ')' | FILTER builtin(...) | FILTER [NOT] EXISTS {}
      expression_ptr
      parse_constraint() {
        if (match(token_kind::lparen)) {
          auto e = parse_expression();
          expect(token_kind::rparen, "')'");
          return e;
        }
        return parse_primary();
      }

      expression_ptr
      parse_expression() {
        return parse_or();
      }

      expression_ptr
      parse_or() {
        auto left = parse_and();
        while (match(token_kind::or_or)) {
          left = make(expr_kind::logical_or, {left, parse_and()});
        }
        return left;
      }

      expression_ptr
      parse_and() {
        auto left = parse_relational();
        while (match(token_kind::and_and)) {
          left = make(expr_kind::logical_and, {left, parse_relational()});
        }
        return left;
      }

      expression_ptr
      parse_relational() {
        auto left = parse_additive();
        expr_kind kind;
        switch (current_.kind) {
          case token_kind::eq:
            kind = expr_kind::equal;
            break;
          case token_kind::ne:
            kind = expr_kind::not_equal;
            break;
          case token_kind::lt:
            kind = expr_kind::less;
            break;
          case token_kind::le:
            kind = expr_kind::less_equal;
            break;
          case token_kind::gt:
            kind = expr_kind::greater;
            break;
          case token_kind::ge:
            kind = expr_kind::greater_equal;
            break;
          default:
            return left;
        }
        advance();
        return make(kind, {left, parse_additive()});
      }

      expression_ptr
      parse_additive() {
        auto left = parse_multiplicative();
        while (true) {
          if (match(token_kind::plus)) {
            left = make(expr_kind::add, {left, parse_multiplicative()});
          } else if (match(token_kind::minus)) {
            left = make(expr_kind::subtract, {left, parse_multiplicative()});
          } else {
            return left;
          }
        }
      }

      expression_ptr
      parse_multiplicative() {
        auto left = parse_unary();
        while (true) {
          if (match(token_kind::star)) {
            left = make(expr_kind::multiply, {left, parse_unary()});
          } else if (match(token_kind::slash)) {
            left = make(expr_kind::divide, {left, parse_unary()});
          } else {
            return left;
          }
        }
      }

      expression_ptr
      parse_unary() {
        if (match(token_kind::bang))
          return make(expr_kind::logical_not, {parse_unary()});
        if (match(token_kind::minus))
          return make(expr_kind::negate, {parse_unary()});
        if (match(token_kind::plus)) return parse_unary();
        return parse_primary();
      }

      expression_ptr
      parse_primary() {
        if (match(token_kind::lparen)) {
          auto e = parse_expression();
          expect(token_kind::rparen, "')'");
          return e;
        }

        if (current_.kind == token_kind::var) {
          auto e = std::make_shared<expression>();
          e->kind = expr_kind::var;
          e->name = current_.value;
          note_variable(current_.value);
          advance();
          return e;
        }

        if (match_word("EXISTS")) {
          auto e = std::make_shared<expression>();
          e->kind = expr_kind::exists;
          e->pattern = parse_group();
          return e;
        }

        if (at_word("NOT")) {
          advance();
          expect_word("EXISTS");
          auto e = std::make_shared<expression>();
          e->kind = expr_kind::not_exists;
          e->pattern = parse_group();
          return e;
        }

        if (current_.kind == token_kind::word && current_.value != "true" &&
            current_.value != "false") {
          auto e = std::make_shared<expression>();
          e->kind = expr_kind::call;
          e->name = upper(current_.value);
          advance();
          expect(token_kind::lparen, "'(' after " + e->name);
          if (!match(token_kind::rparen)) {
            while (true) {
              e->args.push_back(parse_expression());
              if (match(token_kind::rparen)) break;
              expect(token_kind::comma, "',' or ')'");
            }
          }
          check_call(*e);
          return e;
        }

        // Blank node labels are constants here, as in triple patterns.
        if (current_.kind == token_kind::blank) {
          auto e = std::make_shared<expression>();
          e->kind = expr_kind::constant;
          e->value = term::make_blank(current_.value);
          advance();
          return e;
        }

        auto t = parse_constant_term();
        if (!t) {
          auto got = current_.kind == token_kind::eof
                         ? std::string("end of input")
                         : "'" + current_.value + "'";
          error("expected expression, got " + got);
        }
        auto e = std::make_shared<expression>();
        e->kind = expr_kind::constant;
        e->value = *t;
        return e;
      }

      void
      check_call(const expression& e) {
        static const std::unordered_map<std::string, std::pair<int, int>>
            arity = {
                {"BOUND", {1, 1}},    {"ISIRI", {1, 1}},
                {"ISURI", {1, 1}},    {"ISBLANK", {1, 1}},
                {"ISLITERAL", {1, 1}}, {"ISNUMERIC", {1, 1}},
                {"STR", {1, 1}},      {"LANG", {1, 1}},
                {"DATATYPE", {1, 1}}, {"STRLEN", {1, 1}},
                {"REGEX", {2, 3}},    {"SAMETERM", {2, 2}},
            };
        auto it = arity.find(e.name);
        if (it == arity.end()) error("unsupported function " + e.name);
        auto n = static_cast<int>(e.args.size());
        if (n < it->second.first || n > it->second.second)
          error("wrong number of arguments to " + e.name);
        if (e.name == "BOUND" && e.args[0]->kind != expr_kind::var)
          error("BOUND expects a variable");
      }
    };

  } // namespace

  select_query
  parse_select(std::string_view text) {
    parser p(text);
    return p.parse_query();
  }

} // namespace shacl::sparql
