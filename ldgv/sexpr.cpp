#include "sexpr.hpp"
#include "parser.hpp"

#include <ostream>

namespace ldgv {

std::ostream& operator<<(std::ostream& out, const sexpr& self) {
  match(self,
        [&](long value) { out << value; },
        [&](symbol value) { out << value; },
        [&](quote value) { out << '\'' << value.name; },
        [&](const sexpr::list& values) {
          out << '(';
          bool first = true;
          for(const auto& value: values) {
            if(first) first = false;
            else out << ' ';
            out << value;
          }
          out << ')';
        });
  return out;
}


static const char* special = "!$%&*/:<=>?~_^@#-+.";

static bool delimiter(char c) {
  return std::isspace(static_cast<unsigned char>(c)) || c == '(' || c == ')' || c == ';';
}

// blanks: whitespace and comments
static parser::result<parser::unit> blank(parser::range in) {
  using namespace parser;
  static const auto space = pred(std::isspace);
  static const auto comment = single(';') >> skip(pred([](char c) { return c != '\n'; }));

  if(auto res = space(in)) return make_success(unit{}, *res.get());
  return comment(in);
}


static parser::any<sexpr> expression() {
  using namespace parser;

  const auto skipper = blank;

  const auto lparen = token(single('('), skipper);
  const auto rparen = token(single(')'), skipper);

  // atoms must be followed by a delimiter: "5x" is an error, not 5 then x
  const auto delimited = [](auto p) {
    return [p](range in) {
      auto res = p(in);
      if(res) {
        const range rest = *res.get();
        if(rest && !delimiter(rest.get())) {
          return decltype(res)(parser::error(rest));
        }
      }
      return res;
    };
  };

  const auto initial = pred(std::isalpha) | one_of(special);
  const auto subsequent = pred(std::isalnum) | one_of(special) | single('\'');

  const auto name = initial >>= [=](char first) {
    return kleene(subsequent) >>= [=](std::deque<char> nexts) {
      nexts.emplace_front(first);
      return pure(symbol(std::string(nexts.begin(), nexts.end())));
    };
  };

  const auto cast = [](auto value) { return sexpr(value); };

  const auto number = map(_long, cast);
  const auto sym = map(name, cast);
  const auto label = single('\'') >> map(name, [](symbol name) {
    return sexpr(quote{name});
  });

  const auto atom = delimited(longest(number, sym) | label);

  const auto list = [=](auto item) {
    const auto inner = kleene(item) |= [](std::deque<sexpr> items) {
      return sexpr(make_list(items.begin(), items.end()));
    };

    return lparen >> inner >>= drop(rparen);
  };

  const auto expr = parser::fix<sexpr>([=](auto self) {
    return token(atom, skipper) | list(self);
  });

  // trailing blanks and comments are part of the previous expression
  return expr >>= drop(skip(skipper));
}


std::vector<sexpr> read_all(const std::string& source) {
  using namespace parser;
  const auto program = skip(blank) >> kleene(expression()) >>= drop(eos);
  const auto items = run(program, source);
  return std::vector<sexpr>(items.begin(), items.end());
}


sexpr read_one(const std::string& source) {
  using namespace parser;
  return run(skip(blank) >> expression() >>= drop(eos), source);
}

} // namespace ldgv
