#ifndef LDGV_PARSER_HPP
#define LDGV_PARSER_HPP

#include <deque>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include <cctype>
#include <climits>
#include <cstring>

#include "error.hpp"

namespace ldgv {
namespace parser {

struct unit { };

// character range
struct range {
  const char* first;
  const char* last;

  explicit operator bool() const { return first != last; }

  std::size_t size() const { return last - first; }

  char get() const { return *first; }

  range next() const { return {first + 1, last}; }
};


static void peek(range self, std::ostream& out, std::size_t count=24) {
  for(std::size_t i = 0; self && (i < count); ++i, self = self.next()) {
    if(self.get() == '\n') break;
    out << self.get();
  }
}


// successful parse
template<class T>
struct success: range {
  using value_type = T;
  T value;
  success(T value, range rest): range(rest), value(std::move(value)) {}
};


template<class T>
static success<T> make_success(T value, range rest) {
  return {std::move(value), rest};
}

// parse error: where it happened
struct error: range {
  error(range at): range(at) {}
};


// parse result: either a success or an error
template<class T>
class result {
  std::unique_ptr<success<T>> ok;
  parser::error at;
public:
  using value_type = T;

  result(success<T> value):
    ok(std::make_unique<success<T>>(std::move(value))),
    at(*ok) { }

  result(parser::error at): at(at) { }

  explicit operator bool() const { return bool(ok); }

  success<T>* get() const { return ok.get(); }

  const parser::error& failure() const { return at; }
};


// parser value type
template<class Parser>
using value = typename std::result_of<Parser(range)>::type::value_type;


// type-erased parser
template<class T>
using any = std::function<result<T>(range in)>;

////////////////////////////////////////////////////////////////////////////////
// combinators

// monad unit
template<class T>
static auto pure(T value) {
  return [value = std::move(value)](range in) -> result<T> {
    return make_success(value, in);
  };
}

// functor map
template<class Parser, class Func, class=value<Parser>>
static auto map(Parser parser, Func func) {
  return [parser = std::move(parser), func = std::move(func)](range in) {
    using value_type = typename std::result_of<Func(value<Parser>)>::type;
    auto res = parser(in);
    if(!res) return result<value_type>(res.failure());
    return result<value_type>(make_success(func(std::move(res.get()->value)),
                                           *res.get()));
  };
}

template<class Parser, class Func, class=value<Parser>>
static auto operator|=(Parser parser, Func func) {
  return map(std::move(parser), std::move(func));
}


// monad bind
template<class Parser, class Func, class=value<Parser>>
static auto bind(Parser parser, Func func) {
  return [parser = std::move(parser), func = std::move(func)](range in) {
    using parser_type = typename std::result_of<Func(value<Parser>)>::type;
    using result_type = result<value<parser_type>>;
    auto res = parser(in);
    if(!res) return result_type(res.failure());
    const range rest = *res.get();
    return result_type(func(std::move(res.get()->value))(rest));
  };
}

template<class Parser, class Func, class=value<Parser>>
static auto operator>>=(Parser parser, Func func) {
  return bind(std::move(parser), std::move(func));
}

// sequence parser
template<class LHS, class RHS, class=value<LHS>, class=value<RHS>>
static auto operator>>(LHS lhs, RHS rhs) {
  return std::move(lhs) >>= [rhs = std::move(rhs)](auto&&) { return rhs; };
}

// guarded continuation
template<class Pred>
static auto guard(Pred pred) {
  return [pred = std::move(pred)](auto value) {
    using value_type = decltype(value);

    return [pred, value = std::move(value)](range in) -> result<value_type> {
      if(pred(value)) {
        return make_success(value, in);
      }
      return error(in);
    };
  };
}

// drop continuation
template<class Parser>
static auto drop(Parser parser) {
  return [parser = std::move(parser)](auto value) {
    return parser >> pure(std::move(value));
  };
}

// kleene star parser (zero-or-more). note: always succeeds
template<class Parser>
static auto kleene(Parser parser) {
  return [parser = std::move(parser)](range in) -> result<std::deque<value<Parser>>> {
    std::deque<value<Parser>> values;
    while(auto res = parser(in)) {
      values.emplace_back(std::move(res.get()->value));
      in = *res.get();
    }

    return make_success(std::move(values), in);
  };
}

// coproduct parser (alternative). note: rhs is only called if lhs fails
template<class LHS, class RHS>
static auto coproduct(LHS lhs, RHS rhs) {
  return [lhs = std::move(lhs), rhs = std::move(rhs)](range in) {
    if(auto res = lhs(in)) {
      return res;
    }
    return rhs(in);
  };
}

template<class LHS, class RHS, class=value<LHS>, class=value<RHS>>
static auto operator|(LHS lhs, RHS rhs) {
  return coproduct(std::move(lhs), std::move(rhs));
}


// skip parser: parse zero-or-more without collecting
template<class Parser>
static auto skip(Parser parser) {
  return [parser = std::move(parser)](range in) -> result<unit> {
    while(auto res = parser(in)) {
      in = *res.get();
    }
    return make_success(unit{}, in);
  };
}

// tokenizer: skip before parsing
template<class Parser, class Skipper>
static auto token(Parser parser, Skipper skipper) {
  return skip(std::move(skipper)) >> std::move(parser);
}

// longest parse: runs both parsers and keep the longest match. note: lhs result
// is returned in case of a draw.
template<class LHS, class RHS>
static auto longest(LHS lhs, RHS rhs) {
  return [lhs = std::move(lhs), rhs = std::move(rhs)](range in) {
    auto as_lhs = lhs(in);
    auto as_rhs = rhs(in);

    if(!as_rhs) return as_lhs;
    if(!as_lhs) return as_rhs;

    if(as_lhs.get()->first >= as_rhs.get()->first) {
      return as_lhs;
    }
    return as_rhs;
  };
}

// fixpoint (result type needs to be given because c++)
template<class T, class Def>
struct fixpoint {
  const Def def;

  result<T> operator()(range in) const {
    return def(*this)(in);
  }
};

template<class T, class Def>
static fixpoint<T, Def> fix(Def def) {
  return {def};
}


////////////////////////////////////////////////////////////////////////////////
// concrete parsers

static result<char> _char(range in) {
  if(!in) {
    return error(in);
  }

  return make_success(in.get(), in.next());
}

// parse char matching a predicate
template<class Pred>
static auto pred(Pred pred) {
  return _char >>= guard(pred);
}

static auto pred(int (*pred)(int)) {
  return _char >>= guard([pred](char c) {
    return pred(static_cast<unsigned char>(c)) != 0;
  });
}

// parse a given char
static auto single(char c) {
  return pred([c](char x) { return x == c; });
}

// parse one of the given chars
static auto one_of(const char* chars) {
  return pred([chars](char x) { return x && std::strchr(chars, x); });
}

// decimal integer with optional minus sign, fails on overflow
static result<long> _long(range in) {
  range curr = in;
  bool negative = false;
  if(curr && curr.get() == '-') {
    negative = true;
    curr = curr.next();
  }

  if(!curr || !std::isdigit(static_cast<unsigned char>(curr.get()))) {
    return error(in);
  }

  // accumulate negatively so that LONG_MIN fits
  long res = 0;
  for(; curr && std::isdigit(static_cast<unsigned char>(curr.get())); curr = curr.next()) {
    const long digit = curr.get() - '0';
    if(res < (LONG_MIN + digit) / 10) {
      return error(in);
    }
    res = res * 10 - digit;
  }

  if(!negative) {
    if(res == LONG_MIN) return error(in);
    res = -res;
  }

  return make_success(res, curr);
}

// end of stream parser
static result<unit> eos(range in) {
  if(!in) {
    return make_success(unit{}, in);
  }

  return error(in);
}

////////////////////////////////////////////////////////////////////////////////

// line/column of a position within a source text, both starting at 1
static std::pair<std::size_t, std::size_t> position(const char* origin, const char* at) {
  std::size_t line = 1, column = 1;
  for(const char* it = origin; it != at; ++it) {
    if(*it == '\n') {
      ++line;
      column = 1;
    } else {
      ++column;
    }
  }
  return {line, column};
}

template<class Parser>
static value<Parser> run(Parser parser, range in) {
  auto res = parser(in);
  if(!res) {
    const range at = res.failure();
    std::stringstream ss;
    ss << "parse error near \"";
    peek(at, ss);
    ss << "\"";

    const auto pos = position(in.first, at.first);
    throw parse_error(ss.str(), pos.first, pos.second);
  }

  return std::move(res.get()->value);
}

template<class Parser>
static value<Parser> run(Parser parser, const std::string& in) {
  return run(std::move(parser), range{in.data(), in.data() + in.size()});
}

} // namespace parser
} // namespace ldgv

#endif
