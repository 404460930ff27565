#include "eval.hpp"

#include <climits>
#include <map>
#include <memory>
#include <string>

#include "channel.hpp"
#include "error.hpp"
#include "log.hpp"
#include "process.hpp"

namespace ldgv {

template<class T>
static const T& expect(const value& v) {
  if(const T* res = v.cast<T>()) return *res;
  throw type_mismatch(value::kind(value::index_of<T>()), v.kind());
}


long arithmetic(ast::op kind, long lhs, long rhs) {
  long res = 0;
  bool overflow = false;

  switch(kind) {
  case ast::op::add:
    overflow = __builtin_add_overflow(lhs, rhs, &res);
    break;
  case ast::op::sub:
    overflow = __builtin_sub_overflow(lhs, rhs, &res);
    break;
  case ast::op::mul:
    overflow = __builtin_mul_overflow(lhs, rhs, &res);
    break;
  case ast::op::div:
    if(rhs == 0) throw division_by_zero();
    overflow = lhs == LONG_MIN && rhs == -1;
    if(!overflow) res = lhs / rhs;
    break;
  }

  if(overflow) {
    throw arithmetic_overflow("integer overflow: " + std::to_string(lhs) + " "
                              + ast::name(kind) + " " + std::to_string(rhs));
  }

  return res;
}


value apply_binary(ast::op kind, const code& lhs, const code& rhs,
                   const environment& env) {
  const long a = expect<long>(lhs(env));
  const long b = expect<long>(rhs(env));
  return arithmetic(kind, a, b);
}


value unroll(long index, const code& zero, symbol counter, symbol acc,
             const code& step, const environment& env) {
  if(index < 0) {
    throw negative_index(index);
  }

  if(index == 0) {
    return zero(env);
  }

  // the zero case sees the counter at 0, each step sees its own index and
  // the result of the previous one
  value res = zero(env.extend(counter, 0L));
  for(long k = 1; k <= index; ++k) {
    res = step(env.extend_many({{counter, k}, {acc, res}}));
  }

  return res;
}


static value curry(const std::shared_ptr<const ast::decl>& decl, const code& body,
                   std::size_t index, const environment& env) {
  if(index == decl->params.size()) {
    return body(env);
  }

  return closure{[=](const value& arg) {
    return curry(decl, body, index + 1, env.extend(decl->params[index].name, arg));
  }};
}


value resolve(const global& self, const environment& env) {
  return curry(self.decl, self.body, 0, env);
}


////////////////////////////////////////////////////////////////////////////////
// compilation, one overload per node

static code compile(ast::unit) {
  return [](const environment&) -> value { return unit{}; };
}

static code compile(ast::lit self) {
  const value res = self.value;
  return [res](const environment&) { return res; };
}

static code compile(ast::label self) {
  const value res = self.name;
  return [res](const environment&) { return res; };
}

// globals are resolved afresh at every reference
static code compile(ast::var self) {
  return [name = self.name](const environment& env) -> value {
    const value& res = env.lookup(name);
    if(const global* g = res.cast<global>()) {
      return resolve(*g, env);
    }
    return res;
  };
}

static code compile(const ast::binary& self) {
  return [kind = self.kind,
          lhs = compile(self.lhs),
          rhs = compile(self.rhs)](const environment& env) {
    return apply_binary(kind, lhs, rhs, env);
  };
}

static code constant(long n) {
  const value res = n;
  return [res](const environment&) { return res; };
}

static code compile(const ast::negate& self) {
  return [zero = constant(0), arg = compile(self.arg)](const environment& env) {
    return apply_binary(ast::op::sub, zero, arg, env);
  };
}

static code compile(const ast::succ& self) {
  return [one = constant(1), arg = compile(self.arg)](const environment& env) {
    return apply_binary(ast::op::add, one, arg, env);
  };
}

static code compile(const ast::let& self) {
  return [name = self.name,
          def = compile(self.value),
          body = compile(self.body)](const environment& env) {
    return body(env.extend(name, def(env)));
  };
}

static code compile(const ast::let_pair& self) {
  return [first = self.first,
          second = self.second,
          def = compile(self.value),
          body = compile(self.body)](const environment& env) {
    const value v = def(env);
    const pair& p = expect<pair>(v);
    return body(env.extend_many({{first, p.first}, {second, p.second}}));
  };
}

static code compile(const ast::pair& self) {
  return [name = self.name,
          first = compile(self.first),
          second = compile(self.second)](const environment& env) -> value {
    const value v1 = first(env);
    const value v2 = second(env.extend(name, v1));
    return pair{v1, v2};
  };
}

static code compile(const ast::proj& self) {
  return [index = self.index, arg = compile(self.arg)](const environment& env) {
    const value v = arg(env);
    const pair& p = expect<pair>(v);
    return index ? p.second : p.first;
  };
}

// closures capture the whole environment
static code compile(const ast::abs& self) {
  return [arg = self.arg, body = compile(self.body)](const environment& env) -> value {
    return closure{[=](const value& x) {
      return body(env.extend(arg, x));
    }};
  };
}

// argument first, then function
static code compile(const ast::app& self) {
  return [func = compile(self.func), arg = compile(self.arg)](const environment& env) {
    const value x = arg(env);
    const value f = func(env);
    return expect<closure>(f)(x);
  };
}

static code compile(const ast::fork& self) {
  return [expr = self.body, body = compile(self.body)](const environment& env) -> value {
    if(log::enabled(log::debug)) {
      log::line(log::debug, "fork") << "forking " << expr;
    }

    process::spawn([body, env] {
      const value res = body(env);
      if(log::enabled(log::debug)) {
        log::line(log::debug, "fork") << "ran a forked operation with result " << res;
      }
    });
    return unit{};
  };
}

static code compile(const ast::channel&) {
  return [](const environment&) { return make_channel(); };
}

// the returned closure sends its argument and gives back the endpoint
static code compile(const ast::send& self) {
  return [chan = compile(self.chan)](const environment& env) -> value {
    const value c = chan(env);
    const endpoint e = expect<endpoint>(c);
    return closure{[c, e](const value& payload) {
      send(e, payload);
      return c;
    }};
  };
}

static code compile(const ast::recv& self) {
  return [chan = compile(self.chan)](const environment& env) -> value {
    const value c = chan(env);
    const value res = receive(expect<endpoint>(c));
    return pair{res, c};
  };
}

static code compile(const ast::cases& self) {
  std::map<symbol, code> branches;
  for(const auto& b: self.branches) {
    branches.emplace(b.label, compile(b.body));
  }

  return [arg = compile(self.arg), branches](const environment& env) {
    const value v = arg(env);
    const symbol label = expect<symbol>(v);

    const auto it = branches.find(label);
    if(it == branches.end()) {
      throw no_matching_case(label);
    }

    return it->second(env);
  };
}

static code compile(const ast::natrec& self) {
  return [index = compile(self.index),
          zero = compile(self.zero),
          counter = self.counter,
          acc = self.acc,
          step = compile(self.step)](const environment& env) {
    const long n = expect<long>(index(env));
    return unroll(n, zero, counter, acc, step, env);
  };
}


// entry/exit trace lines when debug logging is on
static code traced(const ast::expr& e, code c) {
  return [e, c = std::move(c)](const environment& env) {
    if(!log::enabled(log::debug)) {
      return c(env);
    }

    log::line(log::debug, "eval") << "invoking " << e;
    const value res = c(env);
    log::line(log::debug, "eval") << "leaving " << e << " with value " << res;
    return res;
  };
}


code compile(const ast::expr& e) {
  return traced(e, match(e, [](const auto& self) { return compile(self); }));
}


value evaluate(const ast::expr& e, const environment& env) {
  return compile(e)(env);
}


environment make_toplevel(const std::vector<ast::decl>& decls) {
  environment res;
  for(const auto& d: decls) {
    const auto decl = std::make_shared<const ast::decl>(d);
    res = res.extend(d.name, global{decl, compile(decl->body)});
  }

  return res;
}


value run_main(const environment& toplevel) {
  static const symbol name = "main";

  const value* res = toplevel.find(name);
  if(!res || !res->is<global>()) {
    throw no_main_declaration();
  }

  return resolve(res->get<global>(), toplevel);
}

}
