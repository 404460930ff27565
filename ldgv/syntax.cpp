#include "syntax.hpp"
#include "error.hpp"

#include <functional>
#include <map>
#include <set>
#include <sstream>

namespace ldgv {

namespace kw {
  static const symbol def = "def";
  static const symbol unit = "unit";
}

static std::string show(const sexpr& e) {
  std::stringstream ss;
  ss << e;
  return ss.str();
}

// items joined with spaces
static std::string show(const sexpr::list& items) {
  std::stringstream ss;
  bool first = true;
  for(const auto& item: items) {
    if(first) first = false;
    else ss << ' ';
    ss << item;
  }
  return ss.str();
}


// argument list cursor: every failure reports the form usage
class args {
  sexpr::list rest;
  const char* usage;
public:
  args(sexpr::list rest, const char* usage): rest(rest), usage(usage) { }

  [[noreturn]] void fail() const {
    throw syntax_error(std::string("syntax error: ") + usage);
  }

  bool empty() const { return !rest; }
  std::size_t size() const { return length(rest); }

  sexpr pop() {
    if(!rest) fail();
    const sexpr res = rest->head;
    rest = rest->tail;
    return res;
  }

  template<class T>
  T pop() {
    const sexpr res = pop();
    if(const T* value = res.cast<T>()) return *value;
    fail();
  }

  ast::expr expr() { return check(pop()); }

  void done() const {
    if(rest) fail();
  }
};


// x | (x annot...)
static std::pair<symbol, std::string> check_binder(const sexpr& e, args& form) {
  if(const symbol* name = e.cast<symbol>()) {
    return {*name, {}};
  }

  if(const sexpr::list* items = e.cast<sexpr::list>()) {
    args binder(*items, "(`sym` `annot`...)");
    const symbol name = binder.pop<symbol>();
    if(binder.empty()) binder.fail();
    return {name, show((*items)->tail)};
  }

  form.fail();
}


static ast::expr check_arith(ast::op kind, sexpr::list rest) {
  args form(rest, "(`op` `expr` `expr`)");
  const ast::expr lhs = form.expr();
  const ast::expr rhs = form.expr();
  form.done();
  return ast::binary{kind, lhs, rhs};
}


using special_type = std::function<ast::expr(sexpr::list)>;

static const std::map<symbol, special_type>& special() {
  static const std::map<symbol, special_type> table = {
    {"+", [](sexpr::list rest) { return check_arith(ast::op::add, rest); }},
    {"*", [](sexpr::list rest) { return check_arith(ast::op::mul, rest); }},
    {"/", [](sexpr::list rest) { return check_arith(ast::op::div, rest); }},

    // binary minus or negation
    {"-", [](sexpr::list rest) -> ast::expr {
        if(length(rest) == 1) {
          return ast::negate{check(rest->head)};
        }
        return check_arith(ast::op::sub, rest);
      }},

    {"neg", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(neg `expr`)");
        const ast::expr arg = form.expr();
        form.done();
        return ast::negate{arg};
      }},

    {"succ", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(succ `expr`)");
        const ast::expr arg = form.expr();
        form.done();
        return ast::succ{arg};
      }},

    {"nat", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(nat `natural`)");
        const long value = form.pop<long>();
        form.done();
        if(value < 0) form.fail();
        return ast::lit{value, true};
      }},

    {"let", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(let `sym` `expr` `expr`) or (let (`sym` `sym`) `expr` `expr`)");
        const sexpr binder = form.pop();
        const ast::expr value = form.expr();
        const ast::expr body = form.expr();
        form.done();

        if(const symbol* name = binder.cast<symbol>()) {
          return ast::let{*name, value, body};
        }

        if(const sexpr::list* names = binder.cast<sexpr::list>()) {
          args pair(*names, "(let (`sym` `sym`) `expr` `expr`)");
          const symbol first = pair.pop<symbol>();
          const symbol second = pair.pop<symbol>();
          pair.done();
          return ast::let_pair{first, second, value, body};
        }

        form.fail();
      }},

    {"pair", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(pair [`sym`] `expr` `expr`)");
        if(form.size() == 2) {
          const ast::expr first = form.expr();
          const ast::expr second = form.expr();
          return ast::pair{symbol::unique("pair"), first, second};
        }

        const symbol name = form.pop<symbol>();
        const ast::expr first = form.expr();
        const ast::expr second = form.expr();
        form.done();
        return ast::pair{name, first, second};
      }},

    {"fst", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(fst `expr`)");
        const ast::expr arg = form.expr();
        form.done();
        return ast::proj{0, arg};
      }},

    {"snd", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(snd `expr`)");
        const ast::expr arg = form.expr();
        form.done();
        return ast::proj{1, arg};
      }},

    {"lambda", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(lambda `binder` `expr`)");
        const auto binder = check_binder(form.pop(), form);
        const ast::expr body = form.expr();
        form.done();
        return ast::abs{binder.first, binder.second, body};
      }},

    {"fork", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(fork `expr`)");
        const ast::expr body = form.expr();
        form.done();
        return ast::fork{body};
      }},

    {"new", [](sexpr::list rest) -> ast::expr {
        return ast::channel{show(rest)};
      }},

    {"send", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(send `expr`)");
        const ast::expr chan = form.expr();
        form.done();
        return ast::send{chan};
      }},

    {"recv", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(recv `expr`)");
        const ast::expr chan = form.expr();
        form.done();
        return ast::recv{chan};
      }},

    {"case", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(case `expr` (`label` `expr`)...)");
        const ast::expr arg = form.expr();

        std::vector<ast::branch> branches;
        std::set<symbol> seen;
        while(!form.empty()) {
          args branch(form.pop<sexpr::list>(), "(`label` `expr`)");
          const sexpr head = branch.pop();

          symbol label = match(head,
                               [](quote self) { return self.name; },
                               [](symbol self) { return self; },
                               [&](const auto&) -> symbol { branch.fail(); });

          const ast::expr body = branch.expr();
          branch.done();

          if(!seen.insert(label).second) {
            throw syntax_error("syntax error: duplicate case label '" + label.str());
          }
          branches.push_back(ast::branch{label, body});
        }

        return ast::cases{arg, std::move(branches)};
      }},

    {"natrec", [](sexpr::list rest) -> ast::expr {
        args form(rest, "(natrec `expr` `expr` (`sym` `sym`) `expr`)");
        const ast::expr index = form.expr();
        const ast::expr zero = form.expr();

        args names(form.pop<sexpr::list>(), "(natrec `expr` `expr` (`sym` `sym`) `expr`)");
        const symbol counter = names.pop<symbol>();
        const symbol acc = names.pop<symbol>();
        names.done();

        const ast::expr step = form.expr();
        form.done();
        return ast::natrec{index, zero, counter, acc, step};
      }},
  };

  return table;
}


// (f a b ...) is ((f a) b) ...
static ast::expr check_app(const sexpr& func, sexpr::list rest) {
  if(!rest) {
    throw syntax_error("syntax error: application without argument: (" + show(func) + ")");
  }

  ast::expr res = check(func);
  for(const auto& arg: rest) {
    res = ast::app{res, check(arg)};
  }
  return res;
}


ast::expr check(const sexpr& e) {
  return match(
      e,
      [](long self) -> ast::expr { return ast::lit{self, false}; },
      [](quote self) -> ast::expr { return ast::label{self.name}; },
      [](symbol self) -> ast::expr {
        if(self == kw::unit) return ast::unit{};
        if(special().count(self) || self == kw::def) {
          throw syntax_error("syntax error: keyword used as variable: " + self.str());
        }
        return ast::var{self};
      },
      [](const sexpr::list& self) -> ast::expr {
        if(!self) {
          return ast::unit{};
        }

        if(const symbol* first = self->head.cast<symbol>()) {
          const auto it = special().find(*first);
          if(it != special().end()) {
            return it->second(self->tail);
          }

          if(*first == kw::def) {
            throw syntax_error("syntax error: def is only allowed at top level");
          }
        }

        return check_app(self->head, self->tail);
      });
}


bool is_decl(const sexpr& e) {
  const sexpr::list* items = e.cast<sexpr::list>();
  if(!items || !*items) return false;
  const symbol* first = (*items)->head.cast<symbol>();
  return first && *first == kw::def;
}


ast::decl check_decl(const sexpr& e) {
  static const char* usage = "(def `sym` (`binder`...) [`type`] `expr`)";
  const sexpr::list* items = e.cast<sexpr::list>();
  if(!items || !is_decl(e)) {
    throw syntax_error(std::string("syntax error: ") + usage);
  }

  args form((*items)->tail, usage);
  const symbol name = form.pop<symbol>();

  std::vector<ast::param> params;
  args binders(form.pop<sexpr::list>(), usage);
  while(!binders.empty()) {
    const auto binder = check_binder(binders.pop(), binders);
    params.push_back(ast::param{binder.first, binder.second});
  }

  std::string result;
  if(form.size() == 2) {
    result = show(form.pop());
  }

  const ast::expr body = form.expr();
  form.done();

  return ast::decl{name, std::move(params), body, result};
}


std::vector<ast::decl> check_program(const std::vector<sexpr>& items) {
  std::vector<ast::decl> res;
  std::set<symbol> names;
  for(const auto& item: items) {
    res.push_back(check_decl(item));
    if(!names.insert(res.back().name).second) {
      throw syntax_error("syntax error: duplicate declaration: " + res.back().name.str());
    }
  }
  return res;
}

}
