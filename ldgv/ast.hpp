#ifndef LDGV_AST_HPP
#define LDGV_AST_HPP

#include <iosfwd>
#include <string>
#include <vector>

#include "symbol.hpp"
#include "variant.hpp"

namespace ldgv {
namespace ast {

struct unit { };

struct var {
  symbol name;
};

struct label {
  symbol name;
};

// Int and Nat literals share a representation
struct lit {
  long value;
  bool natural;
};

struct binary;
struct negate;
struct succ;
struct let;
struct let_pair;
struct pair;
struct proj;
struct abs;
struct app;
struct fork;
struct channel;
struct send;
struct recv;
struct cases;
struct natrec;

struct expr: variant<unit, var, label, lit,
                     binary, negate, succ,
                     let, let_pair, pair, proj,
                     abs, app,
                     fork, channel, send, recv,
                     cases, natrec> {
  using expr::variant::variant;
};

enum class op { add, sub, mul, div };

struct binary {
  op kind;
  expr lhs;
  expr rhs;
};

struct negate {
  expr arg;
};

struct succ {
  expr arg;
};

struct let {
  symbol name;
  expr value;
  expr body;
};

struct let_pair {
  symbol first;
  symbol second;
  expr value;
  expr body;
};

// dependent pair: name is bound to the first component in the second
struct pair {
  symbol name;
  expr first;
  expr second;
};

// fst (index 0) or snd (index 1)
struct proj {
  std::size_t index;
  expr arg;
};

// type annotations are carried as text and never checked
struct abs {
  symbol arg;
  std::string annot;
  expr body;
};

struct app {
  expr func;
  expr arg;
};

struct fork {
  expr body;
};

struct channel {
  std::string annot;
};

struct send {
  expr chan;
};

struct recv {
  expr chan;
};

struct branch {
  symbol label;
  expr body;
};

struct cases {
  expr arg;
  std::vector<branch> branches;
};

// natrec index zero (counter acc) step
struct natrec {
  expr index;
  expr zero;
  symbol counter;
  symbol acc;
  expr step;
};


// top-level declarations
struct param {
  symbol name;
  std::string annot;
};

struct decl {
  symbol name;
  std::vector<param> params;
  expr body;
  std::string result;
};


const char* name(op kind);

// concrete syntax
std::ostream& operator<<(std::ostream& out, const expr& self);
std::ostream& operator<<(std::ostream& out, const decl& self);

} // namespace ast
} // namespace ldgv

#endif
