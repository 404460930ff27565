#ifndef LDGV_VALUE_HPP
#define LDGV_VALUE_HPP

#include <functional>
#include <iosfwd>
#include <memory>

#include "ast.hpp"
#include "symbol.hpp"
#include "variant.hpp"

namespace ldgv {

class environment;
class queue;

struct unit { };

struct pair;
struct closure;
struct endpoint;
struct global;

// labels are symbols, Int and Nat are both long
struct value: variant<unit, symbol, long, pair, closure, endpoint, global> {
  using value::variant::variant;

  // human-readable name of an alternative, for error messages
  static const char* kind(std::size_t index);
  const char* kind() const { return kind(type()); }

  friend std::ostream& operator<<(std::ostream& out, const value& self);
};


struct pair {
  value first;
  value second;
};

// native function, capturing whatever environment it needs
struct closure {
  std::function<value(const value&)> func;

  value operator()(const value& arg) const { return func(arg); }
};

// one side of a channel: the peer reads what we write and conversely
struct endpoint {
  std::shared_ptr<queue> read;
  std::shared_ptr<queue> write;

  bool operator==(const endpoint& other) const {
    return read == other.read && write == other.write;
  }
};

// a top-level declaration, resolved anew at each reference
struct global {
  std::shared_ptr<const ast::decl> decl;

  // body compiled once, run at each resolution
  std::function<value(const environment&)> body;
};

} // namespace ldgv

#endif
