#ifndef LDGV_ENVIRONMENT_HPP
#define LDGV_ENVIRONMENT_HPP

#include <initializer_list>
#include <memory>
#include <utility>

#include "symbol.hpp"
#include "value.hpp"

namespace ldgv {

// persistent bindings: extending never alters the parent, and the innermost
// binding of a name shadows outer ones
class environment {
  struct frame {
    const symbol name;
    const value val;
    const std::shared_ptr<const frame> next;
  };

  std::shared_ptr<const frame> top;

  explicit environment(std::shared_ptr<const frame> top): top(std::move(top)) { }

public:
  using binding = std::pair<symbol, value>;

  environment() = default;

  // nullptr when unbound
  const value* find(symbol name) const;

  // throws unbound_variable
  const value& lookup(symbol name) const;

  environment extend(symbol name, value val) const;

  // the first binding is the innermost one
  environment extend_many(std::initializer_list<binding> bindings) const;

  template<class Iterator>
  environment extend_many(Iterator first, Iterator last) const {
    environment res = *this;
    while(first != last) {
      --last;
      res = res.extend(last->first, last->second);
    }
    return res;
  }

  std::size_t size() const;

  // innermost first, shadowed bindings included
  template<class Func>
  void iter(const Func& func) const {
    for(const frame* it = top.get(); it; it = it->next.get()) {
      func(it->name, it->val);
    }
  }
};

}

#endif
