#include "environment.hpp"
#include "error.hpp"

namespace ldgv {

const value* environment::find(symbol name) const {
  for(const frame* it = top.get(); it; it = it->next.get()) {
    if(it->name == name) return &it->val;
  }

  return nullptr;
}


const value& environment::lookup(symbol name) const {
  if(const value* res = find(name)) {
    return *res;
  }

  throw unbound_variable(name);
}


environment environment::extend(symbol name, value val) const {
  return environment(std::make_shared<frame>(frame{name, std::move(val), top}));
}


environment environment::extend_many(std::initializer_list<binding> bindings) const {
  return extend_many(bindings.begin(), bindings.end());
}


std::size_t environment::size() const {
  std::size_t res = 0;
  for(const frame* it = top.get(); it; it = it->next.get()) ++res;
  return res;
}

}
