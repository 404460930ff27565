#ifndef LDGV_FINALLY_HPP
#define LDGV_FINALLY_HPP

#include <utility>

namespace ldgv {

// runs func when the returned guard goes out of scope
template<class Func>
static auto finally(Func func) {
  struct guard {
    Func func;
    ~guard() {
      func();
    }
  };

  return guard{std::move(func)};
}

}

#endif
