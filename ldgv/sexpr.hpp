#ifndef LDGV_SEXPR_HPP
#define LDGV_SEXPR_HPP

#include <iosfwd>
#include <string>
#include <vector>

#include "list.hpp"
#include "symbol.hpp"
#include "variant.hpp"

namespace ldgv {

// 'name
struct quote {
  symbol name;
};

struct sexpr: variant<long, symbol, quote, list<sexpr>> {
  using sexpr::variant::variant;
  using list = ldgv::list<sexpr>;

  friend std::ostream& operator<<(std::ostream& out, const sexpr& self);
};

// reader entry points, throw parse_error
std::vector<sexpr> read_all(const std::string& source);
sexpr read_one(const std::string& source);

} // namespace ldgv

#endif
