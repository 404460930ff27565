#ifndef LDGV_SYMBOL_HPP
#define LDGV_SYMBOL_HPP

#include <ostream>
#include <string>

namespace ldgv {

// interned string: equality and ordering are pointer comparisons
struct symbol {
  const char* repr;

  symbol(const char* repr): symbol(std::string(repr)) { }
  explicit symbol(const std::string& repr);

  const char* c_str() const { return repr; }
  std::string str() const { return repr; }

  friend std::ostream& operator<<(std::ostream& out, symbol self) {
    return out << self.repr;
  }

  bool operator<(symbol other) const { return repr < other.repr; }
  bool operator==(symbol other) const { return repr == other.repr; }
  bool operator!=(symbol other) const { return repr != other.repr; }

  // fresh symbol that cannot clash with source identifiers
  static symbol unique(const char* prefix);
};

} // namespace ldgv

#endif
