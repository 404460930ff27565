#include "value.hpp"
#include "channel.hpp"

#include <ostream>

namespace ldgv {

const char* value::kind(std::size_t index) {
  static const char* table[] = {
    "unit", "label", "integer", "pair", "closure", "channel", "global"
  };
  return table[index];
}


std::ostream& operator<<(std::ostream& out, const value& self) {
  match(self,
        [&](unit) { out << "unit"; },
        [&](symbol self) { out << '\'' << self; },
        [&](long self) { out << self; },
        [&](const pair& self) {
          out << '<' << self.first << ", " << self.second << '>';
        },
        [&](const closure&) { out << "#closure"; },
        [&](const endpoint& self) {
          out << "#channel<" << self.read->id << ',' << self.write->id << '>';
        },
        [&](const global& self) { out << "#global<" << self.decl->name << '>'; });
  return out;
}

}
