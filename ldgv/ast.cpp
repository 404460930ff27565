#include "ast.hpp"

#include <ostream>

namespace ldgv {
namespace ast {

const char* name(op kind) {
  switch(kind) {
  case op::add: return "+";
  case op::sub: return "-";
  case op::mul: return "*";
  case op::div: return "/";
  }
  return "?";
}


static void binder(std::ostream& out, symbol name, const std::string& annot) {
  if(annot.empty()) out << name;
  else out << '(' << name << ' ' << annot << ')';
}


std::ostream& operator<<(std::ostream& out, const expr& self) {
  match(self,
        [&](unit) { out << "()"; },
        [&](var self) { out << self.name; },
        [&](label self) { out << '\'' << self.name; },
        [&](lit self) {
          if(self.natural) out << "(nat " << self.value << ')';
          else out << self.value;
        },
        [&](const binary& self) {
          out << '(' << name(self.kind) << ' ' << self.lhs << ' ' << self.rhs << ')';
        },
        [&](const negate& self) { out << "(neg " << self.arg << ')'; },
        [&](const succ& self) { out << "(succ " << self.arg << ')'; },
        [&](const let& self) {
          out << "(let " << self.name << ' ' << self.value << ' ' << self.body << ')';
        },
        [&](const let_pair& self) {
          out << "(let (" << self.first << ' ' << self.second << ") "
              << self.value << ' ' << self.body << ')';
        },
        [&](const pair& self) {
          out << "(pair " << self.name << ' ' << self.first << ' ' << self.second << ')';
        },
        [&](const proj& self) {
          out << (self.index ? "(snd " : "(fst ") << self.arg << ')';
        },
        [&](const abs& self) {
          out << "(lambda ";
          binder(out, self.arg, self.annot);
          out << ' ' << self.body << ')';
        },
        [&](const app& self) { out << '(' << self.func << ' ' << self.arg << ')'; },
        [&](const fork& self) { out << "(fork " << self.body << ')'; },
        [&](const channel& self) {
          if(self.annot.empty()) out << "(new)";
          else out << "(new " << self.annot << ')';
        },
        [&](const send& self) { out << "(send " << self.chan << ')'; },
        [&](const recv& self) { out << "(recv " << self.chan << ')'; },
        [&](const cases& self) {
          out << "(case " << self.arg;
          for(const auto& b: self.branches) {
            out << " ('" << b.label << ' ' << b.body << ')';
          }
          out << ')';
        },
        [&](const natrec& self) {
          out << "(natrec " << self.index << ' ' << self.zero
              << " (" << self.counter << ' ' << self.acc << ") " << self.step << ')';
        });
  return out;
}


std::ostream& operator<<(std::ostream& out, const decl& self) {
  out << "(def " << self.name << " (";
  bool first = true;
  for(const auto& p: self.params) {
    if(first) first = false;
    else out << ' ';
    binder(out, p.name, p.annot);
  }
  out << ") ";
  if(!self.result.empty()) out << self.result << ' ';
  return out << self.body << ')';
}

} // namespace ast
} // namespace ldgv
