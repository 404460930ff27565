#ifndef LDGV_ERROR_HPP
#define LDGV_ERROR_HPP

#include <stdexcept>
#include <string>

#include "symbol.hpp"

namespace ldgv {

  struct error : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // reader
  struct parse_error : error {
    std::size_t line, column;

    parse_error(const std::string& what, std::size_t line, std::size_t column)
      : error(what + " at " + std::to_string(line) + ":" + std::to_string(column)),
        line(line),
        column(column) { }
  };

  // malformed special form
  struct syntax_error : error {
    using error::error;
  };

  // evaluation faults
  struct unbound_variable : error {
    const symbol name;
    unbound_variable(symbol name)
      : error("unbound variable: " + name.str()),
        name(name) { }
  };

  struct type_mismatch : error {
    type_mismatch(const std::string& expected, const std::string& got)
      : error("expected " + expected + ", got " + got) { }
  };

  struct no_matching_case : error {
    const symbol label;
    no_matching_case(symbol label)
      : error("no case for label '" + label.str()),
        label(label) { }
  };

  struct division_by_zero : error {
    division_by_zero() : error("division by zero") { }
  };

  struct arithmetic_overflow : error {
    using error::error;
  };

  struct negative_index : error {
    negative_index(long index)
      : error("negative recursion index: " + std::to_string(index)) { }
  };

  // driver
  struct no_main_declaration : error {
    no_main_declaration() : error("no 'main' declaration found") { }
  };

}

#endif
