#ifndef LDGV_SYNTAX_HPP
#define LDGV_SYNTAX_HPP

#include <vector>

#include "ast.hpp"
#include "sexpr.hpp"

namespace ldgv {

// sexpr to ast, throw syntax_error
ast::expr check(const sexpr& e);
ast::decl check_decl(const sexpr& e);

// declarations in source order, names must be distinct
std::vector<ast::decl> check_program(const std::vector<sexpr>& items);

// true for (def ...) forms
bool is_decl(const sexpr& e);

}

#endif
