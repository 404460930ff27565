#ifndef LDGV_EVAL_HPP
#define LDGV_EVAL_HPP

#include <functional>
#include <vector>

#include "ast.hpp"
#include "environment.hpp"
#include "value.hpp"

namespace ldgv {

// an expression compiled to a function of its environment
using code = std::function<value(const environment&)>;

code compile(const ast::expr& e);

// big-step evaluation. may block on receive, may spawn processes, throws
// ldgv::error on faults
value evaluate(const ast::expr& e, const environment& env);

// zero parameters: the body evaluated in env. otherwise a chain of closures,
// one per parameter, evaluating the body once the last one is supplied
value resolve(const global& self, const environment& env);

// top-level environment binding each declaration to an unevaluated global
environment make_toplevel(const std::vector<ast::decl>& decls);

// resolves main in the top-level environment, throws no_main_declaration
value run_main(const environment& toplevel);

// integer arithmetic, throws division_by_zero and arithmetic_overflow
long arithmetic(ast::op kind, long lhs, long rhs);

// evaluates lhs then rhs to integers and combines them
value apply_binary(ast::op kind, const code& lhs, const code& rhs,
                   const environment& env);

// bounded recursion over a natural index: zero for 0, then step with counter
// bound to k and acc to the result for k - 1, for k up to index
value unroll(long index, const code& zero, symbol counter, symbol acc,
             const code& step, const environment& env);

}

#endif
