#include "eval.hpp"
#include "channel.hpp"
#include "error.hpp"
#include "log.hpp"
#include "process.hpp"
#include "syntax.hpp"

#include <gtest/gtest.h>

#include <climits>
#include <sstream>
#include <vector>

using namespace ldgv;

static value run_program(const std::string& source) {
  return run_main(make_toplevel(check_program(read_all(source))));
}

static value eval_expr(const std::string& source, const environment& env = environment()) {
  return evaluate(check(read_one(source)), env);
}

static std::string show(const value& v) {
  std::stringstream ss;
  ss << v;
  return ss.str();
}

// an endpoint bound to c, and its peer
struct fixture {
  const value chan = make_channel();
  const endpoint mine = chan.get<pair>().first.get<endpoint>();
  const endpoint peer = chan.get<pair>().second.get<endpoint>();

  environment env(const environment& parent = environment()) const {
    return parent.extend("c", mine);
  }
};


TEST(eval, literals) {
  ASSERT_EQ(show(eval_expr("42")), "42");
  ASSERT_EQ(show(eval_expr("(nat 3)")), "3");
  ASSERT_EQ(show(eval_expr("'left")), "'left");
  ASSERT_EQ(show(eval_expr("()")), "unit");
}


TEST(eval, arithmetic) {
  ASSERT_EQ(eval_expr("(+ (* 2 3) (/ 7 2))").get<long>(), 9);
  ASSERT_EQ(eval_expr("(/ -7 2)").get<long>(), -3);
  ASSERT_EQ(eval_expr("(- 5)").get<long>(), -5);
  ASSERT_EQ(eval_expr("(neg (- 2 5))").get<long>(), 3);
  ASSERT_EQ(eval_expr("(succ (nat 4))").get<long>(), 5);

  ASSERT_EQ(arithmetic(ast::op::add, 2, 5), 7);
  ASSERT_EQ(arithmetic(ast::op::sub, 2, 5), -3);
  ASSERT_EQ(arithmetic(ast::op::mul, -2, 5), -10);
  ASSERT_EQ(arithmetic(ast::op::div, 7, -2), -3);
  ASSERT_THROW(arithmetic(ast::op::add, LONG_MAX, 1), arithmetic_overflow);
  ASSERT_THROW(arithmetic(ast::op::div, LONG_MIN, -1), arithmetic_overflow);
  ASSERT_THROW(arithmetic(ast::op::div, 1, 0), division_by_zero);
}


TEST(eval, let) {
  ASSERT_EQ(eval_expr("(let x 5 (+ x x))").get<long>(), 10);
  ASSERT_EQ(eval_expr("(let x 1 (let x 2 x))").get<long>(), 2);
  ASSERT_EQ(eval_expr("(let (a b) (pair 1 2) (- a b))").get<long>(), -1);
}


TEST(eval, pairs) {
  ASSERT_EQ(show(eval_expr("(pair x 5 (+ x 1))")), "<5, 6>");
  ASSERT_EQ(show(eval_expr("(pair 'a ())")), "<'a, unit>");
  ASSERT_EQ(eval_expr("(fst (pair 1 2))").get<long>(), 1);
  ASSERT_EQ(eval_expr("(snd (pair 1 2))").get<long>(), 2);
}


TEST(eval, functions) {
  ASSERT_EQ(eval_expr("((lambda x (* x x)) 7)").get<long>(), 49);
  ASSERT_EQ(eval_expr("((lambda (x Int) (lambda y (- x y))) 10 3)").get<long>(), 7);
  ASSERT_EQ(show(eval_expr("(lambda x x)")), "#closure");

  // closures capture their definition environment
  ASSERT_EQ(eval_expr("(let y 1 (let f (lambda x (+ x y)) (let y 100 (f 1))))").get<long>(), 2);
}


TEST(eval, cases) {
  ASSERT_EQ(eval_expr("(case 'b ('a 1) ('b 2))").get<long>(), 2);
  ASSERT_EQ(eval_expr("(let l 'a (case l ('a (+ 1 1)) ('b (/ 1 0))))").get<long>(), 2);
  ASSERT_THROW(eval_expr("(case 'c ('a 1) ('b 2))"), no_matching_case);
  ASSERT_THROW(eval_expr("(case 1 ('a 1))"), type_mismatch);
}


TEST(eval, natrec) {
  ASSERT_EQ(eval_expr("(natrec 3 1 (i acc) (* i acc))").get<long>(), 6);
  ASSERT_EQ(eval_expr("(natrec 5 1 (i acc) (* i acc))").get<long>(), 120);

  // zero index never runs the step
  ASSERT_EQ(eval_expr("(natrec 0 7 (i acc) (/ 1 0))").get<long>(), 7);

  // the zero case sees the counter at 0
  ASSERT_EQ(eval_expr("(natrec 2 i (i acc) (+ acc i))").get<long>(), 3);

  ASSERT_THROW(eval_expr("(natrec (- 1) 0 (i acc) acc)"), negative_index);
  ASSERT_THROW(eval_expr("(natrec 'a 0 (i acc) acc)"), type_mismatch);
}


TEST(eval, globals) {
  ASSERT_EQ(run_program("(def main () 42)").get<long>(), 42);
  ASSERT_EQ(run_program("(def add (x y) (+ x y))"
                        "(def main () (add 2 3))").get<long>(), 5);

  // partial application
  ASSERT_EQ(run_program("(def add3 (x y z) (+ x (+ y z)))"
                        "(def main () (let f (add3 1) (f 2 3)))").get<long>(), 6);

  // declarations may refer to later ones
  ASSERT_EQ(run_program("(def main () (twice 4))"
                        "(def twice (n) (* 2 n))").get<long>(), 8);

  // a global sees the bindings of its reference site
  ASSERT_EQ(run_program("(def f () y)"
                        "(def main () (let y 3 f))").get<long>(), 3);

  ASSERT_EQ(show(run_program("(def f (x) x) (def main () f)")), "#closure");
}


TEST(eval, faults) {
  ASSERT_THROW(run_program("(def main () (/ 1 0))"), division_by_zero);
  ASSERT_THROW(run_program("(def main () (+ 1 'a))"), type_mismatch);
  ASSERT_THROW(run_program("(def main () (fst 1))"), type_mismatch);
  ASSERT_THROW(run_program("(def main () (1 2))"), type_mismatch);
  ASSERT_THROW(run_program("(def main () x)"), unbound_variable);
  ASSERT_THROW(run_program("(def main () (* 9223372036854775807 2))"), arithmetic_overflow);
  ASSERT_THROW(run_program("(def main () (- -9223372036854775808))"), arithmetic_overflow);
  ASSERT_THROW(run_program("(def f () 1)"), no_main_declaration);

  try {
    run_program("(def main () (+ 1 'a))");
    FAIL() << "expected a type mismatch";
  } catch(type_mismatch& e) {
    ASSERT_EQ(std::string(e.what()), "expected integer, got label");
  }
}


TEST(eval, channels) {
  ASSERT_EQ(eval_expr("(let c (new) (let (a b) c (let a2 ((send a) 5) (fst (recv b)))))").get<long>(), 5);

  // send gives back the channel, recv pairs the payload with it
  fixture f;
  const value sent = eval_expr("((send c) 'hello)", f.env());
  ASSERT_TRUE(sent.get<endpoint>() == f.mine);
  ASSERT_EQ(receive(f.peer).get<symbol>(), symbol("hello"));

  send(f.peer, 3L);
  const value received = eval_expr("(recv c)", f.env());
  ASSERT_EQ(received.get<pair>().first.get<long>(), 3);
  ASSERT_TRUE(received.get<pair>().second.get<endpoint>() == f.mine);

  ASSERT_THROW(eval_expr("(send 1)"), type_mismatch);
}


TEST(eval, fork) {
  ASSERT_EQ(show(eval_expr("(fork 1)")), "unit");

  ASSERT_EQ(eval_expr("(let c (new) (let (a b) c "
                      "  (let u (fork ((send a) 42)) (fst (recv b)))))").get<long>(), 42);

  // the parent goes on while the child waits
  fixture f;
  ASSERT_EQ(show(eval_expr("(let u (fork ((send c) (fst (recv c)))) 7)", f.env())), "7");

  send(f.peer, 1L);
  ASSERT_EQ(receive(f.peer).get<long>(), 1);

  process::wait_idle();
  ASSERT_EQ(process::running(), 0u);
}


TEST(eval, forked_fault) {
  std::vector<std::string> lines;
  log::add_handler(log::error, [&](const std::string& line) {
    lines.push_back(line);
  });

  const value res = eval_expr("(let u (fork (/ 1 0)) 3)");
  process::wait_idle();
  log::clear_handlers(log::error);

  ASSERT_EQ(res.get<long>(), 3);
  ASSERT_EQ(lines.size(), 1u);
  ASSERT_NE(lines[0].find("[fork]"), std::string::npos);
  ASSERT_NE(lines[0].find("division by zero"), std::string::npos);
}


// each reference to a global runs its body again
TEST(eval, no_memoization) {
  fixture f;
  const environment toplevel =
    f.env(make_toplevel(check_program(read_all("(def noisy () ((send c) 1))"))));

  eval_expr("(let a noisy (let b noisy 0))", toplevel);
  ASSERT_EQ(f.mine.write->size(), 2u);

  // a local binding is evaluated once
  eval_expr("(let x ((send c) 1) (let y x (let z x 0)))", toplevel);
  ASSERT_EQ(f.mine.write->size(), 3u);
}


// the argument is evaluated before the function
TEST(eval, application_order) {
  fixture f;
  eval_expr("((let u ((send c) 'func) (lambda x x)) (let u ((send c) 'arg) 0))", f.env());

  ASSERT_EQ(receive(f.peer).get<symbol>(), symbol("arg"));
  ASSERT_EQ(receive(f.peer).get<symbol>(), symbol("func"));
}


TEST(eval, trace) {
  std::vector<std::string> lines;
  log::add_handler(log::debug, [&](const std::string& line) {
    lines.push_back(line);
  });

  log::threshold(log::debug);
  const value res = eval_expr("(+ 1 2)");
  log::threshold(log::warning);
  log::clear_handlers(log::debug);

  ASSERT_EQ(res.get<long>(), 3);
  ASSERT_FALSE(lines.empty());
  ASSERT_EQ(lines.front(), "[eval] invoking (+ 1 2)");
  ASSERT_EQ(lines.back(), "[eval] leaving (+ 1 2) with value 3");
}
