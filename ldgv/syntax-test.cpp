#include "syntax.hpp"
#include "error.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace ldgv;

static ast::expr parse(const std::string& source) {
  return check(read_one(source));
}

static std::string show(const ast::expr& e) {
  std::stringstream ss;
  ss << e;
  return ss.str();
}


TEST(syntax, atoms) {
  ASSERT_TRUE(parse("()").is<ast::unit>());
  ASSERT_TRUE(parse("unit").is<ast::unit>());
  ASSERT_TRUE(parse("x").is<ast::var>());
  ASSERT_EQ(parse("'l").get<ast::label>().name, symbol("l"));

  const ast::lit i = parse("-3").get<ast::lit>();
  ASSERT_EQ(i.value, -3);
  ASSERT_FALSE(i.natural);

  const ast::lit n = parse("(nat 3)").get<ast::lit>();
  ASSERT_EQ(n.value, 3);
  ASSERT_TRUE(n.natural);
}


TEST(syntax, forms) {
  ASSERT_EQ(parse("(- 1)").get<ast::negate>().arg.get<ast::lit>().value, 1);
  ASSERT_EQ(parse("(- 1 2)").get<ast::binary>().kind, ast::op::sub);
  ASSERT_TRUE(parse("(succ x)").is<ast::succ>());
  ASSERT_TRUE(parse("(let (a b) p a)").is<ast::let_pair>());
  ASSERT_EQ(parse("(snd p)").get<ast::proj>().index, 1u);
  ASSERT_TRUE(parse("(new)").is<ast::channel>());
  ASSERT_EQ(parse("(new !Int.end)").get<ast::channel>().annot, "!Int.end");

  const ast::pair p = parse("(pair 1 2)").get<ast::pair>();
  ASSERT_NE(p.name, symbol("pair"));

  const ast::cases c = parse("(case x ('a 1) (b 2))").get<ast::cases>();
  ASSERT_EQ(c.branches.size(), 2u);
  ASSERT_EQ(c.branches[0].label, symbol("a"));
  ASSERT_EQ(c.branches[1].label, symbol("b"));
}


TEST(syntax, curried_application) {
  const ast::app outer = parse("(f a b)").get<ast::app>();
  ASSERT_EQ(outer.arg.get<ast::var>().name, symbol("b"));

  const ast::app inner = outer.func.get<ast::app>();
  ASSERT_EQ(inner.func.get<ast::var>().name, symbol("f"));
  ASSERT_EQ(inner.arg.get<ast::var>().name, symbol("a"));
}


TEST(syntax, printing) {
  ASSERT_EQ(show(parse("(let x (+ 1 2) (* x x))")), "(let x (+ 1 2) (* x x))");
  ASSERT_EQ(show(parse("(lambda (x Int) x)")), "(lambda (x Int) x)");
  ASSERT_EQ(show(parse("(natrec n 1 (i acc) (* i acc))")),
            "(natrec n 1 (i acc) (* i acc))");
  ASSERT_EQ(show(parse("(case l ('a 1))")), "(case l ('a 1))");
}


TEST(syntax, errors) {
  ASSERT_THROW(parse("(let x 1)"), syntax_error);
  ASSERT_THROW(parse("(lambda)"), syntax_error);
  ASSERT_THROW(parse("(lambda 1 x)"), syntax_error);
  ASSERT_THROW(parse("(fst a b)"), syntax_error);
  ASSERT_THROW(parse("(nat -1)"), syntax_error);
  ASSERT_THROW(parse("(case x ('a 1) ('a 2))"), syntax_error);
  ASSERT_THROW(parse("(case x (1 2))"), syntax_error);
  ASSERT_THROW(parse("(natrec n 1 i acc)"), syntax_error);
  ASSERT_THROW(parse("(f)"), syntax_error);
  ASSERT_THROW(parse("let"), syntax_error);
  ASSERT_THROW(parse("(def f () 1)"), syntax_error);
}


TEST(syntax, declarations) {
  ASSERT_TRUE(is_decl(read_one("(def f () 1)")));
  ASSERT_FALSE(is_decl(read_one("(f 1)")));
  ASSERT_FALSE(is_decl(read_one("()")));

  const ast::decl d = check_decl(read_one("(def f ((x Int) (y 1 Int) z) Int x)"));
  ASSERT_EQ(d.name, symbol("f"));
  ASSERT_EQ(d.params.size(), 3u);
  ASSERT_EQ(d.params[0].annot, "Int");
  ASSERT_EQ(d.params[1].annot, "1 Int");
  ASSERT_TRUE(d.params[2].annot.empty());
  ASSERT_EQ(d.result, "Int");
  ASSERT_TRUE(d.body.is<ast::var>());

  ASSERT_THROW(check_decl(read_one("(def f x)")), syntax_error);
  ASSERT_THROW(check_decl(read_one("(f () 1)")), syntax_error);
}


TEST(syntax, program) {
  const auto decls = check_program(read_all("(def f (x) x) (def main () (f 1))"));
  ASSERT_EQ(decls.size(), 2u);
  ASSERT_EQ(decls[1].name, symbol("main"));

  ASSERT_THROW(check_program(read_all("(def f () 1) (def f () 2)")), syntax_error);
  ASSERT_THROW(check_program(read_all("(def f () 1) (+ 1 2)")), syntax_error);
}
