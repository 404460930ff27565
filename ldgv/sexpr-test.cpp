#include "sexpr.hpp"
#include "error.hpp"

#include <gtest/gtest.h>

#include <climits>
#include <sstream>

using namespace ldgv;

static std::string show(const sexpr& e) {
  std::stringstream ss;
  ss << e;
  return ss.str();
}


TEST(sexpr, atoms) {
  ASSERT_EQ(read_one("42").get<long>(), 42);
  ASSERT_EQ(read_one("-7").get<long>(), -7);
  ASSERT_EQ(read_one("-9223372036854775808").get<long>(), LONG_MIN);

  ASSERT_EQ(read_one("-").get<symbol>(), symbol("-"));
  ASSERT_EQ(read_one("foo-bar?").get<symbol>(), symbol("foo-bar?"));
  ASSERT_EQ(read_one("'left").get<quote>().name, symbol("left"));
}


TEST(sexpr, lists) {
  ASSERT_EQ(show(read_one("(a (b  c) 'd 1)")), "(a (b c) 'd 1)");
  ASSERT_EQ(show(read_one("()")), "()");
  ASSERT_EQ(show(read_one("  (f\n x) ; trailing")), "(f x)");
}


TEST(sexpr, program) {
  const auto items = read_all("; leading comment\n"
                              "(def f (x) x)\n"
                              "(def main () (f 1)) ; done\n");
  ASSERT_EQ(items.size(), 2u);
  ASSERT_EQ(show(items[1]), "(def main () (f 1))");

  ASSERT_TRUE(read_all("").empty());
  ASSERT_TRUE(read_all("  ; nothing but a comment").empty());
}


TEST(sexpr, errors) {
  ASSERT_THROW(read_one("5x"), parse_error);
  ASSERT_THROW(read_one("(a b"), parse_error);
  ASSERT_THROW(read_one("a b"), parse_error);
  ASSERT_THROW(read_one("99999999999999999999"), parse_error);
  ASSERT_THROW(read_all(")"), parse_error);
}


TEST(sexpr, error_position) {
  try {
    read_all("(def main () 1)\n  )");
    FAIL() << "expected a parse error";
  } catch(parse_error& e) {
    ASSERT_EQ(e.line, 2u);
    ASSERT_EQ(e.column, 3u);
    ASSERT_NE(std::string(e.what()).find("at 2:3"), std::string::npos);
  }
}
