#include "value.hpp"
#include "channel.hpp"
#include "environment.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace ldgv;

static std::string show(const value& v) {
  std::stringstream ss;
  ss << v;
  return ss.str();
}


TEST(value, printing) {
  ASSERT_EQ(show(unit{}), "unit");
  ASSERT_EQ(show(symbol("left")), "'left");
  ASSERT_EQ(show(-12L), "-12");
  ASSERT_EQ(show(pair{1L, pair{symbol("a"), unit{}}}), "<1, <'a, unit>>");
  ASSERT_EQ(show(closure{[](const value& x) { return x; }}), "#closure");

  const auto decl = std::make_shared<const ast::decl>(ast::decl{"f", {}, ast::unit{}, ""});
  ASSERT_EQ(show(global{decl, [](const environment&) -> value { return unit{}; }}),
            "#global<f>");
}


TEST(value, channel_printing) {
  const value c = make_channel();
  const pair& p = c.get<pair>();
  const endpoint& a = p.first.get<endpoint>();

  std::stringstream expected;
  expected << "#channel<" << a.read->id << ',' << a.write->id << '>';
  ASSERT_EQ(show(p.first), expected.str());
}


TEST(value, kinds) {
  ASSERT_EQ(std::string(value(unit{}).kind()), "unit");
  ASSERT_EQ(std::string(value(symbol("a")).kind()), "label");
  ASSERT_EQ(std::string(value(1L).kind()), "integer");
  ASSERT_EQ(std::string(value(pair{1L, 2L}).kind()), "pair");
  ASSERT_EQ(std::string(make_channel().get<pair>().first.kind()), "channel");
}
