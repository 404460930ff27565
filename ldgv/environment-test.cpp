#include "environment.hpp"
#include "error.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace ldgv;

TEST(environment, lookup) {
  const environment empty;
  ASSERT_EQ(empty.find("x"), nullptr);
  ASSERT_THROW(empty.lookup("x"), unbound_variable);

  const environment env = empty.extend("x", 1L);
  ASSERT_EQ(env.lookup("x").get<long>(), 1);
  ASSERT_EQ(env.size(), 1u);
}


TEST(environment, shadowing) {
  const environment outer = environment().extend("x", 1L).extend("y", 2L);
  const environment inner = outer.extend("x", 3L);

  ASSERT_EQ(inner.lookup("x").get<long>(), 3);
  ASSERT_EQ(inner.lookup("y").get<long>(), 2);

  // extending leaves the parent alone
  ASSERT_EQ(outer.lookup("x").get<long>(), 1);
  ASSERT_EQ(outer.size(), 2u);
  ASSERT_EQ(inner.size(), 3u);
}


TEST(environment, extend_many) {
  const environment env = environment().extend_many({{"x", 1L}, {"y", 2L}, {"x", 3L}});
  ASSERT_EQ(env.lookup("x").get<long>(), 1);
  ASSERT_EQ(env.lookup("y").get<long>(), 2);

  std::vector<symbol> names;
  env.iter([&](symbol name, const value&) { names.push_back(name); });

  const std::vector<symbol> expected = {"x", "y", "x"};
  ASSERT_EQ(names, expected);
}
