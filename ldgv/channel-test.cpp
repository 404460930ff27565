#include "channel.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace ldgv;

TEST(channel, fifo) {
  queue q;
  q.push(1L);
  q.push(2L);
  q.push(3L);
  ASSERT_EQ(q.size(), 3u);

  ASSERT_EQ(q.pop().get<long>(), 1);
  ASSERT_EQ(q.pop().get<long>(), 2);

  value out = unit{};
  ASSERT_TRUE(q.try_pop(out));
  ASSERT_EQ(out.get<long>(), 3);
  ASSERT_FALSE(q.try_pop(out));
}


TEST(channel, duality) {
  const value c = make_channel();
  const endpoint a = c.get<pair>().first.get<endpoint>();
  const endpoint b = c.get<pair>().second.get<endpoint>();

  ASSERT_EQ(a.read, b.write);
  ASSERT_EQ(a.write, b.read);
  ASSERT_FALSE(a == b);

  send(a, symbol("ping"));
  send(b, symbol("pong"));

  ASSERT_EQ(receive(b).get<symbol>(), symbol("ping"));
  ASSERT_EQ(receive(a).get<symbol>(), symbol("pong"));
}


TEST(channel, blocking_receive) {
  const value c = make_channel();
  const endpoint a = c.get<pair>().first.get<endpoint>();
  const endpoint b = c.get<pair>().second.get<endpoint>();

  long received = 0;
  std::thread reader([&] {
    received = receive(b).get<long>();
  });

  send(a, 42L);
  reader.join();

  ASSERT_EQ(received, 42);
  ASSERT_EQ(a.write->size(), 0u);
}
