#ifndef LDGV_CHANNEL_HPP
#define LDGV_CHANNEL_HPP

#include <condition_variable>
#include <deque>
#include <mutex>

#include "value.hpp"

namespace ldgv {

using mutex_type = std::mutex;
using lock_type = std::unique_lock<mutex_type>;

// unbounded fifo shared between processes. never closed: a pop on a queue
// nobody writes to waits forever
class queue {
  std::deque<value> values;
  mutable mutex_type mutex;
  std::condition_variable cv;

  lock_type lock() const { return lock_type(mutex); }

public:
  const std::size_t id;

  queue();
  queue(const queue&) = delete;

  // never blocks
  void push(value v);

  // blocks until a value is available
  value pop();

  bool try_pop(value& out);

  std::size_t size() const;
};


// (pair (endpoint r w) (endpoint w r))
value make_channel();

// enqueue on the write side of an endpoint
void send(const endpoint& self, const value& payload);

// blocking dequeue from the read side of an endpoint
value receive(const endpoint& self);

}

#endif
