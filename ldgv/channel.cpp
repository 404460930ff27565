#include "channel.hpp"
#include "log.hpp"

#include <atomic>

namespace ldgv {

static std::size_t next_id() {
  static std::atomic<std::size_t> counter{0};
  return counter++;
}

queue::queue(): id(next_id()) { }


void queue::push(value v) {
  {
    const auto lock = this->lock();
    values.emplace_back(std::move(v));
  }
  cv.notify_one();
}


value queue::pop() {
  auto lock = this->lock();
  cv.wait(lock, [this] { return !values.empty(); });

  value res = std::move(values.front());
  values.pop_front();
  return res;
}


bool queue::try_pop(value& out) {
  const auto lock = this->lock();
  if(values.empty()) return false;

  out = std::move(values.front());
  values.pop_front();
  return true;
}


std::size_t queue::size() const {
  const auto lock = this->lock();
  return values.size();
}


value make_channel() {
  const auto r = std::make_shared<queue>();
  const auto w = std::make_shared<queue>();

  if(log::enabled(log::debug)) {
    log::line(log::debug, "chan") << "new channel " << r->id << " <-> " << w->id;
  }

  return pair{endpoint{r, w}, endpoint{w, r}};
}


void send(const endpoint& self, const value& payload) {
  if(log::enabled(log::debug)) {
    log::line(log::debug, "chan") << "sending " << payload << " on queue " << self.write->id;
  }
  self.write->push(payload);
}


value receive(const endpoint& self) {
  value res = self.read->pop();
  if(log::enabled(log::debug)) {
    log::line(log::debug, "chan") << "read " << res << " from queue " << self.read->id;
  }
  return res;
}

}
