#ifndef LDGV_PROCESS_HPP
#define LDGV_PROCESS_HPP

#include <functional>

namespace ldgv {
namespace process {

  using task_type = std::function<void()>;

  // runs task in a new, detached thread. faults are reported at error level
  // and never reach the spawner
  void spawn(task_type task);

  // number of spawned processes that have not terminated yet
  std::size_t running();

  // blocks until every spawned process has terminated
  void wait_idle();

}
}

#endif
