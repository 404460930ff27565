#include "process.hpp"
#include "error.hpp"
#include "log.hpp"

#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>

namespace ldgv {
namespace process {

  namespace {
    struct registry {
      std::mutex mutex;
      std::condition_variable cv;
      std::size_t count = 0;

      void enter() {
        std::lock_guard<std::mutex> lock(mutex);
        ++count;
      }

      void leave() {
        {
          std::lock_guard<std::mutex> lock(mutex);
          --count;
        }
        cv.notify_all();
      }
    };

    // leaked: detached processes may outlive static destruction
    registry& instance() {
      static registry* res = new registry;
      return *res;
    }
  }


  static void run(const task_type& task) {
    try {
      task();
    } catch(error& e) {
      log::line(log::error, "fork") << "forked process failed: " << e.what();
    } catch(std::exception& e) {
      log::line(log::error, "fork") << "forked process aborted: " << e.what();
    }
  }


  void spawn(task_type task) {
    registry& reg = instance();
    reg.enter();

    try {
      std::thread([task = std::move(task), &reg] {
        run(task);
        reg.leave();
      }).detach();
    } catch(std::system_error&) {
      reg.leave();
      throw;
    }
  }


  std::size_t running() {
    registry& reg = instance();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.count;
  }


  void wait_idle() {
    registry& reg = instance();
    std::unique_lock<std::mutex> lock(reg.mutex);
    reg.cv.wait(lock, [&] { return reg.count == 0; });
  }

}
}
