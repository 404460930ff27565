#ifndef LDGV_LOG_HPP
#define LDGV_LOG_HPP

#include <functional>
#include <iosfwd>
#include <sstream>
#include <string>

namespace ldgv {
namespace log {

  enum level {
              debug = 0,
              info,
              warning,
              error,
              fatal,
              size
  };

  const char* name(log::level level);

  using handler = std::function<void(const std::string& line)>;

  // handlers are registered before any process is forked
  void add_handler(log::level level, handler h);
  void clear_handlers(log::level level);

  // writes "level: [tag] message" to std::clog
  void install_default_handlers();

  // messages below threshold are neither formatted nor dispatched
  void threshold(log::level level);
  log::level threshold();

  bool enabled(log::level level);

  // bracketed subsystem tag at the start of a line
  struct emitter {
    std::string tag;

    friend std::ostream& operator<<(std::ostream& out, const emitter& self);
    friend std::istream& operator>>(std::istream& in, emitter& self);
  };


  // a message assembled privately and dispatched line by line on destruction,
  // so that lines from concurrent processes do not interleave
  class line {
    const log::level level;
    std::ostringstream ss;
  public:
    explicit line(log::level level): level(level) { }
    line(log::level level, const char* tag): level(level) {
      ss << emitter{tag} << ' ';
    }

    line(const line&) = delete;
    ~line();

    template<class T>
    line& operator<<(const T& value) {
      ss << value;
      return *this;
    }
  };

}
}

#endif
