#include "log.hpp"

#include <atomic>
#include <iostream>
#include <iterator>
#include <mutex>
#include <vector>

namespace ldgv {
namespace log {

  // leaked: detached processes may still log during static destruction
  static std::vector<handler>& handlers(log::level level) {
    static auto* table = new std::vector<handler>[log::level::size];
    return table[level];
  }

  static std::mutex& dispatch_mutex() {
    static auto* instance = new std::mutex;
    return *instance;
  }

  static std::atomic<int>& current_threshold() {
    static std::atomic<int> instance{log::warning};
    return instance;
  }

  const char* name(log::level level) {
    static const char* table[log::level::size] = {
      "debug", "info", "warning", "error", "fatal"
    };
    return table[level];
  }

  void add_handler(log::level level, handler h) {
    std::lock_guard<std::mutex> lock(dispatch_mutex());
    handlers(level).emplace_back(std::move(h));
  }

  void clear_handlers(log::level level) {
    std::lock_guard<std::mutex> lock(dispatch_mutex());
    handlers(level).clear();
  }

  void threshold(log::level level) { current_threshold() = level; }

  log::level threshold() { return log::level(current_threshold().load()); }

  bool enabled(log::level level) { return level >= current_threshold(); }


  std::ostream& operator<<(std::ostream& out, const emitter& self) {
    return out << "[" << self.tag << "]";
  }

  std::istream& operator>>(std::istream& in, emitter& self) {
    const auto pos = in.tellg();
    char c;
    if((in >> c) && c == '[') {
      std::string tag;
      if(std::getline(in, tag, ']')) {
        self.tag = tag;
        return in;
      }
    }

    in.clear();
    in.seekg(pos);
    in.setstate(std::ios::failbit);

    return in;
  }


  line::~line() {
    if(!enabled(level)) return;

    std::stringstream lines(ss.str());
    std::lock_guard<std::mutex> lock(dispatch_mutex());

    // split lines
    std::string l;
    while(std::getline(lines, l, '\n')) {
      for(const auto& h: handlers(level)) {
        h(l);
      }
    }
  }


  static handler default_handler(log::level level) {
    return [level](const std::string& line) {
      std::stringstream ss(line);
      std::clog << name(level) << ": ";

      emitter em;
      if(ss >> em) {
        std::clog << em << " ";
        ss >> std::ws;
      } else {
        ss.clear();
      }

      const std::string message(std::istreambuf_iterator<char>(ss), {});
      std::clog << message << "\n";
    };
  }

  void install_default_handlers() {
    for(int i = 0; i < log::level::size; ++i) {
      const auto level = log::level(i);
      add_handler(level, default_handler(level));
    }
  }

}
}
