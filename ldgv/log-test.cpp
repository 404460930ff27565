#include "log.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using namespace ldgv;

namespace {
  // logs from its destructor, once every function-local static is destroyed
  struct late_logger {
    bool armed = false;

    ~late_logger() {
      if(armed) {
        log::line(log::error, "exit") << "logging after main returned";
      }
    }
  };

  late_logger at_exit;

  std::size_t late_lines = 0;
}

TEST(log, dispatch) {
  std::vector<std::string> lines;
  log::add_handler(log::warning, [&](const std::string& line) {
    lines.push_back(line);
  });

  log::line(log::warning, "test") << "first\nsecond";
  log::line(log::info, "test") << "below threshold";
  log::clear_handlers(log::warning);

  log::line(log::warning) << "after clear";

  ASSERT_EQ(lines.size(), 2u);
  ASSERT_EQ(lines[0], "[test] first");
  ASSERT_EQ(lines[1], "second");
}


TEST(log, threshold) {
  const log::level saved = log::threshold();

  ASSERT_FALSE(log::enabled(log::debug));
  ASSERT_TRUE(log::enabled(log::error));

  log::threshold(log::debug);
  ASSERT_TRUE(log::enabled(log::debug));

  std::vector<std::string> lines;
  log::add_handler(log::debug, [&](const std::string& line) {
    lines.push_back(line);
  });
  log::line(log::debug) << "visible";
  log::clear_handlers(log::debug);

  log::threshold(saved);
  ASSERT_EQ(lines.size(), 1u);
}


TEST(log, emitter) {
  std::stringstream ss("[eval] invoking x");
  log::emitter em;
  ASSERT_TRUE(bool(ss >> em));
  ASSERT_EQ(em.tag, "eval");

  std::stringstream plain("no tag here");
  ASSERT_FALSE(bool(plain >> em));

  std::stringstream out;
  out << log::emitter{"fork"};
  ASSERT_EQ(out.str(), "[fork]");
}


TEST(log, names) {
  ASSERT_EQ(std::string(log::name(log::debug)), "debug");
  ASSERT_EQ(std::string(log::name(log::fatal)), "fatal");
}


// detached processes may still log while the program exits
TEST(log, usable_during_static_destruction) {
  log::add_handler(log::error, [](const std::string&) { ++late_lines; });
  log::line(log::error, "exit") << "before exit";
  ASSERT_EQ(late_lines, 1u);

  at_exit.armed = true;
}
