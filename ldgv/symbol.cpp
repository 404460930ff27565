#include "symbol.hpp"

#include <mutex>
#include <set>

namespace ldgv {

// forked processes may intern concurrently, and may outlive static
// destruction: both are leaked
static std::mutex& table_mutex() {
  static auto* instance = new std::mutex;
  return *instance;
}

symbol::symbol(const std::string& repr) {
  static auto* table = new std::set<std::string>;
  std::lock_guard<std::mutex> lock(table_mutex());
  this->repr = table->emplace(repr).first->c_str();
}

symbol symbol::unique(const char* prefix) {
  static std::size_t counter = 0;
  std::size_t index;
  {
    std::lock_guard<std::mutex> lock(table_mutex());
    index = counter++;
  }
  return symbol(std::string(prefix) + " " + std::to_string(index));
}

} // namespace ldgv
