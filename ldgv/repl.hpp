#ifndef LDGV_REPL_HPP
#define LDGV_REPL_HPP

#include <functional>

namespace ldgv {

// reads lines until end of input and hands each of them to handler. history
// is loaded from and saved to the given file when non-null
void repl(std::function<void(const char*)> handler,
          const char* prompt = "> ",
          const char* history = nullptr);

}

#endif
