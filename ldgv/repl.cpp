#include "repl.hpp"

#include <cstdlib>
#include <cstring>
#include <string>

#include <readline/readline.h>
#include <readline/history.h>

#include "finally.hpp"

namespace ldgv {

void repl(std::function<void(const char*)> handler,
          const char* prompt,
          const char* history) {
  if(history) {
    read_history(history);
  }

  const auto save = finally([history] {
    if(history) {
      write_history(history);
    }
  });

  while(char* buf = readline(prompt)) {
    if(std::strlen(buf) > 0) {
      add_history(buf);
    }

    const std::string contents = buf;

    // readline mallocs a new buffer every time
    std::free(buf);

    handler(contents.c_str());
  }
}

}
