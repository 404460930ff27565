#include <fstream>
#include <iostream>
#include <iterator>
#include <cstdlib>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "error.hpp"
#include "eval.hpp"
#include "log.hpp"
#include "repl.hpp"
#include "sexpr.hpp"
#include "syntax.hpp"

namespace po = boost::program_options;
using namespace ldgv;

static po::variables_map parse_options(int argc, char** argv) {
  po::options_description desc("Allowed options");
  desc.add_options()
    ("help,h", "produce help message")
    ("trace,t", "log every evaluation step")
    ("interactive,i", "start an interactive session after loading the file")
    ("filename", po::value<std::string>()->default_value("-"), "input file, - for stdin")
    ;

  po::positional_options_description p;
  p.add("filename", 1);

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv).
            options(desc).positional(p).run(), vm);

  po::notify(vm);

  if(vm.count("help")) {
    std::cout << "usage: ldgv [options] [file]\n" << desc << "\n";
    std::exit(0);
  }

  return vm;
}


static std::string read_source(const std::string& filename) {
  if(filename == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), {});
  }

  if(std::ifstream ifs{filename}) {
    return std::string(std::istreambuf_iterator<char>(ifs), {});
  }

  throw std::runtime_error("cannot read file: " + filename);
}


template<class Cont>
static void with_show_errors(Cont cont, std::ostream& err = std::cerr) try {
  return cont();
} catch(parse_error& e) {
  err << e.what() << std::endl;
  throw;
} catch(syntax_error& e) {
  err << e.what() << std::endl;
  throw;
} catch(ldgv::error& e) {
  err << "runtime error: " << e.what() << std::endl;
  throw;
} catch(std::runtime_error& e) {
  err << "error: " << e.what() << std::endl;
  throw;
}


// top-level declarations of a session
class session {
  std::vector<ast::decl> decls;
  environment toplevel;

public:
  void load(const std::string& source) {
    const std::vector<ast::decl> loaded = check_program(read_all(source));
    log::line(log::info, "driver") << "loaded " << loaded.size() << " declarations";

    for(const auto& d: loaded) {
      define(d);
    }
  }

  // duplicate names are rejected as in a program
  void define(const ast::decl& d) {
    for(const auto& other: decls) {
      if(other.name == d.name) {
        throw syntax_error("syntax error: duplicate declaration: " + d.name.str());
      }
    }

    decls.push_back(d);
    toplevel = make_toplevel(decls);
  }

  value run() const { return run_main(toplevel); }

  value eval(const ast::expr& e) const { return evaluate(e, toplevel); }
};


static int with_load(const std::string& filename, session& s) {
  try {
    with_show_errors([&] {
      s.load(read_source(filename));
      std::cout << s.run() << std::endl;
    });
    return 0;
  } catch(std::runtime_error&) {
    return 1;
  }
}


static int with_repl(const std::string& filename, session& s) {
  if(filename != "-") {
    try {
      with_show_errors([&] { s.load(read_source(filename)); });
    } catch(std::runtime_error&) {
      return 1;
    }
  }

  static const char* history = ".ldgv_history";

  repl([&](const char* input) {
    try {
      with_show_errors([&] {
        const std::string line = input;
        if(line.find_first_not_of(" \t") == std::string::npos) return;

        const sexpr e = read_one(line);
        if(is_decl(e)) {
          const ast::decl d = check_decl(e);
          s.define(d);
          std::cout << d.name << std::endl;
        } else {
          std::cout << s.eval(check(e)) << std::endl;
        }
      });
    } catch(std::runtime_error&) {
      // already reported, the session goes on
    }
  }, "> ", history);

  return 0;
}


int main(int argc, char** argv) {
  log::install_default_handlers();

  po::variables_map vm;
  try {
    vm = parse_options(argc, argv);
  } catch(po::error& e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }

  if(vm.count("trace")) {
    log::threshold(log::debug);
  }

  const std::string filename = vm["filename"].as<std::string>();

  session s;
  if(vm.count("interactive")) {
    return with_repl(filename, s);
  }

  return with_load(filename, s);
}
