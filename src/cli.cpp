#include "cli.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>

static const char* USAGE =
"ccr project set <name> [dir] [--config path]\n"
"ccr project add <name> <dir> [--config path]\n"
"ccr project current | list\n"
"ccr project remove <name>\n"
"ccr index [path] [--project p] [--config c] [--ext .py]... [--no-parallel] [--no-save] [--rebuild]\n"
"ccr query <text> [--top-k N] [--threshold T] [--project p] [--config c] [--index name]\n"
"                 [--output file] [--terminal] [--json]\n"
"ccr cache clear [--project p] [--config c]\n"
"\n"
"Any command also takes --verbose.\n";

[[noreturn]] static void usage_error(const std::string& msg) {
  if (!msg.empty()) std::cerr << "ccr: " << msg << "\n";
  std::cerr << USAGE;
  std::exit(1);
}

static void check_arity(const Args& a, std::size_t lo, std::size_t hi) {
  if (a.positional.size() < lo || a.positional.size() > hi) {
    std::string what = a.mode + (a.action.empty() ? "" : " " + a.action);
    usage_error("wrong number of arguments for '" + what + "'");
  }
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) usage_error("");
  a.mode = argv[1];
  if (a.mode == "-h" || a.mode == "--help") { std::cout << USAGE; std::exit(0); }

  int i = 2;
  if (a.mode == "project" || a.mode == "cache") {
    if (i >= argc) usage_error("missing " + a.mode + " action");
    a.action = argv[i++];
  } else if (a.mode != "index" && a.mode != "query") {
    usage_error("unknown command: " + a.mode);
  }

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) usage_error("missing value after " + f);
      dst = argv[i++];
    };
    auto next_int = [&]() {
      std::string v; next(v);
      try {
        std::size_t used = 0;
        int n = std::stoi(v, &used);
        if (used == v.size()) return n;
      } catch (const std::exception&) {
      }
      usage_error("expected an integer after " + f + ", got '" + v + "'");
    };
    auto next_double = [&]() {
      std::string v; next(v);
      try {
        std::size_t used = 0;
        double d = std::stod(v, &used);
        if (used == v.size()) return d;
      } catch (const std::exception&) {
      }
      usage_error("expected a number after " + f + ", got '" + v + "'");
    };

    if (f == "-h" || f == "--help") { std::cout << USAGE; std::exit(0); }
    else if (f == "--project" || f == "-p") next(a.project);
    else if (f == "--config" || f == "-c") next(a.config_path);
    else if (f == "--index" || f == "-i") next(a.index_name);
    else if (f == "--ext" || f == "-e") { std::string v; next(v); a.extensions.push_back(v); }
    else if (f == "--no-parallel") a.parallel = false;
    else if (f == "--no-save") a.save = false;
    else if (f == "--rebuild") a.rebuild = true;
    else if (f == "--top-k" || f == "-k") a.top_k = next_int();
    else if (f == "--threshold" || f == "-t") a.threshold = next_double();
    else if (f == "--output" || f == "-o") next(a.output);
    else if (f == "--terminal" || f == "-T") a.terminal = true;
    else if (f == "--json") a.json = true;
    else if (f == "--verbose" || f == "-v") a.verbose = true;
    else if (f.size() > 1 && f[0] == '-' && f != "-") usage_error("unknown flag: " + f);
    else a.positional.push_back(f);
  }

  if (a.mode == "project") {
    if (a.action == "set") check_arity(a, 1, 2);
    else if (a.action == "add") check_arity(a, 2, 2);
    else if (a.action == "remove") check_arity(a, 1, 1);
    else if (a.action == "current" || a.action == "list") check_arity(a, 0, 0);
    else usage_error("unknown project action: " + a.action);
  } else if (a.mode == "cache") {
    if (a.action != "clear") usage_error("unknown cache action: " + a.action);
    check_arity(a, 0, 0);
  } else if (a.mode == "index") {
    check_arity(a, 0, 1);
  } else {
    check_arity(a, 1, 1);
  }
  return a;
}
