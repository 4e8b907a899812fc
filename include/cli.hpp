#pragma once
#include <optional>
#include <string>
#include <vector>

struct Args {
  std::string mode;                    // "project", "index", "query" or "cache"
  std::string action;                  // project: set|add|current|list|remove, cache: clear
  std::vector<std::string> positional; // name/dir for project, path for index, text for query

  std::string project;                 // --project
  std::string config_path;             // --config
  std::string index_name;              // --index (query)
  std::vector<std::string> extensions; // --ext, repeatable
  bool parallel = true;                // --no-parallel
  bool save = true;                    // --no-save
  bool rebuild = false;                // --rebuild

  std::optional<int> top_k;            // --top-k
  std::optional<double> threshold;     // --threshold
  std::string output = "context.txt";  // --output
  bool terminal = false;               // --terminal
  bool json = false;                   // --json
  bool verbose = false;                // --verbose
};

// Prints usage and exits 1 on a malformed command line, 0 on --help.
Args parse_cli(int argc, char** argv);
