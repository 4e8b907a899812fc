#include "chunker.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "embedding_cache.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "pipeline.hpp"
#include "project_index.hpp"
#include "projects.hpp"
#include "query.hpp"

#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>

namespace fs = std::filesystem;

namespace {

std::atomic<IndexingPipeline*> g_running{nullptr};

void on_sigint(int) {
  if (IndexingPipeline* p = g_running.load()) p->request_stop();
}

// Project, config and index name a command works against.
struct Session {
  std::optional<Project> project;
  Config cfg;
  std::string index_name;
};

Session open_session(const Args& args, const ProjectRegistry& reg) {
  Session s;
  s.project = reg.resolve(args.project);
  std::string cfg_path = args.config_path;
  if (cfg_path.empty() && s.project) cfg_path = s.project->config_path;
  s.cfg = load_config(cfg_path);
  if (args.verbose) s.cfg.logging.level = "debug";
  setup_logging(s.cfg.logging);

  if (!args.index_name.empty()) s.index_name = args.index_name;
  else if (s.project) s.index_name = s.project->index_name;
  else s.index_name = s.cfg.index_name;
  return s;
}

std::unique_ptr<EmbeddingCache> open_cache(const Session& s) {
  if (!s.cfg.embedder.use_cache) return nullptr;
  fs::path p = fs::path(s.cfg.embedder.cache_dir) / s.index_name / "embeddings.sqlite";
  return std::unique_ptr<EmbeddingCache>(new EmbeddingCache(p.string()));
}

int cmd_project(const Args& args, ProjectRegistry& reg) {
  const auto& pos = args.positional;
  if (args.action == "set") {
    try {
      Project p = reg.set(pos[0], pos.size() > 1 ? pos[1] : "", args.config_path);
      std::cout << "Current project set to '" << p.name << "' (" << p.directory << ")\n";
    } catch (const ProjectNotFoundError&) {
      std::cerr << "Error: Project '" << pos[0] << "' does not exist. To create a new project, specify a directory.\n";
      return 1;
    }
  } else if (args.action == "add") {
    Project p = reg.add(pos[0], pos[1], args.config_path);
    std::cout << "Project '" << p.name << "' added (" << p.directory << ")\n";
  } else if (args.action == "remove") {
    reg.remove(pos[0]);
    std::cout << "Project '" << pos[0] << "' removed.\n";
  } else if (args.action == "list") {
    auto all = reg.list();
    if (all.empty()) {
      std::cout << "No projects found.\n";
      return 0;
    }
    auto cur = reg.current();
    std::cout << "Projects:\n";
    for (const auto& p : all) {
      bool is_current = cur && cur->name == p.name;
      std::cout << "  " << p.name << (is_current ? " (current)" : "") << ": " << p.directory << "\n";
    }
  } else {
    auto cur = reg.current();
    if (!cur) {
      std::cout << "No current project set.\n";
      return 0;
    }
    std::cout << "Current project: " << cur->name << "\n"
              << "  Directory: " << cur->directory << "\n";
    if (!cur->config_path.empty()) std::cout << "  Config: " << cur->config_path << "\n";
    std::cout << "  Index name: " << cur->index_name << "\n";
  }
  return 0;
}

int cmd_index(const Args& args, const ProjectRegistry& reg) {
  Session s = open_session(args, reg);
  std::string root = !args.positional.empty() ? args.positional[0]
                   : s.project ? s.project->directory : "";
  if (root.empty()) {
    std::cerr << "Error: No root directory specified and no current project set.\n";
    return 1;
  }

  ChunkerRegistry chunkers = make_default_registry(s.cfg.extractors);
  auto cache = open_cache(s);
  Embedder embedder(make_backend(s.cfg.embedder), cache.get(), s.cfg.embedder);
  ProjectIndex project(s.cfg.vector_index, s.index_name);
  IndexingPipeline pipeline(s.cfg, chunkers, embedder, project);

  IndexOptions opts;
  opts.root = root;
  opts.extensions.insert(args.extensions.begin(), args.extensions.end());
  opts.parallel = args.parallel;
  opts.save = args.save;
  opts.rebuild = args.rebuild;

  g_running.store(&pipeline);
  auto previous = std::signal(SIGINT, on_sigint);
  IndexRunReport report;
  try {
    report = pipeline.run(opts);
  } catch (...) {
    std::signal(SIGINT, previous);
    g_running.store(nullptr);
    throw;
  }
  std::signal(SIGINT, previous);
  g_running.store(nullptr);

  std::cout << (report.cancelled ? "Partially indexed" : "Successfully indexed") << " codebase at " << root << "\n"
            << "  files: " << report.files_indexed << " indexed, " << report.files_failed << " failed, "
            << report.files_oversized << " too large (" << report.files_scanned << " scanned)\n"
            << "  chunks: " << report.chunks_indexed << " indexed, " << report.chunks_failed << " not embedded\n"
            << "  records: " << report.total_records << " total, " << report.records_removed << " removed, "
            << report.paths_deleted << " deleted files\n";
  if (!report.published) std::cout << "  (not saved)\n";
  return 0;
}

int cmd_query(const Args& args, const ProjectRegistry& reg) {
  Session s = open_session(args, reg);
  const std::string& text = args.positional[0];

  auto cache = open_cache(s);
  Embedder embedder(make_backend(s.cfg.embedder), cache.get(), s.cfg.embedder);
  ProjectIndex project(s.cfg.vector_index, s.index_name);
  QueryEngine engine(s.cfg.retriever, embedder, project);

  auto results = engine.query(text, args.top_k.value_or(s.cfg.retriever.top_k),
                              args.threshold.value_or(s.cfg.retriever.threshold));

  // rendered in full before the old output is truncated
  const std::string body = format_results(text, results, args.json);
  std::ofstream out(args.output, std::ios::trunc);
  out << body;
  out.close();
  if (!out) throw std::runtime_error("cannot write " + args.output);

  std::cout << "Results for query: " << text << "\n"
            << "Found " << results.size() << " results. Saved to " << args.output << "\n";
  if (args.terminal) {
    std::cout << "\nFull results:\n";
    for (std::size_t i = 0; i < results.size(); ++i)
      std::cout << "Result " << i + 1 << ":\n" << results[i].rendered << "\n";
  }
  return 0;
}

int cmd_cache(const Args& args, const ProjectRegistry& reg) {
  Session s = open_session(args, reg);
  fs::path p = fs::path(s.cfg.embedder.cache_dir) / s.index_name / "embeddings.sqlite";
  if (!fs::exists(p)) {
    std::cout << "No embedding cache at " << p.string() << "\n";
    return 0;
  }
  EmbeddingCache cache(p.string());
  std::size_t n = cache.clear();
  std::cout << "Cleared " << n << " cached embeddings from " << p.string() << "\n";
  return 0;
}

int dispatch(const Args& args) {
  ProjectRegistry reg;
  if (args.mode == "project") return cmd_project(args, reg);
  if (args.mode == "index") return cmd_index(args, reg);
  if (args.mode == "query") return cmd_query(args, reg);
  return cmd_cache(args, reg);
}

} // namespace

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);

  LoggingConfig boot;
  if (args.verbose) boot.level = "debug";
  setup_logging(boot);

  try {
    return dispatch(args);
  } catch (const ProjectNotFoundError& e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const ProjectAlreadyExistsError& e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const std::invalid_argument& e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const ConfigurationError& e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const std::exception& e) {
    // corruption, lock contention, backend and I/O failures
    spdlog::error("{}", e.what());
    return 3;
  }
}
