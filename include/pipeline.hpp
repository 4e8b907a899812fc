#pragma once
#include "chunker.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "filters.hpp"
#include "project_index.hpp"
#include <atomic>
#include <cstddef>
#include <set>
#include <string>

enum class PipelineState { Idle, Scanning, Extracting, Embedding, Upserting, Persisted, Failed };

const char* state_name(PipelineState s);

struct IndexOptions {
  std::string root;                  // file or directory
  std::set<std::string> extensions;  // ".py" or "py"; empty means every claimed one
  bool parallel = true;
  bool save = true;
  bool rebuild = false;
};

struct IndexRunReport {
  std::size_t files_scanned = 0;
  std::size_t files_indexed = 0;
  std::size_t files_failed = 0;      // extraction errors
  std::size_t files_oversized = 0;
  std::size_t chunks_indexed = 0;
  std::size_t chunks_failed = 0;     // embedding errors
  std::size_t records_removed = 0;
  std::size_t paths_deleted = 0;
  std::size_t total_records = 0;
  bool cancelled = false;
  bool published = false;
  PipelineState state = PipelineState::Idle;
};

// Walks a tree, extracts and embeds on a worker pool, and applies results
// to a staging copy of the project's index from this thread alone. Only a
// run that gets to the end publishes.
class IndexingPipeline {
public:
  IndexingPipeline(const Config& cfg, const ChunkerRegistry& registry, Embedder& embedder, ProjectIndex& project);

  // Takes the project lock, which the ProjectIndex then holds. Per-file errors
  // are counted in the report; lock, configuration, corruption and persist
  // errors leave the state Failed and propagate.
  IndexRunReport run(const IndexOptions& opts);

  // Stops scheduling files. Files in flight are still applied and the run
  // publishes what it has. Safe from a signal handler's thread.
  void request_stop() { stop_.store(true); }

  PipelineState state() const { return state_.load(); }

private:
  struct FileResult;
  FileResult process_file(const std::string& path);
  void apply(FileResult& r, VectorIndex& staging, IndexRunReport& report);
  void remove_vanished(const std::string& root, VectorIndex& staging, IndexRunReport& report);
  IndexRunReport run_stages(const IndexOptions& opts);

  const Config& cfg_;
  const ChunkerRegistry& registry_;
  Embedder& embedder_;
  ProjectIndex& project_;
  PathFilter filter_;
  std::atomic<bool> stop_{false};
  std::atomic<PipelineState> state_{PipelineState::Idle};
};
