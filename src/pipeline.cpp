#include "pipeline.hpp"
#include "errors.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <deque>
#include <filesystem>
#include <future>
#include <map>
#include <stdexcept>
#include <tuple>

namespace fs = std::filesystem;

const char* state_name(PipelineState s) {
  switch (s) {
    case PipelineState::Idle: return "idle";
    case PipelineState::Scanning: return "scanning";
    case PipelineState::Extracting: return "extracting";
    case PipelineState::Embedding: return "embedding";
    case PipelineState::Upserting: return "upserting";
    case PipelineState::Persisted: return "persisted";
    case PipelineState::Failed: return "failed";
  }
  return "unknown";
}

struct IndexingPipeline::FileResult {
  enum Outcome { Ok, TooLarge, ExtractFailed, EmbedFailed };
  std::string path;
  Outcome outcome = Ok;
  std::vector<Chunk> chunks;
  std::vector<std::vector<float>> vectors;
  std::string error;
};

IndexingPipeline::IndexingPipeline(const Config& cfg, const ChunkerRegistry& registry, Embedder& embedder,
                                   ProjectIndex& project)
  : cfg_(cfg), registry_(registry), embedder_(embedder), project_(project),
    filter_(cfg.indexing.exclude_dirs, cfg.indexing.exclude_files) {}

IndexingPipeline::FileResult IndexingPipeline::process_file(const std::string& path) {
  FileResult r;
  r.path = path;
  try {
    ExtractResult ex = registry_.extract(path);
    if (ex.status == ExtractStatus::TooLarge) {
      r.outcome = FileResult::TooLarge;
      return r;
    }
    r.chunks = std::move(ex.chunks);
  } catch (const ExtractionError& e) {
    r.outcome = FileResult::ExtractFailed;
    r.error = e.what();
    return r;
  } catch (const ConfigurationError&) {
    throw;
  } catch (const std::exception& e) {
    r.outcome = FileResult::ExtractFailed;
    r.error = path + ": " + e.what();
    return r;
  }
  if (r.chunks.empty()) return r;

  state_.store(PipelineState::Embedding);
  std::vector<std::string> texts;
  texts.reserve(r.chunks.size());
  for (const auto& c : r.chunks) texts.push_back(c.text);
  try {
    r.vectors = embedder_.embed_batch(texts);
  } catch (const ConfigurationError&) {
    throw;
  } catch (const std::exception& e) {
    r.outcome = FileResult::EmbedFailed;
    r.error = e.what();
  }
  return r;
}

void IndexingPipeline::apply(FileResult& r, VectorIndex& staging, IndexRunReport& report) {
  state_.store(PipelineState::Upserting);
  switch (r.outcome) {
    case FileResult::ExtractFailed:
      spdlog::warn("skipping file: {}", r.error);
      ++report.files_failed;
      return;
    case FileResult::EmbedFailed:
      // previous records of the file stay searchable
      spdlog::warn("skipping {} chunks of {}: {}", r.chunks.size(), r.path, r.error);
      report.chunks_failed += r.chunks.size();
      return;
    case FileResult::TooLarge:
      ++report.files_oversized;
      report.records_removed += staging.remove_by_path(r.path);
      return;
    case FileResult::Ok:
      break;
  }

  // ids of chunks that come back unchanged are kept
  std::map<std::tuple<std::string, int, int>, std::int64_t> old_ids;
  for (const IndexRecord* rec : staging.records_for_path(r.path)) {
    old_ids.emplace(std::make_tuple(rec->chunk.content_hash, rec->chunk.ls, rec->chunk.le), rec->id);
  }
  std::size_t removed = staging.remove_by_path(r.path);

  std::vector<IndexRecord> records;
  records.reserve(r.chunks.size());
  std::size_t reused = 0;
  for (std::size_t i = 0; i < r.chunks.size(); ++i) {
    IndexRecord rec;
    auto it = old_ids.find(std::make_tuple(r.chunks[i].content_hash, r.chunks[i].ls, r.chunks[i].le));
    if (it != old_ids.end()) {
      rec.id = it->second;
      old_ids.erase(it);
      ++reused;
    } else {
      rec.id = staging.allocate_id();
    }
    rec.chunk = std::move(r.chunks[i]);
    rec.vector = std::move(r.vectors[i]);
    records.push_back(std::move(rec));
  }
  staging.add(records);

  ++report.files_indexed;
  report.chunks_indexed += records.size();
  report.records_removed += removed - reused;
  spdlog::debug("indexed {}: {} chunks ({} unchanged)", r.path, records.size(), reused);
}

void IndexingPipeline::remove_vanished(const std::string& root, VectorIndex& staging, IndexRunReport& report) {
  const std::string prefix = root + "/";
  for (const auto& path : staging.indexed_paths()) {
    bool under = path == root || path.compare(0, prefix.size(), prefix) == 0;
    if (!under) continue;
    std::error_code ec;
    if (fs::exists(path, ec) || ec) {
      // still on disk, but now excluded
      if (ec || path == root || !filter_.excluded_path(path.substr(prefix.size()))) continue;
      report.records_removed += staging.remove_by_path(path);
      spdlog::info("removed excluded file {}", path);
      continue;
    }
    report.records_removed += staging.remove_by_path(path);
    ++report.paths_deleted;
    spdlog::info("removed deleted file {}", path);
  }
}

IndexRunReport IndexingPipeline::run(const IndexOptions& opts) {
  stop_.store(false);
  try {
    return run_stages(opts);
  } catch (...) {
    spdlog::debug("indexing failed while {}", state_name(state_.load()));
    state_.store(PipelineState::Failed);
    throw;
  }
}

IndexRunReport IndexingPipeline::run_stages(const IndexOptions& opts) {
  IndexRunReport report;
  state_.store(PipelineState::Scanning);

  std::error_code ec;
  fs::path root_path = fs::weakly_canonical(fs::absolute(opts.root), ec);
  if (ec || !fs::exists(root_path)) throw std::invalid_argument("no such file or directory: " + opts.root);
  const std::string root = root_path.string();

  std::set<std::string> exts;
  const auto claimed = registry_.extensions();
  for (std::string e : opts.extensions) {
    if (e.empty()) continue;
    if (e[0] != '.') e.insert(e.begin(), '.');
    for (auto& ch : e) ch = (char)std::tolower((unsigned char)ch);
    if (!claimed.count(e)) {
      spdlog::warn("no chunker handles {}, ignoring it", e);
      continue;
    }
    exts.insert(e);
  }
  if (exts.empty()) {
    if (!opts.extensions.empty()) throw std::invalid_argument("none of the requested extensions can be indexed");
    exts = claimed;
  }

  project_.lock();
  std::unique_ptr<VectorIndex> staging = project_.load_staging(embedder_.dim(), embedder_.model_id(), opts.rebuild);

  std::vector<std::string> files = list_source_files(root, filter_, exts);
  report.files_scanned = files.size();
  spdlog::info("indexing {}: {} files, {} records before", root, files.size(), staging->size());

  state_.store(PipelineState::Extracting);
  std::size_t next = 0;
  if (opts.parallel) {
    const std::size_t workers = (std::size_t)std::max(1, cfg_.indexing.max_workers);
    WorkerPool pool(workers);
    std::deque<std::future<FileResult>> inflight;
    for (;;) {
      // at most 2 * workers files in flight
      while (next < files.size() && inflight.size() < 2 * workers && !stop_.load()) {
        const std::string path = files[next++];
        inflight.push_back(pool.submit([this, path] { return process_file(path); }));
      }
      if (inflight.empty()) break;
      FileResult r = inflight.front().get();
      inflight.pop_front();
      apply(r, *staging, report);
    }
  } else {
    for (; next < files.size() && !stop_.load(); ++next) {
      FileResult r = process_file(files[next]);
      apply(r, *staging, report);
    }
  }
  report.cancelled = next < files.size();
  if (report.cancelled) spdlog::warn("stopped early: {} files not processed", files.size() - next);

  state_.store(PipelineState::Upserting);
  remove_vanished(root, *staging, report);
  report.total_records = staging->size();

  if (opts.save) {
    project_.publish(std::move(staging));
    report.published = true;
  } else {
    spdlog::info("--no-save: index left unchanged on disk");
  }
  state_.store(PipelineState::Persisted);
  report.state = PipelineState::Persisted;

  auto st = embedder_.stats();
  spdlog::debug("embedding cache: {} hits, {} misses, {} backend calls, {} retries",
                st.cache_hits, st.cache_misses, st.backend_calls, st.retries);
  spdlog::info("indexed {} of {} files ({} chunks); {} failed, {} oversized, {} chunks not embedded, "
               "{} records removed, {} deleted paths; {} records total",
               report.files_indexed, report.files_scanned, report.chunks_indexed, report.files_failed,
               report.files_oversized, report.chunks_failed, report.records_removed, report.paths_deleted,
               report.total_records);
  return report;
}
