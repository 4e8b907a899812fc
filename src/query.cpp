#include "query.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "project_index.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string render_chunk(const std::string& tmpl, const std::string& separator, const Chunk& c, float score) {
  try {
    return fmt::format(fmt::runtime(tmpl),
                       fmt::arg("file", c.file),
                       fmt::arg("type", c.type),
                       fmt::arg("name", c.name),
                       fmt::arg("score", score),
                       fmt::arg("full_text", c.text),
                       fmt::arg("separator", separator),
                       fmt::arg("start_line", c.ls),
                       fmt::arg("end_line", c.le));
  } catch (const fmt::format_error& e) {
    throw ConfigurationError(std::string("retriever.format_template: ") + e.what());
  }
}

void check_format_template(const std::string& tmpl) {
  Chunk sample;
  sample.file = "/src/example.py";
  sample.type = chunk_types::kFunction;
  sample.name = "example";
  sample.text = "def example():\n    pass";
  sample.ls = 1;
  sample.le = 2;
  render_chunk(tmpl, "----", sample, 0.5f);
}

nlohmann::json results_to_json(const std::vector<ScoredChunk>& results) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& r : results) {
    arr.push_back({
      {"file", r.chunk.file},
      {"type", r.chunk.type},
      {"name", r.chunk.name},
      {"score", r.score},
      {"start_line", r.chunk.ls},
      {"end_line", r.chunk.le},
      {"text", r.chunk.text},
    });
  }
  return arr;
}

std::string results_to_text(const std::string& query, const std::vector<ScoredChunk>& results) {
  std::string out = "Results for query: " + query + "\n\n";
  for (std::size_t i = 0; i < results.size(); ++i) {
    out += fmt::format("Result {}:\n{}\n\n", i + 1, results[i].rendered);
  }
  return out;
}

std::string format_results(const std::string& query, const std::vector<ScoredChunk>& results, bool json) {
  if (!json) return results_to_text(query, results);
  return results_to_json(results).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

QueryEngine::QueryEngine(const RetrieverConfig& cfg, Embedder& embedder, ProjectIndex& project)
  : cfg_(cfg), embedder_(embedder), project_(project) {
  check_format_template(cfg_.format_template);
  if (!project_.snapshot()) project_.open();
}

std::vector<ScoredChunk> QueryEngine::query(const std::string& text, int top_k, double threshold) const {
  if (top_k <= 0) throw ConfigurationError("top_k must be positive, got " + std::to_string(top_k));
  if (!(threshold >= 0.0 && threshold <= 1.0))
    throw ConfigurationError("threshold must be within [0, 1], got " + std::to_string(threshold));
  if (text.empty()) throw std::invalid_argument("empty query");

  std::shared_ptr<const VectorIndex> snap = project_.snapshot();
  if (!snap || snap->size() == 0) {
    spdlog::warn("index {} is empty; run `ccr index` first", project_.dir());
    return {};
  }
  if (snap->model_id() != embedder_.model_id())
    throw ConfigurationError("index was built with " + snap->model_id() + " but the embedder is " +
                             embedder_.model_id() + "; re-index with --rebuild");

  std::vector<float> q = embedder_.embed(text);
  std::vector<SearchHit> hits = snap->search(q, top_k);

  std::vector<ScoredChunk> out;
  out.reserve(hits.size());
  for (const auto& h : hits) {
    if (threshold > 0.0 && h.score < threshold) continue;
    const IndexRecord* rec = snap->get(h.id);
    if (!rec) continue;
    ScoredChunk sc;
    sc.record_id = h.id;
    sc.chunk = rec->chunk;
    sc.score = h.score;
    sc.rendered = render_chunk(cfg_.format_template, cfg_.separator, sc.chunk, sc.score);
    out.push_back(std::move(sc));
  }
  spdlog::debug("query '{}': {} candidates, {} above {}", text, hits.size(), out.size(), threshold);
  return out;
}
