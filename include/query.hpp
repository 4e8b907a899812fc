#pragma once
#include "chunk.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

class Embedder;
class ProjectIndex;

struct ScoredChunk {
  std::int64_t record_id = 0;
  Chunk chunk;
  float score = 0.0f;
  std::string rendered;
};

// Fills a result template. Placeholders: {file} {type} {name} {score}
// {full_text} {separator} {start_line} {end_line}, with fmt format specs.
// Throws ConfigurationError on a template fmt rejects.
std::string render_chunk(const std::string& tmpl, const std::string& separator, const Chunk& c, float score);

// render_chunk against a sample chunk, for validation.
void check_format_template(const std::string& tmpl);

// [{file, type, name, score, start_line, end_line, text}, ...]
nlohmann::json results_to_json(const std::vector<ScoredChunk>& results);

// "Results for query: ..." followed by one "Result i:" block per result.
std::string results_to_text(const std::string& query, const std::vector<ScoredChunk>& results);

// The text written by `ccr query`: results_to_json dumped with two-space
// indent, or results_to_text. Invalid UTF-8 in chunk text becomes U+FFFD.
std::string format_results(const std::string& query, const std::vector<ScoredChunk>& results, bool json);

// Semantic search over the published snapshot of one project.
class QueryEngine {
public:
  QueryEngine(const RetrieverConfig& cfg, Embedder& embedder, ProjectIndex& project);

  // Best first, at most top_k, none scoring below threshold (0 keeps all).
  // top_k <= 0 or a threshold outside [0, 1] is a ConfigurationError, raised
  // before anything is embedded or searched.
  std::vector<ScoredChunk> query(const std::string& text, int top_k, double threshold) const;
  std::vector<ScoredChunk> query(const std::string& text) const {
    return query(text, cfg_.top_k, cfg_.threshold);
  }

private:
  RetrieverConfig cfg_;
  Embedder& embedder_;
  ProjectIndex& project_;
};
