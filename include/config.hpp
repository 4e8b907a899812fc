#pragma once
#include <cstddef>
#include <string>
#include <vector>

struct ExtractorConfig {
  std::size_t max_file_size = 1024 * 1024;
  bool python_include_comments = true;
  bool markdown_split_by_headings = true;
};

struct EmbedderConfig {
  std::string model = "./models/embed.gguf";
  std::string cache_dir = ".cache/embeddings";
  bool use_cache = true;
  int batch_size = 32;
  int max_workers = 4;
  int max_retries = 2;
  int timeout_seconds = 30;
  std::string api_base = "https://api.openai.com/v1";
  std::string api_key_env = "OPENAI_API_KEY";
  int dimensions = 0;              // 0: ask the backend
};

struct VectorIndexConfig {
  std::string index_dir = ".cache/vector_index";
  std::string metric = "cosine";   // "cosine" or "l2"
  int hnsw_m = 16;
  int ef_construction = 200;
  int ef_search = 64;
};

struct RetrieverConfig {
  int top_k = 75;
  double threshold = 0.35;
  std::string format_template =
    "File: {file} | Type: {type} | Name: {name}\n"
    "Score: {score:.4f}\n"
    "{separator}\n"
    "{full_text}\n"
    "{separator}\n";
  std::string separator = "----------------------------------------";
};

struct IndexingConfig {
  int max_workers = 4;
  std::vector<std::string> exclude_dirs = {".git", "node_modules", "__pycache__", "venv", ".env", ".venv"};
  std::vector<std::string> exclude_files = {"*.pyc", "*.pyo", "*.pyd", "*.so", "*.dll", "*.class"};
};

struct LoggingConfig {
  std::string level = "info";
  std::string file;                // empty: console only
};

struct Config {
  std::string index_name = "default";
  ExtractorConfig extractors;
  EmbedderConfig embedder;
  VectorIndexConfig vector_index;
  RetrieverConfig retriever;
  IndexingConfig indexing;
  LoggingConfig logging;

  // Throws ConfigurationError on the first invalid value.
  void validate() const;
};

// Defaults, then the JSON file at path (if non-empty), then CCR_* variables.
// The result is validated.
Config load_config(const std::string& path = "");

// Same, from an in-memory JSON document. Used by load_config and tests.
Config config_from_json_text(const std::string& json_text, bool with_env = true);
