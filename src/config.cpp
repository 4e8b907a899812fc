#include "config.hpp"
#include "errors.hpp"
#include "query.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

// Every key the loader understands, as a dotted path.
const char* const kKnownKeys[] = {
  "index_name",
  "extractors.max_file_size",
  "extractors.python.include_comments",
  "extractors.markdown.split_by_headings",
  "embedder.model",
  "embedder.cache_dir",
  "embedder.use_cache",
  "embedder.batch_size",
  "embedder.max_workers",
  "embedder.max_retries",
  "embedder.timeout_seconds",
  "embedder.api_base",
  "embedder.api_key_env",
  "embedder.dimensions",
  "vector_index.index_dir",
  "vector_index.metric",
  "vector_index.hnsw_m",
  "vector_index.ef_construction",
  "vector_index.ef_search",
  "retriever.top_k",
  "retriever.threshold",
  "retriever.format_template",
  "retriever.separator",
  "indexing.max_workers",
  "indexing.exclude_dirs",
  "indexing.exclude_files",
  "logging.level",
  "logging.file",
};

json::json_pointer to_pointer(const std::string& dotted) {
  std::string p = "/" + dotted;
  std::replace(p.begin(), p.end(), '.', '/');
  return json::json_pointer(p);
}

std::string to_env_name(const std::string& dotted) {
  std::string e = "CCR_";
  for (char c : dotted) e += (c == '.') ? '_' : (char)std::toupper((unsigned char)c);
  return e;
}

bool is_known(const std::string& dotted) {
  for (auto* k : kKnownKeys) if (dotted == k) return true;
  return false;
}

void warn_unknown(const json& j, const std::string& prefix) {
  for (auto it = j.begin(); it != j.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
    if (is_known(key)) continue;
    bool is_section = false;
    for (auto* k : kKnownKeys) {
      if (std::string(k).rfind(key + ".", 0) == 0) { is_section = true; break; }
    }
    if (is_section && it.value().is_object()) warn_unknown(it.value(), key);
    else spdlog::warn("config: ignoring unknown key '{}'", key);
  }
}

json defaults_to_json() {
  Config d;
  json j;
  j["index_name"] = d.index_name;
  j["extractors"] = {
    {"max_file_size", d.extractors.max_file_size},
    {"python", {{"include_comments", d.extractors.python_include_comments}}},
    {"markdown", {{"split_by_headings", d.extractors.markdown_split_by_headings}}},
  };
  j["embedder"] = {
    {"model", d.embedder.model},
    {"cache_dir", d.embedder.cache_dir},
    {"use_cache", d.embedder.use_cache},
    {"batch_size", d.embedder.batch_size},
    {"max_workers", d.embedder.max_workers},
    {"max_retries", d.embedder.max_retries},
    {"timeout_seconds", d.embedder.timeout_seconds},
    {"api_base", d.embedder.api_base},
    {"api_key_env", d.embedder.api_key_env},
    {"dimensions", d.embedder.dimensions},
  };
  j["vector_index"] = {
    {"index_dir", d.vector_index.index_dir},
    {"metric", d.vector_index.metric},
    {"hnsw_m", d.vector_index.hnsw_m},
    {"ef_construction", d.vector_index.ef_construction},
    {"ef_search", d.vector_index.ef_search},
  };
  j["retriever"] = {
    {"top_k", d.retriever.top_k},
    {"threshold", d.retriever.threshold},
    {"format_template", d.retriever.format_template},
    {"separator", d.retriever.separator},
  };
  j["indexing"] = {
    {"max_workers", d.indexing.max_workers},
    {"exclude_dirs", d.indexing.exclude_dirs},
    {"exclude_files", d.indexing.exclude_files},
  };
  j["logging"] = {
    {"level", d.logging.level},
    {"file", d.logging.file},
  };
  return j;
}

void apply_env(json& j) {
  for (auto* k : kKnownKeys) {
    const char* v = std::getenv(to_env_name(k).c_str());
    if (!v) continue;
    // Bare words such as a model name are not JSON; keep them as strings.
    json value;
    try {
      value = json::parse(v);
    } catch (const json::parse_error&) {
      value = std::string(v);
    }
    j[to_pointer(k)] = value;
    spdlog::debug("config: {} overridden from environment", k);
  }
}

template <typename T>
T read(const json& j, const char* dotted) {
  try {
    return j.at(to_pointer(dotted)).get<T>();
  } catch (const json::exception& e) {
    throw ConfigurationError(std::string("bad value for ") + dotted + ": " + e.what());
  }
}

Config decode(const json& j) {
  Config c;
  c.index_name = read<std::string>(j, "index_name");
  c.extractors.max_file_size = read<std::size_t>(j, "extractors.max_file_size");
  c.extractors.python_include_comments = read<bool>(j, "extractors.python.include_comments");
  c.extractors.markdown_split_by_headings = read<bool>(j, "extractors.markdown.split_by_headings");

  c.embedder.model = read<std::string>(j, "embedder.model");
  c.embedder.cache_dir = read<std::string>(j, "embedder.cache_dir");
  c.embedder.use_cache = read<bool>(j, "embedder.use_cache");
  c.embedder.batch_size = read<int>(j, "embedder.batch_size");
  c.embedder.max_workers = read<int>(j, "embedder.max_workers");
  c.embedder.max_retries = read<int>(j, "embedder.max_retries");
  c.embedder.timeout_seconds = read<int>(j, "embedder.timeout_seconds");
  c.embedder.api_base = read<std::string>(j, "embedder.api_base");
  c.embedder.api_key_env = read<std::string>(j, "embedder.api_key_env");
  c.embedder.dimensions = read<int>(j, "embedder.dimensions");

  c.vector_index.index_dir = read<std::string>(j, "vector_index.index_dir");
  c.vector_index.metric = read<std::string>(j, "vector_index.metric");
  c.vector_index.hnsw_m = read<int>(j, "vector_index.hnsw_m");
  c.vector_index.ef_construction = read<int>(j, "vector_index.ef_construction");
  c.vector_index.ef_search = read<int>(j, "vector_index.ef_search");

  c.retriever.top_k = read<int>(j, "retriever.top_k");
  c.retriever.threshold = read<double>(j, "retriever.threshold");
  c.retriever.format_template = read<std::string>(j, "retriever.format_template");
  c.retriever.separator = read<std::string>(j, "retriever.separator");

  c.indexing.max_workers = read<int>(j, "indexing.max_workers");
  c.indexing.exclude_dirs = read<std::vector<std::string>>(j, "indexing.exclude_dirs");
  c.indexing.exclude_files = read<std::vector<std::string>>(j, "indexing.exclude_files");

  c.logging.level = read<std::string>(j, "logging.level");
  c.logging.file = read<std::string>(j, "logging.file");
  return c;
}

} // namespace

void Config::validate() const {
  if (index_name.empty()) throw ConfigurationError("index_name must not be empty");
  if (vector_index.metric != "cosine" && vector_index.metric != "l2")
    throw ConfigurationError("vector_index.metric must be 'cosine' or 'l2', got '" + vector_index.metric + "'");
  if (retriever.top_k <= 0) throw ConfigurationError("retriever.top_k must be > 0");
  if (retriever.threshold < 0.0 || retriever.threshold > 1.0)
    throw ConfigurationError("retriever.threshold must be within [0, 1]");
  if (embedder.batch_size <= 0) throw ConfigurationError("embedder.batch_size must be > 0");
  if (embedder.max_workers <= 0) throw ConfigurationError("embedder.max_workers must be > 0");
  if (embedder.max_retries < 0) throw ConfigurationError("embedder.max_retries must be >= 0");
  if (embedder.timeout_seconds <= 0) throw ConfigurationError("embedder.timeout_seconds must be > 0");
  if (embedder.dimensions < 0) throw ConfigurationError("embedder.dimensions must be >= 0");
  if (indexing.max_workers <= 0) throw ConfigurationError("indexing.max_workers must be > 0");
  if (vector_index.hnsw_m <= 0 || vector_index.ef_construction <= 0 || vector_index.ef_search <= 0)
    throw ConfigurationError("vector_index HNSW parameters must be > 0");
  if (extractors.max_file_size == 0) throw ConfigurationError("extractors.max_file_size must be > 0");

  static const char* levels[] = {"trace", "debug", "info", "warn", "error", "off"};
  if (std::find(std::begin(levels), std::end(levels), logging.level) == std::end(levels))
    throw ConfigurationError("logging.level '" + logging.level + "' is not a level");

  check_format_template(retriever.format_template);
}

Config config_from_json_text(const std::string& json_text, bool with_env) {
  json j = defaults_to_json();
  if (!json_text.empty()) {
    json user;
    try {
      user = json::parse(json_text);
    } catch (const json::parse_error& e) {
      throw ConfigurationError(std::string("JSON parse error: ") + e.what());
    }
    if (!user.is_object()) throw ConfigurationError("top level must be an object");
    warn_unknown(user, "");
    j.merge_patch(user);
  }
  if (with_env) apply_env(j);

  Config c = decode(j);
  c.validate();
  return c;
}

Config load_config(const std::string& path) {
  std::string text;
  if (!path.empty()) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open " + path);
    std::ostringstream ss; ss << in.rdbuf(); text = ss.str();
    spdlog::debug("config: loaded {}", path);
  }
  return config_from_json_text(text);
}
