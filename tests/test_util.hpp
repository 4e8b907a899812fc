#pragma once
#include "config.hpp"
#include "embedder.hpp"
#include "errors.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on scope exit.
struct TempDir {
  fs::path path;

  TempDir() {
    static std::atomic<int> counter{0};
    std::random_device rd;
    path = fs::temp_directory_path() /
           ("ccr_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + "_" + std::to_string(rd()));
    fs::create_directories(path);
    // canonical so paths compare equal to what the pipeline stores
    path = fs::weakly_canonical(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  std::string str(const std::string& rel = "") const { return rel.empty() ? path.string() : (path / rel).string(); }
};

inline void write_file(const fs::path& p, const std::string& content) {
  if (p.has_parent_path()) fs::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << content;
}

// Hashing backend that counts what it is asked and can be told to fail.
class CountingBackend : public EmbeddingBackend {
public:
  explicit CountingBackend(int dim = 256) : inner_(dim) {}

  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++calls;
    texts_seen += texts.size();
    batch_sizes.push_back(texts.size());
    if (fail_retryable > 0) {
      --fail_retryable;
      throw EmbeddingBackendError("transient failure", true);
    }
    if (fail_permanent) throw EmbeddingBackendError("permanent failure", false);
    for (const auto& t : texts) {
      if (!fail_on.empty() && t.find(fail_on) != std::string::npos)
        throw EmbeddingBackendError("refused text", false);
    }
    auto out = inner_.embed_batch(texts);
    if (wrong_dim) for (auto& v : out) v.pop_back();
    return out;
  }
  std::string model_id() const override { return inner_.model_id(); }
  int dim() override { return inner_.dim(); }

  int calls = 0;
  std::size_t texts_seen = 0;
  std::vector<std::size_t> batch_sizes;
  int fail_retryable = 0;
  bool fail_permanent = false;
  bool wrong_dim = false;
  std::string fail_on;

private:
  HashingBackend inner_;
  std::mutex mu_;
};

// Defaults pointed at tmp, hashing embeddings, no score filtering.
inline Config test_config(const TempDir& tmp) {
  Config cfg;
  cfg.index_name = "test";
  cfg.embedder.model = "hashing/256";
  cfg.embedder.cache_dir = tmp.str("cache");
  cfg.embedder.max_retries = 2;
  cfg.vector_index.index_dir = tmp.str("index");
  cfg.retriever.threshold = 0.0;
  cfg.indexing.max_workers = 2;
  return cfg;
}
