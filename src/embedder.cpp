#include "embedder.hpp"
#include "embedding_cache.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <thread>
#include <unordered_map>

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

int parse_dim(const std::string& s) {
  try {
    std::size_t used = 0;
    int d = std::stoi(s, &used);
    if (used == s.size() && d > 0) return d;
  } catch (const std::exception&) {
  }
  throw ConfigurationError("embedder.model: bad hashing dimension '" + s + "'");
}

} // namespace

std::shared_ptr<EmbeddingBackend> make_backend(const EmbedderConfig& cfg) {
  const std::string& m = cfg.model;
  if (ends_with(m, ".gguf")) return std::make_shared<LlamaBackend>(m);

  if (starts_with(m, "openai/") || starts_with(m, "api/")) {
    std::string name = m.substr(m.find('/') + 1);
    if (name.empty()) throw ConfigurationError("embedder.model: missing model name in '" + m + "'");
#ifdef CCR_HAVE_CURL
    return std::make_shared<RemoteBackend>(name, cfg);
#else
    throw ConfigurationError("embedder.model '" + m + "' needs the remote backend, which was built without libcurl");
#endif
  }

  if (m == "hashing") return std::make_shared<HashingBackend>(cfg.dimensions > 0 ? cfg.dimensions : 384);
  if (starts_with(m, "hashing/")) return std::make_shared<HashingBackend>(parse_dim(m.substr(8)));

  throw ConfigurationError("embedder.model '" + m +
                           "': expected a .gguf path, openai/<name>, api/<name> or hashing[/<dim>]");
}

Embedder::Embedder(std::shared_ptr<EmbeddingBackend> backend, EmbeddingCache* cache, const EmbedderConfig& cfg)
  : backend_(std::move(backend)), cache_(cache), cfg_(cfg),
    pool_(new WorkerPool(cfg.max_workers > 0 ? (std::size_t)cfg.max_workers : 1)) {
  if (!backend_) throw ConfigurationError("embedder: no backend");
}

Embedder::~Embedder() = default;

EmbedderStats Embedder::stats() const {
  EmbedderStats s;
  s.cache_hits = hits_.load();
  s.cache_misses = misses_.load();
  s.backend_calls = calls_.load();
  s.retries = retries_.load();
  return s;
}

std::vector<std::vector<float>> Embedder::call_backend(const std::vector<std::string>& texts) {
  for (int attempt = 0;; ++attempt) {
    ++calls_;
    try {
      std::vector<std::vector<float>> out = backend_->embed_batch(texts);
      if (out.size() != texts.size())
        throw EmbeddingBackendError("backend returned " + std::to_string(out.size()) + " vectors for " +
                                    std::to_string(texts.size()) + " texts", false);
      const std::size_t d = (std::size_t)backend_->dim();
      for (const auto& v : out) {
        if (v.size() != d)
          throw EmbeddingBackendError("dimension mismatch: got " + std::to_string(v.size()) + ", expected " +
                                      std::to_string(d), false);
      }
      return out;
    } catch (const EmbeddingBackendError& e) {
      if (!e.retryable() || attempt >= cfg_.max_retries) throw;
      ++retries_;
      spdlog::warn("{} (attempt {}/{}), retrying", e.what(), attempt + 1, cfg_.max_retries + 1);
      std::this_thread::sleep_for(std::chrono::milliseconds(100 << attempt));
    } catch (const CcrError&) {
      throw;
    } catch (const std::exception& e) {
      throw EmbeddingBackendError(e.what(), false);
    }
  }
}

std::vector<std::vector<float>> Embedder::embed_batch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out(texts.size());
  if (texts.empty()) return out;

  const bool cached = cache_ && cfg_.use_cache;
  const std::string mid = backend_->model_id();

  // unique miss texts, and the input slots each one fills
  std::vector<std::string> miss_texts;
  std::vector<std::string> miss_hashes;
  std::vector<std::vector<std::size_t>> miss_slots;
  std::unordered_map<std::string, std::size_t> by_hash;
  std::size_t local_hits = 0;

  for (std::size_t i = 0; i < texts.size(); ++i) {
    std::string h = sha256_hex(texts[i]);
    if (cached) {
      std::optional<std::vector<float>> v;
      try {
        v = cache_->get(h, mid);
      } catch (const std::exception& e) {
        spdlog::warn("{}; treating as a miss", e.what());
      }
      if (v) {
        out[i] = std::move(*v);
        ++hits_;
        ++local_hits;
        continue;
      }
    }
    ++misses_;
    auto it = by_hash.find(h);
    if (it != by_hash.end()) {
      miss_slots[it->second].push_back(i);
      continue;
    }
    by_hash.emplace(h, miss_texts.size());
    miss_texts.push_back(texts[i]);
    miss_hashes.push_back(std::move(h));
    miss_slots.push_back({i});
  }

  if (miss_texts.empty()) {
    spdlog::debug("embedder: {} texts, all cached", texts.size());
    return out;
  }

  const std::size_t bs = cfg_.batch_size > 0 ? (std::size_t)cfg_.batch_size : miss_texts.size();
  std::vector<std::vector<std::vector<float>>> results;
  if (miss_texts.size() <= bs) {
    results.push_back(call_backend(miss_texts));
  } else {
    std::vector<std::future<std::vector<std::vector<float>>>> futs;
    for (std::size_t b = 0; b < miss_texts.size(); b += bs) {
      std::vector<std::string> sub(miss_texts.begin() + b,
                                   miss_texts.begin() + std::min(miss_texts.size(), b + bs));
      futs.push_back(pool_->submit([this, sub = std::move(sub)] { return call_backend(sub); }));
    }
    // wait for every sub-batch before reporting the first failure
    std::exception_ptr first;
    for (auto& f : futs) {
      try {
        results.push_back(f.get());
      } catch (...) {
        if (!first) first = std::current_exception();
      }
    }
    if (first) std::rethrow_exception(first);
  }

  std::size_t u = 0;
  bool cache_writable = cached;
  for (auto& batch : results) {
    for (auto& v : batch) {
      if (cache_writable) {
        try {
          cache_->put(miss_hashes[u], mid, v);
        } catch (const std::exception& e) {
          // the vectors are still good; the rest of this batch goes uncached
          spdlog::warn("{}; not caching {} embeddings", e.what(), miss_texts.size() - u);
          cache_writable = false;
        }
      }
      for (std::size_t slot : miss_slots[u]) out[slot] = v;
      ++u;
    }
  }
  spdlog::debug("embedder: {} texts, {} cached, {} sent to {}", texts.size(), local_hits, miss_texts.size(), mid);
  return out;
}

std::vector<float> Embedder::embed(const std::string& text) {
  return embed_batch({text}).front();
}
