#pragma once
#include "config.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

class EmbeddingCache;
class WorkerPool;

// A text -> vector model. Implementations throw EmbeddingBackendError.
class EmbeddingBackend {
public:
  virtual ~EmbeddingBackend() = default;

  // One vector per text, same order, each of size dim().
  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) = 0;
  // Names the embedding space; part of every cache key.
  virtual std::string model_id() const = 0;
  virtual int dim() = 0;
};

// Local GGUF model through llama.cpp. Mean pooled, L2-normalized.
class LlamaBackend : public EmbeddingBackend {
public:
  explicit LlamaBackend(const std::string& embed_model_path);
  ~LlamaBackend() override;

  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
  std::string model_id() const override { return model_id_; }
  int dim() override { return dim_; }

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::string model_id_;
  int dim_;
};

// OpenAI-compatible HTTP embeddings endpoint.
class RemoteBackend : public EmbeddingBackend {
public:
  RemoteBackend(const std::string& model, const EmbedderConfig& cfg);
  ~RemoteBackend() override;

  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
  std::string model_id() const override { return "remote/" + model_; }
  int dim() override;  // configured, else probed once

private:
  std::string model_;
  std::string endpoint_;
  std::string api_key_;
  long timeout_s_;
  std::atomic<int> dim_;
};

// Feature-hashed bag of words. Deterministic, no model needed.
class HashingBackend : public EmbeddingBackend {
public:
  explicit HashingBackend(int dim = 384) : dim_(dim) {}

  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
  std::string model_id() const override { return "hashing/" + std::to_string(dim_); }
  int dim() override { return dim_; }

  std::vector<float> embed_one(const std::string& text) const;

private:
  int dim_;
};

// Chooses the backend named by cfg.model:
//   *.gguf            -> LlamaBackend
//   openai/<m>, api/<m> -> RemoteBackend
//   hashing[/<dim>]   -> HashingBackend
// Anything else is a ConfigurationError.
std::shared_ptr<EmbeddingBackend> make_backend(const EmbedderConfig& cfg);

struct EmbedderStats {
  std::size_t cache_hits = 0;
  std::size_t cache_misses = 0;
  std::size_t backend_calls = 0;
  std::size_t retries = 0;
};

// Batches texts through a backend with a content-addressed cache in front.
class Embedder {
public:
  // cache may be null; cfg.use_cache=false also bypasses it.
  Embedder(std::shared_ptr<EmbeddingBackend> backend, EmbeddingCache* cache, const EmbedderConfig& cfg);
  ~Embedder();

  // 1:1 and order preserving. Throws EmbeddingBackendError if any
  // sub-batch fails after its retries; nothing partial is returned.
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts);
  std::vector<float> embed(const std::string& text);

  int dim() { return backend_->dim(); }
  std::string model_id() const { return backend_->model_id(); }
  EmbedderStats stats() const;

private:
  std::vector<std::vector<float>> call_backend(const std::vector<std::string>& texts);

  std::shared_ptr<EmbeddingBackend> backend_;
  EmbeddingCache* cache_;
  EmbedderConfig cfg_;
  std::unique_ptr<WorkerPool> pool_;
  std::atomic<std::size_t> hits_{0}, misses_{0}, calls_{0}, retries_{0};
};
