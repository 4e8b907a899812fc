#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Persistent (model_id, content_hash) -> vector map. Entries are never
// mutated; put() on an existing key replaces it with the same value.
// Thread-safe; several processes may share the file.
class EmbeddingCache {
public:
  // busy_timeout_ms bounds how long a write waits on another process.
  explicit EmbeddingCache(const std::string& sqlite_path, int busy_timeout_ms = 5000);
  ~EmbeddingCache();
  EmbeddingCache(const EmbeddingCache&) = delete;
  EmbeddingCache& operator=(const EmbeddingCache&) = delete;

  std::optional<std::vector<float>> get(const std::string& content_hash, const std::string& model_id) const;
  void put(const std::string& content_hash, const std::string& model_id, const std::vector<float>& vec);

  // Removes every entry, or only those of model_id. Returns rows removed.
  std::size_t clear(const std::string& model_id = "");
  std::size_t size() const;

  const std::string& path() const { return path_; }

private:
  std::string path_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
