#pragma once
#include "store.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct SearchHit {
  std::int64_t id;
  float score;
};

// Records of one project plus an HNSW graph over their vectors. The metric,
// dimension and model id are fixed for the life of the index.
//
// Mutations (add, remove_by_path, persist) need external serialization;
// const members may run concurrently with each other.
class VectorIndex {
public:
  VectorIndex(int dim, const std::string& metric, const std::string& model_id,
              int M = 16, int ef_construction = 200, int ef_search = 64);
  ~VectorIndex();
  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;

  // Reads a directory written by persist(). ef_search 0 keeps the stored
  // value. Inconsistent files throw IndexCorruptionError.
  static std::unique_ptr<VectorIndex> load(const std::string& dir, int ef_search = 0);

  // All or nothing: an id already present or a vector of the wrong size
  // throws std::invalid_argument and leaves the index untouched.
  void add(const std::vector<IndexRecord>& records);
  std::size_t remove_by_path(const std::string& file);

  // Up to top_k hits, best first. Ties: file, start line, id.
  std::vector<SearchHit> search(const std::vector<float>& q, int top_k) const;

  void persist(const std::string& dir);

  std::vector<const IndexRecord*> records_for_path(const std::string& file) const;
  std::vector<std::string> indexed_paths() const;
  const IndexRecord* get(std::int64_t id) const;

  std::size_t size() const { return records_.size(); }
  std::int64_t next_id() const { return next_id_; }
  std::int64_t allocate_id() { return next_id_++; }

  int dim() const { return dim_; }
  const std::string& metric() const { return metric_; }
  const std::string& model_id() const { return model_id_; }

  // Exact similarity under this index's metric; higher is closer.
  float score(const std::vector<float>& a, const std::vector<float>& b) const;

private:
  void reserve_for(std::size_t extra);
  void compact();

  int dim_, M_, efC_, efS_;
  std::string metric_;
  std::string model_id_;
  std::int64_t next_id_ = 0;
  std::map<std::int64_t, IndexRecord> records_;
  std::map<std::string, std::vector<std::int64_t>> by_path_;
  // pimpl so headers stay light
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
