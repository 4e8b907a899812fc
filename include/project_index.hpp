#pragma once
#include "config.hpp"
#include "index.hpp"
#include <memory>
#include <mutex>
#include <string>

// On-disk home of one project's index:
//   <index_dir>/<index_name>/CURRENT      name of the live generation
//   <index_dir>/<index_name>/gen-NNNNNN/  one persisted VectorIndex each
//   <index_dir>/<index_name>/.lock        held by the writing process
//
// Readers take snapshot() and keep using it; publish() swaps in a new one.
class ProjectIndex {
public:
  ProjectIndex(const VectorIndexConfig& cfg, const std::string& index_name);
  ~ProjectIndex();
  ProjectIndex(const ProjectIndex&) = delete;
  ProjectIndex& operator=(const ProjectIndex&) = delete;

  // Non-blocking exclusive lock, held until destruction.
  // Throws IndexLockError if another writer has it.
  void lock();

  bool has_published() const;

  // Loads the live generation as the snapshot. Null when nothing is published.
  std::shared_ptr<const VectorIndex> open();

  // A private, mutable copy of the live generation for an indexing run, or
  // a new empty index when nothing is published or rebuild is set. A
  // published index built with another metric, model or dimension is a
  // ConfigurationError unless rebuild is set.
  std::unique_ptr<VectorIndex> load_staging(int dim, const std::string& model_id, bool rebuild) const;

  // Persists into a fresh generation, flips CURRENT, swaps the snapshot and
  // drops generations older than the previous one.
  std::shared_ptr<const VectorIndex> publish(std::unique_ptr<VectorIndex> index);

  std::shared_ptr<const VectorIndex> snapshot() const;

  const std::string& dir() const { return dir_; }

private:
  std::string current_generation() const;
  int next_generation() const;
  void prune(const std::string& keep_a, const std::string& keep_b) const;

  VectorIndexConfig cfg_;
  std::string dir_;
  int lock_fd_ = -1;
  mutable std::mutex mu_;
  std::shared_ptr<const VectorIndex> snapshot_;
};
