#pragma once
#include <stdexcept>
#include <string>

// Base for every error this library throws on purpose.
struct CcrError : std::runtime_error {
  explicit CcrError(const std::string& what) : std::runtime_error(what) {}
};

// One file could not be parsed. The pipeline skips the file and continues.
struct ExtractionError : CcrError {
  ExtractionError(const std::string& file, const std::string& why)
    : CcrError("extract " + file + ": " + why), file_(file) {}
  const std::string& file() const { return file_; }
private:
  std::string file_;
};

// A backend call failed. Retryable errors (timeouts, transport, 429/5xx)
// are retried per sub-batch before this escapes the embedder.
struct EmbeddingBackendError : CcrError {
  EmbeddingBackendError(const std::string& what, bool retryable)
    : CcrError("embedder: " + what), retryable_(retryable) {}
  bool retryable() const { return retryable_; }
private:
  bool retryable_;
};

// Persisted index does not match itself. Requires a rebuild.
struct IndexCorruptionError : CcrError {
  explicit IndexCorruptionError(const std::string& what)
    : CcrError("index corrupt: " + what) {}
};

// Another indexing run holds the project's lock file.
struct IndexLockError : CcrError {
  explicit IndexLockError(const std::string& what) : CcrError(what) {}
};

struct ProjectNotFoundError : CcrError {
  explicit ProjectNotFoundError(const std::string& name)
    : CcrError("Project not found: " + name) {}
};

struct ProjectAlreadyExistsError : CcrError {
  explicit ProjectAlreadyExistsError(const std::string& name)
    : CcrError("Project already exists: " + name) {}
};

struct ConfigurationError : CcrError {
  explicit ConfigurationError(const std::string& what)
    : CcrError("config: " + what) {}
};
