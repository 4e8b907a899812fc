#include "embedding_cache.hpp"
#include "sqlite_util.hpp"
#include <cstring>
#include <filesystem>
#include <mutex>
#include <stdexcept>

struct EmbeddingCache::Impl {
  sqlite3* db = nullptr;
  mutable std::mutex mu;
};

EmbeddingCache::EmbeddingCache(const std::string& path, int busy_timeout_ms) : path_(path), impl_(new Impl) {
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  if (sqlite3_open_v2(path.c_str(), &impl_->db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr) != SQLITE_OK) {
    std::string e = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
    sqlite3_close(impl_->db);
    impl_->db = nullptr;
    throw std::runtime_error("embedding cache open failed (" + path + "): " + e);
  }
  sqlite3_busy_timeout(impl_->db, busy_timeout_ms);
  sqlite_exec(impl_->db, "PRAGMA journal_mode=WAL;");
  sqlite_exec(impl_->db,
    "CREATE TABLE IF NOT EXISTS embeddings ("
    " model_id TEXT NOT NULL,"
    " content_hash TEXT NOT NULL,"
    " dim INTEGER NOT NULL,"
    " vector BLOB NOT NULL,"
    " PRIMARY KEY (model_id, content_hash)"
    ");");
}

EmbeddingCache::~EmbeddingCache() {
  if (impl_ && impl_->db) sqlite3_close(impl_->db);
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string& hash, const std::string& model_id) const {
  std::lock_guard<std::mutex> lock(impl_->mu);
  Stmt s(impl_->db, "SELECT dim, vector FROM embeddings WHERE model_id=? AND content_hash=?");
  sqlite3_bind_text(s.st, 1, model_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 2, hash.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(s.st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("embedding cache read: ") + sqlite3_errmsg(impl_->db));

  int dim = sqlite3_column_int(s.st, 0);
  const void* blob = sqlite3_column_blob(s.st, 1);
  int bytes = sqlite3_column_bytes(s.st, 1);
  // a torn or foreign row is a miss, it will be overwritten
  if (dim <= 0 || bytes != dim * (int)sizeof(float)) return std::nullopt;
  std::vector<float> v(dim);
  std::memcpy(v.data(), blob, bytes);
  return v;
}

void EmbeddingCache::put(const std::string& hash, const std::string& model_id, const std::vector<float>& vec) {
  std::lock_guard<std::mutex> lock(impl_->mu);
  Stmt s(impl_->db,
    "INSERT OR REPLACE INTO embeddings (model_id, content_hash, dim, vector) VALUES (?, ?, ?, ?)");
  sqlite3_bind_text(s.st, 1, model_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 2, hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(s.st, 3, (int)vec.size());
  sqlite3_bind_blob(s.st, 4, vec.data(), (int)(vec.size() * sizeof(float)), SQLITE_TRANSIENT);
  if (sqlite3_step(s.st) != SQLITE_DONE)
    throw std::runtime_error(std::string("embedding cache write: ") + sqlite3_errmsg(impl_->db));
}

std::size_t EmbeddingCache::clear(const std::string& model_id) {
  std::lock_guard<std::mutex> lock(impl_->mu);
  Stmt s(impl_->db, model_id.empty() ? "DELETE FROM embeddings" : "DELETE FROM embeddings WHERE model_id=?");
  if (!model_id.empty()) sqlite3_bind_text(s.st, 1, model_id.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(s.st) != SQLITE_DONE)
    throw std::runtime_error(std::string("embedding cache clear: ") + sqlite3_errmsg(impl_->db));
  return (std::size_t)sqlite3_changes(impl_->db);
}

std::size_t EmbeddingCache::size() const {
  std::lock_guard<std::mutex> lock(impl_->mu);
  Stmt s(impl_->db, "SELECT COUNT(*) FROM embeddings");
  if (sqlite3_step(s.st) != SQLITE_ROW)
    throw std::runtime_error(std::string("embedding cache count: ") + sqlite3_errmsg(impl_->db));
  return (std::size_t)sqlite3_column_int64(s.st, 0);
}
