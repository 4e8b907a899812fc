#include "store.hpp"
#include "errors.hpp"
#include "sqlite_util.hpp"
#include <cstring>
#include <stdexcept>

struct RecordStore::Impl {
  sqlite3* db = nullptr;
};

RecordStore::RecordStore(const std::string& path) : impl_(new Impl) {
  if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
    std::string e = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
    sqlite3_close(impl_->db);
    delete impl_;
    throw std::runtime_error("sqlite open failed (" + path + "): " + e);
  }
  try {
    ensure_schema();
  } catch (...) {
    sqlite3_close(impl_->db);
    delete impl_;
    throw;
  }
}

RecordStore::~RecordStore() {
  if (impl_) {
    if (impl_->db) sqlite3_close(impl_->db);
    delete impl_;
  }
}

void RecordStore::ensure_schema() {
  sqlite_exec(impl_->db,
    "CREATE TABLE IF NOT EXISTS chunks ("
    " id INTEGER PRIMARY KEY,"
    " file TEXT NOT NULL,"
    " chunk_type TEXT NOT NULL,"
    " name TEXT NOT NULL,"
    " text TEXT NOT NULL,"
    " start_line INTEGER NOT NULL,"
    " end_line INTEGER NOT NULL,"
    " content_hash TEXT NOT NULL,"
    " vector BLOB NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS chunks_file ON chunks(file);");
}

void RecordStore::begin() { sqlite_exec(impl_->db, "BEGIN IMMEDIATE;"); }
void RecordStore::commit() { sqlite_exec(impl_->db, "COMMIT;"); }
void RecordStore::rollback() { sqlite_exec(impl_->db, "ROLLBACK;"); }

void RecordStore::upsert(const IndexRecord& r) {
  Stmt s(impl_->db,
    "INSERT INTO chunks (id, file, chunk_type, name, text, start_line, end_line, content_hash, vector) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT(id) DO UPDATE SET "
    " file=excluded.file, chunk_type=excluded.chunk_type, name=excluded.name, text=excluded.text,"
    " start_line=excluded.start_line, end_line=excluded.end_line,"
    " content_hash=excluded.content_hash, vector=excluded.vector;");
  const Chunk& c = r.chunk;
  sqlite3_bind_int64(s.st, 1, (sqlite3_int64)r.id);
  sqlite3_bind_text(s.st, 2, c.file.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 3, c.type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 4, c.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 5, c.text.c_str(), (int)c.text.size(), SQLITE_TRANSIENT);
  sqlite3_bind_int(s.st, 6, c.ls);
  sqlite3_bind_int(s.st, 7, c.le);
  sqlite3_bind_text(s.st, 8, c.content_hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(s.st, 9, r.vector.data(), (int)(r.vector.size() * sizeof(float)), SQLITE_TRANSIENT);

  if (sqlite3_step(s.st) != SQLITE_DONE)
    throw std::runtime_error(std::string("sqlite insert failed: ") + sqlite3_errmsg(impl_->db));
}

std::vector<IndexRecord> RecordStore::load_all(int dim) const {
  Stmt s(impl_->db,
    "SELECT id, file, chunk_type, name, text, start_line, end_line, content_hash, vector "
    "FROM chunks ORDER BY id");
  auto col_text = [&](int i) {
    const unsigned char* t = sqlite3_column_text(s.st, i);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(s.st, i)) : std::string();
  };

  std::vector<IndexRecord> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    IndexRecord r;
    r.id = sqlite3_column_int64(s.st, 0);
    r.chunk.file = col_text(1);
    r.chunk.type = col_text(2);
    r.chunk.name = col_text(3);
    r.chunk.text = col_text(4);
    r.chunk.ls = sqlite3_column_int(s.st, 5);
    r.chunk.le = sqlite3_column_int(s.st, 6);
    r.chunk.content_hash = col_text(7);

    const void* blob = sqlite3_column_blob(s.st, 8);
    int bytes = sqlite3_column_bytes(s.st, 8);
    if (bytes != dim * (int)sizeof(float))
      throw IndexCorruptionError("record " + std::to_string(r.id) + " has a " + std::to_string(bytes) +
                                 "-byte vector, expected dim " + std::to_string(dim));
    r.vector.resize(dim);
    std::memcpy(r.vector.data(), blob, bytes);
    out.push_back(std::move(r));
  }
  if (rc != SQLITE_DONE)
    throw std::runtime_error(std::string("sqlite read failed: ") + sqlite3_errmsg(impl_->db));
  return out;
}
