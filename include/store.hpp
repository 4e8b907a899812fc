#pragma once
#include "chunk.hpp"
#include <cstdint>
#include <string>
#include <vector>

// A chunk as it lives in an index: its id and embedding.
struct IndexRecord {
  std::int64_t id = 0;
  Chunk chunk;
  std::vector<float> vector;
};

// chunks.sqlite of one index generation: record metadata plus the raw
// vectors the HNSW graph was built from.
class RecordStore {
public:
  explicit RecordStore(const std::string& sqlite_path);
  ~RecordStore();
  RecordStore(const RecordStore&) = delete;
  RecordStore& operator=(const RecordStore&) = delete;

  void begin();
  void commit();
  void rollback();

  void upsert(const IndexRecord& r);
  // Every record, by ascending id. Rows whose vector is not dim floats
  // throw IndexCorruptionError.
  std::vector<IndexRecord> load_all(int dim) const;

private:
  void ensure_schema();

  struct Impl;
  Impl* impl_;
};
