#include "index.hpp"
#include "errors.hpp"
#include <hnswlib/hnswlib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <tuple>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kFormatVersion = 1;
constexpr std::size_t kInitialCapacity = 1024;

double norm_of(const std::vector<float>& v) {
  double s = 0.0;
  for (float x : v) s += (double)x * x;
  return std::sqrt(s);
}

std::vector<float> normalized(const std::vector<float>& v) {
  double n = norm_of(v);
  std::vector<float> out(v);
  if (n > 0.0) for (auto& x : out) x = (float)(x / n);
  return out;
}

} // namespace

struct VectorIndex::Impl {
  std::unique_ptr<hnswlib::SpaceInterface<float>> space;
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> hnsw;
};

VectorIndex::VectorIndex(int dim, const std::string& metric, const std::string& model_id,
                         int M, int efC, int efS)
  : dim_(dim), M_(M), efC_(efC), efS_(efS), metric_(metric), model_id_(model_id), impl_(new Impl) {
  if (dim <= 0) throw std::invalid_argument("VectorIndex: dimension must be positive");
  if (metric_ == "cosine") {
    // vectors go in normalized, so inner product ranks like cosine
    impl_->space.reset(new hnswlib::InnerProductSpace(dim_));
  } else if (metric_ == "l2") {
    impl_->space.reset(new hnswlib::L2Space(dim_));
  } else {
    throw ConfigurationError("vector_index.metric must be cosine or l2, got '" + metric_ + "'");
  }
  impl_->hnsw.reset(new hnswlib::HierarchicalNSW<float>(impl_->space.get(), kInitialCapacity, M_, efC_));
  impl_->hnsw->setEf(efS_);
}

VectorIndex::~VectorIndex() = default;

float VectorIndex::score(const std::vector<float>& a, const std::vector<float>& b) const {
  double dot = 0.0, dist = 0.0;
  for (int i = 0; i < dim_; ++i) {
    dot += (double)a[i] * b[i];
    double d = (double)a[i] - b[i];
    dist += d * d;
  }
  if (metric_ == "l2") return (float)(1.0 / (1.0 + std::sqrt(dist)));
  double na = norm_of(a), nb = norm_of(b);
  if (na == 0.0 || nb == 0.0) return 0.0f;
  return (float)(dot / (na * nb));
}

void VectorIndex::reserve_for(std::size_t extra) {
  auto& h = *impl_->hnsw;
  std::size_t need = h.getCurrentElementCount() + extra;
  if (need <= h.getMaxElements()) return;
  std::size_t cap = std::max<std::size_t>(h.getMaxElements(), kInitialCapacity);
  while (cap < need) cap *= 2;
  h.resizeIndex(cap);
}

void VectorIndex::add(const std::vector<IndexRecord>& records) {
  std::set<std::int64_t> batch;
  for (const auto& r : records) {
    if ((int)r.vector.size() != dim_)
      throw std::invalid_argument("VectorIndex::add: record " + std::to_string(r.id) + " has dim " +
                                  std::to_string(r.vector.size()) + ", index has " + std::to_string(dim_));
    if (r.id < 0 || records_.count(r.id) || !batch.insert(r.id).second)
      throw std::invalid_argument("VectorIndex::add: duplicate record id " + std::to_string(r.id));
  }

  reserve_for(records.size());
  for (const auto& r : records) {
    // re-adding a deleted label revives its graph node in place
    if (metric_ == "cosine") {
      auto v = normalized(r.vector);
      impl_->hnsw->addPoint(v.data(), (hnswlib::labeltype)r.id);
    } else {
      impl_->hnsw->addPoint(r.vector.data(), (hnswlib::labeltype)r.id);
    }
    by_path_[r.chunk.file].push_back(r.id);
    records_.emplace(r.id, r);
    next_id_ = std::max(next_id_, r.id + 1);
  }
}

std::size_t VectorIndex::remove_by_path(const std::string& file) {
  auto it = by_path_.find(file);
  if (it == by_path_.end()) return 0;
  std::size_t n = 0;
  for (std::int64_t id : it->second) {
    impl_->hnsw->markDelete((hnswlib::labeltype)id);
    n += records_.erase(id);
  }
  by_path_.erase(it);
  return n;
}

std::vector<SearchHit> VectorIndex::search(const std::vector<float>& q, int top_k) const {
  if ((int)q.size() != dim_)
    throw std::invalid_argument("VectorIndex::search: query has dim " + std::to_string(q.size()) +
                                ", index has " + std::to_string(dim_));
  if (top_k <= 0 || records_.empty()) return {};

  std::vector<SearchHit> hits;
  std::size_t want = std::max<std::size_t>((std::size_t)top_k, (std::size_t)efS_);
  if (want >= records_.size()) {
    // small enough to score everything exactly
    hits.reserve(records_.size());
    for (const auto& kv : records_) hits.push_back({kv.first, score(q, kv.second.vector)});
  } else {
    std::vector<float> probe = metric_ == "cosine" ? normalized(q) : q;
    auto res = impl_->hnsw->searchKnn(probe.data(), want);
    hits.reserve(res.size());
    while (!res.empty()) {
      auto id = (std::int64_t)res.top().second;
      res.pop();
      auto it = records_.find(id);
      if (it != records_.end()) hits.push_back({id, score(q, it->second.vector)});
    }
  }

  auto key = [this](const SearchHit& h) {
    const Chunk& c = records_.at(h.id).chunk;
    return std::tie(c.file, c.ls);
  };
  std::sort(hits.begin(), hits.end(), [&](const SearchHit& a, const SearchHit& b) {
    if (a.score != b.score) return a.score > b.score;
    auto ka = key(a), kb = key(b);
    if (ka != kb) return ka < kb;
    return a.id < b.id;
  });
  if ((int)hits.size() > top_k) hits.resize(top_k);
  return hits;
}

void VectorIndex::compact() {
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> fresh(new hnswlib::HierarchicalNSW<float>(
    impl_->space.get(), std::max(records_.size(), kInitialCapacity), M_, efC_));
  fresh->setEf(efS_);
  for (const auto& kv : records_) {
    if (metric_ == "cosine") {
      auto v = normalized(kv.second.vector);
      fresh->addPoint(v.data(), (hnswlib::labeltype)kv.first);
    } else {
      fresh->addPoint(kv.second.vector.data(), (hnswlib::labeltype)kv.first);
    }
  }
  spdlog::debug("compacted index: dropped {} deleted elements", impl_->hnsw->getDeletedCount());
  impl_->hnsw = std::move(fresh);
}

void VectorIndex::persist(const std::string& dir) {
  fs::create_directories(dir);
  if (impl_->hnsw->getDeletedCount() > records_.size()) compact();

  impl_->hnsw->saveIndex((fs::path(dir) / "vectors.hnsw").string());

  fs::path db = fs::path(dir) / "chunks.sqlite";
  fs::remove(db);
  {
    RecordStore store(db.string());
    store.begin();
    try {
      for (const auto& kv : records_) store.upsert(kv.second);
      store.commit();
    } catch (...) {
      store.rollback();
      throw;
    }
  }

  json manifest = {
    {"format_version", kFormatVersion},
    {"dim", dim_},
    {"metric", metric_},
    {"model_id", model_id_},
    {"next_id", next_id_},
    {"record_count", records_.size()},
    {"hnsw", {{"m", M_}, {"ef_construction", efC_}, {"ef_search", efS_}}},
  };
  std::ofstream out(fs::path(dir) / "manifest.json", std::ios::trunc);
  out << manifest.dump(2) << "\n";
  out.close();
  if (!out) throw std::runtime_error("cannot write manifest in " + dir);
}

std::unique_ptr<VectorIndex> VectorIndex::load(const std::string& dir, int ef_search) {
  fs::path base(dir);
  for (const char* f : {"manifest.json", "vectors.hnsw", "chunks.sqlite"}) {
    if (!fs::is_regular_file(base / f)) throw IndexCorruptionError(dir + ": missing " + f);
  }

  json m;
  try {
    std::ifstream in(base / "manifest.json");
    m = json::parse(in);
  } catch (const json::exception& e) {
    throw IndexCorruptionError(dir + ": unreadable manifest: " + e.what());
  }

  std::unique_ptr<VectorIndex> idx;
  std::size_t record_count = 0;
  try {
    if (m.at("format_version").get<int>() != kFormatVersion)
      throw IndexCorruptionError(dir + ": unsupported format version " + m.at("format_version").dump());
    const auto& h = m.at("hnsw");
    int efs = ef_search > 0 ? ef_search : h.at("ef_search").get<int>();
    idx.reset(new VectorIndex(m.at("dim").get<int>(), m.at("metric").get<std::string>(),
                              m.at("model_id").get<std::string>(), h.at("m").get<int>(),
                              h.at("ef_construction").get<int>(), efs));
    idx->next_id_ = m.at("next_id").get<std::int64_t>();
    record_count = m.at("record_count").get<std::size_t>();
  } catch (const json::exception& e) {
    throw IndexCorruptionError(dir + ": bad manifest: " + e.what());
  } catch (const std::invalid_argument& e) {
    throw IndexCorruptionError(dir + ": bad manifest: " + e.what());
  } catch (const ConfigurationError& e) {
    throw IndexCorruptionError(dir + ": bad manifest: " + e.what());
  }

  auto& impl = *idx->impl_;
  try {
    impl.hnsw.reset(new hnswlib::HierarchicalNSW<float>(impl.space.get(), (base / "vectors.hnsw").string()));
  } catch (const std::runtime_error& e) {
    throw IndexCorruptionError(dir + ": vectors.hnsw: " + e.what());
  }
  impl.hnsw->setEf(idx->efS_);
  std::size_t stored_bytes = impl.hnsw->label_offset_ - impl.hnsw->offsetData_;
  if (stored_bytes != (std::size_t)idx->dim_ * sizeof(float))
    throw IndexCorruptionError(dir + ": vectors.hnsw dimension disagrees with manifest");

  std::vector<IndexRecord> recs = RecordStore((base / "chunks.sqlite").string()).load_all(idx->dim_);
  if (recs.size() != record_count)
    throw IndexCorruptionError(dir + ": manifest lists " + std::to_string(record_count) + " records, store has " +
                               std::to_string(recs.size()));

  std::set<std::int64_t> live_labels;
  for (const auto& kv : impl.hnsw->label_lookup_) {
    if (!impl.hnsw->isMarkedDeleted(kv.second)) live_labels.insert((std::int64_t)kv.first);
  }
  std::set<std::int64_t> ids;
  for (const auto& r : recs) ids.insert(r.id);
  if (ids != live_labels)
    throw IndexCorruptionError(dir + ": graph labels and stored records differ");

  for (auto& r : recs) {
    if (r.id >= idx->next_id_) throw IndexCorruptionError(dir + ": record id beyond next_id");
    idx->by_path_[r.chunk.file].push_back(r.id);
    std::int64_t id = r.id;
    idx->records_.emplace(id, std::move(r));
  }
  return idx;
}

std::vector<const IndexRecord*> VectorIndex::records_for_path(const std::string& file) const {
  std::vector<const IndexRecord*> out;
  auto it = by_path_.find(file);
  if (it == by_path_.end()) return out;
  for (std::int64_t id : it->second) out.push_back(&records_.at(id));
  return out;
}

std::vector<std::string> VectorIndex::indexed_paths() const {
  std::vector<std::string> out;
  out.reserve(by_path_.size());
  for (const auto& kv : by_path_) out.push_back(kv.first);
  return out;
}

const IndexRecord* VectorIndex::get(std::int64_t id) const {
  auto it = records_.find(id);
  return it == records_.end() ? nullptr : &it->second;
}
