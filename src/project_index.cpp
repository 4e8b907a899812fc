#include "project_index.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const char* const kGenPrefix = "gen-";

std::string gen_name(int n) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s%06d", kGenPrefix, n);
  return buf;
}

// -1 for anything that is not gen-<digits>
int gen_number(const std::string& name) {
  if (name.rfind(kGenPrefix, 0) != 0 || name.size() <= std::strlen(kGenPrefix)) return -1;
  std::string digits = name.substr(std::strlen(kGenPrefix));
  if (digits.size() > 9) return -1;
  for (char c : digits) if (c < '0' || c > '9') return -1;
  return std::stoi(digits);
}

} // namespace

ProjectIndex::ProjectIndex(const VectorIndexConfig& cfg, const std::string& index_name)
  : cfg_(cfg), dir_((fs::path(cfg.index_dir) / index_name).string()) {}

ProjectIndex::~ProjectIndex() {
  if (lock_fd_ != -1) {
    ::flock(lock_fd_, LOCK_UN);
    ::close(lock_fd_);
  }
}

void ProjectIndex::lock() {
  if (lock_fd_ != -1) return;
  fs::create_directories(dir_);
  std::string path = (fs::path(dir_) / ".lock").string();
  int fd = ::open(path.c_str(), O_CREAT | O_RDWR, 0644);
  if (fd == -1) throw IndexLockError("cannot open " + path + ": " + std::strerror(errno));
  if (::flock(fd, LOCK_EX | LOCK_NB) == -1) {
    int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK)
      throw IndexLockError("index " + dir_ + " is being updated by another process");
    throw IndexLockError("cannot lock " + path + ": " + std::strerror(err));
  }
  lock_fd_ = fd;
}

std::string ProjectIndex::current_generation() const {
  std::ifstream in(fs::path(dir_) / "CURRENT");
  std::string name;
  if (!in || !std::getline(in, name)) return "";
  if (gen_number(name) < 0) throw IndexCorruptionError(dir_ + ": CURRENT names '" + name + "'");
  return name;
}

bool ProjectIndex::has_published() const {
  return !current_generation().empty();
}

std::shared_ptr<const VectorIndex> ProjectIndex::open() {
  std::string gen = current_generation();
  std::shared_ptr<const VectorIndex> idx;
  if (!gen.empty()) idx = VectorIndex::load((fs::path(dir_) / gen).string(), cfg_.ef_search);
  std::lock_guard<std::mutex> lock(mu_);
  snapshot_ = idx;
  return snapshot_;
}

std::unique_ptr<VectorIndex> ProjectIndex::load_staging(int dim, const std::string& model_id, bool rebuild) const {
  std::string gen = current_generation();
  if (!rebuild && !gen.empty()) {
    auto idx = VectorIndex::load((fs::path(dir_) / gen).string(), cfg_.ef_search);
    if (idx->metric() != cfg_.metric)
      throw ConfigurationError("index " + dir_ + " uses metric " + idx->metric() + ", configured " + cfg_.metric +
                               "; re-run with --rebuild");
    if (idx->model_id() != model_id || idx->dim() != dim)
      throw ConfigurationError("index " + dir_ + " was built with " + idx->model_id() + " (dim " +
                               std::to_string(idx->dim()) + "), configured " + model_id + " (dim " +
                               std::to_string(dim) + "); re-run with --rebuild");
    return idx;
  }
  return std::unique_ptr<VectorIndex>(
    new VectorIndex(dim, cfg_.metric, model_id, cfg_.hnsw_m, cfg_.ef_construction, cfg_.ef_search));
}

int ProjectIndex::next_generation() const {
  int top = 0;
  if (fs::is_directory(dir_)) {
    for (const auto& e : fs::directory_iterator(dir_)) top = std::max(top, gen_number(e.path().filename().string()));
  }
  return top + 1;
}

void ProjectIndex::prune(const std::string& keep_a, const std::string& keep_b) const {
  for (const auto& e : fs::directory_iterator(dir_)) {
    std::string name = e.path().filename().string();
    if (gen_number(name) < 0 || name == keep_a || name == keep_b) continue;
    std::error_code ec;
    fs::remove_all(e.path(), ec);
    if (ec) spdlog::warn("could not remove old generation {}: {}", e.path().string(), ec.message());
  }
}

std::shared_ptr<const VectorIndex> ProjectIndex::publish(std::unique_ptr<VectorIndex> index) {
  fs::create_directories(dir_);
  std::string previous = current_generation();
  std::string gen = gen_name(next_generation());
  fs::path gen_dir = fs::path(dir_) / gen;

  try {
    index->persist(gen_dir.string());
  } catch (...) {
    std::error_code ec;
    fs::remove_all(gen_dir, ec);
    throw;
  }

  fs::path tmp = fs::path(dir_) / "CURRENT.tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    out << gen << "\n";
    out.close();
    if (!out) throw std::runtime_error("cannot write " + tmp.string());
  }
  fs::rename(tmp, fs::path(dir_) / "CURRENT");

  std::shared_ptr<const VectorIndex> published(std::move(index));
  {
    std::lock_guard<std::mutex> lock(mu_);
    snapshot_ = published;
  }
  prune(gen, previous);
  spdlog::info("published {} ({} records)", (fs::path(dir_) / gen).string(), published->size());
  return published;
}

std::shared_ptr<const VectorIndex> ProjectIndex::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return snapshot_;
}
