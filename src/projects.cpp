#include "projects.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void write_atomic(const fs::path& path, const std::string& data) {
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out << data;
    out.close();
    if (!out) throw std::runtime_error("cannot write " + tmp.string());
  }
  fs::rename(tmp, path);
}

std::string trim(std::string s) {
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
  std::size_t i = 0;
  while (i < s.size() && std::isspace((unsigned char)s[i])) ++i;
  return s.substr(i);
}

} // namespace

std::string ProjectRegistry::default_home() {
  if (const char* h = std::getenv("CCR_HOME"); h && *h) return h;
  const char* home = std::getenv("HOME");
  return (fs::path(home && *home ? home : ".") / ".code_context_retriever").string();
}

ProjectRegistry::ProjectRegistry(const std::string& home) : home_(home.empty() ? default_home() : home) {
  fs::create_directories(home_);
  load();
}

void ProjectRegistry::load() {
  fs::path pf = fs::path(home_) / "projects.json";
  if (fs::exists(pf)) {
    try {
      std::ifstream in(pf);
      json j = json::parse(in);
      for (auto it = j.begin(); it != j.end(); ++it) {
        Project p;
        p.name = it.key();
        p.directory = it.value().value("directory", "");
        const auto& cp = it.value().value("config_path", json());
        p.config_path = cp.is_string() ? cp.get<std::string>() : "";
        p.index_name = it.value().value("index_name", p.name);
        projects_[p.name] = p;
      }
    } catch (const json::exception& e) {
      spdlog::error("ignoring unreadable {}: {}", pf.string(), e.what());
      projects_.clear();
    }
  }

  std::ifstream cur(fs::path(home_) / "current_project");
  if (cur) {
    std::stringstream ss;
    ss << cur.rdbuf();
    std::string name = trim(ss.str());
    if (projects_.count(name)) current_ = name;
  }
}

void ProjectRegistry::save_projects() const {
  json j = json::object();
  for (const auto& kv : projects_) {
    const Project& p = kv.second;
    j[p.name] = {
      {"directory", p.directory},
      {"config_path", p.config_path.empty() ? json() : json(p.config_path)},
      {"index_name", p.index_name},
    };
  }
  write_atomic(fs::path(home_) / "projects.json", j.dump(2) + "\n");
}

void ProjectRegistry::save_current() const {
  fs::path cf = fs::path(home_) / "current_project";
  if (current_.empty()) {
    std::error_code ec;
    fs::remove(cf, ec);
    if (ec) spdlog::warn("could not remove {}: {}", cf.string(), ec.message());
    return;
  }
  write_atomic(cf, current_ + "\n");
}

Project ProjectRegistry::make(const std::string& name, const std::string& directory,
                              const std::string& config_path) const {
  if (name.empty()) throw std::invalid_argument("project name is empty");
  if (!fs::is_directory(directory)) throw std::invalid_argument("Directory does not exist: " + directory);
  if (!config_path.empty() && !fs::is_regular_file(config_path))
    throw std::invalid_argument("Config file does not exist: " + config_path);
  Project p;
  p.name = name;
  p.directory = fs::weakly_canonical(fs::absolute(directory)).string();
  p.config_path = config_path.empty() ? "" : fs::weakly_canonical(fs::absolute(config_path)).string();
  p.index_name = name;
  return p;
}

Project ProjectRegistry::set(const std::string& name, const std::string& directory, const std::string& config_path) {
  if (directory.empty()) {
    auto it = projects_.find(name);
    if (it == projects_.end()) throw ProjectNotFoundError(name);
    current_ = name;
    save_current();
    return it->second;
  }
  Project p = make(name, directory, config_path);
  projects_[name] = p;
  save_projects();
  current_ = name;
  save_current();
  spdlog::debug("project {} -> {}", name, p.directory);
  return p;
}

Project ProjectRegistry::add(const std::string& name, const std::string& directory, const std::string& config_path) {
  if (projects_.count(name)) throw ProjectAlreadyExistsError(name);
  Project p = make(name, directory, config_path);
  projects_[name] = p;
  save_projects();
  return p;
}

std::optional<Project> ProjectRegistry::current() const {
  if (current_.empty()) return std::nullopt;
  return get(current_);
}

std::optional<Project> ProjectRegistry::get(const std::string& name) const {
  auto it = projects_.find(name);
  if (it == projects_.end()) return std::nullopt;
  return it->second;
}

std::vector<Project> ProjectRegistry::list() const {
  std::vector<Project> out;
  out.reserve(projects_.size());
  for (const auto& kv : projects_) out.push_back(kv.second);
  return out;
}

void ProjectRegistry::remove(const std::string& name) {
  if (!projects_.erase(name)) throw ProjectNotFoundError(name);
  save_projects();
  if (current_ == name) {
    current_.clear();
    save_current();
  }
}

std::optional<Project> ProjectRegistry::resolve(const std::string& override_name) const {
  if (!override_name.empty()) {
    auto p = get(override_name);
    if (!p) throw ProjectNotFoundError(override_name);
    return p;
  }
  return current();
}
