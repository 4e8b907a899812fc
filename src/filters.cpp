// src/filters.cpp
#include "filters.hpp"
#include "chunker.hpp"
#include "errors.hpp"
#include <re2/re2.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

std::string glob_to_regex(const std::string& glob) {
  std::string re = "^";
  for (std::size_t i = 0; i < glob.size(); ++i) {
    char c = glob[i];
    switch (c) {
      case '*': re += ".*"; break;
      case '?': re += "."; break;
      case '[': {
        std::size_t close = glob.find(']', i + 2);
        if (close == std::string::npos) { re += "\\["; break; }
        std::string body = glob.substr(i + 1, close - i - 1);
        if (!body.empty() && body[0] == '!') body[0] = '^';
        re += "[" + body + "]";
        i = close;
        break;
      }
      default:
        re += RE2::QuoteMeta(std::string(1, c));
    }
  }
  return re + "$";
}

struct PathFilter::Impl {
  std::vector<std::unique_ptr<RE2>> dirs;
  std::vector<std::unique_ptr<RE2>> files;

  static void compile(const std::vector<std::string>& globs, std::vector<std::unique_ptr<RE2>>& out) {
    for (auto& g : globs) {
      if (g.empty()) continue;
      auto re = std::make_unique<RE2>(glob_to_regex(g), RE2::Quiet);
      if (!re->ok()) throw ConfigurationError("bad exclude pattern '" + g + "': " + re->error());
      out.push_back(std::move(re));
    }
  }

  static bool any(const std::vector<std::unique_ptr<RE2>>& res, const std::string& s) {
    for (auto& re : res) if (RE2::FullMatch(s, *re)) return true;
    return false;
  }
};

PathFilter::PathFilter(const std::vector<std::string>& exclude_dirs,
                       const std::vector<std::string>& exclude_files)
  : impl_(new Impl) {
  Impl::compile(exclude_dirs, impl_->dirs);
  Impl::compile(exclude_files, impl_->files);
}

PathFilter::~PathFilter() = default;

bool PathFilter::excluded_dir(const std::string& dir_name) const {
  return Impl::any(impl_->dirs, dir_name);
}

bool PathFilter::excluded_file(const std::string& file_name) const {
  return Impl::any(impl_->files, file_name);
}

bool PathFilter::excluded_path(const std::string& rel_path) const {
  fs::path p(rel_path);
  fs::path parent = p.parent_path();
  for (auto& part : parent) {
    auto s = part.string();
    if (s.empty() || s == "." || s == "/") continue;
    if (excluded_dir(s)) return true;
  }
  return excluded_file(p.filename().string());
}

std::vector<std::string> list_source_files(const std::string& root,
                                           const PathFilter& filter,
                                           const std::set<std::string>& extensions) {
  std::vector<std::string> out;
  auto wanted = [&](const fs::path& p) {
    return extensions.empty() || extensions.count(lower_extension(p.string())) > 0;
  };

  std::error_code ec;
  if (fs::is_regular_file(root, ec)) {
    fs::path p(root);
    if (!filter.excluded_file(p.filename().string()) && wanted(p)) out.push_back(p.string());
    return out;
  }
  if (!fs::is_directory(root, ec)) throw std::runtime_error("not a file or directory: " + root);

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
  if (ec) throw std::runtime_error("cannot walk " + root + ": " + ec.message());
  for (; it != end; it.increment(ec)) {
    if (ec) {
      spdlog::warn("walk {} stopped early: {}", root, ec.message());
      break;
    }
    const auto& entry = *it;
    auto name = entry.path().filename().string();
    if (entry.is_directory(ec)) {
      if (filter.excluded_dir(name)) it.disable_recursion_pending();
      continue;
    }
    if (!entry.is_regular_file(ec)) continue;
    if (filter.excluded_file(name) || !wanted(entry.path())) continue;
    out.push_back(entry.path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}
