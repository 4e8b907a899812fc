#pragma once
#include <memory>
#include <set>
#include <string>
#include <vector>

// fnmatch-style glob (*, ?, [...]) translated to an anchored RE2 pattern.
std::string glob_to_regex(const std::string& glob);

// Exclusion rules of an indexing walk: directory globs tested against every
// path component, file globs against the file name.
class PathFilter {
public:
  PathFilter(const std::vector<std::string>& exclude_dirs,
             const std::vector<std::string>& exclude_files);
  ~PathFilter();

  bool excluded_dir(const std::string& dir_name) const;
  bool excluded_file(const std::string& file_name) const;
  // Any component of path (relative to the walk root) excluded, or the name.
  bool excluded_path(const std::string& rel_path) const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Regular files under root (or root itself if it is a file) that pass the
// filter, whose extension is in `extensions` (all if empty). Sorted.
std::vector<std::string> list_source_files(const std::string& root,
                                           const PathFilter& filter,
                                           const std::set<std::string>& extensions);
