#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

struct Project {
  std::string name;
  std::string directory;    // absolute
  std::string config_path;  // absolute, empty if none
  std::string index_name;
};

// Named codebases and the current one, kept under a home directory:
//   <home>/projects.json     name -> {directory, config_path, index_name}
//   <home>/current_project   name of the current project
// Every mutation is written through with temp file + rename.
class ProjectRegistry {
public:
  // home "" means $CCR_HOME, else ~/.code_context_retriever.
  explicit ProjectRegistry(const std::string& home = "");

  // With a directory: create or update, then make current. Without: make an
  // existing project current (ProjectNotFoundError otherwise, and current
  // is left alone). A missing directory or config file is invalid_argument.
  Project set(const std::string& name, const std::string& directory = "", const std::string& config_path = "");

  // Registers without switching. ProjectAlreadyExistsError if taken.
  Project add(const std::string& name, const std::string& directory, const std::string& config_path = "");

  std::optional<Project> current() const;
  std::optional<Project> get(const std::string& name) const;
  std::vector<Project> list() const;  // by name

  // ProjectNotFoundError if unknown. Clears current if it was current.
  void remove(const std::string& name);

  // The named project if given (must exist), else the current one, else none.
  std::optional<Project> resolve(const std::string& override_name = "") const;

  const std::string& home() const { return home_; }
  static std::string default_home();

private:
  Project make(const std::string& name, const std::string& directory, const std::string& config_path) const;
  void load();
  void save_projects() const;
  void save_current() const;

  std::string home_;
  std::map<std::string, Project> projects_;
  std::string current_;
};
