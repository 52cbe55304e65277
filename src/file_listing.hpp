#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Patterns from .fshignore (or .gitignore when that has none) in the shared
// folder. Later patterns win; "!" re-includes, a trailing "/" only matches
// directories and a leading "/" anchors the pattern at the root.
class IgnoreList {
public:
  struct Pattern {
    std::string glob;
    bool negated = false;
    bool directory_only = false;
    bool anchored = false;
  };

  IgnoreList() = default;

  static IgnoreList load(const std::filesystem::path& root);

  // Parses one ignore-file line. Blank lines and comments are skipped.
  void add_pattern(const std::string& line);
  bool should_ignore(const std::string& relative_path, bool is_dir = false) const;

  std::size_t size() const { return patterns_.size(); }
  bool empty() const { return patterns_.empty(); }

private:
  bool evaluate(const std::string& path, bool is_dir) const;

  std::vector<Pattern> patterns_;
};

// Names in a directory under `root`, sorted, directories suffixed with "/".
// Recursive listings prefix nested entries with their parent directory.
// Throws ShareError(AccessDenied | NotFound | IOError).
std::vector<std::string> list_directory(const std::filesystem::path& root,
                                        const std::string& relative_dir,
                                        bool recursive,
                                        const IgnoreList& ignore);

// Every regular file below `relative_dir`, as root-relative paths.
std::vector<std::string> list_files_recursive(const std::filesystem::path& root,
                                              const std::string& relative_dir,
                                              const IgnoreList& ignore);

// Files below the pattern's directory whose basename matches its last
// component, e.g. "docs/*.pdf".
std::vector<std::string> find_matching_files(const std::filesystem::path& root,
                                             const std::string& pattern,
                                             const IgnoreList& ignore);
