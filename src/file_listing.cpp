#include "file_listing.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <fstream>
#include <utility>

#include "errors.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

bool glob_match(const std::string& glob, const std::string& text) {
  return ::fnmatch(glob.c_str(), text.c_str(), FNM_PATHNAME) == 0;
}

bool is_system_file(const std::string& basename) {
  return basename == ".fshignore" || basename == ".gitignore";
}

std::string basename_of(const std::string& path) {
  auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string join_relative(const std::string& dir, const std::string& name) {
  return dir.empty() ? name : dir + "/" + name;
}

std::vector<std::string> read_patterns(const fs::path& file) {
  std::vector<std::string> lines;
  std::ifstream in(file);
  if(!in) return lines;
  std::string line;
  while(std::getline(in, line)) {
    line = trim_copy(line);
    if(line.empty() || line[0] == '#') continue;
    lines.push_back(line);
  }
  return lines;
}

// Depth-first walk over regular files, pruning ignored directories.
template<typename Fn>
void walk_files(const fs::path& root, const std::string& relative_dir,
                const IgnoreList& ignore, Fn&& on_file) {
  auto base = resolve_in_root(root, relative_dir);
  std::error_code ec;
  if(!fs::is_directory(base, ec)) {
    throw ShareError(ErrorKind::NotFound, "Directory not found: " + (relative_dir.empty() ? "." : relative_dir));
  }
  fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
  if(ec) {
    throw ShareError(ErrorKind::IOError, "Unable to read " + relative_dir + ": " + ec.message());
  }
  for(; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if(ec) {
      throw ShareError(ErrorKind::IOError, "Unable to read " + relative_dir + ": " + ec.message());
    }
    auto rel = relative_to_root(root, it->path());
    bool is_dir = it->is_directory(ec);
    if(ignore.should_ignore(rel, is_dir)) {
      if(is_dir) it.disable_recursion_pending();
      continue;
    }
    if(it->is_regular_file(ec)) on_file(rel);
  }
}

} // namespace

IgnoreList IgnoreList::load(const fs::path& root) {
  IgnoreList list;
  auto lines = read_patterns(root / ".fshignore");
  if(lines.empty()) lines = read_patterns(root / ".gitignore");
  for(const auto& line : lines) list.add_pattern(line);
  return list;
}

void IgnoreList::add_pattern(const std::string& line) {
  std::string text = trim_copy(line);
  if(text.empty() || text[0] == '#') return;
  Pattern pattern;
  if(text[0] == '!') {
    pattern.negated = true;
    text.erase(0, 1);
  }
  if(!text.empty() && text.back() == '/') {
    pattern.directory_only = true;
    while(!text.empty() && text.back() == '/') text.pop_back();
  }
  if(!text.empty() && text.front() == '/') {
    pattern.anchored = true;
    while(!text.empty() && text.front() == '/') text.erase(0, 1);
  }
  if(text.empty()) return;
  pattern.glob = std::move(text);
  patterns_.push_back(std::move(pattern));
}

bool IgnoreList::evaluate(const std::string& path, bool is_dir) const {
  const auto base = basename_of(path);
  bool ignored = false;
  for(const auto& pattern : patterns_) {
    if(pattern.directory_only && !is_dir) continue;
    bool matched = glob_match(pattern.glob, path);
    if(!matched && !pattern.anchored) {
      matched = glob_match(pattern.glob, base) ||
                (path.find('/') != std::string::npos && glob_match(pattern.glob + "/*", path));
    }
    if(matched) ignored = !pattern.negated;
  }
  return ignored;
}

bool IgnoreList::should_ignore(const std::string& relative_path, bool is_dir) const {
  auto path = normalize_relative_path(relative_path);
  if(path.empty()) return false;
  if(is_system_file(basename_of(path))) return true;
  if(patterns_.empty()) return false;

  // contents of an ignored directory are ignored too
  std::size_t slash = path.find('/');
  while(slash != std::string::npos) {
    if(evaluate(path.substr(0, slash), true)) return true;
    slash = path.find('/', slash + 1);
  }
  return evaluate(path, is_dir);
}

std::vector<std::string> list_directory(const fs::path& root,
                                        const std::string& relative_dir,
                                        bool recursive,
                                        const IgnoreList& ignore) {
  auto rel = normalize_relative_path(relative_dir);
  auto target = resolve_in_root(root, rel);
  std::error_code ec;
  auto status = fs::status(target, ec);
  if(ec || !fs::exists(status)) {
    throw ShareError(ErrorKind::NotFound, "Directory not found: " + (rel.empty() ? "." : rel));
  }
  if(fs::is_regular_file(status)) {
    return {target.filename().string()};
  }

  std::vector<std::pair<std::string, bool>> entries;
  fs::directory_iterator it(target, ec);
  if(ec) {
    throw ShareError(ErrorKind::IOError, "Unable to read " + (rel.empty() ? "." : rel) + ": " + ec.message());
  }
  for(const auto& entry : it) {
    auto name = entry.path().filename().string();
    bool is_dir = entry.is_directory(ec);
    if(ignore.should_ignore(join_relative(rel, name), is_dir)) continue;
    entries.emplace_back(std::move(name), is_dir);
  }
  std::sort(entries.begin(), entries.end());

  std::vector<std::string> out;
  for(const auto& [name, is_dir] : entries) {
    out.push_back(is_dir ? name + "/" : name);
    if(recursive && is_dir) {
      for(const auto& nested : list_directory(root, join_relative(rel, name), true, ignore)) {
        out.push_back(name + "/" + nested);
      }
    }
  }
  return out;
}

std::vector<std::string> list_files_recursive(const fs::path& root,
                                              const std::string& relative_dir,
                                              const IgnoreList& ignore) {
  std::vector<std::string> files;
  walk_files(root, normalize_relative_path(relative_dir), ignore,
             [&](const std::string& rel){ files.push_back(rel); });
  std::sort(files.begin(), files.end());
  return files;
}

std::vector<std::string> find_matching_files(const fs::path& root,
                                             const std::string& pattern,
                                             const IgnoreList& ignore) {
  auto normalized = normalize_relative_path(pattern);
  auto slash = normalized.find_last_of('/');
  std::string dir = slash == std::string::npos ? "" : normalized.substr(0, slash);
  std::string glob = slash == std::string::npos ? normalized : normalized.substr(slash + 1);
  if(glob.empty()) return {};

  std::vector<std::string> matches;
  walk_files(root, dir, ignore, [&](const std::string& rel){
    if(glob_match(glob, basename_of(rel))) matches.push_back(rel);
  });
  std::sort(matches.begin(), matches.end());
  return matches;
}
