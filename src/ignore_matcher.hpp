#pragma once

#include <mutex>
#include <string>
#include <system_error>
#include <vector>

class Filesystem;

// Shell glob patterns, one per line, in the folder's .replignore file.
// A pattern containing '/' matches the whole relative name (or a parent
// directory of it); a pattern without one matches any single component.
// Lines starting with '#' are comments.
class IgnoreMatcher {
public:
  IgnoreMatcher() = default;
  explicit IgnoreMatcher(std::vector<std::string> patterns);

  // Reloads patterns from the ignore file. A missing file clears them.
  void load(Filesystem& fs, std::error_code& ec);
  void set_patterns(std::vector<std::string> patterns);
  std::vector<std::string> patterns() const;

  bool is_ignored(const std::string& name) const;

private:
  static bool matches(const std::string& pattern, const std::string& name);

  mutable std::mutex m_;
  std::vector<std::string> patterns_;
};
