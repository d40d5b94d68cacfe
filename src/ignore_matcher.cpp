#include "ignore_matcher.hpp"

#include <fnmatch.h>

#include <sstream>

#include "filesystem.hpp"
#include "settings_manager.hpp"

IgnoreMatcher::IgnoreMatcher(std::vector<std::string> patterns)
  : patterns_(std::move(patterns)) {}

void IgnoreMatcher::load(Filesystem& fs, std::error_code& ec) {
  ec.clear();
  auto file = fs.open(kIgnoreFileName, ec);
  if(!file) {
    if(ec == std::errc::no_such_file_or_directory) {
      ec.clear();
      set_patterns({});
    }
    return;
  }
  auto size = file->size(ec);
  if(ec) return;
  std::string content(static_cast<std::size_t>(size), '\0');
  file->read_at(content.data(), content.size(), 0, ec);
  if(ec) return;

  std::vector<std::string> patterns;
  std::istringstream iss(content);
  std::string line;
  while(std::getline(iss, line)) {
    line = SettingsManager::trim_copy(line);
    if(line.empty() || line[0] == '#') continue;
    patterns.push_back(line);
  }
  set_patterns(std::move(patterns));
}

void IgnoreMatcher::set_patterns(std::vector<std::string> patterns) {
  std::lock_guard lg(m_);
  patterns_ = std::move(patterns);
}

std::vector<std::string> IgnoreMatcher::patterns() const {
  std::lock_guard lg(m_);
  return patterns_;
}

bool IgnoreMatcher::is_ignored(const std::string& name) const {
  std::lock_guard lg(m_);
  for(const auto& pattern : patterns_) {
    if(matches(pattern, name)) return true;
  }
  return false;
}

bool IgnoreMatcher::matches(const std::string& pattern, const std::string& name) {
  if(pattern.find('/') != std::string::npos) {
    std::string anchored = pattern.front() == '/' ? pattern.substr(1) : pattern;
    // The name itself or any parent directory of it.
    std::string prefix = name;
    while(!prefix.empty()) {
      if(fnmatch(anchored.c_str(), prefix.c_str(), FNM_PATHNAME) == 0) return true;
      auto pos = prefix.rfind('/');
      if(pos == std::string::npos) break;
      prefix.resize(pos);
    }
    return false;
  }

  std::istringstream iss(name);
  std::string component;
  while(std::getline(iss, component, '/')) {
    if(fnmatch(pattern.c_str(), component.c_str(), 0) == 0) return true;
  }
  return false;
}
