#include "filesystem.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <sstream>
#include <vector>

namespace {

std::error_code last_error() {
  return std::error_code(errno, std::generic_category());
}

FileStat to_file_stat(const struct stat& st) {
  FileStat out;
  if(S_ISDIR(st.st_mode)) {
    out.type = FileType::Directory;
  } else if(S_ISLNK(st.st_mode)) {
    out.type = FileType::Symlink;
  } else {
    out.type = FileType::File;
  }
  out.size = static_cast<int64_t>(st.st_size);
  out.permissions = static_cast<uint32_t>(st.st_mode & 07777);
  out.modified_s = static_cast<int64_t>(st.st_mtim.tv_sec);
  out.modified_ns = static_cast<int32_t>(st.st_mtim.tv_nsec);
  return out;
}

class PosixFile : public File {
public:
  explicit PosixFile(int fd) : fd_(fd) {}

  ~PosixFile() override {
    if(fd_ >= 0) ::close(fd_);
  }

  std::size_t read_at(char* buffer, std::size_t size, int64_t offset, std::error_code& ec) override {
    ec.clear();
    std::size_t done = 0;
    while(done < size) {
      ssize_t n = ::pread(fd_, buffer + done, size - done, static_cast<off_t>(offset + done));
      if(n < 0) {
        if(errno == EINTR) continue;
        ec = last_error();
        return done;
      }
      if(n == 0) break;
      done += static_cast<std::size_t>(n);
    }
    return done;
  }

  void write_at(const char* buffer, std::size_t size, int64_t offset, std::error_code& ec) override {
    ec.clear();
    std::size_t done = 0;
    while(done < size) {
      ssize_t n = ::pwrite(fd_, buffer + done, size - done, static_cast<off_t>(offset + done));
      if(n < 0) {
        if(errno == EINTR) continue;
        ec = last_error();
        return;
      }
      done += static_cast<std::size_t>(n);
    }
  }

  void truncate(int64_t size, std::error_code& ec) override {
    ec.clear();
    if(::ftruncate(fd_, static_cast<off_t>(size)) != 0) ec = last_error();
  }

  void sync(std::error_code& ec) override {
    ec.clear();
    if(::fsync(fd_) != 0) ec = last_error();
  }

  int64_t size(std::error_code& ec) override {
    ec.clear();
    struct stat st {};
    if(::fstat(fd_, &st) != 0) {
      ec = last_error();
      return 0;
    }
    return static_cast<int64_t>(st.st_size);
  }

private:
  int fd_ = -1;
};

std::vector<std::string> split_name(const std::string& name) {
  std::vector<std::string> parts;
  std::string current;
  std::istringstream iss(name);
  while(std::getline(iss, current, '/')) {
    parts.push_back(current);
  }
  return parts;
}

} // namespace

BasicFilesystem::BasicFilesystem(std::filesystem::path root)
  : root_(std::move(root)) {}

std::string BasicFilesystem::full_path(const std::string& name) const {
  if(name.empty()) return root_.string();
  return (root_ / name).string();
}

std::shared_ptr<File> BasicFilesystem::open(const std::string& name, std::error_code& ec) {
  ec.clear();
  int fd = ::open(full_path(name).c_str(), O_RDONLY | O_CLOEXEC);
  if(fd < 0) {
    ec = last_error();
    return nullptr;
  }
  return std::make_shared<PosixFile>(fd);
}

std::shared_ptr<File> BasicFilesystem::open_write(const std::string& name,
                                                  uint32_t permissions,
                                                  std::error_code& ec) {
  ec.clear();
  int fd = ::open(full_path(name).c_str(), O_RDWR | O_CREAT | O_CLOEXEC,
                  static_cast<mode_t>(permissions & 0777));
  if(fd < 0) {
    ec = last_error();
    return nullptr;
  }
  return std::make_shared<PosixFile>(fd);
}

void BasicFilesystem::rename(const std::string& from, const std::string& to, std::error_code& ec) {
  ec.clear();
  if(::rename(full_path(from).c_str(), full_path(to).c_str()) != 0) ec = last_error();
}

void BasicFilesystem::remove(const std::string& name, std::error_code& ec) {
  ec.clear();
  auto path = full_path(name);
  if(::unlink(path.c_str()) == 0) return;
  if(errno == EISDIR || errno == EPERM) {
    if(::rmdir(path.c_str()) == 0) return;
  }
  ec = last_error();
}

std::optional<FileStat> BasicFilesystem::lstat(const std::string& name, std::error_code& ec) {
  ec.clear();
  struct stat st {};
  if(::lstat(full_path(name).c_str(), &st) != 0) {
    ec = last_error();
    return std::nullopt;
  }
  return to_file_stat(st);
}

void BasicFilesystem::mkdir(const std::string& name, uint32_t permissions, std::error_code& ec) {
  ec.clear();
  if(::mkdir(full_path(name).c_str(), static_cast<mode_t>(permissions & 0777)) != 0) {
    ec = last_error();
  }
}

void BasicFilesystem::create_symlink(const std::string& target, const std::string& name, std::error_code& ec) {
  ec.clear();
  if(::symlink(target.c_str(), full_path(name).c_str()) != 0) ec = last_error();
}

std::string BasicFilesystem::read_symlink(const std::string& name, std::error_code& ec) {
  ec.clear();
  std::vector<char> buffer(4096);
  ssize_t n = ::readlink(full_path(name).c_str(), buffer.data(), buffer.size());
  if(n < 0) {
    ec = last_error();
    return {};
  }
  return std::string(buffer.data(), static_cast<std::size_t>(n));
}

void BasicFilesystem::chmod(const std::string& name, uint32_t permissions, std::error_code& ec) {
  ec.clear();
  if(::chmod(full_path(name).c_str(), static_cast<mode_t>(permissions & 07777)) != 0) {
    ec = last_error();
  }
}

void BasicFilesystem::set_modified(const std::string& name, int64_t seconds, int32_t nanos, std::error_code& ec) {
  ec.clear();
  struct timespec times[2];
  times[0].tv_sec = 0;
  times[0].tv_nsec = UTIME_OMIT;
  times[1].tv_sec = static_cast<time_t>(seconds);
  times[1].tv_nsec = nanos;
  if(::utimensat(AT_FDCWD, full_path(name).c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
    ec = last_error();
  }
}

std::vector<std::string> BasicFilesystem::read_dir(const std::string& name, std::error_code& ec) {
  ec.clear();
  std::vector<std::string> out;
  std::filesystem::directory_iterator it(full_path(name), ec);
  if(ec) return out;
  for(; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if(ec) return out;
    out.push_back(it->path().filename().string());
  }
  return out;
}

void BasicFilesystem::walk(const WalkFn& fn, std::error_code& ec) {
  namespace fs = std::filesystem;
  ec.clear();
  fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
  if(ec) return;
  for(; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if(ec) return;
    auto name = it->path().lexically_relative(root_).generic_string();
    std::error_code stat_ec;
    auto st = lstat(name, stat_ec);
    if(!st) continue; // vanished while walking
    if(!fn(name, *st) && st->type == FileType::Directory) {
      it.disable_recursion_pending();
    }
  }
}

std::optional<std::string> canonical_name(const std::string& raw) {
  if(raw.empty() || raw.front() == '/') return std::nullopt;
  std::string out;
  for(const auto& part : split_name(raw)) {
    if(part.empty() || part == ".") continue;
    if(part == "..") return std::nullopt;
    if(!out.empty()) out += '/';
    out += part;
  }
  if(out.empty()) return std::nullopt;
  return out;
}

std::string parent_name(const std::string& name) {
  auto pos = name.rfind('/');
  if(pos == std::string::npos) return {};
  return name.substr(0, pos);
}

std::string base_name(const std::string& name) {
  auto pos = name.rfind('/');
  if(pos == std::string::npos) return name;
  return name.substr(pos + 1);
}

std::string temp_name(const std::string& name, const VersionVector& version) {
  auto dir = parent_name(name);
  std::string tmp = std::string(kTempPrefix) + base_name(name) + "." + version.fingerprint();
  return dir.empty() ? tmp : dir + "/" + tmp;
}

bool is_temporary(const std::string& name) {
  return base_name(name).rfind(kTempPrefix, 0) == 0;
}

bool is_internal(const std::string& name) {
  const std::string internal_dir(kInternalDirName);
  if(name == internal_dir || name.rfind(internal_dir + "/", 0) == 0) return true;
  return name == kIgnoreFileName;
}

bool has_symlink_ancestor(Filesystem& fs, const std::string& name, std::error_code& ec) {
  ec.clear();
  auto parts = split_name(name);
  std::string prefix;
  for(std::size_t i = 0; i + 1 < parts.size(); ++i) {
    if(parts[i].empty()) continue;
    prefix = prefix.empty() ? parts[i] : prefix + "/" + parts[i];
    std::error_code stat_ec;
    auto st = fs.lstat(prefix, stat_ec);
    if(!st) {
      if(stat_ec == std::errc::no_such_file_or_directory) return false;
      ec = stat_ec;
      return false;
    }
    if(st->type == FileType::Symlink) return true;
  }
  return false;
}

void make_parents(Filesystem& fs, const std::string& name, std::error_code& ec) {
  ec.clear();
  auto parts = split_name(parent_name(name));
  std::string prefix;
  for(const auto& part : parts) {
    if(part.empty()) continue;
    prefix = prefix.empty() ? part : prefix + "/" + part;
    std::error_code stat_ec;
    auto st = fs.lstat(prefix, stat_ec);
    if(st) {
      if(st->type != FileType::Directory) {
        ec = std::make_error_code(std::errc::not_a_directory);
        return;
      }
      continue;
    }
    fs.mkdir(prefix, 0755, ec);
    if(ec && ec != std::errc::file_exists) return;
    ec.clear();
  }
}
