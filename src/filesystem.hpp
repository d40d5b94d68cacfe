#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "file_info.hpp"

inline constexpr const char* kInternalDirName = ".replisync";
inline constexpr const char* kIgnoreFileName = ".replignore";
inline constexpr const char* kTempPrefix = ".replisync.";

struct FileStat {
  FileType type = FileType::File;
  int64_t size = 0;
  uint32_t permissions = 0;
  int64_t modified_s = 0;
  int32_t modified_ns = 0;
};

// An open file. Reads and writes are positional so several workers can
// share one handle as long as their ranges do not overlap.
class File {
public:
  virtual ~File() = default;

  // Returns the number of bytes read; short only at end of file.
  virtual std::size_t read_at(char* buffer, std::size_t size, int64_t offset, std::error_code& ec) = 0;
  virtual void write_at(const char* buffer, std::size_t size, int64_t offset, std::error_code& ec) = 0;
  virtual void truncate(int64_t size, std::error_code& ec) = 0;
  virtual void sync(std::error_code& ec) = 0;
  virtual int64_t size(std::error_code& ec) = 0;
};

// Everything the engine does to disk, addressed by slash separated names
// relative to the folder root. Nothing here follows symlinks except open().
class Filesystem {
public:
  // Called for every entry below the root; return false to skip a directory's
  // children.
  using WalkFn = std::function<bool(const std::string& name, const FileStat& stat)>;

  virtual ~Filesystem() = default;

  virtual const std::filesystem::path& root() const = 0;

  virtual std::shared_ptr<File> open(const std::string& name, std::error_code& ec) = 0;
  // Opens for read/write, creating the file if needed. Never truncates.
  virtual std::shared_ptr<File> open_write(const std::string& name, uint32_t permissions, std::error_code& ec) = 0;

  virtual void rename(const std::string& from, const std::string& to, std::error_code& ec) = 0;
  // Removes a file, symlink or empty directory.
  virtual void remove(const std::string& name, std::error_code& ec) = 0;
  // nullopt with ec == no_such_file_or_directory when the entry is missing.
  virtual std::optional<FileStat> lstat(const std::string& name, std::error_code& ec) = 0;
  virtual void mkdir(const std::string& name, uint32_t permissions, std::error_code& ec) = 0;
  virtual void create_symlink(const std::string& target, const std::string& name, std::error_code& ec) = 0;
  virtual std::string read_symlink(const std::string& name, std::error_code& ec) = 0;
  virtual void chmod(const std::string& name, uint32_t permissions, std::error_code& ec) = 0;
  virtual void set_modified(const std::string& name, int64_t seconds, int32_t nanos, std::error_code& ec) = 0;
  // Entry names (not paths) directly inside a directory.
  virtual std::vector<std::string> read_dir(const std::string& name, std::error_code& ec) = 0;
  virtual void walk(const WalkFn& fn, std::error_code& ec) = 0;
};

class BasicFilesystem : public Filesystem {
public:
  explicit BasicFilesystem(std::filesystem::path root);

  const std::filesystem::path& root() const override { return root_; }

  std::shared_ptr<File> open(const std::string& name, std::error_code& ec) override;
  std::shared_ptr<File> open_write(const std::string& name, uint32_t permissions, std::error_code& ec) override;
  void rename(const std::string& from, const std::string& to, std::error_code& ec) override;
  void remove(const std::string& name, std::error_code& ec) override;
  std::optional<FileStat> lstat(const std::string& name, std::error_code& ec) override;
  void mkdir(const std::string& name, uint32_t permissions, std::error_code& ec) override;
  void create_symlink(const std::string& target, const std::string& name, std::error_code& ec) override;
  std::string read_symlink(const std::string& name, std::error_code& ec) override;
  void chmod(const std::string& name, uint32_t permissions, std::error_code& ec) override;
  void set_modified(const std::string& name, int64_t seconds, int32_t nanos, std::error_code& ec) override;
  std::vector<std::string> read_dir(const std::string& name, std::error_code& ec) override;
  void walk(const WalkFn& fn, std::error_code& ec) override;

private:
  std::string full_path(const std::string& name) const;

  std::filesystem::path root_;
};

// Normalizes a wire or on-disk name: strips "./" and duplicate slashes, and
// rejects empty, absolute and ".." names.
std::optional<std::string> canonical_name(const std::string& raw);

std::string parent_name(const std::string& name);
std::string base_name(const std::string& name);

// Hidden sibling ".replisync.<base>.<fingerprint>" used while the given
// version of name is assembled.
std::string temp_name(const std::string& name, const VersionVector& version);
bool is_temporary(const std::string& name);
// The internal directory and the ignore file; never synced.
bool is_internal(const std::string& name);

// True if any directory component leading to name (not name itself) is a
// symlink on disk. Missing components are not symlinks.
bool has_symlink_ancestor(Filesystem& fs, const std::string& name, std::error_code& ec);

// Creates every missing directory leading to name.
void make_parents(Filesystem& fs, const std::string& name, std::error_code& ec);
