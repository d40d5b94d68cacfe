#pragma once

#include <memory>
#include <string>
#include <system_error>

class Filesystem;

// Keeps the previous content of a file before it is replaced or deleted.
class Versioner {
public:
  virtual ~Versioner() = default;
  // Moves name out of the way. The file is gone from name afterwards.
  virtual void archive(const std::string& name, std::error_code& ec) = 0;
};

// One previous copy per name under .replisync/versions/<name>.
class TrashcanVersioner : public Versioner {
public:
  explicit TrashcanVersioner(Filesystem& fs);
  void archive(const std::string& name, std::error_code& ec) override;

private:
  Filesystem& fs_;
};

// Up to keep copies per name under .replisync/versions/<name>.<unix seconds>,
// oldest removed first.
class SimpleVersioner : public Versioner {
public:
  SimpleVersioner(Filesystem& fs, int keep);
  void archive(const std::string& name, std::error_code& ec) override;

private:
  void prune(const std::string& archived_name);

  Filesystem& fs_;
  int keep_;
};

std::string versions_dir();

// "none" (returns nullptr), "trashcan" or "simple". Throws on anything else.
std::unique_ptr<Versioner> make_versioner(const std::string& type, Filesystem& fs, int keep);
