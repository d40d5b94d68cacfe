#include "blocks.hpp"
#include "file_index.hpp"
#include "test_runner_utils.hpp"

#include <string>
#include <vector>

using namespace replisync::test;

namespace {

const std::string kFolder = "default";
const std::string kLocal = "local";

FileInfo record(const std::string& name, const std::string& device, uint64_t counter,
                const std::string& content = "x") {
  FileInfo f;
  f.name = name;
  f.size = static_cast<int64_t>(content.size());
  f.blocks = hash_buffer(content, block_size_for(f.size));
  f.version.set(device, counter);
  f.modified_by = device;
  f.modified_s = 1000;
  return f;
}

std::vector<std::string> names_of(const std::vector<FileInfo>& files) {
  std::vector<std::string> out;
  for(const auto& f : files) out.push_back(f.name);
  return out;
}

bool test_local_sequence(TestContext& ctx) {
  FileIndex index(kLocal);
  std::error_code ec;
  auto before = index.sequence(kFolder);
  index.update(kFolder, kLocal, {record("a", kLocal, 1), record("b", kLocal, 1)}, ec);
  bool ok = expect(ctx, !ec, "the update to succeed");
  auto a = index.get(kFolder, kLocal, "a");
  auto b = index.get(kFolder, kLocal, "b");
  ok &= expect(ctx, a && b && a->sequence > 0 && b->sequence > a->sequence, "increasing local sequence numbers");
  ok &= expect(ctx, index.sequence(kFolder) > before, "the folder sequence to move");

  auto mid = index.sequence(kFolder);
  index.update(kFolder, "remote", {record("c", "remote", 1)}, ec);
  auto c = index.get(kFolder, "remote", "c");
  ok &= expect(ctx, c && c->sequence == 0, "remote records keep their own sequence");
  ok &= expect(ctx, index.sequence(kFolder) > mid, "remote updates to move the folder sequence");
  ok &= expect(ctx, index.files(kFolder, kLocal).size() == 2, "two local files");
  return ok;
}

bool test_need(TestContext& ctx) {
  FileIndex index(kLocal);
  std::error_code ec;
  index.update(kFolder, kLocal, {record("same", "r", 1), record("old", "r", 1)}, ec);

  auto gone = record("gone", "r", 1);
  gone.deleted = true;
  auto deleted_here_too = record("old-gone", "r", 2);
  deleted_here_too.deleted = true;
  auto invalid = record("invalid", "r", 1);
  invalid.invalid = true;
  index.update(kFolder, "r", {record("same", "r", 1), record("old", "r", 2), record("new", "r", 1),
                              gone, invalid, deleted_here_too, record("zz", "r", 1)}, ec);

  auto need = index.need(kFolder);
  bool ok = expect(ctx, names_of(need) == std::vector<std::string>{"new", "old", "zz"},
                   "new, old and zz needed in name order");
  auto limited = index.need(kFolder, 2);
  ok &= expect(ctx, names_of(limited) == std::vector<std::string>{"new", "old"}, "the limit to apply");

  // Something we have locally and the remote deleted must be removed here.
  auto tombstone = record("same", "r", 2);
  tombstone.deleted = true;
  index.update(kFolder, "r", {tombstone}, ec);
  auto again = index.need(kFolder);
  bool has_deletion = false;
  for(const auto& f : again) {
    if(f.name == "same") has_deletion = f.deleted;
  }
  ok &= expect(ctx, has_deletion, "the tombstone for same to be needed");
  return ok;
}

bool test_global_and_availability(TestContext& ctx) {
  FileIndex index(kLocal);
  std::error_code ec;
  auto v1 = record("f", "A", 1, "one");
  auto newer = record("f", "A", 2, "two");
  auto invalid = newer;
  invalid.invalid = true;
  index.update(kFolder, "A", {newer}, ec);
  index.update(kFolder, "B", {v1}, ec);
  index.update(kFolder, "C", {newer}, ec);
  index.update(kFolder, "D", {invalid}, ec);

  auto global = index.get_global(kFolder, "f");
  bool ok = expect(ctx, global && global->version == newer.version, "the dominating version as global");
  auto holders = index.availability(kFolder, "f", newer.version);
  ok &= expect(ctx, holders == std::vector<std::string>{"A", "C"}, "A and C to hold the global version");
  ok &= expect(ctx, index.availability(kFolder, "f", v1.version) == std::vector<std::string>{"B"},
               "B to hold the old version");

  // Concurrent records: the conflict winner becomes global.
  auto left = record("g", "A", 1, "left");
  left.modified_s = 10;
  auto right = record("g", "B", 1, "right");
  right.modified_s = 20;
  index.update(kFolder, "A", {left}, ec);
  index.update(kFolder, "B", {right}, ec);
  auto g = index.get_global(kFolder, "g");
  ok &= expect(ctx, g && g->modified_by == "B", "the later concurrent edit as global");

  auto only_invalid = record("h", "D", 1);
  only_invalid.invalid = true;
  index.update(kFolder, "D", {only_invalid}, ec);
  ok &= expect(ctx, names_of(index.need(kFolder)) == std::vector<std::string>{"f", "g"},
               "invalid-only entries not needed");
  return ok;
}

bool test_replace_and_close(TestContext& ctx) {
  FileIndex index(kLocal);
  std::error_code ec;
  index.update(kFolder, "r", {record("a", "r", 1), record("b", "r", 1)}, ec);
  index.replace(kFolder, "r", {record("b", "r", 2)}, ec);
  bool ok = expect(ctx, !index.get(kFolder, "r", "a"), "a dropped by a full index");
  auto b = index.get(kFolder, "r", "b");
  ok &= expect(ctx, b && b->version.counter("r") == 2, "b replaced");

  index.drop_device(kFolder, "r");
  ok &= expect(ctx, index.files(kFolder, "r").empty() && index.need(kFolder).empty(), "nothing left from r");

  index.close();
  index.update(kFolder, kLocal, {record("c", kLocal, 1)}, ec);
  ok &= expect(ctx, ec == std::errc::operation_canceled && index.closed(), "writes to fail once closed");
  ok &= expect(ctx, !index.get(kFolder, kLocal, "c"), "nothing stored after close");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"local_sequence", test_local_sequence},
    {"need", test_need},
    {"global_and_availability", test_global_and_availability},
    {"replace_and_close", test_replace_and_close},
  };
  return run_test_cases(argc, argv, "index", tests);
}
