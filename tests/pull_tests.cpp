#include "filesystem.hpp"
#include "folder_harness.hpp"
#include "pull_scheduler.hpp"
#include "test_runner_utils.hpp"
#include "version_resolver.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using namespace replisync::test;

namespace {

bool content_is(const FolderHarness& h, const std::string& name, const std::string& expected) {
  auto data = read_file(h.path(name));
  return data && *data == expected;
}

std::vector<std::string> conflict_copies(const FolderHarness& h, const std::string& dir = std::string()) {
  std::vector<std::string> out;
  for(const auto& name : list_dir(dir.empty() ? h.root() : h.path(dir))) {
    if(is_conflict_name(name)) out.push_back(name);
  }
  return out;
}

bool test_pulls_new_file(TestContext& ctx) {
  FolderHarness h(ctx);
  auto& remote_file = h.remote.add_file("testfile", "test file contents\n");
  const auto version = remote_file.version;
  h.send_update();

  bool ok = expect(ctx, h.folder->pull_once(), "a pull cycle to run");
  ok &= expect(ctx, content_is(h, "testfile", "test file contents\n"), "testfile pulled");
  auto local = h.local("testfile");
  ok &= expect(ctx, local && local->version == version && !local->deleted, "the remote version recorded locally");
  ok &= expect(ctx, h.temp_files().empty(), "no temp file left");
  ok &= expect(ctx, h.connection->requests_for("testfile") == 1, "one block requested");
  auto announced = h.connection->last_sent("testfile");
  ok &= expect(ctx, announced && announced->version == version, "the new local record announced");

  bool finished = false;
  for(const auto& item : h.recorder.all<ItemFinished>()) {
    if(item.name == "testfile" && item.action == "update" && item.error.empty()) finished = true;
  }
  ok &= expect(ctx, finished, "an ItemFinished event for testfile");
  ok &= expect(ctx, h.folder->state() == FolderState::Idle, "the folder idle afterwards");

  // One more cycle sees our own commit, then the folder settles.
  h.folder->pull_once();
  ok &= expect(ctx, !h.folder->pull_once(), "nothing to do once settled");
  ok &= expect(ctx, h.connection->requests_for("testfile") == 1, "testfile not requested again");
  return ok;
}

bool test_pulls_directories_and_symlinks(TestContext& ctx) {
  FolderHarness h(ctx);
  h.remote.add_directory("photos", 0750);
  h.remote.add_directory("photos/2024");
  h.remote.add_file("photos/2024/a.jpg", std::string(3000, 'j'));
  h.remote.add_symlink("latest", "photos/2024/a.jpg");
  h.send_update();

  bool ok = expect(ctx, h.folder->pull_once(), "a pull cycle to run");
  ok &= expect(ctx, std::filesystem::is_directory(h.path("photos/2024")), "the directories created");
  auto perms = std::filesystem::status(h.path("photos")).permissions();
  ok &= expect(ctx, (perms & std::filesystem::perms::all) == static_cast<std::filesystem::perms>(0750),
               "directory permissions applied");
  ok &= expect(ctx, content_is(h, "photos/2024/a.jpg", std::string(3000, 'j')), "the file pulled");
  ok &= expect(ctx, std::filesystem::is_symlink(h.path("latest")) &&
                    std::filesystem::read_symlink(h.path("latest")) == "photos/2024/a.jpg",
               "the symlink created with its target");
  ok &= expect(ctx, h.index.need(FolderHarness::kFolder).empty(), "nothing left needed");

  // Children go before their parents.
  h.remote.delete_file("photos/2024/a.jpg");
  h.remote.delete_file("photos/2024");
  h.remote.delete_file("photos");
  h.remote.delete_file("latest");
  h.send_update();
  ok &= expect(ctx, h.folder->pull_once(), "a second pull cycle to run");
  ok &= expect(ctx, !h.exists("photos") && !h.exists("latest"), "everything deleted");
  auto photos = h.local("photos");
  ok &= expect(ctx, photos && photos->deleted, "a tombstone for photos");
  ok &= expect(ctx, h.recorder.all<FolderError>().empty(), "no errors");
  return ok;
}

bool test_symlink_traversal_refused(TestContext& ctx) {
  FolderHarness h(ctx);
  h.remote.add_symlink("symlink", "..");
  h.send_update();
  bool ok = expect(ctx, h.folder->pull_once(), "a pull cycle to run");
  ok &= expect(ctx, std::filesystem::is_symlink(h.path("symlink")), "the symlink created");

  h.remote.add_file("symlink/testfile", "escaped");
  h.remote.add_directory("symlink/testdir");
  h.remote.add_symlink("symlink/testsyml", "..");
  h.send_update();
  h.folder->pull_once();

  // ".." from the root is the temp dir itself.
  for(const std::string name : {"testfile", "testdir", "testsyml"}) {
    std::error_code ec;
    auto st = std::filesystem::symlink_status(h.dir.path() / name, ec);
    ok &= expect(ctx, st.type() == std::filesystem::file_type::not_found, name + " not written outside the folder");
    ok &= expect(ctx, !h.local("symlink/" + name), "no local record for symlink/" + name);
    ok &= expect(ctx, !h.recorder.errors_for("symlink/" + name).empty(), "a folder error for symlink/" + name);
  }
  ok &= expect(ctx, h.connection->requests_for("symlink/testfile") == 0, "nothing requested below the symlink");
  ok &= expect(ctx, ctx.logs.contains("a parent directory is a symlink"), "the refusal logged");
  return ok;
}

bool test_remote_rename_over_local_edit(TestContext& ctx) {
  FolderHarness h(ctx);
  const auto earlier = now_seconds() - 100;
  h.remote.add_file("a", "aData", earlier);
  h.remote.add_file("b", "bData", earlier);
  h.send_update();
  bool ok = expect(ctx, h.folder->pull_once(), "the first pull cycle to run");
  ok &= expect(ctx, content_is(h, "a", "aData") && content_is(h, "b", "bData"), "a and b pulled");

  write_file(h.path("b"), "otherData");
  ok &= expect(ctx, h.scan(), "the local edit scanned");
  h.connection->clear_requests();

  // The remote renamed a over b, later than our edit.
  h.remote.delete_file("a");
  h.remote.add_file("b", "aData", now_seconds() + 3600);
  h.send_update();
  ok &= expect(ctx, h.folder->pull_once(), "the second pull cycle to run");

  ok &= expect(ctx, !h.exists("a"), "a removed");
  ok &= expect(ctx, content_is(h, "b", "aData"), "b holding the renamed content");
  auto conflicts = conflict_copies(h);
  ok &= expect(ctx, conflicts.size() == 1, "exactly one conflict copy of b");
  if(conflicts.size() == 1) {
    ok &= expect(ctx, conflicts[0].rfind("b.sync-conflict-", 0) == 0, "the conflict copy named after b");
    ok &= expect(ctx, content_is(h, conflicts[0], "otherData"), "the local edit kept in the conflict copy");
    auto record = h.local(conflicts[0]);
    ok &= expect(ctx, record && !record->deleted, "the conflict copy indexed");
  }
  ok &= expect(ctx, h.connection->requests().empty(), "the renamed content copied locally, not requested");
  ok &= expect(ctx, h.temp_files().empty(), "no temp file left");
  return ok;
}

bool test_unscanned_edit_not_overwritten(TestContext& ctx) {
  FolderHarness h(ctx);
  const auto earlier = now_seconds() - 100;
  h.remote.add_file("a", "aData", earlier);
  h.remote.add_file("b", "bData", earlier);
  h.send_update();
  bool ok = expect(ctx, h.folder->pull_once(), "the first pull cycle to run");

  // Not scanned: the folder cannot know about this edit yet.
  write_file(h.path("b"), "otherData");
  h.remote.delete_file("a");
  h.remote.add_file("b", "aData");
  h.send_update();
  h.folder->pull_once();

  ok &= expect(ctx, !h.exists("a"), "a removed");
  ok &= expect(ctx, content_is(h, "b", "otherData"), "the modified b not overwritten");
  bool refused = false;
  for(const auto& item : h.recorder.all<ItemFinished>()) {
    if(item.name == "b" && item.error == "file modified since last scan") refused = true;
  }
  ok &= expect(ctx, refused, "the replacement refused");
  return ok;
}

bool test_delete_of_changed_file_refused(TestContext& ctx) {
  FolderHarness h(ctx);
  h.remote.add_file("a", "aData", now_seconds() - 100);
  h.send_update();
  bool ok = expect(ctx, h.folder->pull_once(), "the first pull cycle to run");

  write_file(h.path("a"), "otherData");
  h.remote.delete_file("a");
  h.send_update();
  h.folder->pull_once();
  ok &= expect(ctx, content_is(h, "a", "otherData"), "the modified a not removed");
  ok &= expect(ctx, !h.recorder.errors_for("a").empty(), "a folder error for a");

  // The refused deletion queued a rescan; the local edit now wins over the
  // remote deletion.
  h.folder->pull_once();
  auto local = h.local("a");
  ok &= expect(ctx, local && !local->deleted && local->size == 9, "the edit indexed");
  ok &= expect(ctx, content_is(h, "a", "otherData"), "a still present");
  auto global = h.index.get_global(FolderHarness::kFolder, "a");
  ok &= expect(ctx, global && !global->deleted, "the edit as the global version");
  return ok;
}

bool test_failure_without_source(TestContext& ctx) {
  FolderHarness h(ctx);
  h.connection->set_connected(false);
  h.remote.add_file("orphan", "nobody serves this");
  h.send_update();
  h.folder->pull_once();

  bool ok = expect(ctx, !h.exists("orphan"), "orphan not created");
  ok &= expect(ctx, h.temp_files().empty(), "the temp file removed");
  ok &= expect(ctx, !h.local("orphan"), "no local record");
  ok &= expect(ctx, !h.recorder.errors_for("orphan").empty(), "a folder error for orphan");

  // The failed cycle is retried even though the index did not change.
  h.connection->set_connected(true);
  ok &= expect(ctx, h.folder->pull_once(), "a retry cycle to run");
  ok &= expect(ctx, content_is(h, "orphan", "nobody serves this"), "orphan pulled once a source is back");
  return ok;
}

bool test_corrupt_source_skipped(TestContext& ctx) {
  FolderHarness h(ctx);
  h.connection->set_responder([](const BlockRequest& request){
    RequestResponse response;
    response.data.assign(static_cast<std::size_t>(request.size), 'z');
    return response;
  });
  auto mirror = std::make_shared<FakeConnection>("mirror-device");
  h.peers.add(mirror);

  const std::string content = "served correctly by the mirror";
  h.remote.add_file("shared", content);
  mirror->set_content("shared", content);
  h.send_update();
  h.folder->handle_index("mirror-device", h.remote.all(), true);

  bool ok = expect(ctx, h.folder->pull_once(), "a pull cycle to run");
  ok &= expect(ctx, content_is(h, "shared", content), "the file pulled from the mirror");
  ok &= expect(ctx, mirror->requests_for("shared") == 1, "the block requested from the mirror");
  ok &= expect(ctx, h.temp_files().empty(), "no temp file left");

  // With only the corrupt device left the pull fails and writes nothing.
  h.peers.remove("mirror-device");
  auto& second = h.remote.add_file("shared", "a newer version");
  const auto second_version = second.version;
  h.send_update();
  h.folder->pull_once();
  ok &= expect(ctx, content_is(h, "shared", content), "the old content kept");
  auto local = h.local("shared");
  ok &= expect(ctx, local && local->version != second_version, "the newer version not recorded");
  ok &= expect(ctx, ctx.logs.contains("hash mismatch in data from remote-device"), "the mismatch logged");
  ok &= expect(ctx, h.temp_files().empty(), "the temp file removed");
  return ok;
}

bool test_resumes_from_temp_file(TestContext& ctx) {
  FolderHarness h(ctx);
  const std::string content(200 * 1024, 'r');
  auto& announced = h.remote.add_file("resume", content);
  write_file(h.path(temp_name("resume", announced.version)), content);
  h.connection->set_connected(false);
  h.send_update();

  bool ok = expect(ctx, h.folder->pull_once(), "a pull cycle to run");
  ok &= expect(ctx, content_is(h, "resume", content), "the file assembled from the temp file");
  ok &= expect(ctx, h.connection->requests().empty(), "nothing requested");
  ok &= expect(ctx, h.temp_files().empty(), "the temp file renamed into place");
  return ok;
}

bool test_ignored_and_temporary_names_skipped(TestContext& ctx) {
  FolderHarness h(ctx);
  write_file(h.path(kIgnoreFileName), "*.log\n");
  bool ok = expect(ctx, h.scan(), "the scan to succeed");

  h.remote.add_file("debug.log", "noise");
  const auto tmp = temp_name("testlink", VersionVector());
  h.remote.add_symlink(tmp, "..");
  h.remote.add_file("kept", "kept");
  h.send_update();
  h.folder->pull_once();

  ok &= expect(ctx, !h.exists("debug.log") && h.connection->requests_for("debug.log") == 0, "ignored file not pulled");
  ok &= expect(ctx, !h.exists(tmp), "the temporary name not created");
  auto remote_tmp = h.index.get(FolderHarness::kFolder, FolderHarness::kRemoteDevice, tmp);
  ok &= expect(ctx, remote_tmp && remote_tmp->invalid, "the temporary name stored as invalid");
  ok &= expect(ctx, content_is(h, "kept", "kept"), "the other file pulled");
  return ok;
}

bool test_trashcan_does_not_follow_symlinks(TestContext& ctx) {
  FolderHarness h(ctx, "trashcan");
  const auto outside = h.dir.path() / "outside";
  std::filesystem::create_directories(outside);

  h.remote.add_symlink("foo", outside.string());
  h.send_update();
  bool ok = expect(ctx, h.folder->pull_once(), "the symlink pulled");

  h.remote.delete_file("foo");
  h.send_update();
  h.folder->pull_once();
  ok &= expect(ctx, !h.exists("foo"), "the symlink deleted");

  h.remote.add_directory("foo");
  h.remote.add_file("foo/test", "testtesttest");
  h.send_update();
  h.folder->pull_once();
  ok &= expect(ctx, content_is(h, "foo/test", "testtesttest"), "foo/test pulled into a real directory");

  h.remote.delete_file("foo/test");
  h.send_update();
  h.folder->pull_once();
  ok &= expect(ctx, !h.exists("foo/test"), "foo/test deleted");
  ok &= expect(ctx, !std::filesystem::exists(outside / "test"), "nothing escaped the folder");
  ok &= expect(ctx, content_is(h, std::string(kInternalDirName) + "/versions/foo/test", "testtesttest"),
               "the deleted file kept in the trashcan");
  return ok;
}

bool test_same_content_only_updates_metadata(TestContext& ctx) {
  FolderHarness h(ctx);
  write_file(h.path("same"), "identical");
  bool ok = expect(ctx, h.scan(), "the scan to succeed");
  auto before = h.local("same");
  if(!expect(ctx, before.has_value(), "same indexed")) return false;

  // The remote saw our version and only changed the permissions.
  FileInfo update = *before;
  update.version = before->version.updated(FolderHarness::kRemoteDevice, 0);
  update.modified_by = FolderHarness::kRemoteDevice;
  update.permissions = 0600;
  update.sequence = 0;
  h.folder->handle_index(FolderHarness::kRemoteDevice, {update}, false);
  ok &= expect(ctx, h.folder->pull_once(), "a pull cycle to run");

  auto perms = std::filesystem::status(h.path("same")).permissions();
  ok &= expect(ctx, (perms & std::filesystem::perms::all) == static_cast<std::filesystem::perms>(0600),
               "the new permissions applied");
  auto after = h.local("same");
  ok &= expect(ctx, after && after->version == update.version, "the remote version adopted");
  ok &= expect(ctx, h.connection->requests().empty(), "no data requested");
  return ok;
}

bool test_remote_symlink_replaces_local_file(TestContext& ctx) {
  FolderHarness h(ctx, "trashcan");
  h.remote.add_file("x", "original", now_seconds() - 100);
  h.remote.add_file("y", "plain");
  h.send_update();
  bool ok = expect(ctx, h.folder->pull_once(), "x and y pulled");
  write_file(h.path("x"), "edited locally");
  ok &= expect(ctx, h.scan(), "the edit scanned");

  // Concurrent with the local edit and later, so the remote side wins.
  h.remote.add_symlink("x", "elsewhere").modified_s = now_seconds() + 100;
  h.remote.add_symlink("y", "x");
  h.send_update();
  h.folder->pull_once();

  ok &= expect(ctx, std::filesystem::is_symlink(h.path("x")), "x replaced by the remote symlink");
  auto copies = conflict_copies(h);
  ok &= expect(ctx, copies.size() == 1 && content_is(h, copies[0], "edited locally"),
               "the local edit kept as a conflict copy");
  std::optional<FileInfo> copy;
  if(!copies.empty()) copy = h.local(copies[0]);
  ok &= expect(ctx, copy && !copy->deleted && copy->is_file(), "the conflict copy indexed");

  ok &= expect(ctx, std::filesystem::is_symlink(h.path("y")), "y replaced by the remote symlink");
  ok &= expect(ctx, content_is(h, std::string(kInternalDirName) + "/versions/y", "plain"),
               "the replaced file kept in the trashcan");
  return ok;
}

bool test_type_changes_converge(TestContext& ctx) {
  FolderHarness h(ctx, "trashcan");
  h.remote.add_file("d", "was a file");
  h.remote.add_directory("e");
  h.remote.add_file("e/f", "inside e");
  h.remote.add_symlink("s", "d");
  h.send_update();
  bool ok = expect(ctx, h.folder->pull_once(), "the first pull");
  ok &= expect(ctx, content_is(h, "d", "was a file") && content_is(h, "e/f", "inside e"), "the initial entries pulled");

  h.remote.add_directory("d");
  h.remote.add_file("d/inner", "below d");
  h.remote.delete_file("e/f");
  h.remote.add_file("e", "now a file");
  h.remote.add_directory("s");
  h.send_update();
  // e still has a child until the deletions of the first cycle ran.
  for(int i = 0; i < 4; ++i) h.folder->pull_once();

  ok &= expect(ctx, std::filesystem::is_directory(h.path("d")) && content_is(h, "d/inner", "below d"),
               "d became a directory");
  ok &= expect(ctx, content_is(h, "e", "now a file"), "e became a file");
  ok &= expect(ctx, !std::filesystem::is_symlink(h.path("s")) && std::filesystem::is_directory(h.path("s")),
               "s became a directory");
  ok &= expect(ctx, content_is(h, std::string(kInternalDirName) + "/versions/d", "was a file"),
               "the old d kept in the trashcan");
  auto d = h.local("d");
  auto e = h.local("e");
  ok &= expect(ctx, d && d->is_directory() && e && e->is_file(), "the new types recorded");
  ok &= expect(ctx, h.index.need(FolderHarness::kFolder).empty(), "nothing left needed");
  ok &= expect(ctx, h.temp_files().empty(), "no temp file left");
  return ok;
}

bool test_non_empty_directory_not_replaced(TestContext& ctx) {
  FolderHarness h(ctx);
  h.remote.add_directory("dir");
  h.send_update();
  bool ok = expect(ctx, h.folder->pull_once(), "dir pulled");
  write_file(h.path("dir/local-only"), "not known to the remote");

  h.remote.add_file("dir", "a file now");
  h.send_update();
  h.folder->pull_once();
  ok &= expect(ctx, content_is(h, "dir/local-only", "not known to the remote"), "the local child kept");
  ok &= expect(ctx, !h.recorder.errors_for("dir").empty(), "a folder error for dir");
  ok &= expect(ctx, ctx.logs.contains("directory not empty"), "the refusal logged");
  return ok;
}

bool test_merge_applies_metadata(TestContext& ctx) {
  FolderHarness h(ctx);
  write_file(h.path("m"), "same bytes");
  bool ok = expect(ctx, h.scan(), "the scan to succeed");

  // Concurrent with our version, same content, later modification time.
  auto& remote_file = h.remote.add_file("m", "same bytes", now_seconds() + 50, 0600);
  const auto version = remote_file.version;
  h.send_update();
  ok &= expect(ctx, h.folder->pull_once(), "a pull cycle to run");

  auto perms = std::filesystem::status(h.path("m")).permissions();
  ok &= expect(ctx, (perms & std::filesystem::perms::all) == static_cast<std::filesystem::perms>(0600),
               "the winner's permissions applied");
  auto merged = h.local("m");
  ok &= expect(ctx, merged && merged->version == version, "the winner's record adopted");
  ok &= expect(ctx, h.connection->requests().empty(), "no data requested");

  // The file on disk matches its record, so a scan finds nothing to do.
  ok &= expect(ctx, h.scan(), "the rescan to succeed");
  auto rescanned = h.local("m");
  ok &= expect(ctx, rescanned && rescanned->version == version, "the record unchanged by the rescan");
  return ok;
}

bool test_renamed_content_copied_locally(TestContext& ctx) {
  FolderHarness h(ctx);
  std::string content;
  for(int i = 0; content.size() < 300 * 1024; ++i) content += std::to_string(i) + ",";
  write_file(h.path("old-name"), content);
  bool ok = expect(ctx, h.scan(), "the scan to succeed");

  h.remote.add_file("new-name", content);
  h.connection->set_connected(false);
  h.send_update();
  ok &= expect(ctx, h.folder->pull_once(), "a pull cycle to run");
  ok &= expect(ctx, content_is(h, "new-name", content), "new-name assembled from old-name");
  ok &= expect(ctx, h.connection->requests().empty(), "nothing requested");
  ok &= expect(ctx, ctx.logs.contains("new-name has the content of old-name"), "the local copy logged");
  return ok;
}

bool test_ignored_remote_files_recorded_invalid(TestContext& ctx) {
  FolderHarness h(ctx);
  write_file(h.path(kIgnoreFileName), "*.log\n");
  write_file(h.path("present.log"), "local data");
  bool ok = expect(ctx, h.scan(), "the scan to succeed");
  ok &= expect(ctx, !h.local("present.log"), "an ignored file not indexed by the scan");

  h.remote.add_file("present.log", "remote data");
  h.remote.add_file("absent.log", "remote only");
  h.send_update();
  h.folder->pull_once();

  for(const std::string name : {"present.log", "absent.log"}) {
    auto record = h.local(name);
    auto remote = h.index.get(FolderHarness::kFolder, FolderHarness::kRemoteDevice, name);
    ok &= expect(ctx, record && record->ignored && remote && record->version == remote->version,
                 name + " recorded as ignored with the remote version");
    auto announced = h.connection->last_sent(name);
    ok &= expect(ctx, announced && announced->to_json().value("invalid", false), name + " announced as invalid");
    ok &= expect(ctx, h.connection->requests_for(name) == 0, name + " not requested");
  }
  ok &= expect(ctx, content_is(h, "present.log", "local data") && !h.exists("absent.log"), "nothing written");
  ok &= expect(ctx, h.index.need(FolderHarness::kFolder).empty(), "ignored files not needed");

  write_file(h.path(kIgnoreFileName), "");
  ok &= expect(ctx, h.scan(), "the scan without patterns");
  auto present = h.local("present.log");
  ok &= expect(ctx, present && !present->ignored && !present->deleted && present->blocks.size() == 1 &&
                    present->version.counters().size() == 1 &&
                    present->version.counter(FolderHarness::kLocalDevice) > 0,
               "present.log rescanned with a local-only version");
  auto absent = h.local("absent.log");
  ok &= expect(ctx, absent && absent->deleted && !absent->ignored && absent->version.counters().size() == 1 &&
                    absent->version.counter(FolderHarness::kLocalDevice) > 0,
               "absent.log deleted with a local-only version");
  return ok;
}

} // namespace


int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"pulls_new_file", test_pulls_new_file},
    {"pulls_directories_and_symlinks", test_pulls_directories_and_symlinks},
    {"symlink_traversal_refused", test_symlink_traversal_refused},
    {"remote_rename_over_local_edit", test_remote_rename_over_local_edit},
    {"unscanned_edit_not_overwritten", test_unscanned_edit_not_overwritten},
    {"delete_of_changed_file_refused", test_delete_of_changed_file_refused},
    {"failure_without_source", test_failure_without_source},
    {"corrupt_source_skipped", test_corrupt_source_skipped},
    {"resumes_from_temp_file", test_resumes_from_temp_file},
    {"ignored_and_temporary_names_skipped", test_ignored_and_temporary_names_skipped},
    {"trashcan_does_not_follow_symlinks", test_trashcan_does_not_follow_symlinks},
    {"same_content_only_updates_metadata", test_same_content_only_updates_metadata},
    {"remote_symlink_replaces_local_file", test_remote_symlink_replaces_local_file},
    {"type_changes_converge", test_type_changes_converge},
    {"non_empty_directory_not_replaced", test_non_empty_directory_not_replaced},
    {"merge_applies_metadata", test_merge_applies_metadata},
    {"renamed_content_copied_locally", test_renamed_content_copied_locally},
    {"ignored_remote_files_recorded_invalid", test_ignored_remote_files_recorded_invalid},
  };
  return run_test_cases(argc, argv, "pull", tests);
}
