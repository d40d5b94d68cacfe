#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "test_runner_utils.hpp"

#include <string>
#include <vector>

using namespace replisync::test;

namespace {

bool throws_command_line_error(const std::vector<std::string>& args) {
  SettingsManager settings;
  CommandLineParser parser;
  try {
    parser.parse(args, settings);
  } catch(const CommandLineError&) {
    return true;
  }
  return false;
}

bool test_defaults(TestContext& ctx) {
  SettingsManager settings;
  bool ok = true;
  ok &= expect(ctx, settings.get<std::string>("folder_id") == "default", "folder_id default");
  ok &= expect(ctx, settings.get<int>("listen_port") == 9000, "listen_port default");
  ok &= expect(ctx, settings.get<int64_t>("pull_interval_ms") == 10000, "pull interval default");
  ok &= expect(ctx, settings.get<int>("puller_concurrency") == 4, "puller concurrency default");
  ok &= expect(ctx, settings.get<std::string>("versioning") == "none", "versioning default");
  ok &= expect(ctx, !settings.help_requested() && !settings.save_requested(), "no help or save by default");
  ok &= expect(ctx, settings.resolve_key("PORT") == std::optional<std::string>("listen_port"),
               "aliases resolved case-insensitively");
  return ok;
}

bool test_command_line(TestContext& ctx) {
  SettingsManager settings;
  CommandLineParser parser;
  parser.parse({"--pi", "250", "-v", "myshare", "0", "10.0.0.1:9000, 10.0.0.2:9001",
                "--versioning=trashcan", "--keep", "3", "--scan_interval_ms", "0"}, settings);

  bool ok = true;
  ok &= expect(ctx, settings.get<int64_t>("pull_interval_ms") == 250, "-pi to set the pull interval");
  ok &= expect(ctx, settings.get<bool>("verbose"), "-v without a literal to mean true");
  ok &= expect(ctx, settings.get<std::string>("folder_path") == "myshare", "the first positional as folder_path");
  ok &= expect(ctx, settings.get<int>("listen_port") == 0, "the second positional as listen_port");
  ok &= expect(ctx, SettingsManager::split_list(settings.get<std::string>("peers")) ==
                    std::vector<std::string>{"10.0.0.1:9000", "10.0.0.2:9001"},
               "the third positional as the peer list");
  ok &= expect(ctx, settings.get<std::string>("versioning") == "trashcan", "--key=value");
  ok &= expect(ctx, settings.get<int>("versioning_keep") == 3, "an alias with a value");
  ok &= expect(ctx, settings.get<int64_t>("scan_interval_ms") == 0, "periodic scans disabled");

  SettingsManager with_bool;
  parser.parse({"--verbose", "false", "--help"}, with_bool);
  ok &= expect(ctx, !with_bool.get<bool>("verbose") && with_bool.help_requested(), "explicit bool literals");

  auto usage = parser.usage(settings);
  ok &= expect(ctx, usage.find("--pull_interval_ms") != std::string::npos &&
                    usage.find("[folder_path]") != std::string::npos,
               "usage listing options and positionals");
  return ok;
}

bool test_command_line_errors(TestContext& ctx) {
  bool ok = true;
  ok &= expect(ctx, throws_command_line_error({"--bogus", "1"}), "an unknown option refused");
  ok &= expect(ctx, throws_command_line_error({"--listen_port", "70000"}), "an out of range port refused");
  ok &= expect(ctx, throws_command_line_error({"--pi", "5"}), "a pull interval below the minimum refused");
  ok &= expect(ctx, throws_command_line_error({"--versioning", "zip"}), "an unknown versioning type refused");
  ok &= expect(ctx, throws_command_line_error({"--pullers", "many"}), "a non-numeric value refused");
  ok &= expect(ctx, throws_command_line_error({"--pi"}), "a missing value refused");
  ok &= expect(ctx, throws_command_line_error({"a", "1", "b", "extra"}), "an extra positional refused");
  return ok;
}

bool test_save_and_load(TestContext& ctx) {
  TempDir dir;
  const auto path = dir / "settings.json";
  SettingsManager settings;
  std::string error;
  bool ok = expect(ctx, settings.set_from_json("device_id", "dev-a", error), "device_id set: " + error);
  ok &= expect(ctx, settings.set_from_string("pullers", "8", error), "pullers set: " + error);
  ok &= expect(ctx, settings.set_from_json("help", true, error), "help set: " + error);
  ok &= expect(ctx, !settings.set_from_json("listen_port", "9000", error), "a string refused for an integer");
  ok &= expect(ctx, settings.save_to_file(path), "the settings saved");

  SettingsManager loaded;
  ok &= expect(ctx, loaded.load_from_file(path), "the settings loaded");
  ok &= expect(ctx, loaded.get<std::string>("device_id") == "dev-a", "device_id persisted");
  ok &= expect(ctx, loaded.get<int>("puller_concurrency") == 8, "puller concurrency persisted");
  ok &= expect(ctx, !loaded.help_requested(), "help not persisted");

  write_file(path, "{ not json");
  SettingsManager broken;
  ok &= expect(ctx, !broken.load_from_file(path), "a malformed file rejected");
  ok &= expect(ctx, broken.get<std::string>("device_id").empty(), "defaults kept after a failed load");
  return ok;
}

bool test_folder_config(TestContext& ctx) {
  SettingsManager settings;
  CommandLineParser parser;
  parser.parse({"--folder", "photos", "--path", "pics", "--batch", "10", "--copiers", "2",
                "--timeout", "500", "--ver", "simple", "--keep", "2"}, settings);
  auto config = folder_config_from_settings(settings, "/work", "dev-a");

  bool ok = true;
  ok &= expect(ctx, config.id == "photos" && config.device_id == "dev-a", "folder and device ids");
  ok &= expect(ctx, config.path == std::filesystem::path("/work/pics"), "a relative path under the workspace");
  ok &= expect(ctx, config.pull_batch_size == 10 && config.copier_concurrency == 2, "batch and copier settings");
  ok &= expect(ctx, config.request_timeout == std::chrono::milliseconds(500), "the request timeout");
  ok &= expect(ctx, config.versioning == "simple" && config.versioning_keep == 2, "versioning settings");

  parser.parse({"--path", "/abs/share"}, settings);
  ok &= expect(ctx, folder_config_from_settings(settings, "/work", "dev-a").path == std::filesystem::path("/abs/share"),
               "an absolute path kept");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"defaults", test_defaults},
    {"command_line", test_command_line},
    {"command_line_errors", test_command_line_errors},
    {"save_and_load", test_save_and_load},
    {"folder_config", test_folder_config},
  };
  return run_test_cases(argc, argv, "settings", tests);
}
