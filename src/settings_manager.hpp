#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every setting the engine understands. "min"/"max" bound integers,
// "choices" restricts strings.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","device_id"},          {"aliases", {"id"}},                {"type","string"}, {"default",""},          {"description","This device's identifier (random if empty)"}, {"persistent", true}},
  {{"key","folder_id"},          {"aliases", {"folder"}},            {"type","string"}, {"default","default"},   {"description","Identifier of the shared folder"}, {"persistent", true}},
  {{"key","folder_path"},        {"aliases", {"path","fp"}},         {"type","string"}, {"default","share"},     {"description","Directory to keep in sync, relative to the workspace"}, {"persistent", true}},
  {{"key","listen_ip"},          {"aliases", {"li"}},                {"type","string"}, {"default","127.0.0.1"}, {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","listen_port"},        {"aliases", {"lp","port"}},         {"type","int"},    {"default",9000},        {"min",0}, {"max",65535}, {"description","TCP port to listen on (0 = any)"}, {"persistent", true}},
  {{"key","peers"},              {"aliases", {"peer","connect"}},    {"type","string"}, {"default",""},          {"description","Comma separated host:port list of devices to connect to"}, {"persistent", true}},
  {{"key","pull_interval_ms"},   {"aliases", {"interval","pi"}},     {"type","int"},    {"default",10000},       {"min",10},  {"description","Milliseconds between pull cycles"}, {"persistent", true}},
  {{"key","scan_interval_ms"},   {"aliases", {"scan_interval","si"}},{"type","int"},    {"default",60000},       {"min",0},   {"description","Milliseconds between full rescans (0 = never)"}, {"persistent", true}},
  {{"key","pull_batch_size"},    {"aliases", {"batch"}},             {"type","int"},    {"default",1000},        {"min",1},   {"description","Needed files handled per pull cycle"}, {"persistent", true}},
  {{"key","copier_concurrency"}, {"aliases", {"copiers"}},           {"type","int"},    {"default",1},           {"min",1}, {"max",64}, {"description","Local copy workers per folder"}, {"persistent", true}},
  {{"key","puller_concurrency"}, {"aliases", {"pullers"}},           {"type","int"},    {"default",4},           {"min",1}, {"max",256}, {"description","Concurrent block requests per folder"}, {"persistent", true}},
  {{"key","request_timeout_ms"}, {"aliases", {"timeout"}},           {"type","int"},    {"default",30000},       {"min",100}, {"description","Milliseconds to wait for a block response"}, {"persistent", true}},
  {{"key","versioning"},         {"aliases", {"ver"}},               {"type","string"}, {"default","none"},      {"choices", {"none","trashcan","simple"}}, {"description","What to keep of replaced and deleted files"}, {"persistent", true}},
  {{"key","versioning_keep"},    {"aliases", {"keep"}},              {"type","int"},    {"default",5},           {"min",1},   {"description","Copies kept per file by simple versioning"}, {"persistent", true}},
  {{"key","verbose"},            {"aliases", {"v"}},                 {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},               {"aliases", {"h","?"}},             {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},               {"aliases", {"persist"}},           {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  enum class Type { Bool, Int, String };

  struct Setting {
    std::string key;
    std::vector<std::string> aliases; // lower case
    Type type = Type::String;
    nlohmann::json default_value;
    std::optional<int64_t> min;
    std::optional<int64_t> max;
    std::vector<std::string> choices;
    std::string description;
    bool persistent = true;
  };

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  const std::vector<Setting>& settings() const { return settings_specs_; }
  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  // One line per setting: names, default and description.
  std::string describe() const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static std::vector<std::string> split_list(const std::string& value);

private:
  const Setting* find(const std::string& token) const;
  void merge_from_json(const nlohmann::json& doc);
  bool store(const Setting& setting, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const Setting& setting, const std::string& value, std::string& error) const;

  std::vector<Setting> settings_specs_;
  nlohmann::json values_;
  std::filesystem::path settings_path_override_;
};

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
