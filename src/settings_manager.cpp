#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "log.hpp"

namespace {

SettingsManager::Type type_from_string(const std::string& type) {
  if(type == "bool") return SettingsManager::Type::Bool;
  if(type == "int") return SettingsManager::Type::Int;
  if(type == "string") return SettingsManager::Type::String;
  throw std::runtime_error("Unsupported setting type '" + type + "'");
}

std::string json_to_display(const nlohmann::json& value) {
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

} // namespace

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification) {
  values_ = nlohmann::json::object();
  for(const auto& entry : specification) {
    Setting s;
    s.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      s.aliases.push_back(to_lower(alias));
    }
    s.type = type_from_string(entry.at("type").get<std::string>());
    s.default_value = entry.at("default");
    if(entry.contains("min")) s.min = entry.at("min").get<int64_t>();
    if(entry.contains("max")) s.max = entry.at("max").get<int64_t>();
    s.choices = entry.value("choices", std::vector<std::string>{});
    s.description = entry.value("description", "");
    s.persistent = entry.value("persistent", true);
    values_[s.key] = s.default_value;
    settings_specs_.push_back(std::move(s));
  }
}

const SettingsManager::Setting* SettingsManager::find(const std::string& token) const {
  std::string lowered = to_lower(trim_copy(token));
  for(const auto& s : settings_specs_) {
    if(lowered == to_lower(s.key)) return &s;
    if(std::find(s.aliases.begin(), s.aliases.end(), lowered) != s.aliases.end()) return &s;
  }
  return nullptr;
}

bool SettingsManager::has(const std::string& key) const {
  return values_.contains(key);
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(settings_specs_.size());
  for(const auto& s : settings_specs_) out.push_back(s.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  return json_to_display(values_.at(key));
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* s = find(token)) return s->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* s = find(key);
  return s && s->type == Type::Bool;
}

std::string SettingsManager::describe() const {
  std::ostringstream out;
  for(const auto& s : settings_specs_) {
    out << "  --" << s.key;
    for(const auto& alias : s.aliases) out << ", -" << alias;
    out << "\n      " << s.description << " (default: " << json_to_display(s.default_value);
    if(!s.choices.empty()) {
      out << ", one of:";
      for(const auto& c : s.choices) out << " " << c;
    }
    out << ")\n";
  }
  return out.str();
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* s = find(item.key());
    if(!s) continue;
    std::string error;
    if(!store(*s, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& s : settings_specs_) {
    if(persistent_only && !s.persistent) continue;
    doc[s.key] = values_.at(s.key);
  }
  return doc;
}

bool SettingsManager::store(const Setting& s, const nlohmann::json& value, std::string& error) {
  switch(s.type) {
    case Type::Bool:
      if(value.is_boolean()) {
        values_[s.key] = value.get<bool>();
        return true;
      }
      if(value.is_number_integer()) {
        values_[s.key] = value.get<int64_t>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;

    case Type::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      auto n = value.get<int64_t>();
      if((s.min && n < *s.min) || (s.max && n > *s.max)) {
        error = "out of range";
        if(s.min) error += ", min " + std::to_string(*s.min);
        if(s.max) error += ", max " + std::to_string(*s.max);
        return false;
      }
      values_[s.key] = n;
      return true;
    }

    case Type::String: {
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      auto text = value.get<std::string>();
      if(!s.choices.empty() && std::find(s.choices.begin(), s.choices.end(), text) == s.choices.end()) {
        error = "'" + text + "' is not one of the allowed values";
        return false;
      }
      values_[s.key] = text;
      return true;
    }
  }
  error = "unknown type";
  return false;
}

nlohmann::json SettingsManager::parse_string_value(const Setting& s,
                                                   const std::string& value,
                                                   std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  switch(s.type) {
    case Type::Bool: {
      std::string v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
      if(v == "false" || v == "0" || v == "off" || v == "no") return false;
      error = "expected boolean (true|false|on|off)";
      return {};
    }
    case Type::Int:
      try {
        std::size_t used = 0;
        auto n = std::stoll(clean, &used);
        if(used != clean.size()) {
          error = "expected integer";
          return {};
        }
        return static_cast<int64_t>(n);
      } catch(const std::exception& e) {
        error = e.what();
        return {};
      }
    case Type::String:
      return clean;
  }
  error = "unsupported type";
  return {};
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  const auto* s = find(key);
  if(!s) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*s, value, error);
  if(!error.empty()) return false;
  return store(*s, parsed, error);
}

bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  const auto* s = find(key);
  if(!s) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return store(*s, value, error);
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

std::vector<std::string> SettingsManager::split_list(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream ss(value);
  std::string item;
  while(std::getline(ss, item, ',')) {
    item = trim_copy(item);
    if(!item.empty()) out.push_back(item);
  }
  return out;
}
