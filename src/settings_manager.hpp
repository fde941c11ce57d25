#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

// Every key the tool understands. "choices" restricts string values and
// "min" bounds integers; non-persistent keys are never written by save().
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","command"},      {"aliases", {"cmd"}},           {"type","string"}, {"default",""},     {"description","Subcommand: scan, rename, report, db, settings"}, {"persistent", false}},
  {{"key","path"},         {"aliases", {"p"}},             {"type","string"}, {"default",""},     {"description","ROM directory to operate on"}, {"persistent", false}},
  {{"key","database_dir"}, {"aliases", {"db","dats"}},     {"type","string"}, {"default","data"}, {"description","Directory scanned for DAT files"}, {"persistent", true}},
  {{"key","recursive"},    {"aliases", {"r"}},             {"type","bool"},   {"default",false},  {"description","Descend into subdirectories"}, {"persistent", true}},
  {{"key","dry_run"},      {"aliases", {"d","dry"}},       {"type","bool"},   {"default",false},  {"description","Report renames without touching files"}, {"persistent", false}},
  {{"key","backup"},       {"aliases", {"b"}},             {"type","bool"},   {"default",false},  {"description","Copy ROMs to the backup directory before renaming"}, {"persistent", false}},
  {{"key","backup_dir"},   {"aliases", {"bd"}},            {"type","string"}, {"default",""},     {"description","Backup root (empty = <path>_backup)"}, {"persistent", true}},
  {{"key","output"},       {"aliases", {"o"}},             {"type","string"}, {"default",""},     {"description","Report output file"}, {"persistent", false}},
  {{"key","format"},       {"aliases", {"f"}},             {"type","string"}, {"default","json"}, {"description","Report format"}, {"choices", {"json","html","csv"}}, {"persistent", true}},
  {{"key","add"},          {"aliases", {"a"}},             {"type","string"}, {"default",""},     {"description","db: load a DAT file"}, {"persistent", false}},
  {{"key","list"},         {"aliases", {"l"}},             {"type","bool"},   {"default",false},  {"description","db: list loaded catalogs"}, {"persistent", false}},
  {{"key","stats"},        {"aliases", {"s"}},             {"type","bool"},   {"default",false},  {"description","db: show catalog statistics"}, {"persistent", false}},
  {{"key","find"},         {"aliases", {"q","query"}},     {"type","string"}, {"default",""},     {"description","db: look up catalog entries by name"}, {"persistent", false}},
  {{"key","jobs"},         {"aliases", {"j"}},             {"type","int"},    {"default",1},      {"description","Files identified in parallel"}, {"min", 1}, {"persistent", true}},
  {{"key","log_file"},     {"aliases", {"log"}},           {"type","string"}, {"default",""},     {"description","Also write diagnostics to this file"}, {"persistent", true}},
  {{"key","verbose"},      {"aliases", {"v"}},             {"type","bool"},   {"default",false},  {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},         {"aliases", {"h","?"}},         {"type","bool"},   {"default",false},  {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},         {"aliases", {"persist"}},       {"type","bool"},   {"default",false},  {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
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

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    std::vector<std::string> choices;
    std::optional<int> min_value;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  static std::string join_choices(const std::vector<std::string>& choices);

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = to_lower_copy(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = to_lower_copy(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    if(entry.contains("choices")) {
      spec.choices = entry.at("choices").get<std::vector<std::string>>();
    }
    if(entry.contains("min")) {
      spec.min_value = entry.at("min").get<int>();
    }
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower_copy(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
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
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(spec.persistent) doc[spec.key] = settings_.at(spec.key);
  }
  out << doc.dump(2);
  return true;
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                                  const nlohmann::json& value,
                                                  std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    int number = value.get<int>();
    if(spec.min_value && number < *spec.min_value) {
      error = "must be at least " + std::to_string(*spec.min_value);
      return false;
    }
    settings_[spec.key] = number;
    return true;
  }
  if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    auto text = value.get<std::string>();
    if(!spec.choices.empty()) {
      text = to_lower_copy(text);
      if(std::find(spec.choices.begin(), spec.choices.end(), text) == spec.choices.end()) {
        error = "expected one of " + join_choices(spec.choices);
        return false;
      }
    }
    settings_[spec.key] = text;
    return true;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                             const std::string& value,
                                                             std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower_copy(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int number = std::stoi(clean, &consumed);
      if(consumed != clean.size()) {
        error = "expected integer";
        return {};
      }
      return number;
    } catch(const std::exception&) {
      error = "expected integer";
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                                const std::string& value,
                                                std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::join_choices(const std::vector<std::string>& choices) {
  std::string out;
  for(std::size_t i = 0; i < choices.size(); ++i) {
    if(i > 0) out += "|";
    out += choices[i];
  }
  return out;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
