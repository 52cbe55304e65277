#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// key, aliases, type (bool|int|string), default, optional min/max for ints,
// description, persistent (written by --save)
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","folder"},        {"aliases", {"f","dir"}},        {"type","string"}, {"default","."},       {"description","Shared folder"}, {"persistent", true}},
  {{"key","name"},          {"aliases", {"n"}},              {"type","string"}, {"default",""},        {"description","Display name sent in the handshake (hostname when empty)"}, {"persistent", true}},
  {{"key","listen_port"},   {"aliases", {"lp","port","p"}},  {"type","int"},    {"default",8080},      {"min",0}, {"max",65535}, {"description","TCP port to listen on"}, {"persistent", true}},
  {{"key","listen_ip"},     {"aliases", {"li"}},             {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","target"},        {"aliases", {"ip","connect"}},   {"type","string"}, {"default",""},        {"description","Peer host:port to dial (client mode)"}, {"persistent", false}},
  {{"key","readonly"},      {"aliases", {"ro"}},             {"type","bool"},   {"default",false},     {"description","Never send files to the peer"}, {"persistent", true}},
  {{"key","writeonly"},     {"aliases", {"wo"}},             {"type","bool"},   {"default",false},     {"description","Never accept files from the peer"}, {"persistent", true}},
  {{"key","maxsize"},       {"aliases", {"max"}},            {"type","int"},    {"default",0},         {"min",0}, {"description","Maximum file size in MB (0 = unlimited)"}, {"persistent", true}},
  {{"key","verify"},        {"aliases", {"checksum"}},       {"type","bool"},   {"default",true},      {"description","Verify SHA-256 of every transfer"}, {"persistent", true}},
  {{"key","verbose"},       {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","max_transfers"}, {"aliases", {"mt"}},             {"type","int"},    {"default",3},         {"min",1}, {"description","Concurrent transfers allowed in progress"}, {"persistent", true}},
  {{"key","help"},          {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},          {"aliases", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const { return settings_.contains(key); }

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

  // Defaults to <cwd>/.config/settings.json until set.
  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::optional<long long> min;
    std::optional<long long> max;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void merge_from_json(const nlohmann::json& doc);
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
