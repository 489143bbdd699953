#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

// Every option ndog understands. Keys double as long option names and as
// entries in the settings file; only "persistent" ones are saved.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen"},            {"aliases", {"l"}},               {"type","bool"},   {"default",false}, {"description","Listen for inbound connections instead of connecting"}, {"persistent", false}},
  {{"key","host"},              {"aliases", {"c","connect"}},     {"type","string"}, {"default",""},    {"description","Host to connect to"}, {"persistent", false}},
  {{"key","port"},              {"aliases", {"p"}},               {"type","int"},    {"default",0},     {"min",0}, {"max",65535}, {"description","Port to connect to or listen on"}, {"persistent", false}},
  {{"key","udp"},               {"aliases", {"u"}},               {"type","bool"},   {"default",false}, {"description","Use UDP instead of TCP"}, {"persistent", true}},
  {{"key","verbose"},           {"aliases", {"v"}},               {"type","bool"},   {"default",false}, {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","hex"},               {"aliases", {"x"}},               {"type","bool"},   {"default",false}, {"description","Render inbound data as a hex dump"}, {"persistent", true}},
  {{"key","color"},             {"aliases", {"colour"}},          {"type","bool"},   {"default",true},  {"description","Colour console output"}, {"persistent", true}},
  {{"key","wait"},              {"aliases", {"w","timeout"}},     {"type","int"},    {"default",3},     {"min",1}, {"max",3600}, {"description","Connect timeout in seconds"}, {"persistent", true}},
  {{"key","idle_timeout"},      {"aliases", {"idle"}},            {"type","int"},    {"default",10},    {"min",1}, {"max",86400}, {"description","Seconds without data before a file receive gives up"}, {"persistent", true}},
  {{"key","keep_open"},         {"aliases", {"k"}},               {"type","bool"},   {"default",false}, {"description","Keep the session (or listener) open after local EOF or a finished transfer"}, {"persistent", true}},
  {{"key","ssl"},               {"aliases", {"tls"}},             {"type","bool"},   {"default",false}, {"description","Wrap TCP sessions in TLS"}, {"persistent", true}},
  {{"key","cert"},              {"aliases", {}},                  {"type","string"}, {"default",""},    {"description","TLS certificate (PEM)"}, {"persistent", true}},
  {{"key","key"},               {"aliases", {}},                  {"type","string"}, {"default",""},    {"description","TLS private key (PEM)"}, {"persistent", true}},
  {{"key","send_file"},         {"aliases", {"f","file"}},        {"type","string"}, {"default",""},    {"description","Send this file, then close"}, {"persistent", false}},
  {{"key","receive_file"},      {"aliases", {"r","receive"}},     {"type","string"}, {"default",""},    {"description","Receive one file into this path ('-' keeps the sender's name)"}, {"persistent", false}},
  {{"key","message"},           {"aliases", {"m"}},               {"type","string"}, {"default",""},    {"description","Send this line once, then close"}, {"persistent", false}},
  {{"key","output"},            {"aliases", {"o"}},               {"type","string"}, {"default",""},    {"description","Mirror everything rendered locally into this file"}, {"persistent", true}},
  {{"key","timestamp"},         {"aliases", {"ts"}},              {"type","bool"},   {"default",false}, {"description","Prefix rendered lines with a timestamp"}, {"persistent", true}},
  {{"key","chat"},              {"aliases", {"i","interactive"}}, {"type","bool"},   {"default",false}, {"description","Interactive chat with line editing and /commands"}, {"persistent", true}},
  {{"key","broadcast"},         {"aliases", {"b","relay"}},       {"type","bool"},   {"default",true},  {"description","Listener relays data between connected clients"}, {"persistent", true}},
  {{"key","poll_interval_ms"},  {"aliases", {"poll"}},            {"type","int"},    {"default",200},   {"min",10}, {"max",5000}, {"description","Bounded wait used by every loop to observe shutdown"}, {"persistent", true}},
  {{"key","peer_idle_timeout"}, {"aliases", {"pit"}},             {"type","int"},    {"default",60},    {"min",1}, {"max",86400}, {"description","Seconds of silence before a UDP peer is forgotten"}, {"persistent", true}},
  {{"key","peer_sweep_interval"},{"aliases", {"psi"}},            {"type","int"},    {"default",5},     {"min",1}, {"max",3600}, {"description","Seconds between UDP peer sweeps"}, {"persistent", true}},
  {{"key","local_ip"},          {"aliases", {}},                  {"type","bool"},   {"default",false}, {"description","Show the local IP address in the listen banner"}, {"persistent", true}},
  {{"key","public_ip"},         {"aliases", {}},                  {"type","bool"},   {"default",false}, {"description","Show the public IP address in the listen banner"}, {"persistent", true}},
  {{"key","help"},              {"aliases", {"h","?"}},           {"type","bool"},   {"default",false}, {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},              {"aliases", {"persist"}},         {"type","bool"},   {"default",false}, {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { boolean, integer, text };

struct SettingDef {
  std::string key;
  std::vector<std::string> aliases;
  SettingType type = SettingType::text;
  nlohmann::json default_value;
  std::optional<long long> min;
  std::optional<long long> max;
  std::string description;
  bool persistent = true;
};

const char* setting_type_name(SettingType type);

// Typed view over SETTINGS_SPECIFICATION plus the values currently in effect.
// Values start at their defaults and are overlaid by the settings file and
// then the command line.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return it->get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  // True once the value was set by a settings file or the command line.
  bool is_explicit(const std::string& key) const { return explicit_keys_.count(key) > 0; }

  std::filesystem::path get_path(const std::string& key) const { return get<std::string>(key); }
  std::chrono::seconds get_seconds(const std::string& key) const { return std::chrono::seconds(get<int>(key)); }
  std::chrono::milliseconds get_millis(const std::string& key) const { return std::chrono::milliseconds(get<int>(key)); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const { return save_to_file(settings_path()); }
  bool load() { return load_from_file(settings_path()); }
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  // Canonical key for a key or alias; '-' and '_' are interchangeable.
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  const std::vector<SettingDef>& definitions() const { return definitions_; }

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { settings_path_override_ = path; }

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static std::optional<bool> parse_bool(const std::string& value);

private:
  const SettingDef* find(const std::string& token) const;
  void merge_from_json(const nlohmann::json& doc);
  bool store(const SettingDef& def, const nlohmann::json& value, std::string& error);

  std::vector<SettingDef> definitions_;
  std::unordered_map<std::string, std::size_t> index_;
  nlohmann::json values_;
  std::set<std::string> explicit_keys_;
  std::filesystem::path settings_path_override_;
};
