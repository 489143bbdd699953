#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.hpp"

namespace {

SettingType parse_type(const std::string& name) {
  if(name == "bool") return SettingType::boolean;
  if(name == "int") return SettingType::integer;
  if(name == "string") return SettingType::text;
  throw std::runtime_error("Unsupported setting type '" + name + "'");
}

std::string normalize_token(const std::string& token) {
  auto lowered = SettingsManager::to_lower(SettingsManager::trim_copy(token));
  std::replace(lowered.begin(), lowered.end(), '-', '_');
  return lowered;
}

std::string range_text(const SettingDef& def) {
  return "[" + (def.min ? std::to_string(*def.min) : std::string("-inf")) + ", " +
         (def.max ? std::to_string(*def.max) : std::string("inf")) + "]";
}

} // namespace

const char* setting_type_name(SettingType type) {
  switch(type) {
    case SettingType::boolean: return "bool";
    case SettingType::integer: return "int";
    case SettingType::text:    return "string";
  }
  return "string";
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : values_(nlohmann::json::object()) {
  for(const auto& entry : specification) {
    SettingDef def;
    def.key = entry.at("key").get<std::string>();
    def.aliases = entry.value("aliases", std::vector<std::string>{});
    def.type = parse_type(entry.at("type").get<std::string>());
    def.default_value = entry.at("default");
    if(entry.contains("min")) def.min = entry.at("min").get<long long>();
    if(entry.contains("max")) def.max = entry.at("max").get<long long>();
    def.description = entry.value("description", "");
    def.persistent = entry.value("persistent", true);

    auto slot = definitions_.size();
    index_[normalize_token(def.key)] = slot;
    for(const auto& alias : def.aliases) {
      index_.emplace(normalize_token(alias), slot);
    }
    values_[def.key] = def.default_value;
    definitions_.push_back(std::move(def));
  }
}

const SettingDef* SettingsManager::find(const std::string& token) const {
  auto it = index_.find(normalize_token(token));
  if(it == index_.end()) return nullptr;
  return &definitions_[it->second];
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* def = find(token)) return def->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* def = find(key);
  return def && def->type == SettingType::boolean;
}

std::optional<bool> SettingsManager::parse_bool(const std::string& value) {
  auto v = to_lower(trim_copy(value));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

bool SettingsManager::store(const SettingDef& def, const nlohmann::json& value, std::string& error) {
  nlohmann::json accepted;
  switch(def.type) {
    case SettingType::boolean:
      if(value.is_boolean()) {
        accepted = value.get<bool>();
      } else if(value.is_number_integer()) {
        accepted = value.get<long long>() != 0;
      } else {
        error = "expected boolean";
        return false;
      }
      break;
    case SettingType::integer: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      auto number = value.get<long long>();
      if((def.min && number < *def.min) || (def.max && number > *def.max)) {
        error = "out of range " + range_text(def);
        return false;
      }
      accepted = static_cast<int>(number);
      break;
    }
    case SettingType::text:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      accepted = value;
      break;
  }
  values_[def.key] = std::move(accepted);
  explicit_keys_.insert(def.key);
  return true;
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  error.clear();
  const auto* def = find(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  auto clean = trim_copy(value);
  switch(def->type) {
    case SettingType::boolean: {
      auto flag = parse_bool(clean);
      if(!flag) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*def, *flag, error);
    }
    case SettingType::integer: {
      std::size_t consumed = 0;
      long long number = 0;
      try {
        number = std::stoll(clean, &consumed);
      } catch(const std::logic_error&) {
        error = "expected integer";
        return false;
      }
      if(consumed != clean.size()) {
        error = "trailing characters in integer";
        return false;
      }
      return store(*def, number, error);
    }
    case SettingType::text:
      return store(*def, clean, error);
  }
  return false;
}

bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  error.clear();
  const auto* def = find(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  return store(*def, value, error);
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".config" / "ndog" / "settings.json";
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  merge_from_json(doc);
  return true;
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

// Unknown and non-persistent keys are skipped; a bad value leaves the
// default in place.
void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* def = find(item.key());
    if(!def || !def->persistent) continue;
    std::string error;
    if(!store(*def, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& def : definitions_) {
    if(persistent_only && !def.persistent) continue;
    doc[def.key] = values_.at(def.key);
  }
  return doc;
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}
