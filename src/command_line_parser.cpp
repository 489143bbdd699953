#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {
  SettingsManager defaults;
  for(const auto& key : positional_keys_) {
    if(!defaults.resolve_key(key)) {
      throw std::runtime_error("Positional argument mapped to unknown setting '" + key + "'");
    }
  }
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?');
}

// `ndog -l 9000` names only a port; the first positional slot is the host.
void CommandLineParser::normalize_listen_port(SettingsManager& settings) {
  if(!settings.get<bool>("listen") || settings.get<int>("port") != 0) return;
  auto host = settings.get<std::string>("host");
  if(host.empty() || !std::all_of(host.begin(), host.end(),
                                  [](unsigned char ch){ return std::isdigit(ch); })) {
    return;
  }
  std::string error;
  if(settings.set_from_string("port", host, error)) {
    settings.set_from_string("host", "", error);
  }
}

CommandLineParser::OptionResult CommandLineParser::apply_option(const std::vector<std::string>& args,
                                                                std::size_t& i,
                                                                std::string name,
                                                                bool long_form,
                                                                SettingsManager& settings,
                                                                std::string& error) const {
  std::string value;
  bool has_value = false;
  auto eq = name.find('=');
  if(long_form && eq != std::string::npos) {
    value = name.substr(eq + 1);
    name.resize(eq);
    has_value = true;
  }

  auto key = settings.resolve_key(name);
  if(!key) {
    if(!long_form) return OptionResult::not_an_option;
    error = "Unknown option --" + name;
    return OptionResult::failed;
  }

  if(!has_value) {
    bool has_next = i + 1 < args.size();
    if(settings.is_bool_setting(*key)) {
      // a trailing literal belongs to the flag: `-k off`
      if(has_next && !is_option_token(args[i + 1]) && SettingsManager::parse_bool(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else if(has_next) {
      value = args[++i];
    } else {
      error = "Missing value for option '" + name + "'";
      return OptionResult::failed;
    }
  }

  std::string set_error;
  if(!settings.set_from_string(*key, value, set_error)) {
    error = "Invalid value for option '" + name + "': " + set_error;
    return OptionResult::failed;
  }
  return OptionResult::applied;
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args, settings, error);
}

bool CommandLineParser::parse(const std::vector<std::string>& args,
                              SettingsManager& settings,
                              std::string& error) const {
  error.clear();
  std::size_t next_positional = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(token.size() > 2 && token.rfind("--", 0) == 0) {
      if(apply_option(args, i, token.substr(2), true, settings, error) == OptionResult::failed) return false;
      continue;
    }
    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      auto result = apply_option(args, i, token.substr(1), false, settings, error);
      if(result == OptionResult::failed) return false;
      if(result == OptionResult::applied) continue;
      // unknown short forms such as "-" are positional
    }

    if(next_positional >= positional_keys_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& key = positional_keys_[next_positional++];
    std::string set_error;
    if(!settings.set_from_string(key, token, set_error)) {
      error = "Invalid value for " + key + " '" + token + "': " + set_error;
      return false;
    }
  }

  normalize_listen_port(settings);
  return true;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  print_out(nullptr, "{} - TCP/UDP duplex channel with optional TLS, file transfer and chat", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [options] <host> <port>      connect", process_name_);
  print_out(nullptr, "  {} -l [options] <port>          listen", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& def : settings.definitions()) {
    std::string hint = def.type == SettingType::boolean
      ? "[true|false]"
      : std::string("<") + setting_type_name(def.type) + ">";
    std::string aliases;
    for(const auto& alias : def.aliases) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";
    std::string fallback = def.default_value.is_string()
      ? def.default_value.get<std::string>()
      : def.default_value.dump();
    print_out(nullptr, "  --{:<20} {:<12} {}{} (default: {})",
              def.key, hint, def.description, aliases, fallback);
  }
  print_out(nullptr, "");
}
