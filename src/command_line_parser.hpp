#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys. Options are `--key[=value]` or the
// short `-alias [value]` form; bool options take an optional literal.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "ndog",
                             std::vector<std::string> positional_keys = {"host", "port"});

  // Applies argv on top of whatever `settings` already holds. Returns false
  // with a message in `error` on unknown options or bad values.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  void usage(const SettingsManager& settings) const;

private:
  enum class OptionResult { applied, not_an_option, failed };

  OptionResult apply_option(const std::vector<std::string>& args,
                            std::size_t& i,
                            std::string name,
                            bool long_form,
                            SettingsManager& settings,
                            std::string& error) const;

  static bool is_option_token(const std::string& candidate);
  static void normalize_listen_port(SettingsManager& settings);

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
