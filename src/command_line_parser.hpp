#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Applies `--key value`, `-alias value` and positional arguments to a
// SettingsManager. Bool options take an optional literal (`-ro`, `-ro off`).
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "lanshare",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","target"}}
                    }));

  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
