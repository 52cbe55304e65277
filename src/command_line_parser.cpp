#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  SettingsManager probe(settings_spec_);
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    if(!probe.resolve_key(out.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + out.key + "'");
    }
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?');
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
  std::size_t positional_index = 0;
  error.clear();

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(is_option_token(token)) {
      bool long_form = token.rfind("--", 0) == 0;
      std::string key_token = token.substr(long_form ? 2 : 1);
      std::string inline_value;
      bool has_inline_value = false;
      if(auto eq = key_token.find('='); long_form && eq != std::string::npos) {
        inline_value = key_token.substr(eq + 1);
        key_token = key_token.substr(0, eq);
        has_inline_value = true;
      }

      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        error = "Unknown option " + token;
        return false;
      }

      std::string value;
      if(has_inline_value) {
        value = inline_value;
      } else if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          error = "Missing value for option '" + token + "'";
          return false;
        }
        value = args[++i];
      }

      std::string set_error;
      if(!settings.set_from_string(*resolved, value, set_error)) {
        error = "Invalid value for option '" + token + "': " + set_error;
        return false;
      }
      continue;
    }

    if(positional_index >= positional_specs_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string set_error;
    if(!settings.set_from_string(spec.key, token, set_error)) {
      error = "Invalid value for " + spec.key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - LAN file sharing between two nodes", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_ + " [options]";
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(nullptr, "  {}", cmd);
  print_out(nullptr, "  Without a target the node listens for a peer; with host:port it dials one.");
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::string aliases;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";
    const auto& default_value = entry.at("default");
    std::string default_str = default_value.is_string()
      ? default_value.get<std::string>()
      : default_value.dump();
    print_out(nullptr, "  --{:<14} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              entry.value("description", ""),
              aliases,
              default_str);
  }
  print_out(nullptr, "");
}
