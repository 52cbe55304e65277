#include "config.hpp"

#include <unistd.h>

#include "settings_manager.hpp"

std::string default_display_name() {
  char hostname[256] = {0};
  if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
    return "UnknownHost";
  }
  return hostname;
}

Config Config::from_settings(const SettingsManager& settings) {
  Config config;
  std::error_code ec;
  auto folder = std::filesystem::path(settings.get<std::string>("folder"));
  auto absolute = std::filesystem::absolute(folder, ec);
  config.folder = ec ? folder : absolute.lexically_normal();
  config.name = settings.get<std::string>("name");
  if(config.name.empty()) config.name = default_display_name();
  config.read_only = settings.get<bool>("readonly");
  config.write_only = settings.get<bool>("writeonly");
  config.max_size_mb = static_cast<uint64_t>(settings.get<int>("maxsize"));
  config.verify = settings.get<bool>("verify");
  config.verbose = settings.get<bool>("verbose");
  config.max_transfers = static_cast<std::size_t>(settings.get<int>("max_transfers"));
  config.listen_ip = settings.get<std::string>("listen_ip");
  config.listen_port = static_cast<uint16_t>(settings.get<int>("listen_port"));
  config.target = settings.get<std::string>("target");
  return config;
}
