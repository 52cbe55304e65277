#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <string>

class SettingsManager;

// Immutable snapshot of the settings the core consumes.
struct Config {
  // Protocol timings. Tests shrink these.
  struct Timing {
    std::chrono::milliseconds handshake{10000};
    std::chrono::milliseconds reply{15000};
    std::chrono::milliseconds command{10000};
    std::chrono::milliseconds idle_before_ping{25000};
    std::chrono::milliseconds ping_expiry{30000};
    std::chrono::milliseconds sweep{500};
    std::chrono::milliseconds retry_initial{100};
    int max_retries = 5;
    std::chrono::milliseconds close_grace{500};
    std::chrono::milliseconds ack_wait{10000};
    std::chrono::milliseconds pause_poll{200};
    std::chrono::milliseconds path_ack_gap{100};
    int path_ack_repeats = 3;
    std::size_t chunk_size = 256 * 1024;
  };

  std::filesystem::path folder = ".";
  std::string name;
  bool read_only = false;
  bool write_only = false;
  uint64_t max_size_mb = 0;
  bool verify = true;
  bool verbose = false;
  std::size_t max_transfers = 3;
  std::string listen_ip = "0.0.0.0";
  uint16_t listen_port = 8080;
  std::string target;
  Timing timing;

  // 0 means unlimited.
  uint64_t max_size_bytes() const { return max_size_mb * 1024ull * 1024ull; }

  // Resolves the folder to an absolute path and an empty name to the hostname.
  static Config from_settings(const SettingsManager& settings);
};

std::string default_display_name();
