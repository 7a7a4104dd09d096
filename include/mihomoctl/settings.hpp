#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mihomoctl {

struct ReleaseSettings {
  std::string api_url = "https://api.github.com/repos/MetaCubeX/mihomo";
  std::string download_url = "https://github.com/MetaCubeX/mihomo/releases/download";
  int timeout_sec = 60;
};

struct ServiceSettings {
  int stop_timeout_sec = 5;
  int probe_ms = 500;
  int log_max_mb = 5;
};

struct ControllerSettings {
  int timeout_ms = 5000;
};

struct StreamSettings {
  int reconnect_attempts = 5;
  int reconnect_base_ms = 500;
  int reconnect_max_ms = 10000;
  int poll_ms = 200;
  int log_buffer = 256;
};

enum class RestartMode { Never, Backoff };

struct MonitorSettings {
  int interval_sec = 5;
  RestartMode restart = RestartMode::Backoff;
  int max_attempts = 5;
  int base_delay_ms = 1000;
  int max_delay_ms = 30000;
  int healthy_reset_sec = 60;
};

struct LogSettings {
  std::string level = "info";
  bool file = false;
};

// Manager-level settings from <home>/config.toml.
struct Settings {
  ReleaseSettings release;
  ServiceSettings service;
  ControllerSettings controller;
  StreamSettings stream;
  MonitorSettings monitor;
  LogSettings log;

  // Missing file -> defaults. Malformed values -> ValidationError.
  static Settings Load(const std::filesystem::path &p);
};

} // namespace mihomoctl
