#pragma once
#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mihomoctl {

struct ControllerVersion {
  std::string version;
  bool premium = false;
  bool meta = false;
};

struct DelayHistory {
  std::string time;
  int delay = 0;
};

struct ProxyInfo {
  std::string name;
  std::string type;
  std::optional<std::string> now;   // groups only
  std::vector<std::string> all;     // groups only
  std::vector<DelayHistory> history;
  bool udp = false;

  bool is_group() const { return !all.empty(); }
  // Most recent measured delay, 0 when never tested.
  int last_delay() const { return history.empty() ? 0 : history.back().delay; }
};

struct ProxyGroup {
  std::string name;
  std::string type;
  std::string now;
  std::vector<std::string> all;
};

struct ConnectionMetadata {
  std::string network;
  std::string type;
  std::string source_ip;
  std::string source_port;
  std::string destination_ip;
  std::string destination_port;
  std::string host;
};

struct ConnectionInfo {
  std::string id;
  ConnectionMetadata metadata;
  std::uint64_t upload = 0;
  std::uint64_t download = 0;
  std::string start;
  std::vector<std::string> chains;
  std::string rule;
  std::string rule_payload;
};

struct ConnectionsSnapshot {
  std::uint64_t download_total = 0;
  std::uint64_t upload_total = 0;
  std::vector<ConnectionInfo> connections;
};

enum class LogLevel { Debug, Info, Warning, Error, Silent };

// "debug", "info", "warning"/"warn", "error", "silent"; ValidationError otherwise.
LogLevel parse_log_level(const std::string &s);
const char *log_level_name(LogLevel l);

struct LogEntry {
  LogLevel level = LogLevel::Info;
  std::string payload;
};

struct TrafficSample {
  std::uint64_t up = 0;   // bytes/s
  std::uint64_t down = 0; // bytes/s
};

struct MemorySample {
  std::uint64_t inuse = 0;
  std::uint64_t oslimit = 0;
};

// nullopt when `text` is not valid JSON.
std::optional<Json::Value> parse_json(const std::string &text);
std::string write_json(const Json::Value &v);

// Missing and null members read as defaults; members of the wrong type throw
// ValidationError.
void decode(const Json::Value &j, ControllerVersion &v);
void decode(const Json::Value &j, DelayHistory &v);
void decode(const Json::Value &j, ProxyInfo &v);
void decode(const Json::Value &j, ConnectionMetadata &v);
void decode(const Json::Value &j, ConnectionInfo &v);
void decode(const Json::Value &j, ConnectionsSnapshot &v);
void decode(const Json::Value &j, LogEntry &v);
void decode(const Json::Value &j, TrafficSample &v);
void decode(const Json::Value &j, MemorySample &v);

} // namespace mihomoctl
