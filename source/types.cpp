#include <mihomoctl/error.hpp>
#include <mihomoctl/types.hpp>

#include <cctype>
#include <cstring>
#include <memory>

namespace mihomoctl {

LogLevel parse_log_level(const std::string &s) {
  std::string v = s;
  for (auto &c : v) c = (char)std::tolower((unsigned char)c);
  if (v == "debug") return LogLevel::Debug;
  if (v == "info") return LogLevel::Info;
  if (v == "warning" || v == "warn") return LogLevel::Warning;
  if (v == "error") return LogLevel::Error;
  if (v == "silent") return LogLevel::Silent;
  throw ValidationError("unknown log level '" + s + "'");
}

const char *log_level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error: return "error";
    case LogLevel::Silent: return "silent";
  }
  return "info";
}

std::optional<Json::Value> parse_json(const std::string &text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) return std::nullopt;
  return root;
}

std::string write_json(const Json::Value &v) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, v);
}

static const Json::Value &member(const Json::Value &j, const char *key) {
  static const Json::Value null_value;
  if (!j.isObject()) throw ValidationError("expected a JSON object around '" + std::string(key) + "'");
  const Json::Value *v = j.find(key, key + std::strlen(key));
  return v ? *v : null_value;
}

static ValidationError bad_type(const char *key, const char *type) {
  return ValidationError("field '" + std::string(key) + "' is not " + type);
}

static std::string str_or(const Json::Value &j, const char *key, const std::string &def = {}) {
  const auto &v = member(j, key);
  if (v.isNull()) return def;
  if (!v.isString()) throw bad_type(key, "a string");
  return v.asString();
}

static std::uint64_t u64_or(const Json::Value &j, const char *key) {
  const auto &v = member(j, key);
  if (v.isNull()) return 0;
  if (v.isUInt64()) return v.asUInt64();
  if (v.isDouble() && v.asDouble() >= 0) return static_cast<std::uint64_t>(v.asDouble());
  throw bad_type(key, "a non-negative number");
}

static int int_or(const Json::Value &j, const char *key) {
  const auto &v = member(j, key);
  if (v.isNull()) return 0;
  if (!v.isInt()) throw bad_type(key, "an integer");
  return v.asInt();
}

static bool bool_or(const Json::Value &j, const char *key) {
  const auto &v = member(j, key);
  if (v.isNull()) return false;
  if (!v.isBool()) throw bad_type(key, "a boolean");
  return v.asBool();
}

static std::vector<std::string> strings_or(const Json::Value &j, const char *key) {
  std::vector<std::string> out;
  const auto &v = member(j, key);
  if (v.isNull()) return out;
  if (!v.isArray()) throw bad_type(key, "a list");
  for (const auto &e : v) {
    if (!e.isString()) throw bad_type(key, "a list of strings");
    out.push_back(e.asString());
  }
  return out;
}

template <class T> static std::vector<T> objects_or(const Json::Value &j, const char *key) {
  std::vector<T> out;
  const auto &v = member(j, key);
  if (v.isNull()) return out;
  if (!v.isArray()) throw bad_type(key, "a list");
  for (const auto &e : v) {
    T item;
    decode(e, item);
    out.push_back(std::move(item));
  }
  return out;
}

void decode(const Json::Value &j, ControllerVersion &v) {
  v.version = str_or(j, "version");
  v.premium = bool_or(j, "premium");
  v.meta = bool_or(j, "meta");
}

void decode(const Json::Value &j, DelayHistory &v) {
  v.time = str_or(j, "time");
  v.delay = int_or(j, "delay");
}

void decode(const Json::Value &j, ProxyInfo &v) {
  v.name = str_or(j, "name");
  v.type = str_or(j, "type");
  if (const auto &now = member(j, "now"); now.isString()) v.now = now.asString();
  v.all = strings_or(j, "all");
  v.history = objects_or<DelayHistory>(j, "history");
  v.udp = bool_or(j, "udp");
}

void decode(const Json::Value &j, ConnectionMetadata &v) {
  v.network = str_or(j, "network");
  v.type = str_or(j, "type");
  v.source_ip = str_or(j, "sourceIP");
  v.source_port = str_or(j, "sourcePort");
  v.destination_ip = str_or(j, "destinationIP");
  v.destination_port = str_or(j, "destinationPort");
  v.host = str_or(j, "host");
}

void decode(const Json::Value &j, ConnectionInfo &v) {
  v.id = str_or(j, "id");
  if (const auto &m = member(j, "metadata"); !m.isNull()) decode(m, v.metadata);
  v.upload = u64_or(j, "upload");
  v.download = u64_or(j, "download");
  v.start = str_or(j, "start");
  v.chains = strings_or(j, "chains");
  v.rule = str_or(j, "rule");
  v.rule_payload = str_or(j, "rulePayload");
}

void decode(const Json::Value &j, ConnectionsSnapshot &v) {
  v.download_total = u64_or(j, "downloadTotal");
  v.upload_total = u64_or(j, "uploadTotal");
  v.connections = objects_or<ConnectionInfo>(j, "connections");
}

void decode(const Json::Value &j, LogEntry &v) {
  v.level = parse_log_level(str_or(j, "type", "info"));
  v.payload = str_or(j, "payload");
}

void decode(const Json::Value &j, TrafficSample &v) {
  v.up = u64_or(j, "up");
  v.down = u64_or(j, "down");
}

void decode(const Json::Value &j, MemorySample &v) {
  v.inuse = u64_or(j, "inuse");
  v.oslimit = u64_or(j, "oslimit");
}

} // namespace mihomoctl
