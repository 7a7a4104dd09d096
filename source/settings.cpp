#include <mihomoctl/error.hpp>
#include <mihomoctl/settings.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace mihomoctl {

static std::string trim(std::string s){
  while(!s.empty() && (s.back()==' '||s.back()=='\t'||s.back()=='\r'||s.back()=='\n')) s.pop_back();
  size_t i=0; while(i<s.size() && (s[i]==' '||s[i]=='\t')) ++i; return s.substr(i);
}

static std::string unquote(std::string v){
  if (v.size()>=2 && ((v.front()=='"' && v.back()=='"') || (v.front()=='\'' && v.back()=='\'')))
    return v.substr(1, v.size()-2);
  return v;
}

// strip a trailing "# comment" that is not inside quotes
static std::string strip_comment(const std::string& v){
  bool in_s=false, in_d=false;
  for (size_t i=0;i<v.size();++i){
    char c=v[i];
    if (c=='"' && !in_s) in_d=!in_d;
    else if (c=='\'' && !in_d) in_s=!in_s;
    else if (c=='#' && !in_s && !in_d) return trim(v.substr(0,i));
  }
  return v;
}

static int parse_int(const std::string& key, const std::string& val, int min_value){
  char* end=nullptr;
  long v = std::strtol(val.c_str(), &end, 10);
  if (val.empty() || *end!='\0' || v < min_value || v > 1000000000L)
    throw ValidationError("config.toml: invalid value for '" + key + "': " + val);
  return static_cast<int>(v);
}

static bool parse_bool(const std::string& key, std::string val){
  for (auto& ch: val) ch = (char)std::tolower((unsigned char)ch);
  if (val=="true" || val=="yes" || val=="1") return true;
  if (val=="false" || val=="no" || val=="0") return false;
  throw ValidationError("config.toml: invalid boolean for '" + key + "': " + val);
}

static RestartMode parse_restart(const std::string& key, std::string v){
  for (auto& ch: v) ch = (char)std::tolower((unsigned char)ch);
  if (v=="backoff" || v=="restart-with-backoff" || v=="on-failure") return RestartMode::Backoff;
  if (v=="never" || v=="no" || v=="false") return RestartMode::Never;
  throw ValidationError("config.toml: invalid restart policy for '" + key + "': " + v);
}

Settings Settings::Load(const fs::path& p) {
  Settings s;
  std::ifstream in(p);
  if (!in) {
    spdlog::debug("[settings] {} not found; using defaults", p.string());
    return s;
  }

  std::string section;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0]=='#') continue;
    if (line.front()=='[' && line.back()==']') {
      section = trim(line.substr(1, line.size()-2));
      continue;
    }
    auto eq = line.find('=');
    if (eq==std::string::npos) continue;
    auto key = trim(line.substr(0,eq));
    auto val = unquote(strip_comment(trim(line.substr(eq+1))));
    auto full = section.empty() ? key : section + "." + key;

    if (full=="release.api_url") s.release.api_url = val;
    else if (full=="release.download_url") s.release.download_url = val;
    else if (full=="release.timeout_sec") s.release.timeout_sec = parse_int(full, val, 1);

    else if (full=="service.stop_timeout_sec") s.service.stop_timeout_sec = parse_int(full, val, 0);
    else if (full=="service.probe_ms") s.service.probe_ms = parse_int(full, val, 0);
    else if (full=="service.log_max_mb") s.service.log_max_mb = parse_int(full, val, 0);

    else if (full=="controller.timeout_ms") s.controller.timeout_ms = parse_int(full, val, 1);

    else if (full=="stream.reconnect_attempts") s.stream.reconnect_attempts = parse_int(full, val, 0);
    else if (full=="stream.reconnect_base_ms") s.stream.reconnect_base_ms = parse_int(full, val, 0);
    else if (full=="stream.reconnect_max_ms") s.stream.reconnect_max_ms = parse_int(full, val, 0);
    else if (full=="stream.poll_ms") s.stream.poll_ms = parse_int(full, val, 10);
    else if (full=="stream.log_buffer") s.stream.log_buffer = parse_int(full, val, 1);

    else if (full=="monitor.interval_sec") s.monitor.interval_sec = parse_int(full, val, 1);
    else if (full=="monitor.restart") s.monitor.restart = parse_restart(full, val);
    else if (full=="monitor.max_attempts") s.monitor.max_attempts = parse_int(full, val, 0);
    else if (full=="monitor.base_delay_ms") s.monitor.base_delay_ms = parse_int(full, val, 0);
    else if (full=="monitor.max_delay_ms") s.monitor.max_delay_ms = parse_int(full, val, 0);
    else if (full=="monitor.healthy_reset_sec") s.monitor.healthy_reset_sec = parse_int(full, val, 0);

    else if (full=="log.level") s.log.level = val;
    else if (full=="log.file") s.log.file = parse_bool(full, val);

    else spdlog::warn("[settings] unknown key '{}' in {}", full, p.string());
  }

  if (const char* env = std::getenv("MIHOMOCTL_LOG_MAX_MB")) {
    long v = std::strtol(env, nullptr, 10);
    if (v >= 0) s.service.log_max_mb = static_cast<int>(v);
  }
  if (const char* env = std::getenv("MIHOMOCTL_LOG"); env && *env) {
    s.log.level = env;
  }
  return s;
}

} // namespace mihomoctl
