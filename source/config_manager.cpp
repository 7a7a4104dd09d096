#include <mihomoctl/config_manager.hpp>
#include <mihomoctl/error.hpp>
#include <mihomoctl/io.hpp>
#include <mihomoctl/service_manager.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace fs = std::filesystem;

namespace mihomoctl {

static const char *kDefaultProfile =
    "# Generated by mihomoctl\n"
    "mixed-port: 7890\n"
    "allow-lan: false\n"
    "mode: rule\n"
    "log-level: info\n"
    "proxies: []\n"
    "proxy-groups: []\n"
    "rules:\n"
    "  - MATCH,DIRECT\n";

static const char *kPortKeys[] = {"mixed-port", "port", "socks-port", "redir-port", "tproxy-port"};

ConfigManager::ConfigManager(HomeContext home, RunningProbe probe)
    : home_(home), store_(home), probe_(std::move(probe)) {
  if (!probe_) {
    probe_ = [h = home_]() { return ServiceManager::running_record(h); };
  }
}

static bool valid_port(const std::string &s) {
  if (s.empty() || s.size() > 5 || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
    return false;
  int p = std::stoi(s);
  return p >= 1 && p <= 65535;
}

static std::string lower(std::string s) {
  for (auto &c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

static YAML::Node parse_yaml(const std::string &content, const std::string &what) {
  try {
    return YAML::Load(content);
  } catch (const YAML::Exception &e) {
    throw ValidationError(what + ": invalid YAML: " + e.what());
  }
}

void ConfigManager::validate_content(const std::string &content, const std::string &what) {
  const YAML::Node root = parse_yaml(content, what);
  if (!root.IsMap()) throw ValidationError(what + ": top level must be a mapping");

  bool has_port = false;
  for (const char *key : kPortKeys) {
    const YAML::Node n = root[key];
    if (!n) continue;
    if (!n.IsScalar() || !valid_port(n.Scalar()))
      throw ValidationError(what + ": '" + key + "' must be a port number (1-65535)");
    has_port = true;
  }
  if (!has_port)
    throw ValidationError(what + ": missing inbound port ('mixed-port', 'port', 'socks-port', "
                                 "'redir-port' or 'tproxy-port')");

  if (const YAML::Node mode = root["mode"]) {
    auto v = mode.IsScalar() ? lower(mode.Scalar()) : "";
    if (v != "rule" && v != "global" && v != "direct")
      throw ValidationError(what + ": 'mode' must be one of rule, global, direct");
  }
  if (const YAML::Node lvl = root["log-level"]) {
    auto v = lvl.IsScalar() ? lower(lvl.Scalar()) : "";
    if (v != "debug" && v != "info" && v != "warning" && v != "error" && v != "silent")
      throw ValidationError(what + ": 'log-level' must be one of debug, info, warning, error, silent");
  }
  if (const YAML::Node ctrl = root["external-controller"]) {
    if (!ctrl.IsNull()) {
      auto v = ctrl.IsScalar() ? ctrl.Scalar() : "";
      auto colon = v.rfind(':');
      if (colon == std::string::npos || !valid_port(v.substr(colon + 1)))
        throw ValidationError(what + ": 'external-controller' must be host:port");
    }
  }
  if (const YAML::Node secret = root["secret"]) {
    if (!secret.IsNull() && !secret.IsScalar())
      throw ValidationError(what + ": 'secret' must be a string");
  }
  for (const char *key : {"proxies", "proxy-groups", "rules"}) {
    const YAML::Node n = root[key];
    if (n && !n.IsSequence()) throw ValidationError(what + ": '" + key + "' must be a list");
  }
}

void ConfigManager::validate(const fs::path &path) const {
  auto content = io::read_file(path);
  if (!content) throw NotFoundError("config not found: " + path.string());
  validate_content(*content, path.filename().string());
}

std::optional<Profile> ConfigManager::ensure_default_config() {
  if (store_.list().empty()) {
    store_.write("default", kDefaultProfile);
    store_.set_current("default");
    spdlog::info("[profile=default] created {}", store_.path_for("default").string());
  } else if (!store_.current() && store_.find("default")) {
    store_.set_current("default");
    spdlog::info("[profile=default] set as current");
  }
  if (auto cur = store_.current()) return store_.find(*cur);
  return std::nullopt;
}

fs::path ConfigManager::get_current_path() const {
  auto cur = store_.current();
  if (!cur) throw NotFoundError("no current profile; run `mihomoctl profile use <name>`");
  return store_.path_for(*cur);
}

void ConfigManager::set_current(const std::string &name) {
  auto p = store_.find(name);
  if (!p) throw NotFoundError("profile " + name + " does not exist");
  validate(p->path);
  store_.set_current(name);
  spdlog::info("[profile={}] set as current", name);
}

std::string controller_url(const std::string &address) {
  auto colon = address.rfind(':');
  std::string host = colon == std::string::npos ? address : address.substr(0, colon);
  std::string port = colon == std::string::npos ? "9090" : address.substr(colon + 1);
  if (!host.empty() && host.front() == '[' && host.back() == ']') host = host.substr(1, host.size() - 2);
  if (host.empty() || host == "0.0.0.0" || host == "::") host = "127.0.0.1";
  if (host.find(':') != std::string::npos) host = "[" + host + "]";
  return "http://" + host + ":" + port;
}

static std::string scalar_or_empty(const YAML::Node &n) {
  return n && n.IsScalar() ? n.Scalar() : std::string{};
}

ControllerEndpoint ConfigManager::controller() const {
  const auto path = get_current_path();
  auto content = io::read_file(path);
  if (!content) throw NotFoundError("config not found: " + path.string());
  const YAML::Node root = parse_yaml(*content, path.filename().string());
  auto addr = root.IsMap() ? scalar_or_empty(root["external-controller"]) : "";
  if (addr.empty()) throw NotFoundError(path.filename().string() + " has no external-controller");
  return ControllerEndpoint{controller_url(addr), root.IsMap() ? scalar_or_empty(root["secret"]) : ""};
}

static unsigned short find_free_port(unsigned short from) {
  namespace asio = boost::asio;
  asio::io_context io;
  for (unsigned p = from; p < from + 200u && p <= 65535u; ++p) {
    asio::ip::tcp::acceptor acc(io);
    boost::system::error_code ec;
    asio::ip::tcp::endpoint ep(asio::ip::make_address("127.0.0.1"), static_cast<unsigned short>(p));
    acc.open(ep.protocol(), ec);
    if (!ec) acc.bind(ep, ec);
    if (!ec) return static_cast<unsigned short>(p);
  }
  throw IOError("no free controller port from " + std::to_string(from));
}

static std::string random_secret() {
  unsigned char raw[16];
  if (RAND_bytes(raw, sizeof(raw)) != 1) throw IOError("RAND_bytes failed");
  static const char *hex = "0123456789abcdef";
  std::string out;
  for (unsigned char c : raw) {
    out.push_back(hex[c >> 4]);
    out.push_back(hex[c & 0xF]);
  }
  return out;
}

// Replaces a top-level "key:" line, or appends one.
static void set_top_level(std::string &content, const std::string &key, const std::string &value) {
  std::istringstream in(content);
  std::ostringstream out;
  std::string line;
  bool replaced = false;
  while (std::getline(in, line)) {
    if (!replaced && line.rfind(key + ":", 0) == 0) {
      out << key << ": " << value << "\n";
      replaced = true;
    } else {
      out << line << "\n";
    }
  }
  if (!replaced) out << key << ": " << value << "\n";
  content = out.str();
}

ControllerEndpoint ConfigManager::ensure_external_controller() {
  const auto path = get_current_path();
  auto content = io::read_file(path);
  if (!content) throw NotFoundError("config not found: " + path.string());
  const auto what = path.filename().string();
  const YAML::Node root = parse_yaml(*content, what);
  if (!root.IsMap()) throw ValidationError(what + ": top level must be a mapping");

  std::string addr = scalar_or_empty(root["external-controller"]);
  std::string secret = scalar_or_empty(root["secret"]);
  std::string updated = *content;
  bool changed = false;

  if (addr.empty()) {
    addr = "127.0.0.1:" + std::to_string(find_free_port(9090));
    set_top_level(updated, "external-controller", addr);
    changed = true;
  }
  if (secret.empty()) {
    secret = random_secret();
    set_top_level(updated, "secret", "\"" + secret + "\"");
    changed = true;
  }
  if (changed) {
    validate_content(updated, what);
    io::atomic_write(path, updated);
    spdlog::info("[profile={}] external controller {} configured", path.stem().string(), addr);
  }
  return ControllerEndpoint{controller_url(addr), secret};
}

std::vector<Profile> ConfigManager::list_profiles() const { return store_.list(); }

std::string ConfigManager::load(const std::string &name) const {
  auto p = store_.find(name);
  if (!p) throw NotFoundError("profile " + name + " does not exist");
  auto content = io::read_file(p->path);
  if (!content) throw IOError("read " + p->path.string() + " failed");
  return *content;
}

void ConfigManager::save(const std::string &name, const std::string &content) {
  validate_content(content, name + ".yaml");
  store_.write(name, content);
}

void ConfigManager::delete_profile(const std::string &name) {
  auto p = store_.find(name);
  if (!p) throw NotFoundError("profile " + name + " does not exist");
  if (auto rec = probe_()) {
    std::error_code e1;
    if (fs::equivalent(rec->config, p->path, e1) && !e1)
      throw ConflictError("profile " + name + " is used by the running service (pid " +
                          std::to_string(rec->pid) + "); stop it first");
  }
  store_.remove(name);
}

} // namespace mihomoctl
