#include <mihomoctl/app.hpp>
#include <mihomoctl/cli.hpp>
#include <mihomoctl/config_manager.hpp>
#include <mihomoctl/control_client.hpp>
#include <mihomoctl/downloader.hpp>
#include <mihomoctl/home.hpp>
#include <mihomoctl/logging.hpp>
#include <mihomoctl/monitor.hpp>
#include <mihomoctl/proxy_manager.hpp>
#include <mihomoctl/service_manager.hpp>
#include <mihomoctl/settings.hpp>
#include <mihomoctl/version_manager.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#ifndef MIHOMOCTL_COMMIT
#define MIHOMOCTL_COMMIT "unknown"
#endif
#ifndef MIHOMOCTL_BUILD_TIME
#define MIHOMOCTL_BUILD_TIME "unknown"
#endif
#ifndef MIHOMOCTL_VERSION
#define MIHOMOCTL_VERSION "dev"
#endif

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace mihomoctl {

static std::atomic<bool> g_interrupted{false};

static void on_signal(int) { g_interrupted.store(true); }

static void print_help() {
  std::cout <<
      R"(mihomoctl - manage mihomo versions, profiles and the running instance

Usage:
  mihomoctl [--home DIR] [--verbose] <command>

Versions:
  install [VERSION|stable|beta|nightly]
  update                         install stable and make it default
  default VERSION                (alias: version set-default)
  list                           (alias: version list)
  list-remote [--limit N]
  uninstall VERSION

Profiles (alias: config):
  profile list
  profile use NAME
  profile show [NAME]
  profile delete NAME

Service (alias: service <cmd>):
  start | stop | restart | status [--json]

Controller:
  proxy list | groups | current
  proxy switch GROUP PROXY
  proxy test [PROXY] [--url U] [--timeout MS]
  proxy auto GROUP [--url U] [--timeout MS]
  proxy stats
  logs [--level debug|info|warning|error]
  traffic
  memory [--follow]
  monitor [--interval SEC]
)";
}

int exit_code(ErrorKind k) {
  switch (k) {
  case ErrorKind::Network: return 10;
  case ErrorKind::NotFound: return 11;
  case ErrorKind::Conflict: return 12;
  case ErrorKind::Validation: return 13;
  case ErrorKind::Auth: return 14;
  case ErrorKind::Process: return 15;
  case ErrorKind::IO: return 16;
  }
  return 1;
}

static std::string human_bytes(std::uint64_t n) {
  static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double v = static_cast<double>(n);
  int u = 0;
  while (v >= 1024.0 && u < 4) {
    v /= 1024.0;
    ++u;
  }
  return u == 0 ? fmt::format("{} B", n) : fmt::format("{:.1f} {}", v, units[u]);
}

static std::string format_time(std::int64_t ts) {
  if (ts <= 0) return "-";
  std::time_t t = static_cast<std::time_t>(ts);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

namespace {

// Everything a command needs, built lazily from the resolved home.
struct Context {
  HomeContext home;
  Settings settings;

  VersionManager versions() const {
    return VersionManager(home, Downloader(settings.release));
  }
  ConfigManager configs() const { return ConfigManager(home); }

  // Binds to the default version and the current profile, creating the
  // default profile and its controller section when missing.
  ServiceManager service_for_start() const {
    auto binary = versions().binary_path();
    auto cm = configs();
    cm.ensure_default_config();
    cm.ensure_external_controller();
    return ServiceManager(home, binary, cm.get_current_path(), settings.service);
  }

  // Binds to whatever the pid record names; enough for stop and status.
  ServiceManager service_for_inspect() const {
    auto rec = PidStore::read(home.pid_file());
    fs::path binary = rec ? rec->binary : fs::path{};
    fs::path config = rec ? rec->config : fs::path{};
    return ServiceManager(home, binary, config, settings.service);
  }

  ControlPlaneClient client() const {
    auto ep = configs().controller();
    return ControlPlaneClient(ep.url, ep.secret, settings.controller, settings.stream);
  }
};

} // namespace

static void print_state(const ServiceState &st, bool json) {
  if (json) {
    std::cout << fmt::format(R"({{"state":"{}","pid":{},"binary":"{}","config":"{}"}})",
                             state_name(st.kind), st.pid(),
                             st.record ? st.record->binary.string() : "",
                             st.record ? st.record->config.string() : "")
              << "\n";
    return;
  }
  std::cout << state_name(st.kind);
  if (st.record) {
    std::cout << " pid=" << st.pid() << " binary=" << st.record->binary.string()
              << " config=" << st.record->config.string();
    if (st.is_running()) std::cout << " since=" << format_time(st.record->started_at);
  }
  if (st.replaced_crash) std::cout << " (previous pid=" << st.replaced_crash->pid << " had crashed)";
  std::cout << "\n";
}

// Drains `sub` until interrupted or the stream ends; rethrows its error.
template <class T, class Print>
static int follow(Subscription<T> &sub, Print print) {
  while (!g_interrupted.load()) {
    auto item = sub.recv_for(200ms);
    if (item) {
      print(*item);
      continue;
    }
    if (!sub.is_open()) {
      sub.recv(); // rethrows the error that ended the stream
      break;
    }
  }
  return 0;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty()) std::cerr << "error[usage]: " << pr.error << "\n\n";
    print_help();
    return pr.error.empty() ? 0 : 2;
  }
  if (std::holds_alternative<CmdHelp>(*pr.cmd)) {
    print_help();
    return 0;
  }
  if (std::holds_alternative<CmdVersion>(*pr.cmd)) {
    std::cout << fmt::format("mihomoctl {} ({}, built {})\n", MIHOMOCTL_VERSION, MIHOMOCTL_COMMIT,
                             MIHOMOCTL_BUILD_TIME);
    return 0;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  try {
    Context ctx{HomeContext::resolve(pr.globals.home), {}};
    ctx.home.ensure_layout();
    ctx.settings = Settings::Load(ctx.home.settings_file());
    init_logging(pr.globals.verbose ? "debug" : ctx.settings.log.level,
                 ctx.settings.log.file ? std::optional<fs::path>(ctx.home.logs_dir() / "mihomoctl.log")
                                       : std::nullopt);
    spdlog::debug("[app] home={}", ctx.home.root().string());

    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdInstall>) {
            auto v = ctx.versions().install(c.version);
            std::cout << fmt::format("installed {} at {}\n", v.id, v.dir.string());
            return 0;

          } else if constexpr (std::is_same_v<T, CmdUpdate>) {
            auto vm = ctx.versions();
            auto v = vm.install("stable");
            vm.set_default(v.id);
            std::cout << fmt::format("{} is now the default version\n", v.id);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdSetDefault>) {
            ctx.versions().set_default(c.version);
            std::cout << fmt::format("{} is now the default version\n", c.version);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdList>) {
            auto list = ctx.versions().list();
            if (list.empty()) std::cout << "(no versions installed)\n";
            for (auto &v : list)
              std::cout << fmt::format("{} {:<24} {}\n", v.is_default ? '*' : ' ', v.id,
                                       format_time(v.installed_at));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdListRemote>) {
            for (auto &r : ctx.versions().list_remote(c.limit))
              std::cout << fmt::format("{:<24} {:<10} {}\n", r.version,
                                       r.prerelease ? "prerelease" : "stable", r.published_at);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdUninstall>) {
            ctx.versions().uninstall(c.version);
            std::cout << fmt::format("uninstalled {}\n", c.version);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProfileList>) {
            auto cm = ctx.configs();
            cm.ensure_default_config();
            for (auto &p : cm.list_profiles())
              std::cout << fmt::format("{} {:<24} {}\n", p.active ? '*' : ' ', p.name, p.path.string());
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProfileUse>) {
            ctx.configs().set_current(c.name);
            std::cout << fmt::format("current profile: {}\n", c.name);
            if (ServiceManager::running_record(ctx.home))
              std::cout << "restart the service to apply it\n";
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProfileShow>) {
            auto cm = ctx.configs();
            std::string name = c.name ? *c.name : cm.get_current_path().stem().string();
            std::cout << cm.load(name);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProfileDelete>) {
            ctx.configs().delete_profile(c.name);
            std::cout << fmt::format("deleted profile {}\n", c.name);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdStart>) {
            print_state(ctx.service_for_start().start(), false);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdStop>) {
            print_state(ctx.service_for_inspect().stop(), false);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdRestart>) {
            print_state(ctx.service_for_start().restart(), false);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdStatus>) {
            print_state(ctx.service_for_inspect().status(), c.json);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProxyList>) {
            for (auto &p : ctx.client().proxies()) {
              if (p.is_group()) continue;
              auto delay = p.last_delay();
              std::cout << fmt::format("{:<32} {:<14} {}\n", p.name, p.type,
                                       delay > 0 ? fmt::format("{} ms", delay) : "-");
            }
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProxyGroups>) {
            for (auto &g : ctx.client().proxy_groups())
              std::cout << fmt::format("{:<24} {:<12} now={} ({} members)\n", g.name, g.type, g.now,
                                       g.all.size());
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProxyCurrent>) {
            for (auto &g : ctx.client().proxy_groups())
              std::cout << fmt::format("{:<24} -> {}\n", g.name, g.now);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProxySwitch>) {
            ctx.client().switch_proxy(c.group, c.proxy);
            std::cout << fmt::format("{} -> {}\n", c.group, c.proxy);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProxyTest>) {
            auto client = ctx.client();
            if (c.proxy) {
              std::cout << fmt::format("{:<32} {} ms\n", *c.proxy,
                                       client.test_delay(*c.proxy, c.url, c.timeout_ms));
              return 0;
            }
            ProxyManager pm(client);
            std::vector<std::string> names;
            for (auto &p : pm.proxies())
              if (!p.is_group()) names.push_back(p.name);
            std::size_t reachable = 0;
            for (auto &r : pm.test_delays(names, c.url, c.timeout_ms)) {
              if (r.delay) {
                ++reachable;
                std::cout << fmt::format("{:<32} {} ms\n", r.proxy, *r.delay);
              } else {
                std::cout << fmt::format("{:<32} unavailable ({})\n", r.proxy, r.error);
              }
            }
            std::cout << fmt::format("{}/{} reachable\n", reachable, names.size());
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProxyAuto>) {
            ProxyManager pm(ctx.client());
            auto best = pm.select_fastest(c.group, c.url, c.timeout_ms);
            std::cout << fmt::format("{} -> {} ({} ms)\n", c.group, best.first, best.second);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdProxyStats>) {
            ProxyManager pm(ctx.client());
            auto st = pm.stats();
            std::cout << fmt::format("proxies: {}\ngroups: {}\ntested: {}\n", st.total_proxies,
                                     st.total_groups, st.proxies_with_delay);
            for (auto &kv : st.type_counts) std::cout << fmt::format("  {:<16} {}\n", kv.first, kv.second);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdLogs>) {
            auto client = ctx.client();
            auto sub = client.subscribe_logs(parse_log_level(c.level));
            return follow(sub, [](const LogEntry &e) {
              std::cout << fmt::format("[{}] {}\n", log_level_name(e.level), e.payload) << std::flush;
            });

          } else if constexpr (std::is_same_v<T, CmdTraffic>) {
            auto client = ctx.client();
            auto sub = client.subscribe_traffic();
            return follow(sub, [](const TrafficSample &s) {
              std::cout << fmt::format("up {}/s  down {}/s\n", human_bytes(s.up), human_bytes(s.down))
                        << std::flush;
            });

          } else if constexpr (std::is_same_v<T, CmdMemory>) {
            auto client = ctx.client();
            auto print = [](const MemorySample &m) {
              std::cout << fmt::format("inuse {}  oslimit {}\n", human_bytes(m.inuse),
                                       m.oslimit ? human_bytes(m.oslimit) : "-")
                        << std::flush;
            };
            if (!c.follow) {
              print(client.memory());
              return 0;
            }
            auto sub = client.subscribe_memory();
            return follow(sub, print);

          } else if constexpr (std::is_same_v<T, CmdMonitor>) {
            auto ms = ctx.settings.monitor;
            if (c.interval_sec) ms.interval_sec = *c.interval_sec;

            auto rec = PidStore::read(ctx.home.pid_file());
            auto svc = rec && rec->pid > 0 ? ctx.service_for_inspect() : ctx.service_for_start();
            std::shared_ptr<const ControlPlaneClient> client;
            try {
              client = std::make_shared<ControlPlaneClient>(ctx.client());
            } catch (const NotFoundError &e) {
              spdlog::warn("[monitor] no controller, health probes disabled: {}", e.what());
            }

            Monitor mon(svc, ms, client, [](const MonitorEvent &ev) {
              std::cout << fmt::format("{} {:<14} {} attempts={}{}\n", format_time(std::time(nullptr)),
                                       event_name(ev.kind), state_name(ev.state.kind), ev.attempts,
                                       ev.message.empty() ? "" : " " + ev.message)
                        << std::flush;
            });
            std::thread watcher([&] {
              while (!g_interrupted.load()) std::this_thread::sleep_for(200ms);
              mon.request_stop();
            });
            try {
              mon.run();
            } catch (...) {
              g_interrupted.store(true);
              watcher.join();
              throw;
            }
            g_interrupted.store(true);
            watcher.join();
            return 0;

          } else {
            print_help();
            return 0;
          }
        },
        *pr.cmd);
  } catch (const Error &e) {
    spdlog::debug("[app] {} error: {}", kind_name(e.kind()), e.what());
    std::cerr << "error[" << kind_name(e.kind()) << "]: " << e.what() << "\n";
    return exit_code(e.kind());
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

} // namespace mihomoctl
