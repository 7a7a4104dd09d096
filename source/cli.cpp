#include <mihomoctl/cli.hpp>

#include <charconv>
#include <string_view>
#include <vector>

namespace mihomoctl {

using Args = std::vector<std::string_view>;

static bool has_arg(size_t i, const Args &a) { return i + 1 < a.size(); }

static bool to_int(std::string_view s, int &out) {
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && p == s.data() + s.size() && out > 0;
}

static ParseResult fail(ParseResult r, const std::string &msg) {
  r.cmd.reset();
  r.error = msg;
  return r;
}

static ParseResult parse_version_cmd(ParseResult r, const std::string &verb, const Args &a, size_t i,
                                     const std::string &prefix) {
  auto name = prefix + verb;
  if (verb == "install") {
    CmdInstall c;
    if (i < a.size()) c.version = std::string(a[i++]);
    if (i < a.size()) return fail(r, name + ": unexpected argument " + std::string(a[i]));
    r.cmd = c;
  } else if (verb == "update") {
    r.cmd = CmdUpdate{};
  } else if (verb == "default" || verb == "set-default") {
    if (i >= a.size()) return fail(r, name + ": VERSION required");
    r.cmd = CmdSetDefault{std::string(a[i])};
  } else if (verb == "list") {
    r.cmd = CmdList{};
  } else if (verb == "list-remote") {
    CmdListRemote c;
    for (; i < a.size(); ++i) {
      if (a[i] == "--limit" && has_arg(i, a)) {
        if (!to_int(a[++i], c.limit)) return fail(r, name + ": --limit must be a positive number");
      } else {
        return fail(r, name + ": unknown option " + std::string(a[i]));
      }
    }
    r.cmd = c;
  } else if (verb == "uninstall") {
    if (i >= a.size()) return fail(r, name + ": VERSION required");
    r.cmd = CmdUninstall{std::string(a[i])};
  } else {
    return fail(r, "unknown command: " + name);
  }
  return r;
}

static ParseResult parse_profile_cmd(ParseResult r, const Args &a, size_t i, const std::string &group) {
  if (i >= a.size()) return fail(r, group + ": subcommand required (list|use|show|delete)");
  auto verb = a[i++];
  if (verb == "list") {
    r.cmd = CmdProfileList{};
  } else if (verb == "use") {
    if (i >= a.size()) return fail(r, group + " use: NAME required");
    r.cmd = CmdProfileUse{std::string(a[i])};
  } else if (verb == "show") {
    CmdProfileShow c;
    if (i < a.size()) c.name = std::string(a[i]);
    r.cmd = c;
  } else if (verb == "delete") {
    if (i >= a.size()) return fail(r, group + " delete: NAME required");
    r.cmd = CmdProfileDelete{std::string(a[i])};
  } else {
    return fail(r, "unknown command: " + group + " " + std::string(verb));
  }
  return r;
}

static ParseResult parse_service_cmd(ParseResult r, std::string_view verb, const Args &a, size_t i) {
  if (verb == "start") {
    r.cmd = CmdStart{};
  } else if (verb == "stop") {
    r.cmd = CmdStop{};
  } else if (verb == "restart") {
    r.cmd = CmdRestart{};
  } else if (verb == "status") {
    CmdStatus c;
    for (; i < a.size(); ++i) {
      if (a[i] == "--json") c.json = true;
    }
    r.cmd = c;
  } else {
    return fail(r, "unknown command: service " + std::string(verb));
  }
  return r;
}

static ParseResult parse_proxy_cmd(ParseResult r, const Args &a, size_t i) {
  if (i >= a.size()) return fail(r, "proxy: subcommand required (list|groups|switch|test|auto|stats|current)");
  auto verb = a[i++];
  if (verb == "list") {
    r.cmd = CmdProxyList{};
  } else if (verb == "groups") {
    r.cmd = CmdProxyGroups{};
  } else if (verb == "current") {
    r.cmd = CmdProxyCurrent{};
  } else if (verb == "switch") {
    if (i + 1 >= a.size()) return fail(r, "proxy switch: GROUP and PROXY required");
    r.cmd = CmdProxySwitch{std::string(a[i]), std::string(a[i + 1])};
  } else if (verb == "stats") {
    r.cmd = CmdProxyStats{};
  } else if (verb == "test" || verb == "auto") {
    const auto name = "proxy " + std::string(verb);
    std::optional<std::string> target;
    std::string url = CmdProxyTest{}.url;
    int timeout_ms = CmdProxyTest{}.timeout_ms;
    for (; i < a.size(); ++i) {
      if (a[i] == "--url" && has_arg(i, a)) {
        url = std::string(a[++i]);
      } else if (a[i] == "--timeout" && has_arg(i, a)) {
        if (!to_int(a[++i], timeout_ms)) return fail(r, name + ": --timeout must be a positive number");
      } else if (!a[i].empty() && a[i][0] != '-' && !target) {
        target = std::string(a[i]);
      } else {
        return fail(r, name + ": unexpected argument " + std::string(a[i]));
      }
    }
    if (verb == "test") {
      r.cmd = CmdProxyTest{target, url, timeout_ms};
    } else {
      if (!target) return fail(r, "proxy auto: GROUP required");
      r.cmd = CmdProxyAuto{*target, url, timeout_ms};
    }
  } else {
    return fail(r, "unknown command: proxy " + std::string(verb));
  }
  return r;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  Args a;
  for (int k = 1; k < argc; ++k) a.emplace_back(argv[k]);

  size_t i = 0;
  for (; i < a.size(); ++i) {
    if (a[i] == "--home") {
      if (!has_arg(i, a)) return fail(r, "--home: DIR required");
      r.globals.home = std::string(a[++i]);
    } else if (a[i] == "--verbose" || a[i] == "-v") {
      r.globals.verbose = true;
    } else {
      break;
    }
  }
  if (i >= a.size()) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd(a[i++]);
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "install" || cmd == "update" || cmd == "default" || cmd == "list" ||
      cmd == "list-remote" || cmd == "uninstall")
    return parse_version_cmd(r, cmd, a, i, "");
  if (cmd == "version") {
    if (i >= a.size()) {
      r.cmd = CmdVersion{};
      return r;
    }
    std::string verb(a[i++]);
    return parse_version_cmd(r, verb, a, i, "version ");
  }

  if (cmd == "profile" || cmd == "config") return parse_profile_cmd(r, a, i, cmd);

  if (cmd == "start" || cmd == "stop" || cmd == "restart" || cmd == "status")
    return parse_service_cmd(r, cmd, a, i);
  if (cmd == "service") {
    if (i >= a.size()) return fail(r, "service: subcommand required (start|stop|restart|status)");
    auto verb = a[i++];
    return parse_service_cmd(r, verb, a, i);
  }

  if (cmd == "proxy") return parse_proxy_cmd(r, a, i);

  if (cmd == "logs") {
    CmdLogs c;
    for (; i < a.size(); ++i) {
      if (a[i] == "--level" && has_arg(i, a))
        c.level = std::string(a[++i]);
      else
        return fail(r, "logs: unexpected argument " + std::string(a[i]));
    }
    r.cmd = c;
    return r;
  }
  if (cmd == "traffic") {
    r.cmd = CmdTraffic{};
    return r;
  }
  if (cmd == "memory") {
    CmdMemory c;
    for (; i < a.size(); ++i) {
      if (a[i] == "--follow" || a[i] == "-f") c.follow = true;
    }
    r.cmd = c;
    return r;
  }
  if (cmd == "monitor") {
    CmdMonitor c;
    for (; i < a.size(); ++i) {
      int v = 0;
      if (a[i] == "--interval" && has_arg(i, a)) {
        if (!to_int(a[++i], v)) return fail(r, "monitor: --interval must be a positive number");
        c.interval_sec = v;
      } else {
        return fail(r, "monitor: unexpected argument " + std::string(a[i]));
      }
    }
    r.cmd = c;
    return r;
  }

  return fail(r, "unknown command: " + cmd);
}

} // namespace mihomoctl
