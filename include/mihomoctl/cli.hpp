#pragma once
#include <optional>
#include <string>
#include <variant>

namespace mihomoctl {

struct GlobalOptions {
  std::optional<std::string> home;
  bool verbose = false;
};

// versions
struct CmdInstall {
  std::string version = "stable";
};
struct CmdUpdate {};
struct CmdSetDefault {
  std::string version;
};
struct CmdList {};
struct CmdListRemote {
  int limit = 20;
};
struct CmdUninstall {
  std::string version;
};

// profiles
struct CmdProfileList {};
struct CmdProfileUse {
  std::string name;
};
struct CmdProfileShow {
  std::optional<std::string> name; // current when unset
};
struct CmdProfileDelete {
  std::string name;
};

// service
struct CmdStart {};
struct CmdStop {};
struct CmdRestart {};
struct CmdStatus {
  bool json = false;
};

// controller
struct CmdProxyList {};
struct CmdProxyGroups {};
struct CmdProxySwitch {
  std::string group;
  std::string proxy;
};
struct CmdProxyTest {
  std::optional<std::string> proxy; // every non-group proxy when unset
  std::string url = "https://www.gstatic.com/generate_204";
  int timeout_ms = 5000;
};
struct CmdProxyAuto {
  std::string group;
  std::string url = "https://www.gstatic.com/generate_204";
  int timeout_ms = 5000;
};
struct CmdProxyStats {};
struct CmdProxyCurrent {};
struct CmdLogs {
  std::string level = "info";
};
struct CmdTraffic {};
struct CmdMemory {
  bool follow = false;
};
struct CmdMonitor {
  std::optional<int> interval_sec;
};

struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdInstall, CmdUpdate, CmdSetDefault, CmdList, CmdListRemote, CmdUninstall,
                 CmdProfileList, CmdProfileUse, CmdProfileShow, CmdProfileDelete,
                 CmdStart, CmdStop, CmdRestart, CmdStatus,
                 CmdProxyList, CmdProxyGroups, CmdProxySwitch, CmdProxyTest, CmdProxyAuto,
                 CmdProxyStats, CmdProxyCurrent,
                 CmdLogs, CmdTraffic, CmdMemory, CmdMonitor,
                 CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
  GlobalOptions globals;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace mihomoctl
