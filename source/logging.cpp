#include <mihomoctl/io.hpp>
#include <mihomoctl/logging.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace mihomoctl {

void init_logging(const std::string &level,
                  const std::optional<std::filesystem::path> &log_file) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (log_file) {
    try {
      io::ensure_dir(log_file->parent_path());
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file->string(), 5 * 1024 * 1024, 3));
    } catch (const std::exception &e) {
      spdlog::warn("failed to initialize rotating log sink ({}), stderr only", e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("mihomoctl", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off") {
    spdlog::warn("unknown log level '{}', using info", level);
    lvl = spdlog::level::info;
  }
  spdlog::set_level(lvl);
}

} // namespace mihomoctl
