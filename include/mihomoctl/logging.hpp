#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace mihomoctl {

// Installs the process-wide spdlog logger: colored stderr, plus a rotating
// file sink when `log_file` is set.
void init_logging(const std::string &level,
                  const std::optional<std::filesystem::path> &log_file = std::nullopt);

} // namespace mihomoctl
