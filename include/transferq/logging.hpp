#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace transferq {

// Installs the default spdlog logger: coloured stderr, plus a plain file sink
// when `log_file` is given. `level` takes spdlog names ("debug", "info", ...).
void initLogging(const std::string& level, const std::optional<std::filesystem::path>& log_file = std::nullopt);

} // namespace transferq
