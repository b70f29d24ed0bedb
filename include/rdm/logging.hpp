#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace rdm::logging {

struct LogOptions {
    spdlog::level::level_enum level{spdlog::level::warn};
    std::string file;     // empty: no file sink
};

// Installs the "rdm" logger. Safe to call again to reconfigure.
void init(const LogOptions& options);

[[nodiscard]] std::shared_ptr<spdlog::logger> get();

// Accepts spdlog's level names ("warn" and "err" included). Unknown names
// throw std::runtime_error instead of silently meaning "off".
[[nodiscard]] spdlog::level::level_enum parseLevel(const std::string& name);

} // namespace rdm::logging
