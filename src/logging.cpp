#include "rdm/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <stdexcept>
#include <vector>

namespace rdm::logging {

namespace {

constexpr const char* kLoggerName = "rdm";

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

void init(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console);

    if (!options.file.empty()) {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(options.level);
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(registryMutex());
    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(registryMutex());
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    auto logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_level(spdlog::level::warn);
    return logger;
}

spdlog::level::level_enum parseLevel(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw std::runtime_error("Invalid log level: " + name);
    }
    return level;
}

} // namespace rdm::logging
