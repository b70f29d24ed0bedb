#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace rdm {

struct EngineOptions {
    std::string output_dir{"."};
    std::size_t max_chunk_size{1024};
    long connect_timeout_seconds{0};      // 0 = libcurl default
    bool follow_redirects{true};
    std::string user_agent;                // empty = "rdm/<version> libcurl/<version>"
};

struct ManagerOptions {
    EngineOptions engine;
    std::chrono::milliseconds poll_interval{100};
};

} // namespace rdm
