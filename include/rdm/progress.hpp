#pragma once

#include "download_status.hpp"

#include <cstdint>
#include <string>

namespace rdm {

inline constexpr std::int64_t kUnknownSize = -1;
inline constexpr int kUnknownProgress = -1;

struct Progress {
    std::string url;
    std::string filename;
    std::int64_t total_bytes{kUnknownSize};
    std::int64_t downloaded_bytes{0};
    Status status{Status::Downloading};
    std::string error_message;
};

// Whole percent of total, clamped to [0, 100]; kUnknownProgress while total is unknown.
[[nodiscard]] int percentOf(std::int64_t downloaded, std::int64_t total) noexcept;

} // namespace rdm
