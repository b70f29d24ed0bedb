#pragma once

#include <string_view>

namespace rdm {

enum class Status {
    Downloading,
    Paused,
    Complete,
    Cancelled,
    Error
};

[[nodiscard]] std::string_view statusLabel(Status status) noexcept;

// Actions a controller may offer for a download in a given status.
struct Actions {
    bool pause{false};
    bool resume{false};
    bool cancel{false};
    bool clear{false};
};

[[nodiscard]] Actions availableActions(Status status) noexcept;

} // namespace rdm
