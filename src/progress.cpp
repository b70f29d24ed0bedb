#include "rdm/progress.hpp"

#include <algorithm>

namespace rdm {

int percentOf(std::int64_t downloaded, std::int64_t total) noexcept {
    if (total <= 0) {
        return kUnknownProgress;
    }
    const std::int64_t clamped = std::clamp<std::int64_t>(downloaded, 0, total);
    return static_cast<int>(clamped * 100 / total);
}

} // namespace rdm
