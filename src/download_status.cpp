#include "rdm/download_status.hpp"

namespace rdm {

std::string_view statusLabel(Status status) noexcept {
    switch (status) {
        case Status::Downloading: return "Downloading";
        case Status::Paused:      return "Paused";
        case Status::Complete:    return "Complete";
        case Status::Cancelled:   return "Cancelled";
        case Status::Error:       return "Error";
    }
    return "Unknown";
}

Actions availableActions(Status status) noexcept {
    switch (status) {
        case Status::Downloading: return {true, false, true, false};
        case Status::Paused:      return {false, true, true, false};
        case Status::Error:       return {false, true, false, true};
        case Status::Complete:
        case Status::Cancelled:   return {false, false, false, true};
    }
    return {};
}

} // namespace rdm
