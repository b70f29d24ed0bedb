#include "rdm/detail/http_head.hpp"

#include "rdm/errors.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>

#include <fmt/format.h>

namespace rdm::detail {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool parseNumber(std::string_view text, std::int64_t& out) {
    text = trim(text);
    if (text.empty()) {
        return false;
    }
    const auto* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, out);
    return result.ec == std::errc{} && result.ptr == end && out >= 0;
}

} // namespace

bool parseContentRange(std::string_view value, ResponseHead& head) {
    value = trim(value);
    constexpr std::string_view unit = "bytes";
    if (value.size() <= unit.size() || !iequals(value.substr(0, unit.size()), unit)) {
        return false;
    }
    value = trim(value.substr(unit.size()));

    const auto dash = value.find('-');
    const auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return false;
    }

    std::int64_t first = 0;
    std::int64_t last = 0;
    if (!parseNumber(value.substr(0, dash), first) ||
        !parseNumber(value.substr(dash + 1, slash - dash - 1), last) || last < first) {
        return false;
    }

    std::int64_t total = -1;
    const auto total_text = trim(value.substr(slash + 1));
    if (total_text != "*" && !parseNumber(total_text, total)) {
        return false;
    }

    head.range_start = first;
    head.range_total = total;
    return true;
}

void parseHeaderLine(std::string_view line, ResponseHead& head) {
    line = trim(line);
    if (line.size() > 5 && line.substr(0, 5) == "HTTP/") {
        head = ResponseHead{};
        const auto space = line.find(' ');
        if (space != std::string_view::npos) {
            std::int64_t code = 0;
            if (parseNumber(line.substr(space + 1, 3), code)) {
                head.status_code = static_cast<long>(code);
            }
        }
        return;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return;
    }
    const auto name = trim(line.substr(0, colon));
    const auto value = line.substr(colon + 1);

    if (iequals(name, "Content-Length")) {
        std::int64_t length = 0;
        if (parseNumber(value, length)) {
            head.content_length = length;
        }
    } else if (iequals(name, "Content-Range")) {
        parseContentRange(value, head);
    }
}

void requireSuccessStatus(const ResponseHead& head, std::string_view url) {
    if (head.status_code == 0 || (head.status_code >= 200 && head.status_code < 300)) {
        return;
    }
    throw TransferError(fmt::format("HTTP status {} for {}", head.status_code, url));
}

} // namespace rdm::detail
