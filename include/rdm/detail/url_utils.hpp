#pragma once

#include <string>

namespace rdm::detail {

// Last path segment of url without query or fragment, "download" when empty.
[[nodiscard]] std::string fileNameFromUrl(const std::string& url);

} // namespace rdm::detail
