#pragma once

#include <string>

namespace rdm::detail {

// Runs curl_global_init once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

// "rdm/<version> libcurl/<version>", used when no user agent is configured.
[[nodiscard]] std::string defaultUserAgent();

} // namespace rdm::detail
