#include "rdm/detail/curl_utils.hpp"

#include "rdm/logging.hpp"

#include <curl/curl.h>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace rdm::detail {

namespace {
constexpr const char* kVersion = "1.0";
} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK) {
            throw std::runtime_error(std::string{"Failed to initialize libcurl: "} + curl_easy_strerror(res));
        }
        std::atexit([] { curl_global_cleanup(); });
        logging::get()->debug("Using {}", curl_version());
    });
}

std::string defaultUserAgent() {
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    if (!info || !info->version) {
        return fmt::format("rdm/{}", kVersion);
    }
    return fmt::format("rdm/{} libcurl/{}", kVersion, info->version);
}

} // namespace rdm::detail
