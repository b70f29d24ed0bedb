#include "rdm/detail/url_utils.hpp"

namespace rdm::detail {

std::string fileNameFromUrl(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));

    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        const auto path_start = path.find('/', scheme + 3);
        path = (path_start == std::string::npos) ? std::string{} : path.substr(path_start);
    }

    const auto slash = path.rfind('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return "download";
    }
    return name;
}

} // namespace rdm::detail
