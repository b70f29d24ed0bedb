#pragma once

#include "http_client.hpp"
#include "options.hpp"

namespace rdm {

// libcurl transport. The body is pulled through a multi handle so the
// transfer loop can read bounded chunks from a live connection.
class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(EngineOptions options = {});

    [[nodiscard]] std::unique_ptr<HttpResponse> open(const std::string& url,
                                                     std::uint64_t offset,
                                                     StopToken stop) override;

private:
    EngineOptions options_;
};

} // namespace rdm
