#pragma once

#include "stop_token.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace rdm {

struct ResponseHead {
    long status_code{0};                // 0 for schemes without status lines
    std::int64_t content_length{-1};    // bytes in this body, -1 when absent
    std::int64_t range_start{-1};       // from Content-Range, -1 when absent
    std::int64_t range_total{-1};       // from Content-Range, -1 when absent or "*"
};

class HttpResponse {
public:
    virtual ~HttpResponse() = default;

    [[nodiscard]] virtual const ResponseHead& head() const = 0;

    // Blocks until max_bytes are available, the body ends or stop is requested.
    // Returns the number of bytes stored; 0 means end of body or stopped.
    // Throws TransferError on a transport fault.
    virtual std::size_t read(char* buffer, std::size_t max_bytes) = 0;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Issues GET url with "Range: bytes=<offset>-" and returns once the response
    // head is known. Throws TransferError when the request fails.
    [[nodiscard]] virtual std::unique_ptr<HttpResponse> open(const std::string& url,
                                                             std::uint64_t offset,
                                                             StopToken stop) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

} // namespace rdm
