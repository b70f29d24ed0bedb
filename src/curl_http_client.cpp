#include "rdm/curl_http_client.hpp"

#include "rdm/detail/curl_utils.hpp"
#include "rdm/detail/http_head.hpp"
#include "rdm/errors.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <curl/curl.h>

namespace rdm {

namespace {

// Bytes held in memory before libcurl is asked to stop delivering.
constexpr std::size_t kMaxBuffered = 256 * 1024;
constexpr int kPollTimeoutMs = 50;

bool isInterimStatus(long code, bool follow_redirects) {
    if (code >= 100 && code < 200) {
        return true;
    }
    const bool redirect = code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
    return redirect && follow_redirects;
}

class CurlResponse final : public HttpResponse {
public:
    CurlResponse(const std::string& url, std::uint64_t offset, const EngineOptions& options, StopToken stop)
        : easy_(curl_easy_init(), &curl_easy_cleanup),
          multi_(curl_multi_init(), &curl_multi_cleanup),
          stop_(std::move(stop)),
          follow_redirects_(options.follow_redirects),
          range_(std::to_string(offset) + "-"),
          user_agent_(options.user_agent.empty() ? detail::defaultUserAgent() : options.user_agent) {
        if (!easy_ || !multi_) {
            throw TransferError("Failed to allocate curl handle");
        }

        CURL* easy = easy_.get();
        curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
        curl_easy_setopt(easy, CURLOPT_RANGE, range_.c_str());
        curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlResponse::writeCallback);
        curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &CurlResponse::headerCallback);
        curl_easy_setopt(easy, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
        curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(easy, CURLOPT_USERAGENT, user_agent_.c_str());
        if (options.connect_timeout_seconds > 0) {
            curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
        }

        const CURLMcode added = curl_multi_add_handle(multi_.get(), easy);
        if (added != CURLM_OK) {
            throw TransferError(std::string{"curl multi error: "} + curl_multi_strerror(added));
        }
        attached_ = true;
    }

    ~CurlResponse() override {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    CurlResponse(const CurlResponse&) = delete;
    CurlResponse& operator=(const CurlResponse&) = delete;

    [[nodiscard]] const ResponseHead& head() const override { return head_; }

    // Drives the transfer until the final response head is known.
    void awaitHead(const std::string& url) {
        while (!head_done_ && !finished_) {
            if (stop_.stopRequested()) {
                throw TransferError("Request aborted before response");
            }
            pump();
        }

        if (finished_ && result_ != CURLE_OK) {
            throw TransferError(std::string{"curl error: "} + curl_easy_strerror(result_));
        }

        if (head_.content_length < 0) {
            curl_off_t length = -1;
            if (curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0) {
                head_.content_length = static_cast<std::int64_t>(length);
            }
        }

        detail::requireSuccessStatus(head_, url);
    }

    std::size_t read(char* buffer, std::size_t max_bytes) override {
        // A paused handle may still hold body bytes after libcurl reports it
        // done, so unpause before looking at finished_.
        while (available() < max_bytes && available() < kMaxBuffered) {
            if (stop_.stopRequested()) {
                return 0;
            }
            if (paused_) {
                paused_ = false;
                const CURLcode res = curl_easy_pause(easy_.get(), CURLPAUSE_CONT);
                if (res != CURLE_OK) {
                    throw TransferError(std::string{"curl error: "} + curl_easy_strerror(res));
                }
                continue;
            }
            if (finished_) {
                break;
            }
            pump();
        }

        if (stop_.stopRequested()) {
            return 0;
        }

        const std::size_t n = std::min(max_bytes, available());
        if (n == 0) {
            if (result_ != CURLE_OK) {
                throw TransferError(std::string{"curl error: "} + curl_easy_strerror(result_));
            }
            return 0;
        }

        std::memcpy(buffer, buffer_.data() + consumed_, n);
        consumed_ += n;
        if (consumed_ == buffer_.size()) {
            buffer_.clear();
            consumed_ = 0;
        }
        return n;
    }

private:
    using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using MultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;

    [[nodiscard]] std::size_t available() const { return buffer_.size() - consumed_; }

    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_.get(), &running);
        if (mc != CURLM_OK) {
            throw TransferError(std::string{"curl multi error: "} + curl_multi_strerror(mc));
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                finished_ = true;
                result_ = msg->data.result;
            }
        }

        if (!finished_ && running > 0) {
            mc = curl_multi_poll(multi_.get(), nullptr, 0, kPollTimeoutMs, nullptr);
            if (mc != CURLM_OK) {
                throw TransferError(std::string{"curl multi error: "} + curl_multi_strerror(mc));
            }
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlResponse*>(userdata);
        if (!self) {
            return 0;
        }

        self->head_done_ = true;
        if (self->available() >= kMaxBuffered) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }

        const size_t total = size * nmemb;
        if (self->consumed_ > 0 && self->consumed_ >= self->buffer_.size() / 2) {
            self->buffer_.erase(0, self->consumed_);
            self->consumed_ = 0;
        }
        self->buffer_.append(ptr, total);
        return total;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlResponse*>(userdata);
        const size_t total = size * nitems;
        if (!self) {
            return 0;
        }

        const std::string_view line{buffer, total};
        if (line == "\r\n" || line == "\n") {
            if (!isInterimStatus(self->head_.status_code, self->follow_redirects_)) {
                self->head_done_ = true;
            }
            return total;
        }

        detail::parseHeaderLine(line, self->head_);
        return total;
    }

    EasyHandle easy_;
    MultiHandle multi_;
    StopToken stop_;
    bool follow_redirects_;
    std::string range_;
    std::string user_agent_;

    ResponseHead head_;
    std::string buffer_;
    std::size_t consumed_{0};
    bool attached_{false};
    bool head_done_{false};
    bool finished_{false};
    bool paused_{false};
    CURLcode result_{CURLE_OK};
};

} // namespace

CurlHttpClient::CurlHttpClient(EngineOptions options) : options_(std::move(options)) {}

std::unique_ptr<HttpResponse> CurlHttpClient::open(const std::string& url, std::uint64_t offset, StopToken stop) {
    detail::ensureCurlInitialized();
    auto response = std::make_unique<CurlResponse>(url, offset, options_, std::move(stop));
    response->awaitHead(url);
    return response;
}

} // namespace rdm
