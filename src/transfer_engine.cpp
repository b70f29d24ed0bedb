#include "rdm/transfer_engine.hpp"

#include "rdm/curl_http_client.hpp"
#include "rdm/detail/url_utils.hpp"
#include "rdm/errors.hpp"
#include "rdm/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <unistd.h>

namespace rdm {

class TransferEngine::Impl {
public:
    Impl(std::string url, EngineOptions options, HttpClientPtr client)
        : url_(std::move(url)),
          options_(std::move(options)),
          client_(std::move(client)),
          filename_(detail::fileNameFromUrl(url_)),
          destination_((std::filesystem::path{options_.output_dir} / filename_).string()),
          chunk_size_(std::max<std::size_t>(1, options_.max_chunk_size)) {
        if (!client_) {
            client_ = std::make_shared<CurlHttpClient>(options_);
        }
    }

    ~Impl() { shutdown(); }

    void start() {
        std::lock_guard<std::mutex> lock(control_mutex_);
        logging::get()->info("Starting {} -> {}", url_, destination_);
        launchTask();
    }

    void pause() {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (!transition(Status::Downloading, Status::Paused)) {
            logIgnored("pause");
            return;
        }
        stop_.requestStop();
        logging::get()->info("Paused {} at {} bytes", filename_, downloaded_bytes_.load());
    }

    void resume() {
        std::lock_guard<std::mutex> lock(control_mutex_);
        {
            std::lock_guard<std::mutex> message_lock(message_mutex_);
            if (!transition(Status::Paused, Status::Downloading) &&
                !transition(Status::Error, Status::Downloading)) {
                logIgnored("resume");
                return;
            }
            error_message_.clear();
        }
        logging::get()->info("Resuming {} from byte {}", filename_, downloaded_bytes_.load());
        launchTask();
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (!transition(Status::Downloading, Status::Cancelled) &&
            !transition(Status::Paused, Status::Cancelled)) {
            logIgnored("cancel");
            return;
        }
        stop_.requestStop();
        logging::get()->info("Cancelled {} at {} bytes", filename_, downloaded_bytes_.load());
    }

    void shutdown() {
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(control_mutex_);
            stop_.requestStop();
            worker = std::move(worker_);
        }
        if (worker.joinable()) {
            worker.join();
        }
    }

    [[nodiscard]] const std::string& url() const { return url_; }
    [[nodiscard]] const std::string& destination() const { return destination_; }
    [[nodiscard]] std::int64_t size() const { return total_bytes_.load(); }
    [[nodiscard]] std::int64_t bytesTransferred() const { return downloaded_bytes_.load(); }
    [[nodiscard]] Status status() const { return status_.load(); }

    [[nodiscard]] int progress() const {
        const std::int64_t total = total_bytes_.load();
        return percentOf(downloaded_bytes_.load(), total);
    }

    [[nodiscard]] Progress getProgress() const {
        std::lock_guard<std::mutex> lock(message_mutex_);
        return {
            url_,
            filename_,
            total_bytes_.load(),
            downloaded_bytes_.load(),
            status_.load(),
            error_message_
        };
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    using FilePtr = std::unique_ptr<FILE, FileDeleter>;

    // Caller holds control_mutex_. The new task joins its predecessor before
    // touching the file, so at most one task ever writes.
    void launchTask() {
        stop_ = StopSource{};
        StopToken token = stop_.token();
        std::thread previous = std::move(worker_);
        worker_ = std::thread([this, previous = std::move(previous), token]() mutable {
            if (previous.joinable()) {
                previous.join();
            }
            run(token);
        });
    }

    void run(const StopToken& token) {
        try {
            transfer(token);
        } catch (const std::exception& ex) {
            registerError(ex.what(), token);
        }
    }

    void transfer(const StopToken& token) {
        const std::int64_t offset = downloaded_bytes_.load();
        const std::int64_t known_total = total_bytes_.load();
        if (known_total >= 0 && offset >= known_total) {
            completeTransfer();
            return;
        }

        logging::get()->debug("GET {} Range: bytes={}-", url_, offset);
        auto response = client_->open(url_, static_cast<std::uint64_t>(offset), token);
        std::int64_t skip = resolveTotalSize(response->head(), offset);

        FilePtr file = openDestination(offset);
        std::vector<char> buffer(chunk_size_);

        while (skip > 0) {
            const auto want = static_cast<std::size_t>(std::min<std::int64_t>(skip, buffer.size()));
            const std::size_t got = response->read(buffer.data(), want);
            if (got == 0) {
                if (token.stopRequested()) {
                    return;
                }
                throw TransferError("Response ended before the resume offset");
            }
            skip -= static_cast<std::int64_t>(got);
        }

        bool finished = false;
        while (status_.load() == Status::Downloading && !token.stopRequested()) {
            std::size_t want = chunk_size_;
            const std::int64_t total = total_bytes_.load();
            if (total >= 0) {
                want = static_cast<std::size_t>(
                    std::min<std::int64_t>(static_cast<std::int64_t>(want), total - downloaded_bytes_.load()));
            }
            if (want == 0) {
                finished = true;
                break;
            }

            const std::size_t got = response->read(buffer.data(), want);
            if (got == 0) {
                finished = !token.stopRequested();
                break;
            }
            writeChunk(file.get(), buffer.data(), got);
        }

        file.reset();
        if (finished) {
            completeTransfer();
        }
    }

    // Returns how many leading body bytes to discard because the server
    // answered the ranged request with the whole resource.
    std::int64_t resolveTotalSize(const ResponseHead& head, std::int64_t offset) {
        const bool partial = head.status_code == 206 || head.range_start >= 0 || head.status_code == 0;

        std::int64_t observed = kUnknownSize;
        std::int64_t skip = 0;
        if (partial) {
            if (head.range_start >= 0 && head.range_start != offset) {
                throw TransferError(fmt::format("Server resumed at byte {} instead of {}", head.range_start, offset));
            }
            if (head.range_total >= 0) {
                observed = head.range_total;
            } else if (head.content_length >= 0) {
                observed = offset + head.content_length;
            }
        } else {
            observed = head.content_length;
            skip = offset;
            if (offset > 0) {
                logging::get()->warn("{} ignored the range request, skipping {} bytes", url_, offset);
            }
        }

        const std::int64_t known = total_bytes_.load();
        if (known < 0) {
            if (observed >= 0) {
                if (observed < offset) {
                    throw TransferError(fmt::format("Resource is {} bytes but {} are already written", observed, offset));
                }
                total_bytes_.store(observed);
                logging::get()->debug("{} is {} bytes", filename_, observed);
            }
        } else if (observed >= 0 && observed != known) {
            throw TransferError(fmt::format("Resource size changed from {} to {} bytes", known, observed));
        }
        return skip;
    }

    [[nodiscard]] FilePtr openDestination(std::int64_t offset) const {
        std::error_code ec;
        std::filesystem::create_directories(options_.output_dir, ec);
        if (ec) {
            throw TransferError(fmt::format("Cannot create directory {}: {}", options_.output_dir, ec.message()));
        }

        if (offset == 0) {
            FilePtr file{std::fopen(destination_.c_str(), "wb")};
            if (!file) {
                throw TransferError(fmt::format("Cannot create {}: {}", destination_, std::strerror(errno)));
            }
            return file;
        }

        const auto existing = std::filesystem::file_size(destination_, ec);
        if (ec || static_cast<std::int64_t>(existing) < offset) {
            throw TransferError(fmt::format("{} no longer holds the {} bytes already transferred", destination_, offset));
        }

        FilePtr file{std::fopen(destination_.c_str(), "r+b")};
        if (!file) {
            throw TransferError(fmt::format("Cannot open {}: {}", destination_, std::strerror(errno)));
        }
        if (ftruncate(fileno(file.get()), offset) == -1) {
            throw TransferError(fmt::format("Cannot resize {}", destination_));
        }
        if (fseeko(file.get(), offset, SEEK_SET) != 0) {
            throw TransferError(fmt::format("Failed to seek {}", destination_));
        }
        return file;
    }

    // The counter moves only after the bytes are flushed.
    void writeChunk(FILE* file, const char* data, std::size_t size) {
        const std::size_t written = std::fwrite(data, 1, size, file);
        if (written != size || std::fflush(file) != 0) {
            throw TransferError(fmt::format("Failed to write {}", destination_));
        }
        downloaded_bytes_.fetch_add(static_cast<std::int64_t>(written));
    }

    void completeTransfer() {
        const std::int64_t downloaded = downloaded_bytes_.load();
        std::int64_t total = total_bytes_.load();
        if (total < 0) {
            total_bytes_.store(downloaded);
            total = downloaded;
        }
        if (downloaded < total) {
            throw TransferError(fmt::format("Connection closed after {} of {} bytes", downloaded, total));
        }
        if (transition(Status::Downloading, Status::Complete)) {
            logging::get()->info("Completed {} ({} bytes)", filename_, downloaded);
        }
    }

    void registerError(const std::string& message, const StopToken& token) {
        if (token.stopRequested()) {
            logging::get()->debug("Fault after stop on {}: {}", filename_, message);
            return;
        }

        std::lock_guard<std::mutex> lock(message_mutex_);
        if (transition(Status::Downloading, Status::Error)) {
            error_message_ = message;
            logging::get()->error("Download of {} failed at byte {}: {}", url_, downloaded_bytes_.load(), message);
        }
    }

    bool transition(Status from, Status to) {
        return status_.compare_exchange_strong(from, to);
    }

    void logIgnored(const char* action) const {
        logging::get()->debug("Ignoring {} on {} while {}", action, filename_, statusLabel(status_.load()));
    }

    const std::string url_;
    const EngineOptions options_;
    HttpClientPtr client_;
    const std::string filename_;
    const std::string destination_;
    const std::size_t chunk_size_;

    std::mutex control_mutex_;
    StopSource stop_;
    std::thread worker_;

    mutable std::mutex message_mutex_;
    std::string error_message_;

    std::atomic<Status> status_{Status::Downloading};
    std::atomic<std::int64_t> total_bytes_{kUnknownSize};
    std::atomic<std::int64_t> downloaded_bytes_{0};
};

TransferEngine::TransferEngine(std::string url, EngineOptions options, HttpClientPtr client)
    : impl_(std::make_unique<Impl>(std::move(url), std::move(options), std::move(client))) {
    impl_->start();
}

TransferEngine::TransferEngine(std::string url, EngineOptions options)
    : TransferEngine(std::move(url), std::move(options), nullptr) {}

TransferEngine::~TransferEngine() = default;

void TransferEngine::pause() { impl_->pause(); }

void TransferEngine::resume() { impl_->resume(); }

void TransferEngine::cancel() { impl_->cancel(); }

void TransferEngine::shutdown() { impl_->shutdown(); }

const std::string& TransferEngine::url() const { return impl_->url(); }

std::int64_t TransferEngine::size() const { return impl_->size(); }

int TransferEngine::progress() const { return impl_->progress(); }

Status TransferEngine::status() const { return impl_->status(); }

Progress TransferEngine::getProgress() const { return impl_->getProgress(); }

std::int64_t TransferEngine::bytesTransferred() const { return impl_->bytesTransferred(); }

const std::string& TransferEngine::destination() const { return impl_->destination(); }

} // namespace rdm
