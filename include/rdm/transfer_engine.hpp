#pragma once

#include "download_task.hpp"
#include "http_client.hpp"
#include "options.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace rdm {

// A single resumable download. Construction starts the transfer on a
// background thread; pause/resume/cancel only flip shared state.
class TransferEngine final : public DownloadTask {
public:
    TransferEngine(std::string url, EngineOptions options, HttpClientPtr client);
    TransferEngine(std::string url, EngineOptions options = {});
    ~TransferEngine() override;

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void pause() override;
    void resume() override;
    void cancel() override;
    void shutdown() override;

    [[nodiscard]] const std::string& url() const override;
    [[nodiscard]] std::int64_t size() const override;
    [[nodiscard]] int progress() const override;
    [[nodiscard]] Status status() const override;
    [[nodiscard]] Progress getProgress() const override;

    [[nodiscard]] std::int64_t bytesTransferred() const;
    [[nodiscard]] const std::string& destination() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rdm
