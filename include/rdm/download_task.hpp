#pragma once

#include "progress.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace rdm {

class DownloadTask {
public:
    virtual ~DownloadTask() = default;

    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void cancel() = 0;

    // Requests stop and waits for the background task. Status is left as-is.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual const std::string& url() const = 0;
    [[nodiscard]] virtual std::int64_t size() const = 0;
    [[nodiscard]] virtual int progress() const = 0;
    [[nodiscard]] virtual Status status() const = 0;
    [[nodiscard]] virtual Progress getProgress() const = 0;
};

using DownloadTaskPtr = std::shared_ptr<DownloadTask>;

} // namespace rdm
