#pragma once

#include "download_task.hpp"
#include "options.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace rdm {

// Holds the live downloads and routes user actions to them. Every action is
// checked against the status of the target row before it is forwarded.
class DownloadManager {
public:
    using TaskFactory = std::function<DownloadTaskPtr(const std::string& url, const EngineOptions&)>;

    explicit DownloadManager(ManagerOptions options = {}, TaskFactory factory = {});
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Creates a download for url and returns its row index.
    std::size_t add(const std::string& url);
    void addTask(DownloadTaskPtr task);

    bool pause(std::size_t index);
    bool resume(std::size_t index);
    bool cancel(std::size_t index);
    bool clear(std::size_t index);

    [[nodiscard]] Actions actionsFor(std::size_t index) const;
    [[nodiscard]] std::size_t size() const { return tasks_.size(); }
    [[nodiscard]] std::vector<Progress> poll() const;
    [[nodiscard]] bool hasActiveTasks() const;
    [[nodiscard]] const ManagerOptions& options() const { return options_; }

    [[nodiscard]] std::string buildProgressPanel() const;
    static std::string formatTaskLine(std::size_t row, const Progress& progress);
    static std::string formatSize(std::int64_t bytes);

    void shutdown();

private:
    [[nodiscard]] DownloadTask* taskAt(std::size_t index) const;

    ManagerOptions options_;
    TaskFactory factory_;
    std::vector<DownloadTaskPtr> tasks_;
};

} // namespace rdm
