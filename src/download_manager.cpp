#include "rdm/download_manager.hpp"

#include "rdm/logging.hpp"
#include "rdm/transfer_engine.hpp"

#include <algorithm>
#include <memory>
#include <utility>

#include <fmt/format.h>

namespace rdm {

namespace {

constexpr std::size_t kNameWidth = 20;
constexpr int kBarWidth = 30;

std::string displayName(const Progress& progress) {
    std::string name = progress.filename.empty() ? progress.url : progress.filename;
    if (name.size() > kNameWidth) {
        name = name.substr(0, kNameWidth);
    }
    if (name.empty()) {
        name = "(unnamed)";
    }
    return name;
}

} // namespace

DownloadManager::DownloadManager(ManagerOptions options, TaskFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const std::string& url, const EngineOptions& engine_options) -> DownloadTaskPtr {
            return std::make_shared<TransferEngine>(url, engine_options);
        };
    }
}

DownloadManager::~DownloadManager() { shutdown(); }

std::size_t DownloadManager::add(const std::string& url) {
    addTask(factory_(url, options_.engine));
    return tasks_.size() - 1;
}

void DownloadManager::addTask(DownloadTaskPtr task) {
    if (task) {
        tasks_.push_back(std::move(task));
    }
}

bool DownloadManager::pause(std::size_t index) {
    if (!actionsFor(index).pause) {
        return false;
    }
    tasks_[index]->pause();
    return true;
}

bool DownloadManager::resume(std::size_t index) {
    if (!actionsFor(index).resume) {
        return false;
    }
    tasks_[index]->resume();
    return true;
}

bool DownloadManager::cancel(std::size_t index) {
    if (!actionsFor(index).cancel) {
        return false;
    }
    tasks_[index]->cancel();
    return true;
}

bool DownloadManager::clear(std::size_t index) {
    if (!actionsFor(index).clear) {
        return false;
    }
    const auto task = tasks_[index];
    tasks_.erase(tasks_.begin() + static_cast<std::ptrdiff_t>(index));
    task->shutdown();
    logging::get()->debug("Cleared {}", task->url());
    return true;
}

Actions DownloadManager::actionsFor(std::size_t index) const {
    const DownloadTask* task = taskAt(index);
    if (!task) {
        return {};
    }
    return availableActions(task->status());
}

std::vector<Progress> DownloadManager::poll() const {
    std::vector<Progress> rows;
    rows.reserve(tasks_.size());
    for (const auto& task : tasks_) {
        rows.push_back(task->getProgress());
    }
    return rows;
}

bool DownloadManager::hasActiveTasks() const {
    return std::any_of(tasks_.begin(), tasks_.end(), [](const DownloadTaskPtr& task) {
        return task->status() == Status::Downloading;
    });
}

std::string DownloadManager::buildProgressPanel() const {
    std::string panel;
    panel.reserve(tasks_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Download Manager ({} downloads)\n", tasks_.size());
    panel.append("--------------------------------------------------\n");

    std::int64_t total_all = 0;
    std::int64_t downloaded_all = 0;

    const auto rows = poll();
    for (std::size_t i = 0; i < rows.size(); ++i) {
        panel += formatTaskLine(i + 1, rows[i]);
        panel.push_back('\n');

        if (rows[i].total_bytes > 0) {
            total_all += rows[i].total_bytes;
            downloaded_all += rows[i].downloaded_bytes;
        }
    }

    panel.append("--------------------------------------------------\n");
    const int overall = percentOf(downloaded_all, total_all);
    if (overall != kUnknownProgress) {
        panel += fmt::format("Overall: {:>3}%", overall);
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string DownloadManager::formatTaskLine(std::size_t row, const Progress& progress) {
    std::string line;
    line.reserve(256);

    const std::string name = displayName(progress);
    const int percent = percentOf(progress.downloaded_bytes, progress.total_bytes);

    if (percent != kUnknownProgress) {
        const int bar_pos = percent * kBarWidth / 100;

        std::string bar;
        bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
        for (int i = 0; i < kBarWidth; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }

        line += fmt::format("{:>2} {:<20} [{}] {:>3}% ({}/{})",
                            row,
                            name,
                            bar,
                            percent,
                            formatSize(progress.downloaded_bytes),
                            formatSize(progress.total_bytes));
    } else {
        line += fmt::format("{:>2} {:<20} [size unknown] ({})",
                            row,
                            name,
                            formatSize(progress.downloaded_bytes));
    }

    line += fmt::format("  {}", statusLabel(progress.status));
    if (progress.status == Status::Error && !progress.error_message.empty()) {
        line += fmt::format(": {}", progress.error_message);
    }

    return line;
}

std::string DownloadManager::formatSize(std::int64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    if (bytes < 0) {
        return "?";
    }

    const double value = static_cast<double>(bytes);
    if (value >= GB) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (value >= MB) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (value >= KB) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void DownloadManager::shutdown() {
    for (auto& task : tasks_) {
        task->shutdown();
    }
}

DownloadTask* DownloadManager::taskAt(std::size_t index) const {
    return index < tasks_.size() ? tasks_[index].get() : nullptr;
}

} // namespace rdm
