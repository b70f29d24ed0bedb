#include "rdm/detail/curl_utils.hpp"
#include "rdm/download_manager.hpp"
#include "rdm/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <poll.h>
#include <unistd.h>

namespace {
void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-d <directory>] [-c <bytes>] [-i <ms>] [-t <seconds>] [-u <agent>] [-l <level>] [--log-file <path>] [<url> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>    Set download directory (default: current directory)\n"
              << "  -c <bytes>        Maximum chunk size per read (default: 1024)\n"
              << "  -i <ms>           Progress refresh interval (default: 100)\n"
              << "  -t <seconds>      Connect timeout (default: libcurl default)\n"
              << "  -u <agent>        User-Agent header (default: rdm and libcurl versions)\n"
              << "  -l <level>        Log level: trace, debug, info, warn, err, critical, off (default: warn)\n"
              << "  --log-file <path> Also write the log to a file\n"
              << "  -h, --help        Show this message\n"
              << "Commands on stdin: add <url>, pause <n>, resume <n>, cancel <n>, clear <n>, list, quit"
              << std::endl;
}

long parseNumber(const std::string& text, const std::string& what) {
    try {
        std::size_t used = 0;
        const long value = std::stol(text, &used);
        if (used != text.size() || value < 0) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + what + ": " + text);
    }
}

// Collects complete lines from stdin without ever blocking the refresh loop.
class CommandReader {
public:
    std::vector<std::string> poll() {
        std::vector<std::string> lines;
        while (!closed_) {
            pollfd fd{STDIN_FILENO, POLLIN, 0};
            if (::poll(&fd, 1, 0) <= 0 || (fd.revents & (POLLIN | POLLHUP)) == 0) {
                break;
            }
            char chunk[512];
            const ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
            if (n <= 0) {
                closed_ = true;
                break;
            }
            pending_.append(chunk, static_cast<std::size_t>(n));
        }

        std::size_t newline = 0;
        while ((newline = pending_.find('\n')) != std::string::npos) {
            lines.push_back(pending_.substr(0, newline));
            pending_.erase(0, newline + 1);
        }
        if (closed_ && !pending_.empty()) {
            lines.push_back(std::move(pending_));
            pending_.clear();
        }
        return lines;
    }

    [[nodiscard]] bool closed() const { return closed_; }

private:
    std::string pending_;
    bool closed_{false};
};

// Returns false when the user asked to quit.
bool execute(rdm::DownloadManager& manager, const std::string& line, std::string& status_line) {
    std::istringstream in(line);
    std::string command;
    std::string argument;
    in >> command >> argument;

    if (command.empty()) {
        return true;
    }
    if (command == "quit" || command == "exit") {
        return false;
    }
    if (command == "list") {
        status_line.clear();
        return true;
    }
    if (command == "add") {
        if (argument.empty()) {
            status_line = "add: missing url";
        } else {
            const auto row = manager.add(argument);
            status_line = fmt::format("added #{}", row + 1);
        }
        return true;
    }

    std::size_t row = 0;
    try {
        row = static_cast<std::size_t>(parseNumber(argument, "row"));
    } catch (const std::exception& ex) {
        status_line = ex.what();
        return true;
    }
    const std::size_t index = row - 1;

    bool accepted = false;
    if (command == "pause") {
        accepted = manager.pause(index);
    } else if (command == "resume") {
        accepted = manager.resume(index);
    } else if (command == "cancel") {
        accepted = manager.cancel(index);
    } else if (command == "clear") {
        accepted = manager.clear(index);
    } else {
        status_line = fmt::format("unknown command: {}", command);
        return true;
    }

    status_line = accepted ? fmt::format("{} #{}", command, row)
                           : fmt::format("{} is not available for #{}", command, row);
    return true;
}

void redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        std::cout << "\033[" << previous_lines << "F\033[J";
    }
    std::cout << panel << std::flush;
    previous_lines = current_lines;
}

void runController(rdm::DownloadManager& manager) {
    CommandReader reader;
    std::string status_line;
    std::size_t previous_lines = 0;

    while (true) {
        bool quit = false;
        for (const auto& line : reader.poll()) {
            if (!execute(manager, line, status_line)) {
                quit = true;
                break;
            }
        }

        std::string panel = manager.buildProgressPanel();
        if (!status_line.empty()) {
            panel += status_line;
            panel.push_back('\n');
        }
        redrawPanel(panel, previous_lines);

        if (quit || (reader.closed() && !manager.hasActiveTasks())) {
            break;
        }

        std::this_thread::sleep_for(manager.options().poll_interval);
    }
}
} // namespace

int main(int argc, char** argv) {
    try {
        rdm::detail::ensureCurlInitialized();
        rdm::ManagerOptions options;
        rdm::logging::LogOptions log_options;
        options.engine.output_dir = std::filesystem::current_path().string();
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }

            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            const std::string value = argv[arg_index + 1];

            if (option == "-d") {
                std::error_code ec;
                std::filesystem::create_directories(value, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                         + value + " - " + ec.message());
                }
                options.engine.output_dir = value;
            } else if (option == "-c") {
                const long chunk = parseNumber(value, "chunk size");
                if (chunk <= 0) {
                    throw std::runtime_error("Chunk size must be positive.");
                }
                options.engine.max_chunk_size = static_cast<std::size_t>(chunk);
            } else if (option == "-i") {
                const long interval = parseNumber(value, "refresh interval");
                if (interval <= 0) {
                    throw std::runtime_error("Refresh interval must be positive.");
                }
                options.poll_interval = std::chrono::milliseconds(interval);
            } else if (option == "-t") {
                options.engine.connect_timeout_seconds = parseNumber(value, "connect timeout");
            } else if (option == "-u") {
                options.engine.user_agent = value;
            } else if (option == "-l") {
                log_options.level = rdm::logging::parseLevel(value);
            } else if (option == "--log-file") {
                log_options.file = value;
            } else {
                printUsage(argv[0]);
                return 1;
            }
            arg_index += 2;
        }

        rdm::logging::init(log_options);

        rdm::DownloadManager manager(options);
        for (int i = arg_index; i < argc; ++i) {
            manager.add(argv[i]);
        }

        runController(manager);
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
