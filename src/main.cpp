#include "transferq/config.hpp"
#include "transferq/curl_fetcher.hpp"
#include "transferq/errors.hpp"
#include "transferq/json_queue_journal.hpp"
#include "transferq/libarchive_archiver.hpp"
#include "transferq/logging.hpp"
#include "transferq/status_panel.hpp"
#include "transferq/transfer_manager.hpp"
#include "transferq/detail/curl_utils.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Download directory (default: ./Downloads)\n"
              << "  -c <directory>   Cache directory (default: ./DownloadCache)\n"
              << "  -l <kib>         Speed limit in KiB/s, 0 = unlimited (default: 0)\n"
              << "  -r <retries>     Retries per transfer on transport errors (default: 3)\n"
              << "  -i <ms>          Progress sampling interval (default: 500)\n"
              << "  -v <level>       Log level: trace, debug, info, warn, error (default: info)\n"
              << "  -f <file>        Also write the log to <file>\n"
              << "  -q <file>        Saved queue, reloaded on start (default: ./transferq-queue.json)\n"
              << "  -h, --help       Show this message" << std::endl;
}

void printCommands() {
    std::cout << "Commands:\n"
              << "  add <url> [alias]      queue a transfer\n"
              << "  status                 show the queue panel\n"
              << "  watch                  redraw the panel until the queue is idle\n"
              << "  pause | resume | cancel\n"
              << "  order <hash...>        reorder the queue (full permutation)\n"
              << "  remove <hash>          drop a transfer\n"
              << "  demote <pos>           send the active transfer back to the queue\n"
              << "  activate <hash> [pos]  start a queued transfer now\n"
              << "  limit <kib>            change the speed limit\n"
              << "  clean                  delete cached artifacts\n"
              << "  quit" << std::endl;
}

long long parseNumber(const std::string& text, const std::string& what) {
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value < 0) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + what + ": " + text);
    }
}

std::mutex console_mutex;

void printLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(console_mutex);
    std::cout << line << std::endl;
}

std::string describe(const transferq::Event& event) {
    const std::string prefix = event.hash.substr(0, 8);
    switch (event.type) {
    case transferq::EventType::Progress:
        return fmt::format("[{}] {:.1f}%", prefix, event.percent);
    case transferq::EventType::Meta:
        return fmt::format("[{}] file: {}", prefix, event.text);
    case transferq::EventType::Complete:
        return fmt::format("[{}] saved to {}", prefix, event.text);
    case transferq::EventType::Status:
        break;
    }
    return fmt::format("[{}] {}", prefix, event.text);
}

// Prints push events until `running` is cleared. Progress lines are only
// shown in verbose mode so the shell stays readable.
void pumpEvents(transferq::NotificationChannel::Subscription& subscription, const std::atomic<bool>& running,
                bool show_progress) {
    std::uint64_t last_sequence = 0;
    while (running.load()) {
        auto event = subscription.next(std::chrono::milliseconds(200));
        if (!event) {
            if (!subscription.connected()) {
                printLine("(event stream disconnected, use 'status')");
                return;
            }
            continue;
        }
        if (last_sequence != 0 && event->sequence > last_sequence + 1) {
            printLine(fmt::format("({} events missed)", event->sequence - last_sequence - 1));
        }
        last_sequence = event->sequence;
        if (event->type == transferq::EventType::Progress && !show_progress) {
            continue;
        }
        printLine(describe(*event));
    }
}

// Owns the event printer thread; joins it on every exit path out of main.
class EventPump {
public:
    EventPump(transferq::NotificationChannel::Subscription& subscription, bool show_progress)
        : thread_([this, &subscription, show_progress] { pumpEvents(subscription, running_, show_progress); }) {}

    ~EventPump() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    EventPump(const EventPump&) = delete;
    EventPump& operator=(const EventPump&) = delete;

private:
    std::atomic<bool> running_{true};
    std::thread thread_;
};

void watch(const transferq::TransferManager& manager) {
    transferq::StatusPanel panel;
    while (true) {
        const auto status = manager.getStatus();
        {
            std::lock_guard<std::mutex> lock(console_mutex);
            panel.redraw(std::cout, transferq::StatusPanel::build(status));
        }
        if (!status.active && status.queue.empty()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

// Returns false when the shell should exit.
bool runCommand(transferq::TransferManager& manager, const std::string& line) {
    std::istringstream input(line);
    std::string command;
    if (!(input >> command)) {
        return true;
    }
    std::vector<std::string> args;
    for (std::string arg; input >> arg;) {
        args.push_back(std::move(arg));
    }

    if (command == "quit" || command == "exit") {
        return false;
    } else if (command == "help") {
        printCommands();
    } else if (command == "add") {
        if (args.empty()) {
            throw transferq::ValidationError("add needs a URL");
        }
        std::string alias;
        for (std::size_t i = 1; i < args.size(); ++i) {
            alias += (i > 1 ? " " : "") + args[i];
        }
        printLine("queued " + manager.enqueue(args[0], alias));
    } else if (command == "status") {
        printLine(transferq::StatusPanel::build(manager.getStatus()));
    } else if (command == "watch") {
        watch(manager);
    } else if (command == "pause") {
        manager.pause();
    } else if (command == "resume") {
        manager.resume();
    } else if (command == "cancel") {
        manager.cancel();
    } else if (command == "order") {
        manager.reorderQueue(args);
    } else if (command == "remove") {
        if (args.size() != 1) {
            throw transferq::ValidationError("remove needs exactly one hash");
        }
        manager.removeFromQueue(args[0]);
    } else if (command == "demote") {
        const auto position = args.empty() ? 0 : parseNumber(args[0], "position");
        manager.demoteActive(static_cast<std::size_t>(position));
    } else if (command == "activate") {
        if (args.empty()) {
            throw transferq::ValidationError("activate needs a hash");
        }
        const auto position = args.size() > 1 ? parseNumber(args[1], "position") : 0;
        manager.activate(args[0], static_cast<std::size_t>(position));
    } else if (command == "limit") {
        if (args.size() != 1) {
            throw transferq::ValidationError("limit needs a value in KiB/s");
        }
        manager.setSpeedLimit(static_cast<std::uint64_t>(parseNumber(args[0], "speed limit")));
    } else if (command == "clean") {
        printLine(fmt::format("removed {} cache entries", manager.cleanCache()));
    } else {
        printLine("unknown command '" + command + "', try 'help'");
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    try {
        transferq::ManagerConfig config;
        std::string log_level = "info";
        std::optional<std::filesystem::path> log_file;
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
                config.download_dir = value;
            } else if (option == "-c") {
                config.cache_dir = value;
            } else if (option == "-l") {
                config.speed_limit_kib = static_cast<std::uint64_t>(parseNumber(value, "speed limit"));
            } else if (option == "-r") {
                const auto retries = parseNumber(value, "retry count");
                if (retries > 20) {
                    throw std::runtime_error("Retry count is invalid.");
                }
                config.max_retries = static_cast<int>(retries);
            } else if (option == "-i") {
                const auto interval = parseNumber(value, "sampling interval");
                if (interval == 0) {
                    throw std::runtime_error("Sampling interval must be positive.");
                }
                config.sample_interval = std::chrono::milliseconds(interval);
            } else if (option == "-v") {
                log_level = value;
            } else if (option == "-f") {
                log_file = value;
            } else if (option == "-q") {
                config.queue_file = value;
            } else {
                printUsage(argv[0]);
                return 1;
            }
            arg_index += 2;
        }

        if (arg_index != argc) {
            printUsage(argv[0]);
            return 1;
        }

        transferq::initLogging(log_level, log_file);
        transferq::detail::ensureCurlInitialized();

        transferq::CurlFetcher::Options fetch_options;
        fetch_options.user_agent = config.user_agent;
        fetch_options.connect_timeout_seconds = config.connect_timeout_seconds;
        fetch_options.low_speed_time_seconds = config.low_speed_time_seconds;

        transferq::TransferManager manager(config, std::make_shared<transferq::CurlFetcher>(fetch_options),
                                           std::make_shared<transferq::LibarchiveArchiver>(),
                                           std::make_shared<transferq::JsonQueueJournal>(config.queue_file));

        auto subscription = manager.subscribe();
        EventPump events(*subscription, log_level == "debug" || log_level == "trace");

        printCommands();
        std::string line;
        while (std::getline(std::cin, line)) {
            try {
                if (!runCommand(manager, line)) {
                    break;
                }
            } catch (const transferq::ValidationError& ex) {
                printLine(std::string("rejected: ") + ex.what());
            } catch (const std::exception& ex) {
                printLine(std::string("error: ") + ex.what());
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
