/**
 * @file local_copy_queue.cpp
 * @brief Queue local copies under a concurrency and bandwidth limit
 *
 * This example demonstrates:
 * - Building a scheduler over the local filesystem backend
 * - Limiting concurrency and bandwidth
 * - Persisting paused transfers and restoring them on the next run
 * - Pausing every running transfer on Ctrl+C
 */

#include <kcenon/transfer_orchestrator/transfer_orchestrator.h>
#include <kcenon/transfer_orchestrator/core/logging.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::transfer_orchestrator;

namespace {

std::atomic<bool> interrupted{false};

/**
 * @brief Parse size string (e.g., "512K", "10M")
 */
auto parse_size(const std::string& size_str) -> uint64_t {
    std::size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        char suffix = static_cast<char>(std::toupper(size_str[pos]));
        switch (suffix) {
            case 'K': return static_cast<uint64_t>(value * 1024);
            case 'M': return static_cast<uint64_t>(value * 1024 * 1024);
            case 'G': return static_cast<uint64_t>(value * 1024 * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<uint64_t>(value);
}

void print_usage(const char* program) {
    std::cout << "Local Copy Queue Example - Transfer Orchestrator" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <destination_dir> <source>..." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -j, --jobs <n>          Concurrent transfers (default: 2)" << std::endl;
    std::cout << "  -b, --bandwidth <size>  Bytes per second, 0 for unlimited (e.g., 512K)"
              << std::endl;
    std::cout << "  --state-dir <dir>       Save paused transfers here and restore them"
              << std::endl;
    std::cout << "  --move                  Move instead of copy" << std::endl;
    std::cout << "  -v, --verbose           Debug logging" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Press Ctrl+C to pause running transfers and exit." << std::endl;
}

void signal_handler(int signal) {
    if (signal == SIGINT) {
        interrupted = true;
    }
}

auto is_finished(const transfer_record& record) -> bool {
    return record.is_terminal() || record.status == transfer_status::paused;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::size_t jobs = transfer_settings::default_max_concurrent;
    uint64_t bandwidth = 0;
    std::optional<std::string> state_dir;
    bool move = false;
    std::string destination;
    std::vector<std::string> sources;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            jobs = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "-b" || arg == "--bandwidth") {
            if (++i >= argc) {
                std::cerr << "Error: --bandwidth requires an argument" << std::endl;
                return 1;
            }
            bandwidth = parse_size(argv[i]);
        } else if (arg == "--state-dir") {
            if (++i >= argc) {
                std::cerr << "Error: --state-dir requires an argument" << std::endl;
                return 1;
            }
            state_dir = argv[i];
        } else if (arg == "--move") {
            move = true;
        } else if (arg == "-v" || arg == "--verbose") {
            get_logger().set_level(log_level::debug);
        } else if (arg[0] != '-') {
            if (destination.empty()) {
                destination = arg;
            } else {
                sources.push_back(arg);
            }
        }
    }

    if (destination.empty() || (sources.empty() && !state_dir)) {
        std::cerr << "Error: a destination and at least one source are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (jobs == 0) {
        std::cerr << "Error: --jobs must be at least 1" << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    auto settings = std::make_shared<transfer_settings>(bandwidth, jobs);

    local_backend_config local_config;
    local_config.live_settings = settings;
    backend_set backends;
    backends.local = std::make_shared<local_filesystem_backend>(local_config);

    auto builder = transfer_scheduler::builder();
    builder.with_dispatcher(std::make_shared<backend_dispatcher>(backends))
        .with_settings(settings)
        .with_thread_pool(adapters::transfer_pool_factory::create());
    if (state_dir) {
        builder.with_checkpoint_store(
            std::make_shared<checkpoint_store>(checkpoint_store_config(*state_dir)));
    }

    auto built = builder.build();
    if (!built) {
        std::cerr << "Failed to create scheduler: " << built.error().message << std::endl;
        return 1;
    }
    auto scheduler = std::move(built).value();

    scheduler.on_status_change([](const transfer_record& record) {
        std::cout << "[" << to_string(record.status) << "] " << record.label;
        if (record.error_message) {
            std::cout << ": " << *record.error_message;
        }
        std::cout << std::endl;
    });

    std::vector<transfer_id> ids;
    if (state_dir) {
        auto restored = scheduler.restore_paused();
        if (!restored) {
            std::cerr << "Failed to restore paused transfers: " << restored.error().message
                      << std::endl;
            return 1;
        }
        for (const auto& record : scheduler.paused()) {
            auto resumed = scheduler.resume(record.id);
            if (!resumed) {
                std::cerr << "Cannot resume " << record.label << ": "
                          << resumed.error().message << std::endl;
                continue;
            }
            ids.push_back(record.id);
        }
        std::cout << "Restored " << restored.value() << " paused transfer(s)" << std::endl;
    }

    for (const auto& source : sources) {
        transfer_request request;
        request.kind = move ? transfer_kind::move : transfer_kind::copy;
        request.sources = {source};
        request.destination = destination;
        request.label = source;

        auto id = scheduler.enqueue(request);
        if (!id) {
            std::cerr << "Rejected " << source << ": " << id.error().message << std::endl;
            continue;
        }
        ids.push_back(id.value());
    }

    while (!interrupted) {
        bool done = true;
        for (const auto& id : ids) {
            auto record = scheduler.get(id);
            if (record && !is_finished(record.value())) {
                done = false;
                break;
            }
        }
        if (done) {
            break;
        }

        std::cout << "\r" << scheduler.aggregate_summary() << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    std::cout << std::endl;

    if (interrupted) {
        std::cout << "Pausing running transfers..." << std::endl;
        for (const auto& record : scheduler.running()) {
            auto paused = scheduler.pause(record.id);
            if (!paused) {
                std::cerr << "Cannot pause " << record.label << ": "
                          << paused.error().message << std::endl;
            }
        }
        for (const auto& id : ids) {
            auto status = scheduler.wait_for(id, std::chrono::seconds(10));
            if (!status) {
                std::cerr << "Timed out waiting for " << id.to_string() << std::endl;
            }
        }
    }

    std::size_t failed = 0;
    for (const auto& id : ids) {
        auto record = scheduler.get(id);
        if (record && record.value().status == transfer_status::failed) {
            ++failed;
        }
    }
    return failed == 0 ? 0 : 2;
}
