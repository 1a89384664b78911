/**
 * @file directory_sync.cpp
 * @brief Compare two local directories and reconcile them
 *
 * This example demonstrates:
 * - Diffing two trees with size/mtime or checksum comparison
 * - Excluding paths with glob patterns
 * - Adjusting the default selection before building a plan
 * - Running the plan through the scheduler
 */

#include <kcenon/transfer_orchestrator/transfer_orchestrator.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace kcenon::transfer_orchestrator;

namespace {

void print_usage(const char* program) {
    std::cout << "Directory Sync Example - Transfer Orchestrator" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <source_dir> <destination_dir>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --checksum              Compare content fingerprints" << std::endl;
    std::cout << "  --exclude <pattern>     Skip matching paths (repeatable)" << std::endl;
    std::cout << "  --reverse               Sync destination back into source" << std::endl;
    std::cout << "  --no-delete             Keep files that exist only on the target"
              << std::endl;
    std::cout << "  --dry-run               Print the plan without running it" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

auto marker(sync_classification c) -> char {
    switch (c) {
        case sync_classification::new_entry: return '+';
        case sync_classification::modified: return '~';
        case sync_classification::deleted: return '-';
        case sync_classification::same: return '=';
        default: return '?';
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    sync_options options;
    auto direction = sync_direction::source_to_destination;
    bool delete_orphans = true;
    bool dry_run = false;
    std::vector<std::string> roots;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--checksum") {
            options.mode = compare_mode::checksum;
        } else if (arg == "--exclude") {
            if (++i >= argc) {
                std::cerr << "Error: --exclude requires a pattern" << std::endl;
                return 1;
            }
            options.excludes.emplace_back(argv[i]);
        } else if (arg == "--reverse") {
            direction = sync_direction::destination_to_source;
        } else if (arg == "--no-delete") {
            delete_orphans = false;
        } else if (arg == "--dry-run") {
            dry_run = true;
        } else if (arg[0] != '-') {
            roots.push_back(arg);
        }
    }

    if (roots.size() != 2) {
        std::cerr << "Error: both source_dir and destination_dir are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    const sync_location source{backend_id::local(), roots[0]};
    const sync_location destination{backend_id::local(), roots[1]};

    sync_reconciler reconciler(std::make_shared<local_tree_differ>());
    auto summary = reconciler.collect(transfer_id::generate(), source, destination, options,
        [](const sync_event& event) {
            if (const auto* entry = std::get_if<sync_entry>(&event)) {
                if (entry->classification != sync_classification::same) {
                    std::cout << marker(entry->classification) << " "
                              << entry->relative_path << std::endl;
                }
            } else if (const auto* progress = std::get_if<sync_progress>(&event)) {
                std::cout << "  ... " << progress->scanned << " scanned" << std::endl;
            }
        });
    if (!summary) {
        std::cerr << "Comparison failed: " << summary.error().message << std::endl;
        return 1;
    }

    std::cout << summary.value().total << " paths: " << summary.value().new_count << " new, "
              << summary.value().modified << " modified, " << summary.value().deleted
              << " deleted, " << summary.value().same << " same" << std::endl;

    if (!delete_orphans) {
        reconciler.deselect(direction == sync_direction::source_to_destination
                                ? sync_classification::deleted
                                : sync_classification::new_entry);
    }

    auto plan = reconciler.build_plan(direction);
    if (plan.empty()) {
        std::cout << "Already in sync" << std::endl;
        return 0;
    }
    std::cout << "Plan: " << plan.copies.size() << " copies, "
              << plan.deletions.locators.size() << " deletions" << std::endl;
    if (dry_run) {
        for (const auto& copy : plan.copies) {
            std::cout << "  copy   " << copy.sources.front() << " -> " << copy.destination
                      << std::endl;
        }
        for (const auto& locator : plan.deletions.locators) {
            std::cout << "  delete " << locator << std::endl;
        }
        return 0;
    }

    backend_set backends;
    backends.local = std::make_shared<local_filesystem_backend>();
    auto dispatcher = std::make_shared<backend_dispatcher>(backends);

    auto built = transfer_scheduler::builder()
                     .with_dispatcher(dispatcher)
                     .with_thread_pool(adapters::transfer_pool_factory::create())
                     .build();
    if (!built) {
        std::cerr << "Failed to create scheduler: " << built.error().message << std::endl;
        return 1;
    }
    auto scheduler = std::move(built).value();

    auto started = reconciler.execute(plan, scheduler, *dispatcher);
    if (!started) {
        std::cerr << "Sync failed: " << started.error().message << std::endl;
        return 1;
    }

    std::size_t failed = 0;
    for (const auto& id : started.value().enqueued) {
        auto status = scheduler.wait_for(id, std::chrono::hours(1));
        if (!status || status.value() != transfer_status::completed) {
            auto record = scheduler.get(id);
            std::cerr << "Copy failed: "
                      << (record ? record.value().label : id.to_string());
            if (record && record.value().error_message) {
                std::cerr << ": " << *record.value().error_message;
            }
            std::cerr << std::endl;
            ++failed;
        }
    }

    std::cout << "Copied " << started.value().enqueued.size() - failed << ", deleted "
              << started.value().deleted << std::endl;
    return failed == 0 ? 0 : 2;
}
