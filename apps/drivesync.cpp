#include "dsync/config/config.hpp"
#include "dsync/events/components.hpp"
#include "dsync/events/event_bus.hpp"
#include "dsync/metadata/database.hpp"
#include "dsync/metadata/error_log.hpp"
#include "dsync/metadata/progress_store.hpp"
#include "dsync/metadata/task_store.hpp"
#include "dsync/remote/credentials.hpp"
#include "dsync/remote/http_drive_client.hpp"
#include "dsync/sync/control.hpp"
#include "dsync/sync/engine.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using dsync::ErrorKind;
using dsync::config::AppConfig;
using dsync::metadata::Database;
using dsync::metadata::SyncTask;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] <command> [task]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config PATH   Configuration file (default: drivesync.json)\n";
    std::cout << "  -v, --verbose       Debug logging\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  import              Store the tasks of the configuration file\n";
    std::cout << "  tasks               List stored tasks\n";
    std::cout << "  sync <task>         Download everything new or changed\n";
    std::cout << "  status <task>       Transfer progress counts\n";
    std::cout << "  errors <task>       Most recent transfer errors\n";
    std::cout << "  remove <task>       Delete a task with its progress and error history\n";
}

struct CommandLine {
    std::string config_path = "drivesync.json";
    bool verbose = false;
    std::string command;
    std::string task;
};

std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", arg);
                return std::nullopt;
            }
            cli.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            cli.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        spdlog::error("Missing command");
        return std::nullopt;
    }
    cli.command = positional[0];

    const bool needs_task = cli.command == "sync" || cli.command == "status" ||
                            cli.command == "errors" || cli.command == "remove";
    const bool known = needs_task || cli.command == "import" || cli.command == "tasks";
    if (!known) {
        spdlog::error("Unknown command: {}", cli.command);
        return std::nullopt;
    }
    if (needs_task != (positional.size() == 2) || positional.size() > 2) {
        spdlog::error("'{}' expects {}", cli.command, needs_task ? "exactly one task name" : "no arguments");
        return std::nullopt;
    }
    if (needs_task) {
        cli.task = positional[1];
    }
    return cli;
}

void configure_logging(const AppConfig& config, bool verbose) {
    auto level = spdlog::level::from_str(config.logging.level);
    if (verbose) {
        level = spdlog::level::debug;
    }
    spdlog::set_level(level);

    if (!config.logging.file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logging.file);
            spdlog::default_logger()->sinks().push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Could not open log file {}: {}", config.logging.file, e.what());
        }
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

int report_error(const dsync::Error& error) {
    spdlog::error("{}", dsync::describe(error));
    return kExitFailure;
}

std::optional<SyncTask> lookup_task(dsync::metadata::TaskStore& tasks, const std::string& name) {
    auto found = tasks.find_by_name(name);
    if (found.is_error()) {
        report_error(found.error());
        return std::nullopt;
    }
    if (!found.value()) {
        spdlog::error("Unknown task '{}' (run 'import' first?)", name);
        return std::nullopt;
    }
    return *found.value();
}

int run_import(const AppConfig& config, Database& db) {
    dsync::metadata::TaskStore tasks(db);
    for (const auto& task : config.tasks) {
        auto stored = tasks.upsert_by_name(task);
        if (stored.is_error()) {
            return report_error(stored.error());
        }
        std::cout << "imported " << stored.value().name << " (id " << stored.value().id << ")\n";
    }
    return kExitOk;
}

int run_tasks(Database& db) {
    dsync::metadata::TaskStore tasks(db);
    auto listed = tasks.list();
    if (listed.is_error()) {
        return report_error(listed.error());
    }
    for (const auto& task : listed.value()) {
        std::cout << task.id << "\t" << task.name << "\t" << task.remote_root_id << " -> " << task.local_root
                  << "\tconcurrency=" << task.concurrency << " retries=" << task.retry_count;
        if (task.bandwidth_limit_kbps > 0) {
            std::cout << " limit=" << task.bandwidth_limit_kbps << "KiB/s";
        }
        std::cout << "\n";
    }
    return kExitOk;
}

int run_status(Database& db, const std::string& name) {
    dsync::metadata::TaskStore tasks(db);
    auto task = lookup_task(tasks, name);
    if (!task) {
        return kExitFailure;
    }
    dsync::metadata::ProgressStore progress(db);
    auto stats = progress.stats(task->id);
    if (stats.is_error()) {
        return report_error(stats.error());
    }
    const auto& s = stats.value();
    std::cout << task->name << ": total=" << s.total << " completed=" << s.completed
              << " failed=" << s.failed << " pending=" << s.pending << "\n";
    return kExitOk;
}

int run_errors(Database& db, const std::string& name) {
    dsync::metadata::TaskStore tasks(db);
    auto task = lookup_task(tasks, name);
    if (!task) {
        return kExitFailure;
    }
    dsync::metadata::ErrorLog errors(db);
    auto entries = errors.list_by_task(task->id, 50);
    if (entries.is_error()) {
        return report_error(entries.error());
    }
    for (const auto& entry : entries.value()) {
        std::cout << entry.timestamp << "\t" << entry.kind << "\t" << entry.file_path
                  << "\t" << entry.message << "\n";
    }
    return kExitOk;
}

int run_remove(Database& db, const std::string& name) {
    dsync::metadata::TaskStore tasks(db);
    auto task = lookup_task(tasks, name);
    if (!task) {
        return kExitFailure;
    }
    auto removed = tasks.remove(task->id);
    if (removed.is_error()) {
        return report_error(removed.error());
    }
    std::cout << "removed " << task->name << "\n";
    return kExitOk;
}

int run_sync(const AppConfig& config, Database& db, const std::string& name) {
    // A task present in the config file is refreshed before the run
    for (const auto& task : config.tasks) {
        if (task.name == name) {
            dsync::metadata::TaskStore tasks(db);
            auto stored = tasks.upsert_by_name(task);
            if (stored.is_error()) {
                return report_error(stored.error());
            }
        }
    }

    dsync::remote::FileTokenProvider tokens(config.token_file);
    dsync::remote::HttpDriveClient::Options client_options;
    client_options.api_base_url = config.api_base_url;
    dsync::remote::HttpDriveClient drive(client_options, tokens);

    dsync::events::EventBus bus;
    dsync::events::LoggerComponent logger(bus);
    dsync::events::MetricsComponent metrics(bus);

    dsync::sync::EngineOptions options;
    options.chunk_size = config.chunk_size;
    options.progress_interval = config.progress_interval;
    dsync::sync::SyncEngine engine(drive, tokens, db, bus, options);

    dsync::sync::TransferControl control(config.pause_poll);

    // Signals are handled on their own thread: cancel() takes a lock.
    // First signal: no new files, running ones finish. Second: abort them.
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    std::function<void(const boost::system::error_code&, int)> on_signal;
    on_signal = [&control, &signals, &on_signal](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        if (!control.is_cancelled()) {
            spdlog::warn("Signal {} received, finishing in-flight files (repeat to abort them)", signal_number);
            control.cancel();
            signals.async_wait(on_signal);
        } else {
            spdlog::warn("Signal {} received, aborting in-flight files at the next chunk", signal_number);
            control.abort();
        }
    };
    signals.async_wait(on_signal);
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    auto report = engine.sync(name, control);

    signal_context.stop();
    signal_thread.join();

    if (report.is_error()) {
        return report_error(report.error());
    }

    const auto& r = report.value();
    std::cout << r.task_name << ": scanned=" << r.scanned << " filtered_out=" << r.filtered_out
              << " up_to_date=" << r.skipped_by_diff << " to_download=" << r.to_download << "\n";
    std::cout << "  success=" << r.stats.success << " failed=" << r.stats.failed
              << " skipped=" << r.stats.skipped << " cancelled=" << r.stats.cancelled
              << " not_started=" << r.stats.not_started << " (" << r.duration.count() << "ms)\n";
    if (r.cancelled) {
        std::cout << "  run cancelled; partial files resume on the next sync\n";
    }
    metrics.print_stats();
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return kExitOk;
        }
    }

    auto cli = parse_command_line(argc, argv);
    if (!cli) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    auto loaded = dsync::config::load_config(cli->config_path);
    if (loaded.is_error()) {
        return report_error(loaded.error());
    }
    const AppConfig& config = loaded.value();
    configure_logging(config, cli->verbose);

    auto opened = Database::open(config.database);
    if (opened.is_error()) {
        return report_error(opened.error());
    }
    auto& db = *opened.value();
    spdlog::debug("Using database {}", config.database);

    if (cli->command == "import") {
        return run_import(config, db);
    }
    if (cli->command == "tasks") {
        return run_tasks(db);
    }
    if (cli->command == "status") {
        return run_status(db, cli->task);
    }
    if (cli->command == "errors") {
        return run_errors(db, cli->task);
    }
    if (cli->command == "remove") {
        return run_remove(db, cli->task);
    }
    return run_sync(config, db, cli->task);
}
