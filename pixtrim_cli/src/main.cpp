//
// Created by Giuseppe Francione on 18/09/25.
//

#include <algorithm>
#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libpixtrim/include/byte_format.hpp"
#include "../../libpixtrim/include/errors.hpp"
#include "../../libpixtrim/include/event_bus.hpp"
#include "../../libpixtrim/include/events.hpp"
#include "../../libpixtrim/include/exit_status.hpp"
#include "../../libpixtrim/include/logger.hpp"
#include "../../libpixtrim/include/processor_executor.hpp"
#include "../../libpixtrim/include/progress_aggregator.hpp"
#include "../../libpixtrim/include/updater/executable_replacer.hpp"
#include "../../libpixtrim/include/updater/platform_target.hpp"
#include "../../libpixtrim/include/updater/release_source.hpp"
#include "../../libpixtrim/include/updater/self_updater.hpp"

#ifndef PIXTRIM_VERSION
#define PIXTRIM_VERSION "0.0.0"
#endif

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * std::min(progress, 1.0));

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done >= total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace pixtrim;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static std::atomic<ProcessorExecutor*> g_executor{nullptr};

// handle ctrl+c or termination signals; only touches atomics
extern "C" void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (ProcessorExecutor* executor = g_executor.load()) {
            executor->request_stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Debug, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    auto console = std::make_unique<ConsoleLogSink>();
    console->log_level = settings.quiet
        ? LogLevel::Error
        : Logger::string_to_level(settings.log_level).value_or(LogLevel::Warning);
    console->use_colors = is_stderr_a_tty();
    Logger::add_sink(std::move(console));

    if (!settings.log_file.empty()) {
        auto file = std::make_unique<FileLogSink>(settings.log_file);
        if (!file->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(file));
        }
    }
}

static int run_update(const Settings& settings) {
    EventBus bus;
    if (!settings.quiet) {
        bus.subscribe<UpdateStateChangedEvent>([](const UpdateStateChangedEvent& e) {
            switch (e.state) {
                case UpdateState::Checking:
                    std::cerr << CYAN << "Checking for updates..." << RESET << std::endl;
                    break;
                case UpdateState::Comparing:
                    std::cerr << "Latest release: " << e.detail << std::endl;
                    break;
                case UpdateState::Downloading:
                    std::cerr << "Downloading " << e.detail << "..." << std::endl;
                    break;
                case UpdateState::Swapping:
                    std::cerr << "Installing..." << std::endl;
                    break;
                default:
                    break;
            }
        });
    }

    try {
        const fs::path exe = current_executable_path();
        HttpReleaseSource source(settings.release_url, std::string("pixtrim/") + PIXTRIM_VERSION);
        RenameExecutableReplacer replacer;
        SelfUpdater updater(Version::parse(PIXTRIM_VERSION), platform_target(), exe, source, replacer, bus);

        const UpdateOutcome outcome = updater.run();
        if (outcome.result == UpdateResult::UpToDate) {
            std::cerr << GREEN << "pixtrim " << outcome.current.to_string()
                      << " is already the latest version." << RESET << std::endl;
        } else {
            std::cerr << GREEN << "Updated pixtrim " << outcome.current.to_string()
                      << " -> " << outcome.latest.to_string() << RESET << std::endl;
        }
        return kExitOk;
    } catch (const UpdateError& e) {
        std::cerr << RED << "Update failed (" << to_string(e.kind()) << "): " << e.what() << RESET << std::endl;
        return kExitFatal;
    }
}

static int run_batch(const Settings& settings) {
    std::shared_ptr<const RunConfig> config;
    try {
        config = std::make_shared<const RunConfig>(settings.to_run_config());
    } catch (const std::invalid_argument& e) {
        std::cerr << RED << "Invalid configuration: " << e.what() << RESET << std::endl;
        return kExitFatal;
    }

    EventBus bus;
    ProgressAggregator aggregator(bus);

    std::mutex print_mtx;
    std::atomic<size_t> queued{0};
    const auto start_total = std::chrono::steady_clock::now();

    bus.subscribe<FileQueuedEvent>([&](const FileQueuedEvent& e) {
        queued.store(e.queued_so_far);
    });

    bus.subscribe<ScanWarningEvent>([&](const ScanWarningEvent& e) {
        if (settings.quiet) return;
        std::lock_guard lock(print_mtx);
        std::cerr << YELLOW << "\n[SCAN] " << e.path.string() << ": " << e.message << RESET << std::endl;
    });

    bus.subscribe<OutcomeRecordedEvent>([&](const OutcomeRecordedEvent& e) {
        if (settings.quiet) return;
        const auto& o = e.outcome;
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();

        std::lock_guard lock(print_mtx);
        switch (o.status) {
            case OutcomeStatus::Optimized:
                std::cerr << GREEN << "\r[DONE] " << o.source_path.filename().string()
                          << " (" << format_bytes(o.original_size) << " -> " << format_bytes(o.optimized_size)
                          << ", -" << std::fixed << std::setprecision(1) << o.saved_percent() << "%)";
                break;
            case OutcomeStatus::Skipped:
                std::cerr << YELLOW << "\r[SKIP] " << o.source_path.filename().string()
                          << " (" << format_bytes(o.original_size) << ", " << o.skip_reason << ")";
                break;
            case OutcomeStatus::Failed:
                std::cerr << RED << "\r[FAIL] " << o.source_path.filename().string()
                          << " (" << (o.error_kind ? to_string(*o.error_kind) : "Error") << ")";
                break;
        }
        std::cerr << RESET << "\033[K" << std::endl;
        print_progress_bar(e.snapshot.processed, std::max(queued.load(), e.snapshot.processed), elapsed);
    });

    RunSummary summary;
    try {
        ProcessorExecutor executor(config, aggregator, bus);
        g_executor.store(&executor);
        if (interrupted.load()) {
            executor.request_stop();
        }
        summary = executor.run();
        g_executor.store(nullptr);

        if (!settings.quiet) {
            std::cerr << std::endl;
            print_console_report(summary, executor.worker_count());
        }
    } catch (const ScanError& e) {
        g_executor.store(nullptr);
        std::cerr << RED << "\nError: " << e.what() << RESET << std::endl;
        return kExitFatal;
    }

    if (!settings.report_path.empty()) {
        export_csv_report(summary, settings.report_path);
    }

    if (summary.cancelled) {
        std::cerr << CYAN << "[INTERRUPT] Stopped before all files were processed." << RESET << std::endl;
    }
    return exit_status(summary, settings.strict);
}

int main(int argc, char* argv[]) {

    CLI::App app{"pixtrim: batch image optimizer for JPEG, PNG, WebP and SVG."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        app.exit(e);
        return kExitFatal;
    }

    setup_logging(settings);
    init_utf8_locale();

    try {
        cleanup_stale_executables(current_executable_path());
    } catch (const UpdateError& e) {
        Logger::log(LogLevel::Debug, std::string("Skipping stale executable cleanup: ") + e.what(), "main");
    }

    if (settings.update) {
        return run_update(settings);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    return run_batch(settings);
}
