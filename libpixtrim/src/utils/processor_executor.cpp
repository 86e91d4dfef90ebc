//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/processor_executor.hpp"
#include "../../include/backup_manager.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_scanner.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/processor_registry.hpp"
#include <chrono>
#include <exception>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace pixtrim {

    namespace {
        // error messages that already name the file are kept as they are
        std::string failure_detail(const fs::path& source, const std::string_view what) {
            const std::string path = source.string();
            if (what.find(path) != std::string_view::npos) {
                return std::string(what);
            }
            return path + ": " + std::string(what);
        }
    }

    ProcessorExecutor::ProcessorExecutor(std::shared_ptr<const RunConfig> config,
                                         ProgressAggregator& aggregator,
                                         EventBus& bus)
        : config_(std::move(config)),
          aggregator_(aggregator),
          event_bus_(bus),
          router_(config_->input_root, config_->output_root),
          pool_(config_->threads) {
        Logger::log(LogLevel::Debug, "Executor ready with " + std::to_string(pool_.size()) + " workers", "executor");
    }

    bool ProcessorExecutor::inside_output_root(const fs::path& p) const {
        if (!config_->output_root) return false;
        const auto rel = p.lexically_normal().lexically_relative(config_->output_root->lexically_normal());
        return !rel.empty() && *rel.begin() != "..";
    }

    RunSummary ProcessorExecutor::run() {
        const ImageScanner scanner(config_->input_root, config_->recursive,
                                   [this](const fs::path& path, const std::string& message) {
                                       event_bus_.publish(ScanWarningEvent{path, message});
                                   });

        std::size_t queued = 0;
        bool scan_stopped = false;
        for (const auto& image : scanner) {
            if (is_stopped()) {
                scan_stopped = true;
                break;
            }
            if (inside_output_root(image.path)) {
                Logger::log(LogLevel::Debug, "Ignoring file inside the output tree: " + image.path.string(), "executor");
                continue;
            }

            ImageTask task{image.path, image.format, config_};
            ++queued;
            event_bus_.publish(FileQueuedEvent{task.source_path, queued});

            try {
                pool_.enqueue([this, task](const std::stop_token& st) {
                    if (st.stop_requested() || is_stopped()) {
                        aggregator_.record(interrupted(task));
                        return;
                    }
                    aggregator_.record(process(task));
                });
            } catch (const std::runtime_error&) {
                // pool already closed
                aggregator_.record(interrupted(task));
            }
        }

        Logger::log(LogLevel::Info, "Scan finished: " + std::to_string(queued) + " images queued", "executor");
        event_bus_.publish(ScanCompleteEvent{queued, scan_stopped});

        if (is_stopped()) {
            pool_.request_stop();
        }
        pool_.wait_idle();

        if (is_stopped()) {
            Logger::log(LogLevel::Warning, "Run interrupted", "executor");
            aggregator_.mark_cancelled();
        }
        return aggregator_.summary();
    }

    OptimizationOutcome ProcessorExecutor::interrupted(const ImageTask& task) const {
        OptimizationOutcome out;
        out.source_path = task.source_path;
        out.destination_path = task.source_path;
        out.format = task.detected_format;
        std::error_code ec;
        const auto size = fs::file_size(task.source_path, ec);
        out.original_size = ec ? 0 : size;
        out.optimized_size = out.original_size;
        out.status = OutcomeStatus::Skipped;
        out.skip_reason = "Interrupted";
        return out;
    }

    void ProcessorExecutor::keep_original(OptimizationOutcome& outcome,
                                          const ByteView input,
                                          const std::string& reason) const {
        outcome.status = OutcomeStatus::Skipped;
        outcome.skip_reason = reason;
        outcome.optimized_size = outcome.original_size;
        if (!router_.in_place()) {
            // mirrored output stays complete
            router_.prepare(outcome.destination_path);
            write_file_atomic(outcome.destination_path, input);
        }
    }

    OptimizationOutcome ProcessorExecutor::process(const ImageTask& task) const {
        const auto start = std::chrono::steady_clock::now();
        const RunConfig& cfg = *task.config;

        OptimizationOutcome out;
        out.source_path = task.source_path;
        out.destination_path = task.source_path;
        out.format = task.detected_format;

        event_bus_.publish(FileProcessStartEvent{task.source_path});

        try {
            const Bytes input = read_file(task.source_path);
            out.original_size = input.size();
            out.optimized_size = input.size();
            out.destination_path = router_.destination_for(task.source_path);

            if (input.size() < minimal_encoded_size(task.detected_format)) {
                keep_original(out, input, "Already minimal");
            } else {
                out.format = MimeDetector::resolve(task.source_path, input);
                const Bytes optimized = optimize_with(out.format, input, cfg);

                if (optimized.empty() || optimized.size() >= input.size()) {
                    keep_original(out, input, "No smaller encoding found");
                } else {
                    router_.prepare(out.destination_path);
                    if (cfg.backup && router_.in_place()) {
                        create_backup(out.destination_path, input);
                    }
                    write_file_atomic(out.destination_path, optimized);
                    out.optimized_size = optimized.size();
                    out.status = OutcomeStatus::Optimized;
                }
            }
        } catch (const FileError& e) {
            out.status = OutcomeStatus::Failed;
            out.error_kind = e.kind();
            out.error_detail = failure_detail(task.source_path, e.what());
            out.optimized_size = out.original_size;
        } catch (const std::exception& e) {
            out.status = OutcomeStatus::Failed;
            out.error_kind = FileErrorKind::OptimizeError;
            out.error_detail = failure_detail(task.source_path, e.what());
            out.optimized_size = out.original_size;
        }

        out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        switch (out.status) {
            case OutcomeStatus::Optimized:
                Logger::log(LogLevel::Info,
                            "Optimized " + task.source_path.string() + ": " + std::to_string(out.original_size)
                            + " -> " + std::to_string(out.optimized_size) + " bytes",
                            "executor");
                break;
            case OutcomeStatus::Skipped:
                Logger::log(LogLevel::Debug, "Skipped " + task.source_path.string() + ": " + out.skip_reason,
                            "executor");
                break;
            case OutcomeStatus::Failed:
                Logger::log(LogLevel::Error,
                            std::string(to_string(*out.error_kind)) + " " + out.error_detail, "executor");
                break;
        }
        return out;
    }

} // namespace pixtrim
