//
// Created by Giuseppe Francione on 20/09/25.
//

#include "cli_parser.hpp"
#include "../../../libpixtrim/include/updater/release_source.hpp"
#include <CLI/CLI.hpp>
#include <map>
#include <vector>

#ifndef PIXTRIM_VERSION
#define PIXTRIM_VERSION "0.0.0"
#endif

pixtrim::RunConfig Settings::to_run_config() const {
    pixtrim::RunConfig cfg;
    cfg.input_root = input;
    if (!output_path.empty()) {
        cfg.output_root = output_path;
    }
    cfg.quality = quality;
    cfg.lossless = lossless;
    cfg.recursive = recursive;
    cfg.max_edge_px = max_size;
    cfg.backup = backup;
    cfg.preserve_metadata = keep_metadata;
    cfg.png_zopfli = zopfli;
    cfg.zopfli_iterations = zopfli_iterations;
    cfg.zopfli_max_bytes = zopfli_max_bytes;
    cfg.threads = no_parallel ? 1u : num_threads;
    cfg.validate();
    return cfg;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", PIXTRIM_VERSION);

    // --- Run options ---
    std::vector<CLI::Option*> run_options;

    run_options.push_back(app.add_option("-o,--output", settings.output_path,
                   "Write optimized files under DIR, mirroring the input tree, instead of in place."));

    run_options.push_back(app.add_option("-q,--quality", settings.quality,
                   "Lossy quality for JPEG and WebP (1-100).")
                   ->default_val(85)
                   ->check(CLI::Range(1, 100)));

    run_options.push_back(app.add_flag("--lossless", settings.lossless,
                 "Never lose pixel data: JPEG coefficient transcoding, lossless WebP."));

    run_options.push_back(app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders."));

    run_options.push_back(app.add_option("--max-size", settings.max_size,
                   "Downscale raster images so their longest edge is at most PX pixels.")
                   ->check(CLI::PositiveNumber));

    run_options.push_back(app.add_flag("--backup", settings.backup,
                 "Keep the original of every rewritten file as <file>.bak."));

    run_options.push_back(app.add_flag("--keep-metadata", settings.keep_metadata,
                 "Carry EXIF/XMP/ICC and text metadata over to the optimized files."));

    run_options.push_back(app.add_option("--zopfli", settings.zopfli,
                   "PNG zopfli pass: 'never', 'auto' (inputs up to --zopfli-max-bytes) or 'always'.")
        ->default_val(pixtrim::ZopfliPolicy::Budgeted)
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, pixtrim::ZopfliPolicy>{
                {"never", pixtrim::ZopfliPolicy::Never},
                {"auto", pixtrim::ZopfliPolicy::Budgeted},
                {"always", pixtrim::ZopfliPolicy::Always}
            }, CLI::ignore_case)));

    run_options.push_back(app.add_option("--zopfli-iterations", settings.zopfli_iterations,
                   "Zopfli iterations per PNG.")
                   ->default_val(15)
                   ->check(CLI::PositiveNumber));

    run_options.push_back(app.add_option("--zopfli-max-bytes", settings.zopfli_max_bytes,
                   "Largest PNG (in bytes) that gets the zopfli pass in 'auto' mode.")
                   ->default_val(settings.zopfli_max_bytes));

    auto* threads = app.add_option("--threads", settings.num_threads,
                   "Worker threads (default: one per hardware thread).")
                   ->check(CLI::PositiveNumber);
    run_options.push_back(threads);

    auto* no_parallel = app.add_flag("--no-parallel", settings.no_parallel,
                 "Process files one at a time.");
    run_options.push_back(no_parallel);
    no_parallel->excludes(threads);

    run_options.push_back(app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last());

    run_options.push_back(app.add_flag("--strict", settings.strict,
                 "Exit with status 2 if any file failed."));

    // --- Shared options ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("WARNING")
                   ->check(CLI::IsMember({"ERROR", "WARN", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to FILE.");

    app.add_flag("--quiet", settings.quiet,
                 "Suppress non-error console output (progress, summary).");

    // --- Self-update ---
    auto* update = app.add_flag("--update", settings.update,
                 "Replace this executable with the latest release and exit.");

    auto* release_url = app.add_option("--release-url", settings.release_url,
                   "Release API endpoint used by --update.")
                   ->default_val(std::string(pixtrim::kDefaultReleaseUrl));
    release_url->needs(update);

    // --- Positional Arguments ---
    auto* input = app.add_option("input", settings.input, "Image file or directory to optimize.")
        ->check(CLI::ExistingPath);
    run_options.push_back(input);

    for (auto* opt : run_options) {
        update->excludes(opt);
    }

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (!settings.update && settings.input.empty()) {
            throw CLI::ValidationError("INPUT is required unless --update is given.");
        }
        if (!settings.output_path.empty() && !settings.input.empty()) {
            std::error_code ec;
            if (std::filesystem::exists(settings.output_path, ec) &&
                std::filesystem::equivalent(settings.output_path, settings.input, ec)) {
                throw CLI::ValidationError("Output directory must differ from the input; omit -o to optimize in place.");
            }
        }
    });
}
