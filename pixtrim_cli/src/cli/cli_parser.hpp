//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef PIXTRIM_CLI_PARSER_HPP
#define PIXTRIM_CLI_PARSER_HPP

#include "../../../libpixtrim/include/run_config.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::filesystem::path input;
    std::filesystem::path output_path;
    int quality = 85;
    bool lossless = false;
    bool recursive = false;
    std::optional<std::uint32_t> max_size;
    bool backup = false;
    bool keep_metadata = false;
    pixtrim::ZopfliPolicy zopfli = pixtrim::ZopfliPolicy::Budgeted;
    int zopfli_iterations = 15;
    std::uintmax_t zopfli_max_bytes = 4u * 1024u * 1024u;

    unsigned num_threads = 0;
    bool no_parallel = false;

    std::filesystem::path report_path;
    std::string log_level = "WARNING";
    std::filesystem::path log_file;
    bool quiet = false;
    bool strict = false;

    bool update = false;
    std::string release_url;

    /**
     * @brief Build the run configuration for an optimization batch.
     * @throws std::invalid_argument via RunConfig::validate().
     */
    [[nodiscard]] pixtrim::RunConfig to_run_config() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // PIXTRIM_CLI_PARSER_HPP
