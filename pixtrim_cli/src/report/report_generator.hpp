//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef PIXTRIM_REPORT_GENERATOR_HPP
#define PIXTRIM_REPORT_GENERATOR_HPP

#include "../../../libpixtrim/include/outcome.hpp"
#include <filesystem>
#include <ostream>
#include <string>

/**
 * @brief Print the per-file table and the totals to stderr.
 */
void print_console_report(const pixtrim::RunSummary& summary, unsigned num_threads);

/**
 * @brief Write every outcome of the run as CSV.
 * @return False (after logging) if the file cannot be written.
 */
bool export_csv_report(const pixtrim::RunSummary& summary, const std::filesystem::path& output_path);

/// CSV body for `summary`, header line included.
void write_csv(const pixtrim::RunSummary& summary, std::ostream& out);

std::string csv_escape(const std::string& data);

unsigned get_terminal_width();

bool is_stderr_a_tty();

#endif // PIXTRIM_REPORT_GENERATOR_HPP
