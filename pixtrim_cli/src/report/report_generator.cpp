//
// Created by Giuseppe Francione on 20/09/25.
//

#include "report_generator.hpp"
#include "../../../libpixtrim/include/byte_format.hpp"
#include "../../../libpixtrim/include/logger.hpp"
#include "../utils/color.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

using namespace pixtrim;

bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

namespace {

    std::string fixed2(const double v) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << v;
        return oss.str();
    }

    std::string detail_of(const OptimizationOutcome& o) {
        switch (o.status) {
            case OutcomeStatus::Optimized: return "";
            case OutcomeStatus::Skipped:   return o.skip_reason;
            case OutcomeStatus::Failed:
                return std::string(o.error_kind ? to_string(*o.error_kind) : "Error") + ": " + o.error_detail;
        }
        return "";
    }

    const char* color_of(const OutcomeStatus status) {
        switch (status) {
            case OutcomeStatus::Optimized: return GREEN;
            case OutcomeStatus::Skipped:   return YELLOW;
            case OutcomeStatus::Failed:    return RED;
        }
        return RESET;
    }

} // namespace

void print_console_report(const RunSummary& summary, const unsigned num_threads) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    constexpr size_t fmt_w = 6;
    constexpr size_t size_w = 11;
    constexpr size_t delta_w = 9;
    constexpr size_t time_w = 9;
    constexpr size_t result_w = 11;
    constexpr size_t fixed_cols = fmt_w + 2 * size_w + delta_w + time_w + result_w;

    const size_t file_w = term_width > fixed_cols + 30 ? std::min<size_t>(term_width - fixed_cols - 20, 60) : 20;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_w)) << "File"
              << std::setw(fmt_w) << "Type"
              << std::setw(size_w) << "Before"
              << std::setw(size_w) << "After"
              << std::setw(delta_w) << "Saved(%)"
              << std::setw(time_w) << "Time(s)"
              << std::setw(result_w) << "Result"
              << "Detail\n";

    auto sorted = summary.outcomes;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.source_path < b.source_path;
    });

    for (const auto& o : sorted) {
        const std::string delta = o.status == OutcomeStatus::Optimized ? fixed2(o.saved_percent()) + "%" : "-";
        const std::string after = o.status == OutcomeStatus::Failed ? "-" : format_bytes(o.optimized_size);
        std::cerr << std::left << std::setw(static_cast<int>(file_w))
                  << truncate(o.source_path.filename().string(), file_w - 1)
                  << std::setw(fmt_w) << to_string(o.format)
                  << std::setw(size_w) << format_bytes(o.original_size)
                  << std::setw(size_w) << after
                  << std::setw(delta_w) << delta
                  << std::setw(time_w) << fixed2(static_cast<double>(o.duration.count()) / 1000.0);
        if (use_colors) std::cerr << color_of(o.status);
        std::cerr << std::setw(result_w) << to_string(o.status);
        if (use_colors) std::cerr << RESET;
        std::cerr << detail_of(o) << "\n";
    }

    std::cerr << "\nFiles: " << summary.processed
              << " (" << summary.succeeded << " optimized, "
              << summary.skipped << " skipped, "
              << summary.failed << " failed)\n";
    std::cerr << "Total saved space: " << format_bytes(summary.saved_bytes())
              << " of " << format_bytes(summary.original_bytes) << "\n";
    if (summary.original_bytes > 0) {
        std::cerr << "Total reduction: " << fixed2(summary.saved_percent()) << "%\n";
    }
    std::cerr << "Total time: " << fixed2(static_cast<double>(summary.elapsed.count()) / 1000.0)
              << " s (" << num_threads << " thread" << (num_threads > 1U ? "s" : "") << ")\n";
    if (summary.cancelled) {
        std::cerr << (use_colors ? YELLOW : "") << "Run was interrupted." << (use_colors ? RESET : "") << "\n";
    }
}

void write_csv(const RunSummary& summary, std::ostream& out) {
    out << "File,Destination,Format,Before(bytes),After(bytes),Saved(%),Time(s),Result,Detail\n";
    for (const auto& o : summary.outcomes) {
        out << csv_escape(o.source_path.string()) << ","
            << csv_escape(o.destination_path.string()) << ","
            << to_string(o.format) << ","
            << o.original_size << ","
            << (o.status == OutcomeStatus::Failed ? o.original_size : o.optimized_size) << ","
            << fixed2(o.saved_percent()) << ","
            << fixed2(static_cast<double>(o.duration.count()) / 1000.0) << ","
            << to_string(o.status) << ","
            << csv_escape(detail_of(o)) << "\n";
    }
}

bool export_csv_report(const RunSummary& summary, const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write report: " + output_path.string(), "report");
        return false;
    }
    write_csv(summary, out);
    out << "\n\nTotal before(bytes),Total after(bytes),Saved(%),Time(s),Interrupted\n";
    out << summary.original_bytes << "," << summary.optimized_bytes << ","
        << fixed2(summary.saved_percent()) << ","
        << fixed2(static_cast<double>(summary.elapsed.count()) / 1000.0) << ","
        << (summary.cancelled ? "yes" : "no") << "\n";
    out.flush();
    if (!out) {
        Logger::log(LogLevel::Error, "Write error on report: " + output_path.string(), "report");
        return false;
    }
    Logger::log(LogLevel::Info, "Report written to " + output_path.string(), "report");
    return true;
}
