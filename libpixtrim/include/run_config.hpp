//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file run_config.hpp
 * @brief Immutable settings for one optimization run.
 */

#ifndef PIXTRIM_RUN_CONFIG_HPP
#define PIXTRIM_RUN_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace pixtrim {

/**
 * @brief When to run the slow zopflipng pass after the zlib filter search.
 */
enum class ZopfliPolicy {
    Never,    ///< zlib search only
    Budgeted, ///< only for inputs up to RunConfig::zopfli_max_bytes
    Always    ///< every PNG, regardless of size
};

std::string to_string(ZopfliPolicy policy);

/**
 * @brief Settings shared read-only by every worker for a whole run.
 *
 * Built once by the CLI, checked with validate(), then handed to the
 * executor behind a `shared_ptr<const RunConfig>`.
 */
struct RunConfig {
    std::filesystem::path input_root;
    std::optional<std::filesystem::path> output_root; ///< Unset: optimize in place
    int quality = 85;                                 ///< 1..100, lossy JPEG/WebP only
    bool lossless = false;
    bool recursive = false;
    std::optional<std::uint32_t> max_edge_px;         ///< Longest edge cap for raster images
    bool backup = false;
    bool preserve_metadata = false;
    ZopfliPolicy png_zopfli = ZopfliPolicy::Budgeted;
    int zopfli_iterations = 15;
    std::uintmax_t zopfli_max_bytes = 4u * 1024u * 1024u;
    unsigned threads = 0;                             ///< 0: one per hardware thread

    /**
     * @brief Check value ranges.
     * @throws std::invalid_argument naming the first offending field.
     * @note Existence of input_root is checked by the scanner, which
     * raises ScanError.
     */
    void validate() const;

    [[nodiscard]] bool in_place() const noexcept { return !output_root.has_value(); }
};

} // namespace pixtrim

#endif // PIXTRIM_RUN_CONFIG_HPP
