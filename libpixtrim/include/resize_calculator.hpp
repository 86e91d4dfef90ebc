//
// Created by Giuseppe Francione on 03/12/25.
//

/**
 * @file resize_calculator.hpp
 * @brief Target-size computation and box-filter downscaling for decoded rasters.
 */

#ifndef PIXTRIM_RESIZE_CALCULATOR_HPP
#define PIXTRIM_RESIZE_CALCULATOR_HPP

#include <cstdint>
#include <optional>
#include <vector>

namespace pixtrim {

/**
 * @brief Interleaved 8-bit pixels, row-major, no padding between rows.
 */
struct RasterImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint8_t channels = 0; ///< 1 (gray), 3 (RGB) or 4 (RGBA)
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] std::size_t row_bytes() const noexcept {
        return static_cast<std::size_t>(width) * channels;
    }
};

struct Dimensions {
    std::uint32_t width = 0;
    std::uint32_t height = 0;

    bool operator==(const Dimensions&) const = default;
};

/**
 * @brief Fit (w, h) inside a square of side `max_edge`.
 *
 * Never upscales: returns (w, h) unchanged when `max_edge` is unset or
 * the long edge already fits. Otherwise both sides are scaled by
 * `max_edge / max(w, h)` and rounded to nearest, clamped to at least 1;
 * the long edge comes out exactly `max_edge`.
 */
[[nodiscard]] Dimensions target_dimensions(std::uint32_t width,
                                           std::uint32_t height,
                                           std::optional<std::uint32_t> max_edge) noexcept;

/**
 * @brief Area-average downscale to exactly (width, height).
 *
 * Each destination pixel is the rounded mean of the source pixels its box
 * covers. Intended for shrinking; requesting a larger size just repeats
 * source pixels.
 */
[[nodiscard]] RasterImage resample_box(const RasterImage& src, std::uint32_t width, std::uint32_t height);

/**
 * @brief Apply target_dimensions() to an image, resampling only when needed.
 * @return The input unchanged (moved) or the downscaled copy.
 */
[[nodiscard]] RasterImage resize_to_fit(RasterImage src, std::optional<std::uint32_t> max_edge);

} // namespace pixtrim

#endif // PIXTRIM_RESIZE_CALCULATOR_HPP
