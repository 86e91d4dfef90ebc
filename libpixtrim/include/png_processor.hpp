//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file png_processor.hpp
 * @brief Lossless PNG optimizer built on libpng, zlib and zopflipng.
 */

#ifndef PIXTRIM_PNG_PROCESSOR_HPP
#define PIXTRIM_PNG_PROCESSOR_HPP

#include "image_format.hpp"
#include "processor.hpp"
#include "resize_calculator.hpp"
#include "run_config.hpp"
#include <string_view>

namespace pixtrim {

    /**
     * @brief Re-encodes PNG files without changing a single pixel (unless resized).
     *
     * @details Pipeline:
     * 1. decode to RGBA8 and resize if RunConfig::max_edge_px asks for it;
     * 2. pick the smallest exact colour model (palette at 1/2/4/8 bits, gray,
     *    gray+alpha, RGB, RGBA);
     * 3. encode every candidate combination of colour model, row filter and
     *    deflate strategy in memory, keep the smallest;
     * 4. optionally hand the winner to zopflipng (see ZopfliPolicy) and keep
     *    its output if smaller.
     *
     * 16-bit images are never narrowed to 8 bits unless a resize was
     * requested; without one they only get the zopflipng pass.
     */
    class PngProcessor {
    public:
        static constexpr std::string_view name = "PngProcessor";
        static constexpr ImageFormat format = ImageFormat::Png;

        /**
         * @throws FileError(DecodeError) if libpng rejects the input.
         * @throws FileError(OptimizeError) if encoding fails.
         */
        [[nodiscard]] Bytes optimize(ByteView input, const RunConfig& config) const;

        /**
         * @brief Decode any PNG to 8-bit RGBA.
         * @throws FileError(DecodeError)
         */
        [[nodiscard]] static RasterImage decode(ByteView input);

        /**
         * @brief Plain encode (no search) of a 1-, 2-, 3- or 4-channel raster.
         * @param compression_level zlib level 0..9.
         * @throws FileError(OptimizeError)
         */
        [[nodiscard]] static Bytes encode(const RasterImage& image, int compression_level = 6);

        /**
         * @brief Run only the zopflipng pass.
         * @return The recompressed file, or the input unchanged if zopflipng failed.
         */
        [[nodiscard]] static Bytes zopfli_pass(ByteView png, int iterations, bool preserve_metadata);
    };

} // namespace pixtrim

#endif // PIXTRIM_PNG_PROCESSOR_HPP
