//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file jpeg_processor.hpp
 * @brief JPEG optimizer built on libjpeg.
 */

#ifndef PIXTRIM_JPEG_PROCESSOR_HPP
#define PIXTRIM_JPEG_PROCESSOR_HPP

#include "image_format.hpp"
#include "processor.hpp"
#include "resize_calculator.hpp"
#include "run_config.hpp"
#include <string_view>

namespace pixtrim {

    /**
     * @brief Re-encodes JPEG files.
     *
     * @details Three paths, chosen per file:
     * - lossy: decode, resize if needed, re-encode at RunConfig::quality with
     *   optimized Huffman tables (progressive input stays progressive);
     * - lossless without resize: DCT coefficient transcoding, like `jpegtran
     *   -optimize`; no pixel changes, quality is ignored;
     * - lossless with resize: decode, resize, encode at quality 100 with
     *   4:4:4 chroma.
     */
    class JpegProcessor {
    public:
        static constexpr std::string_view name = "JpegProcessor";
        static constexpr ImageFormat format = ImageFormat::Jpeg;

        /**
         * @throws FileError(DecodeError) if the input is not a readable JPEG.
         * @throws FileError(OptimizeError) if encoding fails.
         */
        [[nodiscard]] Bytes optimize(ByteView input, const RunConfig& config) const;

        /**
         * @brief Decode to 8-bit gray or RGB.
         * @throws FileError(DecodeError)
         */
        [[nodiscard]] static RasterImage decode(ByteView input);

        /**
         * @brief Baseline (or progressive) encode of a 1- or 3-channel raster.
         * @param quality libjpeg quality, 1..100.
         * @param progressive Emit a progressive scan script.
         * @throws FileError(OptimizeError)
         */
        [[nodiscard]] static Bytes encode(const RasterImage& image, int quality, bool progressive = false);
    };

} // namespace pixtrim

#endif // PIXTRIM_JPEG_PROCESSOR_HPP
