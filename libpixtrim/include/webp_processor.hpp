//
// Created by Giuseppe Francione on 19/10/25.
//

#ifndef PIXTRIM_WEBP_PROCESSOR_HPP
#define PIXTRIM_WEBP_PROCESSOR_HPP

#include "image_format.hpp"
#include "processor.hpp"
#include "resize_calculator.hpp"
#include "run_config.hpp"
#include <string_view>

namespace pixtrim {

    /**
     * @brief Re-encodes still WebP images with libwebp.
     *
     * Lossy at RunConfig::quality by default, lossless (preset 9) when
     * RunConfig::lossless is set. EXIF, XMP and ICCP chunks are copied over
     * with libwebpmux when metadata is preserved. Animated files are rejected.
     */
    class WebpProcessor {
    public:
        static constexpr std::string_view name = "WebpProcessor";
        static constexpr ImageFormat format = ImageFormat::WebP;

        /**
         * @throws FileError(DecodeError) on unreadable or animated input.
         * @throws FileError(OptimizeError) if the encoder fails.
         */
        [[nodiscard]] Bytes optimize(ByteView input, const RunConfig& config) const;

        // RGBA8
        [[nodiscard]] static RasterImage decode(ByteView input);

        /**
         * @brief Encode an RGBA8 raster.
         * @param quality 1..100, ignored when lossless.
         */
        [[nodiscard]] static Bytes encode(const RasterImage& image, int quality, bool lossless);
    };

} // namespace pixtrim

#endif // PIXTRIM_WEBP_PROCESSOR_HPP
