//
// Created by Giuseppe Francione on 11/10/25.
//

#ifndef PIXTRIM_MIME_DETECTOR_HPP
#define PIXTRIM_MIME_DETECTOR_HPP

#include "image_format.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace pixtrim {

    /**
     * @brief Content sniffing via libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of in-memory content.
         * @return e.g. "image/png", or an empty string if libmagic is unavailable.
         */
        static std::string detect(std::span<const std::uint8_t> data);

        /**
         * @brief Decide the format of a file from its extension and its bytes.
         *
         * The extension decides, unless libmagic recognises the content as a
         * *different* supported image format. Generic answers such as
         * "text/plain" or "application/octet-stream" defer to the extension
         * (SVG without an XML prolog often sniffs as text).
         *
         * @param path Used for the extension and error messages.
         * @param data File content.
         * @throws FileError(FormatMismatch) when content and extension disagree.
         * @throws FileError(DecodeError) when the extension is not supported.
         */
        static ImageFormat resolve(const std::filesystem::path& path, std::span<const std::uint8_t> data);
    };

} // namespace pixtrim

#endif // PIXTRIM_MIME_DETECTOR_HPP
