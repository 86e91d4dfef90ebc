//
// Created by Giuseppe Francione on 18/09/25.
//

/**
 * @file image_format.hpp
 * @brief The closed set of image formats pixtrim optimizes, with
 * conversions from extensions and MIME types.
 */

#ifndef PIXTRIM_IMAGE_FORMAT_HPP
#define PIXTRIM_IMAGE_FORMAT_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pixtrim {

enum class ImageFormat {
    Jpeg,
    Png,
    WebP,
    Svg
};

///< MIME types reported by libmagic for the supported formats.
inline const std::unordered_map<std::string, ImageFormat> mime_to_format = {
    { "image/jpeg",    ImageFormat::Jpeg },
    { "image/pjpeg",   ImageFormat::Jpeg },
    { "image/png",     ImageFormat::Png },
    { "image/webp",    ImageFormat::WebP },
    { "image/x-webp",  ImageFormat::WebP },
    { "image/svg+xml", ImageFormat::Svg },
    { "image/svg",     ImageFormat::Svg },
};

inline std::string to_string(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Png:  return "png";
        case ImageFormat::WebP: return "webp";
        case ImageFormat::Svg:  return "svg";
    }
    return "unknown";
}

inline std::string_view mime_type_of(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Jpeg: return "image/jpeg";
        case ImageFormat::Png:  return "image/png";
        case ImageFormat::WebP: return "image/webp";
        case ImageFormat::Svg:  return "image/svg+xml";
    }
    return "application/octet-stream";
}

/**
 * @brief Parses a file extension into an ImageFormat.
 *
 * Case-insensitive, with or without the leading dot ("JPG", ".jpeg", "Png").
 * @return The format, or std::nullopt when the extension is not supported.
 */
inline std::optional<ImageFormat> format_from_extension(std::string ext) {
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::ranges::transform(ext, ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "jpg" || ext == "jpeg") return ImageFormat::Jpeg;
    if (ext == "png")  return ImageFormat::Png;
    if (ext == "webp") return ImageFormat::WebP;
    if (ext == "svg")  return ImageFormat::Svg;
    return std::nullopt;
}

inline std::optional<ImageFormat> format_from_mime(const std::string& mime) {
    const auto it = mime_to_format.find(mime);
    if (it == mime_to_format.end()) return std::nullopt;
    return it->second;
}

/// @return True for the pixel formats that can be decoded and resized.
inline bool is_raster(const ImageFormat fmt) {
    return fmt != ImageFormat::Svg;
}

/**
 * @brief Size of the smallest well-formed file of a format.
 *
 * Inputs below this cannot be a complete image and cannot get any
 * smaller, so they are skipped before decoding. SVG has no meaningful
 * floor and returns 0.
 */
inline std::size_t minimal_encoded_size(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Png:  return 67;   // signature + IHDR + 1x1 IDAT + IEND
        case ImageFormat::Jpeg: return 125;  // SOI, DQT, SOF0, DHT, SOS, EOI for 1x1
        case ImageFormat::WebP: return 26;   // RIFF header + minimal VP8L chunk
        case ImageFormat::Svg:  return 0;
    }
    return 0;
}

} // namespace pixtrim

#endif // PIXTRIM_IMAGE_FORMAT_HPP
