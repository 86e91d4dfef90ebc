//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/processor_registry.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <string>

namespace pixtrim {

AnyProcessor processor_for(const ImageFormat format) {
    switch (format) {
        case ImageFormat::Jpeg: return JpegProcessor{};
        case ImageFormat::Png:  return PngProcessor{};
        case ImageFormat::WebP: return WebpProcessor{};
        case ImageFormat::Svg:  return SvgProcessor{};
    }
    throw std::invalid_argument("unknown image format");
}

Bytes optimize_with(const ImageFormat format, const ByteView input, const RunConfig& config) {
    const AnyProcessor processor = processor_for(format);
    return std::visit([&](const auto& p) {
        Bytes out = p.optimize(input, config);
        Logger::log(LogLevel::Debug,
                    std::string(p.name) + ": " + std::to_string(input.size()) + " -> "
                    + std::to_string(out.size()) + " bytes",
                    "processor_registry");
        return out;
    }, processor);
}

} // namespace pixtrim
