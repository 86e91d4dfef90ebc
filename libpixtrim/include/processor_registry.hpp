//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file processor_registry.hpp
 * @brief The closed set of format processors and dispatch over it.
 */

#ifndef PIXTRIM_PROCESSOR_REGISTRY_HPP
#define PIXTRIM_PROCESSOR_REGISTRY_HPP

#include "image_format.hpp"
#include "jpeg_processor.hpp"
#include "png_processor.hpp"
#include "processor.hpp"
#include "run_config.hpp"
#include "svg_processor.hpp"
#include "webp_processor.hpp"
#include <variant>

namespace pixtrim {

/**
 * @brief One alternative per supported format.
 *
 * Adding a format means adding an alternative here and a case in
 * processor_for(); std::visit makes every call site exhaustive.
 */
using AnyProcessor = std::variant<JpegProcessor, PngProcessor, WebpProcessor, SvgProcessor>;

/**
 * @brief Pick the processor for a format.
 */
[[nodiscard]] AnyProcessor processor_for(ImageFormat format);

/**
 * @brief Run the processor matching `format` on `input`.
 * @throws FileError
 */
[[nodiscard]] Bytes optimize_with(ImageFormat format, ByteView input, const RunConfig& config);

} // namespace pixtrim

#endif // PIXTRIM_PROCESSOR_REGISTRY_HPP
