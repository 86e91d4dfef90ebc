//
// Created by Giuseppe Francione on 19/10/25.
//

#ifndef PIXTRIM_PROCESSOR_HPP
#define PIXTRIM_PROCESSOR_HPP

#include <cstdint>
#include <span>
#include <vector>

/**
 * @namespace pixtrim
 * @brief The main namespace of the pixtrim library.
 *
 * @details Contains the format processors (JPEG, PNG, WebP, SVG), the
 * execution engine (ProcessorExecutor) with its scanner, router, backup
 * and progress components, and the self-updater.
 */
namespace pixtrim {

using Bytes = std::vector<std::uint8_t>;
using ByteView = std::span<const std::uint8_t>;

/*
 * Every processor is a small stateless class with the same shape:
 *
 *   static constexpr std::string_view name;
 *   static constexpr ImageFormat format;
 *   Bytes optimize(ByteView input, const RunConfig& config) const;
 *
 * optimize() returns the best encoding it found; the caller applies the
 * size guard. Failures are reported as FileError (DecodeError for bad
 * input, OptimizeError for encoder failures). Processors never touch the
 * filesystem. The closed set of processors lives in processor_registry.hpp.
 */

} // namespace pixtrim

#endif // PIXTRIM_PROCESSOR_HPP
