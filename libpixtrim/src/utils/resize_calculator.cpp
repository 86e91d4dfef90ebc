//
// Created by Giuseppe Francione on 03/12/25.
//

#include "../../include/resize_calculator.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace pixtrim {

Dimensions target_dimensions(const std::uint32_t width,
                             const std::uint32_t height,
                             const std::optional<std::uint32_t> max_edge) noexcept {
    const std::uint32_t long_edge = std::max(width, height);
    if (!max_edge || *max_edge == 0 || long_edge <= *max_edge) {
        return {width, height};
    }

    const double scale = static_cast<double>(*max_edge) / static_cast<double>(long_edge);
    auto scaled = [scale](const std::uint32_t v) {
        const auto r = static_cast<std::uint32_t>(std::lround(static_cast<double>(v) * scale));
        return std::max<std::uint32_t>(1, r);
    };

    if (width >= height) {
        return {*max_edge, scaled(height)};
    }
    return {scaled(width), *max_edge};
}

RasterImage resample_box(const RasterImage& src, const std::uint32_t width, const std::uint32_t height) {
    RasterImage dst;
    dst.width = width;
    dst.height = height;
    dst.channels = src.channels;
    dst.pixels.resize(dst.row_bytes() * height);
    if (width == 0 || height == 0 || src.width == 0 || src.height == 0) return dst;

    const unsigned ch = src.channels;
    const std::size_t src_stride = src.row_bytes();

    // box edges per destination column; at least one source column each
    std::vector<std::uint32_t> x0(width), x1(width);
    for (std::uint32_t dx = 0; dx < width; ++dx) {
        x0[dx] = static_cast<std::uint32_t>(static_cast<std::uint64_t>(dx) * src.width / width);
        x1[dx] = static_cast<std::uint32_t>(static_cast<std::uint64_t>(dx + 1) * src.width / width);
        x1[dx] = std::clamp(x1[dx], x0[dx] + 1, src.width);
        x0[dx] = std::min(x0[dx], src.width - 1);
    }

    std::vector<std::uint64_t> acc(dst.row_bytes());
    for (std::uint32_t dy = 0; dy < height; ++dy) {
        std::uint32_t y0 = static_cast<std::uint32_t>(static_cast<std::uint64_t>(dy) * src.height / height);
        std::uint32_t y1 = static_cast<std::uint32_t>(static_cast<std::uint64_t>(dy + 1) * src.height / height);
        y1 = std::clamp(y1, y0 + 1, src.height);
        y0 = std::min(y0, src.height - 1);

        std::ranges::fill(acc, 0);
        for (std::uint32_t sy = y0; sy < y1; ++sy) {
            const std::uint8_t* row = src.pixels.data() + sy * src_stride;
            for (std::uint32_t dx = 0; dx < width; ++dx) {
                const std::uint8_t* p = row + static_cast<std::size_t>(x0[dx]) * ch;
                std::uint64_t* a = acc.data() + static_cast<std::size_t>(dx) * ch;
                for (std::uint32_t sx = x0[dx]; sx < x1[dx]; ++sx) {
                    for (unsigned c = 0; c < ch; ++c) a[c] += p[c];
                    p += ch;
                }
            }
        }

        std::uint8_t* out = dst.pixels.data() + dy * dst.row_bytes();
        for (std::uint32_t dx = 0; dx < width; ++dx) {
            const std::uint64_t area = static_cast<std::uint64_t>(x1[dx] - x0[dx]) * (y1 - y0);
            const std::uint64_t half = area >> 1;
            for (unsigned c = 0; c < ch; ++c) {
                out[dx * ch + c] = static_cast<std::uint8_t>((acc[dx * ch + c] + half) / area);
            }
        }
    }
    return dst;
}

RasterImage resize_to_fit(RasterImage src, const std::optional<std::uint32_t> max_edge) {
    const auto target = target_dimensions(src.width, src.height, max_edge);
    if (target.width == src.width && target.height == src.height) {
        return src;
    }
    Logger::log(LogLevel::Debug,
                "Resizing " + std::to_string(src.width) + "x" + std::to_string(src.height)
                + " -> " + std::to_string(target.width) + "x" + std::to_string(target.height),
                "resize");
    return resample_box(src, target.width, target.height);
}

} // namespace pixtrim
