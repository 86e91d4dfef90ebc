//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/png_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <zopflipng_lib.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring> // IDE may say it's unused, but it's lying to you
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pixtrim {

namespace {

    [[noreturn]] void png_read_error_fn(png_structp, const png_const_charp msg) {
        throw FileError(FileErrorKind::DecodeError, std::string("libpng: ") + msg);
    }

    [[noreturn]] void png_write_error_fn(png_structp, const png_const_charp msg) {
        throw FileError(FileErrorKind::OptimizeError, std::string("libpng: ") + msg);
    }

    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
    }

    struct MemoryReader {
        ByteView data;
        std::size_t offset = 0;
    };

    void read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
        auto *src = static_cast<MemoryReader *>(png_get_io_ptr(png));
        if (src->data.size() - src->offset < length) {
            png_error(png, "unexpected end of PNG data");
        }
        std::memcpy(out, src->data.data() + src->offset, length);
        src->offset += length;
    }

    void write_to_memory(const png_structp png, const png_bytep data, const png_size_t length) {
        auto *dst = static_cast<Bytes *>(png_get_io_ptr(png));
        dst->insert(dst->end(), data, data + length);
    }

    void flush_memory(png_structp) {}

    /**
     * @brief RAII wrapper for libpng read structs reading from memory.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;
        MemoryReader source;

        explicit PngRead(const ByteView data) : source{data} {
            png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_read_error_fn, png_warning_fn);
            if (!png) throw FileError(FileErrorKind::OptimizeError, "png_create_read_struct failed");
            info = png_create_info_struct(png);
            if (!info) {
                png_destroy_read_struct(&png, nullptr, nullptr);
                throw FileError(FileErrorKind::OptimizeError, "png_create_info_struct failed");
            }
            png_set_read_fn(png, &source, read_from_memory);
        }

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }

        PngRead(const PngRead&) = delete;
        PngRead& operator=(const PngRead&) = delete;
    };

    /**
     * @brief RAII wrapper for libpng write structs appending to a byte vector.
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;
        Bytes out;

        PngWrite() {
            png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_write_error_fn, png_warning_fn);
            if (!png) throw FileError(FileErrorKind::OptimizeError, "png_create_write_struct failed");
            info = png_create_info_struct(png);
            if (!info) {
                png_destroy_write_struct(&png, nullptr);
                throw FileError(FileErrorKind::OptimizeError, "png_create_info_struct failed");
            }
            png_set_write_fn(png, &out, write_to_memory, flush_memory);
        }

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }

        PngWrite(const PngWrite&) = delete;
        PngWrite& operator=(const PngWrite&) = delete;
    };

    struct TextChunk {
        int compression;
        std::string key;
        std::string text;
        std::string lang;
        std::string lang_key;
    };

    /**
     * @brief Ancillary chunks that stay valid whatever colour type the output uses.
     *
     * The colour chunks (iCCP, sRGB, gAMA, cHRM) change how the pixels render
     * and are always carried over. pHYs, tIME and text are descriptive and only
     * kept on request. bKGD and sBIT depend on the colour type and are dropped.
     */
    struct PngMetadata {
        std::optional<std::string> iccp_name;
        std::vector<png_byte> iccp_profile;
        std::optional<int> srgb_intent;
        std::optional<png_fixed_point> gamma;
        std::optional<std::array<png_fixed_point, 8>> chrm;
        std::optional<std::array<png_uint_32, 3>> phys;
        std::optional<png_time> mod_time;
        std::vector<TextChunk> text;
    };

    PngMetadata capture_metadata(const png_structp png, const png_infop info, const bool descriptive) {
        PngMetadata meta;
        if (png_get_valid(png, info, PNG_INFO_iCCP)) {
            png_charp name = nullptr;
            int comp_type = 0;
            png_bytep profile = nullptr;
            png_uint_32 profile_len = 0;
            if (png_get_iCCP(png, info, &name, &comp_type, &profile, &profile_len)) {
                meta.iccp_name = name ? name : "ICC";
                meta.iccp_profile.assign(profile, profile + profile_len);
            }
        }
        if (png_get_valid(png, info, PNG_INFO_sRGB)) {
            int intent = 0;
            if (png_get_sRGB(png, info, &intent)) meta.srgb_intent = intent;
        }
        if (png_get_valid(png, info, PNG_INFO_gAMA)) {
            png_fixed_point gamma = 0;
            if (png_get_gAMA_fixed(png, info, &gamma)) meta.gamma = gamma;
        }
        if (png_get_valid(png, info, PNG_INFO_cHRM)) {
            std::array<png_fixed_point, 8> c{};
            if (png_get_cHRM_fixed(png, info, &c[0], &c[1], &c[2], &c[3], &c[4], &c[5], &c[6], &c[7])) {
                meta.chrm = c;
            }
        }
        if (!descriptive) {
            return meta;
        }
        if (png_get_valid(png, info, PNG_INFO_pHYs)) {
            png_uint_32 xppu = 0, yppu = 0;
            int unit = 0;
            if (png_get_pHYs(png, info, &xppu, &yppu, &unit)) {
                meta.phys = std::array<png_uint_32, 3>{xppu, yppu, static_cast<png_uint_32>(unit)};
            }
        }
        if (png_get_valid(png, info, PNG_INFO_tIME)) {
            png_timep mod_time = nullptr;
            if (png_get_tIME(png, info, &mod_time) && mod_time) meta.mod_time = *mod_time;
        }
        png_textp text = nullptr;
        int num_text = 0;
        png_get_text(png, info, &text, &num_text);
        for (int i = 0; i < num_text; ++i) {
            meta.text.push_back({text[i].compression,
                                 text[i].key ? text[i].key : "",
                                 text[i].text ? text[i].text : "",
                                 text[i].lang ? text[i].lang : "",
                                 text[i].lang_key ? text[i].lang_key : ""});
        }
        return meta;
    }

    // must run before png_write_info
    void apply_metadata(const png_structp png, const png_infop info, const PngMetadata& meta) {
        if (meta.iccp_name) {
            png_set_iCCP(png, info, meta.iccp_name->c_str(), PNG_COMPRESSION_TYPE_BASE,
                         meta.iccp_profile.data(), static_cast<png_uint_32>(meta.iccp_profile.size()));
        } else if (meta.srgb_intent) {
            png_set_sRGB(png, info, *meta.srgb_intent);
        }
        if (meta.gamma) png_set_gAMA_fixed(png, info, *meta.gamma);
        if (meta.chrm) {
            const auto& c = *meta.chrm;
            png_set_cHRM_fixed(png, info, c[0], c[1], c[2], c[3], c[4], c[5], c[6], c[7]);
        }
        if (meta.phys) {
            const auto& p = *meta.phys;
            png_set_pHYs(png, info, p[0], p[1], static_cast<int>(p[2]));
        }
        if (meta.mod_time) {
            png_time t = *meta.mod_time;
            png_set_tIME(png, info, &t);
        }
        if (!meta.text.empty()) {
            std::vector<png_text> chunks(meta.text.size());
            for (std::size_t i = 0; i < meta.text.size(); ++i) {
                const auto& t = meta.text[i];
                chunks[i] = png_text{};
                chunks[i].compression = t.compression;
                chunks[i].key = const_cast<png_charp>(t.key.c_str());
                chunks[i].text = const_cast<png_charp>(t.text.c_str());
                chunks[i].lang = const_cast<png_charp>(t.lang.c_str());
                chunks[i].lang_key = const_cast<png_charp>(t.lang_key.c_str());
            }
            png_set_text(png, info, chunks.data(), static_cast<int>(chunks.size()));
        }
    }

    /**
     * @brief Colour space signature of the embedded ICC profile ("RGB ", "GRAY"), empty without one.
     */
    std::string icc_color_space(const PngMetadata *meta) {
        if (!meta || !meta->iccp_name || meta->iccp_profile.size() < 20) {
            return {};
        }
        return {reinterpret_cast<const char *>(meta->iccp_profile.data()) + 16, 4};
    }

    inline std::uint32_t pack_rgba(const std::uint8_t r, const std::uint8_t g,
                                   const std::uint8_t b, const std::uint8_t a) {
        return (static_cast<std::uint32_t>(r) << 24) |
               (static_cast<std::uint32_t>(g) << 16) |
               (static_cast<std::uint32_t>(b) << 8)  |
               (static_cast<std::uint32_t>(a));
    }

    /**
     * @brief Decodes the image data of a read struct whose info was already read, as RGBA8.
     */
    RasterImage read_rgba8(const png_structp png, const png_infop info) {
        png_uint_32 width, height;
        int bit_depth, color_type;
        png_get_IHDR(png, info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

        if (bit_depth == 16) png_set_strip_16(png);
        if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
        if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
        if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
        if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
        png_set_interlace_handling(png);

        png_read_update_info(png, info);

        const std::size_t rowbytes = png_get_rowbytes(png, info);
        if (rowbytes != static_cast<std::size_t>(width) * 4) {
            throw FileError(FileErrorKind::DecodeError, "rowbytes mismatch, expected RGBA8");
        }

        RasterImage image;
        image.width = width;
        image.height = height;
        image.channels = 4;
        image.pixels.resize(rowbytes * height);
        std::vector<png_bytep> row_pointers(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            row_pointers[y] = image.pixels.data() + y * rowbytes;
        }

        png_read_image(png, row_pointers.data());
        png_read_end(png, info);
        return image;
    }

    /**
     * @brief One way of storing the pixels: colour type, depth, palette and
     * the unpacked sample rows (one byte per sample).
     */
    struct ColorLayout {
        int color_type = PNG_COLOR_TYPE_RGBA;
        int bit_depth = 8;
        std::vector<png_color> palette;
        std::vector<png_byte> transparency;
        Bytes rows;
        std::size_t stride = 0;
    };

    /**
     * @brief Builds the truecolor/gray layout and, when there are at most
     * 256 distinct colours, the palette layout.
     *
     * An ICC profile pins the output to its colour space: an RGB profile
     * rules out the gray types, a gray profile rules out the palette.
     */
    std::vector<ColorLayout> reduce_color(const RasterImage& rgba, const std::string& icc_space) {
        const std::size_t pixel_count = static_cast<std::size_t>(rgba.width) * rgba.height;
        const std::uint8_t *p = rgba.pixels.data();

        bool all_gray = true;
        bool all_opaque = true;
        bool can_use_palette = true;
        std::vector<std::uint32_t> colors;
        std::unordered_map<std::uint32_t, std::uint8_t> seen;

        for (std::size_t i = 0; i < pixel_count; ++i, p += 4) {
            const std::uint8_t r = p[0], g = p[1], b = p[2], a = p[3];
            if (r != g || g != b) all_gray = false;
            if (a != 0xFF) all_opaque = false;
            if (can_use_palette) {
                const std::uint32_t color = pack_rgba(r, g, b, a);
                if (!seen.contains(color)) {
                    if (colors.size() >= 256) {
                        can_use_palette = false;
                    } else {
                        seen.emplace(color, 0);
                        colors.push_back(color);
                    }
                }
            }
        }

        if (icc_space == "RGB ") all_gray = false;
        if (icc_space == "GRAY") can_use_palette = false;

        std::vector<ColorLayout> layouts;

        // truecolor or gray
        {
            ColorLayout layout;
            int channels;
            if (all_gray && all_opaque) {
                layout.color_type = PNG_COLOR_TYPE_GRAY;
                channels = 1;
            } else if (all_gray) {
                layout.color_type = PNG_COLOR_TYPE_GA;
                channels = 2;
            } else if (all_opaque) {
                layout.color_type = PNG_COLOR_TYPE_RGB;
                channels = 3;
            } else {
                layout.color_type = PNG_COLOR_TYPE_RGBA;
                channels = 4;
            }
            layout.stride = static_cast<std::size_t>(rgba.width) * channels;
            layout.rows.resize(layout.stride * rgba.height);
            const std::uint8_t *src = rgba.pixels.data();
            std::uint8_t *dst = layout.rows.data();
            for (std::size_t i = 0; i < pixel_count; ++i, src += 4) {
                switch (channels) {
                    case 1: *dst++ = src[0]; break;
                    case 2: *dst++ = src[0]; *dst++ = src[3]; break;
                    case 3: *dst++ = src[0]; *dst++ = src[1]; *dst++ = src[2]; break;
                    default: std::memcpy(dst, src, 4); dst += 4; break;
                }
            }
            layouts.push_back(std::move(layout));
        }

        if (can_use_palette) {
            // translucent entries first, so tRNS can omit the opaque tail
            std::ranges::stable_partition(colors, [](const std::uint32_t c) { return (c & 0xFF) != 0xFF; });

            ColorLayout layout;
            layout.color_type = PNG_COLOR_TYPE_PALETTE;
            const std::size_t n = colors.size();
            layout.bit_depth = n <= 2 ? 1 : n <= 4 ? 2 : n <= 16 ? 4 : 8;

            for (std::size_t i = 0; i < n; ++i) {
                const std::uint32_t c = colors[i];
                seen[c] = static_cast<std::uint8_t>(i);
                layout.palette.push_back({static_cast<png_byte>(c >> 24),
                                          static_cast<png_byte>(c >> 16),
                                          static_cast<png_byte>(c >> 8)});
                if ((c & 0xFF) != 0xFF) layout.transparency.push_back(static_cast<png_byte>(c & 0xFF));
            }

            layout.stride = rgba.width;
            layout.rows.resize(layout.stride * rgba.height);
            const std::uint8_t *src = rgba.pixels.data();
            for (std::size_t i = 0; i < pixel_count; ++i, src += 4) {
                layout.rows[i] = seen.at(pack_rgba(src[0], src[1], src[2], src[3]));
            }
            layouts.push_back(std::move(layout));
        }
        return layouts;
    }

    Bytes write_png(const ColorLayout& layout,
                    const png_uint_32 width,
                    const png_uint_32 height,
                    const int filters,
                    const int strategy,
                    const int level,
                    const PngMetadata *meta) {
        PngWrite wr;
        png_set_compression_level(wr.png, level);
        png_set_compression_mem_level(wr.png, 9);
        png_set_compression_strategy(wr.png, strategy);
        png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, filters);

        png_set_IHDR(wr.png, wr.info, width, height, layout.bit_depth, layout.color_type,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

        if (layout.color_type == PNG_COLOR_TYPE_PALETTE) {
            png_set_PLTE(wr.png, wr.info, layout.palette.data(), static_cast<int>(layout.palette.size()));
            if (!layout.transparency.empty()) {
                png_set_tRNS(wr.png, wr.info, layout.transparency.data(),
                             static_cast<int>(layout.transparency.size()), nullptr);
            }
        }
        if (meta) {
            apply_metadata(wr.png, wr.info, *meta);
        }

        png_write_info(wr.png, wr.info);
        if (layout.bit_depth < 8) {
            png_set_packing(wr.png);
        }

        for (png_uint_32 y = 0; y < height; ++y) {
            png_write_row(wr.png, const_cast<png_bytep>(layout.rows.data() + y * layout.stride));
        }
        png_write_end(wr.png, wr.info);
        return std::move(wr.out);
    }

    const char *filter_name(const int filters) {
        switch (filters) {
            case PNG_FILTER_NONE:  return "none";
            case PNG_FILTER_PAETH: return "paeth";
            case PNG_ALL_FILTERS:  return "adaptive";
            default:               return "mixed";
        }
    }

    /**
     * @brief Encodes every layout/filter/strategy combination and keeps the smallest.
     */
    Bytes search_smallest(const RasterImage& rgba, const PngMetadata *meta) {
        const auto layouts = reduce_color(rgba, icc_color_space(meta));
        const bool huge = static_cast<std::uint64_t>(rgba.width) * rgba.height > 4'000'000u;

        const std::vector<int> strategies = huge
            ? std::vector<int>{Z_DEFAULT_STRATEGY, Z_FILTERED}
            : std::vector<int>{Z_DEFAULT_STRATEGY, Z_FILTERED, Z_RLE};

        Bytes best;
        for (const auto& layout : layouts) {
            std::vector<int> filters;
            if (huge) {
                filters = {PNG_ALL_FILTERS};
            } else if (layout.color_type == PNG_COLOR_TYPE_PALETTE || layout.bit_depth < 8) {
                filters = {PNG_FILTER_NONE, PNG_ALL_FILTERS};
            } else {
                filters = {PNG_FILTER_NONE, PNG_FILTER_PAETH, PNG_ALL_FILTERS};
            }
            for (const int f : filters) {
                for (const int s : strategies) {
                    Bytes candidate = write_png(layout, rgba.width, rgba.height, f, s, 9, meta);
                    Logger::log(LogLevel::Debug,
                                "PNG candidate type=" + std::to_string(layout.color_type)
                                + " depth=" + std::to_string(layout.bit_depth)
                                + " filter=" + filter_name(f)
                                + " strategy=" + std::to_string(s)
                                + " -> " + std::to_string(candidate.size()) + " bytes",
                                "png_processor");
                    if (best.empty() || candidate.size() < best.size()) {
                        best = std::move(candidate);
                    }
                }
            }
        }
        return best;
    }

    bool should_run_zopfli(const RunConfig& config, const std::size_t input_size) {
        switch (config.png_zopfli) {
            case ZopfliPolicy::Never:    return false;
            case ZopfliPolicy::Always:   return true;
            case ZopfliPolicy::Budgeted: return input_size <= config.zopfli_max_bytes;
        }
        return false;
    }

} // namespace

Bytes PngProcessor::optimize(const ByteView input, const RunConfig& config) const {
    PngRead rd(input);
    png_read_info(rd.png, rd.info);

    png_uint_32 width, height;
    int bit_depth, color_type;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);
    const Dimensions original{width, height};
    const bool resize = target_dimensions(width, height, config.max_edge_px) != original;

    Bytes best;
    if (bit_depth == 16 && !resize) {
        Logger::log(LogLevel::Debug, "16-bit PNG kept at full depth, zopfli pass only", "png_processor");
        best.assign(input.begin(), input.end());
    } else {
        RasterImage rgba = read_rgba8(rd.png, rd.info);
        const PngMetadata meta = capture_metadata(rd.png, rd.info, config.preserve_metadata);
        rgba = resize_to_fit(std::move(rgba), config.max_edge_px);
        best = search_smallest(rgba, &meta);
    }

    if (should_run_zopfli(config, input.size())) {
        Bytes z = zopfli_pass(best, config.zopfli_iterations, config.preserve_metadata);
        Logger::log(LogLevel::Debug,
                    "zopflipng: " + std::to_string(best.size()) + " -> " + std::to_string(z.size()) + " bytes",
                    "png_processor");
        if (z.size() < best.size()) {
            best = std::move(z);
        }
    }
    return best;
}

RasterImage PngProcessor::decode(const ByteView input) {
    PngRead rd(input);
    png_read_info(rd.png, rd.info);
    return read_rgba8(rd.png, rd.info);
}

Bytes PngProcessor::encode(const RasterImage& image, const int compression_level) {
    ColorLayout layout;
    switch (image.channels) {
        case 1: layout.color_type = PNG_COLOR_TYPE_GRAY; break;
        case 2: layout.color_type = PNG_COLOR_TYPE_GA; break;
        case 3: layout.color_type = PNG_COLOR_TYPE_RGB; break;
        case 4: layout.color_type = PNG_COLOR_TYPE_RGBA; break;
        default:
            throw FileError(FileErrorKind::OptimizeError,
                            "unsupported channel count " + std::to_string(image.channels));
    }
    layout.rows = image.pixels;
    layout.stride = image.row_bytes();
    return write_png(layout, image.width, image.height, PNG_FILTER_NONE, Z_DEFAULT_STRATEGY,
                     std::clamp(compression_level, 0, 9), nullptr);
}

Bytes PngProcessor::zopfli_pass(const ByteView png, const int iterations, const bool preserve_metadata) {
    ZopfliPNGOptions opts;
    opts.lossy_transparent = false;
    opts.lossy_8bit = false;
    opts.use_zopfli = true;
    opts.num_iterations = std::max(1, iterations);
    opts.num_iterations_large = std::max(1, iterations / 3);
    opts.keepchunks = {"iCCP", "sRGB", "gAMA", "cHRM"};
    if (preserve_metadata) {
        opts.keepchunks.insert(opts.keepchunks.end(), {"tEXt", "zTXt", "iTXt", "eXIf", "pHYs", "tIME"});
    }

    const std::vector<unsigned char> origpng(png.begin(), png.end());
    std::vector<unsigned char> resultpng;
    if (ZopfliPNGOptimize(origpng, opts, false, &resultpng) != 0 || resultpng.empty()) {
        Logger::log(LogLevel::Warning, "zopflipng failed, keeping zlib result", "png_processor");
        return origpng;
    }
    return resultpng;
}

} // namespace pixtrim
