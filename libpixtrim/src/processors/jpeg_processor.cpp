//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/jpeg_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace pixtrim {

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    FileErrorKind kind = FileErrorKind::DecodeError;
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a FileError.
 * Decoder errors become DecodeError, encoder errors OptimizeError.
 */
[[noreturn]] void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw FileError(err->kind, std::string("libjpeg: ") + err->msg);
}

/**
 * @brief Routes the first libjpeg warning of an image to the logger; trace messages are dropped.
 */
void jpeg_emit_message_log(const j_common_ptr cinfo, const int msg_level) {
    if (msg_level >= 0) return;
    if (cinfo->err->num_warnings++ > 0) return;
    char buf[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buf);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + buf, "libjpeg");
}

/**
 * @brief Owns a decompressor reading from memory.
 */
struct JpegReader {
    jpeg_decompress_struct info{};
    JpegErrorMgr err{};

    explicit JpegReader(const ByteView input) {
        info.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.emit_message = jpeg_emit_message_log;
        err.kind = FileErrorKind::DecodeError;
        jpeg_create_decompress(&info);
        jpeg_mem_src(&info, const_cast<unsigned char *>(input.data()),
                     static_cast<unsigned long>(input.size()));
    }
    ~JpegReader() { jpeg_destroy_decompress(&info); }

    JpegReader(const JpegReader&) = delete;
    JpegReader& operator=(const JpegReader&) = delete;
};

/**
 * @brief Owns a compressor writing to a libjpeg-allocated memory buffer.
 */
struct JpegWriter {
    jpeg_compress_struct info{};
    JpegErrorMgr err{};
    unsigned char *buffer = nullptr;
    unsigned long size = 0;

    JpegWriter() {
        info.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.emit_message = jpeg_emit_message_log;
        err.kind = FileErrorKind::OptimizeError;
        jpeg_create_compress(&info);
        jpeg_mem_dest(&info, &buffer, &size);
    }
    ~JpegWriter() {
        jpeg_destroy_compress(&info);
        std::free(buffer);
    }

    JpegWriter(const JpegWriter&) = delete;
    JpegWriter& operator=(const JpegWriter&) = delete;

    [[nodiscard]] Bytes take() const { return {buffer, buffer + size}; }
};

struct MarkerData {
    int marker;
    std::vector<JOCTET> data;
};

void setup_marker_saving(const j_decompress_ptr srcinfo, const bool preserve_metadata) {
    if (preserve_metadata) {
        for (int m = 0; m < 16; ++m) {
            jpeg_save_markers(srcinfo, JPEG_APP0 + m, 0xFFFF);
        }
        jpeg_save_markers(srcinfo, JPEG_COM, 0xFFFF);
    }
}

// JFIF (APP0) and Adobe (APP14) headers are written by the encoder itself
bool is_regenerated_marker(const jpeg_saved_marker_ptr m) {
    if (m->marker == JPEG_APP0 && m->data_length >= 5 && std::memcmp(m->data, "JFIF", 5) == 0) return true;
    if (m->marker == JPEG_APP0 + 14 && m->data_length >= 5 && std::memcmp(m->data, "Adobe", 5) == 0) return true;
    return false;
}

/**
 * @brief Copies saved APPn/COM markers out of the decompressor.
 *
 * Markers live in libjpeg's per-image pool, so they must be copied
 * before the decompressor finishes.
 */
std::vector<MarkerData> collect_markers(const j_decompress_ptr srcinfo) {
    std::vector<MarkerData> markers;
    for (jpeg_saved_marker_ptr m = srcinfo->marker_list; m; m = m->next) {
        if (((m->marker >= JPEG_APP0 && m->marker <= JPEG_APP0 + 15) || m->marker == JPEG_COM)
            && m->data && m->data_length > 0 && !is_regenerated_marker(m)) {
            markers.push_back({m->marker, {m->data, m->data + m->data_length}});
        }
    }

    std::ranges::stable_sort(markers,
                             [](const auto &a, const auto &b) { return a.marker < b.marker; });
    markers.erase(std::unique(markers.begin(), markers.end(),
                              [](const auto &a, const auto &b) {
                                  return a.marker == b.marker && a.data == b.data;
                              }),
                  markers.end());
    return markers;
}

void write_markers(const j_compress_ptr dstinfo, const std::vector<MarkerData>& markers) {
    for (const auto &m: markers) {
        jpeg_write_marker(dstinfo, m.marker, m.data.data(), static_cast<unsigned int>(m.data.size()));
    }
}

void read_header(const j_decompress_ptr info) {
    if (jpeg_read_header(info, TRUE) != JPEG_HEADER_OK) {
        throw FileError(FileErrorKind::DecodeError, "invalid JPEG header");
    }
}

/**
 * @brief Decodes the remaining scanlines of a decompressor whose header was read.
 */
RasterImage read_pixels(const j_decompress_ptr info) {
    if (info->jpeg_color_space == JCS_CMYK || info->jpeg_color_space == JCS_YCCK) {
        throw FileError(FileErrorKind::OptimizeError,
                        "CMYK JPEG can only be optimized losslessly without resizing");
    }
    info->out_color_space = info->jpeg_color_space == JCS_GRAYSCALE ? JCS_GRAYSCALE : JCS_RGB;
    jpeg_start_decompress(info);

    RasterImage image;
    image.width = info->output_width;
    image.height = info->output_height;
    image.channels = static_cast<std::uint8_t>(info->output_components);
    image.pixels.resize(image.row_bytes() * image.height);

    while (info->output_scanline < info->output_height) {
        JSAMPROW row = image.pixels.data() + static_cast<std::size_t>(info->output_scanline) * image.row_bytes();
        jpeg_read_scanlines(info, &row, 1);
    }
    jpeg_finish_decompress(info);
    return image;
}

Bytes encode_raster(const RasterImage& image,
                    const int quality,
                    const bool progressive,
                    const bool full_chroma,
                    const std::vector<MarkerData>& markers) {
    if (image.channels != 1 && image.channels != 3) {
        throw FileError(FileErrorKind::OptimizeError,
                        "JPEG encoder needs 1 or 3 channels, got " + std::to_string(image.channels));
    }

    JpegWriter dst;
    dst.info.image_width = image.width;
    dst.info.image_height = image.height;
    dst.info.input_components = image.channels;
    dst.info.in_color_space = image.channels == 1 ? JCS_GRAYSCALE : JCS_RGB;
    jpeg_set_defaults(&dst.info);
    jpeg_set_quality(&dst.info, std::clamp(quality, 1, 100), TRUE);
    dst.info.optimize_coding = TRUE;

    if (full_chroma && image.channels == 3) {
        for (int ci = 0; ci < dst.info.num_components; ++ci) {
            dst.info.comp_info[ci].h_samp_factor = 1;
            dst.info.comp_info[ci].v_samp_factor = 1;
        }
    }
    if (progressive) {
        jpeg_simple_progression(&dst.info);
    }

    jpeg_start_compress(&dst.info, TRUE);
    write_markers(&dst.info, markers);

    while (dst.info.next_scanline < dst.info.image_height) {
        JSAMPROW row = const_cast<JSAMPLE *>(image.pixels.data()
                                             + static_cast<std::size_t>(dst.info.next_scanline) * image.row_bytes());
        jpeg_write_scanlines(&dst.info, &row, 1);
    }
    jpeg_finish_compress(&dst.info);
    return dst.take();
}

/**
 * @brief Lossless Huffman re-optimization, the jpegtran way.
 */
Bytes transcode(const ByteView input, const bool preserve_metadata) {
    JpegReader src(input);
    setup_marker_saving(&src.info, preserve_metadata);
    read_header(&src.info);

    Logger::log(LogLevel::Debug,
                std::string("JPEG ") + (src.info.progressive_mode ? "progressive" : "baseline")
                + ", coefficient transcode",
                "jpeg_processor");

    jvirt_barray_ptr *coef_arrays = jpeg_read_coefficients(&src.info);
    const auto markers = collect_markers(&src.info);

    // dst is declared after src so it is destroyed first; the coefficient
    // arrays belong to src's memory pool
    JpegWriter dst;
    jpeg_copy_critical_parameters(&src.info, &dst.info);
    if (src.info.progressive_mode) {
        jpeg_simple_progression(&dst.info);
    }
    dst.info.optimize_coding = TRUE;
    jpeg_write_coefficients(&dst.info, coef_arrays);
    write_markers(&dst.info, markers);

    jpeg_finish_compress(&dst.info);
    jpeg_finish_decompress(&src.info);
    return dst.take();
}

} // namespace

Bytes JpegProcessor::optimize(const ByteView input, const RunConfig& config) const {
    JpegReader src(input);
    setup_marker_saving(&src.info, config.preserve_metadata);
    read_header(&src.info);

    const Dimensions original{src.info.image_width, src.info.image_height};
    const Dimensions target = target_dimensions(original.width, original.height, config.max_edge_px);

    if (config.lossless && target == original) {
        return transcode(input, config.preserve_metadata);
    }

    const auto markers = config.preserve_metadata ? collect_markers(&src.info) : std::vector<MarkerData>{};
    const bool progressive = src.info.progressive_mode;

    RasterImage raster = resize_to_fit(read_pixels(&src.info), config.max_edge_px);
    const int quality = config.lossless ? 100 : config.quality;

    Logger::log(LogLevel::Debug,
                "JPEG re-encode " + std::to_string(raster.width) + "x" + std::to_string(raster.height)
                + " at quality " + std::to_string(quality),
                "jpeg_processor");

    return encode_raster(raster, quality, progressive, config.lossless, markers);
}

RasterImage JpegProcessor::decode(const ByteView input) {
    JpegReader src(input);
    read_header(&src.info);
    return read_pixels(&src.info);
}

Bytes JpegProcessor::encode(const RasterImage& image, const int quality, const bool progressive) {
    return encode_raster(image, quality, progressive, false, {});
}

} // namespace pixtrim
