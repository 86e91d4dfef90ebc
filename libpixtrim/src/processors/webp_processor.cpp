//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/webp_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/mux.h>
#include <algorithm>
#include <string>

namespace pixtrim {

namespace {

    const char *vp8_status_name(const VP8StatusCode status) {
        switch (status) {
            case VP8_STATUS_OK:                  return "ok";
            case VP8_STATUS_OUT_OF_MEMORY:       return "out of memory";
            case VP8_STATUS_INVALID_PARAM:       return "invalid parameter";
            case VP8_STATUS_BITSTREAM_ERROR:     return "bitstream error";
            case VP8_STATUS_UNSUPPORTED_FEATURE: return "unsupported feature";
            case VP8_STATUS_SUSPENDED:           return "suspended";
            case VP8_STATUS_USER_ABORT:          return "user abort";
            case VP8_STATUS_NOT_ENOUGH_DATA:     return "not enough data";
        }
        return "unknown";
    }

    struct WebPPictureGuard {
        WebPPicture pic{};
        bool initialized = false;
        ~WebPPictureGuard() { if (initialized) WebPPictureFree(&pic); }
    };

    struct WebPWriterGuard {
        WebPMemoryWriter writer{};
        WebPWriterGuard() { WebPMemoryWriterInit(&writer); }
        ~WebPWriterGuard() { WebPMemoryWriterClear(&writer); }
    };

    struct WebPMuxGuard {
        WebPMux *mux = nullptr;
        explicit WebPMuxGuard(WebPMux *m) : mux(m) {}
        ~WebPMuxGuard() { if (mux) WebPMuxDelete(mux); }
        WebPMuxGuard(const WebPMuxGuard&) = delete;
        WebPMuxGuard& operator=(const WebPMuxGuard&) = delete;
    };

    WebPBitstreamFeatures read_features(const ByteView input) {
        WebPBitstreamFeatures features;
        const VP8StatusCode status = WebPGetFeatures(input.data(), input.size(), &features);
        if (status != VP8_STATUS_OK) {
            throw FileError(FileErrorKind::DecodeError,
                            std::string("libwebp: feature detection failed: ") + vp8_status_name(status));
        }
        if (features.has_animation) {
            throw FileError(FileErrorKind::DecodeError, "animated WebP is not supported");
        }
        return features;
    }

    /**
     * @brief Copy EXIF, XMP and ICCP chunks from `source` into the freshly encoded `encoded`.
     *
     * A source without a readable container just yields the bare encode.
     */
    Bytes attach_metadata(const ByteView source, Bytes encoded) {
        const WebPData encoded_data{encoded.data(), encoded.size()};
        WebPMuxGuard out(WebPMuxCreate(&encoded_data, 1));
        if (!out.mux) {
            throw FileError(FileErrorKind::OptimizeError, "libwebpmux: WebPMuxCreate failed on encoder output");
        }

        const WebPData source_data{source.data(), source.size()};
        const WebPMuxGuard in(WebPMuxCreate(&source_data, 0));
        if (!in.mux) {
            Logger::log(LogLevel::Warning, "libwebpmux: cannot read source container, metadata dropped",
                        "webp_processor");
            return encoded;
        }

        bool copied = false;
        for (const char *fourcc : {"EXIF", "XMP ", "ICCP"}) {
            WebPData chunk;
            if (WebPMuxGetChunk(in.mux, fourcc, &chunk) == WEBP_MUX_OK) {
                if (WebPMuxSetChunk(out.mux, fourcc, &chunk, 1) != WEBP_MUX_OK) {
                    throw FileError(FileErrorKind::OptimizeError,
                                    std::string("libwebpmux: cannot set ") + fourcc + " chunk");
                }
                copied = true;
            }
        }
        if (!copied) {
            return encoded;
        }

        WebPData assembled;
        WebPDataInit(&assembled);
        if (WebPMuxAssemble(out.mux, &assembled) != WEBP_MUX_OK) {
            WebPDataClear(&assembled);
            throw FileError(FileErrorKind::OptimizeError, "libwebpmux: WebPMuxAssemble failed");
        }
        Bytes result(assembled.bytes, assembled.bytes + assembled.size);
        WebPDataClear(&assembled);
        return result;
    }

} // namespace

RasterImage WebpProcessor::decode(const ByteView input) {
    read_features(input);

    int width = 0, height = 0;
    uint8_t *decoded = WebPDecodeRGBA(input.data(), input.size(), &width, &height);
    if (!decoded) {
        throw FileError(FileErrorKind::DecodeError, "libwebp: RGBA decode failed");
    }

    RasterImage image;
    image.width = static_cast<std::uint32_t>(width);
    image.height = static_cast<std::uint32_t>(height);
    image.channels = 4;
    image.pixels.assign(decoded, decoded + image.row_bytes() * image.height);
    WebPFree(decoded);
    return image;
}

Bytes WebpProcessor::encode(const RasterImage& image, const int quality, const bool lossless) {
    if (image.channels != 4) {
        throw FileError(FileErrorKind::OptimizeError, "WebP encoder expects RGBA input");
    }

    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        throw FileError(FileErrorKind::OptimizeError, "libwebp: WebPConfigInit failed (version mismatch)");
    }
    if (lossless) {
        if (!WebPConfigLosslessPreset(&config, 9)) {
            throw FileError(FileErrorKind::OptimizeError, "libwebp: WebPConfigLosslessPreset failed");
        }
    } else {
        config.quality = static_cast<float>(std::clamp(quality, 1, 100));
        config.method = 6;
        config.alpha_quality = 100;
    }
    if (!WebPValidateConfig(&config)) {
        throw FileError(FileErrorKind::OptimizeError, "libwebp: invalid encoder configuration");
    }

    WebPPictureGuard picture;
    if (!WebPPictureInit(&picture.pic)) {
        throw FileError(FileErrorKind::OptimizeError, "libwebp: WebPPictureInit failed");
    }
    picture.initialized = true;
    picture.pic.use_argb = lossless ? 1 : 0;
    picture.pic.width = static_cast<int>(image.width);
    picture.pic.height = static_cast<int>(image.height);
    if (!WebPPictureImportRGBA(&picture.pic, image.pixels.data(), static_cast<int>(image.row_bytes()))) {
        throw FileError(FileErrorKind::OptimizeError, "libwebp: WebPPictureImportRGBA failed");
    }

    WebPWriterGuard writer;
    picture.pic.writer = WebPMemoryWrite;
    picture.pic.custom_ptr = &writer.writer;

    if (!WebPEncode(&config, &picture.pic)) {
        throw FileError(FileErrorKind::OptimizeError,
                        "libwebp: WebPEncode failed, error code " + std::to_string(picture.pic.error_code));
    }
    return {writer.writer.mem, writer.writer.mem + writer.writer.size};
}

Bytes WebpProcessor::optimize(const ByteView input, const RunConfig& config) const {
    const WebPBitstreamFeatures features = read_features(input);
    Logger::log(LogLevel::Debug,
                std::string("WebP input ") + (features.format == 2 ? "lossless" : "lossy")
                + (features.has_alpha ? " with alpha" : "")
                + ", encoding " + (config.lossless ? "lossless" : "lossy q" + std::to_string(config.quality)),
                "webp_processor");

    RasterImage image = resize_to_fit(decode(input), config.max_edge_px);
    Bytes encoded = encode(image, config.quality, config.lossless);

    if (config.preserve_metadata) {
        encoded = attach_metadata(input, std::move(encoded));
    }
    return encoded;
}

} // namespace pixtrim
