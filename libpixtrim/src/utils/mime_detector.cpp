//
// Created by Giuseppe Francione on 11/10/25.
//

#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <type_traits>

namespace pixtrim {

namespace {
    struct MagicCloser {
        void operator()(const magic_t m) const { if (m) magic_close(m); }
    };
    using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

    // magic_t is not thread-safe; each worker thread keeps its own cookie
    magic_t thread_magic() {
        thread_local unique_magic cookie = [] {
            unique_magic m(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
            if (m && magic_load(m.get(), nullptr) != 0) {
                Logger::log(LogLevel::Warning,
                            std::string("Cannot load magic database: ") + magic_error(m.get()),
                            "libmagic");
                m.reset();
            }
            return m;
        }();
        return cookie.get();
    }
}

std::string MimeDetector::detect(const std::span<const std::uint8_t> data) {
    const magic_t magic = thread_magic();
    if (!magic) return {};
    const char* mime = magic_buffer(magic, data.data(), data.size());
    return mime ? mime : "";
}

ImageFormat MimeDetector::resolve(const std::filesystem::path& path, const std::span<const std::uint8_t> data) {
    const auto by_extension = format_from_extension(path.extension().string());
    if (!by_extension) {
        throw FileError(FileErrorKind::DecodeError, "unsupported extension: " + path.string());
    }

    const std::string mime = detect(data);
    const auto by_content = format_from_mime(mime);
    if (by_content && *by_content != *by_extension) {
        throw FileError(FileErrorKind::FormatMismatch,
                        path.string() + ": extension says " + to_string(*by_extension)
                        + " but content is " + mime);
    }
    if (!by_content) {
        Logger::log(LogLevel::Debug,
                    "Content of " + path.filename().string() + " sniffed as '" + mime + "', trusting extension",
                    "mime_detector");
    }
    return *by_extension;
}

} // namespace pixtrim
