//
// Created by Giuseppe Francione on 17/11/25.
//

#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace pixtrim {

namespace {
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    // data must reach the disk before the rename publishes it
    bool sync_to_disk(FILE *f) {
#ifdef _WIN32
        return _commit(_fileno(f)) == 0;
#else
        return ::fsync(fileno(f)) == 0;
#endif
    }
}

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts UTF-16 paths; the \\?\ prefix lifts MAX_PATH
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
        const unique_FILE in(open_file(path, "rb"));
        if (!in) {
            throw FileError(FileErrorKind::IoError,
                            "cannot open " + path.string() + ": " + std::strerror(errno));
        }
        std::vector<std::uint8_t> data;
        std::uint8_t buf[64 * 1024];
        std::size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), in.get())) > 0) {
            data.insert(data.end(), buf, buf + n);
        }
        if (std::ferror(in.get())) {
            throw FileError(FileErrorKind::IoError, "read error on " + path.string());
        }
        return data;
    }

    std::filesystem::path temp_sibling(const std::filesystem::path& target) {
        auto name = target.filename().string() + "." + RandomUtils::random_suffix() + ".tmp";
        return target.parent_path() / name;
    }

    void write_file_atomic(const std::filesystem::path& target, const std::span<const std::uint8_t> data) {
        const auto tmp = temp_sibling(target);
        std::error_code ec;
        {
            const unique_FILE out(open_file(tmp, "wb"));
            if (!out) {
                throw FileError(FileErrorKind::IoError,
                                "cannot create " + tmp.string() + ": " + std::strerror(errno));
            }
            const bool ok = std::fwrite(data.data(), 1, data.size(), out.get()) == data.size()
                            && std::fflush(out.get()) == 0
                            && sync_to_disk(out.get());
            if (!ok) {
                const std::string cause = std::strerror(errno);
                std::filesystem::remove(tmp, ec);
                throw FileError(FileErrorKind::IoError, "cannot write " + tmp.string() + ": " + cause);
            }
        }

        // the replacement keeps the mode bits of the file it replaces
        const auto target_status = std::filesystem::status(target, ec);
        if (!ec && std::filesystem::exists(target_status)) {
            std::filesystem::permissions(tmp, target_status.permissions(), std::filesystem::perm_options::replace, ec);
            if (ec) {
                Logger::log(LogLevel::Debug, "Cannot copy permissions of " + target.string() + ": " + ec.message(),
                            "file_utils");
            }
        }
        ec.clear();

        // rename can transiently fail on Windows while an AV scanner or indexer holds the file
        int retries = 10;
        while (retries > 0) {
            std::filesystem::rename(tmp, target, ec);
            if (!ec) break;
#ifdef _WIN32
            if (ec.value() != 32 && ec.value() != 5) break;
            Logger::log(LogLevel::Debug, "Rename failed (sharing violation), retrying in 250ms...", "file_utils");
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            --retries;
#else
            break;
#endif
        }
        if (ec) {
            const std::string cause = ec.message();
            std::error_code remove_ec;
            std::filesystem::remove(tmp, remove_ec);
            throw FileError(FileErrorKind::IoError, "cannot replace " + target.string() + ": " + cause);
        }
    }

} // namespace pixtrim
