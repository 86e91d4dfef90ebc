//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/backup_manager.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <exception>
#include <string>

namespace pixtrim {

std::filesystem::path backup_path_for(const std::filesystem::path& dest) {
    std::filesystem::path bak = dest;
    bak += ".bak";
    return bak;
}

std::filesystem::path create_backup(const std::filesystem::path& dest, const std::span<const std::uint8_t> original) {
    const auto bak = backup_path_for(dest);
    try {
        write_file_atomic(bak, original);
    } catch (const std::exception& e) {
        throw FileError(FileErrorKind::BackupFailed,
                        "cannot write backup " + bak.string() + ": " + e.what());
    }
    Logger::log(LogLevel::Debug, "Backup written: " + bak.string(), "backup");
    return bak;
}

} // namespace pixtrim
