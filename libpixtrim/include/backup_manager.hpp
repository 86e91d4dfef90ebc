//
// Created by Giuseppe Francione on 04/12/25.
//

#ifndef PIXTRIM_BACKUP_MANAGER_HPP
#define PIXTRIM_BACKUP_MANAGER_HPP

#include <cstdint>
#include <filesystem>
#include <span>

namespace pixtrim {

    /// @return `dest` with ".bak" appended to the full file name (a.png -> a.png.bak).
    [[nodiscard]] std::filesystem::path backup_path_for(const std::filesystem::path& dest);

    /**
     * @brief Store the pre-optimization bytes of `dest` next to it.
     *
     * Written atomically (temp sibling, flush, rename); an existing backup is
     * overwritten. Must run before anything is written to `dest`.
     *
     * @return The backup path.
     * @throws FileError(BackupFailed)
     */
    std::filesystem::path create_backup(const std::filesystem::path& dest, std::span<const std::uint8_t> original);

} // namespace pixtrim

#endif // PIXTRIM_BACKUP_MANAGER_HPP
