//
// Created by Giuseppe Francione on 13/11/25.
//

#ifndef PIXTRIM_FILE_UTILS_HPP
#define PIXTRIM_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace pixtrim {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws FileError(IoError) if the file cannot be opened or read.
     */
    std::vector<std::uint8_t> read_file(const std::filesystem::path &path);

    /**
     * @brief Replaces `target` with `data` so that readers see either the old
     * or the new content, never a partial write.
     *
     * Writes a sibling temp file, flushes and syncs it, gives it the
     * permissions of an existing `target`, then renames it over `target`.
     * The temp file is removed on any failure.
     *
     * @throws FileError(IoError) naming the target and the cause.
     */
    void write_file_atomic(const std::filesystem::path &target, std::span<const std::uint8_t> data);

    /**
     * @return A not-yet-existing sibling of `target` ("name.ext.<suffix>.tmp").
     */
    std::filesystem::path temp_sibling(const std::filesystem::path &target);

} // namespace pixtrim

#endif // PIXTRIM_FILE_UTILS_HPP
