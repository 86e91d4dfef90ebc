//
// Created by Giuseppe Francione on 04/12/25.
//

#ifndef PIXTRIM_OUTPUT_ROUTER_HPP
#define PIXTRIM_OUTPUT_ROUTER_HPP

#include <filesystem>
#include <optional>

namespace pixtrim {

    /**
     * @brief Maps source files to the path their optimized bytes go to.
     *
     * In place (no output root) every file maps to itself. Otherwise the
     * file's path relative to the input root is re-rooted under the output
     * root; a single-file input root contributes only its file name.
     * No destination ever falls outside the output root.
     */
    class OutputRouter {
    public:
        OutputRouter(std::filesystem::path input_root, std::optional<std::filesystem::path> output_root);

        /**
         * @throws FileError(IoError) if the relative path is empty, absolute
         * or climbs out with "..".
         */
        [[nodiscard]] std::filesystem::path destination_for(const std::filesystem::path& source) const;

        /**
         * @brief Create the destination's parent directories.
         * @throws FileError(IoError)
         */
        void prepare(const std::filesystem::path& destination) const;

        [[nodiscard]] bool in_place() const noexcept { return !output_root_.has_value(); }

    private:
        std::filesystem::path input_root_;
        std::optional<std::filesystem::path> output_root_;
        bool single_file_;
    };

} // namespace pixtrim

#endif // PIXTRIM_OUTPUT_ROUTER_HPP
