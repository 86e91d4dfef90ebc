//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef PIXTRIM_FILE_SCANNER_HPP
#define PIXTRIM_FILE_SCANNER_HPP

#include "image_format.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace pixtrim {

struct ScannedImage {
    std::filesystem::path path;
    ImageFormat format = ImageFormat::Jpeg; ///< From the extension
};

/**
 * @brief Lazy walk over the supported images below a root.
 *
 * @details Yields regular files with a jpg/jpeg/png/webp/svg extension
 * (any case). Non-recursive mode only lists direct children. Symlinks are
 * never followed, so the walk is finite even with link cycles. Junk entries
 * (`.DS_Store`, `desktop.ini`, AppleDouble `._*`) are ignored.
 *
 * Entries that cannot be read are reported through the warning callback
 * (and logged) and skipped. Every begin() walks the tree again; nothing is
 * cached. A root that is itself a supported image yields just that file.
 */
class ImageScanner {
public:
    using WarningCallback = std::function<void(const std::filesystem::path&, const std::string&)>;

    /**
     * @throws ScanError if the root does not exist or is neither a directory
     * nor a supported image.
     */
    ImageScanner(std::filesystem::path root, bool recursive, WarningCallback on_warning = {});

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ScannedImage;
        using difference_type = std::ptrdiff_t;
        using pointer = const ScannedImage*;
        using reference = const ScannedImage&;

        iterator() = default;

        reference operator*() const { return state_->current; }
        pointer operator->() const { return &state_->current; }

        iterator& operator++();
        void operator++(int) { ++*this; }

        bool operator==(const iterator& other) const {
            return at_end() == other.at_end() && (at_end() || state_ == other.state_);
        }

    private:
        friend class ImageScanner;

        struct State {
            const ImageScanner* owner = nullptr;
            std::vector<std::filesystem::directory_iterator> stack;
            ScannedImage current;
            bool done = false;
        };

        explicit iterator(std::shared_ptr<State> state) : state_(std::move(state)) {}

        [[nodiscard]] bool at_end() const { return !state_ || state_->done; }

        void advance();

        std::shared_ptr<State> state_;
    };

    /// @throws ScanError if the root vanished or cannot be opened.
    [[nodiscard]] iterator begin() const;
    [[nodiscard]] iterator end() const { return {}; }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    void warn(const std::filesystem::path& path, const std::string& message) const;

    std::filesystem::path root_;
    bool recursive_;
    WarningCallback on_warning_;
};

/// @return True for OS metadata files that are never images.
[[nodiscard]] bool is_junk(const std::filesystem::path& p);

} // namespace pixtrim

#endif // PIXTRIM_FILE_SCANNER_HPP
