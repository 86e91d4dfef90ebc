//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/output_router.hpp"
#include "../../include/errors.hpp"
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace pixtrim {

OutputRouter::OutputRouter(fs::path input_root, std::optional<fs::path> output_root)
    : input_root_(std::move(input_root)), output_root_(std::move(output_root)) {
    std::error_code ec;
    single_file_ = fs::is_regular_file(input_root_, ec);
}

fs::path OutputRouter::destination_for(const fs::path& source) const {
    if (!output_root_) {
        return source;
    }

    fs::path rel;
    if (single_file_) {
        rel = source.filename();
    } else {
        rel = source.lexically_normal().lexically_relative(input_root_.lexically_normal());
    }

    if (rel.empty() || rel == "." || rel.is_absolute() || rel.has_root_name()) {
        throw FileError(FileErrorKind::IoError,
                        "cannot route " + source.string() + " under " + output_root_->string());
    }
    for (const auto& part : rel) {
        if (part == "..") {
            throw FileError(FileErrorKind::IoError,
                            "refusing to route " + source.string() + " outside " + output_root_->string());
        }
    }
    return *output_root_ / rel;
}

void OutputRouter::prepare(const fs::path& destination) const {
    const auto parent = destination.parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw FileError(FileErrorKind::IoError,
                        "cannot create directory " + parent.string() + ": " + ec.message());
    }
}

} // namespace pixtrim
