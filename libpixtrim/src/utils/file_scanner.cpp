//
// Created by Giuseppe Francione on 20/09/25.
//

#include "../../include/file_scanner.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace pixtrim {

bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::ranges::transform(name, name.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini";
}

namespace {

    void check_root(const fs::path& root) {
        std::error_code ec;
        const auto st = fs::status(root, ec);
        if (ec || !fs::exists(st)) {
            throw ScanError("input does not exist: " + root.string());
        }
        if (fs::is_directory(st)) return;
        if (fs::is_regular_file(st) && format_from_extension(root.extension().string())) return;
        throw ScanError("input is neither a directory nor a supported image: " + root.string());
    }

} // namespace

ImageScanner::ImageScanner(fs::path root, const bool recursive, WarningCallback on_warning)
    : root_(std::move(root)), recursive_(recursive), on_warning_(std::move(on_warning)) {
    check_root(root_);
}

void ImageScanner::warn(const fs::path& path, const std::string& message) const {
    Logger::log(LogLevel::Warning, path.string() + ": " + message, "scanner");
    if (on_warning_) {
        on_warning_(path, message);
    }
}

ImageScanner::iterator ImageScanner::begin() const {
    check_root(root_);

    auto state = std::make_shared<iterator::State>();
    state->owner = this;

    std::error_code ec;
    if (fs::is_regular_file(root_, ec)) {
        state->current = {root_, *format_from_extension(root_.extension().string())};
        return iterator(std::move(state));
    }

    fs::directory_iterator it(root_, ec);
    if (ec) {
        throw ScanError("cannot open " + root_.string() + ": " + ec.message());
    }
    state->stack.push_back(std::move(it));

    iterator result(std::move(state));
    result.advance();
    return result;
}

ImageScanner::iterator& ImageScanner::iterator::operator++() {
    advance();
    return *this;
}

void ImageScanner::iterator::advance() {
    if (at_end()) return;
    auto& s = *state_;
    const ImageScanner& owner = *s.owner;

    while (!s.stack.empty()) {
        if (s.stack.back() == fs::directory_iterator{}) {
            s.stack.pop_back();
            continue;
        }

        const fs::directory_entry entry = *s.stack.back();
        std::error_code ec;
        s.stack.back().increment(ec);
        if (ec) {
            owner.warn(entry.path().parent_path(), "listing stopped early: " + ec.message());
            s.stack.back() = fs::directory_iterator{};
        }

        if (is_junk(entry.path())) continue;

        const auto st = entry.symlink_status(ec);
        if (ec) {
            owner.warn(entry.path(), "cannot stat: " + ec.message());
            continue;
        }
        if (fs::is_symlink(st)) {
            Logger::log(LogLevel::Debug, "Not following symlink " + entry.path().string(), "scanner");
            continue;
        }
        if (fs::is_directory(st)) {
            if (!owner.recursive_) continue;
            fs::directory_iterator sub(entry.path(), ec);
            if (ec) {
                owner.warn(entry.path(), "cannot open directory: " + ec.message());
                continue;
            }
            s.stack.push_back(std::move(sub));
            continue;
        }
        if (!fs::is_regular_file(st)) continue;

        const auto fmt = format_from_extension(entry.path().extension().string());
        if (!fmt) continue;

        s.current = {entry.path(), *fmt};
        return;
    }
    s.done = true;
}

} // namespace pixtrim
