//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/updater/executable_replacer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <string>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#include <vector>
#endif

namespace fs = std::filesystem;

namespace pixtrim {

fs::path old_executable_path(const fs::path& exe) {
    fs::path old = exe;
    old += ".old";
    return old;
}

void RenameExecutableReplacer::replace(const fs::path& current, const fs::path& staged) {
    const fs::path old = old_executable_path(current);
    std::error_code ec;

    fs::remove(old, ec);
    ec.clear();

#ifdef _WIN32
    // a running image can be renamed but not overwritten
    fs::rename(current, old, ec);
    if (ec) {
        throw UpdateError(UpdateErrorKind::SwapError,
                          "cannot move " + current.string() + " aside: " + ec.message());
    }
#else
    fs::create_hard_link(current, old, ec);
    if (ec) {
        Logger::log(LogLevel::Debug, "Hard link to " + old.string() + " failed, copying: " + ec.message(), "updater");
        ec.clear();
        fs::copy_file(current, old, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        throw UpdateError(UpdateErrorKind::SwapError,
                          "cannot keep a copy of " + current.string() + ": " + ec.message());
    }
#endif

    install(staged, current, ec);
    if (ec) {
        const std::string cause = ec.message();
        std::error_code restore_ec;
#ifdef _WIN32
        fs::rename(old, current, restore_ec);
        if (restore_ec) {
            Logger::log(LogLevel::Error,
                        "Restoring " + current.string() + " failed, previous binary is at " + old.string()
                        + ": " + restore_ec.message(),
                        "updater");
        }
#else
        // current was never touched
        fs::remove(old, restore_ec);
#endif
        throw UpdateError(UpdateErrorKind::SwapError,
                          "cannot install " + staged.string() + " as " + current.string() + ": " + cause);
    }

#ifdef _WIN32
    if (!MoveFileExW(old.wstring().c_str(), nullptr, MOVEFILE_DELAY_UNTIL_REBOOT)) {
        Logger::log(LogLevel::Debug, "Could not schedule deletion of " + old.string(), "updater");
    }
#else
    fs::remove(old, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Could not remove " + old.string() + ": " + ec.message(), "updater");
    }
#endif
}

void RenameExecutableReplacer::install(const fs::path& staged, const fs::path& current, std::error_code& ec) {
    fs::rename(staged, current, ec);
}

bool cleanup_stale_executables(const fs::path& exe) {
    const fs::path old = old_executable_path(exe);
    std::error_code ec;
    if (!fs::exists(old, ec)) return false;
    const bool removed = fs::remove(old, ec);
    if (ec) {
        Logger::log(LogLevel::Debug, "Stale executable " + old.string() + " still locked: " + ec.message(), "updater");
        return false;
    }
    if (removed) {
        Logger::log(LogLevel::Debug, "Removed stale executable " + old.string(), "updater");
    }
    return removed;
}

fs::path current_executable_path() {
#ifdef _WIN32
    std::wstring buf(MAX_PATH, L'\0');
    while (true) {
        const DWORD len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0) {
            throw UpdateError(UpdateErrorKind::SwapError, "GetModuleFileNameW failed");
        }
        if (len < buf.size()) {
            buf.resize(len);
            return fs::path(buf);
        }
        buf.resize(buf.size() * 2);
    }
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::vector<char> buf(size + 1, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) != 0) {
        throw UpdateError(UpdateErrorKind::SwapError, "_NSGetExecutablePath failed");
    }
    std::error_code ec;
    auto resolved = fs::canonical(buf.data(), ec);
    return ec ? fs::path(buf.data()) : resolved;
#else
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        throw UpdateError(UpdateErrorKind::SwapError, "cannot resolve /proc/self/exe: " + ec.message());
    }
    return exe;
#endif
}

} // namespace pixtrim
