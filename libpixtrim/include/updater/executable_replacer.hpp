//
// Created by Giuseppe Francione on 06/12/25.
//

#ifndef PIXTRIM_EXECUTABLE_REPLACER_HPP
#define PIXTRIM_EXECUTABLE_REPLACER_HPP

#include <filesystem>
#include <system_error>

namespace pixtrim {

/**
 * @brief Swaps the running executable for a staged one.
 *
 * Recovery invariant: at every point either the old binary or the new one
 * is at the executable path, never neither. If replace() throws, the old
 * binary is the one left there.
 */
class IExecutableReplacer {
public:
    virtual ~IExecutableReplacer() = default;

    /**
     * @brief Move `staged` to `current`, keeping the old binary until the swap succeeded.
     * @throws UpdateError(SwapError)
     */
    virtual void replace(const std::filesystem::path& current, const std::filesystem::path& staged) = 0;
};

/**
 * @brief Rename-based replacer for the host OS.
 *
 * POSIX: current is hard linked (or copied) to `<exe>.old`, staged is renamed
 * over current in one atomic step, then `.old` is removed.
 * Windows: a running image can be renamed but not overwritten, so current is
 * renamed to `.old` first and staged takes its place. `.old` is scheduled for
 * deletion at reboot and cleaned by cleanup_stale_executables() on the next start.
 */
class RenameExecutableReplacer : public IExecutableReplacer {
public:
    void replace(const std::filesystem::path& current, const std::filesystem::path& staged) override;

protected:
    /// Final step: put `staged` at `current`. Reports failure through `ec`.
    virtual void install(const std::filesystem::path& staged, const std::filesystem::path& current,
                         std::error_code& ec);
};

/// `<exe>.old`
[[nodiscard]] std::filesystem::path old_executable_path(const std::filesystem::path& exe);

/**
 * @brief Remove a leftover `<exe>.old` from a previous update. Failures are logged only.
 * @return True if a stale file was removed.
 */
bool cleanup_stale_executables(const std::filesystem::path& exe);

/**
 * @brief Absolute path of the running executable.
 * @throws UpdateError(SwapError) if it cannot be determined.
 */
[[nodiscard]] std::filesystem::path current_executable_path();

} // namespace pixtrim

#endif // PIXTRIM_EXECUTABLE_REPLACER_HPP
