//
// Created by Giuseppe Francione on 05/12/25.
//

#ifndef PIXTRIM_EXIT_STATUS_HPP
#define PIXTRIM_EXIT_STATUS_HPP

#include "outcome.hpp"

namespace pixtrim {

    inline constexpr int kExitOk = 0;
    inline constexpr int kExitFatal = 1;       ///< setup error or failed update
    inline constexpr int kExitFileFailed = 2;  ///< only with --strict
    inline constexpr int kExitInterrupted = 130;

    /**
     * @brief Process exit code for a finished run.
     *
     * Interrupted runs win over everything else. Per-file failures only change
     * the code when `strict` is set.
     */
    [[nodiscard]] int exit_status(const RunSummary& summary, bool strict) noexcept;

} // namespace pixtrim

#endif // PIXTRIM_EXIT_STATUS_HPP
