//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/exit_status.hpp"

namespace pixtrim {

int exit_status(const RunSummary& summary, const bool strict) noexcept {
    if (summary.cancelled) return kExitInterrupted;
    if (strict && summary.failed > 0) return kExitFileFailed;
    return kExitOk;
}

} // namespace pixtrim
