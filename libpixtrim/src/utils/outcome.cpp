//
// Created by Giuseppe Francione on 02/12/25.
//

#include "../../include/outcome.hpp"

namespace pixtrim {

const char* to_string(const OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Optimized: return "Optimized";
        case OutcomeStatus::Skipped:   return "Skipped";
        case OutcomeStatus::Failed:    return "Failed";
    }
    return "Unknown";
}

double OptimizationOutcome::saved_percent() const {
    if (status != OutcomeStatus::Optimized || original_size == 0 || optimized_size >= original_size) {
        return 0.0;
    }
    return 100.0 * (1.0 - static_cast<double>(optimized_size) / static_cast<double>(original_size));
}

} // namespace pixtrim
