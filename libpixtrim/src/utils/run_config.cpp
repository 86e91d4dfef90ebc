//
// Created by Giuseppe Francione on 02/12/25.
//

#include "../../include/run_config.hpp"
#include <stdexcept>

namespace pixtrim {

std::string to_string(const ZopfliPolicy policy) {
    switch (policy) {
        case ZopfliPolicy::Never:    return "never";
        case ZopfliPolicy::Budgeted: return "auto";
        case ZopfliPolicy::Always:   return "always";
    }
    return "unknown";
}

void RunConfig::validate() const {
    if (input_root.empty()) {
        throw std::invalid_argument("input root must not be empty");
    }
    if (quality < 1 || quality > 100) {
        throw std::invalid_argument("quality must be in 1..100, got " + std::to_string(quality));
    }
    if (max_edge_px && *max_edge_px == 0) {
        throw std::invalid_argument("max edge must be greater than zero");
    }
    if (zopfli_iterations < 1) {
        throw std::invalid_argument("zopfli iterations must be at least 1");
    }
    if (output_root && output_root->empty()) {
        throw std::invalid_argument("output root must not be empty");
    }
}

} // namespace pixtrim
