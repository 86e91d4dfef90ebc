//
// Created by Giuseppe Francione on 07/10/25.
//

#ifndef PIXTRIM_RANDOM_UTILS_HPP
#define PIXTRIM_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Thread-local random helpers for unique temporary file names.
 */
namespace RandomUtils {

    unsigned long long next_u64();

    /**
     * @brief Hex suffix for temp siblings ("photo.jpg.3f9a...tmp").
     * @return 16 lowercase hex digits.
     */
    std::string random_suffix();

} // namespace RandomUtils

#endif // PIXTRIM_RANDOM_UTILS_HPP
