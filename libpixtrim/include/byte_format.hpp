//
// Created by Giuseppe Francione on 05/12/25.
//

#ifndef PIXTRIM_BYTE_FORMAT_HPP
#define PIXTRIM_BYTE_FORMAT_HPP

#include <cstdint>
#include <string>

namespace pixtrim {

    /**
     * @brief Human-readable size: "0 B", "512 B", "1.5 KB", "3.2 MB", "1.0 GB".
     *
     * Units are powers of 1024; anything from 1 KB up gets one decimal.
     */
    [[nodiscard]] std::string format_bytes(std::uintmax_t bytes);

} // namespace pixtrim

#endif // PIXTRIM_BYTE_FORMAT_HPP
