#pragma once

#include <string>

namespace incidex::engine::text {

    /**
     * @brief Number of UTF-8 code points in s (invalid lead bytes count as one).
     */
    size_t utf8_length(const std::string& s);

    /**
     * @brief Keeps at most max_chars code points, never splitting a sequence.
     */
    std::string utf8_truncate(const std::string& s, size_t max_chars);

    std::string trim(const std::string& s);
    std::string to_lower(const std::string& s);

    /**
     * @brief Lowercased extension including the dot, e.g. ".csv".
     */
    std::string extension_of(const std::string& filename);

}
