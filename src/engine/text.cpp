#include "text.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace incidex::engine::text {

    namespace {
        bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }
    }

    size_t utf8_length(const std::string& s) {
        size_t count = 0;
        for (unsigned char c : s) {
            if (!is_continuation(c)) ++count;
        }
        return count;
    }

    std::string utf8_truncate(const std::string& s, size_t max_chars) {
        size_t chars = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            if (is_continuation(static_cast<unsigned char>(s[i]))) continue;
            if (chars == max_chars) return s.substr(0, i);
            ++chars;
        }
        return s;
    }

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n\f\v";
        size_t start = s.find_first_not_of(ws);
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(ws);
        return s.substr(start, end - start + 1);
    }

    std::string to_lower(const std::string& s) {
        std::string data = s;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c) { return std::tolower(c); });
        return data;
    }

    std::string extension_of(const std::string& filename) {
        return to_lower(std::filesystem::path(filename).extension().string());
    }

}
