//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef PPA_STRING_UTILS_HPP
#define PPA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief Small string helpers used by the catalog, config and reporting code.
 */

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace ppa::string_utils {

    inline std::string_view trim(std::string_view s) noexcept {
        const auto first = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        s.remove_prefix(static_cast<std::size_t>(first - s.begin()));
        const auto last = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - last));
    }

    /**
     * Splits on a single character; empty fields are kept.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits text into lines the way Python's str.splitlines() does for
     * "\n", "\r\n" and "\r" terminators. A trailing terminator does not
     * produce an empty final line.
     */
    inline std::vector<std::string_view> split_lines(std::string_view s) {
        std::vector<std::string_view> lines;
        std::size_t start = 0;
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\n' || s[i] == '\r') {
                lines.push_back(s.substr(start, i - start));
                if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') {
                    ++i;
                }
                start = i + 1;
            }
        }
        if (start < s.size()) {
            lines.push_back(s.substr(start));
        }
        return lines;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::ostringstream oss;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                oss << delimiter;
            }
            oss << part;
            first = false;
        }
        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    inline std::string to_upper(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    inline std::string replace_all(std::string_view s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return std::string(s);
        }

        std::string result;
        result.reserve(s.size());

        std::size_t pos = 0;
        std::size_t found;

        while ((found = s.find(from, pos)) != std::string_view::npos) {
            result.append(s, pos, found - pos);
            result.append(to);
            pos = found + from.size();
        }

        result.append(s, pos, s.size() - pos);
        return result;
    }

    /**
     * Returns the text after the last '.', or the whole string.
     */
    inline std::string_view last_segment(const std::string_view dotted) noexcept {
        const auto pos = dotted.rfind('.');
        return pos == std::string_view::npos ? dotted : dotted.substr(pos + 1);
    }

}  // namespace ppa::string_utils

#endif //PPA_STRING_UTILS_HPP
