/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: String helpers for name lookup and text parsing

**************************************************/

#include "string.hpp"

#include <algorithm>

namespace enumkit::utils {

namespace {
constexpr auto foldAscii(char c) noexcept -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}
}  // namespace

auto trim(std::string_view line, std::string_view symbols) -> std::string {
    return std::string(trimView(line, symbols));
}

auto trimView(std::string_view line, std::string_view symbols) noexcept
    -> std::string_view {
    const auto start = line.find_first_not_of(symbols);
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = line.find_last_not_of(symbols);
    return line.substr(start, end - start + 1);
}

auto iequals(std::string_view lhs, std::string_view rhs) noexcept -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](char a, char b) { return foldAscii(a) == foldAscii(b); });
}

auto splitString(std::string_view str, std::string_view delimiter)
    -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    if (delimiter.empty()) {
        tokens.push_back(str);
        return tokens;
    }

    std::size_t start = 0;
    while (true) {
        const auto pos = str.find(delimiter, start);
        if (pos == std::string_view::npos) {
            tokens.push_back(str.substr(start));
            break;
        }
        tokens.push_back(str.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    return tokens;
}

auto joinStrings(std::span<const std::string> strings,
                 std::string_view delimiter) -> std::string {
    if (strings.empty()) {
        return {};
    }

    std::size_t totalSize = delimiter.size() * (strings.size() - 1);
    for (const auto& str : strings) {
        totalSize += str.size();
    }

    std::string result;
    result.reserve(totalSize);

    bool first = true;
    for (const auto& str : strings) {
        if (!first) {
            result.append(delimiter);
        }
        result.append(str);
        first = false;
    }
    return result;
}

auto CaseInsensitiveHash::operator()(std::string_view str) const noexcept
    -> std::size_t {
    // FNV-1a over the folded bytes
    std::size_t hash = 14695981039346656037ULL;
    for (char c : str) {
        hash ^= static_cast<unsigned char>(foldAscii(c));
        hash *= 1099511628211ULL;
    }
    return hash;
}

}  // namespace enumkit::utils
