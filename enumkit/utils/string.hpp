/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: String helpers for name lookup and text parsing

**************************************************/

#ifndef ENUMKIT_UTILS_STRING_HPP
#define ENUMKIT_UTILS_STRING_HPP

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace enumkit::utils {

inline constexpr std::string_view WHITESPACE = " \n\r\t\f\v";

/**
 * @brief Trims a string_view.
 *
 * @param line The string_view to trim.
 * @param symbols The symbols to trim.
 * @return The trimmed string.
 */
[[nodiscard("the result of trim is not used")]]
auto trim(std::string_view line,
          std::string_view symbols = WHITESPACE) -> std::string;

/**
 * @brief Same as trim() but returns a view into @p line.
 */
[[nodiscard]] auto trimView(std::string_view line,
                            std::string_view symbols = WHITESPACE) noexcept
    -> std::string_view;

/**
 * @brief ASCII case-insensitive equality.
 */
[[nodiscard]] auto iequals(std::string_view lhs,
                           std::string_view rhs) noexcept -> bool;

/**
 * @brief Splits @p str on every occurrence of @p delimiter.
 *
 * Empty pieces are kept, so "a,,b" yields three tokens and "" yields one
 * empty token. The returned views point into @p str.
 */
[[nodiscard("the result of splitString is not used")]]
auto splitString(std::string_view str, std::string_view delimiter)
    -> std::vector<std::string_view>;

/**
 * @brief Concatenates strings with a delimiter between each pair.
 */
[[nodiscard("the result of joinStrings is not used")]]
auto joinStrings(std::span<const std::string> strings,
                 std::string_view delimiter) -> std::string;

/**
 * @brief Transparent hash so unordered containers keyed by std::string can
 * be probed with a std::string_view.
 */
struct StringHash {
    using is_transparent = void;

    auto operator()(std::string_view str) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(str);
    }
};

/**
 * @brief Hash consistent with iequals().
 */
struct CaseInsensitiveHash {
    using is_transparent = void;

    auto operator()(std::string_view str) const noexcept -> std::size_t;
};

struct CaseInsensitiveEqual {
    using is_transparent = void;

    auto operator()(std::string_view lhs,
                    std::string_view rhs) const noexcept -> bool {
        return iequals(lhs, rhs);
    }
};

}  // namespace enumkit::utils

#endif  // ENUMKIT_UTILS_STRING_HPP
