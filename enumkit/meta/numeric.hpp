/*!
 * \file numeric.hpp
 * \brief Integer width capability used by every enum cache instantiation
 * \author Max Qian <lightapt.com>
 * \date 2024-05-12
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_NUMERIC_HPP
#define ENUMKIT_META_NUMERIC_HPP

#include <algorithm>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace enumkit::meta {

/**
 * \brief Integral types usable as the underlying type of an enum domain
 */
template <typename T>
concept EnumUnderlying =
    std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool>;

/**
 * \brief Outcome of a native numeric parse
 */
enum class NumericParseStatus {
    Ok,
    Invalid,     ///< not a number in the requested base
    OutOfRange,  ///< a number, but not representable in the width
};

/**
 * \brief Arithmetic, bitwise, conversion and text primitives for one
 * integer width.
 *
 * Bitwise and additive operations go through the unsigned counterpart so
 * that they wrap instead of overflowing for signed widths.
 */
template <EnumUnderlying T>
struct IntegralOperations {
    using value_type = T;
    using unsigned_type = std::make_unsigned_t<T>;

    static constexpr std::size_t BYTE_WIDTH = sizeof(T);

    static constexpr auto zero() noexcept -> T { return T{0}; }
    static constexpr auto one() noexcept -> T { return T{1}; }
    static constexpr auto allOnes() noexcept -> T {
        return static_cast<T>(static_cast<unsigned_type>(~unsigned_type{0}));
    }

    static constexpr auto add(T lhs, T rhs) noexcept -> T {
        return static_cast<T>(static_cast<unsigned_type>(
            static_cast<unsigned_type>(lhs) + static_cast<unsigned_type>(rhs)));
    }

    static constexpr auto subtract(T lhs, T rhs) noexcept -> T {
        return static_cast<T>(static_cast<unsigned_type>(
            static_cast<unsigned_type>(lhs) - static_cast<unsigned_type>(rhs)));
    }

    static constexpr auto bitAnd(T lhs, T rhs) noexcept -> T {
        return static_cast<T>(static_cast<unsigned_type>(lhs) &
                              static_cast<unsigned_type>(rhs));
    }

    static constexpr auto bitOr(T lhs, T rhs) noexcept -> T {
        return static_cast<T>(static_cast<unsigned_type>(lhs) |
                              static_cast<unsigned_type>(rhs));
    }

    static constexpr auto bitXor(T lhs, T rhs) noexcept -> T {
        return static_cast<T>(static_cast<unsigned_type>(lhs) ^
                              static_cast<unsigned_type>(rhs));
    }

    static constexpr auto bitNot(T value) noexcept -> T {
        return static_cast<T>(
            static_cast<unsigned_type>(~static_cast<unsigned_type>(value)));
    }

    static constexpr auto leftShift(T value, int amount) noexcept -> T {
        return static_cast<T>(static_cast<unsigned_type>(
            static_cast<unsigned_type>(value) << amount));
    }

    static constexpr auto lessThan(T lhs, T rhs) noexcept -> bool {
        return lhs < rhs;
    }

    /**
     * \brief True for zero and for values with exactly one bit set
     */
    static constexpr auto isPowerOfTwo(T value) noexcept -> bool {
        const auto bits = static_cast<unsigned_type>(value);
        return static_cast<unsigned_type>(bits & (bits - 1)) == 0;
    }

    static constexpr auto isInValueRange(std::int64_t value) noexcept -> bool {
        return std::in_range<T>(value);
    }

    static constexpr auto isInValueRange(std::uint64_t value) noexcept
        -> bool {
        return std::in_range<T>(value);
    }

    /**
     * \brief Narrowing conversion; callers check isInValueRange() first
     */
    static constexpr auto create(std::int64_t value) noexcept -> T {
        return static_cast<T>(value);
    }

    static constexpr auto create(std::uint64_t value) noexcept -> T {
        return static_cast<T>(value);
    }

    /**
     * \brief Base-10 parse with an optional leading '+' or '-'
     */
    static auto parseDecimal(std::string_view text, T& out) noexcept
        -> NumericParseStatus {
        auto digits = text;
        bool negative = false;
        if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) {
            negative = digits.front() == '-';
            digits.remove_prefix(1);
        }
        if (digits.empty() ||
            !std::all_of(digits.begin(), digits.end(),
                         [](char c) { return c >= '0' && c <= '9'; })) {
            return NumericParseStatus::Invalid;
        }

        if constexpr (std::is_unsigned_v<T>) {
            if (negative) {
                if (std::all_of(digits.begin(), digits.end(),
                                [](char c) { return c == '0'; })) {
                    out = zero();
                    return NumericParseStatus::Ok;
                }
                return NumericParseStatus::OutOfRange;
            }
        } else if (negative) {
            // from_chars takes the minus sign itself for signed widths
            digits = std::string_view(digits.data() - 1, digits.size() + 1);
        }

        T result{};
        const auto [ptr, ec] =
            std::from_chars(digits.data(), digits.data() + digits.size(), result);
        if (ec == std::errc::result_out_of_range) {
            return NumericParseStatus::OutOfRange;
        }
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return NumericParseStatus::Invalid;
        }
        out = result;
        return NumericParseStatus::Ok;
    }

    /**
     * \brief Base-16 parse with an optional "0x" prefix.
     *
     * The digits are read as the unsigned bit pattern of the width, so
     * "FF" parses to -1 for an 8-bit signed domain.
     */
    static auto parseHex(std::string_view text, T& out) noexcept
        -> NumericParseStatus {
        auto digits = text;
        if (digits.size() > 2 && digits[0] == '0' &&
            (digits[1] == 'x' || digits[1] == 'X')) {
            digits.remove_prefix(2);
        }
        if (digits.empty() ||
            !std::all_of(digits.begin(), digits.end(), [](char c) {
                return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
                       (c >= 'A' && c <= 'F');
            })) {
            return NumericParseStatus::Invalid;
        }

        unsigned_type bits{};
        const auto [ptr, ec] = std::from_chars(
            digits.data(), digits.data() + digits.size(), bits, 16);
        if (ec == std::errc::result_out_of_range) {
            return NumericParseStatus::OutOfRange;
        }
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return NumericParseStatus::Invalid;
        }
        out = static_cast<T>(bits);
        return NumericParseStatus::Ok;
    }

    static auto toDecimalString(T value) -> std::string {
        if constexpr (std::is_signed_v<T>) {
            return fmt::format("{}", static_cast<std::int64_t>(value));
        } else {
            return fmt::format("{}", static_cast<std::uint64_t>(value));
        }
    }

    /**
     * \brief Upper-case hex, zero padded to two digits per byte
     */
    static auto toHexString(T value) -> std::string {
        return fmt::format(
            "{:0{}X}",
            static_cast<std::uint64_t>(static_cast<unsigned_type>(value)),
            BYTE_WIDTH * 2);
    }
};

/**
 * \brief Requirements on a numeric capability for width T
 */
template <typename Ops, typename T>
concept NumericOperations =
    EnumUnderlying<T> &&
    requires(T a, T b, int shift, std::int64_t s64, std::uint64_t u64,
             std::string_view text, T& out) {
        { Ops::BYTE_WIDTH } -> std::convertible_to<std::size_t>;
        { Ops::zero() } -> std::same_as<T>;
        { Ops::one() } -> std::same_as<T>;
        { Ops::allOnes() } -> std::same_as<T>;
        { Ops::add(a, b) } -> std::same_as<T>;
        { Ops::subtract(a, b) } -> std::same_as<T>;
        { Ops::bitAnd(a, b) } -> std::same_as<T>;
        { Ops::bitOr(a, b) } -> std::same_as<T>;
        { Ops::bitXor(a, b) } -> std::same_as<T>;
        { Ops::bitNot(a) } -> std::same_as<T>;
        { Ops::leftShift(a, shift) } -> std::same_as<T>;
        { Ops::lessThan(a, b) } -> std::same_as<bool>;
        { Ops::isPowerOfTwo(a) } -> std::same_as<bool>;
        { Ops::isInValueRange(s64) } -> std::same_as<bool>;
        { Ops::isInValueRange(u64) } -> std::same_as<bool>;
        { Ops::create(s64) } -> std::same_as<T>;
        { Ops::create(u64) } -> std::same_as<T>;
        { Ops::parseDecimal(text, out) } -> std::same_as<NumericParseStatus>;
        { Ops::parseHex(text, out) } -> std::same_as<NumericParseStatus>;
        { Ops::toDecimalString(a) } -> std::same_as<std::string>;
        { Ops::toHexString(a) } -> std::same_as<std::string>;
    };

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_NUMERIC_HPP
