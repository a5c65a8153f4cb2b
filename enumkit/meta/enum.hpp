/*!
 * \file enum.hpp
 * \brief Enum utilities for host enum types described through EnumTraits
 * \author Max Qian <lightapt.com>
 * \date 2023-03-29
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_HPP
#define ENUMKIT_META_ENUM_HPP

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include "enumkit/meta/domain_registry.hpp"
#include "enumkit/meta/enum_cache.hpp"
#include "enumkit/meta/enum_format.hpp"
#include "enumkit/meta/member.hpp"

namespace enumkit::meta {

template <typename T>
concept EnumerationType = std::is_enum_v<T>;

/**
 * \brief One constant of a host enum as declared in EnumTraits::members()
 */
template <EnumerationType T>
struct EnumEntry {
    T value;
    std::string name;
    TagList tags;
};

// **EnumTraits base structure**
//
// Specialise for each enum to describe:
//   using enum_type, underlying_type
//   static constexpr bool is_flags
//   static constexpr std::string_view type_name
//   static auto members() -> std::vector<EnumEntry<T>>
// and optionally
//   static auto is_valid(T) -> bool
// to replace the built-in validity rule.
template <typename T>
struct EnumTraits {
    static_assert(std::is_enum_v<T>, "T must be an enum type");

    using enum_type = T;
    using underlying_type = std::underlying_type_t<T>;

    static constexpr bool is_flags = false;
    static constexpr std::string_view type_name = "Unknown";
};

template <typename T>
concept DescribedEnum = EnumerationType<T> && requires {
    {
        EnumTraits<T>::members()
    } -> std::convertible_to<std::vector<EnumEntry<T>>>;
    { EnumTraits<T>::is_flags } -> std::convertible_to<bool>;
    { EnumTraits<T>::type_name } -> std::convertible_to<std::string_view>;
};

template <typename T>
concept CustomValidatedEnum = DescribedEnum<T> && requires(T value) {
    { EnumTraits<T>::is_valid(value) } -> std::convertible_to<bool>;
};

template <typename T>
concept FlagEnum = DescribedEnum<T> && EnumTraits<T>::is_flags;

template <DescribedEnum T>
using enum_cache_t = EnumCache<std::underlying_type_t<T>>;

/**
 * \brief Registry key of an enum type
 */
template <DescribedEnum T>
auto enum_domain_key() -> std::string {
    return std::string("enum:") + typeid(T).name();
}

/**
 * \brief Cache for enum T, built on first use
 */
template <DescribedEnum T>
auto enum_cache() -> enum_cache_t<T>& {
    using UT = std::underlying_type_t<T>;
    static const auto CACHE =
        DomainRegistry::instance().getOrCreate<enum_cache_t<T>>(
            enum_domain_key<T>(), [] {
                std::vector<RawMember<UT>> members;
                for (auto& entry : EnumTraits<T>::members()) {
                    members.push_back({static_cast<UT>(entry.value),
                                       std::move(entry.name),
                                       std::move(entry.tags)});
                }
                typename enum_cache_t<T>::Validator validator;
                if constexpr (CustomValidatedEnum<T>) {
                    validator = [](UT raw) {
                        return static_cast<bool>(
                            EnumTraits<T>::is_valid(static_cast<T>(raw)));
                    };
                }
                return std::make_shared<enum_cache_t<T>>(
                    std::string(EnumTraits<T>::type_name), std::move(members),
                    EnumTraits<T>::is_flags, defaultTagInspector,
                    std::move(validator));
            });
    return *CACHE;
}

// **Core enum operation functions**

template <EnumerationType T>
constexpr auto enum_to_integer(T value) noexcept {
    return static_cast<std::underlying_type_t<T>>(value);
}

/**
 * \brief Name of the primary member for \p value, or an empty string
 */
template <DescribedEnum T>
auto enum_name(T value) -> std::string {
    if (auto member = enum_cache<T>().getByValue(enum_to_integer(value))) {
        return std::move(member->name);
    }
    return {};
}

/**
 * \brief Enum value named \p name (primary or alias)
 */
template <DescribedEnum T>
auto enum_cast(std::string_view name, bool ignoreCase = false)
    -> std::optional<T> {
    if (auto member = enum_cache<T>().getByName(name, ignoreCase)) {
        return static_cast<T>(member->value);
    }
    return std::nullopt;
}

/**
 * \brief Parses names, numbers or any of \p formats into T
 * \throws EnumParseError, EnumOverflowError or InvalidFlagCombination
 */
template <DescribedEnum T>
auto enum_parse(std::string_view text, bool ignoreCase = false,
                typename enum_cache_t<T>::FormatList formats =
                    DEFAULT_FORMAT_ORDER) -> T {
    return static_cast<T>(enum_cache<T>().parse(text, ignoreCase, formats));
}

template <DescribedEnum T>
auto enum_try_parse(std::string_view text, bool ignoreCase = false,
                    typename enum_cache_t<T>::FormatList formats =
                        DEFAULT_FORMAT_ORDER) -> std::optional<T> {
    if (auto value = enum_cache<T>().tryParse(text, ignoreCase, formats)) {
        return static_cast<T>(*value);
    }
    return std::nullopt;
}

template <DescribedEnum T>
auto enum_format(T value, typename enum_cache_t<T>::FormatList formats)
    -> std::optional<std::string> {
    return enum_cache<T>().format(enum_to_integer(value), formats);
}

/**
 * \brief "G", "F", "D" or "X" rendering of \p value
 */
template <DescribedEnum T>
auto enum_format(T value, std::string_view formatString) -> std::string {
    return enum_cache<T>().format(enum_to_integer(value), formatString);
}

template <DescribedEnum T>
auto enum_to_string(T value) -> std::string {
    return enum_cache<T>().asString(enum_to_integer(value));
}

/**
 * \brief Range-checked conversion; with \p validate, also rejects values
 * that are not valid for T
 */
template <DescribedEnum T, std::integral I>
auto integer_to_enum(I value, bool validate = false) -> std::optional<T> {
    if (auto result = enum_cache<T>().tryToValue(value, validate)) {
        return static_cast<T>(*result);
    }
    return std::nullopt;
}

template <DescribedEnum T>
auto enum_contains(T value) -> bool {
    return enum_cache<T>().isDefined(enum_to_integer(value));
}

template <DescribedEnum T>
auto enum_is_valid(T value) -> bool {
    return enum_cache<T>().isValid(enum_to_integer(value));
}

template <DescribedEnum T>
void enum_validate(T value, std::string_view argument = "value") {
    enum_cache<T>().validate(enum_to_integer(value), argument);
}

template <DescribedEnum T>
auto enum_members(bool includeAliases = false)
    -> std::vector<EnumMember<std::underlying_type_t<T>>> {
    return enum_cache<T>().getMembers(includeAliases);
}

template <DescribedEnum T>
auto enum_count(bool includeAliases = false) -> std::size_t {
    return enum_cache<T>().count(includeAliases);
}

template <DescribedEnum T>
auto enum_description(T value) -> std::optional<std::string> {
    if (auto member = enum_cache<T>().getByValue(enum_to_integer(value))) {
        return std::move(member->description);
    }
    return std::nullopt;
}

template <DescribedEnum T>
auto enum_is_contiguous() -> bool {
    return enum_cache<T>().isContiguous();
}

// **Flag enum specific functions**

template <DescribedEnum T>
auto all_flags() -> T {
    return static_cast<T>(enum_cache<T>().allFlags());
}

template <DescribedEnum T>
auto is_valid_flag_combination(T value) -> bool {
    return enum_cache<T>().isValidFlagCombination(enum_to_integer(value));
}

template <DescribedEnum T>
auto has_any_flags(T value) -> bool {
    return enum_cache<T>().hasAnyFlags(enum_to_integer(value));
}

template <DescribedEnum T>
auto has_any_flags(T value, T mask) -> bool {
    return enum_cache<T>().hasAnyFlags(enum_to_integer(value),
                                       enum_to_integer(mask));
}

template <DescribedEnum T>
auto has_all_flags(T value) -> bool {
    return enum_cache<T>().hasAllFlags(enum_to_integer(value));
}

template <DescribedEnum T>
auto has_all_flags(T value, T mask) -> bool {
    return enum_cache<T>().hasAllFlags(enum_to_integer(value),
                                       enum_to_integer(mask));
}

template <DescribedEnum T>
auto common_flags(T value, T other) -> T {
    return static_cast<T>(enum_cache<T>().commonFlags(enum_to_integer(value),
                                                      enum_to_integer(other)));
}

template <DescribedEnum T>
auto combine_flags(T value, T other) -> T {
    return static_cast<T>(enum_cache<T>().combineFlags(
        enum_to_integer(value), enum_to_integer(other)));
}

template <DescribedEnum T>
auto combine_flags(std::initializer_list<T> flags) -> T {
    std::vector<std::underlying_type_t<T>> values;
    values.reserve(flags.size());
    for (const auto flag : flags) {
        values.push_back(enum_to_integer(flag));
    }
    return static_cast<T>(enum_cache<T>().combineFlags(
        std::span<const std::underlying_type_t<T>>(values)));
}

template <DescribedEnum T>
auto toggle_flags(T value) -> T {
    return static_cast<T>(enum_cache<T>().toggleFlags(enum_to_integer(value)));
}

template <DescribedEnum T>
auto toggle_flags(T value, T mask) -> T {
    return static_cast<T>(enum_cache<T>().toggleFlags(enum_to_integer(value),
                                                      enum_to_integer(mask)));
}

template <DescribedEnum T>
auto exclude_flags(T value, T mask) -> T {
    return static_cast<T>(enum_cache<T>().excludeFlags(
        enum_to_integer(value), enum_to_integer(mask)));
}

/**
 * \brief The single-bit flags set in \p value, lowest first
 */
template <DescribedEnum T>
auto get_flags(T value) -> std::vector<T> {
    std::vector<T> result;
    for (const auto flag : enum_cache<T>().getFlags(enum_to_integer(value))) {
        result.push_back(static_cast<T>(flag));
    }
    return result;
}

template <DescribedEnum T>
auto get_flag_count(T value) -> std::size_t {
    return enum_cache<T>().getFlagCount(enum_to_integer(value));
}

template <DescribedEnum T>
auto format_flags(T value, std::string_view delimiter = DEFAULT_FLAG_DELIMITER,
                  typename enum_cache_t<T>::FormatList formats =
                      DEFAULT_FORMAT_ORDER) -> std::optional<std::string> {
    return enum_cache<T>().formatFlags(enum_to_integer(value), delimiter,
                                       formats);
}

template <DescribedEnum T>
auto parse_flags(std::string_view text, bool ignoreCase = false,
                 std::string_view delimiter = DEFAULT_FLAG_DELIMITER,
                 typename enum_cache_t<T>::FormatList formats =
                     DEFAULT_FORMAT_ORDER) -> T {
    return static_cast<T>(
        enum_cache<T>().parseFlags(text, ignoreCase, delimiter, formats));
}

template <DescribedEnum T>
auto try_parse_flags(std::string_view text, bool ignoreCase = false,
                     std::string_view delimiter = DEFAULT_FLAG_DELIMITER,
                     typename enum_cache_t<T>::FormatList formats =
                         DEFAULT_FORMAT_ORDER) -> std::optional<T> {
    if (auto value = enum_cache<T>().tryParseFlags(text, ignoreCase,
                                                   delimiter, formats)) {
        return static_cast<T>(*value);
    }
    return std::nullopt;
}

// **Custom formats**

/**
 * \brief Registers a formatter visible to enum T only
 */
template <DescribedEnum T>
auto register_enum_format(
    typename enum_cache_t<T>::Formatter formatter) -> EnumFormat {
    return enum_cache<T>().registerFormatter(std::move(formatter));
}

/**
 * \brief Registers a formatter shared by every enum
 */
inline auto register_enum_format(GlobalFormatter formatter) -> EnumFormat {
    return registerEnumFormat(std::move(formatter));
}

// **Bitwise operators (for flag enums)**

template <FlagEnum T>
constexpr auto operator|(T lhs, T rhs) noexcept -> T {
    using UT = std::underlying_type_t<T>;
    return static_cast<T>(static_cast<UT>(lhs) | static_cast<UT>(rhs));
}

template <FlagEnum T>
constexpr auto operator|=(T& lhs, T rhs) noexcept -> T& {
    return lhs = lhs | rhs;
}

template <FlagEnum T>
constexpr auto operator&(T lhs, T rhs) noexcept -> T {
    using UT = std::underlying_type_t<T>;
    return static_cast<T>(static_cast<UT>(lhs) & static_cast<UT>(rhs));
}

template <FlagEnum T>
constexpr auto operator&=(T& lhs, T rhs) noexcept -> T& {
    return lhs = lhs & rhs;
}

template <FlagEnum T>
constexpr auto operator^(T lhs, T rhs) noexcept -> T {
    using UT = std::underlying_type_t<T>;
    return static_cast<T>(static_cast<UT>(lhs) ^ static_cast<UT>(rhs));
}

template <FlagEnum T>
constexpr auto operator^=(T& lhs, T rhs) noexcept -> T& {
    return lhs = lhs ^ rhs;
}

template <FlagEnum T>
constexpr auto operator~(T rhs) noexcept -> T {
    using UT = std::underlying_type_t<T>;
    return static_cast<T>(~static_cast<UT>(rhs));
}

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_HPP
