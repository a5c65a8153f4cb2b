/*!
 * \file enum_format.hpp
 * \brief Format selectors, pipeline defaults and the global formatter
 * registry
 * \author Max Qian <lightapt.com>
 * \date 2024-05-12
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_FORMAT_HPP
#define ENUMKIT_META_ENUM_FORMAT_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "enumkit/meta/member.hpp"

namespace enumkit::meta {

/**
 * \brief Names one value<->text strategy.
 *
 * The enumerators are the built-in strategies. Custom strategies are
 * represented by ids handed out by the formatter registries and cast to
 * EnumFormat.
 */
enum class EnumFormat : int {
    DecimalValue = 0,
    HexadecimalValue = 1,
    Name = 2,
    Description = 3,
    SerializedName = 4,
};

inline constexpr std::string_view DEFAULT_FLAG_DELIMITER = ", ";

inline constexpr std::array<EnumFormat, 2> DEFAULT_FORMAT_ORDER{
    EnumFormat::Name, EnumFormat::DecimalValue};

inline constexpr int FIRST_GLOBAL_CUSTOM_FORMAT = 100;
inline constexpr int FIRST_DOMAIN_CUSTOM_FORMAT = 200;
inline constexpr std::size_t CUSTOM_FORMAT_CAPACITY = 100;

static_assert(FIRST_GLOBAL_CUSTOM_FORMAT + static_cast<int>(CUSTOM_FORMAT_CAPACITY) <=
                  FIRST_DOMAIN_CUSTOM_FORMAT,
              "global and per-domain custom format ids must not overlap");

/**
 * \brief Formatter usable with every domain
 */
using GlobalFormatter =
    std::function<std::optional<std::string>(const EnumMemberView&)>;

[[nodiscard]] constexpr auto isBuiltInFormat(EnumFormat format) noexcept
    -> bool {
    const auto id = static_cast<int>(format);
    return id >= static_cast<int>(EnumFormat::DecimalValue) &&
           id <= static_cast<int>(EnumFormat::SerializedName);
}

[[nodiscard]] constexpr auto isGlobalCustomFormat(EnumFormat format) noexcept
    -> bool {
    const auto id = static_cast<int>(format);
    return id >= FIRST_GLOBAL_CUSTOM_FORMAT &&
           id < FIRST_GLOBAL_CUSTOM_FORMAT +
                    static_cast<int>(CUSTOM_FORMAT_CAPACITY);
}

[[nodiscard]] constexpr auto isDomainCustomFormat(EnumFormat format) noexcept
    -> bool {
    const auto id = static_cast<int>(format);
    return id >= FIRST_DOMAIN_CUSTOM_FORMAT &&
           id < FIRST_DOMAIN_CUSTOM_FORMAT +
                    static_cast<int>(CUSTOM_FORMAT_CAPACITY);
}

/**
 * \brief Registers a formatter shared by every domain.
 *
 * The registry is process-wide and append-only: it is created on the first
 * registration and only read afterwards.
 *
 * \return The selector id for the new formatter, starting at
 * FIRST_GLOBAL_CUSTOM_FORMAT.
 * \throws enumkit::error::InvalidArgument if \p formatter is empty.
 * \throws enumkit::error::OutOfRange when CUSTOM_FORMAT_CAPACITY formatters
 * are already registered.
 */
auto registerEnumFormat(GlobalFormatter formatter) -> EnumFormat;

/**
 * \brief Globally registered formatter for \p format, or nullptr if no
 * formatter was registered under that id.
 */
[[nodiscard]] auto getGlobalFormatter(EnumFormat format)
    -> std::shared_ptr<const GlobalFormatter>;

/**
 * \brief Selector name for diagnostics ("Name", "Custom(101)", ...)
 */
[[nodiscard]] auto toString(EnumFormat format) -> std::string;

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_FORMAT_HPP
