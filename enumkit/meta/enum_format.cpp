/*!
 * \file enum_format.cpp
 * \brief Global formatter registry
 * \author Max Qian <lightapt.com>
 * \date 2024-05-12
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#include "enum_format.hpp"

#include <fmt/format.h>

#include "enumkit/meta/formatter_registry.hpp"

namespace enumkit::meta {

namespace {
auto globalFormatters() -> FormatterRegistry<GlobalFormatter>& {
    static FormatterRegistry<GlobalFormatter> registry(
        "global", FIRST_GLOBAL_CUSTOM_FORMAT, CUSTOM_FORMAT_CAPACITY);
    return registry;
}
}  // namespace

auto registerEnumFormat(GlobalFormatter formatter) -> EnumFormat {
    return static_cast<EnumFormat>(
        globalFormatters().add(std::move(formatter)));
}

auto getGlobalFormatter(EnumFormat format)
    -> std::shared_ptr<const GlobalFormatter> {
    return globalFormatters().get(static_cast<int>(format));
}

auto toString(EnumFormat format) -> std::string {
    switch (format) {
        case EnumFormat::DecimalValue:
            return "DecimalValue";
        case EnumFormat::HexadecimalValue:
            return "HexadecimalValue";
        case EnumFormat::Name:
            return "Name";
        case EnumFormat::Description:
            return "Description";
        case EnumFormat::SerializedName:
            return "SerializedName";
    }
    return fmt::format("Custom({})", static_cast<int>(format));
}

}  // namespace enumkit::meta
