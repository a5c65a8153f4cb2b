/**
 * Examples for enumkit::meta enum utilities
 *
 * 1. Names, parsing and integer conversion
 * 2. Descriptions and serialized names
 * 3. Flag enum operations
 * 4. Custom formats
 * 5. Runtime domains
 */

#include "enumkit/meta/enum.hpp"

#include <array>
#include <cstdint>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

using namespace enumkit::meta;

enum class HttpStatus {
    OK = 200,
    Created = 201,
    NoContent = 204,
    BadRequest = 400,
    NotFound = 404,
    ServerError = 500
};

enum class Permission : std::uint8_t {
    None = 0x00,
    Read = 0x01,
    Write = 0x02,
    Execute = 0x04,
    Admin = 0x08,
    All = Read | Write | Execute | Admin
};

namespace enumkit::meta {

template <>
struct EnumTraits<HttpStatus> {
    using enum_type = HttpStatus;
    using underlying_type = int;

    static constexpr bool is_flags = false;
    static constexpr std::string_view type_name = "HttpStatus";

    static auto members() -> std::vector<EnumEntry<HttpStatus>> {
        return {
            {HttpStatus::OK, "OK", {Description{"Request succeeded"}}},
            {HttpStatus::Created, "Created",
             {Description{"Resource created"}, SerializedName{"created"}}},
            {HttpStatus::NoContent, "NoContent"},
            {HttpStatus::BadRequest, "BadRequest",
             {Description{"Malformed request"}}},
            {HttpStatus::NotFound, "NotFound",
             {Description{"Resource not found"}, SerializedName{"not_found"}}},
            {HttpStatus::ServerError, "ServerError"},
        };
    }
};

template <>
struct EnumTraits<Permission> {
    using enum_type = Permission;
    using underlying_type = std::uint8_t;

    static constexpr bool is_flags = true;
    static constexpr std::string_view type_name = "Permission";

    static auto members() -> std::vector<EnumEntry<Permission>> {
        return {{Permission::None, "None"},       {Permission::Read, "Read"},
                {Permission::Write, "Write"},     {Permission::Execute, "Execute"},
                {Permission::Admin, "Admin"},     {Permission::All, "All"},
                {Permission::Admin, "Root", {PrimaryMember{}}}};
    }
};

}  // namespace enumkit::meta

namespace {

void basicConversions() {
    std::cout << "=== Names and parsing ===\n";
    std::cout << "HttpStatus::NotFound -> " << enum_name(HttpStatus::NotFound)
              << '\n';
    std::cout << "\"created\" (ignore case) -> "
              << enum_to_integer(*enum_cast<HttpStatus>("created", true))
              << '\n';
    std::cout << "parse \"500\" -> " << enum_to_string(enum_parse<HttpStatus>("500"))
              << '\n';
    std::cout << "302 as HttpStatus -> "
              << enum_to_string(static_cast<HttpStatus>(302)) << '\n';
    std::cout << "302 is defined: " << std::boolalpha
              << enum_contains(static_cast<HttpStatus>(302)) << '\n';

    if (auto status = integer_to_enum<HttpStatus>(404, true)) {
        std::cout << "404 -> " << enum_name(*status) << '\n';
    }
    try {
        enum_validate(static_cast<HttpStatus>(999), "status");
    } catch (const enumkit::error::InvalidArgument& e) {
        std::cout << "validate(999): " << e.what() << '\n';
    }
}

void descriptions() {
    std::cout << "\n=== Descriptions ===\n";
    const std::array order{EnumFormat::Description, EnumFormat::Name};
    for (const auto& member : enum_members<HttpStatus>()) {
        std::cout << member.value << ": "
                  << *enum_format(static_cast<HttpStatus>(member.value), order)
                  << '\n';
    }

    const std::array serialized{EnumFormat::SerializedName};
    std::cout << "\"not_found\" -> "
              << enum_name(enum_parse<HttpStatus>("not_found", false, serialized))
              << '\n';
}

void flagOperations() {
    std::cout << "\n=== Flags ===\n";
    auto permissions = Permission::Read | Permission::Write;
    std::cout << "Read | Write -> " << enum_to_string(permissions) << '\n';
    // "Root" carries PrimaryMember, so it is the canonical name of Admin
    std::cout << "Admin -> " << enum_name(Permission::Admin) << '\n';
    std::cout << "all flags -> " << enum_to_string(all_flags<Permission>())
              << '\n';
    std::cout << "has Write: " << has_any_flags(permissions, Permission::Write)
              << '\n';
    std::cout << "toggled -> " << enum_to_string(toggle_flags(permissions))
              << '\n';

    permissions |= Permission::Execute;
    std::cout << "flags of " << enum_format(permissions, "D") << ':';
    for (const auto flag : get_flags(permissions)) {
        std::cout << ' ' << enum_name(flag);
    }
    std::cout << '\n';

    std::cout << "format_flags with \" | \" -> "
              << *format_flags(permissions, " | ") << '\n';
    std::cout << "parse \"read, root\" -> "
              << enum_format(parse_flags<Permission>("read, root", true), "X")
              << '\n';

    if (!try_parse_flags<Permission>("Read, Fly")) {
        std::cout << "\"Read, Fly\" is not a valid flag list\n";
    }
    try {
        (void)parse_flags<Permission>("Read, 16");
    } catch (const InvalidFlagCombination& e) {
        std::cout << "parse \"Read, 16\": " << e.what() << '\n';
    }
}

void customFormats() {
    std::cout << "\n=== Custom formats ===\n";
    const auto code = register_enum_format<HttpStatus>(
        [](const enum_cache_t<HttpStatus>::member_type& member)
            -> std::optional<std::string> {
            return "HTTP " + std::to_string(member.value);
        });
    const std::array codeFormat{code};
    std::cout << "NotFound -> " << *enum_format(HttpStatus::NotFound, codeFormat)
              << '\n';
    std::cout << "\"HTTP 201\" -> "
              << enum_name(enum_parse<HttpStatus>("HTTP 201", false, codeFormat))
              << '\n';

    const auto lower = register_enum_format(
        [](const EnumMemberView& member) -> std::optional<std::string> {
            std::string text(member.name);
            for (auto& ch : text) {
                if (ch >= 'A' && ch <= 'Z') {
                    ch = static_cast<char>(ch - 'A' + 'a');
                }
            }
            return text;
        });
    const std::array lowerFormat{lower};
    std::cout << "Execute -> " << *enum_format(Permission::Execute, lowerFormat)
              << '\n';
}

void runtimeDomains() {
    std::cout << "\n=== Runtime domains ===\n";
    auto ports = DomainRegistry::instance().registerDomain<std::uint16_t>(
        "ports", {{22, "Ssh"}, {80, "Http"}, {443, "Https"}, {443, "Tls"}},
        false);
    std::cout << "Tls -> " << ports->parse("Tls") << '\n';
    std::cout << "443 -> " << ports->asString(443) << '\n';
    std::cout << "contiguous: " << ports->isContiguous() << '\n';
    for (const auto& name : ports->names(true)) {
        std::cout << "  " << name << '\n';
    }
}

}  // namespace

auto main() -> int {
    spdlog::set_level(spdlog::level::debug);

    basicConversions();
    descriptions();
    flagOperations();
    customFormats();
    runtimeDomains();
    return 0;
}
