#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "enumkit/macro.hpp"
#include "enumkit/meta/enum.hpp"

namespace enumkit::test {

enum class Color { Red, Green, Blue, Yellow };

enum class Permissions : std::uint8_t {
    None = 0,
    Read = 1,
    Write = 2,
    Execute = 4,
    All = Read | Write | Execute
};

enum class Level : std::int8_t { Low = -1, Normal = 0, High = 1 };

// every channel from 1 to 16 is usable, only two are named
enum class Channel : std::uint8_t { Primary = 1, Backup = 2 };

}  // namespace enumkit::test

namespace enumkit::meta {

template <>
struct EnumTraits<test::Color> {
    using enum_type = test::Color;
    using underlying_type = std::underlying_type_t<test::Color>;

    static constexpr bool is_flags = false;
    static constexpr std::string_view type_name = "Color";

    static auto members() -> std::vector<EnumEntry<test::Color>> {
        return {{test::Color::Red, "Red", {Description{"The color red"}}},
                {test::Color::Green, "Green"},
                {test::Color::Blue, "Blue", {SerializedName{"blue"}}},
                {test::Color::Yellow, "Yellow"}};
    }
};

template <>
struct EnumTraits<test::Permissions> {
    using enum_type = test::Permissions;
    using underlying_type = std::underlying_type_t<test::Permissions>;

    static constexpr bool is_flags = true;
    static constexpr std::string_view type_name = "Permissions";

    static auto members() -> std::vector<EnumEntry<test::Permissions>> {
        return {{test::Permissions::None, "None"},
                {test::Permissions::Read, "Read"},
                {test::Permissions::Write, "Write"},
                {test::Permissions::Execute, "Execute"},
                {test::Permissions::All, "All"},
                {test::Permissions::All, "RWX"}};
    }
};

template <>
struct EnumTraits<test::Level> {
    using enum_type = test::Level;
    using underlying_type = std::underlying_type_t<test::Level>;

    static constexpr bool is_flags = false;
    static constexpr std::string_view type_name = "Level";

    // declared out of order on purpose
    static auto members() -> std::vector<EnumEntry<test::Level>> {
        return {{test::Level::High, "High"},
                {test::Level::Low, "Low"},
                {test::Level::Normal, "Normal"}};
    }
};

template <>
struct EnumTraits<test::Channel> {
    using enum_type = test::Channel;
    using underlying_type = std::uint8_t;

    static constexpr bool is_flags = false;
    static constexpr std::string_view type_name = "Channel";

    static auto members() -> std::vector<EnumEntry<test::Channel>> {
        return {{test::Channel::Primary, "Primary"},
                {test::Channel::Backup, "Backup"}};
    }

    static auto is_valid(test::Channel channel) -> bool {
        const auto raw = static_cast<std::uint8_t>(channel);
        return raw >= 1 && raw <= 16;
    }
};

}  // namespace enumkit::meta

namespace enumkit::test {

using enumkit::meta::operator|;
using enumkit::meta::operator&;
using enumkit::meta::operator^;
using enumkit::meta::operator~;
using enumkit::meta::operator|=;
using enumkit::meta::operator&=;
using enumkit::meta::operator^=;

static_assert(meta::DescribedEnum<Color>);
static_assert(meta::FlagEnum<Permissions>);
static_assert(!meta::FlagEnum<Color>);

class EnumTest : public ::testing::Test {};

TEST_F(EnumTest, EnumToString) {
    EXPECT_EQ(meta::enum_name(Color::Red), "Red");
    EXPECT_EQ(meta::enum_name(Color::Yellow), "Yellow");
    EXPECT_EQ(meta::enum_name(Permissions::All), "All");
    EXPECT_EQ(meta::enum_name(static_cast<Color>(42)), "");

    EXPECT_EQ(meta::enum_to_string(Color::Blue), "Blue");
    EXPECT_EQ(meta::enum_to_string(static_cast<Color>(42)), "42");
    EXPECT_EQ(meta::enum_to_string(Permissions::Read | Permissions::Execute),
              "Read, Execute");
}

TEST_F(EnumTest, StringToEnum) {
    EXPECT_EQ(meta::enum_cast<Color>("Green"), Color::Green);
    EXPECT_FALSE(meta::enum_cast<Color>("Purple").has_value());
    EXPECT_FALSE(meta::enum_cast<Color>("green").has_value());
    EXPECT_EQ(meta::enum_cast<Color>("gReEn", true), Color::Green);
    // alias
    EXPECT_EQ(meta::enum_cast<Permissions>("RWX"), Permissions::All);
}

TEST_F(EnumTest, EnumToInteger) {
    EXPECT_EQ(meta::enum_to_integer(Color::Blue), 2);
    EXPECT_EQ(meta::enum_to_integer(Permissions::All), 7);
    EXPECT_EQ(meta::enum_to_integer(Level::Low), -1);
}

TEST_F(EnumTest, IntegerToEnum) {
    EXPECT_EQ(meta::integer_to_enum<Color>(3), Color::Yellow);
    EXPECT_EQ(meta::integer_to_enum<Color>(42), static_cast<Color>(42));
    EXPECT_FALSE(meta::integer_to_enum<Color>(42, true).has_value());
    EXPECT_FALSE(meta::integer_to_enum<Permissions>(300).has_value());
    EXPECT_EQ(meta::integer_to_enum<Permissions>(6, true),
              Permissions::Write | Permissions::Execute);
    EXPECT_FALSE(meta::integer_to_enum<Permissions>(8, true).has_value());
}

TEST_F(EnumTest, ContainsAndValidate) {
    EXPECT_TRUE(meta::enum_contains(Color::Red));
    EXPECT_FALSE(meta::enum_contains(static_cast<Color>(4)));
    EXPECT_FALSE(meta::enum_contains(Permissions::Read | Permissions::Write));
    EXPECT_TRUE(meta::enum_is_valid(Permissions::Read | Permissions::Write));
    EXPECT_NO_THROW(meta::enum_validate(Color::Blue));
    EXPECT_THROW(meta::enum_validate(static_cast<Color>(9), "color"),
                 enumkit::error::InvalidArgument);
}

TEST_F(EnumTest, TraitsValidatorIsConsulted) {
    using enumkit::test::Channel;
    static_assert(meta::CustomValidatedEnum<Channel>);
    static_assert(!meta::CustomValidatedEnum<Color>);

    EXPECT_TRUE(meta::enum_cache<Channel>().hasCustomValidator());
    EXPECT_TRUE(meta::enum_is_valid(static_cast<Channel>(12)));
    EXPECT_FALSE(meta::enum_contains(static_cast<Channel>(12)));
    EXPECT_FALSE(meta::enum_is_valid(static_cast<Channel>(0)));
    EXPECT_NO_THROW(meta::enum_validate(static_cast<Channel>(16)));
    EXPECT_THROW(meta::enum_validate(static_cast<Channel>(17), "channel"),
                 enumkit::error::InvalidArgument);
    EXPECT_EQ(meta::integer_to_enum<Channel>(9, true), static_cast<Channel>(9));
    EXPECT_FALSE(meta::integer_to_enum<Channel>(40, true).has_value());
}

TEST_F(EnumTest, MembersAndMetadata) {
    EXPECT_EQ(meta::enum_count<Color>(), 4);
    EXPECT_EQ(meta::enum_count<Permissions>(), 5);
    EXPECT_EQ(meta::enum_count<Permissions>(true), 6);
    EXPECT_TRUE(meta::enum_is_contiguous<Color>());
    EXPECT_FALSE(meta::enum_is_contiguous<Permissions>());

    const auto members = meta::enum_members<Color>();
    ASSERT_EQ(members.size(), 4);
    EXPECT_EQ(members[2].name, "Blue");
    EXPECT_EQ(meta::enum_description(Color::Red), "The color red");
    EXPECT_FALSE(meta::enum_description(Color::Green).has_value());
}

TEST_F(EnumTest, SignedUnderlyingType) {
    const auto members = meta::enum_members<Level>();
    ASSERT_EQ(members.size(), 3);
    EXPECT_EQ(members.front().name, "Low");
    EXPECT_TRUE(meta::enum_is_contiguous<Level>());
    EXPECT_EQ(meta::enum_parse<Level>("-1"), Level::Low);
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(meta::enum_parse<Level>("128")),
                 meta::EnumOverflowError);
}

TEST_F(EnumTest, ParseAndFormat) {
    EXPECT_EQ(meta::enum_parse<Color>("Yellow"), Color::Yellow);
    EXPECT_EQ(meta::enum_parse<Color>(" yellow ", true), Color::Yellow);
    EXPECT_EQ(meta::enum_parse<Color>("1"), Color::Green);
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(meta::enum_parse<Color>("Purple")),
                 meta::EnumParseError);
    EXPECT_FALSE(meta::enum_try_parse<Color>("Purple").has_value());

    const std::array serialized{meta::EnumFormat::SerializedName};
    EXPECT_EQ(meta::enum_parse<Color>("blue", false, serialized), Color::Blue);
    EXPECT_EQ(meta::enum_format(Color::Blue, serialized), "blue");
    EXPECT_EQ(meta::enum_format(Color::Blue, "D"), "2");
    EXPECT_EQ(meta::enum_format(Permissions::All, "X"), "07");
}

TEST_F(EnumTest, BitwiseOperations) {
    auto permissions = Permissions::Read | Permissions::Write;
    EXPECT_EQ(meta::enum_to_integer(permissions), 3);
    EXPECT_EQ(permissions & Permissions::Read, Permissions::Read);
    EXPECT_EQ(permissions ^ Permissions::Write, Permissions::Read);
    EXPECT_EQ(meta::enum_to_integer(~Permissions::None), 0xFF);

    permissions |= Permissions::Execute;
    EXPECT_EQ(permissions, Permissions::All);
    permissions &= ~Permissions::Write;
    EXPECT_EQ(meta::enum_to_integer(permissions), 5);
    permissions ^= Permissions::Read;
    EXPECT_EQ(permissions, Permissions::Execute);
}

TEST_F(EnumTest, FlagEnumFunctions) {
    EXPECT_EQ(meta::all_flags<Permissions>(), Permissions::All);
    EXPECT_TRUE(meta::is_valid_flag_combination(Permissions::All));
    EXPECT_FALSE(
        meta::is_valid_flag_combination(static_cast<Permissions>(8)));

    const auto readWrite = Permissions::Read | Permissions::Write;
    EXPECT_TRUE(meta::has_any_flags(readWrite, Permissions::Write));
    EXPECT_FALSE(meta::has_any_flags(readWrite, Permissions::Execute));
    EXPECT_TRUE(meta::has_any_flags(readWrite));
    EXPECT_FALSE(meta::has_all_flags(readWrite));
    EXPECT_TRUE(meta::has_all_flags(Permissions::All));
    EXPECT_TRUE(meta::has_all_flags(readWrite, Permissions::Read));

    EXPECT_EQ(meta::common_flags(readWrite, Permissions::All), readWrite);
    EXPECT_EQ(meta::combine_flags(Permissions::Read, Permissions::Execute),
              static_cast<Permissions>(5));
    EXPECT_EQ(meta::combine_flags({Permissions::Read, Permissions::Write,
                                   Permissions::Execute}),
              Permissions::All);
    EXPECT_EQ(meta::toggle_flags(readWrite), Permissions::Execute);
    EXPECT_EQ(meta::toggle_flags(readWrite, Permissions::Read),
              Permissions::Write);
    EXPECT_EQ(meta::exclude_flags(Permissions::All, Permissions::Write),
              static_cast<Permissions>(5));

    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(meta::all_flags<Color>()),
                 enumkit::error::UnlawfulOperation);
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(meta::combine_flags(
                     Permissions::Read, static_cast<Permissions>(64))),
                 meta::InvalidFlagCombination);
}

TEST_F(EnumTest, GetFlags) {
    EXPECT_EQ(meta::get_flags(Permissions::All),
              (std::vector<Permissions>{Permissions::Read, Permissions::Write,
                                        Permissions::Execute}));
    EXPECT_TRUE(meta::get_flags(Permissions::None).empty());
    EXPECT_EQ(meta::get_flag_count(Permissions::Read | Permissions::Execute),
              2);
}

TEST_F(EnumTest, FlagSerialization) {
    EXPECT_EQ(meta::format_flags(Permissions::All), "All");
    EXPECT_EQ(meta::format_flags(Permissions::Write | Permissions::Execute),
              "Write, Execute");
    EXPECT_EQ(meta::format_flags(Permissions::Read | Permissions::Write, "|"),
              "Read|Write");
    EXPECT_EQ(meta::format_flags(Permissions::None), "None");
}

TEST_F(EnumTest, FlagDeserialization) {
    EXPECT_EQ(meta::parse_flags<Permissions>("Read, Write"),
              Permissions::Read | Permissions::Write);
    EXPECT_EQ(meta::parse_flags<Permissions>("read|execute", true, "|"),
              Permissions::Read | Permissions::Execute);
    EXPECT_EQ(meta::parse_flags<Permissions>("RWX"), Permissions::All);
    EXPECT_FALSE(meta::try_parse_flags<Permissions>("Read, Fly").has_value());
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(meta::parse_flags<Permissions>("8")),
                 meta::InvalidFlagCombination);
}

TEST_F(EnumTest, CustomFormats) {
    const auto local = meta::register_enum_format<Color>(
        [](const meta::enum_cache_t<Color>::member_type& member)
            -> std::optional<std::string> { return "c:" + member.name; });
    const std::array localFormat{local};
    EXPECT_EQ(meta::enum_format(Color::Green, localFormat), "c:Green");
    EXPECT_EQ(meta::enum_parse<Color>("c:Yellow", false, localFormat),
              Color::Yellow);

    const auto global = meta::register_enum_format(
        [](const meta::EnumMemberView& member) -> std::optional<std::string> {
            return std::string(member.name.substr(0, 1));
        });
    const std::array globalFormat{global};
    EXPECT_EQ(meta::enum_format(Permissions::Write, globalFormat), "W");
    EXPECT_EQ(meta::enum_format(Color::Blue, globalFormat), "B");
}

TEST_F(EnumTest, CacheIsSharedThroughTheRegistry) {
    auto& cache = meta::enum_cache<Color>();
    EXPECT_EQ(&cache, &meta::enum_cache<Color>());
    const auto registered =
        meta::DomainRegistry::instance().find<meta::enum_cache_t<Color>>(
            meta::enum_domain_key<Color>());
    EXPECT_EQ(registered.get(), &cache);
    EXPECT_EQ(cache.name(), "Color");
}

}  // namespace enumkit::test
