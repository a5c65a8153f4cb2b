#include <gtest/gtest.h>

#include <any>
#include <array>
#include <compare>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "enumkit/macro.hpp"
#include "enumkit/meta/enum_cache.hpp"

using namespace enumkit::meta;

namespace {
using Cache = EnumCache<int>;
using Raw = RawMember<int>;

auto makeColors() -> std::vector<Raw> {
    return {{0, "Red", {Description{"Warm"}}},
            {1, "Green"},
            {2, "Blue", {SerializedName{"blue"}, Description{"Cool"}}},
            {3, "Yellow"}};
}
}  // namespace

class EnumCacheTest : public ::testing::Test {
protected:
    Cache colors{"Color", makeColors(), false};
    Cache duplicates{"Dup", {{1, "A"}, {1, "B"}, {2, "C"}}, false};
};

TEST_F(EnumCacheTest, LookupByValueAndName) {
    auto green = colors.getByValue(1);
    ASSERT_TRUE(green.has_value());
    EXPECT_EQ(green->name, "Green");
    EXPECT_FALSE(colors.getByValue(9).has_value());

    auto blue = colors.getByName("Blue");
    ASSERT_TRUE(blue.has_value());
    EXPECT_EQ(blue->value, 2);
    EXPECT_FALSE(colors.getByName("blue").has_value());
    EXPECT_EQ(colors.getByName("bLuE", true)->value, 2);
    EXPECT_FALSE(colors.getByName("Purple", true).has_value());
}

TEST_F(EnumCacheTest, PreferredTagIsHoistedToFront) {
    auto blue = colors.getByValue(2);
    ASSERT_TRUE(blue.has_value());
    ASSERT_EQ(blue->tags->size(), 2);
    EXPECT_NE(std::any_cast<Description>(&blue->tags->front()), nullptr);
    EXPECT_EQ(blue->description, "Cool");
    ASSERT_NE(blue->getTag<SerializedName>(), nullptr);
    EXPECT_EQ(blue->getTag<SerializedName>()->text, "blue");
    EXPECT_FALSE(colors.getByValue(1)->description.has_value());
}

TEST_F(EnumCacheTest, Contiguity) {
    EXPECT_TRUE(colors.isContiguous());
    EXPECT_EQ(colors.contiguity().minValue, 0);
    EXPECT_EQ(colors.contiguity().maxValue, 3);
    EXPECT_TRUE(colors.isDefined(3));
    EXPECT_FALSE(colors.isDefined(4));
    EXPECT_FALSE(colors.isDefined(-1));

    Cache sparse{"Sparse", {{1, "One"}, {5, "Five"}}, false};
    EXPECT_FALSE(sparse.isContiguous());
    EXPECT_TRUE(sparse.isDefined(5));
    EXPECT_FALSE(sparse.isDefined(3));
}

TEST_F(EnumCacheTest, DuplicateValuesBecomeAliases) {
    EXPECT_EQ(duplicates.getByName("A")->value, 1);
    EXPECT_EQ(duplicates.getByName("B")->value, 1);
    EXPECT_EQ(duplicates.count(), 2);
    EXPECT_EQ(duplicates.count(true), 3);
    EXPECT_EQ(duplicates.getMembers(false).size(), 2);
    EXPECT_EQ(duplicates.getMembers(true).size(), 3);
    EXPECT_EQ(duplicates.getByValue(1)->name, "A");
    EXPECT_EQ(duplicates.asString(1), "A");
    EXPECT_TRUE(duplicates.isContiguous());
}

TEST_F(EnumCacheTest, ForcePrimarySwapsCanonicalName) {
    Cache forced{"Forced", {{1, "A"}, {1, "B", {PrimaryMember{}}}, {2, "C"}},
                 false};
    EXPECT_EQ(forced.getByValue(1)->name, "B");
    EXPECT_EQ(forced.asString(1), "B");
    EXPECT_EQ(forced.getByName("A")->value, 1);
    EXPECT_EQ(forced.names(true),
              (std::vector<std::string>{"B", "A", "C"}));
}

TEST_F(EnumCacheTest, EnumerationMergesAliasesByValue) {
    Cache mixed{"Mixed",
                {{5, "Five"},
                 {1, "One"},
                 {5, "Cinq"},
                 {3, "Three"},
                 {1, "Un"},
                 {3, "Trois"}},
                false};
    EXPECT_EQ(mixed.names(false),
              (std::vector<std::string>{"One", "Three", "Five"}));
    EXPECT_EQ(mixed.names(true),
              (std::vector<std::string>{"One", "Un", "Three", "Trois", "Five",
                                        "Cinq"}));
    EXPECT_EQ(mixed.values(true), (std::vector<int>{1, 1, 3, 3, 5, 5}));
}

TEST_F(EnumCacheTest, UnsortedInputIsStoredAscending) {
    Cache reversed{"Reversed", {{3, "C"}, {2, "B"}, {1, "A"}, {0, "Zero"}},
                   false};
    EXPECT_EQ(reversed.values(), (std::vector<int>{0, 1, 2, 3}));
    EXPECT_TRUE(reversed.isContiguous());
}

TEST_F(EnumCacheTest, EmptyMemberListIsValid) {
    Cache empty{"Empty", {}, false};
    EXPECT_EQ(empty.count(true), 0);
    EXPECT_FALSE(empty.isContiguous());
    EXPECT_FALSE(empty.isDefined(0));
    EXPECT_TRUE(empty.getMembers(true).empty());
    EXPECT_EQ(empty.asString(4), "4");
    EXPECT_FALSE(empty.tryParse("Anything").has_value());
}

TEST_F(EnumCacheTest, MalformedMembersAreRejected) {
    EXPECT_THROW(Cache("Bad", {{1, ""}}, false),
                 enumkit::error::InvalidArgument);
    EXPECT_THROW(Cache("Bad", {{1, "A"}, {2, "A"}}, false),
                 enumkit::error::InvalidArgument);
    EXPECT_THROW(Cache("Bad", {{1, "A"}, {1, "B"}, {3, "B"}}, false),
                 enumkit::error::InvalidArgument);
}

TEST_F(EnumCacheTest, CustomTagInspector) {
    TagInspector inspector = [](const TagList& tags) {
        TagInspection inspection;
        for (std::size_t i = 0; i < tags.size(); ++i) {
            if (const auto* name = std::any_cast<SerializedName>(&tags[i])) {
                inspection.preferredIndex = i;
                inspection.preferredText = name->text;
            }
        }
        return inspection;
    };
    Cache custom{"Custom",
                 {{1, "One", {Description{"uno"}, SerializedName{"one"}}}},
                 false, inspector};
    const auto one = custom.getByValue(1);
    EXPECT_EQ(one->description, "one");
    EXPECT_NE(std::any_cast<SerializedName>(&one->tags->front()), nullptr);
}

TEST_F(EnumCacheTest, ValidationAndConversion) {
    EXPECT_TRUE(colors.isValid(2));
    EXPECT_FALSE(colors.isValid(7));
    EXPECT_NO_THROW(colors.validate(1));
    EXPECT_THROW(colors.validate(7), enumkit::error::InvalidArgument);

    EXPECT_EQ(colors.toValue(std::int64_t{3}), 3);
    EXPECT_EQ(colors.toValue(std::uint8_t{2}, true), 2);
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(colors.toValue(std::int64_t{1} << 40)),
                 EnumOverflowError);
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(colors.toValue(9, true)),
                 enumkit::error::InvalidArgument);
    EXPECT_FALSE(colors.tryToValue(std::uint64_t{1} << 63).has_value());
    EXPECT_FALSE(colors.tryToValue(9, true).has_value());
    EXPECT_EQ(colors.tryToValue(9), 9);
}

TEST_F(EnumCacheTest, CustomValidatorReplacesBuiltInRule) {
    // any even value up to 10 is valid, defined or not
    Cache even{"Even", makeColors(), false, defaultTagInspector,
               [](int value) { return value % 2 == 0 && value <= 10; }};
    EXPECT_TRUE(even.hasCustomValidator());
    EXPECT_FALSE(colors.hasCustomValidator());

    EXPECT_TRUE(even.isValid(8));
    EXPECT_FALSE(even.isValid(1));
    EXPECT_FALSE(even.isDefined(8));
    EXPECT_TRUE(even.isDefined(1));

    EXPECT_NO_THROW(even.validate(8));
    EXPECT_THROW(even.validate(3), enumkit::error::InvalidArgument);
    EXPECT_EQ(even.toValue(std::int64_t{6}, true), 6);
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(even.toValue(std::int64_t{3}, true)),
                 enumkit::error::InvalidArgument);
    EXPECT_EQ(even.tryToValue(std::uint8_t{4}, true), 4);
    EXPECT_FALSE(even.tryToValue(12, true).has_value());
    EXPECT_EQ(even.tryToValue(12), 12);
}

TEST_F(EnumCacheTest, CustomValidatorOnFlagDomain) {
    Cache flags{"Limited", {{1, "A"}, {2, "B"}, {4, "C"}}, true,
                defaultTagInspector, [](int value) { return value != 7; }};
    EXPECT_TRUE(flags.isValidFlagCombination(7));
    EXPECT_FALSE(flags.isValid(7));
    EXPECT_TRUE(flags.isValid(64));
    EXPECT_FALSE(flags.tryToValue(7, true).has_value());
}

TEST_F(EnumCacheTest, Compare) {
    EXPECT_EQ(Cache::compare(1, 2), std::strong_ordering::less);
    EXPECT_EQ(Cache::compare(2, 2), std::strong_ordering::equal);
    EXPECT_EQ(Cache::compare(3, -2), std::strong_ordering::greater);

    using Wide = EnumCache<std::uint64_t>;
    EXPECT_EQ(Wide::compare(1, ~std::uint64_t{0}), std::strong_ordering::less);
    EXPECT_EQ(Wide::compare(~std::uint64_t{0}, 1),
              std::strong_ordering::greater);
    using Narrow = EnumCache<std::int8_t>;
    EXPECT_EQ(Narrow::compare(-128, 127), std::strong_ordering::less);
}

TEST_F(EnumCacheTest, ParseRoundTripsEveryMemberName) {
    for (const auto& member : colors.getMembers(true)) {
        const std::array formats{EnumFormat::Name};
        const auto text = colors.format(member.value, formats);
        ASSERT_TRUE(text.has_value());
        EXPECT_EQ(colors.parse(*text, false, formats), member.value);
    }
    for (const auto& member : duplicates.getMembers(true)) {
        EXPECT_EQ(duplicates.parse(member.name), member.value);
    }
}

TEST_F(EnumCacheTest, ParseMemberKeepsAliasIdentity) {
    EXPECT_EQ(duplicates.parseMember("B").name, "B");
    EXPECT_EQ(duplicates.parseMember("1").name, "A");
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(duplicates.parseMember("7")),
                 EnumParseError);
    EXPECT_FALSE(duplicates.tryParseMember("Z").has_value());
    EXPECT_EQ(duplicates.tryParseMember(" c ", true)->name, "C");
}

TEST_F(EnumCacheTest, ConcurrentCaseInsensitiveLookups) {
    std::vector<std::thread> threads;
    std::vector<int> results(8, -1);
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([this, &results, i] {
            if (auto member = colors.getByName("YELLOW", true)) {
                results[i] = member->value;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto value : results) {
        EXPECT_EQ(value, 3);
    }
}

TEST(EnumCacheWidthTest, UnsignedSixtyFourBit) {
    EnumCache<std::uint64_t> big{
        "Big",
        {{0, "Zero"}, {std::uint64_t{1} << 63, "Top"}},
        false};
    EXPECT_FALSE(big.isContiguous());
    EXPECT_EQ(big.parse("Top"), std::uint64_t{1} << 63);
    EXPECT_EQ(big.asString(std::uint64_t{1} << 63), "Top");
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(big.parse("18446744073709551616")),
                 EnumOverflowError);
}

TEST(EnumCacheWidthTest, SignedEightBitContiguousAcrossZero) {
    EnumCache<std::int8_t> small{
        "Small", {{-1, "Minus"}, {0, "Zero"}, {1, "Plus"}}, false};
    EXPECT_TRUE(small.isContiguous());
    EXPECT_TRUE(small.isDefined(-1));
    EXPECT_FALSE(small.isDefined(2));
    EXPECT_EQ(small.parse("-1"), -1);
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(small.parse("200")), EnumOverflowError);
}
