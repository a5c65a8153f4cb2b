#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "enumkit/error/exception.hpp"
#include "enumkit/macro.hpp"
#include "enumkit/type/ordered_bimap.hpp"
#include "enumkit/utils/string.hpp"

using namespace enumkit::type;

using NameMap = OrderedBiMap<int, std::string, std::hash<int>, std::equal_to<>,
                             enumkit::utils::StringHash, std::equal_to<>>;

class OrderedBiMapTest : public ::testing::Test {
protected:
    void SetUp() override {
        map.add(1, "one");
        map.add(2, "two");
        map.add(3, "three");
    }

    // Every pair is reachable through both keys at its own index
    static void expectConsistent(const NameMap& m) {
        for (std::size_t i = 0; i < m.size(); ++i) {
            const auto& [first, second] = m.at(i);
            ASSERT_EQ(m.indexOfFirst(first), i) << "first " << first;
            ASSERT_EQ(m.indexOfSecond(std::string_view(second)), i)
                << "second " << second;
        }
    }

    NameMap map;
};

TEST_F(OrderedBiMapTest, AddPreservesOrder) {
    ASSERT_EQ(map.size(), 3);
    EXPECT_EQ(map.firstAt(0), 1);
    EXPECT_EQ(map.secondAt(1), "two");
    EXPECT_EQ(map.at(2).second, "three");
    expectConsistent(map);
}

TEST_F(OrderedBiMapTest, LookupBothDirections) {
    EXPECT_EQ(map.indexOfFirst(2), 1);
    EXPECT_EQ(map.indexOfSecond(std::string_view("three")), 2);
    EXPECT_FALSE(map.indexOfFirst(42).has_value());
    EXPECT_FALSE(map.indexOfSecond(std::string_view("zero")).has_value());
    EXPECT_TRUE(map.containsFirst(1));
    EXPECT_FALSE(map.containsSecond(std::string_view("four")));
}

TEST_F(OrderedBiMapTest, DuplicateKeysAreRejected) {
    EXPECT_FALSE(map.add(1, "uno"));
    EXPECT_FALSE(map.add(10, "one"));
    EXPECT_FALSE(map.insert(0, 2, "dos"));
    EXPECT_EQ(map.size(), 3);
    EXPECT_EQ(map.secondAt(0), "one");
    expectConsistent(map);
}

TEST_F(OrderedBiMapTest, InsertInMiddleShiftsLaterEntries) {
    ASSERT_TRUE(map.insert(1, 10, "ten"));
    ASSERT_TRUE(map.insert(0, 20, "twenty"));

    ASSERT_EQ(map.size(), 5);
    std::vector<int> firsts;
    for (const auto& [first, second] : map) {
        firsts.push_back(first);
    }
    EXPECT_EQ(firsts, (std::vector<int>{20, 1, 10, 2, 3}));
    expectConsistent(map);
}

TEST_F(OrderedBiMapTest, InsertPastEndThrows) {
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(map.insert(5, 9, "nine")),
                 enumkit::error::OutOfRange);
    EXPECT_EQ(map.size(), 3);
}

TEST_F(OrderedBiMapTest, AtIsBoundsChecked) {
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(map.at(3)), enumkit::error::OutOfRange);
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(map.firstAt(100)),
                 enumkit::error::OutOfRange);
}

TEST_F(OrderedBiMapTest, ReplaceSecondAt) {
    EXPECT_TRUE(map.replaceSecondAt(1, "deux"));
    EXPECT_EQ(map.secondAt(1), "deux");
    EXPECT_FALSE(map.containsSecond(std::string_view("two")));
    EXPECT_EQ(map.indexOfSecond(std::string_view("deux")), 1);

    EXPECT_FALSE(map.replaceSecondAt(0, "three"));
    EXPECT_EQ(map.secondAt(0), "one");
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(map.replaceSecondAt(7, "seven")),
                 enumkit::error::OutOfRange);
    expectConsistent(map);
}

TEST(OrderedBiMapGrowthTest, GrowsPastInitialCapacity) {
    NameMap map(2);
    const auto initial = map.capacity();
    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(map.add(i, "n" + std::to_string(i)));
    }
    EXPECT_GT(map.capacity(), initial);
    EXPECT_EQ(map.size(), 200);
    for (int i = 0; i < 200; ++i) {
        ASSERT_EQ(map.indexOfFirst(i), static_cast<std::size_t>(i));
        ASSERT_EQ(map.indexOfSecond("n" + std::to_string(i)),
                  static_cast<std::size_t>(i));
    }
}

TEST(OrderedBiMapGrowthTest, SortedInsertionFromShuffledInput) {
    std::vector<int> values(300);
    std::iota(values.begin(), values.end(), -150);
    std::mt19937 rng(1234);
    std::shuffle(values.begin(), values.end(), rng);

    NameMap map;
    for (const auto value : values) {
        std::size_t position = map.size();
        while (position > 0 && value < map.firstAt(position - 1)) {
            --position;
        }
        ASSERT_TRUE(map.insert(position, value, std::to_string(value)));
    }

    ASSERT_EQ(map.size(), values.size());
    for (std::size_t i = 0; i < map.size(); ++i) {
        const auto& [first, second] = map.at(i);
        ASSERT_EQ(first, -150 + static_cast<int>(i));
        ASSERT_EQ(map.indexOfFirst(first), i);
        ASSERT_EQ(map.indexOfSecond(std::string_view(second)), i);
    }
}

TEST(OrderedBiMapGrowthTest, TrimExcessKeepsLookups) {
    NameMap map(500);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(map.add(i * 7, std::to_string(i)));
    }
    map.trimExcess();
    EXPECT_LT(map.capacity(), 500);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(map.indexOfFirst(i * 7), static_cast<std::size_t>(i));
    }
    ASSERT_TRUE(map.insert(0, -1, "minus"));
    EXPECT_EQ(map.indexOfSecond(std::string_view("9")), 10);
}

TEST(OrderedBiMapGrowthTest, EmptyMap) {
    NameMap map;
    EXPECT_TRUE(map.empty());
    EXPECT_TRUE(map.begin() == map.end());
    EXPECT_FALSE(map.indexOfFirst(0).has_value());
    EXPECT_THROW(ENUMKIT_UNUSED_RESULT(map.at(0)), enumkit::error::OutOfRange);
}
