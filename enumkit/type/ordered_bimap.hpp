/*
 * ordered_bimap.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Insertion-ordered bidirectional hash map

**************************************************/

#ifndef ENUMKIT_TYPE_ORDERED_BIMAP_HPP
#define ENUMKIT_TYPE_ORDERED_BIMAP_HPP

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include "enumkit/algorithm/prime.hpp"
#include "enumkit/error/exception.hpp"
#include "enumkit/macro.hpp"

namespace enumkit::type {

/**
 * @brief An insertion-ordered map that is unique and hash-indexed on both
 * sides of every pair.
 *
 * One backing array of entries holds the pairs in order. Two independent
 * bucket tables chain into that array: every entry stores the hash of each
 * side and an intrusive "next" link per table, so the same array serves as
 * a first->index and a second->index dictionary at once.
 *
 * Inserting in the middle shifts every later entry up one slot and repairs
 * the links that pointed at the shifted slots, which is O(n) per insert.
 * The structure is meant to be filled once and then only read.
 *
 * @tparam TFirst Type of the first key.
 * @tparam TSecond Type of the second key.
 * @tparam FirstHash Hash for TFirst (may be transparent).
 * @tparam FirstEqual Equality for TFirst (may be transparent).
 * @tparam SecondHash Hash for TSecond (may be transparent).
 * @tparam SecondEqual Equality for TSecond (may be transparent).
 */
template <typename TFirst, typename TSecond,
          typename FirstHash = std::hash<TFirst>,
          typename FirstEqual = std::equal_to<>,
          typename SecondHash = std::hash<TSecond>,
          typename SecondEqual = std::equal_to<>>
class OrderedBiMap {
public:
    using first_type = TFirst;
    using second_type = TSecond;
    using value_type = std::pair<TFirst, TSecond>;
    using size_type = std::size_t;

    static constexpr size_type npos = static_cast<size_type>(-1);

private:
    struct Entry {
        value_type pair;
        std::size_t firstHash;
        std::size_t secondHash;
        size_type firstNext;
        size_type secondNext;
    };

    using storage_type = std::vector<Entry>;

public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = OrderedBiMap::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        const_iterator() = default;

        auto operator*() const -> reference { return iter_->pair; }
        auto operator->() const -> pointer { return &iter_->pair; }

        auto operator++() -> const_iterator& {
            ++iter_;
            return *this;
        }

        auto operator++(int) -> const_iterator {
            auto temp = *this;
            ++iter_;
            return temp;
        }

        auto operator==(const const_iterator& other) const -> bool {
            return iter_ == other.iter_;
        }

    private:
        friend class OrderedBiMap;

        explicit const_iterator(typename storage_type::const_iterator iter)
            : iter_(iter) {}

        typename storage_type::const_iterator iter_;
    };

    /**
     * @brief Creates an empty map able to hold @p capacity pairs before it
     * has to grow.
     */
    explicit OrderedBiMap(size_type capacity = 0)
        : capacity_(algorithm::nextPrime(capacity)),
          firstBuckets_(capacity_, npos),
          secondBuckets_(capacity_, npos) {
        entries_.reserve(capacity_);
    }

    [[nodiscard]] auto size() const noexcept -> size_type {
        return entries_.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return entries_.empty();
    }

    [[nodiscard]] auto capacity() const noexcept -> size_type {
        return capacity_;
    }

    /**
     * @brief Inserts a pair at @p index, shifting later pairs back.
     *
     * @return false (and leaves the map untouched) if either key is
     * already present.
     * @throws enumkit::error::OutOfRange if index > size().
     */
    auto insert(size_type index, TFirst first, TSecond second) -> bool {
        if (index > entries_.size()) {
            THROW_OUT_OF_RANGE("Insert index {} is past the end (size {})",
                               index, entries_.size());
        }

        const auto firstHash = firstHasher_(first);
        if (findFirst(first, firstHash) != npos) {
            return false;
        }
        const auto secondHash = secondHasher_(second);
        if (findSecond(second, secondHash) != npos) {
            return false;
        }

        if (entries_.size() == capacity_) {
            rehash(capacity_ << 1);
        }

        Entry entry{value_type(std::move(first), std::move(second)),
                    firstHash, secondHash, npos, npos};
        shiftEntriesFrom(index);
        linkEntry(index, std::move(entry));
        return true;
    }

    /**
     * @brief Appends a pair.
     */
    auto add(TFirst first, TSecond second) -> bool {
        return insert(entries_.size(), std::move(first), std::move(second));
    }

    /**
     * @brief Replaces the second key of the pair at @p index.
     *
     * @return false if @p second is already present anywhere in the map.
     * @throws enumkit::error::OutOfRange if index >= size().
     */
    auto replaceSecondAt(size_type index, TSecond second) -> bool {
        checkIndex(index);

        const auto secondHash = secondHasher_(second);
        if (findSecond(second, secondHash) != npos) {
            return false;
        }

        unlinkSecond(index);
        auto& entry = entries_[index];
        entry.pair.second = std::move(second);
        entry.secondHash = secondHash;
        const auto bucket = secondHash % capacity_;
        entry.secondNext = secondBuckets_[bucket];
        secondBuckets_[bucket] = index;
        return true;
    }

    template <typename K>
    [[nodiscard]] auto indexOfFirst(const K& first) const
        -> std::optional<size_type> {
        const auto index = findFirst(first, firstHasher_(first));
        return index == npos ? std::nullopt : std::optional<size_type>(index);
    }

    template <typename K>
    [[nodiscard]] auto indexOfSecond(const K& second) const
        -> std::optional<size_type> {
        const auto index = findSecond(second, secondHasher_(second));
        return index == npos ? std::nullopt : std::optional<size_type>(index);
    }

    template <typename K>
    [[nodiscard]] auto containsFirst(const K& first) const -> bool {
        return findFirst(first, firstHasher_(first)) != npos;
    }

    template <typename K>
    [[nodiscard]] auto containsSecond(const K& second) const -> bool {
        return findSecond(second, secondHasher_(second)) != npos;
    }

    /**
     * @throws enumkit::error::OutOfRange if index >= size().
     */
    [[nodiscard]] auto at(size_type index) const -> const value_type& {
        checkIndex(index);
        return entries_[index].pair;
    }

    [[nodiscard]] auto firstAt(size_type index) const -> const TFirst& {
        return at(index).first;
    }

    [[nodiscard]] auto secondAt(size_type index) const -> const TSecond& {
        return at(index).second;
    }

    /**
     * @brief Shrinks the bucket tables to the smallest prime that holds the
     * current pairs.
     */
    void trimExcess() { rehash(entries_.size()); }

    [[nodiscard]] auto begin() const -> const_iterator {
        return const_iterator(entries_.cbegin());
    }

    [[nodiscard]] auto end() const -> const_iterator {
        return const_iterator(entries_.cend());
    }

private:
    void checkIndex(size_type index) const {
        if (ENUMKIT_UNLIKELY(index >= entries_.size())) {
            THROW_OUT_OF_RANGE("Index {} out of range (size {})", index,
                               entries_.size());
        }
    }

    template <typename K>
    auto findFirst(const K& first, std::size_t hash) const -> size_type {
        for (auto i = firstBuckets_[hash % capacity_]; i != npos;
             i = entries_[i].firstNext) {
            const auto& entry = entries_[i];
            if (entry.firstHash == hash && firstEqual_(entry.pair.first, first)) {
                return i;
            }
        }
        return npos;
    }

    template <typename K>
    auto findSecond(const K& second, std::size_t hash) const -> size_type {
        for (auto i = secondBuckets_[hash % capacity_]; i != npos;
             i = entries_[i].secondNext) {
            const auto& entry = entries_[i];
            if (entry.secondHash == hash &&
                secondEqual_(entry.pair.second, second)) {
                return i;
            }
        }
        return npos;
    }

    void rehash(size_type minCapacity) {
        const auto newCapacity = algorithm::nextPrime(minCapacity);
        if (newCapacity == capacity_) {
            return;
        }

        capacity_ = newCapacity;
        firstBuckets_.assign(capacity_, npos);
        secondBuckets_.assign(capacity_, npos);
        for (size_type i = 0; i < entries_.size(); ++i) {
            auto& entry = entries_[i];
            const auto firstBucket = entry.firstHash % capacity_;
            entry.firstNext = firstBuckets_[firstBucket];
            firstBuckets_[firstBucket] = i;
            const auto secondBucket = entry.secondHash % capacity_;
            entry.secondNext = secondBuckets_[secondBucket];
            secondBuckets_[secondBucket] = i;
        }
        entries_.reserve(capacity_);
    }

    // Moves entries [index, size) up by one slot, highest first, so every
    // chain stays walkable while its links are being repaired. The backing
    // vector always has room for capacity_ entries, so the push_back below
    // never reallocates.
    void shiftEntriesFrom(size_type index) {
        const auto count = entries_.size();
        if (index == count) {
            return;
        }

        redirectLinks(count - 1, count);
        entries_.push_back(std::move(entries_[count - 1]));
        for (auto i = count - 1; i > index; --i) {
            redirectLinks(i - 1, i);
            entries_[i] = std::move(entries_[i - 1]);
        }
    }

    // Points whichever bucket head or chain link referenced slot `from` at
    // slot `to` instead.
    void redirectLinks(size_type from, size_type to) {
        const auto& moving = entries_[from];

        auto& firstHead = firstBuckets_[moving.firstHash % capacity_];
        if (firstHead == from) {
            firstHead = to;
        } else {
            auto prev = firstHead;
            while (entries_[prev].firstNext != from) {
                prev = entries_[prev].firstNext;
            }
            entries_[prev].firstNext = to;
        }

        auto& secondHead = secondBuckets_[moving.secondHash % capacity_];
        if (secondHead == from) {
            secondHead = to;
        } else {
            auto prev = secondHead;
            while (entries_[prev].secondNext != from) {
                prev = entries_[prev].secondNext;
            }
            entries_[prev].secondNext = to;
        }
    }

    void linkEntry(size_type index, Entry entry) {
        const auto firstBucket = entry.firstHash % capacity_;
        const auto secondBucket = entry.secondHash % capacity_;
        entry.firstNext = firstBuckets_[firstBucket];
        entry.secondNext = secondBuckets_[secondBucket];
        if (index == entries_.size()) {
            entries_.push_back(std::move(entry));
        } else {
            entries_[index] = std::move(entry);
        }
        firstBuckets_[firstBucket] = index;
        secondBuckets_[secondBucket] = index;
    }

    void unlinkSecond(size_type index) {
        const auto& entry = entries_[index];
        auto& head = secondBuckets_[entry.secondHash % capacity_];
        if (head == index) {
            head = entry.secondNext;
            return;
        }
        auto prev = head;
        while (entries_[prev].secondNext != index) {
            prev = entries_[prev].secondNext;
        }
        entries_[prev].secondNext = entry.secondNext;
    }

    size_type capacity_;
    std::vector<size_type> firstBuckets_;
    std::vector<size_type> secondBuckets_;
    storage_type entries_;
    [[no_unique_address]] FirstHash firstHasher_{};
    [[no_unique_address]] FirstEqual firstEqual_{};
    [[no_unique_address]] SecondHash secondHasher_{};
    [[no_unique_address]] SecondEqual secondEqual_{};
};

}  // namespace enumkit::type

#endif  // ENUMKIT_TYPE_ORDERED_BIMAP_HPP
