/*!
 * \file enum_cache.hpp
 * \brief Per-domain enum metadata cache: member index, flag algebra and the
 * format/parse pipeline
 * \author Max Qian <lightapt.com>
 * \date 2024-05-12
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_CACHE_HPP
#define ENUMKIT_META_ENUM_CACHE_HPP

#include <algorithm>
#include <atomic>
#include <bit>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "enumkit/error/exception.hpp"
#include "enumkit/meta/enum_format.hpp"
#include "enumkit/meta/formatter_registry.hpp"
#include "enumkit/meta/member.hpp"
#include "enumkit/meta/numeric.hpp"
#include "enumkit/type/ordered_bimap.hpp"
#include "enumkit/utils/string.hpp"

namespace enumkit::meta {

/**
 * \brief A value has bits set outside the flag union of its domain
 */
class InvalidFlagCombination : public error::InvalidArgument {
public:
    using error::InvalidArgument::InvalidArgument;
};

/**
 * \brief A numeric value does not fit the underlying type of its domain
 */
class EnumOverflowError : public error::OutOfRange {
public:
    using error::OutOfRange::OutOfRange;
};

/**
 * \brief Text matched no member under any requested format
 */
class EnumParseError : public error::InvalidArgument {
public:
    using error::InvalidArgument::InvalidArgument;
};

#define THROW_INVALID_FLAG_COMBINATION(...)                      \
    throw enumkit::meta::InvalidFlagCombination(                 \
        ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE, ENUMKIT_FUNC_NAME, \
        __VA_ARGS__)

#define THROW_ENUM_OVERFLOW(...)                                           \
    throw enumkit::meta::EnumOverflowError(ENUMKIT_FILE_NAME,              \
                                           ENUMKIT_FILE_LINE,              \
                                           ENUMKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_ENUM_PARSE_ERROR(...)                                     \
    throw enumkit::meta::EnumParseError(ENUMKIT_FILE_NAME,              \
                                        ENUMKIT_FILE_LINE,              \
                                        ENUMKIT_FUNC_NAME, __VA_ARGS__)

/**
 * \brief Why a parse failed
 */
enum class ParseErrorKind {
    NoMatch,
    OutOfRange,
    InvalidFlagCombination,
};

struct ParseFailure {
    ParseErrorKind kind = ParseErrorKind::NoMatch;
    std::string token;  ///< the offending token
};

/**
 * \brief Immutable metadata for one enum domain.
 *
 * Primary members (one per distinct value) live in an OrderedBiMap kept in
 * ascending value order; the other names sharing a value are aliases. The
 * cache is built once from the host's member list and is read-only after
 * that, except for:
 *  - lazily built lookup indices (case-insensitive names, one reverse table
 *    per format), published with an atomic swap,
 *  - per-domain formatter registration, which is append-only.
 *
 * Primary insertion scans backward from the tail for the insert position.
 * Input that is sorted or nearly sorted costs O(n) overall; input in
 * descending order degrades to O(n^2).
 *
 * \tparam TInt Underlying integer type.
 * \tparam Ops Numeric capability for TInt.
 */
template <EnumUnderlying TInt, typename Ops = IntegralOperations<TInt>>
    requires NumericOperations<Ops, TInt>
class EnumCache {
public:
    using underlying_type = TInt;
    using operations_type = Ops;
    using member_type = EnumMember<TInt>;
    using raw_member_type = RawMember<TInt>;
    using Formatter =
        std::function<std::optional<std::string>(const member_type&)>;
    using FormatList = std::span<const EnumFormat>;
    /// Host-supplied validity rule; replaces the built-in one when set.
    using Validator = std::function<bool(TInt)>;

    struct Contiguity {
        TInt minValue{};
        TInt maxValue{};
        bool isContiguous = false;
    };

    /**
     * \brief Lazy, restartable sequence of the single-bit flags set in a
     * value, lowest bit first.
     */
    class FlagSequence {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = TInt;
            using difference_type = std::ptrdiff_t;
            using pointer = const TInt*;
            using reference = TInt;

            iterator() = default;

            auto operator*() const -> TInt { return bit_; }

            auto operator++() -> iterator& {
                remaining_ = Ops::bitAnd(remaining_, Ops::bitNot(bit_));
                bit_ = Ops::leftShift(bit_, 1);
                seek();
                return *this;
            }

            auto operator++(int) -> iterator {
                auto temp = *this;
                ++*this;
                return temp;
            }

            auto operator==(const iterator& other) const -> bool {
                return remaining_ == other.remaining_;
            }

        private:
            friend class FlagSequence;

            explicit iterator(TInt remaining)
                : remaining_(remaining), bit_(Ops::one()) {
                seek();
            }

            void seek() {
                while (remaining_ != Ops::zero() &&
                       Ops::bitAnd(remaining_, bit_) == Ops::zero()) {
                    bit_ = Ops::leftShift(bit_, 1);
                }
            }

            TInt remaining_{};
            TInt bit_{};
        };

        [[nodiscard]] auto begin() const -> iterator { return iterator(bits_); }
        [[nodiscard]] auto end() const -> iterator {
            return iterator(Ops::zero());
        }

        [[nodiscard]] auto size() const noexcept -> std::size_t {
            return static_cast<std::size_t>(
                std::popcount(static_cast<std::make_unsigned_t<TInt>>(bits_)));
        }

        [[nodiscard]] auto empty() const noexcept -> bool {
            return bits_ == Ops::zero();
        }

    private:
        friend class EnumCache;

        explicit FlagSequence(TInt bits) : bits_(bits) {}

        TInt bits_;
    };

    /**
     * \brief Builds the cache from the host's member list.
     *
     * \param name Domain name used in diagnostics.
     * \param members Members in declaration order.
     * \param isFlagDomain Whether values combine as bit flags.
     * \param inspector Extracts the preferred textual tag and force-primary
     * marker from each member's tags.
     * \param validator Optional rule consulted by isValid() instead of the
     * built-in one.
     * \throws enumkit::error::InvalidArgument if a member has an empty name
     * or a name is used twice.
     */
    EnumCache(std::string name, std::vector<raw_member_type> members,
              bool isFlagDomain, TagInspector inspector = defaultTagInspector,
              Validator validator = {})
        : name_(std::move(name)),
          isFlagDomain_(isFlagDomain),
          validator_(std::move(validator)),
          primary_(members.size()),
          domainFormatters_(name_, FIRST_DOMAIN_CUSTOM_FORMAT,
                            CUSTOM_FORMAT_CAPACITY) {
        if (!inspector) {
            inspector = defaultTagInspector;
        }

        NameSet aliasNames;
        for (auto& raw : members) {
            addMember(std::move(raw), inspector, aliasNames);
        }

        std::stable_sort(aliases_.begin(), aliases_.end(),
                         [](const member_type& lhs, const member_type& rhs) {
                             return Ops::lessThan(lhs.value, rhs.value);
                         });
        for (std::size_t i = 0; i < aliases_.size(); ++i) {
            aliasIndex_.emplace(aliases_[i].name, i);
        }

        primary_.trimExcess();
        computeContiguity();

        spdlog::debug(
            "Built enum cache '{}': {} primary, {} alias, contiguous={}, "
            "flags={}",
            name_, primary_.size(), aliases_.size(), contiguity_.isContiguous,
            isFlagDomain_ ? Ops::toHexString(allFlags_) : std::string("n/a"));
    }

    EnumCache(const EnumCache&) = delete;
    auto operator=(const EnumCache&) -> EnumCache& = delete;

    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto isFlagDomain() const noexcept -> bool {
        return isFlagDomain_;
    }

    [[nodiscard]] auto contiguity() const noexcept -> const Contiguity& {
        return contiguity_;
    }

    [[nodiscard]] auto isContiguous() const noexcept -> bool {
        return contiguity_.isContiguous;
    }

    [[nodiscard]] auto count(bool includeAliases = false) const noexcept
        -> std::size_t {
        return includeAliases ? primary_.size() + aliases_.size()
                              : primary_.size();
    }

    // **Member lookup**

    [[nodiscard]] auto getByValue(TInt value) const
        -> std::optional<member_type> {
        if (const auto index = primary_.indexOfFirst(value)) {
            return primary_.secondAt(*index);
        }
        return std::nullopt;
    }

    /**
     * \brief Member named \p name: primary names first, then aliases, then
     * (if \p ignoreCase) a case-insensitive match.
     */
    [[nodiscard]] auto getByName(std::string_view name,
                                 bool ignoreCase = false) const
        -> std::optional<member_type> {
        if (const auto index = primary_.indexOfSecond(name)) {
            return primary_.secondAt(*index);
        }
        if (const auto iter = aliasIndex_.find(name);
            iter != aliasIndex_.end()) {
            return aliases_[iter->second];
        }
        if (ignoreCase) {
            const auto folded = caseInsensitiveNames();
            if (const auto iter = folded->find(name); iter != folded->end()) {
                return iter->second;
            }
        }
        return std::nullopt;
    }

    /**
     * \brief Members in ascending value order. With \p includeAliases, each
     * primary is followed by its aliases.
     */
    [[nodiscard]] auto getMembers(bool includeAliases = false) const
        -> std::vector<member_type> {
        std::vector<member_type> result;
        result.reserve(count(includeAliases));
        std::size_t aliasPos = 0;
        for (const auto& [value, member] : primary_) {
            result.push_back(member);
            if (!includeAliases) {
                continue;
            }
            while (aliasPos < aliases_.size() &&
                   !Ops::lessThan(value, aliases_[aliasPos].value)) {
                result.push_back(aliases_[aliasPos++]);
            }
        }
        return result;
    }

    [[nodiscard]] auto names(bool includeAliases = false) const
        -> std::vector<std::string> {
        std::vector<std::string> result;
        result.reserve(count(includeAliases));
        for (auto& member : getMembers(includeAliases)) {
            result.push_back(std::move(member.name));
        }
        return result;
    }

    [[nodiscard]] auto values(bool includeAliases = false) const
        -> std::vector<TInt> {
        std::vector<TInt> result;
        result.reserve(count(includeAliases));
        for (const auto& member : getMembers(includeAliases)) {
            result.push_back(member.value);
        }
        return result;
    }

    // **Validation and conversion**

    [[nodiscard]] auto isDefined(TInt value) const -> bool {
        if (contiguity_.isContiguous) {
            return !Ops::lessThan(value, contiguity_.minValue) &&
                   !Ops::lessThan(contiguity_.maxValue, value);
        }
        return primary_.containsFirst(value);
    }

    /**
     * \brief The custom validator's verdict if one was given, otherwise a
     * valid flag combination (flag domains) or a defined value.
     */
    [[nodiscard]] auto isValid(TInt value) const -> bool {
        if (validator_) {
            return validator_(value);
        }
        return isValidFlagCombination(value) || isDefined(value);
    }

    [[nodiscard]] auto hasCustomValidator() const noexcept -> bool {
        return static_cast<bool>(validator_);
    }

    /**
     * \throws enumkit::error::InvalidArgument if \p value is not valid.
     */
    void validate(TInt value, std::string_view argument = "value") const {
        if (!isValid(value)) {
            THROW_INVALID_ARGUMENT("invalid {} {} for enum '{}'", argument,
                                   Ops::toDecimalString(value), name_);
        }
    }

    /**
     * \brief Range-checked conversion of any integer into this domain.
     * \throws EnumOverflowError if \p value does not fit TInt.
     * \throws enumkit::error::InvalidArgument if \p validateValue is set and
     * the result is not valid.
     */
    template <std::integral I>
    [[nodiscard]] auto toValue(I value, bool validateValue = false) const
        -> TInt {
        if (!fitsWidth(value)) {
            THROW_ENUM_OVERFLOW("{} is outside the range of enum '{}'", value,
                                name_);
        }
        const auto result = createValue(value);
        if (validateValue) {
            validate(result);
        }
        return result;
    }

    template <std::integral I>
    [[nodiscard]] auto tryToValue(I value, bool validateValue = false) const
        -> std::optional<TInt> {
        if (!fitsWidth(value)) {
            return std::nullopt;
        }
        const auto result = createValue(value);
        if (validateValue && !isValid(result)) {
            return std::nullopt;
        }
        return result;
    }

    [[nodiscard]] static auto compare(TInt lhs, TInt rhs) noexcept
        -> std::strong_ordering {
        if (Ops::lessThan(lhs, rhs)) {
            return std::strong_ordering::less;
        }
        if (Ops::lessThan(rhs, lhs)) {
            return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }

    // **Formatting**

    /**
     * \brief First non-empty rendering of \p value among \p formats. An
     * empty list means DEFAULT_FORMAT_ORDER.
     * \throws enumkit::error::InvalidArgument for an unregistered custom
     * format id.
     */
    [[nodiscard]] auto format(TInt value,
                              FormatList formats = DEFAULT_FORMAT_ORDER) const
        -> std::optional<std::string> {
        if (formats.empty()) {
            formats = DEFAULT_FORMAT_ORDER;
        }
        std::optional<member_type> member;
        bool lookedUp = false;
        for (const auto format : formats) {
            switch (format) {
                case EnumFormat::DecimalValue:
                    return Ops::toDecimalString(value);
                case EnumFormat::HexadecimalValue:
                    return Ops::toHexString(value);
                default:
                    break;
            }
            if (!lookedUp) {
                member = getByValue(value);
                lookedUp = true;
            }
            if (!member) {
                checkFormat(format);
                continue;
            }
            if (auto text = formatMember(*member, format)) {
                return text;
            }
        }
        return std::nullopt;
    }

    /**
     * \brief .NET style format strings: "G" (general), "F" (flags),
     * "D" (decimal) and "X" (hex), either case. An empty string means "G".
     */
    [[nodiscard]] auto format(TInt value, std::string_view formatString) const
        -> std::string {
        // asString joins flags on a flag domain, so "F" and "G" coincide
        if (formatString.empty() || formatString == "G" ||
            formatString == "g" || formatString == "F" ||
            formatString == "f") {
            return asString(value);
        }
        if (formatString == "D" || formatString == "d") {
            return Ops::toDecimalString(value);
        }
        if (formatString == "X" || formatString == "x") {
            return Ops::toHexString(value);
        }
        THROW_INVALID_ARGUMENT("Invalid format string '{}' for enum '{}'",
                               formatString, name_);
    }

    /**
     * \brief Default rendering: flags joined for flag domains, otherwise
     * name or decimal value. A value outside the flag union is rendered
     * through the default order.
     */
    [[nodiscard]] auto asString(TInt value) const -> std::string {
        std::optional<std::string> text;
        if (isFlagDomain_) {
            text = formatFlags(value);
        }
        if (!text) {
            text = format(value);
        }
        return text ? *std::move(text) : Ops::toDecimalString(value);
    }

    [[nodiscard]] auto formatMember(const member_type& member,
                                    EnumFormat format) const
        -> std::optional<std::string> {
        switch (format) {
            case EnumFormat::DecimalValue:
                return Ops::toDecimalString(member.value);
            case EnumFormat::HexadecimalValue:
                return Ops::toHexString(member.value);
            case EnumFormat::Name:
                return member.name;
            case EnumFormat::Description:
                return member.description;
            case EnumFormat::SerializedName:
                if (const auto* tag =
                        member.template getTag<meta::SerializedName>()) {
                    return tag->text;
                }
                return std::nullopt;
        }

        if (isGlobalCustomFormat(format)) {
            if (const auto formatter = getGlobalFormatter(format)) {
                return (*formatter)(member.view());
            }
        } else if (isDomainCustomFormat(format)) {
            if (const auto formatter =
                    domainFormatters_.get(static_cast<int>(format))) {
                return (*formatter)(member);
            }
        }
        THROW_INVALID_ARGUMENT("Unknown format {} for enum '{}'",
                               toString(format), name_);
    }

    /**
     * \brief Registers a formatter visible to this domain only.
     * \return Its selector id, starting at FIRST_DOMAIN_CUSTOM_FORMAT.
     */
    auto registerFormatter(Formatter formatter) -> EnumFormat {
        return static_cast<EnumFormat>(
            domainFormatters_.add(std::move(formatter)));
    }

    // **Parsing**

    /**
     * \brief Parses \p text into a value.
     *
     * Decimal text is accepted first. Otherwise each format in \p formats is
     * tried in order. For flag domains the text is parsed as a flag list
     * joined by DEFAULT_FLAG_DELIMITER.
     *
     * \throws EnumOverflowError if the text is numeric but does not fit.
     * \throws InvalidFlagCombination if a flag token has bits outside the
     * flag union.
     * \throws EnumParseError if nothing matched.
     */
    [[nodiscard]] auto parse(std::string_view text, bool ignoreCase = false,
                             FormatList formats = DEFAULT_FORMAT_ORDER) const
        -> TInt {
        ParseFailure failure;
        if (auto value = parseValue(text, ignoreCase, formats, failure)) {
            return *value;
        }
        raiseParseFailure(failure, text);
    }

    [[nodiscard]] auto tryParse(std::string_view text, bool ignoreCase = false,
                                FormatList formats = DEFAULT_FORMAT_ORDER) const
        -> std::optional<TInt> {
        ParseFailure failure;
        return parseValue(text, ignoreCase, formats, failure);
    }

    /**
     * \brief Like tryParse() but leaves the reason for a failure in
     * \p failure.
     */
    [[nodiscard]] auto tryParse(std::string_view text, bool ignoreCase,
                                FormatList formats,
                                ParseFailure& failure) const
        -> std::optional<TInt> {
        return parseValue(text, ignoreCase, formats, failure);
    }

    /**
     * \brief Parses a single token into the member it names. An alias name
     * yields the alias, not its primary.
     * \throws EnumParseError if the text resolves to no member.
     */
    [[nodiscard]] auto parseMember(std::string_view text,
                                   bool ignoreCase = false,
                                   FormatList formats =
                                       DEFAULT_FORMAT_ORDER) const
        -> member_type {
        ParseFailure failure;
        auto resolved =
            resolveToken(utils::trimView(text), ignoreCase, formats, failure);
        if (!resolved) {
            raiseParseFailure(failure, text);
        }
        if (resolved->member) {
            return *std::move(resolved->member);
        }
        if (auto member = getByValue(resolved->value)) {
            return *std::move(member);
        }
        THROW_ENUM_PARSE_ERROR("'{}' is value {} which is not a member of '{}'",
                               text, Ops::toDecimalString(resolved->value),
                               name_);
    }

    [[nodiscard]] auto tryParseMember(std::string_view text,
                                      bool ignoreCase = false,
                                      FormatList formats =
                                          DEFAULT_FORMAT_ORDER) const
        -> std::optional<member_type> {
        ParseFailure failure;
        auto resolved =
            resolveToken(utils::trimView(text), ignoreCase, formats, failure);
        if (!resolved) {
            return std::nullopt;
        }
        if (resolved->member) {
            return std::move(resolved->member);
        }
        return getByValue(resolved->value);
    }

    // **Flag algebra**

    [[nodiscard]] auto allFlags() const -> TInt {
        requireFlagDomain("allFlags");
        return allFlags_;
    }

    [[nodiscard]] auto isValidFlagCombination(TInt value) const noexcept
        -> bool {
        return isFlagDomain_ && Ops::bitAnd(value, allFlags_) == value;
    }

    [[nodiscard]] auto hasAnyFlags(TInt value) const -> bool {
        checkFlags(value, "value");
        return value != Ops::zero();
    }

    [[nodiscard]] auto hasAnyFlags(TInt value, TInt mask) const -> bool {
        checkFlags(value, "value");
        checkFlags(mask, "mask");
        return Ops::bitAnd(value, mask) != Ops::zero();
    }

    [[nodiscard]] auto hasAllFlags(TInt value) const -> bool {
        checkFlags(value, "value");
        return Ops::bitAnd(value, allFlags_) == allFlags_;
    }

    [[nodiscard]] auto hasAllFlags(TInt value, TInt mask) const -> bool {
        checkFlags(value, "value");
        checkFlags(mask, "mask");
        return Ops::bitAnd(value, mask) == mask;
    }

    [[nodiscard]] auto commonFlags(TInt value, TInt other) const -> TInt {
        checkFlags(value, "value");
        checkFlags(other, "other");
        return Ops::bitAnd(value, other);
    }

    [[nodiscard]] auto combineFlags(TInt value, TInt other) const -> TInt {
        checkFlags(value, "value");
        checkFlags(other, "other");
        return Ops::bitOr(value, other);
    }

    [[nodiscard]] auto combineFlags(std::span<const TInt> flags) const
        -> TInt {
        requireFlagDomain("combineFlags");
        auto result = Ops::zero();
        for (const auto flag : flags) {
            checkFlags(flag, "flag");
            result = Ops::bitOr(result, flag);
        }
        return result;
    }

    [[nodiscard]] auto toggleFlags(TInt value) const -> TInt {
        checkFlags(value, "value");
        return Ops::bitXor(value, allFlags_);
    }

    [[nodiscard]] auto toggleFlags(TInt value, TInt mask) const -> TInt {
        checkFlags(value, "value");
        checkFlags(mask, "mask");
        return Ops::bitXor(value, mask);
    }

    [[nodiscard]] auto excludeFlags(TInt value, TInt mask) const -> TInt {
        checkFlags(value, "value");
        checkFlags(mask, "mask");
        return Ops::bitAnd(value, Ops::bitNot(mask));
    }

    /**
     * \brief The single-bit primary flags set in \p value, lowest first.
     */
    [[nodiscard]] auto getFlags(TInt value) const -> FlagSequence {
        checkFlags(value, "value");
        return FlagSequence(Ops::bitAnd(value, allFlags_));
    }

    [[nodiscard]] auto getFlagCount(TInt value) const -> std::size_t {
        return getFlags(value).size();
    }

    [[nodiscard]] auto getFlagCount() const -> std::size_t {
        return getFlagCount(allFlags());
    }

    [[nodiscard]] auto getFlagMembers(TInt value) const
        -> std::vector<member_type> {
        std::vector<member_type> result;
        for (const auto flag : getFlags(value)) {
            if (auto member = getByValue(flag)) {
                result.push_back(*std::move(member));
            }
        }
        return result;
    }

    /**
     * \brief Renders \p value as its flags joined by \p delimiter.
     *
     * A value that is itself a member is formatted directly. Zero that is
     * not a member renders as "0".
     *
     * \return std::nullopt if \p value has bits outside the flag union or a
     * flag has no text under \p formats.
     * \throws enumkit::error::InvalidArgument if \p delimiter is empty.
     */
    [[nodiscard]] auto formatFlags(TInt value,
                                   std::string_view delimiter =
                                       DEFAULT_FLAG_DELIMITER,
                                   FormatList formats =
                                       DEFAULT_FORMAT_ORDER) const
        -> std::optional<std::string> {
        requireFlagDomain("formatFlags");
        if (delimiter.empty()) {
            THROW_INVALID_ARGUMENT("Flag delimiter for enum '{}' is empty",
                                   name_);
        }
        if (formats.empty()) {
            formats = DEFAULT_FORMAT_ORDER;
        }
        if (!isValidFlagCombination(value)) {
            return std::nullopt;
        }
        if (isDefined(value)) {
            return format(value, formats);
        }
        if (value == Ops::zero()) {
            return std::string("0");
        }

        std::vector<std::string> texts;
        for (const auto flag : getFlags(value)) {
            auto text = format(flag, formats);
            if (!text) {
                return std::nullopt;
            }
            texts.push_back(*std::move(text));
        }
        return utils::joinStrings(texts, delimiter);
    }

    /**
     * \brief Parses a delimited list of flags and ORs them together.
     * \throws enumkit::error::InvalidArgument if \p delimiter is empty.
     * \throws EnumOverflowError, InvalidFlagCombination or EnumParseError
     * naming the first token that failed.
     */
    [[nodiscard]] auto parseFlags(std::string_view text,
                                  bool ignoreCase = false,
                                  std::string_view delimiter =
                                      DEFAULT_FLAG_DELIMITER,
                                  FormatList formats =
                                      DEFAULT_FORMAT_ORDER) const -> TInt {
        ParseFailure failure;
        if (auto value =
                parseFlagList(text, ignoreCase, delimiter, formats, failure)) {
            return *value;
        }
        raiseParseFailure(failure, text);
    }

    [[nodiscard]] auto tryParseFlags(std::string_view text,
                                     bool ignoreCase = false,
                                     std::string_view delimiter =
                                         DEFAULT_FLAG_DELIMITER,
                                     FormatList formats =
                                         DEFAULT_FORMAT_ORDER) const
        -> std::optional<TInt> {
        ParseFailure failure;
        return parseFlagList(text, ignoreCase, delimiter, formats, failure);
    }

private:
    struct MemberNameHash {
        using is_transparent = void;

        auto operator()(const member_type& member) const noexcept
            -> std::size_t {
            return utils::StringHash{}(member.name);
        }
        auto operator()(std::string_view name) const noexcept -> std::size_t {
            return utils::StringHash{}(name);
        }
    };

    struct MemberNameEqual {
        using is_transparent = void;

        auto operator()(const member_type& lhs,
                        const member_type& rhs) const noexcept -> bool {
            return lhs.name == rhs.name;
        }
        auto operator()(const member_type& lhs,
                        std::string_view rhs) const noexcept -> bool {
            return lhs.name == rhs;
        }
    };

    using PrimaryIndex =
        type::OrderedBiMap<TInt, member_type, std::hash<TInt>,
                           std::equal_to<>, MemberNameHash, MemberNameEqual>;
    using NameSet =
        std::unordered_set<std::string, utils::StringHash, std::equal_to<>>;
    using CaseInsensitiveMap =
        std::unordered_map<std::string, member_type, utils::CaseInsensitiveHash,
                           utils::CaseInsensitiveEqual>;

    // Reverse lookup for one format: rendered text -> member. Later members
    // overwrite earlier ones on equal text.
    struct FormatParser {
        std::vector<std::pair<std::string, member_type>> entries;
        std::unordered_map<std::string, member_type, utils::StringHash,
                           std::equal_to<>>
            exact;
        mutable std::atomic<std::shared_ptr<const CaseInsensitiveMap>> folded{
            nullptr};
    };

    using ParserTable =
        std::unordered_map<int, std::shared_ptr<const FormatParser>>;

    struct Resolved {
        TInt value;
        std::optional<member_type> member;
    };

    void addMember(raw_member_type raw, const TagInspector& inspector,
                   NameSet& aliasNames) {
        if (raw.name.empty()) {
            spdlog::error("Enum '{}' has an unnamed member with value {}",
                          name_, Ops::toDecimalString(raw.value));
            THROW_INVALID_ARGUMENT("Enum '{}' has an unnamed member with value {}",
                                   name_, Ops::toDecimalString(raw.value));
        }
        if (primary_.containsSecond(std::string_view(raw.name)) ||
            aliasNames.contains(raw.name)) {
            spdlog::error("Enum '{}' declares member '{}' twice", name_,
                          raw.name);
            THROW_INVALID_ARGUMENT("Enum '{}' declares member '{}' twice",
                                   name_, raw.name);
        }

        auto inspection = inspector(raw.tags);
        if (inspection.preferredIndex &&
            *inspection.preferredIndex < raw.tags.size() &&
            *inspection.preferredIndex != 0) {
            const auto preferred =
                raw.tags.begin() +
                static_cast<std::ptrdiff_t>(*inspection.preferredIndex);
            std::rotate(raw.tags.begin(), preferred, preferred + 1);
        }

        member_type member{raw.value, std::move(raw.name),
                           std::make_shared<const TagList>(std::move(raw.tags)),
                           std::move(inspection.preferredText)};

        if (const auto index = primary_.indexOfFirst(member.value)) {
            if (inspection.forcePrimary) {
                auto previous = primary_.secondAt(*index);
                if (!primary_.replaceSecondAt(*index, std::move(member))) {
                    THROW_INVALID_ARGUMENT(
                        "Enum '{}' could not make a member primary", name_);
                }
                aliasNames.insert(previous.name);
                aliases_.push_back(std::move(previous));
            } else {
                aliasNames.insert(member.name);
                aliases_.push_back(std::move(member));
            }
            return;
        }

        auto position = primary_.size();
        while (position > 0 &&
               Ops::lessThan(member.value, primary_.firstAt(position - 1))) {
            --position;
        }
        if (Ops::isPowerOfTwo(member.value)) {
            allFlags_ = Ops::bitOr(allFlags_, member.value);
        }
        const auto value = member.value;
        if (!primary_.insert(position, value, std::move(member))) {
            THROW_INVALID_ARGUMENT("Enum '{}' could not index value {}", name_,
                                   Ops::toDecimalString(value));
        }
    }

    void computeContiguity() {
        if (primary_.empty()) {
            return;
        }
        const auto minValue = primary_.firstAt(0);
        const auto maxValue = primary_.firstAt(primary_.size() - 1);
        const auto span = static_cast<std::uint64_t>(
            static_cast<std::make_unsigned_t<TInt>>(
                Ops::subtract(maxValue, minValue)));
        contiguity_ = {minValue, maxValue, span == primary_.size() - 1};
    }

    template <std::integral I>
    static auto fitsWidth(I value) noexcept -> bool {
        if constexpr (std::is_signed_v<I>) {
            return Ops::isInValueRange(static_cast<std::int64_t>(value));
        } else {
            return Ops::isInValueRange(static_cast<std::uint64_t>(value));
        }
    }

    template <std::integral I>
    static auto createValue(I value) noexcept -> TInt {
        if constexpr (std::is_signed_v<I>) {
            return Ops::create(static_cast<std::int64_t>(value));
        } else {
            return Ops::create(static_cast<std::uint64_t>(value));
        }
    }

    void requireFlagDomain(std::string_view operation) const {
        if (!isFlagDomain_) {
            THROW_UNLAWFUL_OPERATION("{} requires a flag enum, '{}' is not one",
                                     operation, name_);
        }
    }

    void checkFlags(TInt value, std::string_view argument) const {
        requireFlagDomain("Flag operation");
        if (!isValidFlagCombination(value)) {
            THROW_INVALID_FLAG_COMBINATION(
                "{} 0x{} has bits outside the flags of '{}'", argument,
                Ops::toHexString(value), name_);
        }
    }

    void checkFormat(EnumFormat format) const {
        if (isBuiltInFormat(format)) {
            return;
        }
        if (isGlobalCustomFormat(format) && getGlobalFormatter(format)) {
            return;
        }
        if (isDomainCustomFormat(format) &&
            domainFormatters_.claimed(static_cast<int>(format))) {
            return;
        }
        THROW_INVALID_ARGUMENT("Unknown format {} for enum '{}'",
                               toString(format), name_);
    }

    [[noreturn]] void raiseParseFailure(const ParseFailure& failure,
                                        std::string_view text) const {
        switch (failure.kind) {
            case ParseErrorKind::OutOfRange:
                THROW_ENUM_OVERFLOW(
                    "'{}' is outside the underlying range of enum '{}'",
                    failure.token, name_);
            case ParseErrorKind::InvalidFlagCombination:
                THROW_INVALID_FLAG_COMBINATION(
                    "'{}' in '{}' is not a valid flag of '{}'", failure.token,
                    text, name_);
            case ParseErrorKind::NoMatch:
                break;
        }
        THROW_ENUM_PARSE_ERROR("'{}' is not a member of '{}' (token '{}')",
                               text, name_, failure.token);
    }

    auto parseValue(std::string_view text, bool ignoreCase, FormatList formats,
                    ParseFailure& failure) const -> std::optional<TInt> {
        const auto trimmed = utils::trimView(text);
        if (isFlagDomain_) {
            // a raw bitmask literal is taken as is
            TInt number{};
            if (Ops::parseDecimal(trimmed, number) == NumericParseStatus::Ok) {
                return number;
            }
            return parseFlagList(trimmed, ignoreCase, DEFAULT_FLAG_DELIMITER,
                                 formats, failure);
        }
        auto resolved = resolveToken(trimmed, ignoreCase, formats, failure);
        if (!resolved) {
            return std::nullopt;
        }
        return resolved->value;
    }

    auto parseFlagList(std::string_view text, bool ignoreCase,
                       std::string_view delimiter, FormatList formats,
                       ParseFailure& failure) const -> std::optional<TInt> {
        requireFlagDomain("parseFlags");
        if (delimiter.empty()) {
            THROW_INVALID_ARGUMENT("Flag delimiter for enum '{}' is empty",
                                   name_);
        }
        auto separator = utils::trimView(delimiter);
        if (separator.empty()) {
            separator = delimiter;
        }

        auto result = Ops::zero();
        for (const auto piece :
             utils::splitString(utils::trimView(text), separator)) {
            const auto token = utils::trimView(piece);
            const auto resolved =
                resolveToken(token, ignoreCase, formats, failure);
            if (!resolved) {
                return std::nullopt;
            }
            if (!isValidFlagCombination(resolved->value)) {
                failure = {ParseErrorKind::InvalidFlagCombination,
                           std::string(token)};
                return std::nullopt;
            }
            result = Ops::bitOr(result, resolved->value);
        }
        return result;
    }

    auto resolveToken(std::string_view token, bool ignoreCase,
                      FormatList formats, ParseFailure& failure) const
        -> std::optional<Resolved> {
        if (formats.empty()) {
            formats = DEFAULT_FORMAT_ORDER;
        }
        failure = {ParseErrorKind::NoMatch, std::string(token)};
        if (token.empty()) {
            return std::nullopt;
        }

        bool overflow = false;
        TInt number{};
        const auto numeric = [&overflow](NumericParseStatus status) {
            if (status == NumericParseStatus::OutOfRange) {
                overflow = true;
            }
            return status == NumericParseStatus::Ok;
        };

        if (numeric(Ops::parseDecimal(token, number))) {
            return Resolved{number, std::nullopt};
        }

        for (const auto format : formats) {
            switch (format) {
                case EnumFormat::DecimalValue:
                    // already tried above
                    break;
                case EnumFormat::HexadecimalValue:
                    if (numeric(Ops::parseHex(token, number))) {
                        return Resolved{number, std::nullopt};
                    }
                    break;
                case EnumFormat::Name:
                    if (auto member = getByName(token, ignoreCase)) {
                        const auto value = member->value;
                        return Resolved{value, std::move(member)};
                    }
                    break;
                default:
                    if (auto member = lookupFormatted(token, ignoreCase, format)) {
                        const auto value = member->value;
                        return Resolved{value, std::move(member)};
                    }
                    break;
            }
        }

        if (overflow) {
            failure.kind = ParseErrorKind::OutOfRange;
        }
        return std::nullopt;
    }

    auto lookupFormatted(std::string_view text, bool ignoreCase,
                         EnumFormat format) const
        -> std::optional<member_type> {
        const auto parser = formatParser(format);
        if (const auto iter = parser->exact.find(text);
            iter != parser->exact.end()) {
            return iter->second;
        }
        if (ignoreCase) {
            const auto folded = foldedEntries(*parser, format);
            if (const auto iter = folded->find(text); iter != folded->end()) {
                return iter->second;
            }
        }
        return std::nullopt;
    }

    auto caseInsensitiveNames() const
        -> std::shared_ptr<const CaseInsensitiveMap> {
        auto current = caseInsensitiveNames_.load(std::memory_order_acquire);
        if (current) {
            return current;
        }

        auto built = std::make_shared<CaseInsensitiveMap>();
        for (const auto& [value, member] : primary_) {
            built->emplace(member.name, member);
        }
        for (const auto& alias : aliases_) {
            built->emplace(alias.name, alias);
        }

        std::shared_ptr<const CaseInsensitiveMap> published = std::move(built);
        if (caseInsensitiveNames_.compare_exchange_strong(
                current, published, std::memory_order_acq_rel,
                std::memory_order_acquire)) {
            spdlog::trace("Built case-insensitive name index for enum '{}'",
                          name_);
            return published;
        }
        return current;
    }

    auto formatParser(EnumFormat format) const
        -> std::shared_ptr<const FormatParser> {
        const auto id = static_cast<int>(format);
        auto table = parsers_.load(std::memory_order_acquire);
        if (table) {
            if (const auto iter = table->find(id); iter != table->end()) {
                return iter->second;
            }
        }

        const auto parser = buildFormatParser(format);
        while (true) {
            auto updated = table ? std::make_shared<ParserTable>(*table)
                                 : std::make_shared<ParserTable>();
            updated->emplace(id, parser);
            std::shared_ptr<const ParserTable> desired = std::move(updated);
            if (parsers_.compare_exchange_weak(table, desired,
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire)) {
                return parser;
            }
            if (table) {
                if (const auto iter = table->find(id); iter != table->end()) {
                    return iter->second;
                }
            }
        }
    }

    auto buildFormatParser(EnumFormat format) const
        -> std::shared_ptr<const FormatParser> {
        checkFormat(format);
        auto parser = std::make_shared<FormatParser>();
        for (const auto& member : getMembers(true)) {
            if (auto text = formatMember(member, format)) {
                parser->entries.emplace_back(*text, member);
                parser->exact.insert_or_assign(std::move(*text), member);
            }
        }
        spdlog::trace("Built {} parser for enum '{}' ({} entries)",
                      toString(format), name_, parser->exact.size());
        return parser;
    }

    auto foldedEntries(const FormatParser& parser, EnumFormat format) const
        -> std::shared_ptr<const CaseInsensitiveMap> {
        auto current = parser.folded.load(std::memory_order_acquire);
        if (current) {
            return current;
        }

        auto built = std::make_shared<CaseInsensitiveMap>();
        for (const auto& [text, member] : parser.entries) {
            built->insert_or_assign(text, member);
        }

        std::shared_ptr<const CaseInsensitiveMap> published = std::move(built);
        if (parser.folded.compare_exchange_strong(current, published,
                                                  std::memory_order_acq_rel,
                                                  std::memory_order_acquire)) {
            spdlog::trace("Built case-insensitive {} parser for enum '{}'",
                          toString(format), name_);
            return published;
        }
        return current;
    }

    std::string name_;
    bool isFlagDomain_;
    Validator validator_;
    PrimaryIndex primary_;
    std::vector<member_type> aliases_;
    std::unordered_map<std::string, std::size_t, utils::StringHash,
                       std::equal_to<>>
        aliasIndex_;
    TInt allFlags_ = Ops::zero();
    Contiguity contiguity_;
    FormatterRegistry<Formatter> domainFormatters_;

    mutable std::atomic<std::shared_ptr<const CaseInsensitiveMap>>
        caseInsensitiveNames_{nullptr};
    mutable std::atomic<std::shared_ptr<const ParserTable>> parsers_{nullptr};
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_CACHE_HPP
