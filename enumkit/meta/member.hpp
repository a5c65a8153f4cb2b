/*!
 * \file member.hpp
 * \brief Enum member records and the tags attached to them
 * \author Max Qian <lightapt.com>
 * \date 2024-05-12
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_MEMBER_HPP
#define ENUMKIT_META_MEMBER_HPP

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "enumkit/meta/numeric.hpp"

namespace enumkit::meta {

/**
 * \brief Ordered list of opaque labels attached to a member
 */
using TagList = std::vector<std::any>;

// **Built-in tags**

/**
 * \brief Human readable text; the default preferred textual tag
 */
struct Description {
    std::string text;
};

/**
 * \brief Alternative name used on the wire
 */
struct SerializedName {
    std::string text;
};

/**
 * \brief Marks a member as the canonical name for its value when several
 * members share one value
 */
struct PrimaryMember {};

namespace detail {
template <typename Tag>
auto findTag(const TagList& tags) -> const Tag* {
    for (const auto& tag : tags) {
        if (const auto* found = std::any_cast<Tag>(&tag)) {
            return found;
        }
    }
    return nullptr;
}
}  // namespace detail

/**
 * \brief Member as supplied by the host, before the cache resolves
 * duplicates
 */
template <EnumUnderlying TInt>
struct RawMember {
    TInt value;
    std::string name;
    TagList tags;
};

/**
 * \brief Width-erased view of a member, handed to global formatters that
 * serve every domain.
 */
struct EnumMemberView {
    std::string_view name;
    std::optional<std::string_view> description;
    const TagList* tags;
    std::variant<std::int64_t, std::uint64_t> value;

    template <typename Tag>
    [[nodiscard]] auto getTag() const -> const Tag* {
        return tags != nullptr ? detail::findTag<Tag>(*tags) : nullptr;
    }
};

/**
 * \brief Immutable member record held by an enum cache.
 *
 * The tag list is shared, so copies are cheap. If the tag inspector found a
 * preferred textual tag it sits at the front of the list and its text is
 * cached in \c description.
 */
template <EnumUnderlying TInt>
struct EnumMember {
    TInt value;
    std::string name;
    std::shared_ptr<const TagList> tags;
    std::optional<std::string> description;

    template <typename Tag>
    [[nodiscard]] auto getTag() const -> const Tag* {
        return tags ? detail::findTag<Tag>(*tags) : nullptr;
    }

    [[nodiscard]] auto view() const -> EnumMemberView {
        EnumMemberView result{name, std::nullopt, tags.get(), {}};
        if (description) {
            result.description = std::string_view(*description);
        }
        if constexpr (std::is_signed_v<TInt>) {
            result.value = static_cast<std::int64_t>(value);
        } else {
            result.value = static_cast<std::uint64_t>(value);
        }
        return result;
    }
};

/**
 * \brief What the tag inspector extracted from one member's tags
 */
struct TagInspection {
    std::optional<std::size_t> preferredIndex;  ///< tag to hoist to front
    std::optional<std::string> preferredText;
    bool forcePrimary = false;
};

using TagInspector = std::function<TagInspection(const TagList&)>;

/**
 * \brief Recognises Description as the preferred textual tag and
 * PrimaryMember as the force-primary marker
 */
inline auto defaultTagInspector(const TagList& tags) -> TagInspection {
    TagInspection inspection;
    for (std::size_t i = 0; i < tags.size(); ++i) {
        if (!inspection.preferredIndex) {
            if (const auto* description =
                    std::any_cast<Description>(&tags[i])) {
                inspection.preferredIndex = i;
                inspection.preferredText = description->text;
                continue;
            }
        }
        if (std::any_cast<PrimaryMember>(&tags[i]) != nullptr) {
            inspection.forcePrimary = true;
        }
    }
    return inspection;
}

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_MEMBER_HPP
