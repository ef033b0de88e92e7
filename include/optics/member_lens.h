// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file member_lens.h
/// @brief Lens over a data member, addressed by pointer-to-member.
///
/// MemberLens is what a per-field accessor boils down to: the field is a
/// compile-time constant and the path element is the field's zero-based
/// position in its declaring struct. Code generators emit one per field;
/// hand-written accessor groups are one declaration each:
///
/// ```cpp
/// struct Struct1 { int32_t int32; int16_t int16; };
///
/// struct Struct1Lenses {
///     static constexpr auto int32 = member_lens<&Struct1::int32>(0);
///     static constexpr auto int16 = member_lens<&Struct1::int16>(1);
/// };
/// ```
///
/// Capabilities: Lens + RefLens always, ValueLens when the field type is a
/// ValueTarget (scalars, enums, std::string by default).

#pragma once

#include <optics/lens_facade.h>

#include <cstdint>
#include <type_traits>

namespace optics {

namespace detail {

template<typename MemberPtr>
struct member_pointer_traits;

template<typename S, typename T>
struct member_pointer_traits<T S::*> {
    using source_type = S;
    using target_type = T;
};

} // namespace detail

template<auto Member>
    requires std::is_member_object_pointer_v<decltype(Member)>
class MemberLens : public LensFacade<MemberLens<Member>> {
    using traits = detail::member_pointer_traits<decltype(Member)>;

public:
    using source_type = typename traits::source_type;
    using target_type = typename traits::target_type;

    constexpr explicit MemberLens(std::uint64_t index) noexcept : index_(index) {}

    [[nodiscard]] LensPath path() const { return LensPath::single(index_); }

    void mutate(source_type& source, target_type target) const {
        source.*Member = std::move(target);
    }

    [[nodiscard]] const target_type& get_ref(const source_type& source) const noexcept {
        return source.*Member;
    }

    [[nodiscard]] target_type& get_mut_ref(source_type& source) const noexcept {
        return source.*Member;
    }

    [[nodiscard]] target_type get(const source_type& source) const
        requires ValueTarget<target_type>
    {
        return source.*Member;
    }

    /// Position of the field among its siblings
    [[nodiscard]] constexpr std::uint64_t index() const noexcept { return index_; }

private:
    std::uint64_t index_;
};

/// @brief Create a lens over the data member `Member`
/// @param index Zero-based position of the field in its declaring struct
template<auto Member>
[[nodiscard]] constexpr MemberLens<Member> member_lens(std::uint64_t index) noexcept {
    return MemberLens<Member>{index};
}

} // namespace optics
