// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file composed_lens.h
/// @brief Lens composition: Lens<A, B> + Lens<B, C> -> Lens<A, C>.
///
/// The outer lens must be a RefLens: both reads and mutate() need a
/// reference to the intermediate value to hand to the inner lens. Only the
/// deepest lens of a chain may be Identify-only.
///
/// | outer   | inner         | composed         |
/// |---------|---------------|------------------|
/// | RefLens | Lens          | Lens             |
/// | RefLens | RefLens       | RefLens          |
/// | RefLens | ValueLens     | ValueLens        |
///
/// Mismatched intermediate types, or an outer lens without reference
/// access, fail to compile at the compose() call.
///
/// ```cpp
/// auto lens = compose(Struct3Lenses::struct2, Struct2Lenses::struct1, Struct1Lenses::int32);
/// lens.path();  // [1, 1, 0]
/// ```

#pragma once

#include <optics/lens_facade.h>

#include <type_traits>
#include <utility>

namespace optics {

template<typename Outer, typename Inner>
    requires ComposableWith<Outer, Inner>
class ComposedLens : public LensFacade<ComposedLens<Outer, Inner>> {
public:
    using source_type = lens_source_t<Outer>;
    using target_type = lens_target_t<Inner>;

    constexpr ComposedLens(Outer outer, Inner inner)
        : outer_(std::move(outer)), inner_(std::move(inner)) {}

    /// outer's path followed by inner's path
    [[nodiscard]] LensPath path() const {
        return LensPath::concat(outer_.path(), inner_.path());
    }

    void mutate(source_type& source, target_type target) const {
        inner_.mutate(outer_.get_mut_ref(source), std::move(target));
    }

    [[nodiscard]] const target_type& get_ref(const source_type& source) const
        requires RefLens<Inner>
    {
        return inner_.get_ref(outer_.get_ref(source));
    }

    [[nodiscard]] target_type& get_mut_ref(source_type& source) const
        requires RefLens<Inner>
    {
        return inner_.get_mut_ref(outer_.get_mut_ref(source));
    }

    [[nodiscard]] target_type get(const source_type& source) const
        requires ValueLens<Inner>
    {
        return inner_.get(outer_.get_ref(source));
    }

    [[nodiscard]] const Outer& outer() const noexcept { return outer_; }
    [[nodiscard]] const Inner& inner() const noexcept { return inner_; }

private:
    Outer outer_;
    Inner inner_;
};

/// @brief Compose `outer` (A -> B) with `inner` (B -> C) into a lens A -> C
template<typename Outer, typename Inner>
    requires ComposableWith<std::remove_cvref_t<Outer>, std::remove_cvref_t<Inner>>
[[nodiscard]] constexpr auto compose(Outer&& outer, Inner&& inner) {
    return ComposedLens<std::remove_cvref_t<Outer>, std::remove_cvref_t<Inner>>{
        std::forward<Outer>(outer), std::forward<Inner>(inner)};
}

/// @brief Compose a chain of lenses, outermost first: compose(a, b, c) == compose(a, compose(b, c))
template<typename First, typename Second, typename Third, typename... Rest>
[[nodiscard]] constexpr auto compose(First&& first, Second&& second, Third&& third, Rest&&... rest) {
    return compose(std::forward<First>(first),
                   compose(std::forward<Second>(second), std::forward<Third>(third),
                           std::forward<Rest>(rest)...));
}

} // namespace optics
