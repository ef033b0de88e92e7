// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lens.h
/// @brief Lens operations shared by every lens type.
///
/// These free functions work on anything modelling the concepts in
/// concepts.h, so a hand-written or generated lens gets them for free:
///
/// ```cpp
/// auto s1 = lens_set(lens, s0, 41);                          // consumes a copy
/// auto s2 = lens_modify(lens, s1, [](int v) { return v - 1; });
/// int  v  = lens_get(lens, s2);                              // ValueLens only
/// ```
///
/// `mutate()` is the in-place primitive every lens implements; callers
/// normally go through lens_set() / lens_modify() instead.

#pragma once

#include <optics/concepts.h>

#include <functional>
#include <utility>

namespace optics {

namespace detail {

/// Read the target by reference when the lens supports it, by value otherwise
template<ReadableLens L>
[[nodiscard]] decltype(auto) read_target(const L& lens, const lens_source_t<L>& source)
{
    if constexpr (RefLens<L>) {
        return lens.get_ref(source);
    } else {
        return lens.get(source);
    }
}

} // namespace detail

// ============================================================
// Reads
// ============================================================

/// @brief Get a copy of the lens target (does not consume the source)
template<ValueLens L>
[[nodiscard]] lens_target_t<L> lens_get(const L& lens, const lens_source_t<L>& source)
{
    return lens.get(source);
}

/// @brief Get a reference to the lens target (does not consume the source)
template<RefLens L>
[[nodiscard]] const lens_target_t<L>& lens_get_ref(const L& lens, const lens_source_t<L>& source)
{
    return lens.get_ref(source);
}

// ============================================================
// Updates
// ============================================================

/// @brief Set the lens target and return the new state of the source
/// @param source Taken by value; the caller's structure is never touched
/// @throws IndexOutOfRange when an index hop is out of bounds (nothing is written)
template<Lens L>
[[nodiscard]] lens_source_t<L> lens_set(const L& lens, lens_source_t<L> source, lens_target_t<L> target)
{
    lens.mutate(source, std::move(target));
    return source;
}

/// @brief Replace the target in place with fn(current target)
template<ReadableLens L, typename Fn>
    requires TargetFunction<Fn, L>
void mutate_with(const L& lens, lens_source_t<L>& source, const Fn& fn)
{
    lens_target_t<L> target = std::invoke(fn, detail::read_target(lens, source));
    lens.mutate(source, std::move(target));
}

/// @brief Set the target to fn(current target) and return the new state of the source
template<ReadableLens L, typename Fn>
    requires TargetFunction<Fn, L>
[[nodiscard]] lens_source_t<L> lens_modify(const L& lens, lens_source_t<L> source, const Fn& fn)
{
    mutate_with(lens, source, fn);
    return source;
}

} // namespace optics
