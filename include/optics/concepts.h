// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts describing lens capabilities and transform shapes.
///
/// A lens is not a class hierarchy but a capability set. Any type that
/// exposes the members below models the corresponding concept:
///
/// | Concept      | Requires                                                   |
/// |--------------|------------------------------------------------------------|
/// | Lens         | source_type, target_type, path(), mutate(Source&, Target)  |
/// | RefLens      | Lens + get_ref(const Source&), get_mut_ref(Source&)        |
/// | ValueLens    | Lens + get(const Source&) returning a Target copy          |
///
/// @note Requires C++20 or later.

#pragma once

#include <optics/lens_path.h>

#include <concepts>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

namespace optics {

// ============================================================
// Lens type aliases
// ============================================================

template<typename L>
using lens_source_t = typename std::remove_cvref_t<L>::source_type;

template<typename L>
using lens_target_t = typename std::remove_cvref_t<L>::target_type;

// ============================================================
// Value access opt-in
// ============================================================

/// Targets that may be read by value (copied out of their source).
/// Cheap leaf types are enabled by default; composite structures are not,
/// so reading them goes through get_ref() instead of a deep copy.
/// Specialise to opt a type in or out:
/// @code
/// template<> inline constexpr bool optics::enable_value_access<Color> = true;
/// @endcode
template<typename T>
inline constexpr bool enable_value_access =
    std::is_arithmetic_v<T> || std::is_enum_v<T> || std::is_same_v<T, std::string>;

template<typename T>
concept ValueTarget = std::copy_constructible<T> && enable_value_access<std::remove_cv_t<T>>;

// ============================================================
// Lens capability concepts
// ============================================================

/// Identify tier: a static path plus in-place mutation
template<typename L>
concept Lens = requires {
    typename std::remove_cvref_t<L>::source_type;
    typename std::remove_cvref_t<L>::target_type;
} && requires(const std::remove_cvref_t<L>& lens, lens_source_t<L>& source, lens_target_t<L> target) {
    { lens.path() } -> std::convertible_to<LensPath>;
    lens.mutate(source, std::move(target));
};

/// Read-by-reference tier
template<typename L>
concept RefLens = Lens<L> && requires(const std::remove_cvref_t<L>& lens,
                                      const lens_source_t<L>& source,
                                      lens_source_t<L>& mut_source) {
    { lens.get_ref(source) } -> std::same_as<const lens_target_t<L>&>;
    { lens.get_mut_ref(mut_source) } -> std::same_as<lens_target_t<L>&>;
};

/// Read-by-value tier
template<typename L>
concept ValueLens = Lens<L> && requires(const std::remove_cvref_t<L>& lens,
                                        const lens_source_t<L>& source) {
    { lens.get(source) } -> std::same_as<lens_target_t<L>>;
};

/// Any lens whose target can be read one way or the other
template<typename L>
concept ReadableLens = RefLens<L> || ValueLens<L>;

/// Inner lens whose source is the outer lens's target
template<typename Outer, typename Inner>
concept ComposableWith = RefLens<Outer> && Lens<Inner> &&
                         std::same_as<lens_target_t<Outer>, lens_source_t<Inner>>;

// ============================================================
// Target concepts used by the transform builders
// ============================================================

/// Integral targets with a well-defined unit step (bool excluded)
template<typename T>
concept IntegralTarget = std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool>;

/// Targets supporting logical negation
template<typename T>
concept Negatable = std::copy_constructible<T> && requires(const T& t) {
    { !t } -> std::convertible_to<T>;
};

// ============================================================
// Callable concepts
// ============================================================

/// Computes a new target from the whole (pre-mutation) source
template<typename Fn, typename L>
concept SourceFunction = std::invocable<const Fn&, const lens_source_t<L>&> &&
                         std::convertible_to<std::invoke_result_t<const Fn&, const lens_source_t<L>&>,
                                             lens_target_t<L>>;

/// Computes a new target from the current target
template<typename Fn, typename L>
concept TargetFunction = std::invocable<const Fn&, const lens_target_t<L>&> &&
                         std::convertible_to<std::invoke_result_t<const Fn&, const lens_target_t<L>&>,
                                             lens_target_t<L>>;

// ============================================================
// Transform concept
// ============================================================

/// A unary, pure operation consuming an input and producing an output
template<typename T>
concept Transform = requires {
    typename std::remove_cvref_t<T>::input_type;
    typename std::remove_cvref_t<T>::output_type;
} && requires(const std::remove_cvref_t<T>& tx, typename std::remove_cvref_t<T>::input_type input) {
    { tx.apply(std::move(input)) } -> std::same_as<typename std::remove_cvref_t<T>::output_type>;
};

template<typename T>
using transform_input_t = typename std::remove_cvref_t<T>::input_type;

template<typename T>
using transform_output_t = typename std::remove_cvref_t<T>::output_type;

// ============================================================
// Container concepts
// ============================================================

/// Containers with size() and mutable index access (std::vector, std::deque, std::array)
template<typename C>
concept MutableSequence = requires(C& c, const C& cc, std::size_t i) {
    typename C::value_type;
    { cc.size() } -> std::convertible_to<std::size_t>;
    { c[i] } -> std::same_as<typename C::value_type&>;
    { cc[i] } -> std::same_as<const typename C::value_type&>;
};

/// Persistent sequences updated by returning a new container (immer::vector, immer::flex_vector)
template<typename C>
concept PersistentSequence = requires(const C& cc, std::size_t i, typename C::value_type v) {
    typename C::value_type;
    { cc.size() } -> std::convertible_to<std::size_t>;
    { cc[i] } -> std::convertible_to<const typename C::value_type&>;
    { cc.set(i, std::move(v)) } -> std::same_as<C>;
};

} // namespace optics
