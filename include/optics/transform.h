// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file transform.h
/// @brief Pure input-to-output transforms and their composition.
///
/// A transform consumes an input and produces an output. Transforms built
/// from lenses live in lens_transform.h; this header holds the algebra:
///
/// ```cpp
/// auto tx = compose_tx(fn_tx<int>([](int x) { return x + 1; }),
///                      fn_tx<int>([](int x) { return x * 2; }));
/// tx.apply(0);  // == 2
/// ```

#pragma once

#include <optics/concepts.h>

#include <functional>
#include <type_traits>
#include <utility>

namespace optics {

// ============================================================
// ComposedTransform - Transform<A, B> then Transform<B, C>
// ============================================================

template<Transform Lhs, Transform Rhs>
    requires std::same_as<transform_output_t<Lhs>, transform_input_t<Rhs>>
class ComposedTransform {
public:
    using input_type = transform_input_t<Lhs>;
    using output_type = transform_output_t<Rhs>;

    constexpr ComposedTransform(Lhs lhs, Rhs rhs)
        : lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    [[nodiscard]] output_type apply(input_type input) const {
        return rhs_.apply(lhs_.apply(std::move(input)));
    }

private:
    Lhs lhs_;
    Rhs rhs_;
};

// ============================================================
// IdentityTransform - Passes the input through unchanged
// ============================================================

template<typename X>
class IdentityTransform {
public:
    using input_type = X;
    using output_type = X;

    [[nodiscard]] output_type apply(input_type input) const { return input; }
};

// ============================================================
// FnTransform - Lifts a plain function into a transform
// ============================================================

template<typename X, typename Fn>
    requires std::invocable<const Fn&, X>
class FnTransform {
public:
    using input_type = X;
    using output_type = std::remove_cvref_t<std::invoke_result_t<const Fn&, X>>;

    constexpr explicit FnTransform(Fn fn) : fn_(std::move(fn)) {}

    [[nodiscard]] output_type apply(input_type input) const {
        return std::invoke(fn_, std::move(input));
    }

private:
    Fn fn_;
};

// ============================================================
// Factories
// ============================================================

/// The identity transform; the unit of compose_tx()
template<typename X>
[[nodiscard]] constexpr IdentityTransform<X> identity_tx() {
    return {};
}

/// Wrap a function taking an X into a transform
template<typename X, typename Fn>
[[nodiscard]] constexpr auto fn_tx(Fn fn) {
    return FnTransform<X, Fn>{std::move(fn)};
}

/// Compose transforms left to right: compose_tx(a, b, c).apply(x) == c(b(a(x)))
template<Transform T>
[[nodiscard]] constexpr T compose_tx(T tx) {
    return tx;
}

template<Transform Lhs, Transform Rhs, Transform... Rest>
[[nodiscard]] constexpr auto compose_tx(Lhs lhs, Rhs rhs, Rest... rest) {
    if constexpr (sizeof...(Rest) == 0) {
        return ComposedTransform<Lhs, Rhs>{std::move(lhs), std::move(rhs)};
    } else {
        auto tail = compose_tx(std::move(rhs), std::move(rest)...);
        return ComposedTransform<Lhs, decltype(tail)>{std::move(lhs), std::move(tail)};
    }
}

/// Run `input` through a sequence of transforms in one call
template<Transform First, Transform... Rest>
[[nodiscard]] auto apply_tx(transform_input_t<First> input, First first, Rest... rest) {
    return compose_tx(std::move(first), std::move(rest)...).apply(std::move(input));
}

} // namespace optics
