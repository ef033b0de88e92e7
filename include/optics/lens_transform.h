// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lens_transform.h
/// @brief Transforms that update a structure through a lens.
///
/// Each builder pairs a lens with a pure function and yields a
/// Transform<Source, Source>:
///
/// | Builder          | New target                         | Lens tier needed |
/// |------------------|------------------------------------|------------------|
/// | set_tx(l, f)     | f(whole source)                    | Lens             |
/// | mod_tx(l, f)     | f(current target)                  | readable         |
/// | increment_tx(l)  | current + 1 (integral targets)     | readable         |
/// | decrement_tx(l)  | current - 1 (integral targets)     | readable         |
/// | not_tx(l)        | !current                           | readable         |
///
/// "Readable" means RefLens (preferred, no copy) or ValueLens.

#pragma once

#include <optics/lens.h>
#include <optics/transform.h>

#include <functional>
#include <type_traits>
#include <utility>

namespace optics {

// ============================================================
// LensSetTransform
// ============================================================

/// Sets the lens target to the output of a function of the whole source
template<Lens L, typename Fn>
    requires SourceFunction<Fn, L>
class LensSetTransform {
public:
    using input_type = lens_source_t<L>;
    using output_type = lens_source_t<L>;

    LensSetTransform(L lens, Fn fn) : lens_(std::move(lens)), fn_(std::move(fn)) {}

    [[nodiscard]] output_type apply(input_type input) const {
        lens_target_t<L> new_value = std::invoke(fn_, std::as_const(input));
        lens_.mutate(input, std::move(new_value));
        return input;
    }

private:
    L lens_;
    Fn fn_;
};

// ============================================================
// LensModifyTransform
// ============================================================

/// Sets the lens target to the output of a function of the current target
template<ReadableLens L, typename Fn>
    requires TargetFunction<Fn, L>
class LensModifyTransform {
public:
    using input_type = lens_source_t<L>;
    using output_type = lens_source_t<L>;

    LensModifyTransform(L lens, Fn fn) : lens_(std::move(lens)), fn_(std::move(fn)) {}

    [[nodiscard]] output_type apply(input_type input) const {
        mutate_with(lens_, input, fn_);
        return input;
    }

private:
    L lens_;
    Fn fn_;
};

// ============================================================
// Step transforms (increment / decrement)
// ============================================================

/// Adds Step (+1 or -1) to an integral lens target.
/// The step is taken in the unsigned counterpart of the target type, so it
/// wraps modulo 2^N at the limits (INT32_MAX + 1 == INT32_MIN).
template<ReadableLens L, int Step>
    requires IntegralTarget<lens_target_t<L>>
class LensStepTransform {
public:
    using input_type = lens_source_t<L>;
    using output_type = lens_source_t<L>;

    explicit LensStepTransform(L lens) : lens_(std::move(lens)) {}

    [[nodiscard]] output_type apply(input_type input) const {
        using target_type = lens_target_t<L>;
        using unsigned_type = std::make_unsigned_t<target_type>;
        const auto bits = static_cast<unsigned_type>(detail::read_target(lens_, input));
        const target_type next = Step > 0 ? static_cast<target_type>(bits + 1u)
                                          : static_cast<target_type>(bits - 1u);
        lens_.mutate(input, next);
        return input;
    }

private:
    L lens_;
};

template<typename L>
using LensIncrementTransform = LensStepTransform<L, 1>;

template<typename L>
using LensDecrementTransform = LensStepTransform<L, -1>;

// ============================================================
// LensNotTransform
// ============================================================

/// Applies logical negation to the lens target
template<ReadableLens L>
    requires Negatable<lens_target_t<L>>
class LensNotTransform {
public:
    using input_type = lens_source_t<L>;
    using output_type = lens_source_t<L>;

    explicit LensNotTransform(L lens) : lens_(std::move(lens)) {}

    [[nodiscard]] output_type apply(input_type input) const {
        lens_target_t<L> negated = !detail::read_target(lens_, input);
        lens_.mutate(input, std::move(negated));
        return input;
    }

private:
    L lens_;
};

// ============================================================
// Factories
// ============================================================

template<Lens L, typename Fn>
    requires SourceFunction<Fn, L>
[[nodiscard]] auto set_tx(L lens, Fn fn) {
    return LensSetTransform<L, Fn>{std::move(lens), std::move(fn)};
}

template<ReadableLens L, typename Fn>
    requires TargetFunction<Fn, L>
[[nodiscard]] auto mod_tx(L lens, Fn fn) {
    return LensModifyTransform<L, Fn>{std::move(lens), std::move(fn)};
}

template<ReadableLens L>
    requires IntegralTarget<lens_target_t<L>>
[[nodiscard]] auto increment_tx(L lens) {
    return LensIncrementTransform<L>{std::move(lens)};
}

template<ReadableLens L>
    requires IntegralTarget<lens_target_t<L>>
[[nodiscard]] auto decrement_tx(L lens) {
    return LensDecrementTransform<L>{std::move(lens)};
}

template<ReadableLens L>
    requires Negatable<lens_target_t<L>>
[[nodiscard]] auto not_tx(L lens) {
    return LensNotTransform<L>{std::move(lens)};
}

} // namespace optics
