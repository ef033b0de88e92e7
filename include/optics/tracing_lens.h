// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tracing_lens.h
/// @brief Delegating lens that logs every operation it forwards.
///
/// Wrap a lens with traced() while debugging a transform pipeline:
///
/// ```cpp
/// auto lens = traced(compose(Struct2Lenses::struct1, Struct1Lenses::int32));
/// auto s = lens.set(s0, 7);
/// // stderr: [TracingLens] mutate [1, 0]
/// ```
///
/// TracingLens exposes exactly the tiers of the lens it wraps.

#pragma once

#include <optics/api.h>
#include <optics/lens_facade.h>

#include <iostream>
#include <string_view>
#include <utility>

namespace optics {

namespace detail {

/// Write one "[TracingLens] <operation> <path>" line
OPTICS_API void write_trace(std::ostream& os, std::string_view operation, const LensPath& path);

} // namespace detail

template<Lens L>
class TracingLens : public LensFacade<TracingLens<L>> {
public:
    using source_type = lens_source_t<L>;
    using target_type = lens_target_t<L>;

    TracingLens(L lens, std::ostream& os) : lens_(std::move(lens)), os_(&os) {}

    [[nodiscard]] LensPath path() const {
        auto p = lens_.path();
        detail::write_trace(*os_, "path", p);
        return p;
    }

    void mutate(source_type& source, target_type target) const {
        detail::write_trace(*os_, "mutate", lens_.path());
        lens_.mutate(source, std::move(target));
    }

    [[nodiscard]] const target_type& get_ref(const source_type& source) const
        requires RefLens<L>
    {
        detail::write_trace(*os_, "get_ref", lens_.path());
        return lens_.get_ref(source);
    }

    [[nodiscard]] target_type& get_mut_ref(source_type& source) const
        requires RefLens<L>
    {
        detail::write_trace(*os_, "get_mut_ref", lens_.path());
        return lens_.get_mut_ref(source);
    }

    [[nodiscard]] target_type get(const source_type& source) const
        requires ValueLens<L>
    {
        detail::write_trace(*os_, "get", lens_.path());
        return lens_.get(source);
    }

    [[nodiscard]] const L& wrapped() const noexcept { return lens_; }

private:
    L lens_;
    std::ostream* os_;
};

/// @brief Wrap `lens` so each operation is logged to `os` (std::clog by default)
template<Lens L>
[[nodiscard]] TracingLens<L> traced(L lens, std::ostream& os = std::clog) {
    return TracingLens<L>{std::move(lens), os};
}

} // namespace optics
