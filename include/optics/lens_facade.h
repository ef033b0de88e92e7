// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lens_facade.h
/// @brief CRTP base giving every library lens member-call sugar.
///
/// A lens only has to implement path() / mutate() (plus get_ref() / get()
/// for the read tiers). Deriving from LensFacade adds:
///
/// ```cpp
/// auto s1 = lens.set(s0, 41);
/// auto s2 = lens.modify(s1, [](int v) { return v + 1; });
/// auto tx = lens.increment_tx();
/// ```
///
/// Everything here forwards to the free functions in lens.h and
/// lens_transform.h, so lenses that do not derive from LensFacade lose
/// nothing but the member syntax.

#pragma once

#include <optics/lens.h>
#include <optics/lens_transform.h>

#include <utility>

namespace optics {

template<typename Derived>
class LensFacade {
public:
    /// Set the target and return the new state of the source
    template<typename Source, typename Target>
    [[nodiscard]] auto set(Source&& source, Target&& target) const {
        return lens_set(derived(), std::forward<Source>(source), std::forward<Target>(target));
    }

    /// Set the target to fn(current target) and return the new state of the source
    template<typename Source, typename Fn>
    [[nodiscard]] auto modify(Source&& source, const Fn& fn) const {
        return lens_modify(derived(), std::forward<Source>(source), fn);
    }

    // ============================================================
    // Transform builders
    // ============================================================

    template<typename Fn>
    [[nodiscard]] auto set_tx(Fn fn) const {
        return optics::set_tx(derived(), std::move(fn));
    }

    template<typename Fn>
    [[nodiscard]] auto mod_tx(Fn fn) const {
        return optics::mod_tx(derived(), std::move(fn));
    }

    template<typename Self = Derived>
    [[nodiscard]] auto increment_tx() const {
        return optics::increment_tx(static_cast<const Self&>(*this));
    }

    template<typename Self = Derived>
    [[nodiscard]] auto decrement_tx() const {
        return optics::decrement_tx(static_cast<const Self&>(*this));
    }

    template<typename Self = Derived>
    [[nodiscard]] auto not_tx() const {
        return optics::not_tx(static_cast<const Self&>(*this));
    }

protected:
    LensFacade() = default;

private:
    [[nodiscard]] const Derived& derived() const noexcept {
        return static_cast<const Derived&>(*this);
    }
};

} // namespace optics
