// lager_adapters.h - Adapters between optics lenses and lager lenses
//
// optics lenses carry a path and support in-place mutation; lager lenses
// are van Laarhoven functors driven by lager::view / lager::set /
// lager::over. This header bridges the two in both directions.
//
// Features:
// 1. to_lager_lens()   - any readable optics lens as a lager::lens<S, T>
// 2. lager_chain()     - several optics lenses as one zug-composed lager lens
// 3. from_lager_lens() - any lager lens as an optics Lens + ValueLens
//
// Example usage:
//   auto l = to_lager_lens(compose(Struct2Lenses::struct1, Struct1Lenses::int32));
//   int32_t v = lager::view(l, s2);
//   Struct2 s = lager::over(l, s2, [](int32_t x) { return x + 1; });
//
//   auto attr = from_lager_lens<Struct1, int32_t>(lager::lenses::attr(&Struct1::int32),
//                                                 LensPath::single(0));
//   Struct1 s1 = attr.set(Struct1{}, 7);

#pragma once

#include <optics/optics_config.h>
#include <optics/lens_facade.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>
#include <zug/compose.hpp>

#include <concepts>
#include <type_traits>
#include <utility>

namespace optics {

// ============================================================
// Part 1: optics -> lager
// ============================================================

namespace detail {

/// Untyped lager lens functor over an optics lens (getter copies the target)
template<ReadableLens L>
    requires std::copy_constructible<lens_target_t<L>>
[[nodiscard]] auto lager_functor(L lens) {
    using source_type = lens_source_t<L>;
    using target_type = lens_target_t<L>;
    return lager::lenses::getset(
        // Getter
        [lens](const source_type& whole) -> target_type {
            return detail::read_target(lens, whole);
        },
        // Setter
        [lens](source_type whole, target_type part) -> source_type {
            lens.mutate(whole, std::move(part));
            return whole;
        });
}

} // namespace detail

/// @brief Type-erased lager lens over a readable optics lens
template<ReadableLens L>
    requires std::copy_constructible<lens_target_t<L>>
[[nodiscard]] lager::lens<lens_source_t<L>, lens_target_t<L>> to_lager_lens(L lens) {
    return detail::lager_functor(std::move(lens));
}

/// @brief Compose optics lenses (outermost first) as lager functors with zug::comp
///
/// Unlike optics::compose(), intermediate lenses only need to be readable:
/// lager rebuilds each level by value instead of mutating through references.
template<ReadableLens... Lenses>
    requires(sizeof...(Lenses) > 0)
[[nodiscard]] auto lager_chain(Lenses... lenses) {
    return zug::comp(detail::lager_functor(std::move(lenses))...);
}

// ============================================================
// Part 2: lager -> optics
// ============================================================

/// Lens + ValueLens over an arbitrary lager lens, tagged with a path
template<typename S, typename T, typename LagerLens>
class LagerLensAdapter : public LensFacade<LagerLensAdapter<S, T, LagerLens>> {
public:
    using source_type = S;
    using target_type = T;

    LagerLensAdapter(LagerLens lens, LensPath path)
        : lens_(std::move(lens)), path_(std::move(path)) {}

    [[nodiscard]] LensPath path() const { return path_; }

    void mutate(source_type& source, target_type target) const {
        source = lager::set(lens_, std::move(source), std::move(target));
    }

    [[nodiscard]] target_type get(const source_type& source) const {
        return lager::view(lens_, source);
    }

    [[nodiscard]] const LagerLens& lager_lens() const noexcept { return lens_; }

private:
    LagerLens lens_;
    LensPath path_;
};

/// @brief Wrap a lager lens over S focusing a T
/// @param path Identity of the focused field; lager lenses carry none of their own
template<typename S, typename T, typename LagerLens>
[[nodiscard]] auto from_lager_lens(LagerLens lens, LensPath path = {}) {
    return LagerLensAdapter<S, T, std::decay_t<LagerLens>>{std::move(lens), std::move(path)};
}

} // namespace optics
