// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file immer_index_lens.h
/// @brief Lens over one element of a persistent immer vector.
///
/// immer containers never hand out mutable references, so this lens stops
/// at the Identify + ValueLens tiers: mutate() swaps the whole vector for
/// an updated copy (sharing all untouched nodes), get() copies the element
/// out. It can therefore sit at the end of a composed chain, but not in
/// the middle of one.
///
/// ```cpp
/// struct Scene { immer::vector<int> layers; };
/// auto lens = compose(member_lens<&Scene::layers>(0), immer_index_lens<int>(2));
/// ```

#pragma once

#include <optics/optics_config.h>
#include <optics/lens_error.h>
#include <optics/lens_facade.h>

#include <immer/flex_vector.hpp>
#include <immer/vector.hpp>

#include <cstddef>

namespace optics {

template<PersistentSequence Vector>
class ImmerIndexLens : public LensFacade<ImmerIndexLens<Vector>> {
public:
    using source_type = Vector;
    using target_type = typename Vector::value_type;

    constexpr explicit ImmerIndexLens(std::size_t index) noexcept : index_(index) {}

    [[nodiscard]] LensPath path() const { return LensPath::from_index(index_); }

    void mutate(source_type& source, target_type target) const {
        detail::check_index(index_, source.size());
        source = std::move(source).set(index_, std::move(target));
    }

    /// Elements of a persistent vector are immutable values, so any element
    /// type may be copied out.
    [[nodiscard]] target_type get(const source_type& source) const {
        detail::check_index(index_, source.size());
        return source[index_];
    }

    [[nodiscard]] constexpr std::size_t index() const noexcept { return index_; }

private:
    std::size_t index_;
};

/// @brief Lens over element `index` of an immer::vector<T>
template<typename T>
[[nodiscard]] constexpr ImmerIndexLens<immer::vector<T>> immer_index_lens(std::size_t index) noexcept {
    return ImmerIndexLens<immer::vector<T>>{index};
}

/// @brief Lens over element `index` of an immer::flex_vector<T>
template<typename T>
[[nodiscard]] constexpr ImmerIndexLens<immer::flex_vector<T>> immer_flex_index_lens(std::size_t index) noexcept {
    return ImmerIndexLens<immer::flex_vector<T>>{index};
}

} // namespace optics
