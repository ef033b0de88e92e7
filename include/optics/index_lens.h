// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file index_lens.h
/// @brief Lens over one element of a mutable random-access container.
///
/// The element index doubles as the path element. Every access is bounds
/// checked and throws IndexOutOfRange instead of reading or writing past
/// the end:
///
/// ```cpp
/// auto lens = vec_lens<uint32_t>(1);
/// auto v1 = lens.set(std::vector<uint32_t>{0, 1, 2}, 42);  // {0, 42, 2}
/// vec_lens<uint32_t>(5).get_ref(v1);                      // throws IndexOutOfRange
/// ```

#pragma once

#include <optics/lens_error.h>
#include <optics/lens_facade.h>

#include <cstddef>
#include <vector>

namespace optics {

template<MutableSequence Container>
class IndexLens : public LensFacade<IndexLens<Container>> {
public:
    using source_type = Container;
    using target_type = typename Container::value_type;

    constexpr explicit IndexLens(std::size_t index) noexcept : index_(index) {}

    [[nodiscard]] LensPath path() const { return LensPath::from_index(index_); }

    void mutate(source_type& source, target_type target) const {
        detail::check_index(index_, source.size());
        source[index_] = std::move(target);
    }

    [[nodiscard]] const target_type& get_ref(const source_type& source) const {
        detail::check_index(index_, source.size());
        return source[index_];
    }

    [[nodiscard]] target_type& get_mut_ref(source_type& source) const {
        detail::check_index(index_, source.size());
        return source[index_];
    }

    [[nodiscard]] target_type get(const source_type& source) const
        requires ValueTarget<target_type>
    {
        detail::check_index(index_, source.size());
        return source[index_];
    }

    [[nodiscard]] constexpr std::size_t index() const noexcept { return index_; }

private:
    std::size_t index_;
};

/// @brief Lens over element `index` of any MutableSequence container
template<MutableSequence Container>
[[nodiscard]] constexpr IndexLens<Container> index_lens(std::size_t index) noexcept {
    return IndexLens<Container>{index};
}

/// @brief Lens over element `index` of a std::vector<T>
template<typename T>
[[nodiscard]] constexpr IndexLens<std::vector<T>> vec_lens(std::size_t index) noexcept {
    return IndexLens<std::vector<T>>{index};
}

} // namespace optics
