// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lens_error.h
/// @brief Errors raised by lens reads and mutations.

#pragma once

#include <optics/api.h>

#include <cstddef>
#include <stdexcept>

namespace optics {

/// Thrown when a collection-element lens addresses an index outside the
/// collection at the moment of a read or mutation. Raised before anything is
/// written, so the source is never partially updated.
class OPTICS_API IndexOutOfRange : public std::out_of_range {
public:
    IndexOutOfRange(std::size_t index, std::size_t size);

    [[nodiscard]] std::size_t index() const noexcept { return index_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
    std::size_t index_;
    std::size_t size_;
};

namespace detail {

/// Throws IndexOutOfRange unless index < size
inline void check_index(std::size_t index, std::size_t size)
{
    if (index >= size) [[unlikely]] {
        throw IndexOutOfRange{index, size};
    }
}

} // namespace detail

} // namespace optics
