// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lens_path.h
/// @brief Structural identifiers describing where a lens points inside its source.
///
/// A LensPath is the ordered list of hops (field index or collection index)
/// taken from a root structure down to a lens target:
///
/// ```cpp
/// auto p = LensPath::concat(LensPath::single(1), LensPath::single(0));
/// // p.to_string() == "[1, 0]"
/// ```
///
/// ## Design Philosophy
///
/// - Paths are immutable values built once, at lens construction time
/// - Elements live in an immer::flex_vector, so copies share structure and
///   concat() is a logarithmic, non-mutating operation
/// - Equality and ordering are purely structural (element-wise)

#pragma once

#include <optics/optics_config.h>
#include <optics/api.h>

#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <ranges>
#include <string>

namespace optics {

// ============================================================
// LensPathElement - A single hop in a LensPath
// ============================================================

/// One hop from a structure to one of its fields or elements
class LensPathElement {
public:
    constexpr LensPathElement() noexcept = default;
    constexpr explicit LensPathElement(std::uint64_t id) noexcept : id_(id) {}

    [[nodiscard]] constexpr std::uint64_t id() const noexcept { return id_; }

    constexpr auto operator<=>(const LensPathElement&) const = default;

private:
    std::uint64_t id_ = 0;
};

// ============================================================
// LensPath - Ordered hop list from a root to a lens target
// ============================================================

class OPTICS_API LensPath {
public:
    using value_type = LensPathElement;
    using element_vector = immer::flex_vector<LensPathElement>;
    using const_iterator = element_vector::const_iterator;
    using iterator = const_iterator;
    using size_type = std::size_t;

    /// Default constructor - the empty path (the whole structure)
    LensPath() = default;

    /// Single-element path
    explicit LensPath(std::uint64_t id);

    // ============================================================
    // Factories
    // ============================================================

    /// Path with no elements
    [[nodiscard]] static LensPath empty_path() { return LensPath{}; }

    /// Path with a single element
    [[nodiscard]] static LensPath single(std::uint64_t id) { return LensPath{id}; }

    /// Path with a single index (for an indexed container such as std::vector)
    [[nodiscard]] static LensPath from_index(std::size_t index) {
        return LensPath{static_cast<std::uint64_t>(index)};
    }

    /// Path with two elements
    [[nodiscard]] static LensPath from_pair(std::uint64_t id0, std::uint64_t id1);

    /// Path with one element per id, in order
    [[nodiscard]] static LensPath from_sequence(std::initializer_list<std::uint64_t> ids);

    /// Path with one element per id of any unsigned integral range, in order
    template<std::ranges::input_range Range>
        requires std::unsigned_integral<std::ranges::range_value_t<Range>>
    [[nodiscard]] static LensPath from_sequence(const Range& ids) {
        auto elements = element_vector{}.transient();
        for (auto id : ids) {
            elements.push_back(LensPathElement{static_cast<std::uint64_t>(id)});
        }
        return LensPath{elements.persistent()};
    }

    /// A new path holding lhs's elements followed by rhs's; neither input changes
    [[nodiscard]] static LensPath concat(const LensPath& lhs, const LensPath& rhs);

    // ============================================================
    // Observers
    // ============================================================

    [[nodiscard]] const_iterator begin() const { return elements_.begin(); }
    [[nodiscard]] const_iterator end() const { return elements_.end(); }

    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }

    [[nodiscard]] const LensPathElement& operator[](std::size_t i) const { return elements_[i]; }
    [[nodiscard]] const LensPathElement& front() const { return elements_.front(); }
    [[nodiscard]] const LensPathElement& back() const { return elements_.back(); }

    [[nodiscard]] const element_vector& elements() const noexcept { return elements_; }

    /// True when every element of this path starts `other`
    [[nodiscard]] bool is_prefix_of(const LensPath& other) const;

    /// Human-readable form, e.g. "[1, 2, 3]" ("[]" for the empty path)
    [[nodiscard]] std::string to_string() const;

    // ============================================================
    // Comparison
    // ============================================================

    [[nodiscard]] bool operator==(const LensPath& other) const;
    [[nodiscard]] std::strong_ordering operator<=>(const LensPath& other) const;

private:
    explicit LensPath(element_vector elements) : elements_(std::move(elements)) {}

    element_vector elements_;
};

OPTICS_API std::ostream& operator<<(std::ostream& os, const LensPath& path);

} // namespace optics

template<>
struct std::hash<optics::LensPath> {
    std::size_t operator()(const optics::LensPath& path) const noexcept {
        std::size_t hash = 0;
        for (const auto& elem : path) {
            hash ^= std::hash<std::uint64_t>{}(elem.id()) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
        }
        return hash;
    }
};
