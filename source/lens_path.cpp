// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lens_path.cpp
/// @brief Implementation of LensPath.

#include <optics/lens_path.h>

#include <algorithm>
#include <ostream>

namespace optics {

// ============================================================
// LensPath - Construction
// ============================================================

LensPath::LensPath(std::uint64_t id)
    : elements_{LensPathElement{id}}
{
}

LensPath LensPath::from_pair(std::uint64_t id0, std::uint64_t id1) {
    return LensPath{element_vector{LensPathElement{id0}, LensPathElement{id1}}};
}

LensPath LensPath::from_sequence(std::initializer_list<std::uint64_t> ids) {
    auto elements = element_vector{}.transient();
    for (auto id : ids) {
        elements.push_back(LensPathElement{id});
    }
    return LensPath{elements.persistent()};
}

LensPath LensPath::concat(const LensPath& lhs, const LensPath& rhs) {
    if (lhs.empty()) return rhs;
    if (rhs.empty()) return lhs;
    return LensPath{lhs.elements_ + rhs.elements_};
}

// ============================================================
// LensPath - Observers
// ============================================================

bool LensPath::is_prefix_of(const LensPath& other) const {
    if (size() > other.size()) return false;
    return std::equal(begin(), end(), other.begin());
}

std::string LensPath::to_string() const {
    std::string result;
    result.reserve(2 + size() * 4);  // Estimate

    result += '[';
    bool first = true;
    for (const auto& elem : elements_) {
        if (!first) {
            result += ", ";
        }
        result += std::to_string(elem.id());
        first = false;
    }
    result += ']';
    return result;
}

// ============================================================
// LensPath - Comparison operators
// ============================================================

bool LensPath::operator==(const LensPath& other) const {
    return elements_ == other.elements_;
}

std::strong_ordering LensPath::operator<=>(const LensPath& other) const {
    return std::lexicographical_compare_three_way(
        begin(), end(), other.begin(), other.end());
}

std::ostream& operator<<(std::ostream& os, const LensPath& path) {
    return os << path.to_string();
}

} // namespace optics
