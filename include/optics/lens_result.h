// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lens_result.h
/// @brief Non-throwing lens access returning a status result.
///
/// Lens reads and writes report out-of-range indices by throwing
/// IndexOutOfRange. Callers that prefer a status value use the try_*
/// functions instead:
///
/// ```cpp
/// auto result = try_get(vec_lens<int>(5), values);
/// if (!result) {
///     std::cerr << result.error_message << "\n";
/// }
/// int v = result.get_or(0);
/// ```

#pragma once

#include <optics/lens.h>
#include <optics/lens_error.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace optics {

enum class LensErrorCode {
    Success = 0,
    IndexOutOfRange,    // Collection index outside bounds at access time
};

template<typename T>
struct LensAccessResult {
    std::optional<T> value;         // The accessed value (empty on error)
    bool success = false;           // Whether the access succeeded
    LensErrorCode error_code = LensErrorCode::Success;
    std::string error_message;      // Human-readable error description

    explicit operator bool() const noexcept { return success; }

    const T& get() const {
        if (!success) {
            throw std::runtime_error("Lens access failed: " + error_message);
        }
        return *value;
    }

    T get_or(T default_val) const {
        return success ? *value : std::move(default_val);
    }

    [[nodiscard]] static LensAccessResult ok(T v) {
        LensAccessResult result;
        result.value = std::move(v);
        result.success = true;
        return result;
    }

    [[nodiscard]] static LensAccessResult failure(LensErrorCode code, std::string message) {
        LensAccessResult result;
        result.error_code = code;
        result.error_message = std::move(message);
        return result;
    }
};

/// @brief Read a copy of the target, reporting out-of-range indices as a result
template<ReadableLens L>
    requires std::copy_constructible<lens_target_t<L>>
[[nodiscard]] LensAccessResult<lens_target_t<L>> try_get(const L& lens, const lens_source_t<L>& source)
{
    using result_type = LensAccessResult<lens_target_t<L>>;
    try {
        return result_type::ok(detail::read_target(lens, source));
    } catch (const IndexOutOfRange& e) {
        return result_type::failure(LensErrorCode::IndexOutOfRange, e.what());
    }
}

/// @brief lens_set() reporting out-of-range indices as a result
template<Lens L>
[[nodiscard]] LensAccessResult<lens_source_t<L>> try_set(const L& lens, lens_source_t<L> source,
                                                          lens_target_t<L> target)
{
    using result_type = LensAccessResult<lens_source_t<L>>;
    try {
        return result_type::ok(lens_set(lens, std::move(source), std::move(target)));
    } catch (const IndexOutOfRange& e) {
        return result_type::failure(LensErrorCode::IndexOutOfRange, e.what());
    }
}

/// @brief lens_modify() reporting out-of-range indices as a result
template<ReadableLens L, typename Fn>
    requires TargetFunction<Fn, L>
[[nodiscard]] LensAccessResult<lens_source_t<L>> try_modify(const L& lens, lens_source_t<L> source,
                                                             const Fn& fn)
{
    using result_type = LensAccessResult<lens_source_t<L>>;
    try {
        return result_type::ok(lens_modify(lens, std::move(source), fn));
    } catch (const IndexOutOfRange& e) {
        return result_type::failure(LensErrorCode::IndexOutOfRange, e.what());
    }
}

} // namespace optics
