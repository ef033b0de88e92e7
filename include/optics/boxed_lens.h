// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file boxed_lens.h
/// @brief Type-erased lenses for storing heterogeneous lenses behind one type.
///
/// Each capability tier has an abstract interface; a small model template
/// adapts any concrete lens to it, and a copyable handle holds the model
/// through std::shared_ptr<const Interface>. Handles forward every call
/// unchanged, so a boxed lens behaves exactly like the lens it wraps and
/// composes like any other:
///
/// ```cpp
/// BoxedRefLens<Struct1, int32_t> leaf = Struct1Lenses::int32;
/// auto lens = compose(Struct3Lenses::struct2, box_ref_lens(Struct2Lenses::struct1), leaf);
/// ```
///
/// | Handle              | Interface                 | Tier               |
/// |---------------------|---------------------------|--------------------|
/// | BoxedLens<S, T>     | LensInterface<S, T>       | Lens               |
/// | BoxedRefLens<S, T>  | RefLensInterface<S, T>    | Lens + RefLens     |
/// | BoxedValueLens<S, T>| ValueLensInterface<S, T>  | Lens + ValueLens   |

#pragma once

#include <optics/lens_facade.h>

#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace optics {

// ============================================================
// Capability interfaces
// ============================================================

template<typename S, typename T>
class LensInterface {
public:
    virtual ~LensInterface() = default;

    [[nodiscard]] virtual LensPath path() const = 0;
    virtual void mutate(S& source, T target) const = 0;
};

template<typename S, typename T>
class RefLensInterface : public LensInterface<S, T> {
public:
    [[nodiscard]] virtual const T& get_ref(const S& source) const = 0;
    [[nodiscard]] virtual T& get_mut_ref(S& source) const = 0;
};

template<typename S, typename T>
class ValueLensInterface : public LensInterface<S, T> {
public:
    [[nodiscard]] virtual T get(const S& source) const = 0;
};

// ============================================================
// Models - one per tier, wrapping a concrete lens
// ============================================================

namespace detail {

template<typename L, typename Interface>
class LensModelBase : public Interface {
public:
    explicit LensModelBase(L lens) : lens_(std::move(lens)) {}

    [[nodiscard]] LensPath path() const override { return lens_.path(); }

    void mutate(lens_source_t<L>& source, lens_target_t<L> target) const override {
        lens_.mutate(source, std::move(target));
    }

protected:
    L lens_;
};

template<Lens L>
class LensModel final : public LensModelBase<L, LensInterface<lens_source_t<L>, lens_target_t<L>>> {
public:
    using LensModelBase<L, LensInterface<lens_source_t<L>, lens_target_t<L>>>::LensModelBase;
};

template<RefLens L>
class RefLensModel final : public LensModelBase<L, RefLensInterface<lens_source_t<L>, lens_target_t<L>>> {
public:
    using LensModelBase<L, RefLensInterface<lens_source_t<L>, lens_target_t<L>>>::LensModelBase;

    [[nodiscard]] const lens_target_t<L>& get_ref(const lens_source_t<L>& source) const override {
        return this->lens_.get_ref(source);
    }

    [[nodiscard]] lens_target_t<L>& get_mut_ref(lens_source_t<L>& source) const override {
        return this->lens_.get_mut_ref(source);
    }
};

template<ValueLens L>
class ValueLensModel final : public LensModelBase<L, ValueLensInterface<lens_source_t<L>, lens_target_t<L>>> {
public:
    using LensModelBase<L, ValueLensInterface<lens_source_t<L>, lens_target_t<L>>>::LensModelBase;

    [[nodiscard]] lens_target_t<L> get(const lens_source_t<L>& source) const override {
        return this->lens_.get(source);
    }
};

/// Returns `impl` unchanged; throws std::invalid_argument when it is null
template<typename Interface>
std::shared_ptr<const Interface> require_impl(std::shared_ptr<const Interface> impl)
{
    if (!impl) {
        throw std::invalid_argument("Boxed lens requires a non-null implementation");
    }
    return impl;
}

/// Lens L has exactly the source/target pair (S, T)
template<typename L, typename S, typename T>
concept LensOver = std::same_as<lens_source_t<L>, S> && std::same_as<lens_target_t<L>, T>;

} // namespace detail

// ============================================================
// BoxedRefLens
// ============================================================

template<typename S, typename T>
class BoxedRefLens : public LensFacade<BoxedRefLens<S, T>> {
public:
    using source_type = S;
    using target_type = T;
    using interface_type = RefLensInterface<S, T>;

    /// @throws std::invalid_argument if `impl` is null
    explicit BoxedRefLens(std::shared_ptr<const interface_type> impl)
        : impl_(detail::require_impl(std::move(impl))) {}

    template<typename L>
        requires(!std::same_as<L, BoxedRefLens>) && RefLens<L> && detail::LensOver<L, S, T>
    BoxedRefLens(L lens)
        : impl_(std::make_shared<detail::RefLensModel<L>>(std::move(lens))) {}

    [[nodiscard]] LensPath path() const { return impl_->path(); }
    void mutate(S& source, T target) const { impl_->mutate(source, std::move(target)); }
    [[nodiscard]] const T& get_ref(const S& source) const { return impl_->get_ref(source); }
    [[nodiscard]] T& get_mut_ref(S& source) const { return impl_->get_mut_ref(source); }

    [[nodiscard]] const std::shared_ptr<const interface_type>& impl() const noexcept { return impl_; }

private:
    std::shared_ptr<const interface_type> impl_;
};

// ============================================================
// BoxedValueLens
// ============================================================

template<typename S, typename T>
class BoxedValueLens : public LensFacade<BoxedValueLens<S, T>> {
public:
    using source_type = S;
    using target_type = T;
    using interface_type = ValueLensInterface<S, T>;

    /// @throws std::invalid_argument if `impl` is null
    explicit BoxedValueLens(std::shared_ptr<const interface_type> impl)
        : impl_(detail::require_impl(std::move(impl))) {}

    template<typename L>
        requires(!std::same_as<L, BoxedValueLens>) && ValueLens<L> && detail::LensOver<L, S, T>
    BoxedValueLens(L lens)
        : impl_(std::make_shared<detail::ValueLensModel<L>>(std::move(lens))) {}

    [[nodiscard]] LensPath path() const { return impl_->path(); }
    void mutate(S& source, T target) const { impl_->mutate(source, std::move(target)); }
    [[nodiscard]] T get(const S& source) const { return impl_->get(source); }

    [[nodiscard]] const std::shared_ptr<const interface_type>& impl() const noexcept { return impl_; }

private:
    std::shared_ptr<const interface_type> impl_;
};

// ============================================================
// BoxedLens
// ============================================================

template<typename S, typename T>
class BoxedLens : public LensFacade<BoxedLens<S, T>> {
public:
    using source_type = S;
    using target_type = T;
    using interface_type = LensInterface<S, T>;

    /// @throws std::invalid_argument if `impl` is null
    explicit BoxedLens(std::shared_ptr<const interface_type> impl)
        : impl_(detail::require_impl(std::move(impl))) {}

    template<typename L>
        requires(!std::same_as<L, BoxedLens>) && Lens<L> && detail::LensOver<L, S, T>
    BoxedLens(L lens)
        : impl_(std::make_shared<detail::LensModel<L>>(std::move(lens))) {}

    /// Narrow a boxed reference lens without another level of indirection
    BoxedLens(const BoxedRefLens<S, T>& lens) : impl_(lens.impl()) {}

    /// Narrow a boxed value lens without another level of indirection
    BoxedLens(const BoxedValueLens<S, T>& lens) : impl_(lens.impl()) {}

    [[nodiscard]] LensPath path() const { return impl_->path(); }
    void mutate(S& source, T target) const { impl_->mutate(source, std::move(target)); }

    [[nodiscard]] const std::shared_ptr<const interface_type>& impl() const noexcept { return impl_; }

private:
    std::shared_ptr<const interface_type> impl_;
};

// ============================================================
// Factories
// ============================================================

template<Lens L>
[[nodiscard]] BoxedLens<lens_source_t<L>, lens_target_t<L>> box_lens(L lens) {
    return BoxedLens<lens_source_t<L>, lens_target_t<L>>{std::move(lens)};
}

template<RefLens L>
[[nodiscard]] BoxedRefLens<lens_source_t<L>, lens_target_t<L>> box_ref_lens(L lens) {
    return BoxedRefLens<lens_source_t<L>, lens_target_t<L>>{std::move(lens)};
}

template<ValueLens L>
[[nodiscard]] BoxedValueLens<lens_source_t<L>, lens_target_t<L>> box_value_lens(L lens) {
    return BoxedValueLens<lens_source_t<L>, lens_target_t<L>>{std::move(lens)};
}

} // namespace optics
