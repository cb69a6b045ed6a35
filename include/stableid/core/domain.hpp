/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file domain.hpp
 * @brief Identifier domains: the categories of things that can be identified.
 *
 * @details
 * A domain is any type that declares four members:
 * - `static constexpr std::string_view name`: presentable name, used in diagnostics;
 * - `using Backing`: the concrete payload type stored by `Id<Domain>`;
 * - `using Generator`: a generator type (see generate.hpp), or `void`;
 * - `using ConstRepr`: the constant representation used by `StableTypeId`, or `void`.
 *
 * Deriving from `IdDomain<Domain>` adds the convenience constructors. The domain type
 * may be a pure marker or a regular data type that also serves as its own domain.
 */

#pragma once

#include "stableid/core/generate.hpp"
#include "stableid/core/id.hpp"
#include "stableid/core/traits.hpp"

#include <string_view>
#include <type_traits>
#include <utility>

namespace stableid {

template <typename D>
using domain_name_t = decltype(D::name);

template <typename D>
using domain_backing_t = typename D::Backing;

template <typename D>
using domain_generator_t = typename D::Generator;

template <typename D>
using domain_const_repr_t = typename D::ConstRepr;

/// @brief Whether `D` declares everything a domain descriptor requires.
template <typename D>
inline constexpr bool is_id_domain_v =
    is_detected_v<domain_name_t, D> && is_detected_v<domain_backing_t, D> &&
    is_detected_v<domain_generator_t, D> && is_detected_v<domain_const_repr_t, D>;

/**
 * @class IdDomain
 * @brief CRTP base giving a domain its identifier constructors.
 *
 * @details
 * `generate_id` and `generate_id_stateful` only exist when `Derived::Generator` has the
 * matching capability for `Derived`; calling the wrong one does not compile.
 *
 * @code
 * struct Bird : stableid::IdDomain<Bird> {
 *     static constexpr std::string_view name = "Bird";
 *     using Backing = stableid::TinyId<16>;
 *     using Generator = stableid::TinyIdGen<16>;
 *     using ConstRepr = void;
 * };
 *
 * auto random_bird = Bird::generate_id();
 * auto named_bird = Bird::new_id("short");
 * @endcode
 */
template <typename Derived>
class IdDomain {
  public:
    /**
     * @brief Constructs an identifier from any value the backing type can be built from.
     *
     * No validation beyond the conversion itself. Narrowing conversions (a negative
     * `int` into an unsigned backing, for instance) do not participate.
     */
    template <typename Value, typename D = Derived,
              typename = std::enable_if_t<
                  is_lossless_constructible_v<typename D::Backing, Value&&>>>
    static Id<D> new_id(Value&& value)
    {
        return Id<D>(typename D::Backing{std::forward<Value>(value)});
    }

    /// @brief Generates a new identifier with the domain's stateless generator.
    template <typename D = Derived, typename = std::enable_if_t<
                                        is_stateless_generator_v<typename D::Generator, D>>>
    static Id<D> generate_id()
    {
        return D::Generator::template generate_id<D>();
    }

    /**
     * @brief Generates a new identifier with a caller-owned stateful generator.
     *
     * @param generator Exclusively borrowed for the duration of the call.
     */
    template <typename D = Derived, typename = std::enable_if_t<
                                        is_stateful_generator_v<typename D::Generator, D>>>
    static Id<D> generate_id_stateful(typename D::Generator& generator)
    {
        return generator.template generate_id_stateful<D>();
    }
};

template <typename D>
using generate_id_op = decltype(D::generate_id());

template <typename D>
using generate_id_stateful_op =
    decltype(D::generate_id_stateful(std::declval<typename D::Generator&>()));

/// @brief Whether `D::generate_id()` is callable.
template <typename D>
inline constexpr bool can_generate_id_v = is_detected_v<generate_id_op, D>;

/// @brief Whether `D::generate_id_stateful(generator)` is callable.
template <typename D>
inline constexpr bool can_generate_id_stateful_v = is_detected_v<generate_id_stateful_op, D>;

} // namespace stableid
