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
 * @file generate.hpp
 * @brief Identifier generation capabilities and the stock generators.
 *
 * @details
 * A generator type opts into one (or both) of two independent capabilities:
 *
 * - **Stateless**: `template <typename D> static Id<D> generate_id();`
 *   No state visible to the caller (it may draw randomness internally).
 * - **Stateful**: `template <typename D> Id<D> generate_id_stateful();` (non-const member)
 *   Mutates the generator instance, which the caller owns. Ordering guarantees hold
 *   across calls on the same instance only. Concurrent calls on one instance must be
 *   synchronized by the caller.
 *
 * Either member may be constrained (SFINAE) to the domains it supports; the probes
 * below then report `false` for the others and `IdDomain` drops the matching operation.
 */

#pragma once

#include "stableid/config.hpp"
#include "stableid/core/id.hpp"
#include "stableid/core/traits.hpp"
#include "stableid/infra/id_generator.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace stableid {

template <typename Generator, typename Domain>
using stateless_generate_op = decltype(Generator::template generate_id<Domain>());

template <typename Generator, typename Domain>
using stateful_generate_op =
    decltype(std::declval<Generator&>().template generate_id_stateful<Domain>());

/// @brief Whether `Generator` produces `Id<Domain>` without caller-visible state.
template <typename Generator, typename Domain>
inline constexpr bool is_stateless_generator_v =
    is_detected_exact_v<Id<Domain>, stateless_generate_op, Generator, Domain>;

/// @brief Whether `Generator` produces `Id<Domain>` by mutating an instance.
template <typename Generator, typename Domain>
inline constexpr bool is_stateful_generator_v =
    is_detected_exact_v<Id<Domain>, stateful_generate_op, Generator, Domain>;

/**
 * @class SequenceGen
 * @brief Stateful generator issuing strictly increasing integers.
 *
 * @details
 * Usable by any domain whose backing holds every value of `T` without narrowing, so a
 * `SequenceGen<std::uint64_t>` does not serve a `std::uint8_t` backing. Each instance
 * keeps its own counter; two instances give no ordering guarantee relative to each other.
 *
 * @code
 * struct Order : stableid::IdDomain<Order> {
 *     static constexpr std::string_view name = "Order";
 *     using Backing = std::uint64_t;
 *     using Generator = stableid::SequenceGen<>;
 *     using ConstRepr = std::uint64_t;
 * };
 *
 * stableid::SequenceGen<> orders;
 * auto first = Order::generate_id_stateful(orders);  // Order [1]
 * auto second = Order::generate_id_stateful(orders); // Order [2]
 * @endcode
 *
 * @tparam T Integral counter type.
 */
template <typename T = std::uint64_t>
class SequenceGen {
    static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>,
                  "SequenceGen requires an integral counter type");

  public:
    using value_type = T;

    /// @param first The value returned by the first call.
    constexpr explicit SequenceGen(T first = T{1}) noexcept : next_(first) {}

    /**
     * @brief Issues the next value of the sequence.
     *
     * @throws std::overflow_error Once the value `std::numeric_limits<T>::max()` has
     * been issued.
     */
    template <typename D,
              typename = std::enable_if_t<is_lossless_constructible_v<typename D::Backing, T>>>
    Id<D> generate_id_stateful()
    {
        if (exhausted_) {
            throw std::overflow_error("SequenceGen: counter exhausted");
        }

        T value = next_;
        if (next_ == std::numeric_limits<T>::max()) {
            exhausted_ = true;
        } else {
            ++next_;
        }
        return Id<D>(typename D::Backing{value});
    }

    /// @brief The value the next call will return.
    constexpr T peek() const noexcept
    {
        return next_;
    }

    constexpr bool exhausted() const noexcept
    {
        return exhausted_;
    }

  private:
    T next_;
    bool exhausted_ = false;
};

/**
 * @class NanoIdGen
 * @brief Stateless generator of `N` random URL-safe characters.
 *
 * For domains whose backing can be built from a `std::string` (typically `std::string`
 * itself). `Source` must provide `static std::string nanoid(std::size_t)`.
 */
template <std::size_t N = STABLEID_NANOID_DEFAULT_LENGTH, typename Source = infra::IdGenerator>
struct NanoIdGen {
    template <typename D, typename = std::enable_if_t<
                              std::is_constructible_v<typename D::Backing, std::string>>>
    static Id<D> generate_id()
    {
        return Id<D>(typename D::Backing(Source::nanoid(N)));
    }
};

/**
 * @class UuidGen
 * @brief Stateless generator of canonical Version 4 UUID text.
 *
 * `Source` must provide `static std::string uuid_v4()`.
 */
template <typename Source = infra::IdGenerator>
struct UuidGen {
    template <typename D, typename = std::enable_if_t<
                              std::is_constructible_v<typename D::Backing, std::string>>>
    static Id<D> generate_id()
    {
        return Id<D>(typename D::Backing(Source::uuid_v4()));
    }
};

} // namespace stableid
