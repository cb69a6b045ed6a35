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
 * @file traits.hpp
 * @brief Compile-time capability probes.
 *
 * @details
 * Every optional behaviour of `Id<D>` (comparison, ordering, hashing, formatting,
 * serialization) and every optional domain operation (generation, stable type ids) is
 * gated on what the participating types support. This header provides the detection
 * idiom those gates are written with, and the public probes tests assert against.
 */

#pragma once

#include <functional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace stableid {

namespace detail {

/// @brief Placeholder returned by `detected_t` when the probed expression is ill-formed.
struct Nonesuch {
    Nonesuch() = delete;
    ~Nonesuch() = delete;
    Nonesuch(const Nonesuch&) = delete;
    void operator=(const Nonesuch&) = delete;
};

template <typename Default, typename AlwaysVoid, template <typename...> class Op, typename... Args>
struct Detector {
    using value_t = std::false_type;
    using type = Default;
};

template <typename Default, template <typename...> class Op, typename... Args>
struct Detector<Default, std::void_t<Op<Args...>>, Op, Args...> {
    using value_t = std::true_type;
    using type = Op<Args...>;
};

} // namespace detail

/// @brief `true_type` iff `Op<Args...>` names a valid type.
template <template <typename...> class Op, typename... Args>
using is_detected = typename detail::Detector<detail::Nonesuch, void, Op, Args...>::value_t;

template <template <typename...> class Op, typename... Args>
inline constexpr bool is_detected_v = is_detected<Op, Args...>::value;

/// @brief The type named by `Op<Args...>`, or `detail::Nonesuch`.
template <template <typename...> class Op, typename... Args>
using detected_t = typename detail::Detector<detail::Nonesuch, void, Op, Args...>::type;

/// @brief Whether `Op<Args...>` is valid and names exactly `Expected`.
template <typename Expected, template <typename...> class Op, typename... Args>
inline constexpr bool is_detected_exact_v = std::is_same_v<Expected, detected_t<Op, Args...>>;

// ========================================================================
//  Operator Probes
// ========================================================================

template <typename A, typename B>
using equality_op = decltype(std::declval<const A&>() == std::declval<const B&>());

template <typename A, typename B>
using inequality_op = decltype(std::declval<const A&>() != std::declval<const B&>());

template <typename A, typename B>
using less_op = decltype(std::declval<const A&>() < std::declval<const B&>());

template <typename A, typename B>
using less_equal_op = decltype(std::declval<const A&>() <= std::declval<const B&>());

template <typename A, typename B>
using greater_op = decltype(std::declval<const A&>() > std::declval<const B&>());

template <typename A, typename B>
using greater_equal_op = decltype(std::declval<const A&>() >= std::declval<const B&>());

template <typename T>
using stream_op = decltype(std::declval<std::ostream&>() << std::declval<const T&>());

template <typename T>
using hash_op = decltype(std::declval<const std::hash<T>&>()(std::declval<const T&>()));

template <typename A, typename B = A>
inline constexpr bool is_equality_comparable_v = is_detected_v<equality_op, A, B>;

template <typename A, typename B = A>
inline constexpr bool is_less_comparable_v = is_detected_v<less_op, A, B>;

/// @brief Whether `std::hash<T>` is an enabled specialization.
template <typename T>
inline constexpr bool is_hashable_v =
    std::is_default_constructible_v<std::hash<T>> && is_detected_v<hash_op, T>;

/// @brief Whether `T` can be written to a `std::ostream`.
template <typename T>
inline constexpr bool is_streamable_v = is_detected_v<stream_op, T>;

template <typename To, typename From>
using brace_init_op = decltype(To{std::declval<From>()});

/**
 * @brief Whether `To{from}` is well-formed for a `From` value.
 *
 * List-initialization rejects narrowing, so `uint8_t` from `uint64_t` or `uint64_t` from
 * `int` is `false` while widening conversions stay `true`.
 */
template <typename To, typename From>
inline constexpr bool is_lossless_constructible_v = is_detected_v<brace_init_op, To, From>;

} // namespace stableid
