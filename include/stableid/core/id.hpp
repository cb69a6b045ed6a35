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
 * @file id.hpp
 * @brief The domain-scoped identifier container `Id<D>`.
 *
 * @details
 * `Id<D>` wraps exactly one `D::Backing` value and nothing else. The domain `D` only
 * exists in the type, so `Id<Dog>` and `Id<Cat>` are unrelated types even when both wrap
 * a `std::string`: no operator below accepts identifiers of two different domains.
 *
 * Each behaviour is delegated to the payload and is only available when the payload
 * supports it:
 * | `Id<D>` provides             | when `D::Backing` provides |
 * |------------------------------|----------------------------|
 * | copy / move                  | copy / move                |
 * | `==` `!=` `<` `<=` `>` `>=`  | the same operator          |
 * | `std::hash<Id<D>>`           | `std::hash<Backing>`       |
 * | `operator<<`, `to_string`    | `operator<<`               |
 * | `debug_string`               | `operator<<`               |
 */

#pragma once

#include "stableid/core/traits.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace stableid {

/**
 * @class Id
 * @brief A container for a unique identifier of an object in domain `Domain`.
 *
 * @details
 * A convenient alias per domain keeps call sites readable:
 * @code
 * struct Dog : stableid::IdDomain<Dog> {
 *     static constexpr std::string_view name = "Dog";
 *     using Backing = std::string;
 *     using Generator = void;
 *     using ConstRepr = void;
 * };
 * using DogId = stableid::Id<Dog>;
 * @endcode
 *
 * @tparam Domain The domain descriptor (see `IdDomain`).
 */
template <typename Domain>
class Id {
  public:
    using domain_type = Domain;
    using backing_type = typename Domain::Backing;

    /**
     * @brief Wraps a backing value. Never fails and performs no validation.
     *
     * `explicit` so that a bare payload is never silently promoted to an identifier.
     */
    constexpr explicit Id(backing_type value) noexcept(
        std::is_nothrow_move_constructible_v<backing_type>)
        : backing_(std::move(value))
    {
    }

    /// @brief Read-only access to the payload.
    constexpr const backing_type& backing() const noexcept
    {
        return backing_;
    }

    /// @brief Consumes the identifier and returns the payload.
    constexpr backing_type into_backing() &&
    {
        return std::move(backing_);
    }

    /// @brief Returns a copy of the payload (copyable backings only).
    constexpr backing_type into_backing() const&
    {
        return backing_;
    }

  private:
    backing_type backing_;
};

// ========================================================================
//  Comparison (delegated to the backing, same domain only)
// ========================================================================

template <typename D>
constexpr auto operator==(const Id<D>& lhs, const Id<D>& rhs)
    -> decltype(static_cast<bool>(lhs.backing() == rhs.backing()))
{
    return static_cast<bool>(lhs.backing() == rhs.backing());
}

template <typename D>
constexpr auto operator!=(const Id<D>& lhs, const Id<D>& rhs)
    -> decltype(static_cast<bool>(lhs.backing() != rhs.backing()))
{
    return static_cast<bool>(lhs.backing() != rhs.backing());
}

template <typename D>
constexpr auto operator<(const Id<D>& lhs, const Id<D>& rhs)
    -> decltype(static_cast<bool>(lhs.backing() < rhs.backing()))
{
    return static_cast<bool>(lhs.backing() < rhs.backing());
}

template <typename D>
constexpr auto operator<=(const Id<D>& lhs, const Id<D>& rhs)
    -> decltype(static_cast<bool>(lhs.backing() <= rhs.backing()))
{
    return static_cast<bool>(lhs.backing() <= rhs.backing());
}

template <typename D>
constexpr auto operator>(const Id<D>& lhs, const Id<D>& rhs)
    -> decltype(static_cast<bool>(lhs.backing() > rhs.backing()))
{
    return static_cast<bool>(lhs.backing() > rhs.backing());
}

template <typename D>
constexpr auto operator>=(const Id<D>& lhs, const Id<D>& rhs)
    -> decltype(static_cast<bool>(lhs.backing() >= rhs.backing()))
{
    return static_cast<bool>(lhs.backing() >= rhs.backing());
}

// ========================================================================
//  Formatting
// ========================================================================

/**
 * @brief Display form: `"<DomainName> [<payload>]"`.
 */
template <typename D>
auto operator<<(std::ostream& os, const Id<D>& id) -> decltype(os << id.backing())
{
    return os << D::name << " [" << id.backing() << "]";
}

/// @brief The display form as a string.
template <typename D, typename = std::enable_if_t<is_streamable_v<typename D::Backing>>>
std::string to_string(const Id<D>& id)
{
    std::ostringstream ss;
    ss << id;
    return ss.str();
}

/**
 * @brief Debug form: `"Id<<DomainName>>(<payload>)"`, e.g. `Id<Dog>(hans)`.
 */
template <typename D, typename = std::enable_if_t<is_streamable_v<typename D::Backing>>>
std::string debug_string(const Id<D>& id)
{
    std::ostringstream ss;
    ss << "Id<" << D::name << ">(" << id.backing() << ")";
    return ss.str();
}

namespace detail {

/// Disabled hasher: neither constructible nor copyable, as the standard requires.
template <typename D, bool = is_hashable_v<typename D::Backing>>
struct IdHash {
    IdHash() = delete;
    IdHash(const IdHash&) = delete;
    IdHash& operator=(const IdHash&) = delete;
};

template <typename D>
struct IdHash<D, true> {
    std::size_t operator()(const Id<D>& id) const
        noexcept(noexcept(std::hash<typename D::Backing>{}(id.backing())))
    {
        return std::hash<typename D::Backing>{}(id.backing());
    }
};

} // namespace detail

} // namespace stableid

namespace std {

/// Hashes the payload only; the domain never enters the hash.
template <typename D>
struct hash<stableid::Id<D>> : stableid::detail::IdHash<D> {
};

} // namespace std
