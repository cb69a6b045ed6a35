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
 * @file identify.hpp
 * @brief Stable identifiers for types (`StableTypeId`) and for values (`IdentifyAs`).
 *
 * @details
 * Like `std::type_index`, a stable type id identifies a type. Unlike `std::type_index`,
 * the id is chosen by the type's author: it survives renames, moves between
 * translation units and process restarts, until the author changes it.
 */

#pragma once

#include "stableid/core/id.hpp"
#include "stableid/core/traits.hpp"

#include <type_traits>
#include <utility>

namespace stableid {

/// @brief Empty tag selecting a domain in overloaded `identify_as` members.
template <typename Domain>
struct DomainTag {
};

template <typename Domain>
inline constexpr DomainTag<Domain> domain_tag{};

/**
 * @brief Whether the constant representation of `D` converts into its backing.
 *
 * `false` when `D::ConstRepr` is `void`.
 */
template <typename D, typename = void>
struct has_const_repr_conversion : std::false_type {
};

template <typename D>
struct has_const_repr_conversion<D, std::enable_if_t<!std::is_void_v<typename D::ConstRepr>>>
    : std::is_constructible<typename D::Backing, const typename D::ConstRepr&> {
};

template <typename D>
inline constexpr bool has_const_repr_conversion_v = has_const_repr_conversion<D>::value;

/**
 * @brief Where the constant of `Type` in `Domain` is read from.
 *
 * Defaults to `Type::stable_type_id_repr`. Specialize it for a type that carries a
 * stable id in more than one domain.
 */
template <typename Type, typename Domain>
struct StableTypeIdRepr {
    static constexpr typename Domain::ConstRepr value()
    {
        return Type::stable_type_id_repr;
    }
};

/**
 * @class StableTypeId
 * @brief CRTP base assigning a fixed identifier of `Domain` to `Type`.
 *
 * @details
 * `Type` declares `static constexpr Domain::ConstRepr stable_type_id_repr`. Each
 * implementer is assumed to pick a value unique within `Domain`; nothing checks it
 * unless the type is registered with a `StableTypeRegistry`.
 *
 * @code
 * struct Saw : stableid::StableTypeId<Saw, Tool> {
 *     static constexpr std::string_view stable_type_id_repr = "saw";
 * };
 *
 * stableid::Id<Tool> saw = Saw::stable_type_id();
 * @endcode
 *
 * @note Requires `Domain::Backing` to be constructible from `Domain::ConstRepr`.
 */
template <typename Type, typename Domain>
class StableTypeId {
  public:
    /// @brief The identifier of `Type` in `Domain`.
    static Id<Domain> stable_type_id()
    {
        static_assert(has_const_repr_conversion_v<Domain>,
                      "StableTypeId: Domain::Backing must be constructible from "
                      "Domain::ConstRepr (and ConstRepr must not be void)");
        static_assert(std::is_same_v<decltype(StableTypeIdRepr<Type, Domain>::value()),
                                     typename Domain::ConstRepr>,
                      "StableTypeId: the constant must be of type Domain::ConstRepr");
        return Id<Domain>(
            typename Domain::Backing(StableTypeIdRepr<Type, Domain>::value()));
    }
};

/// @brief The stable id of `Type` in `Domain` (unambiguous for multi-domain types).
template <typename Domain, typename Type>
Id<Domain> stable_type_id()
{
    return StableTypeId<Type, Domain>::stable_type_id();
}

/**
 * @class IdentifyAs
 * @brief Interface for values that can report their own identifier in `Domain`.
 *
 * @details
 * A value may implement it for several domains; each override takes the
 * `DomainTag` of its domain, so the overloads never collide:
 * @code
 * struct Dog : stableid::IdentifyAs<Pet>, stableid::IdentifyAs<Patient> {
 *     stableid::Id<Pet> identify_as(stableid::DomainTag<Pet>) const override;
 *     stableid::Id<Patient> identify_as(stableid::DomainTag<Patient>) const override;
 * };
 *
 * stableid::Id<Pet> pet = stableid::identify(dog); // domain picked by the declared type
 * @endcode
 *
 * Inheriting is optional: any type with a matching `identify_as(DomainTag<D>) const`
 * member works with `identify_as<D>()` and `identify()`.
 */
template <typename Domain>
class IdentifyAs {
  public:
    virtual Id<Domain> identify_as(DomainTag<Domain>) const = 0;

  protected:
    IdentifyAs() = default;
    IdentifyAs(const IdentifyAs&) = default;
    IdentifyAs& operator=(const IdentifyAs&) = default;
    ~IdentifyAs() = default;
};

template <typename Value, typename Domain>
using identify_as_op = decltype(std::declval<const Value&>().identify_as(DomainTag<Domain>{}));

/// @brief Whether `Value` can report an identifier in `Domain`.
template <typename Value, typename Domain>
inline constexpr bool can_identify_as_v =
    is_detected_exact_v<Id<Domain>, identify_as_op, Value, Domain>;

/// @brief The identifier `value` reports for `Domain`.
template <typename Domain, typename Value,
          typename = std::enable_if_t<can_identify_as_v<Value, Domain>>>
Id<Domain> identify_as(const Value& value)
{
    return value.identify_as(DomainTag<Domain>{});
}

/**
 * @class Identity
 * @brief Deferred identity lookup, resolved by the identifier type it converts to.
 *
 * @warning Holds a reference to the value; it must not outlive it.
 */
template <typename Value>
class Identity {
  public:
    explicit Identity(const Value& value) noexcept : value_(value) {}

    template <typename Domain, typename = std::enable_if_t<can_identify_as_v<Value, Domain>>>
    operator Id<Domain>() const
    {
        return value_.identify_as(DomainTag<Domain>{});
    }

  private:
    const Value& value_;
};

/**
 * @brief Returns the identity of `value` in whichever domain the result is assigned to.
 *
 * @code
 * stableid::Id<Pet> as_pet = stableid::identify(dog);
 * stableid::Id<Patient> as_patient = stableid::identify(dog);
 * @endcode
 */
template <typename Value>
Identity<Value> identify(const Value& value) noexcept
{
    return Identity<Value>(value);
}

} // namespace stableid
