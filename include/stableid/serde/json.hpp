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
 * @file json.hpp
 * @brief Transparent JSON encoding of identifiers through cJSON.
 *
 * @details
 * An `Id<D>` is written exactly as its backing value would be: no envelope and no
 * domain tag. Reading it back rebuilds the identifier without checking which domain the
 * payload came from, so the same text reads equally well as `Id<Dog>` or `Id<Cat>`.
 *
 * Every type goes through the `JsonSerializer<T>` customisation point:
 * - `static cJSON* to_json(const T&)`: new tree owned by the caller, `nullptr` on failure;
 * - `static std::optional<T> from_json(const cJSON*)`: empty when the tree does not fit `T`.
 */

#pragma once

#include "stableid/core/id.hpp"
#include "stableid/core/traits.hpp"
#include "stableid/tiny/tiny_id.hpp"

#include <cJSON.h>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace stableid::serde {

/// @brief Releases a cJSON tree with `cJSON_Delete`.
struct JsonDeleter {
    void operator()(cJSON* node) const noexcept;
};

/// @brief Owning handle for a cJSON tree.
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

/**
 * @brief Prints a tree without whitespace.
 * @return The text, or an empty string if `node` is null or printing failed.
 */
std::string print_unformatted(const cJSON* node);

/**
 * @brief Parses a complete JSON document.
 *
 * Trailing characters after the document are rejected.
 *
 * @return The tree, or an empty handle on malformed input (logged at `DEBUG`).
 */
JsonPtr parse(std::string_view text);

namespace detail {

/**
 * Whether `value` is a whole number representable by an integer with `digits` value bits.
 *
 * For integers wider than a `double` mantissa only the magnitudes below 2^53 pass, since
 * beyond that several integers read back as the same number.
 */
bool is_integral_in_range(double value, int digits, bool is_signed) noexcept;

/// Logs why `what` has no faithful JSON form (at `DEBUG`) and returns `nullptr`.
cJSON* reject_unencodable(std::string_view what, std::string_view reason);

/// Largest magnitude below which every integer has a distinct `double`.
inline constexpr std::uint64_t k_exact_integer_limit = std::uint64_t{1}
                                                       << std::numeric_limits<double>::digits;

/// Whether `value` survives the trip through `double` unchanged and unambiguous.
template <typename T>
constexpr bool has_exact_json_number(T value) noexcept
{
    if constexpr (std::numeric_limits<T>::digits < std::numeric_limits<double>::digits) {
        return true;
    } else if constexpr (std::is_signed_v<T>) {
        const auto limit = static_cast<T>(k_exact_integer_limit);
        return value > -limit && value < limit;
    } else {
        return value < k_exact_integer_limit;
    }
}

/// Whether `text` can be handed to cJSON without being cut at a null byte.
inline bool has_no_null_bytes(std::string_view text) noexcept
{
    return text.find('\0') == std::string_view::npos;
}

} // namespace detail

/// @brief Customisation point; the primary template serializes nothing.
template <typename T, typename Enable = void>
struct JsonSerializer {
};

template <typename T>
using to_json_op = decltype(JsonSerializer<T>::to_json(std::declval<const T&>()));

template <typename T>
using from_json_op = decltype(JsonSerializer<T>::from_json(std::declval<const cJSON*>()));

/// @brief Whether `T` has a complete `JsonSerializer` specialisation.
template <typename T>
inline constexpr bool is_json_serializable_v =
    is_detected_exact_v<cJSON*, to_json_op, T> &&
    is_detected_exact_v<std::optional<T>, from_json_op, T>;

// ========================================================================
//  Scalars
// ========================================================================

template <>
struct JsonSerializer<std::string> {
    /// @return `nullptr` when the text contains a null byte.
    static cJSON* to_json(const std::string& value)
    {
        if (!detail::has_no_null_bytes(value)) {
            return detail::reject_unencodable("string", "embedded null byte");
        }
        return cJSON_CreateString(value.c_str());
    }

    static std::optional<std::string> from_json(const cJSON* node)
    {
        if (!cJSON_IsString(node) || node->valuestring == nullptr) {
            return std::nullopt;
        }
        return std::string(node->valuestring);
    }
};

template <>
struct JsonSerializer<bool> {
    static cJSON* to_json(bool value)
    {
        return cJSON_CreateBool(value ? 1 : 0);
    }

    static std::optional<bool> from_json(const cJSON* node)
    {
        if (!cJSON_IsBool(node)) {
            return std::nullopt;
        }
        return cJSON_IsTrue(node) != 0;
    }
};

/**
 * @brief Numbers. cJSON keeps them as `double`.
 *
 * Integers of magnitude 2^53 or more are refused in both directions: `to_json` returns
 * `nullptr` and `from_json` is empty. Reading into an integral type also rejects
 * fractions and out-of-range values.
 */
template <typename T>
struct JsonSerializer<T, std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>> {
    static cJSON* to_json(T value)
    {
        if constexpr (std::is_integral_v<T>) {
            if (!detail::has_exact_json_number(value)) {
                return detail::reject_unencodable("integer", "magnitude of 2^53 or more");
            }
        }
        return cJSON_CreateNumber(static_cast<double>(value));
    }

    static std::optional<T> from_json(const cJSON* node)
    {
        if (!cJSON_IsNumber(node)) {
            return std::nullopt;
        }
        const double value = node->valuedouble;
        if constexpr (std::is_integral_v<T>) {
            if (!detail::is_integral_in_range(value, std::numeric_limits<T>::digits,
                                              std::is_signed_v<T>)) {
                return std::nullopt;
            }
        }
        return static_cast<T>(value);
    }
};

/// @brief A `TinyId` is written as its text; a null byte inside the text is refused.
template <std::size_t N>
struct JsonSerializer<TinyId<N>> {
    static cJSON* to_json(const TinyId<N>& value)
    {
        const std::string text(value.as_str());
        if (!detail::has_no_null_bytes(text)) {
            return detail::reject_unencodable("TinyId", "embedded null byte");
        }
        return cJSON_CreateString(text.c_str());
    }

    static std::optional<TinyId<N>> from_json(const cJSON* node)
    {
        if (!cJSON_IsString(node) || node->valuestring == nullptr) {
            return std::nullopt;
        }
        return TinyId<N>::from_str(node->valuestring);
    }
};

// ========================================================================
//  Identifiers
// ========================================================================

/// @brief `Id<D>` is written as its backing, with no wrapping of any kind.
template <typename D>
struct JsonSerializer<Id<D>, std::enable_if_t<is_json_serializable_v<typename D::Backing>>> {
    static cJSON* to_json(const Id<D>& id)
    {
        return JsonSerializer<typename D::Backing>::to_json(id.backing());
    }

    static std::optional<Id<D>> from_json(const cJSON* node)
    {
        auto backing = JsonSerializer<typename D::Backing>::from_json(node);
        if (!backing) {
            return std::nullopt;
        }
        return Id<D>(std::move(*backing));
    }
};

// ========================================================================
//  Text helpers
// ========================================================================

/**
 * @brief Encodes `value` as compact JSON text.
 * @return The text, or an empty string if `value` has no faithful JSON form or cJSON
 * could not allocate the tree.
 */
template <typename T, typename = std::enable_if_t<is_json_serializable_v<T>>>
std::string to_json_string(const T& value)
{
    JsonPtr tree(JsonSerializer<T>::to_json(value));
    return print_unformatted(tree.get());
}

/**
 * @brief Decodes JSON text into a `T`.
 * @return Empty when the text is malformed or does not describe a `T`.
 */
template <typename T, typename = std::enable_if_t<is_json_serializable_v<T>>>
std::optional<T> from_json_string(std::string_view text)
{
    JsonPtr tree = parse(text);
    if (!tree) {
        return std::nullopt;
    }
    return JsonSerializer<T>::from_json(tree.get());
}

} // namespace stableid::serde
