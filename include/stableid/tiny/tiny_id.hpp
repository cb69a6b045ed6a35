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
 * @file tiny_id.hpp
 * @brief Fixed-capacity, allocation-free string identifiers.
 *
 * @details
 * `TinyId<N>` stores up to `N` bytes of UTF-8 text inline, padded with null bytes.
 * It is trivially copyable, so identifiers backed by it are cheap to pass around.
 * `TinyIdGen<N>` fills it with `N` random URL-safe characters, and the
 * `STABLEID_TINY_ID_DOMAIN` macros declare a complete domain around the pair.
 */

#pragma once

#include "stableid/config.hpp"
#include "stableid/core/domain.hpp"
#include "stableid/core/id.hpp"
#include "stableid/infra/id_generator.hpp"
#include "stableid/infra/string.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace stableid {

/**
 * @class InvalidUtf8Error
 * @brief Thrown when a `TinyId` holding invalid UTF-8 is read as text.
 *
 * Every constructor path fed from text keeps the buffer valid, so reaching this
 * means raw bytes were written through `from_bytes` without checking them: a
 * programming error, not a recoverable condition.
 */
class InvalidUtf8Error : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

namespace detail {

/// Logs and throws `InvalidUtf8Error` for a `TinyId<capacity>`.
[[noreturn]] void throw_invalid_utf8(std::size_t capacity);

} // namespace detail

/**
 * @class TinyId
 * @brief Constant-size backing type for string-based identifiers.
 *
 * @details
 * The buffer is expected to hold valid UTF-8 followed by zero or more `'\0'` bytes.
 * The length is the offset of the first `'\0'` (or `N` if there is none).
 *
 * Equality and hashing cover all `N` bytes. There is deliberately no ordering.
 *
 * @tparam N Capacity in bytes; defaults to `STABLEID_TINY_ID_DEFAULT_LENGTH` (21).
 */
template <std::size_t N = STABLEID_TINY_ID_DEFAULT_LENGTH>
class TinyId {
    static_assert(N > 0, "TinyId capacity must be at least one byte");

  public:
    static constexpr std::size_t capacity = N;

    /// @brief The empty identifier (all bytes null).
    constexpr TinyId() noexcept : text_{} {}

    /// @brief Same as `from_str`; implicit so string constants convert naturally.
    constexpr TinyId(std::string_view text) noexcept : TinyId(from_bytes(text)) {}

    /**
     * @brief Builds an id from raw bytes, assumed to be valid UTF-8.
     *
     * At most `N` bytes are copied; a shorter input is padded with `'\0'`, a longer one
     * is truncated. Nothing is validated here.
     */
    static constexpr TinyId from_bytes(std::string_view bytes) noexcept
    {
        TinyId id;
        const std::size_t count = bytes.size() < N ? bytes.size() : N;
        for (std::size_t i = 0; i < count; ++i) {
            id.text_[i] = bytes[i];
        }
        return id;
    }

    /// @copydoc from_bytes(std::string_view)
    static constexpr TinyId from_bytes(const std::uint8_t* data, std::size_t size) noexcept
    {
        TinyId id;
        const std::size_t count = size < N ? size : N;
        for (std::size_t i = 0; i < count; ++i) {
            id.text_[i] = static_cast<char>(data[i]);
        }
        return id;
    }

    /// @brief Parses text into an id. Infallible: truncation and padding absorb any input.
    static constexpr TinyId from_str(std::string_view text) noexcept
    {
        return from_bytes(text);
    }

    /// @brief The whole `N`-byte buffer, padding included.
    constexpr const std::array<char, N>& as_bytes() const noexcept
    {
        return text_;
    }

    /**
     * @brief The text of the id, without trailing `'\0'` padding.
     *
     * @throws InvalidUtf8Error If the buffer is not valid UTF-8.
     */
    std::string_view as_str() const
    {
        const std::string_view raw(text_.data(), N);
        if (!infra::String::is_valid_utf8(raw)) {
            detail::throw_invalid_utf8(N);
        }
        return infra::String::trim_trailing_nulls(raw);
    }

    /// @brief Number of bytes before the first `'\0'`.
    constexpr std::size_t len() const noexcept
    {
        std::size_t count = 0;
        while (count < N && text_[count] != '\0') {
            ++count;
        }
        return count;
    }

    /// @brief Whether the first byte is `'\0'`.
    constexpr bool is_empty() const noexcept
    {
        return text_[0] == '\0';
    }

    friend constexpr bool operator==(const TinyId& lhs, const TinyId& rhs) noexcept
    {
        for (std::size_t i = 0; i < N; ++i) {
            if (lhs.text_[i] != rhs.text_[i]) {
                return false;
            }
        }
        return true;
    }

    friend constexpr bool operator!=(const TinyId& lhs, const TinyId& rhs) noexcept
    {
        return !(lhs == rhs);
    }

    friend std::ostream& operator<<(std::ostream& os, const TinyId& id)
    {
        return os << id.as_str();
    }

  private:
    std::array<char, N> text_;
};

/**
 * @class TinyIdGen
 * @brief Stateless generator of random `TinyId<N>` values.
 *
 * @details
 * Only applies to domains backed by exactly `TinyId<N>`. Draws `N` characters from
 * `Source::nanoid(N)`, the injected random-string source.
 *
 * @tparam N Length of the generated identifiers.
 * @tparam Source Type providing `static std::string nanoid(std::size_t)`.
 */
template <std::size_t N = STABLEID_TINY_ID_DEFAULT_LENGTH, typename Source = infra::IdGenerator>
struct TinyIdGen {
    template <typename D,
              typename = std::enable_if_t<std::is_same_v<typename D::Backing, TinyId<N>>>>
    static Id<D> generate_id()
    {
        return Id<D>(TinyId<N>::from_str(Source::nanoid(N)));
    }
};

} // namespace stableid

namespace std {

template <std::size_t N>
struct hash<stableid::TinyId<N>> {
    std::size_t operator()(const stableid::TinyId<N>& id) const noexcept
    {
        return std::hash<std::string_view>{}(std::string_view(id.as_bytes().data(), N));
    }
};

} // namespace std

/**
 * @def STABLEID_TINY_ID_DOMAIN_SIZED
 * @brief Declares `domain_type` as a domain backed by `TinyId<length>`, generated by
 * `TinyIdGen<length>`, with `std::string_view` constant representations.
 *
 * @code
 * STABLEID_TINY_ID_DOMAIN_SIZED(Bird, "Bird", 16);
 * auto id = Bird::generate_id(); // 16 random characters
 * @endcode
 */
#define STABLEID_TINY_ID_DOMAIN_SIZED(domain_type, domain_name, length)                          \
    struct domain_type : ::stableid::IdDomain<domain_type> {                                     \
        static constexpr std::string_view name = domain_name;                                    \
        using Backing = ::stableid::TinyId<length>;                                              \
        using Generator = ::stableid::TinyIdGen<length>;                                         \
        using ConstRepr = std::string_view;                                                      \
    }

/**
 * @def STABLEID_TINY_ID_DOMAIN
 * @brief `STABLEID_TINY_ID_DOMAIN_SIZED` with the default length (21).
 */
#define STABLEID_TINY_ID_DOMAIN(domain_type, domain_name)                                        \
    STABLEID_TINY_ID_DOMAIN_SIZED(domain_type, domain_name, STABLEID_TINY_ID_DEFAULT_LENGTH)
