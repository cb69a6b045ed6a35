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
 * @file type_registry.hpp
 * @brief Registration of identifier types with a runtime reflection registry.
 *
 * @details
 * Editors, inspectors and scene serializers work on values they only know through a
 * `void*` and a type key. `TypeRegistry` gives them, for each registered `Id<D>`, a path
 * name, type-erased JSON (de)serialization and an optional text widget that shows and
 * edits the payload directly. Registration has no effect on how identifiers behave
 * elsewhere.
 */

#pragma once

#include "stableid/core/id.hpp"
#include "stableid/core/traits.hpp"
#include "stableid/infra/logger.hpp"
#include "stableid/infra/type_name.hpp"
#include "stableid/serde/json.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace stableid::reflect {

/**
 * @struct Registration
 * @brief Type-erased operations on one registered type.
 *
 * The `const void*` / `void*` arguments must point at an object of the registered type.
 */
struct Registration {
    std::string type_path;         ///< e.g. `stableid::Id<Dog>`.
    std::string backing_type_path; ///< Demangled name of the payload type.
    std::size_t size = 0;          ///< `sizeof` of the registered type.

    std::function<std::string(const void*)> serialize;
    std::function<bool(const std::string&, void*)> deserialize;

    /// Shows the payload as text. Empty when registered without a display widget.
    std::function<std::string(const void*)> display;
    /// Replaces the payload from text. Empty when the payload cannot be built from text.
    std::function<bool(void*, const std::string&)> edit;
};

/**
 * @class TypeRegistry
 * @brief Thread-safe table of `Registration`s keyed by `std::type_index` and by path.
 */
class TypeRegistry {
  public:
    /**
     * @brief Registers `Id<D>` as a transparent alias of `D::Backing`.
     *
     * Serialization goes through `serde::JsonSerializer<Id<D>>`, i.e. the backing's own
     * JSON form. With `with_display_widget`, a streamable payload is also shown and, when
     * the backing can be built from a string, edited as plain text instead of as a nested
     * structure. A backing that cannot be streamed gets no widget (logged at `WARN` if
     * one was asked for). Registering the same domain again replaces the previous entry.
     */
    template <typename D>
    void register_stable_id(bool with_display_widget = true)
    {
        using Backing = typename D::Backing;
        using IdType = Id<D>;
        static_assert(serde::is_json_serializable_v<IdType>,
                      "register_stable_id: D::Backing must be JSON serializable");

        Registration entry;
        entry.type_path = "stableid::Id<" + std::string(D::name) + ">";
        entry.backing_type_path = infra::type_name<Backing>();
        entry.size = sizeof(IdType);

        entry.serialize = [](const void* object) {
            return serde::to_json_string(*static_cast<const IdType*>(object));
        };
        entry.deserialize = [](const std::string& text, void* object) {
            auto id = serde::from_json_string<IdType>(text);
            if (!id) {
                return false;
            }
            *static_cast<IdType*>(object) = std::move(*id);
            return true;
        };

        if (with_display_widget) {
            if constexpr (is_streamable_v<Backing>) {
                entry.display = [](const void* object) {
                    std::ostringstream ss;
                    ss << static_cast<const IdType*>(object)->backing();
                    return ss.str();
                };
                if constexpr (std::is_constructible_v<Backing, std::string>) {
                    entry.edit = [](void* object, const std::string& text) {
                        *static_cast<IdType*>(object) = IdType(Backing(text));
                        return true;
                    };
                }
            } else {
                infra::Logger::log(infra::LogLevel::WARN,
                                   "TypeRegistry: " + entry.type_path +
                                       " has no display widget, payload is not printable");
            }
        }

        insert(std::type_index(typeid(IdType)), std::move(entry));
    }

    /// @brief The registration of `T`, if any.
    template <typename T>
    std::optional<Registration> find() const
    {
        return find(std::type_index(typeid(T)));
    }

    std::optional<Registration> find(std::type_index type) const;

    /// @brief The registration whose `type_path` is `path`, if any.
    std::optional<Registration> find(const std::string& path) const;

    std::size_t size() const;

  private:
    void insert(std::type_index type, Registration entry);

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, Registration> by_type_;
    std::unordered_map<std::string, std::type_index> by_path_;
};

} // namespace stableid::reflect
