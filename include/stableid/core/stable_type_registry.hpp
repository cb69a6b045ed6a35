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
 * @file stable_type_registry.hpp
 * @brief Opt-in uniqueness diagnostics for stable type identifiers.
 *
 * @details
 * Stable type ids are chosen by hand, so two types can end up claiming the same one.
 * `StableTypeRegistry` lets an application record the types it knows about and be
 * warned about such clashes. It is purely diagnostic: identifiers are never checked
 * against it implicitly.
 */

#pragma once

#include "stableid/core/id.hpp"
#include "stableid/core/identify.hpp"
#include "stableid/core/traits.hpp"
#include "stableid/infra/logger.hpp"
#include "stableid/infra/type_name.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace stableid {

/**
 * @class StableTypeRegistry
 * @brief Records which type claimed which stable id within `Domain`.
 *
 * @details
 * Thread-safe. Requires `Domain::Backing` to be hashable and equality comparable.
 */
template <typename Domain>
class StableTypeRegistry {
    static_assert(is_hashable_v<typename Domain::Backing> &&
                      is_equality_comparable_v<typename Domain::Backing>,
                  "StableTypeRegistry: Domain::Backing must be hashable and comparable");

  public:
    /**
     * @brief Records the stable id of `Type`.
     *
     * @return true If the id was free or already belonged to `Type`.
     * @return false If another type already claimed the id (a `WARN` entry is logged and
     * the first claimant is kept).
     */
    template <typename Type>
    bool register_type()
    {
        return register_type(stable_type_id<Domain, Type>(), infra::type_name<Type>());
    }

    /**
     * @brief Records that `type_name` claims `id`.
     *
     * Same contract as the templated overload, for ids that do not come from a
     * `StableTypeId` implementer.
     */
    bool register_type(const Id<Domain>& id, const std::string& type_name)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(id);
        if (it == entries_.end()) {
            entries_.emplace(id, type_name);
            infra::Logger::log(infra::LogLevel::TRACE, "StableTypeRegistry<" +
                                                           std::string(Domain::name) +
                                                           ">: " + type_name + " -> " +
                                                           describe(id));
            return true;
        }

        if (it->second == type_name) {
            return true;
        }

        infra::Logger::log(infra::LogLevel::WARN,
                           "StableTypeRegistry<" + std::string(Domain::name) + ">: " +
                               type_name + " claims " + describe(id) +
                               ", already used by " + it->second);
        return false;
    }

    /// @brief Whether any type claimed `id`.
    bool contains(const Id<Domain>& id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(id) != 0;
    }

    /// @brief Name of the type that claimed `id`, if any.
    std::optional<std::string> type_name_of(const Id<Domain>& id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

  private:
    static std::string describe(const Id<Domain>& id)
    {
        if constexpr (is_streamable_v<typename Domain::Backing>) {
            return to_string(id);
        } else {
            return std::string(Domain::name) + " [?]";
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<Id<Domain>, std::string> entries_;
};

} // namespace stableid
