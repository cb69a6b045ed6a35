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
 * @file type_registry.cpp
 * @brief Storage and lookup for `TypeRegistry`.
 */

#include "stableid/reflect/type_registry.hpp"

#include "stableid/infra/logger.hpp"

namespace stableid::reflect {

void TypeRegistry::insert(std::type_index type, Registration entry)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto previous = by_type_.find(type);
    if (previous != by_type_.end()) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "TypeRegistry: replacing registration of " + entry.type_path);
        by_path_.erase(previous->second.type_path);
        by_type_.erase(previous);
    } else {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "TypeRegistry: registered " + entry.type_path + " as " +
                               entry.backing_type_path);
    }

    by_path_.insert_or_assign(entry.type_path, type);
    by_type_.emplace(type, std::move(entry));
}

std::optional<Registration> TypeRegistry::find(std::type_index type) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_type_.find(type);
    if (it == by_type_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Registration> TypeRegistry::find(const std::string& path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto path_it = by_path_.find(path);
    if (path_it == by_path_.end()) {
        return std::nullopt;
    }
    auto it = by_type_.find(path_it->second);
    if (it == by_type_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t TypeRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return by_type_.size();
}

} // namespace stableid::reflect
