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
 * @file type_name.hpp
 * @brief Human-readable C++ type names for diagnostics.
 */

#pragma once

#include <string>
#include <typeinfo>

namespace stableid::infra {

/**
 * @brief Demangles an ABI type name (as returned by `std::type_info::name()`).
 *
 * @param mangled The mangled name.
 * @return std::string The demangled name, or `mangled` unchanged if demangling fails.
 */
std::string demangle(const char* mangled);

/// @brief Readable name of `T`, e.g. `"tool::Saw"`.
template <typename T>
std::string type_name()
{
    return demangle(typeid(T).name());
}

} // namespace stableid::infra
