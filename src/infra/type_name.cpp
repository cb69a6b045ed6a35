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
 * @file type_name.cpp
 * @brief Itanium C++ ABI demangling through `abi::__cxa_demangle`.
 */

#include "stableid/infra/type_name.hpp"

#include <cstdlib>
#include <cxxabi.h>
#include <memory>

namespace stableid::infra {

std::string demangle(const char* mangled)
{
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);

    if (status != 0 || !demangled) {
        return std::string(mangled);
    }
    return std::string(demangled.get());
}

} // namespace stableid::infra
