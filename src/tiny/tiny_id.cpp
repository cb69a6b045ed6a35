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
 * @file tiny_id.cpp
 * @brief Out-of-line failure path of `TinyId::as_str`.
 */

#include "stableid/tiny/tiny_id.hpp"

#include "stableid/infra/logger.hpp"

#include <string>

namespace stableid::detail {

void throw_invalid_utf8(std::size_t capacity)
{
    const std::string message = "TinyId<" + std::to_string(capacity) +
                                "> must not be created from invalid UTF-8";
    infra::Logger::log(infra::LogLevel::ERROR, message);
    throw InvalidUtf8Error(message);
}

} // namespace stableid::detail
