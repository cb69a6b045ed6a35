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
 * @file json.cpp
 * @brief cJSON plumbing shared by every `JsonSerializer`.
 */

#include "stableid/serde/json.hpp"

#include "stableid/infra/logger.hpp"

#include <algorithm>
#include <cJSON.h>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>

namespace stableid::serde {

void JsonDeleter::operator()(cJSON* node) const noexcept
{
    cJSON_Delete(node);
}

std::string print_unformatted(const cJSON* node)
{
    if (node == nullptr) {
        return {};
    }

    char* raw = cJSON_PrintUnformatted(node);
    if (raw == nullptr) {
        return {};
    }
    std::string text(raw);
    cJSON_free(raw);
    return text;
}

JsonPtr parse(std::string_view text)
{
    // cJSON needs a terminated buffer.
    const std::string buffer(text);
    const char* end = nullptr;
    JsonPtr tree(cJSON_ParseWithOpts(buffer.c_str(), &end, 1));

    if (!tree) {
        std::string near = end != nullptr ? std::string(end).substr(0, 16) : std::string();
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "JSON parse failed near '" + near + "' in: " + buffer);
    }
    return tree;
}

namespace detail {

bool is_integral_in_range(double value, int digits, bool is_signed) noexcept
{
    if (!std::isfinite(value) || std::trunc(value) != value) {
        return false;
    }

    const int exact_digits = std::min(digits, std::numeric_limits<double>::digits);
    const double bound = std::ldexp(1.0, exact_digits);
    if (exact_digits < digits) {
        // Wide integers: (-2^53, 2^53), clipped at zero when unsigned.
        return value > -bound && value < bound && (is_signed || value >= 0.0);
    }

    // Signed types hold [-2^digits, 2^digits), unsigned ones [0, 2^digits).
    const double lowest = is_signed ? -bound : 0.0;
    return value >= lowest && value < bound;
}

cJSON* reject_unencodable(std::string_view what, std::string_view reason)
{
    infra::Logger::log(infra::LogLevel::DEBUG, "JSON encode refused " + std::string(what) +
                                                   ": " + std::string(reason));
    return nullptr;
}

} // namespace detail

} // namespace stableid::serde
