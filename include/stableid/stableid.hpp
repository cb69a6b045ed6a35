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
 * @file stableid.hpp
 * @brief Convenience header for the identifier core and `TinyId`.
 *
 * @details
 * JSON support (`stableid/serde/json.hpp`) and reflection registration
 * (`stableid/reflect/type_registry.hpp`) live in the `stableid_serde` library and are
 * included separately, since they pull in cJSON.
 */

#pragma once

#include "stableid/config.hpp"
#include "stableid/core/domain.hpp"
#include "stableid/core/generate.hpp"
#include "stableid/core/id.hpp"
#include "stableid/core/identify.hpp"
#include "stableid/core/stable_type_registry.hpp"
#include "stableid/core/traits.hpp"
#include "stableid/tiny/tiny_id.hpp"
