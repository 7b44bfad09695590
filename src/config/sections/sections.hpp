/*
 * sections.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Aggregated header for all configuration sections

**************************************************/

#ifndef HUBBRIDGE_CONFIG_SECTIONS_SECTIONS_HPP
#define HUBBRIDGE_CONFIG_SECTIONS_SECTIONS_HPP

#include "bridge_config.hpp"
#include "credentials_config.hpp"
#include "logging_config.hpp"
#include "preset_config.hpp"

#endif  // HUBBRIDGE_CONFIG_SECTIONS_SECTIONS_HPP
