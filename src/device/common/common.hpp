/*
 * common.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Aggregated header for the bridge error module

**************************************************/

#ifndef HUBBRIDGE_DEVICE_COMMON_HPP
#define HUBBRIDGE_DEVICE_COMMON_HPP

// Error codes and error structures
#include "device_error.hpp"

// Exception hierarchy
#include "device_exceptions.hpp"

// Result types using std::expected
#include "device_result.hpp"

#endif  // HUBBRIDGE_DEVICE_COMMON_HPP
