/*
 * device_discovery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Startup discovery populating the device catalog

*************************************************/

#ifndef HUBBRIDGE_DEVICE_DEVICE_DISCOVERY_HPP
#define HUBBRIDGE_DEVICE_DEVICE_DISCOVERY_HPP

#include <cstddef>
#include <string>

#include "client/afero/session.hpp"
#include "common/device_result.hpp"
#include "device_catalog.hpp"

namespace hubbridge::device {

/**
 * @brief Catalog every device held by the session's class controllers
 *
 * Classes are listed independently; a class whose controller is missing or
 * throws is logged and skipped.
 *
 * @return Number of devices added
 */
auto discoverFromControllers(afero::SessionProvider& session,
                             DeviceCatalog& catalog) -> std::size_t;

/**
 * @brief Catalog devices straight from the metadevice listing
 *
 * Used when the controllers yield nothing. Every metadevice exposing a
 * `power` function class is cataloged as a light.
 *
 * @param dataHost Base URL of the metadevice API
 * @return Number of devices added, or the failure of the listing request
 */
auto discoverFromListing(afero::SessionProvider& session,
                         DeviceCatalog& catalog, const std::string& dataHost)
    -> DeviceResult<std::size_t>;

}  // namespace hubbridge::device

#endif  // HUBBRIDGE_DEVICE_DEVICE_DISCOVERY_HPP
