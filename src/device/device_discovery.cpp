/*
 * device_discovery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Startup discovery implementation

*************************************************/

#include "device_discovery.hpp"

#include "client/afero/afero_protocol.hpp"
#include "logging/logging.hpp"

namespace hubbridge::device {

auto discoverFromControllers(afero::SessionProvider& session,
                             DeviceCatalog& catalog) -> std::size_t {
    auto logger = logging::get("worker");
    std::size_t added = 0;

    for (auto cls : kAllDeviceClasses) {
        const auto className = deviceClassToString(cls);
        try {
            auto* controller = session.controller(cls);
            if (controller == nullptr) {
                logger->debug("No {} controller available", className);
                continue;
            }

            auto devices = controller->listDevices();
            for (const auto& handle : devices) {
                catalog.add(Device{handle.id, handle.name, cls});
                logger->debug("Discovered {} '{}' ({})", className,
                              handle.name, handle.id);
            }
            added += devices.size();
        } catch (const std::exception& e) {
            logger->warn("Listing {} devices failed: {}", className, e.what());
        }
    }

    logger->info("Discovered {} device(s) through class controllers", added);
    return added;
}

auto discoverFromListing(afero::SessionProvider& session,
                         DeviceCatalog& catalog, const std::string& dataHost)
    -> DeviceResult<std::size_t> {
    auto logger = logging::get("worker");

    return tryExecute([&]() -> std::size_t {
        afero::HttpRequest request;
        request.url = afero::metadevices_url(dataHost, session.accountId());
        request.query = {{"expansions", "state"}};

        auto response = session.rawRequest(std::move(request));
        if (!response.is_success()) {
            throw BackendException("Direct metadevice listing failed",
                                   response.status);
        }

        json body;
        try {
            body = json::parse(response.body);
        } catch (const json::parse_error& e) {
            throw ProtocolException(
                std::string("Metadevice listing is not JSON: ") + e.what());
        }

        std::size_t added = 0;
        for (const auto& metadevice : afero::parse_metadevices(body)) {
            if (!afero::has_function_class(metadevice.values,
                                           afero::function_class::kPower)) {
                continue;
            }
            catalog.add(Device{metadevice.id, metadevice.friendly_name,
                               DeviceClass::Light});
            logger->debug("Discovered '{}' ({}) from direct listing",
                          metadevice.friendly_name, metadevice.id);
            ++added;
        }

        logger->info("Discovered {} device(s) from direct listing", added);
        return added;
    });
}

}  // namespace hubbridge::device
