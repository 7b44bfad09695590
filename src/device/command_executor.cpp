/*
 * command_executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Command executor implementation

*************************************************/

#include "command_executor.hpp"

#include "client/afero/afero_protocol.hpp"
#include "logging/logging.hpp"

namespace hubbridge::device {

namespace fc = afero::function_class;

CommandExecutor::CommandExecutor(DeviceCatalog& catalog, StatusCache& cache,
                                 worker::SyncBridge& bridge,
                                 ExecutorConfig config)
    : catalog_(catalog),
      cache_(cache),
      bridge_(bridge),
      config_(std::move(config)),
      logger_(logging::get("worker")) {}

// ==================== Control Operations ====================

auto CommandExecutor::turnOn(const std::string& nameOrId) -> DeviceVoidResult {
    return mutate("turnOn", nameOrId,
                  [this](afero::SessionProvider& session, const Device& device) {
                      return setPower(session, device, true);
                  });
}

auto CommandExecutor::turnOff(const std::string& nameOrId)
    -> DeviceVoidResult {
    return mutate("turnOff", nameOrId,
                  [this](afero::SessionProvider& session, const Device& device) {
                      return setPower(session, device, false);
                  });
}

auto CommandExecutor::setBrightness(const std::string& nameOrId, int percent)
    -> DeviceVoidResult {
    if (percent < 0 || percent > 100) {
        return failure(error::invalidArgument(
            "Brightness must be between 0 and 100, got " +
            std::to_string(percent)));
    }

    return mutate(
        "setBrightness", nameOrId,
        [this, percent](afero::SessionProvider& session, const Device& device) {
            if (percent == 0) {
                return setPower(session, device, false);
            }
            return setValue(session, device, fc::kBrightness, percent);
        });
}

auto CommandExecutor::setColor(const std::string& nameOrId, RgbColor color)
    -> DeviceVoidResult {
    const json value = {
        {"color-rgb", {{"r", color.r}, {"g", color.g}, {"b", color.b}}}};
    return mutate(
        "setColor", nameOrId,
        [this, value](afero::SessionProvider& session, const Device& device) {
            return setValue(session, device, fc::kColorRgb, value);
        });
}

auto CommandExecutor::setEffect(const std::string& nameOrId,
                                const std::string& effect)
    -> DeviceVoidResult {
    if (effect.empty()) {
        return failure(error::invalidArgument("Effect name must not be empty"));
    }
    return mutate(
        "setEffect", nameOrId,
        [this, effect](afero::SessionProvider& session, const Device& device) {
            return setValue(session, device, fc::kColorSequence, effect);
        });
}

auto CommandExecutor::setColorTemperature(const std::string& nameOrId,
                                          int kelvin) -> DeviceVoidResult {
    if (kelvin <= 0) {
        return failure(error::invalidArgument(
            "Colour temperature must be positive, got " +
            std::to_string(kelvin)));
    }
    return mutate(
        "setColorTemperature", nameOrId,
        [this, kelvin](afero::SessionProvider& session, const Device& device) {
            return setValue(session, device, fc::kColorTemperature, kelvin);
        });
}

// ==================== Query Operations ====================

auto CommandExecutor::status(const std::string& nameOrId)
    -> DeviceResult<StatusSnapshot> {
    if (!bridge_.connected()) {
        return StatusSnapshot::failed(error::notConnected().message);
    }

    auto id = catalog_.resolve(nameOrId);
    auto device = id ? catalog_.get(*id) : std::nullopt;
    if (!device) {
        return failure<StatusSnapshot>(error::unknownDevice(nameOrId));
    }

    if (auto cached = cache_.get(device->id)) {
        return *cached;
    }

    auto result = bridge_.runBlocking(
        "status",
        [this, dev = *device](afero::SessionProvider& session) {
            return readStatus(session, dev);
        },
        config_.commandTimeout);
    if (!result) {
        logger_->debug("Status of {} unavailable: {}", device->id,
                       result.error().message);
        return StatusSnapshot::failed(result.error().message);
    }

    auto snapshot = *result;
    if (!snapshot.on) {
        snapshot.brightnessPercent = 0;
    }
    cache_.put(device->id, snapshot);
    return snapshot;
}

auto CommandExecutor::statusAll() -> std::vector<DeviceStatus> {
    std::vector<DeviceStatus> result;
    for (const auto& device : catalog_.list()) {
        if (device.deviceClass != DeviceClass::Light) {
            continue;
        }

        StatusSnapshot snapshot;
        try {
            auto status = this->status(device.id);
            snapshot = status ? *status
                              : StatusSnapshot::failed(status.error().message);
        } catch (const std::exception& e) {
            snapshot = StatusSnapshot::failed(e.what());
        }
        result.push_back(DeviceStatus{device, std::move(snapshot)});
    }
    return result;
}

// ==================== Internals ====================

auto CommandExecutor::prepare(const std::string& nameOrId)
    -> DeviceResult<Device> {
    if (!bridge_.connected()) {
        return failure<Device>(error::notConnected());
    }

    auto id = catalog_.resolve(nameOrId);
    auto device = id ? catalog_.get(*id) : std::nullopt;
    if (!device) {
        return failure<Device>(error::unknownDevice(nameOrId));
    }
    return *device;
}

auto CommandExecutor::mutate(
    const std::string& operation, const std::string& nameOrId,
    const std::function<DeviceVoidResult(afero::SessionProvider&,
                                         const Device&)>& work)
    -> DeviceVoidResult {
    auto device = prepare(nameOrId);
    if (!device) {
        return std::unexpected(device.error());
    }

    cache_.invalidate(device->id);

    auto result = bridge_.runBlocking(
        operation,
        [work, dev = *device](afero::SessionProvider& session) {
            return work(session, dev);
        },
        config_.commandTimeout);
    if (!result) {
        logger_->warn("{} on '{}' ({}) failed: {}", operation, device->name,
                      device->id, result.error().message);
    }
    return result;
}

auto CommandExecutor::setPower(afero::SessionProvider& session,
                               const Device& device, bool on)
    -> DeviceVoidResult {
    try {
        auto* controller = session.controller(device.deviceClass);
        if (controller != nullptr && controller->getDevice(device.id)) {
            if (on) {
                controller->turnOn(device.id);
            } else {
                controller->turnOff(device.id);
            }
            return success();
        }
        logger_->debug("{} not held by the {} controller; writing state",
                       device.id, deviceClassToString(device.deviceClass));
    } catch (const std::exception& e) {
        logger_->debug("Controller power change for {} failed: {}; writing "
                       "state",
                       device.id, e.what());
    }

    return writeState(session, device, fc::kPower, on ? "on" : "off");
}

auto CommandExecutor::setValue(afero::SessionProvider& session,
                               const Device& device,
                               std::string_view functionClass,
                               const json& value) -> DeviceVoidResult {
    if (auto powered = setPower(session, device, true); !powered) {
        logger_->debug("Power-on before {} on {} failed: {}", functionClass,
                       device.id, powered.error().message);
    }
    return writeState(session, device, functionClass, value);
}

auto CommandExecutor::writeState(afero::SessionProvider& session,
                                 const Device& device,
                                 std::string_view functionClass,
                                 const json& value) -> DeviceVoidResult {
    auto result = tryExecute([&] {
        afero::StateValue entry{std::string(functionClass), std::nullopt,
                                value};

        afero::HttpRequest request;
        request.method = afero::HttpMethod::Put;
        request.url =
            afero::state_url(config_.dataHost, session.accountId(), device.id);
        request.headers["Content-Type"] = "application/json; charset=utf-8";
        request.body =
            afero::build_state_payload(device.id, {entry},
                                       afero::now_epoch_ms())
                .dump();

        auto response = session.rawRequest(std::move(request));
        if (response.status != 200 && response.status != 202 &&
            response.status != 204) {
            throw BackendException("API call failed", response.status);
        }
    });
    if (!result) {
        return result;
    }

    // Controller memory backs status reads
    try {
        if (auto* controller = session.controller(device.deviceClass)) {
            controller->applyState(device.id, functionClass, value);
        }
    } catch (const std::exception& e) {
        logger_->debug("Could not record {} for {} in controller state: {}",
                       functionClass, device.id, e.what());
    }
    return result;
}

auto CommandExecutor::readStatus(afero::SessionProvider& session,
                                 const Device& device)
    -> DeviceResult<StatusSnapshot> {
    try {
        auto* controller = session.controller(device.deviceClass);
        if (controller != nullptr) {
            if (auto handle = controller->getDevice(device.id)) {
                return handle->state;
            }
        }
    } catch (const std::exception& e) {
        logger_->debug("Controller state for {} unavailable: {}", device.id,
                       e.what());
    }

    return tryExecute([&] {
        afero::HttpRequest request;
        request.url =
            afero::metadevice_url(config_.dataHost, session.accountId(),
                                  device.id);
        request.query = {{"expansions", "state"}};

        auto response = session.rawRequest(std::move(request));
        if (!response.is_success()) {
            throw BackendException("API fetch failed", response.status);
        }

        json body;
        try {
            body = json::parse(response.body);
        } catch (const json::parse_error& e) {
            throw ProtocolException(std::string("State response is not JSON: ") +
                                    e.what());
        }
        return afero::snapshot_from_state(afero::parse_state_values(body));
    });
}

}  // namespace hubbridge::device
