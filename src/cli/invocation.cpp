/*
 * invocation.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Command line commands, validated before the bridge starts

**************************************************/

#include "invocation.hpp"

#include <csignal>
#include <cstdint>
#include <fstream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/logging.hpp"

namespace hubbridge::cli {

namespace {

void printJson(std::ostream& out, const json& value) {
    out << value.dump(2) << std::endl;
}

void requireArgs(const std::vector<std::string>& args, size_t count,
                 const std::string& usage) {
    if (args.size() < count) {
        throw UsageError("usage: hubbridge " + usage);
    }
}

auto parseChannel(const std::string& text, const std::string& what)
    -> std::uint8_t {
    int value = parseInt(text, what);
    if (value < 0 || value > 255) {
        throw UsageError(what + " must be between 0 and 255");
    }
    return static_cast<std::uint8_t>(value);
}

auto report(std::ostream& out, const ActionResult& result) -> int {
    printJson(out, result.toJson());
    return result.ok ? EXIT_OK : EXIT_ACTION_FAILED;
}

auto action(std::string command,
            std::function<ActionResult(HubspaceBridge&)> call) -> Invocation {
    return Invocation{std::move(command), true,
                      [call = std::move(call)](HubspaceBridge& bridge,
                                               std::ostream& out) {
                          return report(out, call(bridge));
                      }};
}

/**
 * @brief Block until SIGINT or SIGTERM
 */
void serveUntilSignalled() {
    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            logging::get("hubbridge")
                ->info("Received signal {}, shutting down", signal);
        }
    });
    io.run();
}

}  // namespace

auto parseInt(const std::string& text, const std::string& what) -> int {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        throw UsageError(what + " must be an integer, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw UsageError(what + " must be an integer, got '" + text + "'");
    }
    return value;
}

auto parseInvocation(const std::string& command,
                     const std::vector<std::string>& args,
                     const std::optional<std::string>& output) -> Invocation {
    if (command == "list") {
        return Invocation{command, true,
                          [](HubspaceBridge& bridge, std::ostream& out) {
                              json devices = json::array();
                              for (const auto& device : bridge.list()) {
                                  devices.push_back(device.toJson());
                              }
                              printJson(out, devices);
                              return EXIT_OK;
                          }};
    }
    if (command == "discover") {
        return Invocation{
            command, true, [output](HubspaceBridge& bridge, std::ostream& out) {
                auto devices = bridge.discover();
                if (output) {
                    std::ofstream file(*output);
                    if (!file) {
                        throw UsageError("cannot write " + *output);
                    }
                    file << devices.dump(2) << '\n';
                    logging::get("hubbridge")
                        ->info("Wrote {} devices to {}", devices.size(),
                               *output);
                }
                printJson(out, devices);
                return EXIT_OK;
            }};
    }
    if (command == "on" || command == "off") {
        requireArgs(args, 1, command + " <device>");
        const bool on = command == "on";
        return action(command, [device = args[0], on](HubspaceBridge& bridge) {
            return on ? bridge.turnOn(device) : bridge.turnOff(device);
        });
    }
    if (command == "brightness") {
        requireArgs(args, 2, "brightness <device> <0..100>");
        const int percent = parseInt(args[1], "brightness");
        if (percent < 0 || percent > 100) {
            throw UsageError("brightness must be between 0 and 100");
        }
        return action(command,
                      [device = args[0], percent](HubspaceBridge& bridge) {
                          return bridge.setBrightness(device, percent);
                      });
    }
    if (command == "color") {
        requireArgs(args, 4, "color <device> <r> <g> <b>");
        const auto r = parseChannel(args[1], "r");
        const auto g = parseChannel(args[2], "g");
        const auto b = parseChannel(args[3], "b");
        return action(command,
                      [device = args[0], r, g, b](HubspaceBridge& bridge) {
                          return bridge.setColor(device, r, g, b);
                      });
    }
    if (command == "effect") {
        requireArgs(args, 2, "effect <device> <name>");
        return action(command, [device = args[0],
                                effect = args[1]](HubspaceBridge& bridge) {
            return bridge.setEffect(device, effect);
        });
    }
    if (command == "temperature") {
        requireArgs(args, 2, "temperature <device> <kelvin>");
        const int kelvin = parseInt(args[1], "kelvin");
        if (kelvin <= 0) {
            throw UsageError("kelvin must be positive");
        }
        return action(command,
                      [device = args[0], kelvin](HubspaceBridge& bridge) {
                          return bridge.setColorTemperature(device, kelvin);
                      });
    }
    if (command == "status") {
        requireArgs(args, 1, "status <device>");
        return Invocation{
            command, true,
            [device = args[0]](HubspaceBridge& bridge, std::ostream& out) {
                auto status = bridge.status(device);
                printJson(out, status);
                return status.contains("error") ? EXIT_ACTION_FAILED
                                                : EXIT_OK;
            }};
    }
    if (command == "status-all") {
        return Invocation{command, true,
                          [](HubspaceBridge& bridge, std::ostream& out) {
                              printJson(out, bridge.statusAll());
                              return EXIT_OK;
                          }};
    }
    if (command == "presets") {
        return Invocation{command, false,
                          [](HubspaceBridge& bridge, std::ostream& out) {
                              printJson(out, bridge.presets());
                              return EXIT_OK;
                          }};
    }
    if (command == "preset") {
        requireArgs(args, 1, "preset <key>");
        return action(command, [key = args[0]](HubspaceBridge& bridge) {
            return bridge.applyPreset(key);
        });
    }
    if (command == "serve") {
        return Invocation{command, true,
                          [](HubspaceBridge& bridge, std::ostream& /*out*/) {
                              logging::get("hubbridge")
                                  ->info("Bridge running with {} devices; "
                                         "Ctrl+C to stop",
                                         bridge.list().size());
                              serveUntilSignalled();
                              return EXIT_OK;
                          }};
    }
    throw UsageError("unknown command '" + command + "'");
}

}  // namespace hubbridge::cli
