/*
 * invocation.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Command line commands, validated before the bridge starts

**************************************************/

#ifndef HUBBRIDGE_CLI_INVOCATION_HPP
#define HUBBRIDGE_CLI_INVOCATION_HPP

#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "bridge/hubspace_bridge.hpp"

namespace hubbridge::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ACTION_FAILED = 1;
constexpr int EXIT_USAGE = 2;

/**
 * @brief Malformed command line: unknown command, missing or bad argument
 */
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A fully parsed command, ready to run against a bridge
 */
struct Invocation {
    std::string command;
    /// Whether the worker must be started (auth and discovery) first.
    bool needsWorker{true};
    /// Runs the command, prints JSON to the stream, returns the exit code.
    std::function<int(HubspaceBridge&, std::ostream&)> run;
};

/**
 * @brief Parse a command and its arguments
 *
 * All argument checks happen here, so a bad command line fails without
 * touching the network.
 *
 * @param command Command name (list, discover, on, off, ...).
 * @param args Positional arguments after the command.
 * @param output File the discover report is written to, if any.
 * @throws UsageError on an unknown command or invalid arguments.
 */
[[nodiscard]] auto parseInvocation(const std::string& command,
                                   const std::vector<std::string>& args,
                                   const std::optional<std::string>& output)
    -> Invocation;

/**
 * @brief Parse a whole decimal integer
 * @throws UsageError if `text` is not an integer
 */
[[nodiscard]] auto parseInt(const std::string& text, const std::string& what)
    -> int;

}  // namespace hubbridge::cli

#endif  // HUBBRIDGE_CLI_INVOCATION_HPP
