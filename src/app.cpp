/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: hubbridge command line interface

**************************************************/

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "bridge/hubspace_bridge.hpp"
#include "cli/invocation.hpp"
#include "config/config_loader.hpp"
#include "device/common/device_exceptions.hpp"
#include "logging/logging.hpp"

namespace po = boost::program_options;

using hubbridge::cli::EXIT_OK;
using hubbridge::cli::EXIT_USAGE;

int main(int argc, char* argv[]) {
    po::options_description visible("hubbridge options");
    // clang-format off
    visible.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>(), "Configuration file (.json, .yaml, .yml)")
        ("env-file,e", po::value<std::string>()->default_value(".env"), "Dotenv file with credentials")
        ("log-level,l", po::value<std::string>(), "Log level (trace/debug/info/warn/error/critical/off)")
        ("output,o", po::value<std::string>(), "Output file for 'discover'");
    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(), "Command")
        ("args", po::value<std::vector<std::string>>()->default_value({}, ""), "Arguments");
    // clang-format on

    po::options_description all;
    all.add(visible).add(hidden);
    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "hubbridge: " << e.what() << "\n\n" << visible;
        return EXIT_USAGE;
    }

    if (vm.count("help") != 0U || vm.count("command") == 0U) {
        std::cout << "usage: hubbridge [options] <command> [args...]\n\n"
                  << "commands: list, discover, on, off, brightness, color,\n"
                  << "          effect, temperature, status, status-all,\n"
                  << "          presets, preset, serve\n\n"
                  << visible;
        return vm.count("help") != 0U ? EXIT_OK : EXIT_USAGE;
    }

    hubbridge::config::AppConfig config;
    try {
        std::optional<std::filesystem::path> configPath;
        if (vm.count("config") != 0U) {
            configPath = vm["config"].as<std::string>();
        }
        config = hubbridge::config::ConfigLoader::load(
            configPath, vm["env-file"].as<std::string>());

        if (vm.count("log-level") != 0U) {
            auto level = hubbridge::config::logLevelFromString(
                vm["log-level"].as<std::string>());
            if (!level) {
                std::cerr << "hubbridge: unknown log level '"
                          << vm["log-level"].as<std::string>() << "'\n";
                return EXIT_USAGE;
            }
            config.logging.level = *level;
        }
    } catch (const hubbridge::device::ConfigurationException& e) {
        std::cerr << "hubbridge: " << e.what() << '\n';
        return EXIT_USAGE;
    }

    const auto command = vm["command"].as<std::string>();
    const auto args = vm["args"].as<std::vector<std::string>>();
    std::optional<std::string> output;
    if (vm.count("output") != 0U) {
        output = vm["output"].as<std::string>();
    }

    hubbridge::cli::Invocation invocation;
    try {
        invocation = hubbridge::cli::parseInvocation(command, args, output);
    } catch (const hubbridge::cli::UsageError& e) {
        std::cerr << "hubbridge: " << e.what() << '\n';
        return EXIT_USAGE;
    }

    hubbridge::logging::initialize(config.logging);

    int code = EXIT_OK;
    {
        hubbridge::HubspaceBridge bridge(config);
        if (invocation.needsWorker) {
            bridge.start();
        }
        try {
            code = invocation.run(bridge, std::cout);
        } catch (const hubbridge::cli::UsageError& e) {
            std::cerr << "hubbridge: " << e.what() << '\n';
            code = EXIT_USAGE;
        }
        bridge.stop();
    }

    hubbridge::logging::LoggingManager::getInstance().shutdown();
    return code;
}
