/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <functional>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "carver.hpp"

// Everything the command line can configure
struct CliOptions {
    std::string input;
    std::string output;
    std::optional<int> width;
    std::optional<int> height;
    EnergyMethod energy_method = EnergyMethod::Auto;
    EnergyUpdate energy_update = EnergyUpdate::Full;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

enum class ParseResult { Ok, Help, Error };

// Configure spdlog logging formatting and set the desired log level (default is info)
void initLogging(const spdlog::level::level_enum &level = spdlog::level::info);

/**
 * @brief Parse the command line into CliOptions
 *
 * Usage: carver [options] <input> <output>. At least one of --width / --height is required.
 * Errors are logged. argv may be permuted (getopt_long moves options before operands).
 *
 * @return Ok when options is complete, Help for -h/--help, Error otherwise
 */
ParseResult parseArguments(int argc, char **argv, CliOptions &options);

// Print the usage text to stdout
void printUsage(const char *program);

// Parses "trace", "debug", "info", "warn", "error", "critical" or "off"
bool parseLogLevel(const std::string &text, spdlog::level::level_enum &level);

// Parses "full" or "incremental"
bool parseEnergyUpdate(const std::string &text, EnergyUpdate &update);

// Progress callback that logs at info level about every 10% of each phase
std::function<void(const CarveProgress &)> makeProgressLogger();
