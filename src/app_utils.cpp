/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <getopt.h>
#include <memory>

#include <spdlog/fmt/fmt.h>

#include "app_utils.hpp"

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Strict integer parsing: the whole string must be a number that fits in an int
bool parseInt(const char *text, int &value) {
    if (!text || *text == '\0') {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

const option kLongOptions[] = {
    {"width", required_argument, nullptr, 'w'},
    {"height", required_argument, nullptr, 'H'},
    {"energy", required_argument, nullptr, 'e'},
    {"energy-update", required_argument, nullptr, 'u'},
    {"log-level", required_argument, nullptr, 'l'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

// Leading ':' makes getopt report a missing argument as ':' instead of '?'
constexpr const char *kShortOptions = ":w:H:e:u:l:h";

} // namespace

void initLogging(const spdlog::level::level_enum &level) {
    spdlog::set_level(level);
    spdlog::set_pattern("[%H:%M:%S] [%^%L%$] %v");
}

bool parseLogLevel(const std::string &text, spdlog::level::level_enum &level) {
    const std::string lower = toLower(text);

    // from_str() maps unknown names to "off", so only accept "off" when it was asked for
    spdlog::level::level_enum parsed = spdlog::level::from_str(lower);
    if (parsed == spdlog::level::off && lower != "off") {
        return false;
    }
    level = parsed;
    return true;
}

bool parseEnergyUpdate(const std::string &text, EnergyUpdate &update) {
    const std::string lower = toLower(text);
    if (lower == "full") {
        update = EnergyUpdate::Full;
        return true;
    }
    if (lower == "incremental") {
        update = EnergyUpdate::Incremental;
        return true;
    }
    return false;
}

void printUsage(const char *program) {
    fmt::print("Usage: {} [options] <input> <output>\n"
               "\n"
               "Content-aware resize (seam carving). Only downsizing is supported.\n"
               "\n"
               "Options:\n"
               "  -w, --width N                Target width\n"
               "  -H, --height N               Target height\n"
               "  -e, --energy METHOD          Energy function: auto|sobel (default: auto)\n"
               "  -u, --energy-update MODE     full|incremental (default: full)\n"
               "  -l, --log-level LEVEL        trace|debug|info|warn|error|critical|off\n"
               "                               (default: info)\n"
               "  -h, --help                   Show this help\n",
               program ? program : "carver");
}

ParseResult parseArguments(int argc, char **argv, CliOptions &options) {
    // Reset getopt's global state so the parser can run more than once per process
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, kShortOptions, kLongOptions, nullptr)) != -1) {
        switch (opt) {
        case 'w': {
            int value = 0;
            if (!parseInt(optarg, value)) {
                spdlog::error("Invalid --width value: '{}'", optarg);
                return ParseResult::Error;
            }
            options.width = value;
            break;
        }
        case 'H': {
            int value = 0;
            if (!parseInt(optarg, value)) {
                spdlog::error("Invalid --height value: '{}'", optarg);
                return ParseResult::Error;
            }
            options.height = value;
            break;
        }
        case 'e':
            if (!parseEnergyMethod(optarg, options.energy_method)) {
                spdlog::error("Unsupported energy method: {}", optarg);
                return ParseResult::Error;
            }
            break;
        case 'u':
            if (!parseEnergyUpdate(optarg, options.energy_update)) {
                spdlog::error("Unsupported energy update mode: {}", optarg);
                return ParseResult::Error;
            }
            break;
        case 'l':
            if (!parseLogLevel(optarg, options.log_level)) {
                spdlog::error("Unknown log level: {}", optarg);
                return ParseResult::Error;
            }
            break;
        case 'h':
            return ParseResult::Help;
        case ':':
            spdlog::error("Option '{}' requires a value", argv[optind - 1]);
            return ParseResult::Error;
        default:
            spdlog::error("Unknown option '{}'", argv[optind - 1]);
            return ParseResult::Error;
        }
    }

    if (argc - optind != 2) {
        spdlog::error("Expected <input> and <output> paths, got {} positional argument(s)",
                      argc - optind);
        return ParseResult::Error;
    }
    options.input = argv[optind];
    options.output = argv[optind + 1];

    if (!options.width && !options.height) {
        spdlog::error("Provide --width and/or --height");
        return ParseResult::Error;
    }

    return ParseResult::Ok;
}

std::function<void(const CarveProgress &)> makeProgressLogger() {
    // Shared between copies of the callback: start time of the phase being reported
    auto phase_start = std::make_shared<std::chrono::steady_clock::time_point>();

    return [phase_start](const CarveProgress &progress) {
        if (progress.seams_removed == 1) {
            *phase_start = std::chrono::steady_clock::now();
        }

        // Update every 10% or at least every seam
        const int interval = std::max(1, progress.seams_total / 10);
        if (progress.seams_removed % interval != 0 &&
            progress.seams_removed != progress.seams_total) {
            return;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - *phase_start);
        spdlog::info("{}: {}/{} seams removed ({}%) - now {}x{}, {} ms elapsed",
                     progress.axis == CarveAxis::Width ? "Width" : "Height",
                     progress.seams_removed, progress.seams_total,
                     progress.seams_removed * 100 / std::max(1, progress.seams_total),
                     progress.width, progress.height, elapsed.count());
    };
}
