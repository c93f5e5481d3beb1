/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <atomic>
#include <csignal>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "app_utils.hpp"
#include "carver.hpp"
#include "image_io.hpp"

namespace {

// Raised by Ctrl+C; the carver checks it between two seams
std::atomic<bool> g_cancel_requested{false};

void handleInterrupt(int) { g_cancel_requested.store(true); }

} // namespace

int main(int argc, char **argv) {

    // Default level until the command line tells us otherwise
    initLogging();

    CliOptions cli;
    switch (parseArguments(argc, argv, cli)) {
    case ParseResult::Help:
        printUsage(argv[0]);
        return 0;
    case ParseResult::Error:
        printUsage(argv[0]);
        return 1;
    case ParseResult::Ok:
        break;
    }

    initLogging(cli.log_level);

    PixelBuffer image;
    if (!loadImage(cli.input, image)) {
        return 1;
    }
    spdlog::info("Original size: {}x{}", image.width, image.height);

    if (cli.width && *cli.width > 0 && *cli.width < image.width) {
        spdlog::info("Removing {} vertical seams to reach width {}", image.width - *cli.width,
                     *cli.width);
    }
    if (cli.height && *cli.height > 0 && *cli.height < image.height) {
        spdlog::info("Removing {} horizontal seams to reach height {}",
                     image.height - *cli.height, *cli.height);
    }

    CarveOptions options;
    options.energy_method = cli.energy_method;
    options.energy_update = cli.energy_update;
    options.on_progress = makeProgressLogger();
    options.cancel = &g_cancel_requested;

    std::signal(SIGINT, handleInterrupt);

    PixelBuffer carved;
    CarveStatus status = carveImage(image, cli.width, cli.height, carved, options);
    if (status != CarveStatus::Ok) {
        spdlog::error("Carving failed: {}", carveStatusMessage(status));
        return 1;
    }
    spdlog::info("Resized size: {}x{}", carved.width, carved.height);

    if (!saveImage(cli.output, carved)) {
        return 1;
    }

    fmt::print("Saved carved image to {}\n", cli.output);
    return 0;
}
