// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace reel::core {

void init_logging(bool verbose, bool quiet) {
    spdlog::drop("reel");
    auto logger = spdlog::stderr_color_mt("reel");
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (quiet) {
        logger->set_level(spdlog::level::warn);
    } else if (verbose) {
        logger->set_level(spdlog::level::debug);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(std::move(logger));
}

} // namespace reel::core
