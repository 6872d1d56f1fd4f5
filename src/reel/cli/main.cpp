// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/log.hpp>
#include <iostream>

using namespace reel::cli;

int main(int argc, char* argv[]) {
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    // Handle help
    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }

    // Handle version
    if (args.version) {
        print_version();
        return EXIT_OK;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }

    reel::core::init_logging(args.verbose, args.quiet);

    reel::core::HttpSession::global_init();
    int exit_code = download(args);
    reel::core::HttpSession::global_cleanup();

    return exit_code;
}
