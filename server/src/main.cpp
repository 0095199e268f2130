//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <cstdlib>
#include <exception>
#include <iostream>

#include "application.hpp"
#include "config.hpp"
#include "error.hpp"

using namespace poker;

static int main_impl(int argc, char* argv[])
{
    // Check command line arguments.
    if (argc != 3)
    {
        std::cerr << "Usage: " << argv[0] << " <address> <port>\n"
                  << "Example:\n"
                  << "    " << argv[0] << " 0.0.0.0 8080\n";
        return EXIT_FAILURE;
    }

    // Application config. Tuning parameters are read from the environment
    application_config cfg;
    cfg.ip = argv[1];                                           // IP where the server will listen
    cfg.port = static_cast<unsigned short>(std::atoi(argv[2]));  // Port
    auto cfg_result = apply_environment(std::move(cfg));
    if (cfg_result.has_error())
    {
        log_error(cfg_result.error(), "Reading configuration");
        return EXIT_FAILURE;
    }

    // Setup the application
    application app(std::move(cfg_result).value());
    auto ec = app.setup();
    if (ec)
    {
        log_error(ec, "Setting up the server");
        return EXIT_FAILURE;
    }

    // Run until we get a SIGINT or SIGTERM
    app.run_until_completion(true);
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    try
    {
        return main_impl(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << "Exception in main(): " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
