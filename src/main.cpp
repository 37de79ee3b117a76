// -------------------------------------------------------------------------------------------------
//
// Copyright (C) all of the contributors. All rights reserved.
//
// This software, including documentation, is protected by copyright controlled by
// contributors. All rights are reserved. Copying, including reproducing, storing,
// adapting or translating, any or all of this material requires the prior written
// consent of all contributors.
//
// -------------------------------------------------------------------------------------------------

#include "tqeval_app.h"
#include "logger.h"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                tqeval_app::print_usage(argv[0]);
                return tqeval_app::exit_passed;
            }
        }

        // Console logging until the configured level and file are known
        logger::instance().init(false, true);

        // Defaults, then .env and environment, then the command line
        const eval_config settings = config_loader::load(tqeval_app::find_env_file(argc, argv));
        const eval_config config = tqeval_app::parse_command_line(argc, argv, settings);

        tqeval_app app(config, std::cout);
        return app.run();

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl << std::endl;
        tqeval_app::print_usage(argv[0]);
        return tqeval_app::exit_aborted;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return tqeval_app::exit_aborted;
    }
}
