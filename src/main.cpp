/**
 * @file main.cpp
 * @brief Main entry point for etcwatch.
 *
 * Handles command-line parsing, command registration, logging initialization
 * and command execution. Without an explicit command the arguments go to
 * "watch", so "producer | etcwatch 100" just works. Every command except
 * "test" is preceded by a silent self-test.
 */

#include <argparse/argparse.hpp>

#include <algorithm>
#include <iostream>

#include "utils/common.hpp"
#include "dist/version.h"

#include "commands/TestCommand.hpp"
#include "commands/WatchCommand.hpp"

extern argparse::ArgumentParser program;
extern int verbosity;

/**
 * @brief Main entry point for etcwatch.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return EXIT_SUCCESS (0) on success, EXIT_FAILURE (1) on error.
 */
int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        std::vector<std::string> unknown_args = program.parse_known_args(argc, argv); // doesnt raise error on unknown args
        const bool no_subcommand_used = std::all_of(Command::registry().begin(), Command::registry().end(), [&](const auto& cmd) { return !program.is_subcommand_used(cmd.first); } );
        if( unknown_args.size() > 0 ){
            if( no_subcommand_used && !Command::is_registered(unknown_args[0]) ){
                // no subcommand used => implicit "watch" command, "etcwatch 100" or "etcwatch -g 100"
                unknown_args.insert(unknown_args.begin(), WATCH_CMD_NAME);
                unknown_args.insert(unknown_args.begin(), argv[0]);
                program.parse_args(unknown_args); // raises error on unknown args
            } else {
                std::cerr << "[?] Unknown arguments: ";
                for (const auto& arg : unknown_args) {
                    std::cerr << "\"" << arg << "\" ";
                }
                std::cerr << std::endl;
                std::exit(1);
            }
        }
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before logger->add_file() call

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (program.is_subcommand_used(name)) {
            if( cmd->parser().is_used("--log") ){
                init_log(cmd->parser().get<std::string>("--log"));
            } else if( program.is_used("--log") ){
                init_log(program.get<std::string>("--log"));
            } else {
                init_log();
            }

            if( name == TEST_CMD_NAME ){
                // explicit self-test, make it visible
                logger->set_verbosity(9);
            } else {
                // implicit self-test, make it silent
                int rc = 0;
                logger->with_console_level(Logger::level::critical, [&]() { rc = selfTestCmd->run(); });
                if( rc != 0 ){
                    logger->critical("self-test failed, exiting");
                    return 1;
                }
            }

            try {
                return cmd->run();
            } catch (const std::exception& err) {
                logger->critical("{}", err.what());
                return 1;
            }
        }
    }

    std::cout << program;
    return 0;
}
