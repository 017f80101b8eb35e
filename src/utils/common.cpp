/**
 * @file common.cpp
 * @brief Global logger, common command-line arguments and crash handling.
 */

#include "common.hpp"
#include "dist/version.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstring>

int verbosity = 0;

// stdout belongs to the status line, diagnostics go to stderr
std::shared_ptr<Logger> logger = std::make_shared<Logger>(spdlog::stderr_color_mt(APP_NAME));
argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

// crash handler: SIGSEGV/SIGABRT print a symbolized stack trace to the log and exit
#include <backtrace.h>

static void backtrace_error_cb(void *, const char *msg, int errnum) {
    logger->critical("backtrace failed: {} ({})", msg, errnum);
}

static int backtrace_frame_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    logger->critical("  at {} in {} {}:{}", (void *)pc, function ? function : "??", filename ? filename : "??", lineno);
    return 0;
}

void signal_handler(int sig) {
    logger->critical("caught signal {} ({}), backtrace:", sig, strsignal(sig));

    backtrace_state *state = backtrace_create_state(nullptr, 0, backtrace_error_cb, nullptr);
    backtrace_full(state, 0, backtrace_frame_cb, backtrace_error_cb, nullptr);

    exit(1);
}

// adds a file sink once, an explicit log pathname that can't be opened is fatal
void init_log(std::string log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }

    inited = true;
    if( !log_fname.empty() && !logger->add_file(log_fname) ){
        logger->critical("explicit log pathname is set, refusing to continue without log");
        exit(1);
    }
    logger->start();
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity, -v dumps internal state on every update")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("also write log to a file");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
