#pragma once
#include "io/Logger.hpp"
#include "units.hpp"

#include <string>
#include <filesystem>
#include <signal.h>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "etcwatch"

#define ANSI_CLEAR_SCREEN  "\x1b[H\x1b[2J"

extern std::shared_ptr<Logger> logger;
void init_log(std::string log_fname = "");
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
void signal_handler(int sig);
