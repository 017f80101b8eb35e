/**
 * @file Logger.cpp
 * @brief Implementation of the Logger wrapper around spdlog.
 *
 * The console sink writes to stderr, stdout belongs to the status line. A log file
 * added with -L receives DEBUG and up regardless of -v/-q.
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <array>
#include <fstream>

/**
 * @brief Sets the logging verbosity level.
 *
 * Verbosity is the number of -v minus the number of -q:
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 *
 * @param verbosity Integer verbosity level.
 */
void Logger::set_verbosity(int verbosity){
    static const std::array<level, 6> levels = {
        level::off, level::critical, level::err, level::warn, level::info, level::debug
    };

    if( verbosity >= 2 ){
        m_logger->set_level(level::trace);
    } else if( verbosity <= -4 ){
        m_logger->set_level(level::off);
    } else {
        m_logger->set_level(levels[verbosity + 4]);
    }
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.assign(argv, argv + argc);
}

void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

// command line as it would be typed, args with blanks in quotes (no real shell escaping)
static std::string command_line(const std::vector<std::string>& args) {
    std::vector<std::string> words;
    words.reserve(args.size());
    for( const auto& arg : args ){
        words.push_back(arg.find_first_of(" \t") == std::string::npos ? arg : "\"" + arg + "\"");
    }
    return fmt::format("{}", fmt::join(words, " "));
}

/**
 * @brief Adds a file sink to the logger.
 *
 * The file is appended to, consecutive sessions are separated by a blank line.
 * When the console shows less than DEBUG, the logger level drops to DEBUG and the
 * previous level moves to the console sink, so the file still gets everything.
 *
 * @param fname Path to the log file.
 * @return false if a file is already attached or the file can't be opened.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        return false;
    }

    {
        std::ofstream probe(fname, std::ios::app);
        if( !probe ){
            m_logger->error("can't open log file {}, logging to console only", fname);
            return false;
        }
        if( probe.tellp() > 0 ){
            probe << "\n\n";
        }
    }

    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());
    sink->set_pattern("%Y-%m-%d %H:%M:%S.%e [%L] %v");

    const level prev = m_logger->level();
    if( prev > level::debug ){
        sink->set_level(level::debug);
        set_console_level(prev);
        m_logger->set_level(level::debug);
    }

    m_logger->sinks().push_back(sink);
    m_fname = fname;
    return true;
}

/**
 * @brief Logs the session header: banner, command line and log destination.
 *
 * DEBUG only, a plain run prints nothing but the status line.
 */
void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->debug("{}", m_banner);
    }
    m_logger->debug("started as {}", command_line(m_arguments));
    if( !m_fname.empty() ){
        m_logger->debug("log file: {}", m_fname);
    }
}

// the console sink is created with the logger, so it's always the first one
void Logger::set_console_level(level lvl) {
    m_logger->sinks().front()->set_level(lvl);
}

Logger::level Logger::console_level() const {
    return m_logger->sinks().front()->level();
}
