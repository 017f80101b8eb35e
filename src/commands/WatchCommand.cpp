/**
 * @file WatchCommand.cpp
 * @brief The live estimator: reads numbers from stdin and redraws the ETC.
 *
 * This is the default command, "etcwatch 100" is the same as "etcwatch watch 100".
 * Each input line is one sample; with --field a single column of the line is used.
 * The run ends when the input ends, or on the first line that isn't a number.
 */

#include "WatchCommand.hpp"
#include "io/SampleReader.hpp"
#include "utils/StatusRenderer.hpp"

#include <fstream>
#include <iostream>

REGISTER_COMMAND(WatchCommand);

/**
 * @brief Constructs a WatchCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
WatchCommand::WatchCommand(bool reg) : Command(reg, WATCH_CMD_NAME, "estimate time of completion for numbers piped to stdin") {
    m_parser.add_argument("goal").nargs(argparse::nargs_pattern::optional).help("goal number");
    m_parser.add_argument("-g", "--goal-num").help("goal number, same as the positional argument");
    m_parser.add_argument("-f", "--field-sel").default_value(0).scan<'i', int>()
        .help("use N-th field of each line (1-based), 0 = whole line");
    m_parser.add_argument("-F", "--delimiter").help("field delimiter, single char or \"tab\" [default: whitespace]");
    m_parser.add_argument("-m", "--message").default_value(std::string()).help("header line shown above the status");
    m_parser.add_argument("-c", "--no-clear").default_value(false).implicit_value(true).help("do not clear the screen when updating");
    m_parser.add_argument("-l", "--long").default_value(false).implicit_value(true).help("print remaining time as days/hours/minutes/seconds");
    m_parser.add_argument("-i", "--input").default_value(std::string("-")).help("read samples from a file instead of stdin");
}

char WatchCommand::delimiter() const {
    auto value = m_parser.present("--delimiter");
    if( !value ){
        return '\0';
    }
    if( *value == "tab" || *value == "\\t" ){
        return '\t';
    }
    if( value->size() != 1 ){
        throw std::invalid_argument(fmt::format("delimiter must be a single char, got \"{}\"", *value));
    }
    return (*value)[0];
}

/**
 * @brief Runs the estimation loop until the input ends.
 *
 * @return 0 when the input ends normally, 1 on an invalid goal, an invalid
 *         sample or unusable options.
 */
int WatchCommand::run() {
    Decimal goal;
    size_t field = 0;
    char delim = '\0';
    try {
        auto goal_str = m_parser.present("--goal-num");
        if( !goal_str ){
            goal_str = m_parser.present("goal");
        }
        goal = Estimator::parse_goal(goal_str);

        const int ifield = m_parser.get<int>("--field-sel");
        if( ifield < 0 ){
            throw std::invalid_argument(fmt::format("field must be 0 or larger, got {}", ifield));
        }
        field = ifield;
        delim = delimiter();
    } catch( const Estimator::InvalidGoal& e ){
        logger->critical("{}", e.what());
        return 1;
    } catch( const std::invalid_argument& e ){
        logger->critical("{}", e.what());
        return 1;
    }

    const std::string input = m_parser.get("--input");
    std::ifstream file;
    if( input != "-" ){
        file.open(input);
        if( !file.is_open() ){
            logger->critical("cannot open input file {}", input);
            return 1;
        }
    }

    StatusRenderer::Options opts;
    opts.message = m_parser.get("--message");
    opts.clear = !m_parser.get<bool>("--no-clear");
    opts.long_eta = m_parser.get<bool>("--long");
    StatusRenderer renderer(stdout, opts);

    SampleReader reader(input == "-" ? std::cin : file, field, delim);
    Estimator estimator(goal, m_clock);

    logger->debug("goal: {}, field: {}, input: {}", goal, field, input);
    try {
        estimator.run(reader, [&](const ProgressSnapshot& snap) { renderer.render(snap); });
    } catch( const Estimator::InvalidSample& e ){
        logger->critical("invalid sample: {}", e.what());
        return 1;
    }
    return 0;
}
