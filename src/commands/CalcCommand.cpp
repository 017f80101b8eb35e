/**
 * @file CalcCommand.cpp
 * @brief One-shot progress computation from explicit values.
 *
 * Prints the same metrics the live estimator would show for a single
 * (goal, baseline, current, elapsed) tuple. Handy for scripts and for checking
 * the numbers behind a surprising ETC.
 */

#include "CalcCommand.hpp"
#include "core/Estimator.hpp"
#include "utils/StatusRenderer.hpp"

REGISTER_COMMAND(CalcCommand);

CalcCommand::CalcCommand(bool reg) : Command(reg, "calc", "compute progress for a single sample") {
    m_parser.add_argument("-g", "--goal-num").required().help("goal number");
    m_parser.add_argument("-b", "--baseline").required().help("first observed value");
    m_parser.add_argument("-c", "--current").required().help("current value");
    m_parser.add_argument("-e", "--elapsed").required().scan<'i', int64_t>().help("seconds since the first value");
    m_parser.add_argument("--now").scan<'i', int64_t>().help("wall clock of the current value, unix time [default: now]");
}

/**
 * @brief Computes and prints one snapshot.
 * @return 0 on success, 1 on invalid numbers or non-positive elapsed time.
 */
int CalcCommand::run() {
    ProgressSnapshot snap;
    try {
        const Decimal goal = Estimator::parse_goal(m_parser.get("--goal-num"));
        const Decimal baseline = Decimal::parse(m_parser.get("--baseline"));
        const Decimal current = Decimal::parse(m_parser.get("--current"));
        snap = compute_progress(goal, baseline, current, m_parser.get<int64_t>("--elapsed"));
    } catch( const std::runtime_error& e ){
        logger->critical("{}", e.what());
        return 1;
    } catch( const std::invalid_argument& e ){
        logger->critical("{}", e.what());
        return 1;
    }

    const time_t now = m_parser.present<int64_t>("--now").value_or(time(nullptr));
    if( snap.seconds_remaining ){
        snap.eta_timestamp = now + *snap.seconds_remaining;
    }

    fmt::print("percent_complete:  {}\n", snap.percent_complete);
    fmt::print("current_value:     {}\n", snap.current_value.to_short_string());
    fmt::print("goal:              {}\n", snap.goal.to_short_string());
    fmt::print("average_rate:      {}\n", snap.average_rate);
    fmt::print("seconds_remaining: {}\n", snap.seconds_remaining ? std::to_string(*snap.seconds_remaining) : "INF");
    fmt::print("eta:               {}\n", StatusRenderer::format_eta(snap.eta_timestamp));
    fmt::print("direction:         {}\n", direction_name(snap.direction));
    if( snap.degenerate ){
        fmt::print("note:              goal equals baseline, reported as complete\n");
    }
    return 0;
}
