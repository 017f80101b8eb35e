/**
 * @file Estimator.cpp
 * @brief Estimation loop: baseline capture, startup gating and ETC projection.
 *
 * The estimator is demand-driven: it blocks on the sample source and does no work
 * between samples. There is no timeout, a stalled producer stalls the display.
 */

#include "Estimator.hpp"
#include "io/SampleReader.hpp"
#include "utils/common.hpp"

#include <limits>

const char* phase_name(Estimator::Phase phase) {
    switch( phase ){
        case Estimator::Phase::awaiting_baseline: return "awaiting_baseline";
        case Estimator::Phase::gated:             return "gated";
        case Estimator::Phase::running:           return "running";
    }
    return "?";
}

time_t Estimator::system_clock() {
    return time(nullptr);
}

Decimal Estimator::parse_goal(const std::optional<std::string>& text) {
    if( !text || text->empty() ){
        throw InvalidGoal("goal is unset");
    }
    try {
        return Decimal::parse(*text);
    } catch( const Decimal::ParseError& e ){
        throw InvalidGoal(fmt::format("invalid goal: {}", e.what()));
    }
}

/**
 * @brief Creates the estimator and captures the start time.
 * @param goal Target value, fixed for the lifetime of the estimator.
 * @param clock Wall clock source, seconds since epoch.
 */
Estimator::Estimator(const Decimal& goal, clock_fn clock) : m_clock(std::move(clock)) {
    m_state.goal = goal;
    m_state.start_time = m_clock();
}

std::optional<ProgressSnapshot> Estimator::feed(const std::string& sample) {
    Decimal value;
    try {
        value = Decimal::parse(sample);
    } catch( const Decimal::ParseError& e ){
        throw InvalidSample(fmt::format("sample #{}: {}", m_samples + 1, e.what()));
    }
    return feed(value);
}

/**
 * @brief Processes one sample.
 *
 * Elapsed time is recomputed on every sample, including the baseline one, and
 * never goes backwards even if the wall clock does.
 *
 * @param sample Observed value.
 * @return Snapshot, or nullopt while awaiting the baseline or gated.
 */
std::optional<ProgressSnapshot> Estimator::feed(const Decimal& sample) {
    m_samples++;

    const int64_t elapsed = static_cast<int64_t>(m_clock() - m_state.start_time);
    if( elapsed > m_state.elapsed_seconds ){
        m_state.elapsed_seconds = elapsed;
    }
    m_state.current_value = sample;

    if( m_phase == Phase::awaiting_baseline ){
        m_state.baseline = sample;
        m_phase = Phase::gated;
        logger->debug("baseline: {} (goal {})", sample, m_state.goal);
        log_state(nullptr);
        return std::nullopt;
    }

    if( m_state.elapsed_seconds <= 0 ){
        logger->trace("sample #{} within the first second, waiting", m_samples);
        log_state(nullptr);
        return std::nullopt;
    }
    m_phase = Phase::running;

    ProgressSnapshot snap = compute_progress(m_state.goal, *m_state.baseline, m_state.current_value, m_state.elapsed_seconds);
    if( snap.seconds_remaining ){
        // a crawling rate can push the ETC past what time_t holds, that one stays INF
        const __int128_t eta = static_cast<__int128_t>(m_state.start_time) + m_state.elapsed_seconds + *snap.seconds_remaining;
        if( eta <= std::numeric_limits<time_t>::max() ){
            snap.eta_timestamp = static_cast<time_t>(eta);
        }
    }
    if( snap.direction == Direction::away ){
        logger->warn_once("value is moving away from the goal, progress is measured as distance");
    }

    log_state(&snap);
    return snap;
}

/**
 * @brief Runs the loop until the source is exhausted.
 *
 * Errors are not skipped: a bad sample or a missing field ends the run with
 * InvalidSample.
 *
 * @param source Sample source, read one sample at a time.
 * @param sink Receives every emitted snapshot.
 * @return Number of emitted snapshots.
 */
size_t Estimator::run(SampleReader& source, const sink_t& sink) {
    if( m_phase == Phase::awaiting_baseline ){
        logger->info("Waiting for first data update...");
    }

    size_t nemitted = 0;
    std::string line;
    while( true ){
        try {
            if( !source.next(line) ){
                break;
            }
        } catch( const SampleReader::FieldError& e ){
            throw InvalidSample(fmt::format("sample #{}: {}", m_samples + 1, e.what()));
        }

        if( auto snap = feed(line) ){
            sink(*snap);
            nemitted++;
        }
    }

    logger->debug("input ended after {} samples, {} updates", m_samples, nemitted);
    return nemitted;
}

// former --debug dump, now at debug level
void Estimator::log_state(const ProgressSnapshot* snap) const {
    if( !logger->should_log(Logger::level::debug) ){
        return;
    }

    logger->debug("phase:            {}", phase_name(m_phase));
    logger->debug("goal:             {}", m_state.goal);
    logger->debug("current_value:    {}", m_state.current_value);
    logger->debug("baseline:         {}", m_state.baseline ? m_state.baseline->to_string() : "-");
    logger->debug("elapsed_seconds:  {}", m_state.elapsed_seconds);
    if( snap ){
        logger->debug("progress_delta:   {}", snap->progress_delta);
        logger->debug("remaining_work:   {}", snap->remaining_work);
        logger->debug("percent_complete: {}", snap->percent_complete);
        logger->debug("average_rate:     {}", snap->average_rate);
        logger->debug("seconds_left:     {}", snap->seconds_remaining ? std::to_string(*snap->seconds_remaining) : "INF");
        logger->debug("direction:        {}", direction_name(snap->direction));
    }
}
