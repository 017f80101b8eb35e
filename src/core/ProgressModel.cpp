/**
 * @file ProgressModel.cpp
 * @brief Progress math: percent complete, average rate and time remaining.
 *
 * All distances are taken as magnitudes, so the same code serves counters going
 * up (bytes copied) and counters going down (files remaining).
 */

#include "ProgressModel.hpp"

const char* direction_name(Direction d) {
    switch( d ){
        case Direction::toward:  return "toward";
        case Direction::away:    return "away";
        case Direction::stalled: return "stalled";
    }
    return "?";
}

/**
 * @brief Computes a snapshot from the current progress state.
 *
 * - average_rate is measured since the start, not since the previous sample
 * - seconds_remaining is truncated, and is infinite while the rate is zero
 * - goal == baseline is reported as 100% complete instead of dividing by zero
 *
 * @param goal Target value.
 * @param baseline First observed value.
 * @param current_value Most recent value.
 * @param elapsed_seconds Whole seconds since start, must be positive.
 * @return Snapshot without ETC timestamp, the caller owns the clock.
 * @throws std::invalid_argument If elapsed_seconds <= 0.
 */
ProgressSnapshot compute_progress(const Decimal& goal, const Decimal& baseline, const Decimal& current_value, int64_t elapsed_seconds) {
    if( elapsed_seconds <= 0 ){
        throw std::invalid_argument("elapsed_seconds must be positive, got " + std::to_string(elapsed_seconds));
    }

    ProgressSnapshot s;
    s.goal = goal;
    s.baseline = baseline;
    s.current_value = current_value;
    s.elapsed_seconds = elapsed_seconds;

    s.total_work     = (goal - baseline).abs();
    s.remaining_work = (goal - current_value).abs();
    s.progress_delta = (current_value - baseline).abs();
    s.average_rate   = s.progress_delta / Decimal(elapsed_seconds);

    const int moved = (current_value - baseline).sign();
    if( moved == 0 ){
        s.direction = Direction::stalled;
    } else if( moved == (goal - baseline).sign() ){
        s.direction = Direction::toward;
    } else {
        s.direction = Direction::away;
    }

    if( s.total_work.is_zero() ){
        s.degenerate = true;
        s.percent_complete = Decimal(100);
    } else {
        s.percent_complete = Decimal::mul_div(s.progress_delta, Decimal(100), s.total_work);
    }

    if( s.remaining_work.is_zero() ){
        s.seconds_remaining = 0;
    } else if( s.average_rate > Decimal(0) ){
        s.seconds_remaining = s.remaining_work.div_trunc(s.average_rate);
    }

    return s;
}
