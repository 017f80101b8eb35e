#pragma once
#include <cstdint>
#include <optional>
#include <ctime>

#include "Decimal.hpp"

enum class Direction {
    toward,  // moving to the goal
    away,    // moving off the goal, magnitudes still count as progress
    stalled  // no movement since the baseline
};

const char* direction_name(Direction d);

// derived metrics for one sample, recomputed every iteration
struct ProgressSnapshot {
    Decimal goal;
    Decimal baseline;
    Decimal current_value;
    int64_t elapsed_seconds = 0;

    Decimal total_work;       // |goal - baseline|
    Decimal remaining_work;   // |goal - current_value|
    Decimal progress_delta;   // |current_value - baseline|
    Decimal average_rate;     // progress_delta / elapsed_seconds
    Decimal percent_complete; // progress_delta * 100 / total_work

    // nullopt = infinite, no forward progress
    std::optional<int64_t> seconds_remaining;

    // wall clock ETC, set by the estimator; nullopt = infinite
    std::optional<time_t> eta_timestamp;

    Direction direction = Direction::stalled;
    bool degenerate = false;  // goal == baseline, reported as 100%

    bool is_infinite() const { return !seconds_remaining.has_value(); }
};

// pure function, no hidden state
// elapsed_seconds must be > 0, otherwise std::invalid_argument is thrown
ProgressSnapshot compute_progress(const Decimal& goal, const Decimal& baseline, const Decimal& current_value, int64_t elapsed_seconds);
