#pragma once
#include <ctime>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "Decimal.hpp"
#include "ProgressModel.hpp"

class SampleReader;

// mutable running state, owned by the Estimator
struct ProgressState {
    Decimal goal;
    std::optional<Decimal> baseline;
    time_t start_time = 0;
    Decimal current_value;
    int64_t elapsed_seconds = 0;
};

// drives the progress model:
//  - first sample becomes the baseline, nothing is emitted
//  - no snapshot while less than a second has elapsed (no division by ~0)
//  - afterwards, exactly one snapshot per sample
class Estimator {
    public:
    using clock_fn = std::function<time_t()>;
    using sink_t = std::function<void(const ProgressSnapshot&)>;

    enum class Phase { awaiting_baseline, gated, running };

    class InvalidSample : public std::runtime_error {
        public:
        explicit InvalidSample(const std::string& msg) : std::runtime_error(msg) {}
    };

    class InvalidGoal : public std::runtime_error {
        public:
        explicit InvalidGoal(const std::string& msg) : std::runtime_error(msg) {}
    };

    // throws InvalidGoal if the goal is unset or not a number
    static Decimal parse_goal(const std::optional<std::string>& text);

    explicit Estimator(const Decimal& goal, clock_fn clock = system_clock);

    // parse + feed, throws InvalidSample on garbage
    std::optional<ProgressSnapshot> feed(const std::string& sample);
    std::optional<ProgressSnapshot> feed(const Decimal& sample);

    // read until end of input, returns number of emitted snapshots
    size_t run(SampleReader& source, const sink_t& sink);

    const ProgressState& state() const { return m_state; }
    Phase phase() const { return m_phase; }
    size_t samples_seen() const { return m_samples; }

    static time_t system_clock();

    private:
    void log_state(const ProgressSnapshot* snap) const;

    ProgressState m_state;
    clock_fn m_clock;
    Phase m_phase = Phase::awaiting_baseline;
    size_t m_samples = 0;
};

const char* phase_name(Estimator::Phase phase);
