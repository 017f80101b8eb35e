#pragma once
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>

#include "core/ProgressModel.hpp"

// renders snapshots as a status line:
//   [ 22.2222% 30/100 ]	avg/s:10.0000	etc:2024-06-02 14:38:40 (7s)
class StatusRenderer {
    public:
    struct Options {
        std::string message;      // optional header line
        bool clear = true;        // clear screen before each redraw
        bool long_eta = false;    // days/hours/minutes/seconds breakdown
    };

    explicit StatusRenderer(FILE* out = stdout) : m_out(out) {}
    StatusRenderer(FILE* out, const Options& opts) : m_out(out), m_opts(opts) {}

    void render(const ProgressSnapshot& snap);
    std::string format(const ProgressSnapshot& snap) const;

    size_t renders() const { return m_renders; }

    static std::string format_eta(std::optional<time_t> eta);
    static std::string format_long_eta(std::optional<int64_t> seconds_remaining);

    private:
    FILE* m_out;
    Options m_opts;
    size_t m_renders = 0;
};
