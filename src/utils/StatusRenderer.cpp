/**
 * @file StatusRenderer.cpp
 * @brief Text rendering of progress snapshots.
 *
 * Prints percent complete, current/goal values, average rate and the projected
 * completion time. By default the screen is cleared before each redraw so the
 * status stays in place; with clearing disabled every update is appended.
 */

#include "StatusRenderer.hpp"
#include "common.hpp"

/**
 * @brief Formats a wall clock ETC as local time.
 * @param eta Completion timestamp, nullopt = infinite.
 * @return "YYYY-MM-DD HH:MM:SS" or "INF".
 */
std::string StatusRenderer::format_eta(std::optional<time_t> eta) {
    if( !eta ){
        return "INF";
    }

    char buf[0x20];
    struct tm tm;
    if( !localtime_r(&*eta, &tm) ){
        return "INF"; // year doesn't fit struct tm
    }
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

/**
 * @brief Formats time remaining as fractional days, hours and minutes.
 *
 * Each unit is derived from the previous one by truncating division, so the
 * values agree with each other rather than each being exact.
 */
std::string StatusRenderer::format_long_eta(std::optional<int64_t> seconds_remaining) {
    std::string result = "---\n";
    if( !seconds_remaining ){
        result += "Days:\tINF\nHours:\tINF\nMinutes:\tINF\nSeconds:\tINF\n";
        return result;
    }
    if( *seconds_remaining > Decimal::MAX_INTEGER ){
        result += fmt::format("Days:\tINF\nHours:\tINF\nMinutes:\tINF\nSeconds:\t{}\n", *seconds_remaining);
        return result;
    }

    const Decimal minutes = Decimal(*seconds_remaining) / Decimal(60);
    const Decimal hours   = minutes / Decimal(60);
    const Decimal days    = hours / Decimal(24);

    result += fmt::format("Days:\t{}\n", days);
    result += fmt::format("Hours:\t{}\n", hours);
    result += fmt::format("Minutes:\t{}\n", minutes);
    result += fmt::format("Seconds:\t{}\n", *seconds_remaining);
    return result;
}

std::string StatusRenderer::format(const ProgressSnapshot& snap) const {
    std::string result;

    if( !m_opts.message.empty() ){
        result += m_opts.message + "\n";
    }

    result += fmt::format("[ {}% {}/{} ]\tavg/s:{}\tetc:{}",
            snap.percent_complete,
            snap.current_value.to_short_string(),
            snap.goal.to_short_string(),
            snap.average_rate,
            format_eta(snap.eta_timestamp));

    if( snap.seconds_remaining ){
        result += fmt::format(" ({})", seconds2human(*snap.seconds_remaining));
    }
    result += "\n";

    if( m_opts.long_eta ){
        result += format_long_eta(snap.seconds_remaining);
    }
    return result;
}

void StatusRenderer::render(const ProgressSnapshot& snap) {
    fmt::print(m_out, "{}{}", m_opts.clear ? ANSI_CLEAR_SCREEN : "", format(snap));
    fflush(m_out);
    m_renders++;
}
