/**
 * @file TestCommand.cpp
 * @brief Implementation of the TestCommand for arithmetic self-testing.
 *
 * Runs the progress math over a few fixed scenarios with a simulated clock and
 * compares against known answers. It is run silently before every other command,
 * so a broken build never shows a plausible but wrong ETC.
 */

#include "TestCommand.hpp"
#include "core/Estimator.hpp"
#include "utils/common.hpp"

#include <vector>

REGISTER_COMMAND(TestCommand);

/**
 * @brief Constructs a TestCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

/**
 * @brief Executes the self-test scenarios.
 *
 * - decimal arithmetic: 0.1 + 0.2 == 0.3, 2000 / 90 == 22.2222, 50% of 20 TB
 * - goal 100, samples 10, 20, 30 one second apart: 11.1111%, 22.2222%, 7s left
 * - goal 0, value stuck at 50: infinite ETC
 * - goal == baseline: 100% without a division fault
 *
 * @return EXIT_SUCCESS (0) if all tests pass, EXIT_FAILURE (1) if any test fails.
 */
int TestCommand::run() {
    if( Decimal::parse("0.1") + Decimal::parse("0.2") != Decimal::parse("0.3") ){
        logger->critical("selftest: 0.1 + 0.2 != 0.3");
        return 1;
    }

    const std::string quotient = (Decimal(2000) / Decimal(90)).to_string();
    if( quotient != "22.2222" ){
        logger->critical("selftest: 2000 / 90 = {}, expected 22.2222", quotient);
        return 1;
    }

    const ProgressSnapshot large = compute_progress(Decimal::parse("20000000000000"), Decimal(0), Decimal::parse("10000000000000"), 1000);
    if( large.percent_complete != Decimal(50) || large.seconds_remaining != 1000 ){
        logger->critical("selftest: 10 TB of 20 TB = {}%, expected 50%", large.percent_complete);
        return 1;
    }
    logger->trace("selftest: decimal OK");

    time_t fake_now = 1000;
    Estimator counting_up(Decimal(100), [&]() { return fake_now; });
    std::vector<ProgressSnapshot> snaps;
    for( int value : {10, 20, 30} ){
        if( auto snap = counting_up.feed(Decimal(value)) ){
            snaps.push_back(*snap);
        }
        fake_now++;
    }

    if( snaps.size() != 2 ){
        logger->critical("selftest: counting up gave {} updates, expected 2", snaps.size());
        return 1;
    }

    if( snaps[0].percent_complete.to_string() != "11.1111" || snaps[0].average_rate.to_string() != "10.0000" ){
        logger->critical("selftest: first update {}% at {}/s, expected 11.1111% at 10.0000/s",
                snaps[0].percent_complete, snaps[0].average_rate);
        return 1;
    }

    if( snaps[1].percent_complete.to_string() != "22.2222" || snaps[1].seconds_remaining != 7 ){
        logger->critical("selftest: second update {}% with {}s left, expected 22.2222% with 7s left",
                snaps[1].percent_complete, snaps[1].seconds_remaining.value_or(-1));
        return 1;
    }

    if( snaps[1].eta_timestamp != 1000 + 2 + 7 ){
        logger->critical("selftest: ETC {}, expected {}", snaps[1].eta_timestamp.value_or(0), 1000 + 2 + 7);
        return 1;
    }
    logger->trace("selftest: counting up OK");

    const ProgressSnapshot stalled = compute_progress(Decimal(0), Decimal(50), Decimal(50), 2);
    if( !stalled.average_rate.is_zero() || !stalled.is_infinite() ){
        logger->critical("selftest: no movement must give zero rate and infinite ETC");
        return 1;
    }
    logger->trace("selftest: stalled OK");

    const ProgressSnapshot degenerate = compute_progress(Decimal(10), Decimal(10), Decimal(10), 1);
    if( !degenerate.degenerate || degenerate.percent_complete != Decimal(100) || degenerate.seconds_remaining != 0 ){
        logger->critical("selftest: goal == baseline must be 100% with 0s left");
        return 1;
    }
    logger->trace("selftest: degenerate goal OK");

    logger->trace("selftest: OK");
    return 0;
}
