#include "Command.hpp"
#include "core/Estimator.hpp"

#define WATCH_CMD_NAME "watch"

class WatchCommand : public Command {
public:
    int run() override;

private:
    static WatchCommand instance; // Static instance to trigger registration
    WatchCommand(bool reg=false);

    char delimiter() const;

    Estimator::clock_fn m_clock = Estimator::system_clock;

    friend class CmdTestBase<WatchCommand>;
    friend class WatchCommandTest;
};
