#include "Command.hpp"

class CalcCommand : public Command {
public:
    int run() override;

private:
    static CalcCommand instance; // Static instance to trigger registration
    CalcCommand(bool reg=false);

    friend class CmdTestBase<CalcCommand>;
    friend class CalcCommandTest;
};
