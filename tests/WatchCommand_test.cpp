#include "commands/WatchCommand.hpp"
#include "test_utils.hpp"

class WatchCommandTest : public CmdTestBase<WatchCommand> {
    protected:
    void SetUp() override {
        set_utc_timezone();
    }

    void TearDown() override {
        for (const auto& f : m_files) {
            fs::remove(f);
        }
    }

    // one simulated second per clock read: construction, then one per sample
    void prepare(WatchCommand& cmd) override {
        cmd.m_clock = [this]() { return m_now++; };
    }

    fs::path input(const std::string& contents) {
        m_files.push_back(temp_file("watch_input.txt", contents));
        return m_files.back();
    }

    time_t m_now = 1700000000;
    std::vector<fs::path> m_files;
};

TEST_F(WatchCommandTest, registers_itself) {
    ASSERT_NE(Command::registry()[WATCH_CMD_NAME], nullptr);
}

TEST_F(WatchCommandTest, counting_up) {
    const fs::path in = input("10\n20\n30\n");
    std::string output = capture_stdout([&](){
        run_cmd({"unused", "-c", "-i", in, "100"});
    });

    // baseline at +1s, then rate is averaged over 2s and 3s
    for_each_line(R"(
        [ 11.1111% 20/100 ]	avg/s:5.0000	etc:2023-11-14 22:13:38 (16s)
        [ 22.2222% 30/100 ]	avg/s:6.6666	etc:2023-11-14 22:13:33 (10s)
    )", [&](const std::string& line) {
        EXPECT_THAT(output, HasSubstr(line));
    });
    EXPECT_EQ(std::string::npos, output.find("\x1b"));
}

TEST_F(WatchCommandTest, goal_option_and_message) {
    const fs::path in = input("50\n40\n30\n");
    std::string output = capture_stdout([&](){
        run_cmd({"unused", "--no-clear", "-g", "0", "-m", "Counting Down", "-i", in});
    });
    EXPECT_THAT(output, HasSubstr("Counting Down\n[ 20.0000% 40/0 ]"));
    EXPECT_THAT(output, HasSubstr("[ 40.0000% 30/0 ]"));
}

TEST_F(WatchCommandTest, field_selection) {
    const fs::path in = input("copied 10 files\ncopied 20 files\n");
    std::string output = capture_stdout([&](){
        run_cmd({"unused", "-c", "-f", "2", "-i", in, "110"});
    });
    EXPECT_THAT(output, HasSubstr("[ 10.0000% 20/110 ]"));
}

TEST_F(WatchCommandTest, tab_delimiter) {
    const fs::path in = input("a b\t10\na b\t20\n");
    std::string output = capture_stdout([&](){
        run_cmd({"unused", "-c", "-F", "tab", "-f", "2", "-i", in, "110"});
    });
    EXPECT_THAT(output, HasSubstr("[ 10.0000% 20/110 ]"));
}

TEST_F(WatchCommandTest, long_eta) {
    const fs::path in = input("0\n10\n");
    std::string output = capture_stdout([&](){
        run_cmd({"unused", "-c", "-l", "-i", in, "100"});
    });
    EXPECT_THAT(output, HasSubstr("---\nDays:"));
    EXPECT_THAT(output, HasSubstr("Seconds:\t18\n"));
}

TEST_F(WatchCommandTest, clears_screen_by_default) {
    const fs::path in = input("0\n10\n");
    std::string output = capture_stdout([&](){
        run_cmd({"unused", "-i", in, "100"});
    });
    EXPECT_THAT(output, HasSubstr(ANSI_CLEAR_SCREEN "[ 10.0000% 10/100 ]"));
}

TEST_F(WatchCommandTest, stalled_input_shows_inf) {
    const fs::path in = input("50\n50\n");
    std::string output = capture_stdout([&](){
        run_cmd({"unused", "-c", "-i", in, "0"});
    });
    EXPECT_THAT(output, HasSubstr("etc:INF"));
}

TEST_F(WatchCommandTest, only_baseline_prints_nothing) {
    const fs::path in = input("10\n");
    std::string output = capture_stdout([&](){
        run_cmd({"unused", "-c", "-i", in, "100"});
    });
    EXPECT_EQ("", output);
}

TEST_F(WatchCommandTest, missing_goal) {
    const fs::path in = input("10\n");
    run_cmd({"unused", "-i", in}, 1);
}

TEST_F(WatchCommandTest, invalid_goal) {
    const fs::path in = input("10\n");
    run_cmd({"unused", "-i", in, "ten"}, 1);
}

TEST_F(WatchCommandTest, invalid_sample) {
    const fs::path in = input("10\n20\nfoo\n30\n");
    std::string output = capture_stdout([&](){
        run_cmd({"unused", "-c", "-i", in, "100"}, 1);
    });
    EXPECT_THAT(output, HasSubstr("20/100"));
    EXPECT_EQ(std::string::npos, output.find("30/100"));
}

TEST_F(WatchCommandTest, missing_field) {
    const fs::path in = input("a 10\nb\n");
    run_cmd({"unused", "-f", "2", "-i", in, "100"}, 1);
}

TEST_F(WatchCommandTest, bad_field_index) {
    const fs::path in = input("10\n");
    run_cmd({"unused", "-f", "-1", "-i", in, "100"}, 1);
}

TEST_F(WatchCommandTest, bad_delimiter) {
    const fs::path in = input("10\n");
    run_cmd({"unused", "-F", "::", "-f", "1", "-i", in, "100"}, 1);
}

TEST_F(WatchCommandTest, missing_input_file) {
    run_cmd({"unused", "-i", "/nonexistent/etcwatch/input", "100"}, 1);
}
