#pragma once
#include <filesystem>
#include <functional>
#include <variant>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "utils/common.hpp"

using testing::HasSubstr;

std::string capture_stdout(const std::function<void()>& func);
std::vector<std::string> split(const std::string& str, const char delimiter);
std::string trim(const std::string& str);
void for_each_line(const std::string& str, const std::function<void(const std::string& line)>& func);

// unique file under the system temp dir, removed by the caller
std::filesystem::path temp_file(const std::string& name, const std::string& contents);
std::string read_file(const std::filesystem::path& path);

// local time formatting in tests must not depend on the machine
void set_utc_timezone();

// std::filesystem::path is not convertible to std::string on windows, so we need these
typedef std::variant<std::string, std::filesystem::path, const char*> VPathOrStr;
std::vector<std::string> vpath2vstr(const std::initializer_list<VPathOrStr>& vpaths);

template <typename TCmd>
class CmdTestBase : public ::testing::Test {
    protected:

    // called on the fresh command right before run()
    virtual void prepare(TCmd&) {}

    void run_cmd(const std::initializer_list<VPathOrStr>& args, int expected_code = 0) {
        TCmd cmd;
        std::vector<std::string> vargs = vpath2vstr(args);
        logger->set_arguments(vargs);
        cmd.parser().parse_args(vargs);
        prepare(cmd);
        EXPECT_EQ(expected_code, cmd.run());
    }
};
