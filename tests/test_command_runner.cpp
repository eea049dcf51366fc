#include "minitest.h"
#include "command_runner.h"

using namespace wifiproxy;

TEST(runner_captures_output_and_status) {
    CmdResult r = runCommandWithTimeout({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}, 5000);
    ASSERT_EQ(r.code, 3);
    ASSERT_EQ(r.out, "out\n");
    ASSERT_EQ(r.err, "err\n");
}

TEST(runner_runs_with_c_locale) {
    CmdResult r = runCommandWithTimeout({"/bin/sh", "-c", "printf %s \"$LC_ALL\""}, 5000);
    ASSERT_EQ(r.code, 0);
    ASSERT_EQ(r.out, "C");
}

TEST(runner_missing_program_is_127) {
    CmdResult r = runCommandWithTimeout({"wifi-proxy-no-such-program"}, 5000);
    ASSERT_EQ(r.code, 127);
    ASSERT_EQ(runCommandWithTimeout({}, 1000).code, 127);
}

TEST(runner_kills_on_timeout) {
    CmdResult r = runCommandWithTimeout({"/bin/sh", "-c", "sleep 5"}, 150);
    ASSERT_EQ(r.code, 124);
}
