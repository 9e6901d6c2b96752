#include <gtest/gtest.h>

#include "exit_status_resolver.hpp"

using namespace psrelay::core;

TEST(ExitStatusResolver, LaunchFailureWinsOverEverything)
{
    StatusInputs in;
    in.launchFailed = true;
    in.timedOut = true;
    in.exitCode = 0;
    EXPECT_EQ(resolve_status(in), CommandStatus::LaunchFailure);
}

TEST(ExitStatusResolver, TimeoutWinsOverExitCode)
{
    StatusInputs in;
    in.timedOut = true;
    in.exitCode = 0;
    EXPECT_EQ(resolve_status(in), CommandStatus::Timeout);
}

TEST(ExitStatusResolver, ExitCodeDecides)
{
    StatusInputs in;
    in.exitCode = 111;
    EXPECT_EQ(resolve_status(in), CommandStatus::NonZeroExit);

    in.exitCode = -1;
    EXPECT_EQ(resolve_status(in), CommandStatus::NonZeroExit);

    // Present exit code 0 is success even when stderr has text.
    in.exitCode = 0;
    in.stderrText = "WARNING: something";
    EXPECT_EQ(resolve_status(in), CommandStatus::Success);
}

TEST(ExitStatusResolver, NoExitCodeFallsBackToStderr)
{
    StatusInputs in;
    EXPECT_EQ(resolve_status(in), CommandStatus::Success);

    in.stderrText = "Write-Error: boom";
    EXPECT_EQ(resolve_status(in), CommandStatus::TerminatingError);
}

TEST(ExitStatusResolver, LostStatusIsNeverSuccess)
{
    StatusInputs in;
    in.statusLost = true;
    EXPECT_EQ(resolve_status(in), CommandStatus::NonZeroExit);

    in.stderrText = "Write-Error: boom";
    EXPECT_EQ(resolve_status(in), CommandStatus::NonZeroExit);

    // A marker read from the output still decides.
    in.exitCode = 0;
    EXPECT_EQ(resolve_status(in), CommandStatus::Success);
}

// Known-imprecise: any stderr text without an exit code counts as a failure,
// including purely informational output from native tools.
TEST(ExitStatusResolver, StderrHeuristicIsCoarse)
{
    StatusInputs in;
    in.stderrText = "\n";
    EXPECT_EQ(resolve_status(in), CommandStatus::TerminatingError);
}

TEST(ExitStatusResolver, StatusNames)
{
    EXPECT_STREQ(to_string(CommandStatus::Success), "success");
    EXPECT_STREQ(to_string(CommandStatus::Timeout), "timeout");
    EXPECT_STREQ(to_string(CommandStatus::LaunchFailure), "launch-failure");
}
